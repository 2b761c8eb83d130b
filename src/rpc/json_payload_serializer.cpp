#include "seep/rpc/json_payload_serializer.hpp"
#include "seep/core/format.hpp"

#include <google/protobuf/message.h>
#include <google/protobuf/util/json_util.h>

#include <memory>
#include <string>

namespace seep::protocol::rpc {

namespace {

constexpr char kLineSeparator = '\n';
constexpr std::string_view kEmptyBody = "{}";

Result<std::string, ProtocolFailure> ToJson(const google::protobuf::Message& message) {
    std::string json;
    google::protobuf::util::JsonPrintOptions options;
    options.add_whitespace = false;
    options.preserve_proto_field_names = true;
    const auto status = google::protobuf::util::MessageToJsonString(message, &json, options);
    if (!status.ok()) {
        return Result<std::string, ProtocolFailure>::Err(
            ProtocolFailure::Encode(
                compat::format("Failed to encode {} as JSON: {}",
                    message.GetTypeName(), status.ToString())));
    }
    return Result<std::string, ProtocolFailure>::Ok(std::move(json));
}

Result<Unit, ProtocolFailure> FromJson(std::string_view json, google::protobuf::Message& message) {
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;
    const auto status = google::protobuf::util::JsonStringToMessage(
        std::string(json), &message, options);
    if (!status.ok()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Decode(
                compat::format("Malformed JSON {}: {}", message.GetTypeName(), status.ToString())));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

} // namespace

Result<std::vector<uint8_t>, ProtocolFailure> JsonPayloadSerializer::Encode(
    const google::protobuf::Message& header,
    const google::protobuf::Message* body) const {
    auto header_json = ToJson(header);
    if (header_json.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(header_json.UnwrapErr());
    }
    std::string output = std::move(header_json).Unwrap();
    output.push_back(kLineSeparator);
    if (body == nullptr) {
        output.append(kEmptyBody);
    } else {
        auto body_json = ToJson(*body);
        if (body_json.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(body_json.UnwrapErr());
        }
        output.append(body_json.Unwrap());
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(
        std::vector<uint8_t>(output.begin(), output.end()));
}

Result<BodyDecoder, ProtocolFailure> JsonPayloadSerializer::DecodeHeader(
    std::vector<uint8_t> payload,
    google::protobuf::Message& header) const {
    auto text = std::make_shared<const std::string>(payload.begin(), payload.end());
    const size_t separator = text->find(kLineSeparator);
    if (separator == std::string::npos) {
        return Result<BodyDecoder, ProtocolFailure>::Err(
            ProtocolFailure::Decode("JSON envelope has no header line"));
    }
    if (auto parsed = FromJson(std::string_view(*text).substr(0, separator), header); parsed.IsErr()) {
        return Result<BodyDecoder, ProtocolFailure>::Err(parsed.UnwrapErr());
    }

    BodyDecoder decode_body = [text, separator](google::protobuf::Message* body)
        -> Result<Unit, ProtocolFailure> {
        if (body == nullptr) {
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }
        return FromJson(std::string_view(*text).substr(separator + 1), *body);
    };
    return Result<BodyDecoder, ProtocolFailure>::Ok(std::move(decode_body));
}

} // namespace seep::protocol::rpc
