#include "seep/rpc/binary_payload_serializer.hpp"
#include "seep/core/format.hpp"

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/message.h>

#include <limits>
#include <memory>
#include <string>

namespace seep::protocol::rpc {

namespace {

using google::protobuf::io::CodedInputStream;
using google::protobuf::io::CodedOutputStream;
using google::protobuf::io::StringOutputStream;

Result<Unit, ProtocolFailure> WriteDelimited(
    CodedOutputStream& coded_out,
    const google::protobuf::Message* message) {
    if (message == nullptr) {
        coded_out.WriteVarint32(0);
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }
    const size_t size = message->ByteSizeLong();
    if (size > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Encode(
                compat::format("{} too large to encode ({} bytes)",
                    message->GetTypeName(), size)));
    }
    coded_out.WriteVarint32(static_cast<uint32_t>(size));
    message->SerializeWithCachedSizes(&coded_out);
    if (coded_out.HadError()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Encode(
                compat::format("Failed to serialize {}", message->GetTypeName())));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<Unit, ProtocolFailure> ReadDelimited(
    CodedInputStream& coded_in,
    google::protobuf::Message* message,
    const char* what) {
    uint32_t size = 0;
    if (!coded_in.ReadVarint32(&size)) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Decode(compat::format("Truncated {} length", what)));
    }
    if (message == nullptr) {
        if (!coded_in.Skip(static_cast<int>(size))) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::Decode(compat::format("Truncated {}", what)));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }
    const auto limit = coded_in.PushLimit(static_cast<int>(size));
    const bool parsed = message->ParseFromCodedStream(&coded_in) &&
                        coded_in.ConsumedEntireMessage() &&
                        coded_in.BytesUntilLimit() == 0;
    coded_in.PopLimit(limit);
    if (!parsed) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Decode(
                compat::format("Malformed {} ({})", what, message->GetTypeName())));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

} // namespace

Result<std::vector<uint8_t>, ProtocolFailure> BinaryPayloadSerializer::Encode(
    const google::protobuf::Message& header,
    const google::protobuf::Message* body) const {
    std::string output;
    {
        StringOutputStream stream(&output);
        CodedOutputStream coded_out(&stream);
        coded_out.SetSerializationDeterministic(true);
        if (auto written = WriteDelimited(coded_out, &header); written.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(written.UnwrapErr());
        }
        if (auto written = WriteDelimited(coded_out, body); written.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(written.UnwrapErr());
        }
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(
        std::vector<uint8_t>(output.begin(), output.end()));
}

Result<BodyDecoder, ProtocolFailure> BinaryPayloadSerializer::DecodeHeader(
    std::vector<uint8_t> payload,
    google::protobuf::Message& header) const {
    if (payload.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return Result<BodyDecoder, ProtocolFailure>::Err(
            ProtocolFailure::Decode("Envelope too large"));
    }
    auto buffer = std::make_shared<const std::vector<uint8_t>>(std::move(payload));
    int body_offset = 0;
    {
        CodedInputStream coded_in(buffer->data(), static_cast<int>(buffer->size()));
        if (auto read = ReadDelimited(coded_in, &header, "header"); read.IsErr()) {
            return Result<BodyDecoder, ProtocolFailure>::Err(read.UnwrapErr());
        }
        body_offset = coded_in.CurrentPosition();
    }

    BodyDecoder decode_body = [buffer, body_offset](google::protobuf::Message* body)
        -> Result<Unit, ProtocolFailure> {
        CodedInputStream coded_in(
            buffer->data() + body_offset,
            static_cast<int>(buffer->size()) - body_offset);
        if (auto read = ReadDelimited(coded_in, body, "body"); read.IsErr()) {
            return read;
        }
        if (coded_in.CurrentPosition() != static_cast<int>(buffer->size()) - body_offset) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Trailing bytes after envelope body"));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    };
    return Result<BodyDecoder, ProtocolFailure>::Ok(std::move(decode_body));
}

} // namespace seep::protocol::rpc
