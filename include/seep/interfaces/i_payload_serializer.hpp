#pragma once
#include "seep/core/result.hpp"
#include "seep/core/failures.hpp"
#include <cstdint>
#include <functional>
#include <string_view>
#include <vector>
namespace google::protobuf {
class Message;
}
namespace seep::protocol::interfaces {
using protocol::Result;
using protocol::Unit;
using protocol::ProtocolFailure;
/// Decodes the body that followed a header. A null target discards it.
using BodyDecoder = std::function<Result<Unit, ProtocolFailure>(google::protobuf::Message*)>;
/**
 * Wire format for (header, body) envelopes.
 *
 * DecodeHeader parses only the header and returns a decoder bound to the
 * same buffer, so the body can be parsed once its concrete type is known.
 */
class IPayloadSerializer {
public:
    virtual ~IPayloadSerializer() = default;
    [[nodiscard]] virtual Result<std::vector<uint8_t>, ProtocolFailure> Encode(
        const google::protobuf::Message& header,
        const google::protobuf::Message* body) const = 0;
    [[nodiscard]] virtual Result<BodyDecoder, ProtocolFailure> DecodeHeader(
        std::vector<uint8_t> payload,
        google::protobuf::Message& header) const = 0;
    [[nodiscard]] virtual std::string_view Name() const noexcept = 0;
};
}
