#pragma once

#include "seep/interfaces/i_payload_serializer.hpp"

namespace seep::protocol::rpc {

using interfaces::BodyDecoder;

/**
 * @brief Binary protobuf envelopes
 *
 * ```
 * varint(len(header)) header varint(len(body)) body
 * ```
 * Both messages are serialized deterministically. A missing body is encoded
 * as an empty message. Bytes after the body are rejected.
 */
class BinaryPayloadSerializer final : public interfaces::IPayloadSerializer {
public:
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Encode(
        const google::protobuf::Message& header,
        const google::protobuf::Message* body) const override;

    [[nodiscard]] Result<BodyDecoder, ProtocolFailure> DecodeHeader(
        std::vector<uint8_t> payload,
        google::protobuf::Message& header) const override;

    [[nodiscard]] std::string_view Name() const noexcept override { return "binary"; }
};

} // namespace seep::protocol::rpc
