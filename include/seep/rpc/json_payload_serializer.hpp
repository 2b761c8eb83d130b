#pragma once

#include "seep/interfaces/i_payload_serializer.hpp"

namespace seep::protocol::rpc {

using interfaces::BodyDecoder;

/**
 * @brief Protobuf JSON envelopes: one header line, then the body
 *
 * A missing body is sent as "{}". Unknown JSON fields are rejected.
 */
class JsonPayloadSerializer final : public interfaces::IPayloadSerializer {
public:
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Encode(
        const google::protobuf::Message& header,
        const google::protobuf::Message* body) const override;

    [[nodiscard]] Result<BodyDecoder, ProtocolFailure> DecodeHeader(
        std::vector<uint8_t> payload,
        google::protobuf::Message& header) const override;

    [[nodiscard]] std::string_view Name() const noexcept override { return "json"; }
};

} // namespace seep::protocol::rpc
