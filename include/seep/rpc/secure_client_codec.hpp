#pragma once

#include "seep/interfaces/i_client_codec.hpp"
#include "seep/rpc/envelope_channel.hpp"

#include <memory>
#include <vector>

namespace seep::protocol::rpc {

/**
 * @brief Client codec: encrypted requests out, encrypted replies in
 */
class SecureClientCodec final : public interfaces::IClientCodec {
public:
    /// Runs the handshake before returning.
    [[nodiscard]] static Result<std::unique_ptr<SecureClientCodec>, ProtocolFailure> Create(
        std::unique_ptr<IFrameTransport> transport,
        const noise::HandshakeConfig& config,
        std::shared_ptr<const IPayloadSerializer> serializer);

    [[nodiscard]] Result<Unit, ProtocolFailure> WriteRequest(
        const proto::rpc::RequestHeader& header,
        const google::protobuf::Message* body) override;

    [[nodiscard]] Result<Unit, ProtocolFailure> ReadResponseHeader(
        proto::rpc::ResponseHeader& header) override;

    [[nodiscard]] Result<Unit, ProtocolFailure> ReadResponseBody(
        google::protobuf::Message* body) override;

    void Close() override;

    [[nodiscard]] const std::vector<uint8_t>& HandshakeHash() const noexcept {
        return channel_->HandshakeHash();
    }

private:
    explicit SecureClientCodec(std::unique_ptr<EnvelopeChannel> channel)
        : channel_(std::move(channel)) {}

    std::unique_ptr<EnvelopeChannel> channel_;
};

} // namespace seep::protocol::rpc
