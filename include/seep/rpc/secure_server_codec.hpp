#pragma once

#include "seep/interfaces/i_server_codec.hpp"
#include "seep/rpc/envelope_channel.hpp"

#include <memory>
#include <vector>

namespace seep::protocol::rpc {

/**
 * @brief Server codec: encrypted requests in, encrypted replies out
 */
class SecureServerCodec final : public interfaces::IServerCodec {
public:
    /// Runs the handshake before returning.
    [[nodiscard]] static Result<std::unique_ptr<SecureServerCodec>, ProtocolFailure> Create(
        std::unique_ptr<IFrameTransport> transport,
        const noise::HandshakeConfig& config,
        std::shared_ptr<const IPayloadSerializer> serializer);

    [[nodiscard]] Result<Unit, ProtocolFailure> ReadRequestHeader(
        proto::rpc::RequestHeader& header) override;

    [[nodiscard]] Result<Unit, ProtocolFailure> ReadRequestBody(
        google::protobuf::Message* body) override;

    [[nodiscard]] Result<Unit, ProtocolFailure> WriteResponse(
        const proto::rpc::ResponseHeader& header,
        const google::protobuf::Message* body) override;

    void Close() override;

    [[nodiscard]] const std::vector<uint8_t>& HandshakeHash() const noexcept {
        return channel_->HandshakeHash();
    }

private:
    explicit SecureServerCodec(std::unique_ptr<EnvelopeChannel> channel)
        : channel_(std::move(channel)) {}

    std::unique_ptr<EnvelopeChannel> channel_;
};

} // namespace seep::protocol::rpc
