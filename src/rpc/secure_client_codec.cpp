#include "seep/rpc/secure_client_codec.hpp"

namespace seep::protocol::rpc {

Result<std::unique_ptr<SecureClientCodec>, ProtocolFailure> SecureClientCodec::Create(
    std::unique_ptr<IFrameTransport> transport,
    const noise::HandshakeConfig& config,
    std::shared_ptr<const IPayloadSerializer> serializer) {
    auto channel = EnvelopeChannel::Establish(std::move(transport), config, std::move(serializer));
    if (channel.IsErr()) {
        return Result<std::unique_ptr<SecureClientCodec>, ProtocolFailure>::Err(
            std::move(channel).UnwrapErr());
    }
    return Result<std::unique_ptr<SecureClientCodec>, ProtocolFailure>::Ok(
        std::unique_ptr<SecureClientCodec>(new SecureClientCodec(std::move(channel).Unwrap())));
}

Result<Unit, ProtocolFailure> SecureClientCodec::WriteRequest(
    const proto::rpc::RequestHeader& header,
    const google::protobuf::Message* body) {
    return channel_->WriteEnvelope(header, body);
}

Result<Unit, ProtocolFailure> SecureClientCodec::ReadResponseHeader(proto::rpc::ResponseHeader& header) {
    return channel_->ReadEnvelopeHeader(header);
}

Result<Unit, ProtocolFailure> SecureClientCodec::ReadResponseBody(google::protobuf::Message* body) {
    return channel_->ReadEnvelopeBody(body);
}

void SecureClientCodec::Close() {
    channel_->Close();
}

} // namespace seep::protocol::rpc
