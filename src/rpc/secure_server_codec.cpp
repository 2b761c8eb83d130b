#include "seep/rpc/secure_server_codec.hpp"

namespace seep::protocol::rpc {

Result<std::unique_ptr<SecureServerCodec>, ProtocolFailure> SecureServerCodec::Create(
    std::unique_ptr<IFrameTransport> transport,
    const noise::HandshakeConfig& config,
    std::shared_ptr<const IPayloadSerializer> serializer) {
    auto channel = EnvelopeChannel::Establish(std::move(transport), config, std::move(serializer));
    if (channel.IsErr()) {
        return Result<std::unique_ptr<SecureServerCodec>, ProtocolFailure>::Err(
            std::move(channel).UnwrapErr());
    }
    return Result<std::unique_ptr<SecureServerCodec>, ProtocolFailure>::Ok(
        std::unique_ptr<SecureServerCodec>(new SecureServerCodec(std::move(channel).Unwrap())));
}

Result<Unit, ProtocolFailure> SecureServerCodec::ReadRequestHeader(proto::rpc::RequestHeader& header) {
    return channel_->ReadEnvelopeHeader(header);
}

Result<Unit, ProtocolFailure> SecureServerCodec::ReadRequestBody(google::protobuf::Message* body) {
    return channel_->ReadEnvelopeBody(body);
}

Result<Unit, ProtocolFailure> SecureServerCodec::WriteResponse(
    const proto::rpc::ResponseHeader& header,
    const google::protobuf::Message* body) {
    return channel_->WriteEnvelope(header, body);
}

void SecureServerCodec::Close() {
    channel_->Close();
}

} // namespace seep::protocol::rpc
