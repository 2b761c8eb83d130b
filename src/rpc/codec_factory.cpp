#include "seep/rpc/codec_factory.hpp"
#include "seep/rpc/binary_payload_serializer.hpp"
#include "seep/rpc/json_payload_serializer.hpp"
#include "seep/rpc/secure_client_codec.hpp"
#include "seep/rpc/secure_server_codec.hpp"

namespace seep::protocol::rpc {

namespace {

template<typename Codec, typename Interface>
Result<std::unique_ptr<Interface>, ProtocolFailure> Build(
    std::unique_ptr<interfaces::IFrameTransport> transport,
    const noise::HandshakeConfig& config,
    std::shared_ptr<const interfaces::IPayloadSerializer> serializer) {
    auto created = Codec::Create(std::move(transport), config, std::move(serializer));
    if (created.IsErr()) {
        return Result<std::unique_ptr<Interface>, ProtocolFailure>::Err(std::move(created).UnwrapErr());
    }
    return Result<std::unique_ptr<Interface>, ProtocolFailure>::Ok(std::move(created).Unwrap());
}

} // namespace

Result<std::unique_ptr<interfaces::IClientCodec>, ProtocolFailure> CreateBinaryClientCodec(
    std::unique_ptr<interfaces::IFrameTransport> transport,
    const noise::HandshakeConfig& config) {
    return Build<SecureClientCodec, interfaces::IClientCodec>(
        std::move(transport), config, std::make_shared<const BinaryPayloadSerializer>());
}

Result<std::unique_ptr<interfaces::IServerCodec>, ProtocolFailure> CreateBinaryServerCodec(
    std::unique_ptr<interfaces::IFrameTransport> transport,
    const noise::HandshakeConfig& config) {
    return Build<SecureServerCodec, interfaces::IServerCodec>(
        std::move(transport), config, std::make_shared<const BinaryPayloadSerializer>());
}

Result<std::unique_ptr<interfaces::IClientCodec>, ProtocolFailure> CreateJsonClientCodec(
    std::unique_ptr<interfaces::IFrameTransport> transport,
    const noise::HandshakeConfig& config) {
    return Build<SecureClientCodec, interfaces::IClientCodec>(
        std::move(transport), config, std::make_shared<const JsonPayloadSerializer>());
}

Result<std::unique_ptr<interfaces::IServerCodec>, ProtocolFailure> CreateJsonServerCodec(
    std::unique_ptr<interfaces::IFrameTransport> transport,
    const noise::HandshakeConfig& config) {
    return Build<SecureServerCodec, interfaces::IServerCodec>(
        std::move(transport), config, std::make_shared<const JsonPayloadSerializer>());
}

} // namespace seep::protocol::rpc
