#pragma once

#include "seep/interfaces/i_client_codec.hpp"
#include "seep/interfaces/i_server_codec.hpp"
#include "seep/interfaces/i_frame_transport.hpp"
#include "seep/noise/handshake_config.hpp"

#include <memory>

namespace seep::protocol::rpc {

// Each factory runs the handshake over the transport before returning and
// closes the transport if it fails.

[[nodiscard]] Result<std::unique_ptr<interfaces::IClientCodec>, ProtocolFailure> CreateBinaryClientCodec(
    std::unique_ptr<interfaces::IFrameTransport> transport,
    const noise::HandshakeConfig& config);

[[nodiscard]] Result<std::unique_ptr<interfaces::IServerCodec>, ProtocolFailure> CreateBinaryServerCodec(
    std::unique_ptr<interfaces::IFrameTransport> transport,
    const noise::HandshakeConfig& config);

[[nodiscard]] Result<std::unique_ptr<interfaces::IClientCodec>, ProtocolFailure> CreateJsonClientCodec(
    std::unique_ptr<interfaces::IFrameTransport> transport,
    const noise::HandshakeConfig& config);

[[nodiscard]] Result<std::unique_ptr<interfaces::IServerCodec>, ProtocolFailure> CreateJsonServerCodec(
    std::unique_ptr<interfaces::IFrameTransport> transport,
    const noise::HandshakeConfig& config);

} // namespace seep::protocol::rpc
