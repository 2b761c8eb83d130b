#pragma once

#include "seep/core/result.hpp"
#include "seep/core/failures.hpp"
#include "seep/interfaces/i_frame_transport.hpp"
#include "seep/noise/cipher_state.hpp"
#include "seep/noise/handshake_config.hpp"

#include <cstdint>
#include <functional>
#include <vector>

namespace seep::protocol::channel {

using interfaces::IFrameTransport;

/// Called once per outbound handshake message; returns that message's payload.
using PayloadProducer = std::function<std::vector<uint8_t>()>;
/// Called once per inbound handshake message with its decrypted payload.
using PayloadConsumer = std::function<void(std::vector<uint8_t>)>;

struct HandshakeResult {
    noise::CipherStatePair ciphers;
    std::vector<uint8_t> handshake_hash;
};

/**
 * @brief Runs one Noise handshake to completion over a frame transport
 *
 * Alternates WriteMessage/SendFrame and ReceiveFrame/ReadMessage according
 * to the engine's turn until the engine hands out the cipher pair. Shared by
 * SecureChannel and both remote-call codecs.
 *
 * An empty producer sends empty payloads; an empty consumer drops inbound
 * payloads.
 */
class HandshakeDriver {
public:
    [[nodiscard]] static Result<HandshakeResult, ProtocolFailure> Run(
        IFrameTransport& transport,
        const noise::HandshakeConfig& config,
        const PayloadProducer& produce = {},
        const PayloadConsumer& consume = {});

private:
    HandshakeDriver() = delete;
};

} // namespace seep::protocol::channel
