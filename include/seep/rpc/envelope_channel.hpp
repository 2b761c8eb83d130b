#pragma once

#include "seep/core/result.hpp"
#include "seep/core/failures.hpp"
#include "seep/channel/encrypted_stream.hpp"
#include "seep/interfaces/i_frame_transport.hpp"
#include "seep/interfaces/i_payload_serializer.hpp"
#include "seep/noise/cipher_state.hpp"
#include "seep/noise/handshake_config.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace seep::protocol::rpc {

using interfaces::BodyDecoder;
using interfaces::IFrameTransport;
using interfaces::IPayloadSerializer;

/**
 * @brief Encrypted (header, body) envelopes over a frame transport
 *
 * The skeleton both remote-call codecs share: it runs the handshake with
 * empty payloads, then moves one whole serialized envelope per frame.
 * Writes are serialized on the writer lock; a header read stores a deferred
 * body decoder that the matching body read consumes.
 */
class EnvelopeChannel {
public:
    /**
     * @brief Run the handshake and wrap the resulting ciphers
     *
     * The transport is closed if the handshake fails.
     */
    [[nodiscard]] static Result<std::unique_ptr<EnvelopeChannel>, ProtocolFailure> Establish(
        std::unique_ptr<IFrameTransport> transport,
        const noise::HandshakeConfig& config,
        std::shared_ptr<const IPayloadSerializer> serializer);

    ~EnvelopeChannel();

    EnvelopeChannel(const EnvelopeChannel&) = delete;
    EnvelopeChannel& operator=(const EnvelopeChannel&) = delete;

    [[nodiscard]] Result<Unit, ProtocolFailure> WriteEnvelope(
        const google::protobuf::Message& header,
        const google::protobuf::Message* body);

    [[nodiscard]] Result<Unit, ProtocolFailure> ReadEnvelopeHeader(google::protobuf::Message& header);

    [[nodiscard]] Result<Unit, ProtocolFailure> ReadEnvelopeBody(google::protobuf::Message* body);

    void Close();

    [[nodiscard]] const std::vector<uint8_t>& HandshakeHash() const noexcept { return handshake_hash_; }

    [[nodiscard]] const IPayloadSerializer& Serializer() const noexcept { return *serializer_; }

private:
    EnvelopeChannel(std::unique_ptr<IFrameTransport> transport,
                    std::shared_ptr<const IPayloadSerializer> serializer,
                    noise::CipherStatePair ciphers,
                    std::vector<uint8_t> handshake_hash);

    std::unique_ptr<IFrameTransport> transport_;
    std::shared_ptr<const IPayloadSerializer> serializer_;
    channel::EncryptedWriter writer_;
    std::mutex read_lock_;
    noise::ReceiveCipher receive_;
    BodyDecoder pending_body_;
    bool read_poisoned_ = false;
    std::vector<uint8_t> handshake_hash_;
};

} // namespace seep::protocol::rpc
