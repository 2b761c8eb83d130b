#pragma once

#include "seep/core/result.hpp"
#include "seep/core/failures.hpp"
#include "seep/channel/encrypted_stream.hpp"
#include "seep/configuration/channel_options.hpp"
#include "seep/interfaces/i_frame_transport.hpp"
#include "seep/noise/handshake_config.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <thread>
#include <vector>

namespace seep::protocol::channel {

using configuration::ChannelOptions;

enum class ChannelState : uint8_t {
    Uninitialized,
    Staging,
    Handshaking,
    Established,
    Failed
};

/**
 * @brief Byte stream that becomes encrypted once a Noise handshake completes
 *
 * Lifecycle:
 * ```
 *   SecureChannel channel;
 *   channel.Init();
 *   channel.Write(hello);              // staged, rides in the handshake
 *   channel.Handshake(std::move(transport), config);
 *   channel.Read(buffer);              // bytes the peer attached to its
 *                                      // handshake messages come first
 * ```
 *
 * Data staged before the handshake is carried as handshake payload and is
 * therefore only as confidential as the pattern makes that message (the
 * first message of most patterns is sent in the clear).
 *
 * Staged bytes that do not fit in the handshake messages are sent as one
 * encrypted record from a background thread once Handshake returns, so two
 * peers with large backlogs can both drain each other. A later Write goes
 * out after that record.
 *
 * After Handshake returns, one reader thread and one writer thread may use
 * the channel concurrently. A failed handshake is terminal: every later call
 * fails with ObjectDisposed.
 */
class SecureChannel {
public:
    SecureChannel() = default;
    ~SecureChannel();

    SecureChannel(const SecureChannel&) = delete;
    SecureChannel& operator=(const SecureChannel&) = delete;

    /// Prepare empty staging buffers. Idempotent while staging.
    [[nodiscard]] Result<Unit, ProtocolFailure> Init();

    [[nodiscard]] Result<size_t, ProtocolFailure> Write(std::span<const uint8_t> data);

    [[nodiscard]] Result<size_t, ProtocolFailure> Read(std::span<uint8_t> buffer);

    [[nodiscard]] Result<Unit, ProtocolFailure> ReadExact(std::span<uint8_t> buffer);

    /**
     * @brief Run the handshake, carrying staged bytes inside its messages
     *
     * Takes ownership of the transport. On success the channel streams
     * encrypted frames over it; on failure the transport is closed and the
     * error from the transport or the engine is returned unchanged. Close
     * from another thread aborts a handshake blocked on the transport.
     */
    [[nodiscard]] Result<Unit, ProtocolFailure> Handshake(
        std::unique_ptr<interfaces::IFrameTransport> transport,
        const noise::HandshakeConfig& config,
        const ChannelOptions& options = {});

    /// Noise handshake hash, available once established.
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> HandshakeHash() const;

    [[nodiscard]] ChannelState State() const;

    /// Close the underlying transport; blocked reads and a running handshake
    /// return a Transport failure.
    void Close();

    /**
     * @brief Bytes of staged data to attach to each handshake message
     *
     * @param pending staged byte count
     * @param rounds handshake messages this side sends
     * @param threshold chunk threshold
     */
    [[nodiscard]] static size_t ChunkSize(size_t pending, size_t rounds, size_t threshold) noexcept;

private:
    [[nodiscard]] Result<Unit, ProtocolFailure> RequireUsable() const;
    [[nodiscard]] Result<Unit, ProtocolFailure> FailLocked(ProtocolFailure failure);

    mutable std::mutex state_lock_;
    ChannelState state_ = ChannelState::Uninitialized;
    std::vector<uint8_t> outbound_staging_;
    std::unique_ptr<interfaces::IFrameTransport> transport_;
    std::unique_ptr<EncryptedReader> reader_;
    std::unique_ptr<EncryptedWriter> writer_;
    std::vector<uint8_t> handshake_hash_;
    std::thread flusher_;
};

} // namespace seep::protocol::channel
