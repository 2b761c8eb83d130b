#pragma once

#include "seep/core/result.hpp"
#include "seep/core/failures.hpp"
#include "seep/interfaces/i_frame_transport.hpp"
#include "seep/noise/cipher_state.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

namespace seep::protocol::channel {

using interfaces::IFrameTransport;

/**
 * @brief Encrypts each write as one frame
 *
 * Writes are serialized on an internal lock so the send nonce advances in
 * wire order. The first failure is sticky.
 *
 * A backlog given at construction goes out as one record ahead of any
 * later write, either from Flush or from the first Write.
 */
class EncryptedWriter {
public:
    EncryptedWriter(IFrameTransport& transport, noise::SendCipher cipher,
                    std::vector<uint8_t> backlog = {})
        : transport_(transport)
        , cipher_(std::move(cipher))
        , backlog_(std::move(backlog)) {}

    EncryptedWriter(const EncryptedWriter&) = delete;
    EncryptedWriter& operator=(const EncryptedWriter&) = delete;

    /// @return the number of bytes written, always data.size() on success
    [[nodiscard]] Result<size_t, ProtocolFailure> Write(std::span<const uint8_t> data);

    /// Send the backlog now. A failure is kept and returned by the next Write.
    void Flush();

private:
    [[nodiscard]] Result<Unit, ProtocolFailure> SendRecordLocked(std::span<const uint8_t> data);
    [[nodiscard]] Result<Unit, ProtocolFailure> DrainBacklogLocked();

    IFrameTransport& transport_;
    noise::SendCipher cipher_;
    std::mutex lock_;
    std::vector<uint8_t> backlog_;
    std::optional<ProtocolFailure> unreported_failure_;
    bool poisoned_ = false;
};

/**
 * @brief Decrypts frames and serves them as a byte stream
 *
 * Holds the unread tail of the last decrypted frame. Reads are serialized
 * on an internal lock; a decrypt or transport failure is sticky.
 */
class EncryptedReader {
public:
    EncryptedReader(IFrameTransport& transport, noise::ReceiveCipher cipher,
                    std::vector<uint8_t> initial_bytes = {})
        : transport_(transport)
        , cipher_(std::move(cipher))
        , buffer_(std::move(initial_bytes)) {}

    EncryptedReader(const EncryptedReader&) = delete;
    EncryptedReader& operator=(const EncryptedReader&) = delete;

    /**
     * @brief Read up to buffer.size() bytes
     *
     * Blocks for one frame only when no buffered bytes remain. Returns 0
     * without touching the transport for an empty buffer.
     */
    [[nodiscard]] Result<size_t, ProtocolFailure> Read(std::span<uint8_t> buffer);

    /// Read until buffer is full.
    [[nodiscard]] Result<Unit, ProtocolFailure> ReadExact(std::span<uint8_t> buffer);

private:
    [[nodiscard]] Result<size_t, ProtocolFailure> ReadLocked(std::span<uint8_t> buffer);

    IFrameTransport& transport_;
    noise::ReceiveCipher cipher_;
    std::mutex lock_;
    std::vector<uint8_t> buffer_;
    size_t offset_ = 0;
    bool poisoned_ = false;
};

} // namespace seep::protocol::channel
