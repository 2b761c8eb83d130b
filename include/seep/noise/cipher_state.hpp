#pragma once

#include "seep/core/result.hpp"
#include "seep/core/failures.hpp"
#include "seep/crypto/sodium_secure_memory_handle.hpp"
#include "seep/noise/cipher_suite.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace seep::protocol::noise {

using crypto::SecureMemoryHandle;

/**
 * @brief Noise CipherState: a 32-byte key plus a 64-bit nonce counter
 *
 * The nonce advances on every successful encrypt or decrypt. A failed
 * decrypt leaves it untouched. The value 2^64-1 is reserved for Rekey and is
 * never used for a message, so encryption fails once it is reached.
 */
class CipherState {
public:
    [[nodiscard]] static Result<CipherState, ProtocolFailure> Create(
        CipherFunction cipher,
        std::span<const uint8_t> key);

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> EncryptWithAd(
        std::span<const uint8_t> associated_data,
        std::span<const uint8_t> plaintext);

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> DecryptWithAd(
        std::span<const uint8_t> associated_data,
        std::span<const uint8_t> ciphertext);

    /// k = ENCRYPT(k, 2^64-1, "", zeros)[0..32]; nonce unchanged.
    [[nodiscard]] Result<Unit, ProtocolFailure> Rekey();

    [[nodiscard]] uint64_t Nonce() const noexcept { return nonce_; }
    void SetNonce(uint64_t nonce) noexcept { nonce_ = nonce; }

    [[nodiscard]] CipherFunction Cipher() const noexcept { return cipher_; }

    CipherState(CipherState&&) noexcept = default;
    CipherState& operator=(CipherState&&) noexcept = default;
    CipherState(const CipherState&) = delete;
    CipherState& operator=(const CipherState&) = delete;
    ~CipherState() = default;

private:
    CipherState(CipherFunction cipher, SecureMemoryHandle key)
        : cipher_(cipher), key_(std::move(key)), nonce_(0) {}

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Seal(
        uint64_t nonce,
        std::span<const uint8_t> associated_data,
        std::span<const uint8_t> plaintext) const;

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Open(
        uint64_t nonce,
        std::span<const uint8_t> associated_data,
        std::span<const uint8_t> ciphertext) const;

    CipherFunction cipher_;
    SecureMemoryHandle key_;
    uint64_t nonce_;
};

/**
 * @brief Outbound half of a split session. Can only encrypt.
 */
class SendCipher {
public:
    explicit SendCipher(CipherState state) : state_(std::move(state)) {}

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Encrypt(
        std::span<const uint8_t> plaintext) {
        return state_.EncryptWithAd({}, plaintext);
    }

    [[nodiscard]] Result<Unit, ProtocolFailure> Rekey() { return state_.Rekey(); }

    [[nodiscard]] uint64_t Nonce() const noexcept { return state_.Nonce(); }

    SendCipher(SendCipher&&) noexcept = default;
    SendCipher& operator=(SendCipher&&) noexcept = default;
    SendCipher(const SendCipher&) = delete;
    SendCipher& operator=(const SendCipher&) = delete;

private:
    CipherState state_;
};

/**
 * @brief Inbound half of a split session. Can only decrypt.
 */
class ReceiveCipher {
public:
    explicit ReceiveCipher(CipherState state) : state_(std::move(state)) {}

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Decrypt(
        std::span<const uint8_t> ciphertext) {
        return state_.DecryptWithAd({}, ciphertext);
    }

    [[nodiscard]] Result<Unit, ProtocolFailure> Rekey() { return state_.Rekey(); }

    [[nodiscard]] uint64_t Nonce() const noexcept { return state_.Nonce(); }

    ReceiveCipher(ReceiveCipher&&) noexcept = default;
    ReceiveCipher& operator=(ReceiveCipher&&) noexcept = default;
    ReceiveCipher(const ReceiveCipher&) = delete;
    ReceiveCipher& operator=(const ReceiveCipher&) = delete;

private:
    CipherState state_;
};

struct CipherStatePair {
    SendCipher send;
    ReceiveCipher receive;
};

} // namespace seep::protocol::noise
