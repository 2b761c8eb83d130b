#pragma once

#include "seep/core/result.hpp"
#include "seep/core/failures.hpp"
#include "seep/crypto/sodium_secure_memory_handle.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace seep::protocol::noise {

using crypto::SecureMemoryHandle;

/**
 * @brief X25519 key pair with the private scalar held in secure memory
 *
 * Move-only. The private key never leaves the handle except through Dh().
 */
class KeyPair {
public:
    [[nodiscard]] static Result<KeyPair, ProtocolFailure> Generate();

    /// Wrap an existing private key; the public key is derived from it.
    [[nodiscard]] static Result<KeyPair, ProtocolFailure> FromPrivateKey(
        std::span<const uint8_t> private_key);

    [[nodiscard]] Result<KeyPair, ProtocolFailure> Clone() const;

    [[nodiscard]] const std::vector<uint8_t>& PublicKey() const noexcept { return public_key_; }

    /// X25519(private, peer_public). Fails on low-order peer keys.
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Dh(
        std::span<const uint8_t> peer_public_key) const;

    KeyPair(KeyPair&&) noexcept = default;
    KeyPair& operator=(KeyPair&&) noexcept = default;
    KeyPair(const KeyPair&) = delete;
    KeyPair& operator=(const KeyPair&) = delete;
    ~KeyPair() = default;

private:
    KeyPair(SecureMemoryHandle private_key, std::vector<uint8_t> public_key)
        : private_key_(std::move(private_key))
        , public_key_(std::move(public_key)) {}

    SecureMemoryHandle private_key_;
    std::vector<uint8_t> public_key_;
};

} // namespace seep::protocol::noise
