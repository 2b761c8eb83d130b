#pragma once
#include "seep/core/result.hpp"
#include "seep/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace seep::protocol::crypto {

/**
 * IETF ChaCha20-Poly1305 AEAD (RFC 8439) over libsodium.
 *
 * Same contract as AesGcm: 32-byte key, 12-byte nonce, 16-byte tag appended
 * to the ciphertext. Nonce uniqueness is the caller's responsibility.
 */
class ChaCha20Poly1305 {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> associated_data = {});

    static constexpr size_t KEY_SIZE = 32;
    static constexpr size_t NONCE_SIZE = 12;
    static constexpr size_t TAG_SIZE = 16;
private:
    ChaCha20Poly1305() = delete;
};
}
