#pragma once
#include "seep/core/result.hpp"
#include "seep/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace seep::protocol::crypto {

/**
 * AES-256-GCM Authenticated Encryption with Associated Data (AEAD)
 *
 * Stateless primitive: the caller MUST never reuse a (key, nonce) pair.
 * Nonce management lives in noise::CipherState, which derives the 96-bit
 * nonce from a strictly increasing 64-bit counter (4 zero bytes followed by
 * the big-endian counter) and refuses to wrap.
 */
class AesGcm {
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
private:
    AesGcm() = delete;
};
}
