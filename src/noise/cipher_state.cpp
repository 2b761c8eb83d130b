#include "seep/noise/cipher_state.hpp"
#include "seep/noise/constants.hpp"
#include "seep/crypto/aes_gcm.hpp"
#include "seep/crypto/chacha20_poly1305.hpp"
#include "seep/crypto/sodium_interop.hpp"
#include "seep/core/constants.hpp"
#include "seep/core/format.hpp"

#include <array>
#include <string>

namespace seep::protocol::noise {

namespace {

// 4 zero bytes, then the counter: little-endian for ChaChaPoly, big-endian for AESGCM.
std::array<uint8_t, kCipherNonceBytes> EncodeNonce(CipherFunction cipher, uint64_t nonce) {
    std::array<uint8_t, kCipherNonceBytes> encoded{};
    for (size_t i = 0; i < sizeof(uint64_t); ++i) {
        const auto byte = static_cast<uint8_t>(nonce >> (8 * i));
        if (cipher == CipherFunction::ChaChaPoly) {
            encoded[kNonceCounterOffset + i] = byte;
        } else {
            encoded[kCipherNonceBytes - 1 - i] = byte;
        }
    }
    return encoded;
}

} // namespace

Result<CipherState, ProtocolFailure> CipherState::Create(
    CipherFunction cipher,
    std::span<const uint8_t> key) {
    if (key.size() != kCipherKeyBytes) {
        return Result<CipherState, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("Cipher key must be {} bytes, got {}", kCipherKeyBytes, key.size())));
    }
    auto handle_result = SecureMemoryHandle::Allocate(kCipherKeyBytes);
    if (handle_result.IsErr()) {
        return Result<CipherState, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    SecureMemoryHandle handle = std::move(handle_result).Unwrap();
    if (auto written = handle.Write(key); written.IsErr()) {
        return Result<CipherState, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(written.UnwrapErr()));
    }
    return Result<CipherState, ProtocolFailure>::Ok(CipherState(cipher, std::move(handle)));
}

Result<std::vector<uint8_t>, ProtocolFailure> CipherState::Seal(
    uint64_t nonce,
    std::span<const uint8_t> associated_data,
    std::span<const uint8_t> plaintext) const {
    const auto encoded_nonce = EncodeNonce(cipher_, nonce);
    auto sealed = key_.WithReadAccess([&](std::span<const uint8_t> key) {
        return cipher_ == CipherFunction::ChaChaPoly
            ? crypto::ChaCha20Poly1305::Encrypt(key, encoded_nonce, plaintext, associated_data)
            : crypto::AesGcm::Encrypt(key, encoded_nonce, plaintext, associated_data);
    });
    if (sealed.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(sealed.UnwrapErr()));
    }
    return std::move(sealed).Unwrap();
}

Result<std::vector<uint8_t>, ProtocolFailure> CipherState::Open(
    uint64_t nonce,
    std::span<const uint8_t> associated_data,
    std::span<const uint8_t> ciphertext) const {
    const auto encoded_nonce = EncodeNonce(cipher_, nonce);
    auto opened = key_.WithReadAccess([&](std::span<const uint8_t> key) {
        return cipher_ == CipherFunction::ChaChaPoly
            ? crypto::ChaCha20Poly1305::Decrypt(key, encoded_nonce, ciphertext, associated_data)
            : crypto::AesGcm::Decrypt(key, encoded_nonce, ciphertext, associated_data);
    });
    if (opened.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(opened.UnwrapErr()));
    }
    return std::move(opened).Unwrap();
}

Result<std::vector<uint8_t>, ProtocolFailure> CipherState::EncryptWithAd(
    std::span<const uint8_t> associated_data,
    std::span<const uint8_t> plaintext) {
    if (nonce_ == kMaxNonce) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState(std::string(ErrorMessages::NONCE_EXHAUSTED)));
    }
    auto sealed = Seal(nonce_, associated_data, plaintext);
    if (sealed.IsOk()) {
        ++nonce_;
    }
    return sealed;
}

Result<std::vector<uint8_t>, ProtocolFailure> CipherState::DecryptWithAd(
    std::span<const uint8_t> associated_data,
    std::span<const uint8_t> ciphertext) {
    if (nonce_ == kMaxNonce) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState(std::string(ErrorMessages::NONCE_EXHAUSTED)));
    }
    auto opened = Open(nonce_, associated_data, ciphertext);
    if (opened.IsOk()) {
        ++nonce_;
    }
    return opened;
}

Result<Unit, ProtocolFailure> CipherState::Rekey() {
    const std::array<uint8_t, kCipherKeyBytes> zeros{};
    auto sealed = Seal(kMaxNonce, {}, zeros);
    if (sealed.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(std::move(sealed).UnwrapErr());
    }
    std::vector<uint8_t> new_key = std::move(sealed).Unwrap();
    auto written = key_.Write(std::span<const uint8_t>(new_key.data(), kCipherKeyBytes));
    (void) crypto::SodiumInterop::SecureWipe(new_key);
    if (written.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(written.UnwrapErr()));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

} // namespace seep::protocol::noise
