#include "seep/crypto/chacha20_poly1305.hpp"
#include "seep/crypto/sodium_interop.hpp"
#include "seep/core/constants.hpp"
#include "seep/core/format.hpp"
#include <sodium.h>
#include <string>
namespace seep::protocol::crypto {
namespace {
    static_assert(ChaCha20Poly1305::KEY_SIZE == crypto_aead_chacha20poly1305_ietf_KEYBYTES);
    static_assert(ChaCha20Poly1305::NONCE_SIZE == crypto_aead_chacha20poly1305_ietf_NPUBBYTES);
    static_assert(ChaCha20Poly1305::TAG_SIZE == crypto_aead_chacha20poly1305_ietf_ABYTES);

    Result<Unit, ProtocolFailure> ValidateKeyAndNonce(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce) {
        if (!SodiumInterop::IsInitialized()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::Generic(std::string(ErrorMessages::NOT_INITIALIZED)));
        }
        if (key.size() != ChaCha20Poly1305::KEY_SIZE) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput(
                    compat::format("ChaCha20-Poly1305 key must be {} bytes, got {}",
                        ChaCha20Poly1305::KEY_SIZE, key.size())));
        }
        if (nonce.size() != ChaCha20Poly1305::NONCE_SIZE) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput(
                    compat::format("ChaCha20-Poly1305 nonce must be {} bytes, got {}",
                        ChaCha20Poly1305::NONCE_SIZE, nonce.size())));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }
}
Result<std::vector<uint8_t>, ProtocolFailure>
ChaCha20Poly1305::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    if (auto check = ValidateKeyAndNonce(key, nonce); check.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(check.UnwrapErr());
    }
    std::vector<uint8_t> output(plaintext.size() + TAG_SIZE);
    unsigned long long ciphertext_len = 0;
    if (crypto_aead_chacha20poly1305_ietf_encrypt(
            output.data(), &ciphertext_len,
            plaintext.data(), plaintext.size(),
            associated_data.empty() ? nullptr : associated_data.data(),
            associated_data.size(),
            nullptr,
            nonce.data(), key.data()) != SodiumConstants::SUCCESS) {
        (void) SodiumInterop::SecureWipe(output);
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Generic("ChaCha20-Poly1305 encryption failed"));
    }
    output.resize(static_cast<size_t>(ciphertext_len));
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(output));
}
Result<std::vector<uint8_t>, ProtocolFailure>
ChaCha20Poly1305::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext_with_tag,
    std::span<const uint8_t> associated_data) {
    if (auto check = ValidateKeyAndNonce(key, nonce); check.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(check.UnwrapErr());
    }
    if (ciphertext_with_tag.size() < TAG_SIZE) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Decrypt(
                compat::format("{}: {} bytes (minimum {} for tag)",
                    ErrorMessages::CIPHERTEXT_TOO_SMALL,
                    ciphertext_with_tag.size(), TAG_SIZE)));
    }
    std::vector<uint8_t> output(ciphertext_with_tag.size() - TAG_SIZE);
    unsigned long long plaintext_len = 0;
    if (crypto_aead_chacha20poly1305_ietf_decrypt(
            output.data(), &plaintext_len,
            nullptr,
            ciphertext_with_tag.data(), ciphertext_with_tag.size(),
            associated_data.empty() ? nullptr : associated_data.data(),
            associated_data.size(),
            nonce.data(), key.data()) != SodiumConstants::SUCCESS) {
        (void) SodiumInterop::SecureWipe(output);
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Decrypt(std::string(ErrorMessages::CHACHA_DECRYPTION_FAILED)));
    }
    output.resize(static_cast<size_t>(plaintext_len));
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(output));
}
}
