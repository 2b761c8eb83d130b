#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
namespace seep::protocol {
struct Constants {
    static constexpr size_t X_25519_PUBLIC_KEY_SIZE = 32;
    static constexpr size_t X_25519_PRIVATE_KEY_SIZE = 32;
    static constexpr size_t AES_KEY_SIZE = 32;
    static constexpr size_t AES_GCM_NONCE_SIZE = 12;
    static constexpr size_t AES_GCM_TAG_SIZE = 16;
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr std::string_view ALGORITHM_HMAC = "HMAC";
    static constexpr std::string_view DIGEST_SHA256 = "SHA256";
    static constexpr std::string_view DIGEST_SHA512 = "SHA512";
    static constexpr std::string_view DIGEST_BLAKE2B = "BLAKE2B-512";
    static constexpr std::string_view PARAM_DIGEST = "digest";
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};
struct SodiumConstants {
    static constexpr int SUCCESS = 0;
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view CONSTANT_TIME_COMPARISON_FAILED = "Constant-time comparison failed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view CHACHA_DECRYPTION_FAILED = "ChaCha20-Poly1305 decryption failed (authentication tag mismatch)";
    static constexpr std::string_view AES_GCM_DECRYPTION_FAILED = "AES-GCM decryption failed (authentication tag mismatch)";
    static constexpr std::string_view CIPHERTEXT_TOO_SMALL = "Ciphertext too small";
    static constexpr std::string_view NONCE_EXHAUSTED = "Cipher state nonce exhausted";
    static constexpr std::string_view CONNECTION_CLOSED = "Connection closed";
    static constexpr std::string_view CHANNEL_NOT_INITIALIZED = "Secure channel not initialized";
    static constexpr std::string_view HANDSHAKE_IN_PROGRESS = "Secure channel handshake in progress";
    static constexpr std::string_view CHANNEL_UNUSABLE = "Secure channel unusable after failed handshake";
    static constexpr std::string_view STREAM_POISONED = "Encrypted stream unusable after a previous failure";
    static constexpr std::string_view NO_PENDING_BODY = "No pending body: read a header first";
};
}
