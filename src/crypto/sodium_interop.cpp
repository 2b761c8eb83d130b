#include "seep/crypto/sodium_interop.hpp"
#include "seep/crypto/sodium_secure_memory_handle.hpp"

#include <string>

namespace seep::protocol::crypto {

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        if (sodium_init() < SodiumConstants::SUCCESS) {
            initialized_.store(false, std::memory_order_release);
        } else {
            initialized_.store(true, std::memory_order_release);
        }
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }

    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Secure Memory Operations
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    if (buffer.size() > MAX_BUFFER_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                "Buffer size " + std::to_string(buffer.size()) +
                " exceeds maximum " + std::to_string(MAX_BUFFER_SIZE)));
    }

    if (buffer.size() <= Constants::SMALL_BUFFER_THRESHOLD) {
        return WipeSmallBuffer(buffer);
    }
    return WipeLargeBuffer(buffer);
}

Result<Unit, SodiumFailure> SodiumInterop::WipeSmallBuffer(std::span<uint8_t> buffer) {
    volatile uint8_t* vbuf = buffer.data();
    for (size_t i = 0; i < buffer.size(); ++i) {
        vbuf[i] = 0;
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SodiumInterop::WipeLargeBuffer(std::span<uint8_t> buffer) {
    sodium_memzero(buffer.data(), buffer.size());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<bool, SodiumFailure> SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) {

    if (a.size() != b.size()) {
        return Result<bool, SodiumFailure>::Ok(false);
    }

    if (a.empty()) {
        return Result<bool, SodiumFailure>::Ok(true);
    }

    if (!IsInitialized()) {
        return Result<bool, SodiumFailure>::Err(
            SodiumFailure::ComparisonFailed(
                std::string(ErrorMessages::CONSTANT_TIME_COMPARISON_FAILED) +
                ": " + std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    return Result<bool, SodiumFailure>::Ok(
        sodium_memcmp(a.data(), b.data(), a.size()) == SodiumConstants::SUCCESS);
}

// ============================================================================
// X25519
// ============================================================================

Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>
SodiumInterop::GenerateX25519KeyPair(std::string_view key_purpose) {
    using KeyPairResult = Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>;

    auto sk_handle_result = SecureMemoryHandle::Allocate(Constants::X_25519_PRIVATE_KEY_SIZE);
    if (sk_handle_result.IsErr()) {
        return KeyPairResult::Err(
            ProtocolFailure::FromSodiumFailure(sk_handle_result.UnwrapErr()));
    }
    SecureMemoryHandle sk_handle = std::move(sk_handle_result).Unwrap();

    std::vector<uint8_t> sk_bytes = GetRandomBytes(Constants::X_25519_PRIVATE_KEY_SIZE);
    auto write_result = sk_handle.Write(sk_bytes);
    if (write_result.IsErr()) {
        (void) SecureWipe(sk_bytes);
        return KeyPairResult::Err(
            ProtocolFailure::FromSodiumFailure(write_result.UnwrapErr()));
    }

    auto pk_result = DeriveX25519PublicKey(sk_bytes);
    (void) SecureWipe(sk_bytes);
    if (pk_result.IsErr()) {
        return KeyPairResult::Err(
            ProtocolFailure::KeyGeneration(
                "Failed to derive " + std::string(key_purpose) + " public key: " +
                pk_result.UnwrapErr().message));
    }

    return KeyPairResult::Ok(
        std::make_pair(std::move(sk_handle), std::move(pk_result).Unwrap()));
}

Result<std::vector<uint8_t>, ProtocolFailure> SodiumInterop::DeriveX25519PublicKey(
    std::span<const uint8_t> private_key) {
    if (private_key.size() != Constants::X_25519_PRIVATE_KEY_SIZE) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                "X25519 private key must be " +
                std::to_string(Constants::X_25519_PRIVATE_KEY_SIZE) + " bytes"));
    }
    std::vector<uint8_t> pk_bytes(Constants::X_25519_PUBLIC_KEY_SIZE);
    if (crypto_scalarmult_base(pk_bytes.data(), private_key.data()) != SodiumConstants::SUCCESS) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey("crypto_scalarmult_base failed"));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(pk_bytes));
}

Result<std::vector<uint8_t>, ProtocolFailure> SodiumInterop::ComputeX25519(
    std::span<const uint8_t> private_key,
    std::span<const uint8_t> peer_public_key) {
    if (private_key.size() != Constants::X_25519_PRIVATE_KEY_SIZE ||
        peer_public_key.size() != Constants::X_25519_PUBLIC_KEY_SIZE) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Invalid X25519 key size for DH"));
    }
    std::vector<uint8_t> shared(Constants::X_25519_PUBLIC_KEY_SIZE);
    if (crypto_scalarmult(shared.data(), private_key.data(), peer_public_key.data()) !=
        SodiumConstants::SUCCESS) {
        (void) SecureWipe(shared);
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Handshake("X25519 DH rejected peer public key"));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(shared));
}

// ============================================================================
// Random Number Generation
// ============================================================================

std::vector<uint8_t> SodiumInterop::GetRandomBytes(size_t size) {
    std::vector<uint8_t> buffer(size);
    randombytes_buf(buffer.data(), size);
    return buffer;
}

// ============================================================================
// Memory Allocation
// ============================================================================

void* SodiumInterop::AllocateSecure(size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

} // namespace seep::protocol::crypto
