#pragma once

#include "seep/core/result.hpp"
#include "seep/core/failures.hpp"
#include "seep/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace seep::protocol::crypto {

class SecureMemoryHandle;

/**
 * @brief Interop layer for libsodium cryptographic operations
 *
 * Provides RAII wrappers and safe interfaces to libsodium functionality.
 * All methods ensure proper error handling and secure memory management.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium library
     *
     * Must be called before any other sodium operations.
     * Thread-safe and idempotent.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /**
     * @brief Securely wipe a buffer
     *
     * Uses sodium_memzero for large buffers, volatile stores for small ones.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief Constant-time comparison of two buffers
     *
     * @return Ok(true) if equal, Ok(false) if different, Err on failure
     */
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    // ========================================================================
    // X25519
    // ========================================================================

    /**
     * @brief Generate X25519 (Curve25519) key pair
     *
     * Secret key is stored in secure memory (SecureMemoryHandle).
     *
     * @param key_purpose Description for error messages
     * @return Ok((secret_key_handle, public_key_bytes)) or Err
     */
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>
    GenerateX25519KeyPair(std::string_view key_purpose);

    /**
     * @brief Derive the X25519 public key of a private scalar
     */
    static Result<std::vector<uint8_t>, ProtocolFailure> DeriveX25519PublicKey(
        std::span<const uint8_t> private_key);

    /**
     * @brief X25519 scalar multiplication
     *
     * Fails if the peer key is a low-order point (all-zero shared secret).
     */
    static Result<std::vector<uint8_t>, ProtocolFailure> ComputeX25519(
        std::span<const uint8_t> private_key,
        std::span<const uint8_t> peer_public_key);

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    // ========================================================================
    // Memory Allocation (Internal)
    // ========================================================================

    /**
     * @brief Allocate guard-paged, locked memory using sodium_malloc
     *
     * @return Pointer to secure memory, or nullptr on failure
     */
    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static Result<Unit, SodiumFailure> WipeSmallBuffer(std::span<uint8_t> buffer);
    static Result<Unit, SodiumFailure> WipeLargeBuffer(std::span<uint8_t> buffer);

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace seep::protocol::crypto
