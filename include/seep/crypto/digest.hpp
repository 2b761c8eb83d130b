#pragma once
#include "seep/core/result.hpp"
#include "seep/core/failures.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>
namespace seep::protocol::crypto {

enum class HashAlgorithm {
    Sha256,
    Sha512,
    Blake2b
};

/**
 * @brief One-shot hashing and HMAC over OpenSSL EVP
 *
 * Both functions take up to two input parts so callers can hash a
 * concatenation without building it first.
 */
class Digest {
public:
    [[nodiscard]] static constexpr size_t HashLength(HashAlgorithm algorithm) noexcept {
        return algorithm == HashAlgorithm::Sha256 ? 32 : 64;
    }

    [[nodiscard]] static std::string_view Name(HashAlgorithm algorithm) noexcept;

    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> Hash(
        HashAlgorithm algorithm,
        std::span<const uint8_t> first,
        std::span<const uint8_t> second = {});

    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> Hmac(
        HashAlgorithm algorithm,
        std::span<const uint8_t> key,
        std::span<const uint8_t> first,
        std::span<const uint8_t> second = {});

private:
    Digest() = delete;
};
}
