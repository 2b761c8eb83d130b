#pragma once

#include "seep/core/result.hpp"
#include "seep/core/failures.hpp"
#include "seep/crypto/digest.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace seep::protocol::noise {

using crypto::HashAlgorithm;

enum class DhFunction : uint8_t {
    X25519 = 0
};

enum class CipherFunction : uint8_t {
    ChaChaPoly = 0,
    AesGcm = 1
};

struct CipherSuite {
    DhFunction dh = DhFunction::X25519;
    CipherFunction cipher = CipherFunction::ChaChaPoly;
    HashAlgorithm hash = HashAlgorithm::Sha256;

    bool operator==(const CipherSuite&) const = default;
};

[[nodiscard]] std::string_view ToString(DhFunction dh) noexcept;
[[nodiscard]] std::string_view ToString(CipherFunction cipher) noexcept;
[[nodiscard]] std::string_view ToString(HashAlgorithm hash) noexcept;

/**
 * @brief A full Noise protocol name, e.g. "Noise_XX_25519_ChaChaPoly_SHA256"
 *
 * The name is hashed into the initial handshake state, so both peers must
 * agree on it byte for byte.
 */
struct ProtocolName {
    std::string pattern;
    CipherSuite suite;

    [[nodiscard]] static Result<ProtocolName, ProtocolFailure> Parse(std::string_view name);

    [[nodiscard]] std::string ToString() const;
};

} // namespace seep::protocol::noise
