#pragma once

#include "seep/core/result.hpp"
#include "seep/core/failures.hpp"
#include "seep/crypto/digest.hpp"

#include <span>
#include <vector>
#include <cstdint>

namespace seep::protocol::crypto {

/**
 * @brief HKDF as defined by the Noise Protocol Framework (section 4.3)
 *
 * temp_key = HMAC(chaining_key, input_key_material)
 * output1  = HMAC(temp_key, 0x01)
 * output2  = HMAC(temp_key, output1 || 0x02)
 * output3  = HMAC(temp_key, output2 || 0x03)
 *
 * Unlike RFC 5869 usage elsewhere, the input key material may be empty
 * (Split derives the transport keys from a zero-length input).
 */
class Hkdf {
public:
    /**
     * @param num_outputs 2 or 3
     * @return num_outputs values of HASHLEN bytes each
     */
    [[nodiscard]] static Result<std::vector<std::vector<uint8_t>>, ProtocolFailure> Derive(
        HashAlgorithm algorithm,
        std::span<const uint8_t> chaining_key,
        std::span<const uint8_t> input_key_material,
        size_t num_outputs);

    static constexpr size_t MIN_OUTPUTS = 2;
    static constexpr size_t MAX_OUTPUTS = 3;

private:
    Hkdf() = delete;
};

} // namespace seep::protocol::crypto
