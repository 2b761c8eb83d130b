#include "seep/crypto/hkdf.hpp"
#include "seep/crypto/sodium_interop.hpp"
#include "seep/core/format.hpp"

namespace seep::protocol::crypto {

Result<std::vector<std::vector<uint8_t>>, ProtocolFailure> Hkdf::Derive(
    HashAlgorithm algorithm,
    std::span<const uint8_t> chaining_key,
    std::span<const uint8_t> input_key_material,
    size_t num_outputs) {
    using DeriveResult = Result<std::vector<std::vector<uint8_t>>, ProtocolFailure>;

    if (num_outputs < MIN_OUTPUTS || num_outputs > MAX_OUTPUTS) {
        return DeriveResult::Err(
            ProtocolFailure::InvalidInput(
                compat::format("HKDF output count must be {} or {}, got {}",
                    MIN_OUTPUTS, MAX_OUTPUTS, num_outputs)));
    }
    if (chaining_key.size() != Digest::HashLength(algorithm)) {
        return DeriveResult::Err(
            ProtocolFailure::InvalidInput(
                compat::format("HKDF chaining key must be {} bytes, got {}",
                    Digest::HashLength(algorithm), chaining_key.size())));
    }

    auto temp_key_result = Digest::Hmac(algorithm, chaining_key, input_key_material);
    if (temp_key_result.IsErr()) {
        return DeriveResult::Err(std::move(temp_key_result).UnwrapErr());
    }
    std::vector<uint8_t> temp_key = std::move(temp_key_result).Unwrap();

    std::vector<std::vector<uint8_t>> outputs;
    outputs.reserve(num_outputs);
    for (size_t i = 1; i <= num_outputs; ++i) {
        const uint8_t counter[1] = {static_cast<uint8_t>(i)};
        std::span<const uint8_t> previous;
        if (!outputs.empty()) {
            previous = outputs.back();
        }
        auto block = previous.empty()
            ? Digest::Hmac(algorithm, temp_key, counter)
            : Digest::Hmac(algorithm, temp_key, previous, counter);
        if (block.IsErr()) {
            (void) SodiumInterop::SecureWipe(temp_key);
            for (auto& output : outputs) {
                (void) SodiumInterop::SecureWipe(output);
            }
            return DeriveResult::Err(std::move(block).UnwrapErr());
        }
        outputs.push_back(std::move(block).Unwrap());
    }
    (void) SodiumInterop::SecureWipe(temp_key);
    return DeriveResult::Ok(std::move(outputs));
}

} // namespace seep::protocol::crypto
