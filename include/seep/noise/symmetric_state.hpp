#pragma once

#include "seep/core/result.hpp"
#include "seep/core/failures.hpp"
#include "seep/noise/cipher_state.hpp"
#include "seep/noise/cipher_suite.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace seep::protocol::noise {

/**
 * @brief Noise SymmetricState: chaining key, handshake hash and an optional cipher
 *
 * Until the first MixKey there is no key and EncryptAndHash/DecryptAndHash
 * pass the payload through in the clear (still mixing it into the hash).
 */
class SymmetricState {
public:
    [[nodiscard]] static Result<SymmetricState, ProtocolFailure> Initialize(
        std::string_view protocol_name,
        const CipherSuite& suite);

    [[nodiscard]] Result<Unit, ProtocolFailure> MixKey(std::span<const uint8_t> input_key_material);
    [[nodiscard]] Result<Unit, ProtocolFailure> MixHash(std::span<const uint8_t> data);

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> EncryptAndHash(
        std::span<const uint8_t> plaintext);
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> DecryptAndHash(
        std::span<const uint8_t> ciphertext);

    /// Derive the two transport cipher states (initiator-to-responder first).
    [[nodiscard]] Result<std::pair<CipherState, CipherState>, ProtocolFailure> Split() const;

    [[nodiscard]] bool HasKey() const noexcept { return cipher_.has_value(); }
    [[nodiscard]] const std::vector<uint8_t>& HandshakeHash() const noexcept { return hash_; }

    SymmetricState(SymmetricState&&) noexcept = default;
    SymmetricState& operator=(SymmetricState&&) noexcept = default;
    SymmetricState(const SymmetricState&) = delete;
    SymmetricState& operator=(const SymmetricState&) = delete;
    ~SymmetricState();

private:
    SymmetricState(CipherSuite suite, std::vector<uint8_t> chaining_key, std::vector<uint8_t> hash)
        : suite_(suite)
        , chaining_key_(std::move(chaining_key))
        , hash_(std::move(hash)) {}

    CipherSuite suite_;
    std::vector<uint8_t> chaining_key_;
    std::vector<uint8_t> hash_;
    std::optional<CipherState> cipher_;
};

} // namespace seep::protocol::noise
