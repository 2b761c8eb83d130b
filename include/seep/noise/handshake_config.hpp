#pragma once

#include "seep/core/result.hpp"
#include "seep/core/failures.hpp"
#include "seep/enums/role.hpp"
#include "seep/noise/cipher_suite.hpp"
#include "seep/noise/key_pair.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace seep::protocol::noise {

using enums::Role;

/**
 * @brief Everything one side needs to start a handshake
 *
 * Key pairs are shared read-only so a config can be reused for many
 * sessions; the handshake takes its own copy of the private key.
 */
struct HandshakeConfig {
    Role role = Role::Initiator;
    std::string pattern = "XX";
    CipherSuite suite{};
    std::vector<uint8_t> prologue;
    std::shared_ptr<const KeyPair> static_key_pair;
    /// Peer's static public key; empty when it is learned during the handshake.
    std::vector<uint8_t> remote_static_public_key;
    /// Deterministic ephemeral key, for test vectors only.
    std::shared_ptr<const KeyPair> fixed_ephemeral_key_pair;

    /**
     * @brief Build a config from a full protocol name
     *
     * @param protocol_name e.g. "Noise_XX_25519_ChaChaPoly_SHA256"
     */
    [[nodiscard]] static Result<HandshakeConfig, ProtocolFailure> FromProtocolName(
        std::string_view protocol_name,
        Role role);

    [[nodiscard]] std::string ProtocolNameString() const;
};

} // namespace seep::protocol::noise
