#pragma once

#include "seep/core/result.hpp"
#include "seep/core/failures.hpp"
#include "seep/enums/role.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace seep::protocol::noise {

using enums::Role;

enum class Token : uint8_t {
    E,
    S,
    EE,
    ES,
    SE,
    SS
};

using MessagePattern = std::vector<Token>;

/**
 * @brief A Noise handshake pattern: pre-messages plus the message sequence
 *
 * Message i (zero based) is written by the initiator when i is even and by
 * the responder when i is odd.
 */
struct HandshakePattern {
    std::string name;
    MessagePattern initiator_pre_message;
    MessagePattern responder_pre_message;
    std::vector<MessagePattern> messages;

    /**
     * @brief Look up one of the fundamental patterns by name
     *
     * Supported: N, K, X, NN, NK, NX, XN, XK, XX, KN, KK, KX, IN, IK, IX.
     * Names carrying modifiers (e.g. "XXpsk3") are rejected.
     */
    [[nodiscard]] static Result<HandshakePattern, ProtocolFailure> FromName(std::string_view name);

    [[nodiscard]] bool IsOneWay() const noexcept { return messages.size() == 1; }

    /// Number of handshake messages the given role writes.
    [[nodiscard]] size_t MessagesToSend(Role role) const noexcept {
        const size_t total = messages.size();
        return role == Role::Initiator ? (total + 1) / 2 : total / 2;
    }

    /// Whether the local static key is needed (sent, or known to the peer up front).
    [[nodiscard]] bool RequiresLocalStatic(Role role) const;

    /// Whether the remote static key must be known before the handshake starts.
    [[nodiscard]] bool RequiresRemoteStatic(Role role) const;
};

} // namespace seep::protocol::noise
