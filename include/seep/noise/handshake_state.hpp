#pragma once

#include "seep/core/result.hpp"
#include "seep/core/failures.hpp"
#include "seep/enums/role.hpp"
#include "seep/noise/cipher_state.hpp"
#include "seep/noise/handshake_config.hpp"
#include "seep/noise/handshake_pattern.hpp"
#include "seep/noise/key_pair.hpp"
#include "seep/noise/symmetric_state.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace seep::protocol::noise {

using enums::Role;

struct WriteOutcome {
    std::vector<uint8_t> message;
    /// Present only on the call that completes the handshake.
    std::optional<CipherStatePair> ciphers;
};

struct ReadOutcome {
    std::vector<uint8_t> payload;
    /// Present only on the call that completes the handshake.
    std::optional<CipherStatePair> ciphers;
};

/**
 * @brief Noise HandshakeState for one side of one session
 *
 * Driven one message at a time: WriteMessage when IsMyTurn(), ReadMessage
 * otherwise. The call that processes the last message of the pattern
 * returns the transport cipher pair, oriented for this side:
 *
 * ```
 *   Initiator: send = c1, receive = c2
 *   Responder: send = c2, receive = c1
 * ```
 *
 * Any error is terminal; later calls fail with InvalidState.
 */
class HandshakeState {
public:
    /**
     * @brief Validate the config and run the Noise Initialize() step
     *
     * Fails with InvalidInput when the pattern is unknown or a key the
     * pattern needs up front (local static, remote static) is missing.
     */
    [[nodiscard]] static Result<HandshakeState, ProtocolFailure> Create(const HandshakeConfig& config);

    [[nodiscard]] Result<WriteOutcome, ProtocolFailure> WriteMessage(std::span<const uint8_t> payload);

    [[nodiscard]] Result<ReadOutcome, ProtocolFailure> ReadMessage(std::span<const uint8_t> message);

    [[nodiscard]] bool IsMyTurn() const noexcept;
    [[nodiscard]] bool IsComplete() const noexcept { return complete_; }
    [[nodiscard]] size_t MessagesToSend() const noexcept { return pattern_.MessagesToSend(role_); }
    [[nodiscard]] Role GetRole() const noexcept { return role_; }

    /// h after the final message; identical on both sides (channel binding).
    [[nodiscard]] const std::vector<uint8_t>& HandshakeHash() const noexcept {
        return symmetric_.HandshakeHash();
    }

    /// Peer's static key once known, empty otherwise.
    [[nodiscard]] const std::vector<uint8_t>& RemoteStaticPublicKey() const noexcept {
        return remote_static_;
    }

    HandshakeState(HandshakeState&&) noexcept = default;
    HandshakeState& operator=(HandshakeState&&) noexcept = default;
    HandshakeState(const HandshakeState&) = delete;
    HandshakeState& operator=(const HandshakeState&) = delete;
    ~HandshakeState() = default;

private:
    HandshakeState(Role role, HandshakePattern pattern, SymmetricState symmetric)
        : role_(role)
        , pattern_(std::move(pattern))
        , symmetric_(std::move(symmetric)) {}

    [[nodiscard]] Result<Unit, ProtocolFailure> MixDh(
        const std::optional<KeyPair>& local,
        const std::vector<uint8_t>& remote,
        const char* token_name);

    [[nodiscard]] Result<Unit, ProtocolFailure> ProcessDhToken(Token token);

    [[nodiscard]] Result<std::optional<CipherStatePair>, ProtocolFailure> FinishMessage();

    [[nodiscard]] Result<Unit, ProtocolFailure> CheckUsable(bool expect_my_turn) const;

    Role role_;
    HandshakePattern pattern_;
    SymmetricState symmetric_;
    std::optional<KeyPair> static_;
    std::optional<KeyPair> ephemeral_;
    std::shared_ptr<const KeyPair> fixed_ephemeral_;
    std::vector<uint8_t> remote_static_;
    // Expected key when the pattern transmits the peer's static.
    std::vector<uint8_t> pinned_remote_static_;
    std::vector<uint8_t> remote_ephemeral_;
    size_t message_index_ = 0;
    bool complete_ = false;
    bool failed_ = false;
};

} // namespace seep::protocol::noise
