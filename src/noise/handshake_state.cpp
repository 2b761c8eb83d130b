#include "seep/noise/handshake_state.hpp"
#include "seep/noise/constants.hpp"
#include "seep/crypto/sodium_interop.hpp"
#include "seep/core/format.hpp"

#include <algorithm>
#include <string>

namespace seep::protocol::noise {

namespace {

bool Contains(const MessagePattern& pattern, Token token) {
    return std::find(pattern.begin(), pattern.end(), token) != pattern.end();
}

ProtocolFailure AsHandshakeFailure(ProtocolFailure failure) {
    if (failure.type == ProtocolFailureType::Decrypt) {
        return ProtocolFailure::Handshake(
            "Handshake message failed authentication: " + failure.message);
    }
    return failure;
}

} // namespace

Result<HandshakeState, ProtocolFailure> HandshakeState::Create(const HandshakeConfig& config) {
    using CreateResult = Result<HandshakeState, ProtocolFailure>;

    auto pattern_result = HandshakePattern::FromName(config.pattern);
    if (pattern_result.IsErr()) {
        return CreateResult::Err(std::move(pattern_result).UnwrapErr());
    }
    HandshakePattern pattern = std::move(pattern_result).Unwrap();

    if (pattern.RequiresLocalStatic(config.role) && !config.static_key_pair) {
        return CreateResult::Err(
            ProtocolFailure::InvalidInput(
                compat::format("Pattern {} requires a local static key for the {}",
                    pattern.name, enums::ToString(config.role))));
    }
    if (pattern.RequiresRemoteStatic(config.role) &&
        config.remote_static_public_key.size() != kDhLength) {
        return CreateResult::Err(
            ProtocolFailure::InvalidInput(
                compat::format("Pattern {} requires the remote static key ({} bytes) for the {}",
                    pattern.name, kDhLength, enums::ToString(config.role))));
    }

    auto symmetric = SymmetricState::Initialize(config.ProtocolNameString(), config.suite);
    if (symmetric.IsErr()) {
        return CreateResult::Err(std::move(symmetric).UnwrapErr());
    }

    HandshakeState state(config.role, std::move(pattern), std::move(symmetric).Unwrap());
    state.fixed_ephemeral_ = config.fixed_ephemeral_key_pair;

    if (config.static_key_pair) {
        auto cloned = config.static_key_pair->Clone();
        if (cloned.IsErr()) {
            return CreateResult::Err(std::move(cloned).UnwrapErr());
        }
        state.static_.emplace(std::move(cloned).Unwrap());
    }
    if (!config.remote_static_public_key.empty()) {
        if (config.remote_static_public_key.size() != kDhLength) {
            return CreateResult::Err(
                ProtocolFailure::InvalidInput(
                    compat::format("Remote static key must be {} bytes", kDhLength)));
        }
        if (state.pattern_.RequiresRemoteStatic(config.role)) {
            state.remote_static_ = config.remote_static_public_key;
        } else {
            state.pinned_remote_static_ = config.remote_static_public_key;
        }
    }

    if (auto mixed = state.symmetric_.MixHash(config.prologue); mixed.IsErr()) {
        return CreateResult::Err(mixed.UnwrapErr());
    }

    // Pre-messages: initiator's first, then responder's.
    const bool is_initiator = config.role == Role::Initiator;
    if (Contains(state.pattern_.initiator_pre_message, Token::S)) {
        const auto& key = is_initiator ? state.static_->PublicKey() : state.remote_static_;
        if (auto mixed = state.symmetric_.MixHash(key); mixed.IsErr()) {
            return CreateResult::Err(mixed.UnwrapErr());
        }
    }
    if (Contains(state.pattern_.responder_pre_message, Token::S)) {
        const auto& key = is_initiator ? state.remote_static_ : state.static_->PublicKey();
        if (auto mixed = state.symmetric_.MixHash(key); mixed.IsErr()) {
            return CreateResult::Err(mixed.UnwrapErr());
        }
    }

    return CreateResult::Ok(std::move(state));
}

bool HandshakeState::IsMyTurn() const noexcept {
    if (complete_ || failed_) {
        return false;
    }
    const bool initiator_turn = message_index_ % 2 == 0;
    return initiator_turn == (role_ == Role::Initiator);
}

Result<Unit, ProtocolFailure> HandshakeState::CheckUsable(bool expect_my_turn) const {
    if (failed_) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState("Handshake already failed"));
    }
    if (complete_) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState("Handshake already complete"));
    }
    if (IsMyTurn() != expect_my_turn) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Handshake(
                compat::format("Out-of-order handshake call at message {}: it is {} turn",
                    message_index_, expect_my_turn ? "the peer's" : "our")));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<Unit, ProtocolFailure> HandshakeState::MixDh(
    const std::optional<KeyPair>& local,
    const std::vector<uint8_t>& remote,
    const char* token_name) {
    if (!local.has_value() || remote.size() != kDhLength) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Handshake(
                compat::format("Missing key material for '{}' token", token_name)));
    }
    auto shared = local->Dh(remote);
    if (shared.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(std::move(shared).UnwrapErr());
    }
    std::vector<uint8_t> secret = std::move(shared).Unwrap();
    auto mixed = symmetric_.MixKey(secret);
    (void) crypto::SodiumInterop::SecureWipe(secret);
    return mixed;
}

Result<Unit, ProtocolFailure> HandshakeState::ProcessDhToken(Token token) {
    const bool is_initiator = role_ == Role::Initiator;
    switch (token) {
        case Token::EE:
            return MixDh(ephemeral_, remote_ephemeral_, "ee");
        case Token::ES:
            return is_initiator
                ? MixDh(ephemeral_, remote_static_, "es")
                : MixDh(static_, remote_ephemeral_, "es");
        case Token::SE:
            return is_initiator
                ? MixDh(static_, remote_ephemeral_, "se")
                : MixDh(ephemeral_, remote_static_, "se");
        case Token::SS:
            return MixDh(static_, remote_static_, "ss");
        default:
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::Generic("Not a DH token"));
    }
}

Result<std::optional<CipherStatePair>, ProtocolFailure> HandshakeState::FinishMessage() {
    using FinishResult = Result<std::optional<CipherStatePair>, ProtocolFailure>;

    ++message_index_;
    if (message_index_ < pattern_.messages.size()) {
        return FinishResult::Ok(std::nullopt);
    }
    auto split = symmetric_.Split();
    if (split.IsErr()) {
        return FinishResult::Err(std::move(split).UnwrapErr());
    }
    auto [c1, c2] = std::move(split).Unwrap();
    complete_ = true;
    ephemeral_.reset();
    if (role_ == Role::Initiator) {
        return FinishResult::Ok(CipherStatePair{SendCipher(std::move(c1)), ReceiveCipher(std::move(c2))});
    }
    return FinishResult::Ok(CipherStatePair{SendCipher(std::move(c2)), ReceiveCipher(std::move(c1))});
}

Result<WriteOutcome, ProtocolFailure> HandshakeState::WriteMessage(std::span<const uint8_t> payload) {
    if (auto usable = CheckUsable(true); usable.IsErr()) {
        return Result<WriteOutcome, ProtocolFailure>::Err(usable.UnwrapErr());
    }
    auto fail = [this](ProtocolFailure failure) {
        failed_ = true;
        return Result<WriteOutcome, ProtocolFailure>::Err(std::move(failure));
    };

    std::vector<uint8_t> message;
    for (const Token token : pattern_.messages[message_index_]) {
        switch (token) {
            case Token::E: {
                auto generated = fixed_ephemeral_ ? fixed_ephemeral_->Clone() : KeyPair::Generate();
                if (generated.IsErr()) {
                    return fail(std::move(generated).UnwrapErr());
                }
                ephemeral_.emplace(std::move(generated).Unwrap());
                const auto& public_key = ephemeral_->PublicKey();
                message.insert(message.end(), public_key.begin(), public_key.end());
                if (auto mixed = symmetric_.MixHash(public_key); mixed.IsErr()) {
                    return fail(mixed.UnwrapErr());
                }
                break;
            }
            case Token::S: {
                if (!static_.has_value()) {
                    return fail(ProtocolFailure::Handshake("Missing local static key for 's' token"));
                }
                auto encrypted = symmetric_.EncryptAndHash(static_->PublicKey());
                if (encrypted.IsErr()) {
                    return fail(std::move(encrypted).UnwrapErr());
                }
                const auto& bytes = encrypted.Unwrap();
                message.insert(message.end(), bytes.begin(), bytes.end());
                break;
            }
            default:
                if (auto mixed = ProcessDhToken(token); mixed.IsErr()) {
                    return fail(mixed.UnwrapErr());
                }
                break;
        }
    }

    auto encrypted_payload = symmetric_.EncryptAndHash(payload);
    if (encrypted_payload.IsErr()) {
        return fail(std::move(encrypted_payload).UnwrapErr());
    }
    const auto& payload_bytes = encrypted_payload.Unwrap();
    message.insert(message.end(), payload_bytes.begin(), payload_bytes.end());

    if (message.size() > kMaxMessageBytes) {
        return fail(ProtocolFailure::InvalidInput(
            compat::format("Handshake message of {} bytes exceeds the {} byte limit",
                message.size(), kMaxMessageBytes)));
    }

    auto finished = FinishMessage();
    if (finished.IsErr()) {
        return fail(std::move(finished).UnwrapErr());
    }
    return Result<WriteOutcome, ProtocolFailure>::Ok(
        WriteOutcome{std::move(message), std::move(finished).Unwrap()});
}

Result<ReadOutcome, ProtocolFailure> HandshakeState::ReadMessage(std::span<const uint8_t> message) {
    if (auto usable = CheckUsable(false); usable.IsErr()) {
        return Result<ReadOutcome, ProtocolFailure>::Err(usable.UnwrapErr());
    }
    auto fail = [this](ProtocolFailure failure) {
        failed_ = true;
        return Result<ReadOutcome, ProtocolFailure>::Err(AsHandshakeFailure(std::move(failure)));
    };
    if (message.size() > kMaxMessageBytes) {
        return fail(ProtocolFailure::Handshake(
            compat::format("Handshake message of {} bytes exceeds the {} byte limit",
                message.size(), kMaxMessageBytes)));
    }

    std::span<const uint8_t> remaining = message;
    auto take = [&remaining](size_t count) {
        std::span<const uint8_t> taken = remaining.subspan(0, count);
        remaining = remaining.subspan(count);
        return taken;
    };

    for (const Token token : pattern_.messages[message_index_]) {
        switch (token) {
            case Token::E: {
                if (remaining.size() < kDhLength) {
                    return fail(ProtocolFailure::Handshake("Handshake message truncated in 'e' token"));
                }
                const auto public_key = take(kDhLength);
                remote_ephemeral_.assign(public_key.begin(), public_key.end());
                if (auto mixed = symmetric_.MixHash(public_key); mixed.IsErr()) {
                    return fail(mixed.UnwrapErr());
                }
                break;
            }
            case Token::S: {
                const size_t length = kDhLength + (symmetric_.HasKey() ? kAeadTagBytes : 0);
                if (remaining.size() < length) {
                    return fail(ProtocolFailure::Handshake("Handshake message truncated in 's' token"));
                }
                auto decrypted = symmetric_.DecryptAndHash(take(length));
                if (decrypted.IsErr()) {
                    return fail(std::move(decrypted).UnwrapErr());
                }
                remote_static_ = std::move(decrypted).Unwrap();
                if (!pinned_remote_static_.empty()) {
                    auto matches = crypto::SodiumInterop::ConstantTimeEquals(
                        remote_static_, pinned_remote_static_);
                    if (matches.IsErr()) {
                        return fail(ProtocolFailure::FromSodiumFailure(matches.UnwrapErr()));
                    }
                    if (!matches.Unwrap()) {
                        return fail(ProtocolFailure::Handshake(
                            "Remote static key does not match the pinned key"));
                    }
                }
                break;
            }
            default:
                if (auto mixed = ProcessDhToken(token); mixed.IsErr()) {
                    return fail(mixed.UnwrapErr());
                }
                break;
        }
    }

    if (symmetric_.HasKey() && remaining.size() < kAeadTagBytes) {
        return fail(ProtocolFailure::Handshake("Handshake message too short for payload tag"));
    }
    auto payload = symmetric_.DecryptAndHash(remaining);
    if (payload.IsErr()) {
        return fail(std::move(payload).UnwrapErr());
    }

    auto finished = FinishMessage();
    if (finished.IsErr()) {
        return fail(std::move(finished).UnwrapErr());
    }
    return Result<ReadOutcome, ProtocolFailure>::Ok(
        ReadOutcome{std::move(payload).Unwrap(), std::move(finished).Unwrap()});
}

} // namespace seep::protocol::noise
