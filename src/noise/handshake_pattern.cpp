#include "seep/noise/handshake_pattern.hpp"
#include "seep/core/format.hpp"

#include <algorithm>

namespace seep::protocol::noise {

namespace {

using T = Token;

struct PatternEntry {
    std::string_view name;
    MessagePattern initiator_pre;
    MessagePattern responder_pre;
    std::vector<MessagePattern> messages;
};

const std::vector<PatternEntry>& PatternTable() {
    static const std::vector<PatternEntry> table = {
        {"N",  {},     {T::S}, {{T::E, T::ES}}},
        {"K",  {T::S}, {T::S}, {{T::E, T::ES, T::SS}}},
        {"X",  {},     {T::S}, {{T::E, T::ES, T::S, T::SS}}},
        {"NN", {},     {},     {{T::E}, {T::E, T::EE}}},
        {"NK", {},     {T::S}, {{T::E, T::ES}, {T::E, T::EE}}},
        {"NX", {},     {},     {{T::E}, {T::E, T::EE, T::S, T::ES}}},
        {"XN", {},     {},     {{T::E}, {T::E, T::EE}, {T::S, T::SE}}},
        {"XK", {},     {T::S}, {{T::E, T::ES}, {T::E, T::EE}, {T::S, T::SE}}},
        {"XX", {},     {},     {{T::E}, {T::E, T::EE, T::S, T::ES}, {T::S, T::SE}}},
        {"KN", {T::S}, {},     {{T::E}, {T::E, T::EE, T::SE}}},
        {"KK", {T::S}, {T::S}, {{T::E, T::ES, T::SS}, {T::E, T::EE, T::SE}}},
        {"KX", {T::S}, {},     {{T::E}, {T::E, T::EE, T::SE, T::S, T::ES}}},
        {"IN", {},     {},     {{T::E, T::S}, {T::E, T::EE, T::SE}}},
        {"IK", {},     {T::S}, {{T::E, T::ES, T::S, T::SS}, {T::E, T::EE, T::SE}}},
        {"IX", {},     {},     {{T::E, T::S}, {T::E, T::EE, T::SE, T::S, T::ES}}},
    };
    return table;
}

bool Contains(const MessagePattern& pattern, Token token) {
    return std::find(pattern.begin(), pattern.end(), token) != pattern.end();
}

} // namespace

Result<HandshakePattern, ProtocolFailure> HandshakePattern::FromName(std::string_view name) {
    for (const auto& entry : PatternTable()) {
        if (entry.name == name) {
            HandshakePattern pattern;
            pattern.name = std::string(entry.name);
            pattern.initiator_pre_message = entry.initiator_pre;
            pattern.responder_pre_message = entry.responder_pre;
            pattern.messages = entry.messages;
            return Result<HandshakePattern, ProtocolFailure>::Ok(std::move(pattern));
        }
    }
    if (name.find("psk") != std::string_view::npos) {
        return Result<HandshakePattern, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("Pre-shared key modifiers are not supported: '{}'", name)));
    }
    return Result<HandshakePattern, ProtocolFailure>::Err(
        ProtocolFailure::InvalidInput(
            compat::format("Unknown handshake pattern: '{}'", name)));
}

bool HandshakePattern::RequiresLocalStatic(Role role) const {
    const MessagePattern& own_pre =
        role == Role::Initiator ? initiator_pre_message : responder_pre_message;
    if (Contains(own_pre, Token::S)) {
        return true;
    }
    const size_t first = role == Role::Initiator ? 0 : 1;
    for (size_t i = first; i < messages.size(); i += 2) {
        if (Contains(messages[i], Token::S)) {
            return true;
        }
    }
    return false;
}

bool HandshakePattern::RequiresRemoteStatic(Role role) const {
    const MessagePattern& peer_pre =
        role == Role::Initiator ? responder_pre_message : initiator_pre_message;
    return Contains(peer_pre, Token::S);
}

} // namespace seep::protocol::noise
