#include "seep/noise/handshake_config.hpp"

namespace seep::protocol::noise {

Result<HandshakeConfig, ProtocolFailure> HandshakeConfig::FromProtocolName(
    std::string_view protocol_name,
    Role role) {
    auto parsed = ProtocolName::Parse(protocol_name);
    if (parsed.IsErr()) {
        return Result<HandshakeConfig, ProtocolFailure>::Err(std::move(parsed).UnwrapErr());
    }
    ProtocolName name = std::move(parsed).Unwrap();
    HandshakeConfig config;
    config.role = role;
    config.pattern = std::move(name.pattern);
    config.suite = name.suite;
    return Result<HandshakeConfig, ProtocolFailure>::Ok(std::move(config));
}

std::string HandshakeConfig::ProtocolNameString() const {
    return ProtocolName{pattern, suite}.ToString();
}

} // namespace seep::protocol::noise
