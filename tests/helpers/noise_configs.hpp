#pragma once
#include "seep/noise/handshake_config.hpp"
#include "seep/noise/handshake_pattern.hpp"
#include "seep/noise/key_pair.hpp"
#include "seep/core/result.hpp"
#include "seep/core/failures.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace seep::protocol::test_helpers {

using noise::CipherSuite;
using noise::HandshakeConfig;
using noise::HandshakePattern;
using noise::KeyPair;
using enums::Role;

inline const std::vector<std::string>& AllPatternNames() {
    static const std::vector<std::string> names = {
        "N", "K", "X",
        "NN", "NK", "NX",
        "KN", "KK", "KX",
        "XN", "XK", "XX",
        "IN", "IK", "IX"};
    return names;
}

inline const std::vector<CipherSuite>& AllCipherSuites() {
    static const std::vector<CipherSuite> suites = {
        {noise::DhFunction::X25519, noise::CipherFunction::ChaChaPoly, crypto::HashAlgorithm::Sha256},
        {noise::DhFunction::X25519, noise::CipherFunction::ChaChaPoly, crypto::HashAlgorithm::Sha512},
        {noise::DhFunction::X25519, noise::CipherFunction::ChaChaPoly, crypto::HashAlgorithm::Blake2b},
        {noise::DhFunction::X25519, noise::CipherFunction::AesGcm, crypto::HashAlgorithm::Sha256},
        {noise::DhFunction::X25519, noise::CipherFunction::AesGcm, crypto::HashAlgorithm::Sha512},
        {noise::DhFunction::X25519, noise::CipherFunction::AesGcm, crypto::HashAlgorithm::Blake2b}};
    return suites;
}

inline std::shared_ptr<const KeyPair> NewKeyPair() {
    return std::make_shared<const KeyPair>(KeyPair::Generate().Unwrap());
}

/**
 * Initiator and responder configs for one pattern, with exactly the static
 * keys the pattern asks for. Throws (via Unwrap) on an unknown pattern.
 */
inline std::pair<HandshakeConfig, HandshakeConfig> MakeConfigPair(
    const std::string& pattern_name,
    const CipherSuite& suite = {},
    std::vector<uint8_t> prologue = {}) {
    const HandshakePattern pattern = HandshakePattern::FromName(pattern_name).Unwrap();

    auto initiator_static = NewKeyPair();
    auto responder_static = NewKeyPair();

    HandshakeConfig initiator;
    initiator.role = Role::Initiator;
    initiator.pattern = pattern_name;
    initiator.suite = suite;
    initiator.prologue = prologue;

    HandshakeConfig responder;
    responder.role = Role::Responder;
    responder.pattern = pattern_name;
    responder.suite = suite;
    responder.prologue = std::move(prologue);

    if (pattern.RequiresLocalStatic(Role::Initiator)) {
        initiator.static_key_pair = initiator_static;
    }
    if (pattern.RequiresLocalStatic(Role::Responder)) {
        responder.static_key_pair = responder_static;
    }
    if (pattern.RequiresRemoteStatic(Role::Initiator)) {
        initiator.remote_static_public_key = responder_static->PublicKey();
    }
    if (pattern.RequiresRemoteStatic(Role::Responder)) {
        responder.remote_static_public_key = initiator_static->PublicKey();
    }
    return {std::move(initiator), std::move(responder)};
}

inline std::vector<uint8_t> Bytes(const std::string& text) {
    return {text.begin(), text.end()};
}

inline std::vector<uint8_t> PatternBytes(size_t size, uint8_t seed = 0) {
    std::vector<uint8_t> data(size);
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<uint8_t>((i * 31 + seed) & 0xFF);
    }
    return data;
}

} // namespace seep::protocol::test_helpers
