#include "seep/noise/cipher_suite.hpp"
#include "seep/noise/constants.hpp"
#include "seep/core/format.hpp"

#include <vector>

namespace seep::protocol::noise {

namespace {

std::vector<std::string_view> SplitName(std::string_view name) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (true) {
        const size_t pos = name.find(kNameSeparator, start);
        if (pos == std::string_view::npos) {
            parts.push_back(name.substr(start));
            break;
        }
        parts.push_back(name.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

} // namespace

std::string_view ToString(DhFunction dh) noexcept {
    switch (dh) {
        case DhFunction::X25519: return "25519";
    }
    return "UNKNOWN";
}

std::string_view ToString(CipherFunction cipher) noexcept {
    switch (cipher) {
        case CipherFunction::ChaChaPoly: return "ChaChaPoly";
        case CipherFunction::AesGcm: return "AESGCM";
    }
    return "UNKNOWN";
}

std::string_view ToString(HashAlgorithm hash) noexcept {
    switch (hash) {
        case HashAlgorithm::Sha256: return "SHA256";
        case HashAlgorithm::Sha512: return "SHA512";
        case HashAlgorithm::Blake2b: return "BLAKE2b";
    }
    return "UNKNOWN";
}

Result<ProtocolName, ProtocolFailure> ProtocolName::Parse(std::string_view name) {
    const auto parts = SplitName(name);
    if (parts.size() != 5 || parts[0] != kProtocolPrefix) {
        return Result<ProtocolName, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("Malformed Noise protocol name: '{}'", name)));
    }

    ProtocolName parsed;
    parsed.pattern = std::string(parts[1]);

    if (parts[2] == "25519") {
        parsed.suite.dh = DhFunction::X25519;
    } else {
        return Result<ProtocolName, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("Unsupported DH function: '{}'", parts[2])));
    }

    if (parts[3] == "ChaChaPoly") {
        parsed.suite.cipher = CipherFunction::ChaChaPoly;
    } else if (parts[3] == "AESGCM") {
        parsed.suite.cipher = CipherFunction::AesGcm;
    } else {
        return Result<ProtocolName, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("Unsupported cipher function: '{}'", parts[3])));
    }

    if (parts[4] == "SHA256") {
        parsed.suite.hash = HashAlgorithm::Sha256;
    } else if (parts[4] == "SHA512") {
        parsed.suite.hash = HashAlgorithm::Sha512;
    } else if (parts[4] == "BLAKE2b") {
        parsed.suite.hash = HashAlgorithm::Blake2b;
    } else {
        return Result<ProtocolName, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("Unsupported hash function: '{}'", parts[4])));
    }

    return Result<ProtocolName, ProtocolFailure>::Ok(std::move(parsed));
}

std::string ProtocolName::ToString() const {
    return compat::format("{}{}{}{}{}{}{}{}{}",
        kProtocolPrefix, kNameSeparator,
        pattern, kNameSeparator,
        noise::ToString(suite.dh), kNameSeparator,
        noise::ToString(suite.cipher), kNameSeparator,
        noise::ToString(suite.hash));
}

} // namespace seep::protocol::noise
