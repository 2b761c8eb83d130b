#include "seep/noise/key_pair.hpp"
#include "seep/noise/constants.hpp"
#include "seep/crypto/sodium_interop.hpp"
#include "seep/core/format.hpp"

namespace seep::protocol::noise {

using crypto::SodiumInterop;

Result<KeyPair, ProtocolFailure> KeyPair::Generate() {
    auto generated = SodiumInterop::GenerateX25519KeyPair("noise x25519");
    if (generated.IsErr()) {
        return Result<KeyPair, ProtocolFailure>::Err(std::move(generated).UnwrapErr());
    }
    auto [private_key, public_key] = std::move(generated).Unwrap();
    return Result<KeyPair, ProtocolFailure>::Ok(
        KeyPair(std::move(private_key), std::move(public_key)));
}

Result<KeyPair, ProtocolFailure> KeyPair::FromPrivateKey(std::span<const uint8_t> private_key) {
    if (private_key.size() != kDhLength) {
        return Result<KeyPair, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("X25519 private key must be {} bytes, got {}",
                    kDhLength, private_key.size())));
    }
    auto public_key = SodiumInterop::DeriveX25519PublicKey(private_key);
    if (public_key.IsErr()) {
        return Result<KeyPair, ProtocolFailure>::Err(std::move(public_key).UnwrapErr());
    }
    auto handle_result = SecureMemoryHandle::Allocate(kDhLength);
    if (handle_result.IsErr()) {
        return Result<KeyPair, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    SecureMemoryHandle handle = std::move(handle_result).Unwrap();
    if (auto written = handle.Write(private_key); written.IsErr()) {
        return Result<KeyPair, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(written.UnwrapErr()));
    }
    return Result<KeyPair, ProtocolFailure>::Ok(
        KeyPair(std::move(handle), std::move(public_key).Unwrap()));
}

Result<KeyPair, ProtocolFailure> KeyPair::Clone() const {
    auto copied = private_key_.WithReadAccess([](std::span<const uint8_t> private_key) {
        return FromPrivateKey(private_key);
    });
    if (copied.IsErr()) {
        return Result<KeyPair, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(copied.UnwrapErr()));
    }
    return std::move(copied).Unwrap();
}

Result<std::vector<uint8_t>, ProtocolFailure> KeyPair::Dh(
    std::span<const uint8_t> peer_public_key) const {
    if (peer_public_key.size() != kDhLength) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Handshake(
                compat::format("Peer public key must be {} bytes, got {}",
                    kDhLength, peer_public_key.size())));
    }
    auto shared = private_key_.WithReadAccess([&](std::span<const uint8_t> private_key) {
        return SodiumInterop::ComputeX25519(private_key, peer_public_key);
    });
    if (shared.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(shared.UnwrapErr()));
    }
    return std::move(shared).Unwrap();
}

} // namespace seep::protocol::noise
