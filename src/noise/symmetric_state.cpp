#include "seep/noise/symmetric_state.hpp"
#include "seep/noise/constants.hpp"
#include "seep/crypto/digest.hpp"
#include "seep/crypto/hkdf.hpp"
#include "seep/crypto/sodium_interop.hpp"

namespace seep::protocol::noise {

using crypto::Digest;
using crypto::Hkdf;
using crypto::SodiumInterop;

namespace {

// HASHLEN 64 hashes yield 64-byte HKDF outputs; cipher keys take the first 32.
std::span<const uint8_t> TruncateToKey(const std::vector<uint8_t>& output) {
    return std::span<const uint8_t>(output.data(), kCipherKeyBytes);
}

void WipeAll(std::vector<std::vector<uint8_t>>& outputs) {
    for (auto& output : outputs) {
        (void) SodiumInterop::SecureWipe(output);
    }
}

} // namespace

SymmetricState::~SymmetricState() {
    if (!chaining_key_.empty()) {
        (void) SodiumInterop::SecureWipe(chaining_key_);
    }
}

Result<SymmetricState, ProtocolFailure> SymmetricState::Initialize(
    std::string_view protocol_name,
    const CipherSuite& suite) {
    const size_t hash_len = Digest::HashLength(suite.hash);
    const std::vector<uint8_t> name_bytes(protocol_name.begin(), protocol_name.end());

    std::vector<uint8_t> hash;
    if (name_bytes.size() <= hash_len) {
        hash.assign(name_bytes.begin(), name_bytes.end());
        hash.resize(hash_len, 0);
    } else {
        auto hashed = Digest::Hash(suite.hash, name_bytes);
        if (hashed.IsErr()) {
            return Result<SymmetricState, ProtocolFailure>::Err(std::move(hashed).UnwrapErr());
        }
        hash = std::move(hashed).Unwrap();
    }
    std::vector<uint8_t> chaining_key = hash;
    return Result<SymmetricState, ProtocolFailure>::Ok(
        SymmetricState(suite, std::move(chaining_key), std::move(hash)));
}

Result<Unit, ProtocolFailure> SymmetricState::MixKey(std::span<const uint8_t> input_key_material) {
    auto derived = Hkdf::Derive(suite_.hash, chaining_key_, input_key_material, 2);
    if (derived.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(std::move(derived).UnwrapErr());
    }
    auto outputs = std::move(derived).Unwrap();
    auto cipher = CipherState::Create(suite_.cipher, TruncateToKey(outputs[1]));
    if (cipher.IsErr()) {
        WipeAll(outputs);
        return Result<Unit, ProtocolFailure>::Err(std::move(cipher).UnwrapErr());
    }
    (void) SodiumInterop::SecureWipe(chaining_key_);
    chaining_key_ = std::move(outputs[0]);
    cipher_.emplace(std::move(cipher).Unwrap());
    WipeAll(outputs);
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<Unit, ProtocolFailure> SymmetricState::MixHash(std::span<const uint8_t> data) {
    auto hashed = Digest::Hash(suite_.hash, hash_, data);
    if (hashed.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(std::move(hashed).UnwrapErr());
    }
    hash_ = std::move(hashed).Unwrap();
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, ProtocolFailure> SymmetricState::EncryptAndHash(
    std::span<const uint8_t> plaintext) {
    std::vector<uint8_t> ciphertext;
    if (cipher_.has_value()) {
        auto sealed = cipher_->EncryptWithAd(hash_, plaintext);
        if (sealed.IsErr()) {
            return sealed;
        }
        ciphertext = std::move(sealed).Unwrap();
    } else {
        ciphertext.assign(plaintext.begin(), plaintext.end());
    }
    if (auto mixed = MixHash(ciphertext); mixed.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(mixed.UnwrapErr());
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(ciphertext));
}

Result<std::vector<uint8_t>, ProtocolFailure> SymmetricState::DecryptAndHash(
    std::span<const uint8_t> ciphertext) {
    std::vector<uint8_t> plaintext;
    if (cipher_.has_value()) {
        auto opened = cipher_->DecryptWithAd(hash_, ciphertext);
        if (opened.IsErr()) {
            return opened;
        }
        plaintext = std::move(opened).Unwrap();
    } else {
        plaintext.assign(ciphertext.begin(), ciphertext.end());
    }
    if (auto mixed = MixHash(ciphertext); mixed.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(mixed.UnwrapErr());
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(plaintext));
}

Result<std::pair<CipherState, CipherState>, ProtocolFailure> SymmetricState::Split() const {
    using SplitResult = Result<std::pair<CipherState, CipherState>, ProtocolFailure>;

    auto derived = Hkdf::Derive(suite_.hash, chaining_key_, {}, 2);
    if (derived.IsErr()) {
        return SplitResult::Err(std::move(derived).UnwrapErr());
    }
    auto outputs = std::move(derived).Unwrap();
    auto first = CipherState::Create(suite_.cipher, TruncateToKey(outputs[0]));
    auto second = CipherState::Create(suite_.cipher, TruncateToKey(outputs[1]));
    WipeAll(outputs);
    if (first.IsErr()) {
        return SplitResult::Err(std::move(first).UnwrapErr());
    }
    if (second.IsErr()) {
        return SplitResult::Err(std::move(second).UnwrapErr());
    }
    return SplitResult::Ok(std::make_pair(std::move(first).Unwrap(), std::move(second).Unwrap()));
}

} // namespace seep::protocol::noise
