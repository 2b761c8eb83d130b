#include "seep/crypto/digest.hpp"
#include "seep/core/constants.hpp"
#include "seep/core/format.hpp"
#include <openssl/core_names.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/params.h>
#include <memory>
#include <string>
namespace seep::protocol::crypto {
using OpenSSL = OpenSSLConstants;
namespace {
    struct EVP_MD_Deleter {
        void operator()(EVP_MD* md) const { EVP_MD_free(md); }
    };
    struct EVP_MD_CTX_Deleter {
        void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
    };
    struct EVP_MAC_Deleter {
        void operator()(EVP_MAC* mac) const { EVP_MAC_free(mac); }
    };
    struct EVP_MAC_CTX_Deleter {
        void operator()(EVP_MAC_CTX* ctx) const { EVP_MAC_CTX_free(ctx); }
    };
    using EVP_MD_ptr = std::unique_ptr<EVP_MD, EVP_MD_Deleter>;
    using EVP_MD_CTX_ptr = std::unique_ptr<EVP_MD_CTX, EVP_MD_CTX_Deleter>;
    using EVP_MAC_ptr = std::unique_ptr<EVP_MAC, EVP_MAC_Deleter>;
    using EVP_MAC_CTX_ptr = std::unique_ptr<EVP_MAC_CTX, EVP_MAC_CTX_Deleter>;

    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }
}
std::string_view Digest::Name(HashAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case HashAlgorithm::Sha256: return OpenSSL::DIGEST_SHA256;
        case HashAlgorithm::Sha512: return OpenSSL::DIGEST_SHA512;
        case HashAlgorithm::Blake2b: return OpenSSL::DIGEST_BLAKE2B;
    }
    return OpenSSL::DIGEST_SHA256;
}
Result<std::vector<uint8_t>, ProtocolFailure> Digest::Hash(
    HashAlgorithm algorithm,
    std::span<const uint8_t> first,
    std::span<const uint8_t> second) {
    const std::string name(Name(algorithm));
    EVP_MD_ptr md(EVP_MD_fetch(nullptr, name.c_str(), nullptr));
    if (!md) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Generic(
                compat::format("Failed to fetch digest {}: {}", name, GetOpenSSLError())));
    }
    EVP_MD_CTX_ptr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), md.get(), nullptr) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Generic(
                compat::format("Failed to initialize digest {}: {}", name, GetOpenSSLError())));
    }
    if (EVP_DigestUpdate(ctx.get(), first.data(), first.size()) != OpenSSL::SUCCESS ||
        EVP_DigestUpdate(ctx.get(), second.data(), second.size()) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Generic(
                compat::format("Digest update failed: {}", GetOpenSSLError())));
    }
    std::vector<uint8_t> output(HashLength(algorithm));
    unsigned int output_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), output.data(), &output_len) != OpenSSL::SUCCESS ||
        output_len != output.size()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Generic(
                compat::format("Digest finalization failed: {}", GetOpenSSLError())));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(output));
}
Result<std::vector<uint8_t>, ProtocolFailure> Digest::Hmac(
    HashAlgorithm algorithm,
    std::span<const uint8_t> key,
    std::span<const uint8_t> first,
    std::span<const uint8_t> second) {
    const std::string algorithm_name(OpenSSL::ALGORITHM_HMAC);
    EVP_MAC_ptr mac(EVP_MAC_fetch(nullptr, algorithm_name.c_str(), nullptr));
    if (!mac) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey(
                compat::format("Failed to fetch HMAC: {}", GetOpenSSLError())));
    }
    EVP_MAC_CTX_ptr ctx(EVP_MAC_CTX_new(mac.get()));
    if (!ctx) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey(
                compat::format("Failed to create HMAC context: {}", GetOpenSSLError())));
    }
    std::string digest_name(Name(algorithm));
    std::string param_digest(OpenSSL::PARAM_DIGEST);
    OSSL_PARAM params[2];
    params[0] = OSSL_PARAM_construct_utf8_string(param_digest.c_str(), digest_name.data(), 0);
    params[1] = OSSL_PARAM_construct_end();
    if (EVP_MAC_init(ctx.get(), key.data(), key.size(), params) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey(
                compat::format("Failed to initialize HMAC-{}: {}", digest_name, GetOpenSSLError())));
    }
    if (EVP_MAC_update(ctx.get(), first.data(), first.size()) != OpenSSL::SUCCESS ||
        EVP_MAC_update(ctx.get(), second.data(), second.size()) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey(
                compat::format("HMAC update failed: {}", GetOpenSSLError())));
    }
    std::vector<uint8_t> output(HashLength(algorithm));
    size_t output_len = 0;
    if (EVP_MAC_final(ctx.get(), output.data(), &output_len, output.size()) != OpenSSL::SUCCESS ||
        output_len != output.size()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey(
                compat::format("HMAC finalization failed: {}", GetOpenSSLError())));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(output));
}
}
