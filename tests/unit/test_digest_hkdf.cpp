#include <catch2/catch_test_macros.hpp>
#include "seep/crypto/digest.hpp"
#include "seep/crypto/hkdf.hpp"
#include "seep/crypto/sodium_interop.hpp"
#include "helpers/hex.hpp"
#include <string>
using namespace seep::protocol;
using namespace seep::protocol::crypto;
using seep::protocol::test_helpers::FromHex;
using seep::protocol::test_helpers::ToHex;

namespace {
std::vector<uint8_t> Text(const std::string& s) {
    return {s.begin(), s.end()};
}
}

TEST_CASE("Digest - Known answers", "[digest][crypto]") {
    const auto abc = Text("abc");
    SECTION("SHA-256") {
        REQUIRE(ToHex(Digest::Hash(HashAlgorithm::Sha256, abc).Unwrap()) ==
                "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    }
    SECTION("SHA-512") {
        REQUIRE(ToHex(Digest::Hash(HashAlgorithm::Sha512, abc).Unwrap()) ==
                "ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a"
                "2192992a274fc1a836ba3c23a3feebbd454d4423643ce80e2a9ac94fa54ca49f");
    }
    SECTION("BLAKE2b-512") {
        REQUIRE(ToHex(Digest::Hash(HashAlgorithm::Blake2b, abc).Unwrap()) ==
                "ba80a53f981c4d0d6a2797b69f12f6e94c212f14685ac4b74b12bb6fdbffa2d1"
                "7d87c5392aab792dc252d5de4533cc9518d38aa8dbf1925ab92386edd4009923");
    }
    SECTION("Two-part input hashes the concatenation") {
        REQUIRE(Digest::Hash(HashAlgorithm::Sha256, Text("a"), Text("bc")).Unwrap() ==
                Digest::Hash(HashAlgorithm::Sha256, abc).Unwrap());
    }
    SECTION("Output lengths") {
        REQUIRE(Digest::HashLength(HashAlgorithm::Sha256) == 32);
        REQUIRE(Digest::HashLength(HashAlgorithm::Sha512) == 64);
        REQUIRE(Digest::HashLength(HashAlgorithm::Blake2b) == 64);
    }
}

TEST_CASE("Digest - HMAC-SHA256 RFC 4231 case 2", "[digest][crypto]") {
    auto mac = Digest::Hmac(HashAlgorithm::Sha256, Text("Jefe"), Text("what do ya want "), Text("for nothing?"));
    REQUIRE(ToHex(mac.Unwrap()) == "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST_CASE("Hkdf - Noise two and three output derivation", "[hkdf][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    for (const auto algorithm : {HashAlgorithm::Sha256, HashAlgorithm::Sha512, HashAlgorithm::Blake2b}) {
        const std::vector<uint8_t> chaining_key(Digest::HashLength(algorithm), 0x0C);
        const std::vector<uint8_t> ikm(32, 0x1D);

        const auto temp = Digest::Hmac(algorithm, chaining_key, ikm).Unwrap();
        const auto expected1 = Digest::Hmac(algorithm, temp, std::vector<uint8_t>{0x01}).Unwrap();
        const auto expected2 = Digest::Hmac(algorithm, temp, expected1, std::vector<uint8_t>{0x02}).Unwrap();
        const auto expected3 = Digest::Hmac(algorithm, temp, expected2, std::vector<uint8_t>{0x03}).Unwrap();

        auto two = Hkdf::Derive(algorithm, chaining_key, ikm, 2).Unwrap();
        REQUIRE(two.size() == 2);
        REQUIRE(two[0] == expected1);
        REQUIRE(two[1] == expected2);

        auto three = Hkdf::Derive(algorithm, chaining_key, ikm, 3).Unwrap();
        REQUIRE(three.size() == 3);
        REQUIRE(three[2] == expected3);
    }
}

TEST_CASE("Hkdf - Empty input key material is allowed", "[hkdf][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> chaining_key(32, 0x44);
    auto outputs = Hkdf::Derive(HashAlgorithm::Sha256, chaining_key, {}, 2);
    REQUIRE(outputs.IsOk());
    REQUIRE(outputs.Unwrap()[0].size() == 32);
}

TEST_CASE("Hkdf - Output count is bounded", "[hkdf][crypto]") {
    const std::vector<uint8_t> chaining_key(32, 0x44);
    REQUIRE(Hkdf::Derive(HashAlgorithm::Sha256, chaining_key, {}, 1).UnwrapErr().type ==
            ProtocolFailureType::InvalidInput);
    REQUIRE(Hkdf::Derive(HashAlgorithm::Sha256, chaining_key, {}, 4).IsErr());
}
