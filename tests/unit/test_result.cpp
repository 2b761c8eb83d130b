#include <catch2/catch_test_macros.hpp>
#include "seep/core/result.hpp"
#include "seep/core/failures.hpp"
#include <memory>
#include <string>
using namespace seep::protocol;

TEST_CASE("Result - Ok and Err construction", "[result][core]") {
    SECTION("Ok carries its value") {
        auto result = Result<int, ProtocolFailure>::Ok(7);
        REQUIRE(result.IsOk());
        REQUIRE_FALSE(result.IsErr());
        REQUIRE(result.Unwrap() == 7);
    }
    SECTION("Err carries the failure type and message") {
        auto result = Result<int, ProtocolFailure>::Err(ProtocolFailure::Transport("peer went away"));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::Transport);
        REQUIRE(result.UnwrapErr().message == "peer went away");
    }
    SECTION("Unwrap on Err throws") {
        auto result = Result<int, ProtocolFailure>::Err(ProtocolFailure::Decode("bad"));
        REQUIRE_THROWS(result.Unwrap());
    }
    SECTION("UnwrapErr on Ok throws") {
        auto result = Result<Unit, ProtocolFailure>::Ok(unit);
        REQUIRE_THROWS(result.UnwrapErr());
    }
}

TEST_CASE("Result - Move-only values", "[result][core]") {
    auto result = Result<std::unique_ptr<int>, ProtocolFailure>::Ok(std::make_unique<int>(5));
    REQUIRE(result.IsOk());
    std::unique_ptr<int> value = std::move(result).Unwrap();
    REQUIRE(*value == 5);
}

TEST_CASE("Result - Map and MapErr", "[result][core]") {
    SECTION("Map transforms Ok") {
        auto mapped = Result<int, ProtocolFailure>::Ok(21).Map([](int x) { return x * 2; });
        REQUIRE(mapped.Unwrap() == 42);
    }
    SECTION("Map leaves Err untouched") {
        auto mapped = Result<int, ProtocolFailure>::Err(ProtocolFailure::Encode("e"))
            .Map([](int x) { return std::to_string(x); });
        REQUIRE(mapped.IsErr());
        REQUIRE(mapped.UnwrapErr().type == ProtocolFailureType::Encode);
    }
    SECTION("MapErr converts failure") {
        auto mapped = Result<int, ProtocolFailure>::Err(ProtocolFailure::Decrypt("tag"))
            .MapErr([](ProtocolFailure f) { return ProtocolFailure::Handshake(f.message); });
        REQUIRE(mapped.UnwrapErr().type == ProtocolFailureType::Handshake);
        REQUIRE(mapped.UnwrapErr().message == "tag");
    }
}
