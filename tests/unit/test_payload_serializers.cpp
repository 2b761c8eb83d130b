#include <catch2/catch_test_macros.hpp>
#include "seep/rpc/binary_payload_serializer.hpp"
#include "seep/rpc/json_payload_serializer.hpp"
#include "rpc/envelope.pb.h"
#include "arith.pb.h"
#include <memory>
#include <string>
using namespace seep::protocol;
using namespace seep::protocol::rpc;

namespace {

seep::proto::rpc::RequestHeader MakeHeader() {
    seep::proto::rpc::RequestHeader header;
    header.set_service_method("Arith.Divide");
    header.set_seq(7);
    return header;
}

seep::proto::test::Args MakeArgs() {
    seep::proto::test::Args args;
    args.set_a(17);
    args.set_b(-5);
    return args;
}

void CheckRoundTrip(const interfaces::IPayloadSerializer& serializer) {
    const auto header = MakeHeader();
    const auto args = MakeArgs();
    auto payload = serializer.Encode(header, &args).Unwrap();

    seep::proto::rpc::RequestHeader decoded_header;
    auto body = serializer.DecodeHeader(payload, decoded_header).Unwrap();
    REQUIRE(decoded_header.service_method() == "Arith.Divide");
    REQUIRE(decoded_header.seq() == 7);

    seep::proto::test::Args decoded_args;
    REQUIRE(body(&decoded_args).IsOk());
    REQUIRE(decoded_args.a() == 17);
    REQUIRE(decoded_args.b() == -5);
}

} // namespace

TEST_CASE("Payload serializers - Header and body", "[rpc][serializer]") {
    SECTION("binary") {
        BinaryPayloadSerializer serializer;
        REQUIRE(serializer.Name() == "binary");
        CheckRoundTrip(serializer);
    }
    SECTION("json") {
        JsonPayloadSerializer serializer;
        REQUIRE(serializer.Name() == "json");
        CheckRoundTrip(serializer);
    }
}

TEST_CASE("Payload serializers - Missing and skipped bodies", "[rpc][serializer]") {
    std::unique_ptr<interfaces::IPayloadSerializer> serializer;
    SECTION("binary") { serializer = std::make_unique<BinaryPayloadSerializer>(); }
    SECTION("json") { serializer = std::make_unique<JsonPayloadSerializer>(); }

    const auto header = MakeHeader();
    SECTION("Null body decodes as an empty message") {
        auto payload = serializer->Encode(header, nullptr).Unwrap();
        seep::proto::rpc::RequestHeader decoded;
        auto body = serializer->DecodeHeader(payload, decoded).Unwrap();
        seep::proto::test::Args args;
        args.set_a(99);
        REQUIRE(body(&args).IsOk());
        REQUIRE(args.a() == 0);
    }
    SECTION("Body can be discarded") {
        const auto args = MakeArgs();
        auto payload = serializer->Encode(header, &args).Unwrap();
        seep::proto::rpc::RequestHeader decoded;
        auto body = serializer->DecodeHeader(payload, decoded).Unwrap();
        REQUIRE(body(nullptr).IsOk());
    }
}

TEST_CASE("BinaryPayloadSerializer - Malformed payloads", "[rpc][serializer]") {
    BinaryPayloadSerializer serializer;
    seep::proto::rpc::RequestHeader header;

    SECTION("Header length runs past the payload") {
        const std::vector<uint8_t> payload = {0x10, 0x0A};
        REQUIRE(serializer.DecodeHeader(payload, header).UnwrapErr().type == ProtocolFailureType::Decode);
    }
    SECTION("Empty payload") {
        REQUIRE(serializer.DecodeHeader({}, header).UnwrapErr().type == ProtocolFailureType::Decode);
    }
    SECTION("Trailing bytes after the body") {
        const auto args = MakeArgs();
        auto payload = serializer.Encode(MakeHeader(), &args).Unwrap();
        payload.push_back(0x00);
        auto body = serializer.DecodeHeader(payload, header).Unwrap();
        seep::proto::test::Args decoded;
        REQUIRE(body(&decoded).UnwrapErr().type == ProtocolFailureType::Decode);
    }
}

TEST_CASE("JsonPayloadSerializer - Wire text", "[rpc][serializer]") {
    JsonPayloadSerializer serializer;
    const auto args = MakeArgs();
    auto payload = serializer.Encode(MakeHeader(), &args).Unwrap();
    const std::string text(payload.begin(), payload.end());
    REQUIRE(text.find('\n') != std::string::npos);
    REQUIRE(text.find("\"service_method\":\"Arith.Divide\"") != std::string::npos);

    seep::proto::rpc::RequestHeader header;
    SECTION("No separator line") {
        const std::string bad = "{\"seq\":\"1\"}";
        REQUIRE(serializer.DecodeHeader({bad.begin(), bad.end()}, header).UnwrapErr().type ==
                ProtocolFailureType::Decode);
    }
    SECTION("Unknown header field") {
        const std::string bad = "{\"bogus\":1}\n{}";
        REQUIRE(serializer.DecodeHeader({bad.begin(), bad.end()}, header).IsErr());
    }
    SECTION("Body of the wrong shape") {
        const std::string bad = "{\"seq\":\"1\"}\n{\"a\":\"not a number\"}";
        auto body = serializer.DecodeHeader({bad.begin(), bad.end()}, header).Unwrap();
        seep::proto::test::Args decoded;
        REQUIRE(body(&decoded).UnwrapErr().type == ProtocolFailureType::Decode);
    }
}
