#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include "seep/rpc/codec_factory.hpp"
#include "seep/transport/memory_frame_transport.hpp"
#include "seep/crypto/sodium_interop.hpp"
#include "helpers/channel_harness.hpp"
#include "helpers/noise_configs.hpp"
#include "helpers/tampering_transport.hpp"
#include "rpc/envelope.pb.h"
#include "arith.pb.h"
#include <future>
using namespace seep::protocol;
using namespace seep::protocol::test_helpers;
using transport::MemoryFrameTransport;

TEST_CASE("Attacks - Flipped bit in a post-handshake frame", "[attacks][channel]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const std::string pattern = GENERATE(as<std::string>{}, "NN", "XX", "IK");
    const size_t byte_offset = GENERATE(size_t{0}, size_t{7}, size_t{40});
    CAPTURE(pattern, byte_offset);

    auto [initiator_config, responder_config] = MakeConfigPair(pattern);
    const size_t handshake_frames =
        noise::HandshakePattern::FromName(pattern).Unwrap().MessagesToSend(enums::Role::Initiator);

    auto [a, b] = MemoryFrameTransport::CreatePair();
    // Corrupt the second post-handshake frame the initiator sends.
    auto tampering = std::make_unique<TamperingFrameTransport>(
        std::move(a), FlipBitInFrame(handshake_frames + 1, byte_offset));
    auto pair = HandshakePair(std::move(tampering), std::move(b), initiator_config, responder_config);
    REQUIRE(pair.initiator_result.IsOk());
    REQUIRE(pair.responder_result.IsOk());

    REQUIRE(pair.initiator->Write(Bytes("intact")).IsOk());
    REQUIRE(pair.initiator->Write(PatternBytes(48)).IsOk());
    REQUIRE(ReadBytes(*pair.responder, 6).Unwrap() == Bytes("intact"));

    std::vector<uint8_t> buffer(48);
    auto read = pair.responder->Read(buffer);
    REQUIRE(read.IsErr());
    REQUIRE(read.UnwrapErr().type == ProtocolFailureType::Decrypt);
    REQUIRE(pair.responder->Read(buffer).UnwrapErr().type == ProtocolFailureType::ObjectDisposed);
}

TEST_CASE("Attacks - Dropped frame desynchronizes the nonce", "[attacks][channel]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto [initiator_config, responder_config] = MakeConfigPair("NN");
    auto [a, b] = MemoryFrameTransport::CreatePair();
    auto dropping = std::make_unique<TamperingFrameTransport>(
        std::move(a), [](size_t index, std::vector<uint8_t>&) { return index != 1; });
    auto pair = HandshakePair(std::move(dropping), std::move(b), initiator_config, responder_config);
    REQUIRE(pair.initiator_result.IsOk());
    REQUIRE(pair.responder_result.IsOk());

    REQUIRE(pair.initiator->Write(Bytes("first")).IsOk());
    REQUIRE(pair.initiator->Write(Bytes("second")).IsOk());
    std::vector<uint8_t> buffer(16);
    REQUIRE(pair.responder->Read(buffer).UnwrapErr().type == ProtocolFailureType::Decrypt);
}

TEST_CASE("Attacks - Tampered handshake message", "[attacks][handshake]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    SECTION("XX second message: responder's encrypted static") {
        auto [initiator_config, responder_config] = MakeConfigPair("XX");
        auto [a, b] = MemoryFrameTransport::CreatePair();
        // Responder sends one handshake frame; flip a bit inside its encrypted static.
        auto tampering = std::make_unique<TamperingFrameTransport>(std::move(b), FlipBitInFrame(0, 40));
        auto pair = HandshakePair(std::move(a), std::move(tampering), initiator_config, responder_config);
        REQUIRE(pair.initiator_result.IsErr());
        REQUIRE(pair.initiator_result.UnwrapErr().type == ProtocolFailureType::Handshake);
        // The initiator closes its transport, so the responder waiting for message 3 fails too.
        REQUIRE(pair.responder_result.IsErr());
        REQUIRE(pair.initiator->State() == channel::ChannelState::Failed);
    }
    SECTION("NN first message: initiator's ephemeral key") {
        auto [initiator_config, responder_config] = MakeConfigPair("NN");
        auto [a, b] = MemoryFrameTransport::CreatePair();
        auto tampering = std::make_unique<TamperingFrameTransport>(std::move(a), FlipBitInFrame(0, 3));
        auto pair = HandshakePair(std::move(tampering), std::move(b), initiator_config, responder_config);
        // The responder cannot tell, but the initiator rejects the reply.
        REQUIRE(pair.initiator_result.IsErr());
        REQUIRE(pair.initiator_result.UnwrapErr().type == ProtocolFailureType::Handshake);
    }
    SECTION("Truncated handshake message") {
        auto [initiator_config, responder_config] = MakeConfigPair("XX");
        auto [a, b] = MemoryFrameTransport::CreatePair();
        auto truncating = std::make_unique<TamperingFrameTransport>(
            std::move(a), [](size_t index, std::vector<uint8_t>& frame) {
                if (index == 0) {
                    frame.resize(10);
                }
                return true;
            });
        auto pair = HandshakePair(std::move(truncating), std::move(b), initiator_config, responder_config);
        REQUIRE(pair.responder_result.IsErr());
        REQUIRE(pair.responder_result.UnwrapErr().type == ProtocolFailureType::Handshake);
        REQUIRE(pair.initiator_result.IsErr());
    }
}

TEST_CASE("Attacks - Tampered codec envelope", "[attacks][rpc]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const bool json = GENERATE(false, true);
    CAPTURE(json);
    const auto configs = MakeConfigPair("XX");
    auto transports = MemoryFrameTransport::CreatePair();
    // XX initiator sends two handshake frames; the first request is frame 2.
    auto tampering = std::make_unique<TamperingFrameTransport>(
        std::move(transports.first), FlipBitInFrame(2, 5));
    std::unique_ptr<interfaces::IFrameTransport> server_transport = std::move(transports.second);

    const auto& server_config = configs.second;
    auto server_future = std::async(std::launch::async, [json, &server_transport, &server_config] {
        return json ? rpc::CreateJsonServerCodec(std::move(server_transport), server_config)
                    : rpc::CreateBinaryServerCodec(std::move(server_transport), server_config);
    });
    auto client = json ? rpc::CreateJsonClientCodec(std::move(tampering), configs.first)
                       : rpc::CreateBinaryClientCodec(std::move(tampering), configs.first);
    auto server = server_future.get();
    REQUIRE(client.IsOk());
    REQUIRE(server.IsOk());

    seep::proto::rpc::RequestHeader request;
    request.set_service_method("Arith.Divide");
    request.set_seq(1);
    seep::proto::test::Args args;
    args.set_a(4);
    args.set_b(2);
    REQUIRE(client.Unwrap()->WriteRequest(request, &args).IsOk());

    seep::proto::rpc::RequestHeader received;
    auto read = server.Unwrap()->ReadRequestHeader(received);
    REQUIRE(read.IsErr());
    REQUIRE(read.UnwrapErr().type == ProtocolFailureType::Decrypt);
}
