#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include "seep/transport/memory_frame_transport.hpp"
#include "seep/transport/socket_frame_transport.hpp"
#include "seep/crypto/sodium_interop.hpp"
#include "helpers/channel_harness.hpp"
#include "helpers/noise_configs.hpp"
#include <sys/socket.h>
#include <future>
using namespace seep::protocol;
using namespace seep::protocol::test_helpers;
using transport::MemoryFrameTransport;

TEST_CASE("SecureChannel - Bytes written before the handshake arrive first", "[integration][pre_handshake]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const size_t size = GENERATE(size_t{10}, size_t{5000}, size_t{50000});
    const std::string pattern = GENERATE(as<std::string>{}, "XX", "NN", "IK");
    CAPTURE(size, pattern);

    auto [initiator_config, responder_config] = MakeConfigPair(pattern);
    const auto from_initiator = PatternBytes(size, 1);
    const auto from_responder = PatternBytes(size, 2);

    auto [a, b] = MemoryFrameTransport::CreatePair();
    auto pair = HandshakePair(std::move(a), std::move(b),
        initiator_config, responder_config, from_initiator, from_responder);
    REQUIRE(pair.initiator_result.IsOk());
    REQUIRE(pair.responder_result.IsOk());

    // Staged bytes come first, then anything written afterwards.
    REQUIRE(pair.initiator->Write(Bytes("tail")).IsOk());
    REQUIRE(ReadBytes(*pair.responder, size).Unwrap() == from_initiator);
    REQUIRE(ReadBytes(*pair.responder, 4).Unwrap() == Bytes("tail"));

    REQUIRE(ReadBytes(*pair.initiator, size).Unwrap() == from_responder);
}

TEST_CASE("SecureChannel - Staged bytes of a side with no handshake turn", "[integration][pre_handshake]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const size_t size = GENERATE(size_t{10}, size_t{50000});
    CAPTURE(size);

    // In one-way N the responder sends no handshake message, so its staged
    // bytes go out encrypted right after the handshake.
    auto [initiator_config, responder_config] = MakeConfigPair("N");
    const auto staged = PatternBytes(size, 7);
    auto [a, b] = MemoryFrameTransport::CreatePair();
    auto pair = HandshakePair(std::move(a), std::move(b),
        initiator_config, responder_config, {}, staged);
    REQUIRE(pair.initiator_result.IsOk());
    REQUIRE(pair.responder_result.IsOk());
    REQUIRE(ReadBytes(*pair.initiator, size).Unwrap() == staged);
}

TEST_CASE("SecureChannel - Staged data larger than a handshake message", "[integration][pre_handshake]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    // NN gives the initiator a single round, so most of this is flushed later.
    auto [initiator_config, responder_config] = MakeConfigPair("NN");
    const auto staged = PatternBytes(200 * 1024, 3);
    auto [a, b] = MemoryFrameTransport::CreatePair();
    auto pair = HandshakePair(std::move(a), std::move(b),
        initiator_config, responder_config, staged, {});
    REQUIRE(pair.initiator_result.IsOk());
    REQUIRE(pair.responder_result.IsOk());
    REQUIRE(ReadBytes(*pair.responder, staged.size()).Unwrap() == staged);
}

TEST_CASE("SecureChannel - Custom chunk threshold", "[integration][pre_handshake]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto [initiator_config, responder_config] = MakeConfigPair("XX");
    ChannelOptions options;
    options.chunk_threshold = 16;
    const auto staged = PatternBytes(100, 9);
    auto [a, b] = MemoryFrameTransport::CreatePair();
    auto pair = HandshakePair(std::move(a), std::move(b),
        initiator_config, responder_config, staged, staged, options);
    REQUIRE(pair.initiator_result.IsOk());
    REQUIRE(pair.responder_result.IsOk());
    REQUIRE(ReadBytes(*pair.responder, staged.size()).Unwrap() == staged);
    REQUIRE(ReadBytes(*pair.initiator, staged.size()).Unwrap() == staged);
}

TEST_CASE("SecureChannel - Large backlogs on both sides drain over a socket", "[integration][pre_handshake]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    // Far beyond what a socket buffer holds, so neither side can finish
    // sending before the other starts reading.
    constexpr size_t kBacklog = 1024 * 1024;
    auto [initiator_config, responder_config] = MakeConfigPair("NN");
    const auto from_initiator = PatternBytes(kBacklog, 3);
    const auto from_responder = PatternBytes(kBacklog, 4);

    int fds[2];
    REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
    auto a = transport::SocketFrameTransport::Adopt(fds[0]).Unwrap();
    auto b = transport::SocketFrameTransport::Adopt(fds[1]).Unwrap();

    auto pair = HandshakePair(std::move(a), std::move(b),
        initiator_config, responder_config, from_initiator, from_responder);
    REQUIRE(pair.initiator_result.IsOk());
    REQUIRE(pair.responder_result.IsOk());

    SecureChannel* responder = pair.responder.get();
    auto responder_read = std::async(std::launch::async, [responder] {
        return ReadBytes(*responder, kBacklog);
    });
    REQUIRE(ReadBytes(*pair.initiator, kBacklog).Unwrap() == from_responder);
    REQUIRE(responder_read.get().Unwrap() == from_initiator);

    // Writes after the handshake queue behind the backlog record.
    REQUIRE(pair.initiator->Write(Bytes("after")).IsOk());
    REQUIRE(ReadBytes(*pair.responder, 5).Unwrap() == Bytes("after"));
}
