#include <catch2/catch_test_macros.hpp>
#include "seep/channel/secure_channel.hpp"
#include "seep/transport/memory_frame_transport.hpp"
#include "seep/crypto/sodium_interop.hpp"
#include "helpers/noise_configs.hpp"
#include <chrono>
#include <future>
using namespace seep::protocol;
using namespace seep::protocol::channel;
using seep::protocol::test_helpers::Bytes;

TEST_CASE("SecureChannel - Chunk size", "[channel][chunking]") {
    SECTION("Small backlogs go out whole") {
        REQUIRE(SecureChannel::ChunkSize(0, 2, 4096) == 0);
        REQUIRE(SecureChannel::ChunkSize(10, 2, 4096) == 10);
        REQUIRE(SecureChannel::ChunkSize(4096, 1, 4096) == 4096);
    }
    SECTION("Threshold chunks when the rounds can carry everything") {
        REQUIRE(SecureChannel::ChunkSize(8000, 2, 4096) == 4096);
        REQUIRE(SecureChannel::ChunkSize(8192, 2, 4096) == 4096);
    }
    SECTION("Larger chunks when they cannot") {
        REQUIRE(SecureChannel::ChunkSize(50000, 2, 4096) == 25001);
        REQUIRE(SecureChannel::ChunkSize(50000, 1, 4096) == 50001);
    }
    SECTION("No rounds means nothing rides in the handshake") {
        REQUIRE(SecureChannel::ChunkSize(50000, 0, 4096) == 0);
    }
}

TEST_CASE("SecureChannel - Staging before the handshake", "[channel]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    SecureChannel channel;
    REQUIRE(channel.State() == ChannelState::Uninitialized);

    SECTION("Everything fails before Init") {
        auto written = channel.Write(Bytes("x"));
        REQUIRE(written.UnwrapErr().type == ProtocolFailureType::InvalidState);
        std::vector<uint8_t> buffer(4);
        REQUIRE(channel.Read(buffer).UnwrapErr().type == ProtocolFailureType::InvalidState);
    }
    SECTION("Writes are buffered and reads see nothing yet") {
        REQUIRE(channel.Init().IsOk());
        REQUIRE(channel.Init().IsOk());
        REQUIRE(channel.State() == ChannelState::Staging);
        REQUIRE(channel.Write(Bytes("queued")).Unwrap() == 6);
        std::vector<uint8_t> buffer(4);
        REQUIRE(channel.Read(buffer).Unwrap() == 0);
        REQUIRE(channel.HandshakeHash().UnwrapErr().type == ProtocolFailureType::InvalidState);
    }
    SECTION("Null transport is rejected without failing the channel") {
        REQUIRE(channel.Init().IsOk());
        noise::HandshakeConfig config;
        config.pattern = "NN";
        auto result = channel.Handshake(nullptr, config);
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidInput);
        REQUIRE(channel.State() == ChannelState::Staging);
    }
}

TEST_CASE("SecureChannel - Failed handshake is terminal", "[channel]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto [local, remote] = transport::MemoryFrameTransport::CreatePair();
    SecureChannel channel;
    REQUIRE(channel.Init().IsOk());
    REQUIRE(channel.Write(Bytes("lost")).IsOk());

    noise::HandshakeConfig config;
    config.pattern = "XX";  // no static key: rejected before any I/O
    auto result = channel.Handshake(std::move(local), config);
    REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    REQUIRE(channel.State() == ChannelState::Failed);

    REQUIRE(channel.Write(Bytes("more")).UnwrapErr().type == ProtocolFailureType::ObjectDisposed);
    std::vector<uint8_t> buffer(4);
    REQUIRE(channel.Read(buffer).UnwrapErr().type == ProtocolFailureType::ObjectDisposed);
    REQUIRE(channel.Init().UnwrapErr().type == ProtocolFailureType::ObjectDisposed);

    // The transport was closed, so the peer sees the connection end.
    REQUIRE(remote->ReceiveFrame().IsErr());
}

TEST_CASE("SecureChannel - Handshake before Init is refused", "[channel]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto [local, remote] = transport::MemoryFrameTransport::CreatePair();
    SecureChannel channel;
    noise::HandshakeConfig config;
    config.pattern = "NN";
    REQUIRE(channel.Handshake(std::move(local), config).UnwrapErr().type == ProtocolFailureType::InvalidState);
}

TEST_CASE("SecureChannel - Close aborts a stalled handshake", "[channel]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto configs = seep::protocol::test_helpers::MakeConfigPair("XX");
    auto transports = transport::MemoryFrameTransport::CreatePair();
    // The peer endpoint stays open but never answers.
    auto& silent_peer = transports.second;

    SecureChannel channel;
    REQUIRE(channel.Init().IsOk());
    SecureChannel* target = &channel;
    const auto& initiator_config = configs.first;
    auto handshake = std::async(std::launch::async, [target, &transports, &initiator_config] {
        return target->Handshake(std::move(transports.first), initiator_config);
    });

    // The first XX message proves the handshake is waiting for a reply.
    REQUIRE(silent_peer->ReceiveFrame().IsOk());
    REQUIRE(channel.State() == ChannelState::Handshaking);
    std::vector<uint8_t> buffer(4);
    REQUIRE(channel.Read(buffer).UnwrapErr().type == ProtocolFailureType::InvalidState);
    REQUIRE(channel.Write(Bytes("late")).UnwrapErr().type == ProtocolFailureType::InvalidState);

    channel.Close();
    REQUIRE(handshake.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    auto result = handshake.get();
    REQUIRE(result.IsErr());
    REQUIRE(result.UnwrapErr().type == ProtocolFailureType::Transport);
    REQUIRE(channel.State() == ChannelState::Failed);
}
