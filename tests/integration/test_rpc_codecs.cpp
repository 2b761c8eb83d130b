#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include "seep/rpc/codec_factory.hpp"
#include "seep/rpc/secure_client_codec.hpp"
#include "seep/rpc/secure_server_codec.hpp"
#include "seep/rpc/binary_payload_serializer.hpp"
#include "seep/rpc/json_payload_serializer.hpp"
#include "seep/transport/memory_frame_transport.hpp"
#include "seep/transport/socket_frame_transport.hpp"
#include "seep/crypto/sodium_interop.hpp"
#include "helpers/noise_configs.hpp"
#include "rpc/envelope.pb.h"
#include "arith.pb.h"
#include <sys/socket.h>
#include <future>
#include <map>
#include <string>
#include <thread>
using namespace seep::protocol;
using namespace seep::protocol::test_helpers;
using interfaces::IClientCodec;
using interfaces::IServerCodec;
using seep::proto::rpc::RequestHeader;
using seep::proto::rpc::ResponseHeader;
using seep::proto::test::Args;
using seep::proto::test::Quotient;
using transport::MemoryFrameTransport;

namespace {

struct CodecPair {
    std::unique_ptr<IClientCodec> client;
    std::unique_ptr<IServerCodec> server;
};

CodecPair Connect(bool json, const std::string& pattern,
                  std::unique_ptr<interfaces::IFrameTransport> client_transport,
                  std::unique_ptr<interfaces::IFrameTransport> server_transport) {
    const auto configs = MakeConfigPair(pattern);
    const auto& client_config = configs.first;
    const auto& server_config = configs.second;
    auto server_future = std::async(std::launch::async,
        [json, &server_transport, &server_config]() {
            return json
                ? rpc::CreateJsonServerCodec(std::move(server_transport), server_config)
                : rpc::CreateBinaryServerCodec(std::move(server_transport), server_config);
        });
    auto client = json
        ? rpc::CreateJsonClientCodec(std::move(client_transport), client_config)
        : rpc::CreateBinaryClientCodec(std::move(client_transport), client_config);
    auto server = server_future.get();
    REQUIRE(client.IsOk());
    REQUIRE(server.IsOk());
    return CodecPair{std::move(client).Unwrap(), std::move(server).Unwrap()};
}

CodecPair ConnectInMemory(bool json, const std::string& pattern = "XX") {
    auto [a, b] = MemoryFrameTransport::CreatePair();
    return Connect(json, pattern, std::move(a), std::move(b));
}

// Serve one Arith.Divide call.
Result<Unit, ProtocolFailure> ServeDivide(IServerCodec& server) {
    RequestHeader request;
    if (auto read = server.ReadRequestHeader(request); read.IsErr()) {
        return read;
    }
    Args args;
    if (auto body = server.ReadRequestBody(&args); body.IsErr()) {
        return body;
    }
    ResponseHeader response;
    response.set_service_method(request.service_method());
    response.set_seq(request.seq());
    if (args.b() == 0) {
        response.set_error("divide by zero");
        return server.WriteResponse(response, nullptr);
    }
    Quotient quotient;
    quotient.set_quo(args.a() / args.b());
    quotient.set_rem(args.a() % args.b());
    return server.WriteResponse(response, &quotient);
}

Result<Unit, ProtocolFailure> CallDivide(IClientCodec& client, uint64_t seq, int64_t a, int64_t b) {
    RequestHeader request;
    request.set_service_method("Arith.Divide");
    request.set_seq(seq);
    Args args;
    args.set_a(a);
    args.set_b(b);
    return client.WriteRequest(request, &args);
}

} // namespace

TEST_CASE("Codecs - Call and reply arrive intact", "[integration][rpc]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const bool json = GENERATE(false, true);
    const std::string pattern = GENERATE(as<std::string>{}, "NN", "XX", "IK", "KK");
    CAPTURE(json, pattern);
    auto codecs = ConnectInMemory(json, pattern);

    REQUIRE(CallDivide(*codecs.client, 1, 17, 5).IsOk());
    REQUIRE(ServeDivide(*codecs.server).IsOk());

    ResponseHeader response;
    REQUIRE(codecs.client->ReadResponseHeader(response).IsOk());
    REQUIRE(response.service_method() == "Arith.Divide");
    REQUIRE(response.seq() == 1);
    REQUIRE(response.error().empty());
    Quotient quotient;
    REQUIRE(codecs.client->ReadResponseBody(&quotient).IsOk());
    REQUIRE(quotient.quo() == 3);
    REQUIRE(quotient.rem() == 2);
}

TEST_CASE("Codecs - Error replies carry no body", "[integration][rpc]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const bool json = GENERATE(false, true);
    auto codecs = ConnectInMemory(json);

    REQUIRE(CallDivide(*codecs.client, 9, 1, 0).IsOk());
    REQUIRE(ServeDivide(*codecs.server).IsOk());

    ResponseHeader response;
    REQUIRE(codecs.client->ReadResponseHeader(response).IsOk());
    REQUIRE(response.error() == "divide by zero");
    REQUIRE(codecs.client->ReadResponseBody(nullptr).IsOk());
}

TEST_CASE("Codecs - Body reads need a pending header", "[integration][rpc]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto codecs = ConnectInMemory(false);
    Quotient quotient;
    REQUIRE(codecs.client->ReadResponseBody(&quotient).UnwrapErr().type == ProtocolFailureType::InvalidState);

    REQUIRE(CallDivide(*codecs.client, 2, 8, 2).IsOk());
    RequestHeader request;
    REQUIRE(codecs.server->ReadRequestHeader(request).IsOk());
    Args args;
    REQUIRE(codecs.server->ReadRequestBody(&args).IsOk());
    REQUIRE(codecs.server->ReadRequestBody(&args).UnwrapErr().type == ProtocolFailureType::InvalidState);
}

TEST_CASE("Codecs - An unread body is dropped by the next header", "[integration][rpc]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto codecs = ConnectInMemory(true);
    REQUIRE(CallDivide(*codecs.client, 1, 10, 3).IsOk());
    REQUIRE(CallDivide(*codecs.client, 2, 20, 3).IsOk());

    RequestHeader request;
    REQUIRE(codecs.server->ReadRequestHeader(request).IsOk());
    REQUIRE(request.seq() == 1);
    REQUIRE(codecs.server->ReadRequestHeader(request).IsOk());
    REQUIRE(request.seq() == 2);
    Args args;
    REQUIRE(codecs.server->ReadRequestBody(&args).IsOk());
    REQUIRE(args.a() == 20);
}

TEST_CASE("Codecs - Many calls in flight over a socket", "[integration][rpc][socket]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const bool json = GENERATE(false, true);
    int fds[2] = {-1, -1};
    REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
    auto codecs = Connect(json, "XX",
        transport::SocketFrameTransport::Adopt(fds[0]).Unwrap(),
        transport::SocketFrameTransport::Adopt(fds[1]).Unwrap());

    constexpr int kCalls = 32;
    IServerCodec* server = codecs.server.get();
    auto served = std::async(std::launch::async, [server]() {
        for (int i = 0; i < kCalls; ++i) {
            if (ServeDivide(*server).IsErr()) {
                return false;
            }
        }
        return true;
    });

    IClientCodec* client = codecs.client.get();
    std::vector<std::future<bool>> callers;
    for (int i = 0; i < kCalls; ++i) {
        callers.push_back(std::async(std::launch::async, [client, i]() {
            return CallDivide(*client, static_cast<uint64_t>(i), 1000 + i, 7).IsOk();
        }));
    }
    for (auto& caller : callers) {
        REQUIRE(caller.get());
    }

    std::map<uint64_t, Quotient> replies;
    for (int i = 0; i < kCalls; ++i) {
        ResponseHeader response;
        REQUIRE(codecs.client->ReadResponseHeader(response).IsOk());
        Quotient quotient;
        REQUIRE(codecs.client->ReadResponseBody(&quotient).IsOk());
        replies[response.seq()] = quotient;
    }
    REQUIRE(served.get());
    REQUIRE(replies.size() == static_cast<size_t>(kCalls));
    for (const auto& [seq, quotient] : replies) {
        const int64_t a = 1000 + static_cast<int64_t>(seq);
        REQUIRE(quotient.quo() == a / 7);
        REQUIRE(quotient.rem() == a % 7);
    }
}

TEST_CASE("Codecs - Close ends the peer's reads", "[integration][rpc]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto codecs = ConnectInMemory(false, "NN");
    codecs.client->Close();
    RequestHeader request;
    auto read = codecs.server->ReadRequestHeader(request);
    REQUIRE(read.UnwrapErr().type == ProtocolFailureType::Transport);
    REQUIRE(codecs.server->ReadRequestHeader(request).UnwrapErr().type == ProtocolFailureType::ObjectDisposed);
}

TEST_CASE("Codecs - Handshake failure closes the transport", "[integration][rpc]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto [a, b] = MemoryFrameTransport::CreatePair();
    noise::HandshakeConfig config;
    config.pattern = "IK";  // no keys
    auto client = rpc::CreateBinaryClientCodec(std::move(a), config);
    REQUIRE(client.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    REQUIRE(b->ReceiveFrame().IsErr());
}

TEST_CASE("Codecs - Handshake hash is shared by both ends", "[integration][rpc]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const auto configs = MakeConfigPair("XX");
    auto transports = MemoryFrameTransport::CreatePair();
    auto& a = transports.first;
    auto& b = transports.second;
    const auto& client_config = configs.first;
    const auto& server_config = configs.second;
    auto serializer = std::make_shared<const rpc::BinaryPayloadSerializer>();
    auto server_future = std::async(std::launch::async, [&b, &server_config, serializer]() {
        return rpc::SecureServerCodec::Create(std::move(b), server_config, serializer);
    });
    auto client = rpc::SecureClientCodec::Create(std::move(a), client_config, serializer);
    auto server = server_future.get();
    REQUIRE(client.IsOk());
    REQUIRE(server.IsOk());
    REQUIRE(client.Unwrap()->HandshakeHash() == server.Unwrap()->HandshakeHash());
    REQUIRE(client.Unwrap()->HandshakeHash().size() == 32);
}
