#include "seep/rpc/envelope_channel.hpp"
#include "seep/channel/handshake_driver.hpp"
#include "seep/core/constants.hpp"
#include "seep/debug/trace_logger.hpp"

#include <google/protobuf/message.h>

#include <string>

namespace seep::protocol::rpc {

Result<std::unique_ptr<EnvelopeChannel>, ProtocolFailure> EnvelopeChannel::Establish(
    std::unique_ptr<IFrameTransport> transport,
    const noise::HandshakeConfig& config,
    std::shared_ptr<const IPayloadSerializer> serializer) {
    using EstablishResult = Result<std::unique_ptr<EnvelopeChannel>, ProtocolFailure>;
    if (!transport) {
        return EstablishResult::Err(ProtocolFailure::InvalidInput("Transport must not be null"));
    }
    if (!serializer) {
        transport->Close();
        return EstablishResult::Err(ProtocolFailure::InvalidInput("Serializer must not be null"));
    }

    const auto role = config.role;
    auto result = channel::HandshakeDriver::Run(
        *transport, config, {},
        [role](std::vector<uint8_t> payload) {
            debug::LogDiscardedHandshakePayload(role, payload.size());
        });
    if (result.IsErr()) {
        transport->Close();
        return EstablishResult::Err(std::move(result).UnwrapErr());
    }
    channel::HandshakeResult established = std::move(result).Unwrap();
    return EstablishResult::Ok(std::unique_ptr<EnvelopeChannel>(new EnvelopeChannel(
        std::move(transport),
        std::move(serializer),
        std::move(established.ciphers),
        std::move(established.handshake_hash))));
}

EnvelopeChannel::EnvelopeChannel(
    std::unique_ptr<IFrameTransport> transport,
    std::shared_ptr<const IPayloadSerializer> serializer,
    noise::CipherStatePair ciphers,
    std::vector<uint8_t> handshake_hash)
    : transport_(std::move(transport))
    , serializer_(std::move(serializer))
    , writer_(*transport_, std::move(ciphers.send))
    , receive_(std::move(ciphers.receive))
    , handshake_hash_(std::move(handshake_hash)) {}

EnvelopeChannel::~EnvelopeChannel() {
    transport_->Close();
}

void EnvelopeChannel::Close() {
    transport_->Close();
}

Result<Unit, ProtocolFailure> EnvelopeChannel::WriteEnvelope(
    const google::protobuf::Message& header,
    const google::protobuf::Message* body) {
    auto encoded = serializer_->Encode(header, body);
    if (encoded.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(std::move(encoded).UnwrapErr());
    }
    auto written = writer_.Write(encoded.Unwrap());
    if (written.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(std::move(written).UnwrapErr());
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<Unit, ProtocolFailure> EnvelopeChannel::ReadEnvelopeHeader(google::protobuf::Message& header) {
    std::lock_guard<std::mutex> guard(read_lock_);
    if (read_poisoned_) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::ObjectDisposed(std::string(ErrorMessages::STREAM_POISONED)));
    }
    pending_body_ = nullptr;

    auto poison = [this](ProtocolFailure failure) {
        read_poisoned_ = true;
        debug::LogStreamFailure("envelope reader", failure.message);
        return Result<Unit, ProtocolFailure>::Err(std::move(failure));
    };

    auto frame = transport_->ReceiveFrame();
    if (frame.IsErr()) {
        return poison(std::move(frame).UnwrapErr());
    }
    auto opened = receive_.Decrypt(frame.Unwrap());
    if (opened.IsErr()) {
        return poison(std::move(opened).UnwrapErr());
    }
    auto decoded = serializer_->DecodeHeader(std::move(opened).Unwrap(), header);
    if (decoded.IsErr()) {
        return poison(std::move(decoded).UnwrapErr());
    }
    pending_body_ = std::move(decoded).Unwrap();
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<Unit, ProtocolFailure> EnvelopeChannel::ReadEnvelopeBody(google::protobuf::Message* body) {
    std::lock_guard<std::mutex> guard(read_lock_);
    if (!pending_body_) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState(std::string(ErrorMessages::NO_PENDING_BODY)));
    }
    BodyDecoder decode_body = std::move(pending_body_);
    pending_body_ = nullptr;
    return decode_body(body);
}

} // namespace seep::protocol::rpc
