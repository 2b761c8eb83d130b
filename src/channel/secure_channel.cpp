#include "seep/channel/secure_channel.hpp"
#include "seep/channel/handshake_driver.hpp"
#include "seep/noise/constants.hpp"
#include "seep/noise/handshake_pattern.hpp"
#include "seep/core/constants.hpp"
#include "seep/debug/trace_logger.hpp"

#include <algorithm>
#include <string>

namespace seep::protocol::channel {

namespace {

// Worst-case handshake overhead per message: e (32) + encrypted s (48) + payload tag (16).
constexpr size_t kMaxHandshakeOverhead = noise::kDhLength * 2 + noise::kAeadTagBytes * 2;
constexpr size_t kMaxHandshakePayload = noise::kMaxMessageBytes - kMaxHandshakeOverhead;

} // namespace

SecureChannel::~SecureChannel() {
    if (transport_) {
        transport_->Close();
    }
    if (flusher_.joinable()) {
        flusher_.join();
    }
}

size_t SecureChannel::ChunkSize(size_t pending, size_t rounds, size_t threshold) noexcept {
    if (pending <= threshold) {
        return pending;
    }
    if (rounds == 0) {
        return 0;
    }
    if (rounds * threshold >= pending) {
        return threshold;
    }
    return pending / rounds + 1;
}

Result<Unit, ProtocolFailure> SecureChannel::RequireUsable() const {
    switch (state_) {
        case ChannelState::Uninitialized:
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState(std::string(ErrorMessages::CHANNEL_NOT_INITIALIZED)));
        case ChannelState::Handshaking:
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState(std::string(ErrorMessages::HANDSHAKE_IN_PROGRESS)));
        case ChannelState::Failed:
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::ObjectDisposed(std::string(ErrorMessages::CHANNEL_UNUSABLE)));
        default:
            return Result<Unit, ProtocolFailure>::Ok(unit);
    }
}

Result<Unit, ProtocolFailure> SecureChannel::Init() {
    std::lock_guard<std::mutex> guard(state_lock_);
    switch (state_) {
        case ChannelState::Uninitialized:
            outbound_staging_.clear();
            state_ = ChannelState::Staging;
            return Result<Unit, ProtocolFailure>::Ok(unit);
        case ChannelState::Staging:
            return Result<Unit, ProtocolFailure>::Ok(unit);
        case ChannelState::Handshaking:
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState(std::string(ErrorMessages::HANDSHAKE_IN_PROGRESS)));
        case ChannelState::Established:
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState("Secure channel already established"));
        case ChannelState::Failed:
            break;
    }
    return Result<Unit, ProtocolFailure>::Err(
        ProtocolFailure::ObjectDisposed(std::string(ErrorMessages::CHANNEL_UNUSABLE)));
}

Result<size_t, ProtocolFailure> SecureChannel::Write(std::span<const uint8_t> data) {
    EncryptedWriter* writer = nullptr;
    {
        std::lock_guard<std::mutex> guard(state_lock_);
        if (auto usable = RequireUsable(); usable.IsErr()) {
            return Result<size_t, ProtocolFailure>::Err(usable.UnwrapErr());
        }
        if (state_ == ChannelState::Staging) {
            outbound_staging_.insert(outbound_staging_.end(), data.begin(), data.end());
            return Result<size_t, ProtocolFailure>::Ok(data.size());
        }
        writer = writer_.get();
    }
    return writer->Write(data);
}

Result<size_t, ProtocolFailure> SecureChannel::Read(std::span<uint8_t> buffer) {
    EncryptedReader* reader = nullptr;
    {
        std::lock_guard<std::mutex> guard(state_lock_);
        if (auto usable = RequireUsable(); usable.IsErr()) {
            return Result<size_t, ProtocolFailure>::Err(usable.UnwrapErr());
        }
        if (state_ == ChannelState::Staging) {
            // Nothing arrives before the handshake.
            return Result<size_t, ProtocolFailure>::Ok(0);
        }
        reader = reader_.get();
    }
    return reader->Read(buffer);
}

Result<Unit, ProtocolFailure> SecureChannel::ReadExact(std::span<uint8_t> buffer) {
    EncryptedReader* reader = nullptr;
    {
        std::lock_guard<std::mutex> guard(state_lock_);
        if (auto usable = RequireUsable(); usable.IsErr()) {
            return usable;
        }
        if (state_ == ChannelState::Staging) {
            if (!buffer.empty()) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::InvalidState("No bytes can be read before the handshake"));
            }
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }
        reader = reader_.get();
    }
    return reader->ReadExact(buffer);
}

Result<Unit, ProtocolFailure> SecureChannel::FailLocked(ProtocolFailure failure) {
    state_ = ChannelState::Failed;
    outbound_staging_.clear();
    if (transport_) {
        transport_->Close();
    }
    return Result<Unit, ProtocolFailure>::Err(std::move(failure));
}

Result<Unit, ProtocolFailure> SecureChannel::Handshake(
    std::unique_ptr<interfaces::IFrameTransport> transport,
    const noise::HandshakeConfig& config,
    const ChannelOptions& options) {
    std::vector<uint8_t> outbound;
    size_t chunk = 0;
    interfaces::IFrameTransport* wire = nullptr;
    {
        std::lock_guard<std::mutex> guard(state_lock_);
        if (auto usable = RequireUsable(); usable.IsErr()) {
            return usable;
        }
        if (state_ == ChannelState::Established) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState("Secure channel already established"));
        }
        if (!transport) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Transport must not be null"));
        }
        transport_ = std::move(transport);

        auto pattern = noise::HandshakePattern::FromName(config.pattern);
        if (pattern.IsErr()) {
            return FailLocked(std::move(pattern).UnwrapErr());
        }
        const size_t rounds = pattern.Unwrap().MessagesToSend(config.role);
        chunk = std::min(
            ChunkSize(outbound_staging_.size(), rounds, options.chunk_threshold),
            kMaxHandshakePayload);
        outbound = std::move(outbound_staging_);
        outbound_staging_.clear();
        wire = transport_.get();
        state_ = ChannelState::Handshaking;
    }

    // The transport is driven unlocked so Close can interrupt it.
    size_t outbound_offset = 0;
    std::vector<uint8_t> inbound;
    PayloadProducer produce = [&outbound, chunk, &outbound_offset]() {
        const size_t count = std::min(chunk, outbound.size() - outbound_offset);
        const auto first = outbound.begin() + static_cast<std::ptrdiff_t>(outbound_offset);
        std::vector<uint8_t> payload(first, first + static_cast<std::ptrdiff_t>(count));
        outbound_offset += count;
        return payload;
    };
    PayloadConsumer consume = [&inbound](std::vector<uint8_t> payload) {
        inbound.insert(inbound.end(), payload.begin(), payload.end());
    };
    auto result = HandshakeDriver::Run(*wire, config, produce, consume);

    std::lock_guard<std::mutex> guard(state_lock_);
    if (result.IsErr()) {
        return FailLocked(std::move(result).UnwrapErr());
    }
    HandshakeResult established = std::move(result).Unwrap();

    std::vector<uint8_t> leftover(
        outbound.begin() + static_cast<std::ptrdiff_t>(outbound_offset), outbound.end());
    const size_t leftover_size = leftover.size();
    writer_ = std::make_unique<EncryptedWriter>(
        *transport_, std::move(established.ciphers.send), std::move(leftover));
    reader_ = std::make_unique<EncryptedReader>(
        *transport_, std::move(established.ciphers.receive), std::move(inbound));
    handshake_hash_ = std::move(established.handshake_hash);
    state_ = ChannelState::Established;

    if (leftover_size > 0) {
        debug::LogStagedFlush(config.role, leftover_size);
        flusher_ = std::thread([writer = writer_.get()] { writer->Flush(); });
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, ProtocolFailure> SecureChannel::HandshakeHash() const {
    std::lock_guard<std::mutex> guard(state_lock_);
    if (state_ != ChannelState::Established) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState("Handshake has not completed"));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(handshake_hash_);
}

ChannelState SecureChannel::State() const {
    std::lock_guard<std::mutex> guard(state_lock_);
    return state_;
}

void SecureChannel::Close() {
    std::lock_guard<std::mutex> guard(state_lock_);
    if (transport_) {
        transport_->Close();
    }
}

} // namespace seep::protocol::channel
