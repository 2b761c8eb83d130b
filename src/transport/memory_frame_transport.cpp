#include "seep/transport/memory_frame_transport.hpp"
#include "seep/core/constants.hpp"
#include "seep/core/format.hpp"

#include <string>

namespace seep::protocol::transport {

std::pair<std::unique_ptr<MemoryFrameTransport>, std::unique_ptr<MemoryFrameTransport>>
MemoryFrameTransport::CreatePair(const TransportOptions& options) {
    auto a_to_b = std::make_shared<Queue>();
    auto b_to_a = std::make_shared<Queue>();
    std::unique_ptr<MemoryFrameTransport> a(
        new MemoryFrameTransport(b_to_a, a_to_b, options.max_frame_bytes));
    std::unique_ptr<MemoryFrameTransport> b(
        new MemoryFrameTransport(a_to_b, b_to_a, options.max_frame_bytes));
    return {std::move(a), std::move(b)};
}

MemoryFrameTransport::~MemoryFrameTransport() {
    Close();
}

void MemoryFrameTransport::CloseQueue(Queue& queue) {
    {
        std::lock_guard<std::mutex> guard(queue.lock);
        queue.closed = true;
    }
    queue.ready.notify_all();
}

void MemoryFrameTransport::Close() {
    CloseQueue(*outbound_);
    CloseQueue(*inbound_);
}

Result<Unit, ProtocolFailure> MemoryFrameTransport::SendFrame(std::span<const uint8_t> frame) {
    if (frame.size() > max_frame_bytes_) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Transport(
                compat::format("Frame of {} bytes exceeds the {} byte limit",
                    frame.size(), max_frame_bytes_)));
    }
    {
        std::lock_guard<std::mutex> guard(outbound_->lock);
        if (outbound_->closed) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::Transport(std::string(ErrorMessages::CONNECTION_CLOSED)));
        }
        outbound_->frames.emplace_back(frame.begin(), frame.end());
    }
    outbound_->ready.notify_one();
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, ProtocolFailure> MemoryFrameTransport::ReceiveFrame() {
    std::unique_lock<std::mutex> guard(inbound_->lock);
    inbound_->ready.wait(guard, [this] {
        return !inbound_->frames.empty() || inbound_->closed;
    });
    if (inbound_->frames.empty()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Transport(std::string(ErrorMessages::CONNECTION_CLOSED)));
    }
    std::vector<uint8_t> frame = std::move(inbound_->frames.front());
    inbound_->frames.pop_front();
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(frame));
}

} // namespace seep::protocol::transport
