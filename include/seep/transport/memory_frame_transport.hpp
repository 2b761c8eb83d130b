#pragma once

#include "seep/interfaces/i_frame_transport.hpp"
#include "seep/transport/transport_options.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <span>
#include <utility>
#include <vector>

namespace seep::protocol::transport {

/**
 * @brief In-process duplex frame transport
 *
 * CreatePair() returns two connected endpoints. Frames queued before a Close()
 * are still delivered; after that the receiver gets a Transport failure.
 */
class MemoryFrameTransport final : public interfaces::IFrameTransport {
public:
    [[nodiscard]] static std::pair<std::unique_ptr<MemoryFrameTransport>, std::unique_ptr<MemoryFrameTransport>>
    CreatePair(const TransportOptions& options = {});

    ~MemoryFrameTransport() override;

    MemoryFrameTransport(const MemoryFrameTransport&) = delete;
    MemoryFrameTransport& operator=(const MemoryFrameTransport&) = delete;

    [[nodiscard]] Result<Unit, ProtocolFailure> SendFrame(std::span<const uint8_t> frame) override;
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> ReceiveFrame() override;
    void Close() override;

private:
    struct Queue {
        std::mutex lock;
        std::condition_variable ready;
        std::deque<std::vector<uint8_t>> frames;
        bool closed = false;
    };

    MemoryFrameTransport(std::shared_ptr<Queue> inbound, std::shared_ptr<Queue> outbound, size_t max_frame_bytes)
        : inbound_(std::move(inbound))
        , outbound_(std::move(outbound))
        , max_frame_bytes_(max_frame_bytes) {}

    static void CloseQueue(Queue& queue);

    std::shared_ptr<Queue> inbound_;
    std::shared_ptr<Queue> outbound_;
    size_t max_frame_bytes_;
};

} // namespace seep::protocol::transport
