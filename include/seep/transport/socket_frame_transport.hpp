#pragma once

#include "seep/interfaces/i_frame_transport.hpp"
#include "seep/transport/transport_options.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <vector>

namespace seep::protocol::transport {

/**
 * @brief XDR-framed frames over a connected stream socket
 *
 * Takes ownership of the descriptor and closes it on destruction. Close()
 * shuts the socket down in both directions, which wakes a receiver blocked
 * in another thread.
 */
class SocketFrameTransport final : public interfaces::IFrameTransport {
public:
    [[nodiscard]] static Result<std::unique_ptr<SocketFrameTransport>, ProtocolFailure> Adopt(
        int fd,
        const TransportOptions& options = {});

    ~SocketFrameTransport() override;

    SocketFrameTransport(const SocketFrameTransport&) = delete;
    SocketFrameTransport& operator=(const SocketFrameTransport&) = delete;

    [[nodiscard]] Result<Unit, ProtocolFailure> SendFrame(std::span<const uint8_t> frame) override;
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> ReceiveFrame() override;
    void Close() override;

    [[nodiscard]] int NativeHandle() const noexcept { return fd_; }

private:
    SocketFrameTransport(int fd, TransportOptions options)
        : fd_(fd), options_(options) {}

    [[nodiscard]] Result<Unit, ProtocolFailure> SendAll(std::span<const uint8_t> data);
    [[nodiscard]] Result<Unit, ProtocolFailure> ReceiveExact(std::span<uint8_t> buffer);

    int fd_;
    TransportOptions options_;
    std::atomic<bool> closed_{false};
    std::mutex send_lock_;
    std::mutex receive_lock_;
};

} // namespace seep::protocol::transport
