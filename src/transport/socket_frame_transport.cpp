#include "seep/transport/socket_frame_transport.hpp"
#include "seep/transport/xdr_framing.hpp"
#include "seep/core/constants.hpp"
#include "seep/core/format.hpp"

#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <string>

namespace seep::protocol::transport {

namespace {

std::string ErrnoMessage(const char* operation, int error) {
    return compat::format("{} failed: {}", operation, std::strerror(error));
}

bool IsTimeout(int error) {
    return error == EAGAIN || error == EWOULDBLOCK;
}

Result<Unit, ProtocolFailure> ApplyTimeout(int fd, int option, std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    if (::setsockopt(fd, SOL_SOCKET, option, &tv, sizeof(tv)) != 0) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Transport(ErrnoMessage("setsockopt", errno)));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

} // namespace

Result<std::unique_ptr<SocketFrameTransport>, ProtocolFailure> SocketFrameTransport::Adopt(
    int fd,
    const TransportOptions& options) {
    using AdoptResult = Result<std::unique_ptr<SocketFrameTransport>, ProtocolFailure>;
    if (fd < 0) {
        return AdoptResult::Err(ProtocolFailure::InvalidInput("Invalid socket descriptor"));
    }
    if (options.send_timeout.has_value()) {
        if (auto applied = ApplyTimeout(fd, SO_SNDTIMEO, *options.send_timeout); applied.IsErr()) {
            return AdoptResult::Err(applied.UnwrapErr());
        }
    }
    if (options.receive_timeout.has_value()) {
        if (auto applied = ApplyTimeout(fd, SO_RCVTIMEO, *options.receive_timeout); applied.IsErr()) {
            return AdoptResult::Err(applied.UnwrapErr());
        }
    }
    return AdoptResult::Ok(std::unique_ptr<SocketFrameTransport>(new SocketFrameTransport(fd, options)));
}

SocketFrameTransport::~SocketFrameTransport() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void SocketFrameTransport::Close() {
    if (!closed_.exchange(true)) {
        ::shutdown(fd_, SHUT_RDWR);
    }
}

Result<Unit, ProtocolFailure> SocketFrameTransport::SendAll(std::span<const uint8_t> data) {
    size_t sent = 0;
    while (sent < data.size()) {
        const ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            const int error = errno;
            if (error == EINTR) {
                continue;
            }
            if (IsTimeout(error)) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::Transport("Send timed out"));
            }
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::Transport(ErrnoMessage("send", error)));
        }
        sent += static_cast<size_t>(n);
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<Unit, ProtocolFailure> SocketFrameTransport::ReceiveExact(std::span<uint8_t> buffer) {
    size_t received = 0;
    while (received < buffer.size()) {
        const ssize_t n = ::recv(fd_, buffer.data() + received, buffer.size() - received, 0);
        if (n == 0) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::Transport(
                    received == 0
                        ? std::string(ErrorMessages::CONNECTION_CLOSED)
                        : std::string("Connection closed mid-frame")));
        }
        if (n < 0) {
            const int error = errno;
            if (error == EINTR) {
                continue;
            }
            if (IsTimeout(error)) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::Transport("Receive timed out"));
            }
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::Transport(ErrnoMessage("recv", error)));
        }
        received += static_cast<size_t>(n);
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<Unit, ProtocolFailure> SocketFrameTransport::SendFrame(std::span<const uint8_t> frame) {
    if (closed_.load()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Transport(std::string(ErrorMessages::CONNECTION_CLOSED)));
    }
    auto encoded = XdrFraming::Encode(frame, options_.max_frame_bytes);
    if (encoded.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(encoded.UnwrapErr());
    }
    std::lock_guard<std::mutex> guard(send_lock_);
    return SendAll(encoded.Unwrap());
}

Result<std::vector<uint8_t>, ProtocolFailure> SocketFrameTransport::ReceiveFrame() {
    using FrameResult = Result<std::vector<uint8_t>, ProtocolFailure>;
    if (closed_.load()) {
        return FrameResult::Err(
            ProtocolFailure::Transport(std::string(ErrorMessages::CONNECTION_CLOSED)));
    }
    std::lock_guard<std::mutex> guard(receive_lock_);

    std::array<uint8_t, XdrFraming::HEADER_SIZE> header{};
    if (auto read = ReceiveExact(header); read.IsErr()) {
        return FrameResult::Err(read.UnwrapErr());
    }
    auto length_result = XdrFraming::DecodeLength(header, options_.max_frame_bytes);
    if (length_result.IsErr()) {
        return FrameResult::Err(length_result.UnwrapErr());
    }
    const size_t length = length_result.Unwrap();

    std::vector<uint8_t> body(length + XdrFraming::PaddingFor(length));
    if (auto read = ReceiveExact(body); read.IsErr()) {
        return FrameResult::Err(read.UnwrapErr());
    }
    if (auto padding = XdrFraming::CheckPadding(std::span<const uint8_t>(body).subspan(length));
        padding.IsErr()) {
        return FrameResult::Err(padding.UnwrapErr());
    }
    body.resize(length);
    return FrameResult::Ok(std::move(body));
}

} // namespace seep::protocol::transport
