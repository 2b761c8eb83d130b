#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace seep::protocol::transport {

inline constexpr size_t kDefaultMaxFrameBytes = 16 * 1024 * 1024;

struct TransportOptions {
    /// Frames larger than this are rejected on send and on receive.
    size_t max_frame_bytes = kDefaultMaxFrameBytes;
    /// Applied as SO_SNDTIMEO / SO_RCVTIMEO on socket transports.
    std::optional<std::chrono::milliseconds> send_timeout;
    std::optional<std::chrono::milliseconds> receive_timeout;
};

} // namespace seep::protocol::transport
