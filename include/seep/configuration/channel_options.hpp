#pragma once

#include <cstddef>

namespace seep::protocol::configuration {

inline constexpr size_t kDefaultChunkThreshold = 4096;

/// Tuning for SecureChannel's handshake-time data path.
struct ChannelOptions {
    /// Bytes staged before the handshake up to this size ride entirely in the
    /// first handshake message this side sends; larger buffers are spread
    /// across all of this side's handshake messages.
    size_t chunk_threshold = kDefaultChunkThreshold;
};

} // namespace seep::protocol::configuration
