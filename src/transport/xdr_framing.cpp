#include "seep/transport/xdr_framing.hpp"
#include "seep/core/format.hpp"

#include <algorithm>
#include <limits>

namespace seep::protocol::transport {

Result<std::vector<uint8_t>, ProtocolFailure> XdrFraming::Encode(
    std::span<const uint8_t> data,
    size_t max_frame_bytes) {
    if (data.size() > max_frame_bytes || data.size() > std::numeric_limits<uint32_t>::max()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Transport(
                compat::format("Frame of {} bytes exceeds the {} byte limit",
                    data.size(), max_frame_bytes)));
    }
    const auto length = static_cast<uint32_t>(data.size());
    std::vector<uint8_t> encoded;
    encoded.reserve(HEADER_SIZE + data.size() + PaddingFor(data.size()));
    encoded.push_back(static_cast<uint8_t>(length >> 24));
    encoded.push_back(static_cast<uint8_t>(length >> 16));
    encoded.push_back(static_cast<uint8_t>(length >> 8));
    encoded.push_back(static_cast<uint8_t>(length));
    encoded.insert(encoded.end(), data.begin(), data.end());
    encoded.resize(encoded.size() + PaddingFor(data.size()), 0);
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(encoded));
}

Result<uint32_t, ProtocolFailure> XdrFraming::DecodeLength(
    std::span<const uint8_t> header,
    size_t max_frame_bytes) {
    if (header.size() != HEADER_SIZE) {
        return Result<uint32_t, ProtocolFailure>::Err(
            ProtocolFailure::Transport(
                compat::format("XDR length header must be {} bytes, got {}",
                    HEADER_SIZE, header.size())));
    }
    const uint32_t length =
        (static_cast<uint32_t>(header[0]) << 24) |
        (static_cast<uint32_t>(header[1]) << 16) |
        (static_cast<uint32_t>(header[2]) << 8) |
        static_cast<uint32_t>(header[3]);
    if (length > max_frame_bytes) {
        return Result<uint32_t, ProtocolFailure>::Err(
            ProtocolFailure::Transport(
                compat::format("Incoming frame of {} bytes exceeds the {} byte limit",
                    length, max_frame_bytes)));
    }
    return Result<uint32_t, ProtocolFailure>::Ok(length);
}

Result<Unit, ProtocolFailure> XdrFraming::CheckPadding(std::span<const uint8_t> padding) {
    if (std::any_of(padding.begin(), padding.end(), [](uint8_t b) { return b != 0; })) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Transport("Non-zero XDR padding"));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, ProtocolFailure> XdrFraming::Decode(
    std::span<const uint8_t> encoded,
    size_t max_frame_bytes) {
    if (encoded.size() < HEADER_SIZE) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Transport("Truncated XDR length header"));
    }
    auto length_result = DecodeLength(encoded.subspan(0, HEADER_SIZE), max_frame_bytes);
    if (length_result.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(length_result.UnwrapErr());
    }
    const size_t length = length_result.Unwrap();
    const size_t padded = length + PaddingFor(length);
    if (encoded.size() - HEADER_SIZE != padded) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Transport(
                compat::format("XDR opaque declares {} bytes ({} padded), buffer holds {}",
                    length, padded, encoded.size() - HEADER_SIZE)));
    }
    const auto body = encoded.subspan(HEADER_SIZE);
    if (auto padding = CheckPadding(body.subspan(length)); padding.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(padding.UnwrapErr());
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(
        std::vector<uint8_t>(body.begin(), body.begin() + static_cast<std::ptrdiff_t>(length)));
}

} // namespace seep::protocol::transport
