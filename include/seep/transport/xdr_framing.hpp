#pragma once

#include "seep/core/result.hpp"
#include "seep/core/failures.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace seep::protocol::transport {

/**
 * @brief XDR variable-length opaque encoding (RFC 4506, section 4.10)
 *
 * ```
 * +--------+--------+--------+--------+------ ... ------+-- ... --+
 * |          length (big endian)      |      data       | 0 pad   |
 * +--------+--------+--------+--------+------ ... ------+-- ... --+
 * ```
 * The data is zero padded to a multiple of four bytes.
 */
class XdrFraming {
public:
    static constexpr size_t HEADER_SIZE = 4;
    static constexpr size_t ALIGNMENT = 4;

    [[nodiscard]] static constexpr size_t PaddingFor(size_t length) noexcept {
        return (ALIGNMENT - length % ALIGNMENT) % ALIGNMENT;
    }

    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> Encode(
        std::span<const uint8_t> data,
        size_t max_frame_bytes);

    [[nodiscard]] static Result<uint32_t, ProtocolFailure> DecodeLength(
        std::span<const uint8_t> header,
        size_t max_frame_bytes);

    /// Decode exactly one opaque that spans the whole buffer.
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> Decode(
        std::span<const uint8_t> encoded,
        size_t max_frame_bytes);

    [[nodiscard]] static Result<Unit, ProtocolFailure> CheckPadding(std::span<const uint8_t> padding);

private:
    XdrFraming() = delete;
};

} // namespace seep::protocol::transport
