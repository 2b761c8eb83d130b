#pragma once
#include "seep/core/result.hpp"
#include "seep/core/failures.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace seep::protocol::interfaces {
using protocol::Result;
using protocol::Unit;
using protocol::ProtocolFailure;
/**
 * Ordered, reliable, message-framed byte transport.
 *
 * One SendFrame call is delivered as exactly one ReceiveFrame result on the
 * peer. SendFrame and ReceiveFrame may run concurrently on different threads;
 * concurrent calls in the same direction are serialized by the caller.
 */
class IFrameTransport {
public:
    virtual ~IFrameTransport() = default;
    [[nodiscard]] virtual Result<Unit, ProtocolFailure> SendFrame(std::span<const uint8_t> frame) = 0;
    [[nodiscard]] virtual Result<std::vector<uint8_t>, ProtocolFailure> ReceiveFrame() = 0;
    /// Idempotent. Blocked receivers return a Transport failure.
    virtual void Close() = 0;
};
}
