#pragma once

#include <cstdint>

namespace seep::protocol::enums {

/**
 * @brief Side of a handshake, fixed for the lifetime of a session
 *
 * The initiator writes the first handshake message; turns then alternate.
 */
enum class Role : uint8_t {
    Initiator = 0,
    Responder = 1
};

constexpr const char* ToString(Role role) noexcept {
    switch (role) {
        case Role::Initiator:
            return "INITIATOR";
        case Role::Responder:
            return "RESPONDER";
        default:
            return "UNKNOWN";
    }
}

} // namespace seep::protocol::enums
