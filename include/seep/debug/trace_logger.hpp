#pragma once

/**
 * @file trace_logger.hpp
 * @brief Debug tracing for handshake progress and stream/codec failures.
 *
 * Writes "[SEEP-TRACE]" lines to stderr. Only sizes, counters and failure
 * messages are logged; key material and plaintext never are.
 *
 * Enable via CMake: -DSEEP_DEBUG_TRACE=ON
 */

#include "seep/enums/role.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>

namespace seep::debug {

using protocol::enums::Role;

#ifdef SEEP_DEBUG_TRACE

#define SEEP_LOG_VALUE(role, operation, name, value) \
    do { \
        fprintf(stderr, "[SEEP-TRACE] %s %s %s: %s\n", \
            ::seep::protocol::enums::ToString(role), \
            operation, \
            name, \
            std::to_string(value).c_str()); \
        fflush(stderr); \
    } while(0)

#define SEEP_LOG_MSG(role, operation, message) \
    do { \
        fprintf(stderr, "[SEEP-TRACE] %s %s %s\n", \
            ::seep::protocol::enums::ToString(role), \
            operation, \
            message); \
        fflush(stderr); \
    } while(0)

#define SEEP_LOG_SECTION(role, section_name) \
    do { \
        fprintf(stderr, "[SEEP-TRACE] %s ========== %s ==========\n", \
            ::seep::protocol::enums::ToString(role), \
            section_name); \
        fflush(stderr); \
    } while(0)

// ============================================================================
// Handshake
// ============================================================================

inline void LogHandshakeStart(Role role, std::string_view protocol_name, size_t messages_to_send) {
    SEEP_LOG_SECTION(role, "HANDSHAKE START");
    SEEP_LOG_MSG(role, "HANDSHAKE", std::string(protocol_name).c_str());
    SEEP_LOG_VALUE(role, "HANDSHAKE", "messages_to_send", messages_to_send);
}

inline void LogHandshakeSent(Role role, size_t round, size_t payload_size, size_t message_size) {
    SEEP_LOG_VALUE(role, "SEND", "round", round);
    SEEP_LOG_VALUE(role, "SEND", "payload_bytes", payload_size);
    SEEP_LOG_VALUE(role, "SEND", "message_bytes", message_size);
}

inline void LogHandshakeReceived(Role role, size_t round, size_t message_size, size_t payload_size) {
    SEEP_LOG_VALUE(role, "RECV", "round", round);
    SEEP_LOG_VALUE(role, "RECV", "message_bytes", message_size);
    SEEP_LOG_VALUE(role, "RECV", "payload_bytes", payload_size);
}

inline void LogHandshakeComplete(Role role, size_t rounds) {
    SEEP_LOG_SECTION(role, "HANDSHAKE COMPLETE");
    SEEP_LOG_VALUE(role, "HANDSHAKE", "rounds", rounds);
}

inline void LogHandshakeFailed(Role role, const std::string& reason) {
    SEEP_LOG_SECTION(role, "HANDSHAKE FAILED");
    SEEP_LOG_MSG(role, "HANDSHAKE", reason.c_str());
}

// ============================================================================
// Channel / stream / codec
// ============================================================================

inline void LogStagedFlush(Role role, size_t leftover_bytes) {
    SEEP_LOG_VALUE(role, "CHANNEL", "flushed_after_handshake", leftover_bytes);
}

inline void LogStreamFailure(const char* direction, const std::string& reason) {
    fprintf(stderr, "[SEEP-TRACE] STREAM %s poisoned: %s\n", direction, reason.c_str());
    fflush(stderr);
}

inline void LogDiscardedHandshakePayload(Role role, size_t payload_size) {
    SEEP_LOG_VALUE(role, "CODEC", "discarded_handshake_payload_bytes", payload_size);
}

#else // !SEEP_DEBUG_TRACE

#define SEEP_LOG_VALUE(role, operation, name, value) ((void)0)
#define SEEP_LOG_MSG(role, operation, message) ((void)0)
#define SEEP_LOG_SECTION(role, section_name) ((void)0)

inline void LogHandshakeStart(Role, std::string_view, size_t) {}
inline void LogHandshakeSent(Role, size_t, size_t, size_t) {}
inline void LogHandshakeReceived(Role, size_t, size_t, size_t) {}
inline void LogHandshakeComplete(Role, size_t) {}
inline void LogHandshakeFailed(Role, const std::string&) {}
inline void LogStagedFlush(Role, size_t) {}
inline void LogStreamFailure(const char*, const std::string&) {}
inline void LogDiscardedHandshakePayload(Role, size_t) {}

#endif // SEEP_DEBUG_TRACE

} // namespace seep::debug
