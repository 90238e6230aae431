#pragma once

/**
 * @file protocol_trace.hpp
 * @brief Debug tracing for state transitions, envelopes and relay routing.
 *
 * Compiled out unless ARIES_DEBUG_TRACE is defined, in which case every
 * trace line goes to stderr. Only public data is traced: verkeys, message
 * types, thread ids and state codes. Secret key material is never passed in.
 *
 * Enable via CMake: -DARIES_DEBUG_TRACE=ON
 */

#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>

#ifdef ARIES_DEBUG_TRACE
#include <fmt/core.h>
#endif

namespace aries::debug {

// ============================================================================
// Component identifiers - always defined so call sites compile either way
// ============================================================================

enum class Component {
    Envelope,
    Connection,
    Issuer,
    Holder,
    Verifier,
    Prover,
    Relay,
    Registry
};

inline const char* ComponentToString(const Component component) {
    switch (component) {
        case Component::Envelope: return "ENVELOPE";
        case Component::Connection: return "CONNECTION";
        case Component::Issuer: return "ISSUER";
        case Component::Holder: return "HOLDER";
        case Component::Verifier: return "VERIFIER";
        case Component::Prover: return "PROVER";
        case Component::Relay: return "RELAY";
        case Component::Registry: return "REGISTRY";
    }
    return "UNKNOWN";
}

#ifdef ARIES_DEBUG_TRACE

#define ARIES_TRACE(component, ...) \
    do { \
        fprintf(stderr, "[ARIES-TRACE] %s %s\n", \
            ::aries::debug::ComponentToString(component), \
            ::fmt::format(__VA_ARGS__).c_str()); \
        fflush(stderr); \
    } while(0)

#define ARIES_TRACE_TRANSITION(component, source_id, from_state, to_state) \
    do { \
        fprintf(stderr, "[ARIES-TRACE] %s %s: %u -> %u\n", \
            ::aries::debug::ComponentToString(component), \
            std::string(source_id).c_str(), \
            static_cast<uint32_t>(from_state), \
            static_cast<uint32_t>(to_state)); \
        fflush(stderr); \
    } while(0)

inline void TraceEnvelopeCreated(const size_t recipient_count, const size_t forward_layers,
                                 const bool authenticated, const size_t payload_size) {
    ARIES_TRACE(Component::Envelope, "created {} envelope for {} recipient(s), {} forward layer(s), {} bytes",
                authenticated ? "authcrypt" : "anoncrypt", recipient_count, forward_layers, payload_size);
}

inline void TraceEnvelopeUnpacked(std::string_view message_type, const bool has_sender) {
    ARIES_TRACE(Component::Envelope, "unpacked {} (sender {})", message_type,
                has_sender ? "reported" : "anonymous");
}

inline void TraceRelayRouted(std::string_view to, const size_t depth) {
    ARIES_TRACE(Component::Relay, "forward layer {} routed to {}", depth, to);
}

inline void TraceMessageSelected(const Component component, std::string_view uid,
                                 std::string_view message_type) {
    ARIES_TRACE(component, "selected inbox message {} ({})", uid, message_type);
}

#else // !ARIES_DEBUG_TRACE

#define ARIES_TRACE(component, ...) ((void)0)
#define ARIES_TRACE_TRANSITION(component, source_id, from_state, to_state) ((void)0)

inline void TraceEnvelopeCreated(size_t, size_t, bool, size_t) {}
inline void TraceEnvelopeUnpacked(std::string_view, bool) {}
inline void TraceRelayRouted(std::string_view, size_t) {}
inline void TraceMessageSelected(Component, std::string_view, std::string_view) {}

#endif // ARIES_DEBUG_TRACE

}
