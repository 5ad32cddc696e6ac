#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>

namespace tracehook {

// ============================================================================
// Sampling Decision
// ============================================================================

/**
 * @brief Sampling state carried by the propagation header
 *
 * REQUESTED means the caller asked this service to decide and to echo the
 * decision back on the response.
 */
enum class SampleDecision : uint8_t {
    UNKNOWN,
    REQUESTED,
    SAMPLED,
    NOT_SAMPLED
};

/// True once a definitive decision (SAMPLED / NOT_SAMPLED) has been made
[[nodiscard]] inline constexpr bool is_resolved(SampleDecision d) noexcept {
    return d == SampleDecision::SAMPLED || d == SampleDecision::NOT_SAMPLED;
}

[[nodiscard]] inline constexpr const char* sample_decision_name(SampleDecision d) noexcept {
    switch (d) {
        case SampleDecision::UNKNOWN:     return "unknown";
        case SampleDecision::REQUESTED:   return "requested";
        case SampleDecision::SAMPLED:     return "sampled";
        case SampleDecision::NOT_SAMPLED: return "not_sampled";
    }
    return "unknown";
}

// ============================================================================
// HTTP Attributes
// ============================================================================

enum class HttpDirection {
    REQUEST,
    RESPONSE
};

[[nodiscard]] inline constexpr const char* http_direction_name(HttpDirection d) noexcept {
    return d == HttpDirection::REQUEST ? "request" : "response";
}

using AttributeValue = std::variant<std::string, int64_t, bool>;

/// Ordered so serialized segment documents are stable
using HttpAttributes = std::map<std::string, AttributeValue>;

// ============================================================================
// Request Exception
// ============================================================================

/**
 * @brief Error reported by the host for a request (unhandled handler exception)
 */
struct ExceptionInfo {
    std::string type;       // e.g. "std::runtime_error"
    std::string message;

    ExceptionInfo() = default;
    ExceptionInfo(std::string t, std::string m)
        : type(std::move(t)), message(std::move(m)) {}

    bool operator==(const ExceptionInfo&) const = default;
};

} // namespace tracehook
