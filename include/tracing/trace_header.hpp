#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace tracehook {

/**
 * @brief Propagation header (X-Amzn-Trace-Id)
 *
 * Format: "Root={trace_id};Parent={entity_id};Sampled={1|0|?}"
 *   Root:    required, see TraceId
 *   Parent:  optional, 16 hex chars
 *   Sampled: optional; 1 = sampled, 0 = not sampled, ? = requested.
 *            Absent means the decision is unknown.
 *
 * Unrecognized keys (Self=, Lineage=, ...) are ignored.
 */
struct TraceHeader {
    static constexpr std::string_view kHeaderKey = "X-Amzn-Trace-Id";

    std::string root_trace_id;
    std::optional<std::string> parent_id;
    SampleDecision sampled = SampleDecision::UNKNOWN;

    /// Parse a header value. nullopt on empty input or any grammar violation.
    [[nodiscard]] static std::optional<TraceHeader> parse(std::string_view header);

    /// Fresh header for a new trace: new root id, no parent, UNKNOWN decision
    [[nodiscard]] static TraceHeader create_new();

    /**
     * @brief Header for an inbound request
     *
     * Parses `header_value`; an absent or malformed value is treated as
     * absent and yields create_new().
     */
    [[nodiscard]] static TraceHeader from_header_value(const std::optional<std::string>& header_value);

    /// Serialize to the canonical header value
    [[nodiscard]] std::string to_string() const;

    bool operator==(const TraceHeader&) const = default;
};

} // namespace tracehook
