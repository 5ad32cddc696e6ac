#pragma once

#include "core/types.hpp"
#include "core/utils.hpp"
#include "interceptor/http_message.hpp"
#include "recorder/entity.hpp"
#include "sampling/sampling_types.hpp"

#include <optional>
#include <string>

namespace tracehook {

enum class SegmentState {
    IDLE,
    OPEN,
    CLOSED
};

[[nodiscard]] inline constexpr const char* segment_state_name(SegmentState s) {
    switch (s) {
        case SegmentState::IDLE:   return "idle";
        case SegmentState::OPEN:   return "open";
        case SegmentState::CLOSED: return "closed";
    }
    return "idle";
}

/**
 * @brief Per-request tracing state
 *
 * Lives from begin-request to end-request and is owned by the host binding.
 * Never shared between requests.
 */
struct RequestContext {
    // Input
    std::string request_id;
    HttpRequestInfo request;

    // Resolved at begin-request
    std::string segment_name;
    std::optional<SamplingResponse> sampling;

    // Segment handle (null if the recorder failed to open one)
    EntityPtr segment;
    SegmentState state = SegmentState::IDLE;

    // First exception reported by the host for this request
    std::optional<ExceptionInfo> error;

    explicit RequestContext(HttpRequestInfo req)
        : request_id(utils::generate_request_id()),
          request(std::move(req)) {}
};

} // namespace tracehook
