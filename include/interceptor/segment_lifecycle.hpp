#pragma once

#include "core/error.hpp"
#include "interceptor/request_context.hpp"
#include "recorder/entity_marker.hpp"
#include "recorder/irecorder.hpp"
#include "tracing/trace_header.hpp"

namespace tracehook {

/**
 * @brief Opens and closes the segment of one request
 *
 * State machine per RequestContext: IDLE -> OPEN -> CLOSED.
 * None of the methods throw; recorder and marker failures are logged.
 */
class SegmentLifecycleController {
public:
    SegmentLifecycleController(IRecorder& recorder, IEntityMarker& marker);

    /**
     * @brief IDLE -> OPEN
     *
     * Begins the segment at ctx.request.timestamp using ctx.segment_name and
     * the header's root/parent ids. A second call on the same context is a
     * logged no-op.
     *
     * @return true if this call performed the transition
     */
    bool open(RequestContext& ctx, const TraceHeader& header, const SamplingResponse& sampling);

    /// Best-effort auto-instrumentation mark; failures are logged only
    void mark_auto_instrumented(RequestContext& ctx);

    /// Decision recorded on the open segment
    [[nodiscard]] Result<SampleDecision> recover_decision(const RequestContext& ctx) const;

    /**
     * @brief Fold the segment's decision into an unresolved header
     *
     * No-op when header.sampled is already resolved. On failure the
     * header keeps its prior decision.
     */
    void resolve_decision(const RequestContext& ctx, TraceHeader& header);

    /**
     * @brief OPEN -> CLOSED
     * @return true if this call performed the transition
     */
    bool close(RequestContext& ctx);

private:
    IRecorder& recorder_;
    IEntityMarker& marker_;
};

} // namespace tracehook
