#include "interceptor/segment_lifecycle.hpp"
#include "core/utils.hpp"

#include <format>
#include <memory>

namespace tracehook {

SegmentLifecycleController::SegmentLifecycleController(IRecorder& recorder, IEntityMarker& marker)
    : recorder_(recorder), marker_(marker) {}

bool SegmentLifecycleController::open(RequestContext& ctx, const TraceHeader& header,
                                      const SamplingResponse& sampling) {
    if (ctx.state != SegmentState::IDLE) {
        utils::log::warn(std::format(
            "Request {}: segment already {}, ignoring second open",
            ctx.request_id, segment_state_name(ctx.state)));
        return false;
    }

    ctx.sampling = sampling;
    try {
        ctx.segment = recorder_.begin_segment(
            ctx.segment_name, header.root_trace_id, header.parent_id,
            sampling, ctx.request.timestamp);
    } catch (const std::exception& e) {
        utils::log::error(std::format(
            "Request {}: failed to begin segment '{}': {}",
            ctx.request_id, ctx.segment_name, e.what()));
        ctx.segment.reset();
    } catch (...) {
        utils::log::error(std::format(
            "Request {}: failed to begin segment '{}'", ctx.request_id, ctx.segment_name));
        ctx.segment.reset();
    }

    // OPEN even without a handle, so the close path runs exactly once
    ctx.state = SegmentState::OPEN;
    return true;
}

void SegmentLifecycleController::mark_auto_instrumented(RequestContext& ctx) {
    if (!ctx.segment) return;

    Status status = Status::ok();
    try {
        status = marker_.add_auto_instrumentation_mark(*ctx.segment);
    } catch (const std::exception& e) {
        status = Status::error(ErrorCategory::INTERNAL_ERROR, e.what());
    } catch (...) {
        status = Status::error(ErrorCategory::INTERNAL_ERROR, "non-standard exception");
    }

    if (status.is_error()) {
        utils::log::warn(std::format(
            "Request {}: failed to add auto-instrumentation mark: {} ({})",
            ctx.request_id, status.error_message(), error_category_name(status.error_category())));
    }
}

Result<SampleDecision> SegmentLifecycleController::recover_decision(const RequestContext& ctx) const {
    if (!ctx.segment) {
        return Result<SampleDecision>::error(ErrorCategory::ENTITY_MISSING,
            "no segment is open for this request");
    }

    const auto segment = std::dynamic_pointer_cast<Segment>(ctx.segment);
    if (!segment) {
        return Result<SampleDecision>::error(ErrorCategory::ENTITY_TYPE_MISMATCH,
            std::format("entity {} is not a segment", ctx.segment->id()));
    }
    return Result<SampleDecision>::ok(segment->sampled());
}

void SegmentLifecycleController::resolve_decision(const RequestContext& ctx, TraceHeader& header) {
    if (is_resolved(header.sampled)) return;

    const auto recovered = recover_decision(ctx);
    if (recovered.is_ok()) {
        header.sampled = recovered.value();
        return;
    }

    if (recovered.error_category() == ErrorCategory::ENTITY_MISSING) {
        try {
            recorder_.trace_context().handle_entity_missing(
                recorder_,
                EntityNotAvailableError(recovered.error_message()),
                "Failed to get entity since it is not available while processing the request.");
        } catch (const std::exception& e) {
            utils::log::error(std::format(
                "Request {}: missing-entity handler raised: {}", ctx.request_id, e.what()));
        } catch (...) {
            utils::log::error(std::format(
                "Request {}: missing-entity handler raised a non-standard exception", ctx.request_id));
        }
        return;
    }

    utils::log::error(std::format(
        "Request {}: failed to get the segment for setting the sampling decision in the response: {}",
        ctx.request_id, recovered.error_message()));
}

bool SegmentLifecycleController::close(RequestContext& ctx) {
    if (ctx.state != SegmentState::OPEN) {
        utils::log::warn(std::format(
            "Request {}: close requested while segment is {}",
            ctx.request_id, segment_state_name(ctx.state)));
        return false;
    }

    if (ctx.segment) {
        try {
            recorder_.end_segment(ctx.segment);
        } catch (const std::exception& e) {
            utils::log::error(std::format(
                "Request {}: failed to end segment {}: {}",
                ctx.request_id, ctx.segment->id(), e.what()));
        } catch (...) {
            utils::log::error(std::format(
                "Request {}: failed to end segment {}", ctx.request_id, ctx.segment->id()));
        }
    }

    ctx.state = SegmentState::CLOSED;
    return true;
}

} // namespace tracehook
