#include "interceptor/request_interceptor.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace tracehook {

namespace {

constexpr const char* kFallbackSegmentName = "unnamed";

} // anonymous namespace

RequestInterceptor::RequestInterceptor(IRecorder& recorder,
                                       const TracingConfiguration& configuration,
                                       IEntityMarker& marker)
    : recorder_(recorder),
      configuration_(configuration),
      arbiter_(recorder.sampling_strategy()),
      lifecycle_(recorder, marker),
      collector_(marker) {
    if (!configuration_.is_configured()) {
        throw std::invalid_argument("RequestInterceptor: segment naming strategy is not configured");
    }
}

// ============================================================================
// Lifecycle Events
// ============================================================================

void RequestInterceptor::on_begin_request(RequestContext& ctx) {
    process_request(ctx);
}

void RequestInterceptor::on_error(RequestContext& ctx, const ExceptionInfo& error) {
    errors_seen_.fetch_add(1, std::memory_order_relaxed);
    if (!ctx.error) {
        ctx.error = error;
    }
    // Some hosts raise the error before (or instead of) begin-request
    process_request(ctx);
}

void RequestInterceptor::on_end_request(RequestContext& ctx, HttpResponseInfo* response) {
    if (ctx.state == SegmentState::CLOSED) {
        utils::log::warn(std::format(
            "Request {}: end-request after the segment was closed, skipping", ctx.request_id));
        return;
    }
    requests_ended_.fetch_add(1, std::memory_order_relaxed);

    if (!recorder_.is_tracing_disabled() && response != nullptr) {
        attach_response(ctx, *response);
    }
    attach_exception(ctx);

    // Fresh parse: begin and end may run as unrelated host callbacks
    auto header = read_trace_header(ctx.request);
    const bool decision_requested = header.sampled == SampleDecision::REQUESTED;

    lifecycle_.resolve_decision(ctx, header);
    lifecycle_.close(ctx);

    if (decision_requested && response != nullptr) {
        response->set_header(TraceHeader::kHeaderKey, header.to_string());
        headers_written_.fetch_add(1, std::memory_order_relaxed);
    }
}

// ============================================================================
// Begin-request processing
// ============================================================================

void RequestInterceptor::process_request(RequestContext& ctx) {
    if (ctx.state != SegmentState::IDLE) {
        utils::log::warn(std::format(
            "Request {}: begin processing called with segment {}, skipping",
            ctx.request_id, segment_state_name(ctx.state)));
        return;
    }
    requests_begun_.fetch_add(1, std::memory_order_relaxed);

    auto header = read_trace_header(ctx.request);

    try {
        ctx.segment_name = configuration_.naming_strategy()->get_segment_name(ctx.request);
    } catch (const std::exception& e) {
        utils::log::error(std::format(
            "Request {}: segment naming failed: {}", ctx.request_id, e.what()));
        ctx.segment_name = kFallbackSegmentName;
    } catch (...) {
        utils::log::error(std::format(
            "Request {}: segment naming raised a non-standard exception", ctx.request_id));
        ctx.segment_name = kFallbackSegmentName;
    }

    std::optional<std::string> rule_name;
    if (!is_resolved(header.sampled)) {
        const auto decided = arbiter_.decide(header, make_sampling_input(ctx));
        rule_name = decided.rule_name;
    }

    // Final rule name and decision
    const SamplingResponse sampling(rule_name, header.sampled);
    utils::log::debug(std::format("Request {}: segment '{}' trace {} decision {}",
        ctx.request_id, ctx.segment_name, header.root_trace_id,
        sample_decision_name(header.sampled)));
    lifecycle_.open(ctx, header, sampling);
    lifecycle_.mark_auto_instrumented(ctx);

    if (!recorder_.is_tracing_disabled() && ctx.segment) {
        try {
            recorder_.add_http_information(*ctx.segment, HttpDirection::REQUEST,
                                           collector_.collect_request(ctx.request));
        } catch (const std::exception& e) {
            utils::log::warn(std::format("Request {}: failed to record {} attributes: {}",
                ctx.request_id, http_direction_name(HttpDirection::REQUEST), e.what()));
        } catch (...) {
            utils::log::warn(std::format("Request {}: failed to record {} attributes",
                ctx.request_id, http_direction_name(HttpDirection::REQUEST)));
        }
    }
}

TraceHeader RequestInterceptor::read_trace_header(const HttpRequestInfo& request) {
    return TraceHeader::from_header_value(request.header(TraceHeader::kHeaderKey));
}

SamplingInput RequestInterceptor::make_sampling_input(const RequestContext& ctx) const {
    return SamplingInput(
        ctx.request.host,
        ctx.request.path,
        ctx.request.method,
        ctx.segment_name,
        recorder_.origin());
}

// ============================================================================
// End-request helpers
// ============================================================================

void RequestInterceptor::attach_response(RequestContext& ctx, const HttpResponseInfo& response) {
    if (!ctx.segment) return;
    try {
        recorder_.add_http_information(*ctx.segment, HttpDirection::RESPONSE,
                                       collector_.collect_response(response, *ctx.segment));
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Request {}: failed to record {} attributes: {}",
            ctx.request_id, http_direction_name(HttpDirection::RESPONSE), e.what()));
    } catch (...) {
        utils::log::warn(std::format("Request {}: failed to record {} attributes",
            ctx.request_id, http_direction_name(HttpDirection::RESPONSE)));
    }
}

void RequestInterceptor::attach_exception(RequestContext& ctx) {
    if (!ctx.error || !ctx.segment) return;
    try {
        recorder_.add_exception(*ctx.segment, *ctx.error);
    } catch (const std::exception& e) {
        utils::log::warn(std::format(
            "Request {}: failed to record exception: {}", ctx.request_id, e.what()));
    } catch (...) {
        utils::log::warn(std::format("Request {}: failed to record exception", ctx.request_id));
    }
}

RequestInterceptor::Stats RequestInterceptor::get_stats() const {
    return {
        requests_begun_.load(std::memory_order_relaxed),
        requests_ended_.load(std::memory_order_relaxed),
        errors_seen_.load(std::memory_order_relaxed),
        headers_written_.load(std::memory_order_relaxed),
    };
}

} // namespace tracehook
