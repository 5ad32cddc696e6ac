#pragma once

#include "config/tracing_configuration.hpp"
#include "interceptor/attribute_collector.hpp"
#include "interceptor/request_context.hpp"
#include "interceptor/segment_lifecycle.hpp"
#include "recorder/entity_marker.hpp"
#include "recorder/irecorder.hpp"
#include "sampling/sampling_arbiter.hpp"

#include <atomic>
#include <cstdint>

namespace tracehook {

/**
 * @brief Lifecycle events a host HTTP pipeline raises for each request
 *
 * The host owns one RequestContext per request and passes it to every
 * event for that request. Implementations never throw.
 */
class IRequestLifecycle {
public:
    virtual ~IRequestLifecycle() = default;

    virtual void on_begin_request(RequestContext& ctx) = 0;

    /// `response` is null when the host has no response object
    virtual void on_end_request(RequestContext& ctx, HttpResponseInfo* response) = 0;

    /// May fire with or without a preceding on_begin_request()
    virtual void on_error(RequestContext& ctx, const ExceptionInfo& error) = 0;
};

/**
 * @brief Traces requests: header propagation, sampling, segment lifecycle
 *
 * begin:  parse header -> name segment -> sample (if undecided) -> open
 *         -> mark -> request attributes
 * end:    response attributes -> exception -> re-parse header -> resolve
 *         decision from segment -> close -> echo header if REQUESTED
 * error:  remember exception -> same as begin (open is idempotent)
 */
class RequestInterceptor : public IRequestLifecycle {
public:
    /// @throws std::invalid_argument if no naming strategy is configured
    RequestInterceptor(IRecorder& recorder,
                       const TracingConfiguration& configuration,
                       IEntityMarker& marker);

    void on_begin_request(RequestContext& ctx) override;
    void on_end_request(RequestContext& ctx, HttpResponseInfo* response) override;
    void on_error(RequestContext& ctx, const ExceptionInfo& error) override;

    struct Stats {
        uint64_t requests_begun;
        uint64_t requests_ended;
        uint64_t errors_seen;
        uint64_t headers_written;
    };
    [[nodiscard]] Stats get_stats() const;

    [[nodiscard]] SamplingArbiter::Stats sampling_stats() const { return arbiter_.get_stats(); }

private:
    void process_request(RequestContext& ctx);

    [[nodiscard]] static TraceHeader read_trace_header(const HttpRequestInfo& request);
    [[nodiscard]] SamplingInput make_sampling_input(const RequestContext& ctx) const;

    void attach_response(RequestContext& ctx, const HttpResponseInfo& response);
    void attach_exception(RequestContext& ctx);

    IRecorder& recorder_;
    const TracingConfiguration& configuration_;
    SamplingArbiter arbiter_;
    SegmentLifecycleController lifecycle_;
    AttributeCollector collector_;

    std::atomic<uint64_t> requests_begun_{0};
    std::atomic<uint64_t> requests_ended_{0};
    std::atomic<uint64_t> errors_seen_{0};
    std::atomic<uint64_t> headers_written_{0};
};

} // namespace tracehook
