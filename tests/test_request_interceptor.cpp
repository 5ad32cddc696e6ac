#include <catch2/catch_test_macros.hpp>
#include "interceptor/request_interceptor.hpp"
#include "naming/segment_naming_strategy.hpp"
#include "recorder/recorder.hpp"
#include "tracing/trace_id.hpp"
#include "mocks/memory_segment_sink.hpp"
#include "mocks/mock_recorder.hpp"
#include "mocks/mock_sampling_strategy.hpp"

#include <cstdlib>

using namespace tracehook;
using tracehook::testing::MemorySegmentSink;
using tracehook::testing::MockRecorder;
using tracehook::testing::MockSamplingStrategy;

namespace {

constexpr const char* kRoot = "1-5759e988-bd862e3fe1be46a994272793";
constexpr const char* kParent = "53995c3f42cd8ad8";

/**
 * Real Recorder wired to a scripted strategy and an in-memory sink
 */
struct Harness {
    MockSamplingStrategy* strategy = nullptr;
    std::shared_ptr<MemorySegmentSink> sink = std::make_shared<MemorySegmentSink>();
    std::unique_ptr<Recorder> recorder;
    TracingConfiguration configuration;
    StatusEntityMarker marker;
    std::unique_ptr<RequestInterceptor> interceptor;

    explicit Harness(SamplingResponse response = {"default", SampleDecision::SAMPLED},
                     bool tracing_disabled = false) {
        ::unsetenv(kTracingNameEnvVar);
        auto owned = std::make_unique<MockSamplingStrategy>(std::move(response));
        strategy = owned.get();

        Recorder::Config cfg;
        cfg.tracing_disabled = tracing_disabled;
        recorder = std::make_unique<Recorder>(cfg, std::move(owned));
        recorder->add_sink(sink);

        (void)configuration.configure_naming_strategy(
            std::make_shared<FixedSegmentNamingStrategy>("orders-service"));
        interceptor = std::make_unique<RequestInterceptor>(*recorder, configuration, marker);
    }
};

HttpRequestInfo make_request(std::optional<std::string> trace_header = std::nullopt) {
    HttpRequestInfo request;
    request.method = "GET";
    request.host = "api.example.com";
    request.path = "/orders";
    request.peer_address = "10.0.0.7";
    request.set_header("User-Agent", "curl/8.4.0");
    if (trace_header) {
        request.set_header(TraceHeader::kHeaderKey, std::move(*trace_header));
    }
    return request;
}

/**
 * Naming strategy that throws something outside the std::exception hierarchy
 */
class UnnameableStrategy : public ISegmentNamingStrategy {
public:
    [[nodiscard]] std::string get_segment_name(const HttpRequestInfo&) const override {
        throw 42;
    }
};

std::shared_ptr<Segment> segment_of(const RequestContext& ctx) {
    return std::dynamic_pointer_cast<Segment>(ctx.segment);
}

} // anonymous namespace

// ============================================================================
// Setup
// ============================================================================

TEST_CASE("RequestInterceptor: requires a configured naming strategy", "[interceptor]") {
    MockSamplingStrategy strategy;
    MockRecorder recorder(strategy);
    TracingConfiguration configuration;
    StatusEntityMarker marker;

    CHECK_THROWS_AS(RequestInterceptor(recorder, configuration, marker), std::invalid_argument);
}

// ============================================================================
// End-to-end
// ============================================================================

TEST_CASE("RequestInterceptor: untraced inbound request opens a new sampled trace", "[interceptor][e2e]") {
    Harness h;
    RequestContext ctx(make_request());

    h.interceptor->on_begin_request(ctx);

    REQUIRE(ctx.state == SegmentState::OPEN);
    const auto segment = segment_of(ctx);
    REQUIRE(segment);
    CHECK(segment->name() == "orders-service");
    CHECK(TraceId::is_valid(segment->trace_id()));
    CHECK_FALSE(segment->parent_id().has_value());
    CHECK(segment->sampled() == SampleDecision::SAMPLED);
    CHECK(segment->rule_name() == std::optional<std::string>("default"));
    CHECK(segment->start_time() == ctx.request.timestamp);
    CHECK(h.strategy->call_count() == 1);

    const auto& req = segment->http_information(HttpDirection::REQUEST);
    CHECK(std::get<std::string>(req.at("url")) == "http://api.example.com/orders");
    CHECK(std::get<std::string>(req.at("method")) == "GET");
    CHECK(std::get<std::string>(req.at("user_agent")) == "curl/8.4.0");
    CHECK(std::get<std::string>(req.at("client_ip")) == "10.0.0.7");
    CHECK(segment->aws_metadata("xray", "auto_instrumentation").has_value());

    HttpResponseInfo response;
    h.interceptor->on_end_request(ctx, &response);

    CHECK(ctx.state == SegmentState::CLOSED);
    CHECK_FALSE(segment->is_in_progress());
    CHECK(std::get<int64_t>(segment->http_information(HttpDirection::RESPONSE).at("status")) == 200);
    CHECK(response.header_count(TraceHeader::kHeaderKey) == 0);
    CHECK(h.sink->size() == 1);
    CHECK(h.interceptor->get_stats().headers_written == 0);
}

TEST_CASE("RequestInterceptor: upstream decision and parent are honored", "[interceptor]") {
    Harness h({"default", SampleDecision::SAMPLED});
    RequestContext ctx(make_request(std::string("Root=") + kRoot + ";Parent=" + kParent + ";Sampled=0"));

    h.interceptor->on_begin_request(ctx);
    const auto segment = segment_of(ctx);
    REQUIRE(segment);
    CHECK(segment->trace_id() == kRoot);
    CHECK(segment->parent_id() == std::optional<std::string>(kParent));
    CHECK(segment->sampled() == SampleDecision::NOT_SAMPLED);
    CHECK_FALSE(segment->rule_name().has_value());
    CHECK(h.strategy->call_count() == 0);

    HttpResponseInfo response;
    h.interceptor->on_end_request(ctx, &response);
    CHECK(h.sink->size() == 0);
    CHECK(response.header_count(TraceHeader::kHeaderKey) == 0);
}

TEST_CASE("RequestInterceptor: sampled upstream decision skips the strategy", "[interceptor]") {
    Harness h({"default", SampleDecision::NOT_SAMPLED});
    RequestContext ctx(make_request(std::string("Root=") + kRoot + ";Sampled=1"));

    h.interceptor->on_begin_request(ctx);
    CHECK(h.strategy->call_count() == 0);
    CHECK(segment_of(ctx)->sampled() == SampleDecision::SAMPLED);
    CHECK(h.interceptor->sampling_stats().strategy_calls == 0);
}

TEST_CASE("RequestInterceptor: strategy sees the request", "[interceptor]") {
    Harness h;
    RequestContext ctx(make_request());
    h.interceptor->on_begin_request(ctx);

    CHECK(h.strategy->last_host() == "api.example.com");
    CHECK(h.strategy->last_path() == "/orders");
    CHECK(h.strategy->last_method() == "GET");
    CHECK(h.strategy->last_segment_name() == "orders-service");
}

// ============================================================================
// Requested decision echo
// ============================================================================

TEST_CASE("RequestInterceptor: requested decision is echoed once", "[interceptor][propagation]") {
    Harness h({"default", SampleDecision::SAMPLED});
    RequestContext ctx(make_request(std::string("Root=") + kRoot + ";Parent=" + kParent + ";Sampled=?"));

    h.interceptor->on_begin_request(ctx);
    HttpResponseInfo response;
    response.set_header("Content-Type", "application/json");
    h.interceptor->on_end_request(ctx, &response);

    CHECK(response.header_count(TraceHeader::kHeaderKey) == 1);
    const auto echoed = response.header(TraceHeader::kHeaderKey);
    REQUIRE(echoed.has_value());
    CHECK(*echoed == std::string("Root=") + kRoot + ";Parent=" + kParent + ";Sampled=1");
    CHECK(h.interceptor->get_stats().headers_written == 1);
}

TEST_CASE("RequestInterceptor: requested decision echoes a not-sampled outcome", "[interceptor][propagation]") {
    Harness h({"default", SampleDecision::NOT_SAMPLED});
    RequestContext ctx(make_request(std::string("Root=") + kRoot + ";Sampled=?"));

    h.interceptor->on_begin_request(ctx);
    HttpResponseInfo response;
    h.interceptor->on_end_request(ctx, &response);

    const auto echoed = TraceHeader::parse(response.header(TraceHeader::kHeaderKey).value_or(""));
    REQUIRE(echoed.has_value());
    CHECK(echoed->root_trace_id == kRoot);
    CHECK(echoed->sampled == SampleDecision::NOT_SAMPLED);
}

TEST_CASE("RequestInterceptor: requested decision without response writes nothing", "[interceptor][propagation]") {
    Harness h;
    RequestContext ctx(make_request(std::string("Root=") + kRoot + ";Sampled=?"));

    h.interceptor->on_begin_request(ctx);
    h.interceptor->on_end_request(ctx, nullptr);

    CHECK(ctx.state == SegmentState::CLOSED);
    CHECK(h.interceptor->get_stats().headers_written == 0);
}

TEST_CASE("RequestInterceptor: unknown decision writes no header", "[interceptor][propagation]") {
    Harness h({"default", SampleDecision::NOT_SAMPLED});
    RequestContext ctx(make_request(std::string("Root=") + kRoot));

    h.interceptor->on_begin_request(ctx);
    HttpResponseInfo response;
    h.interceptor->on_end_request(ctx, &response);
    CHECK(response.header_count(TraceHeader::kHeaderKey) == 0);
}

TEST_CASE("RequestInterceptor: malformed header starts a fresh trace", "[interceptor][propagation]") {
    Harness h;
    RequestContext ctx(make_request(std::string("Root=garbage;Sampled=?")));

    h.interceptor->on_begin_request(ctx);
    const auto segment = segment_of(ctx);
    REQUIRE(segment);
    CHECK(TraceId::is_valid(segment->trace_id()));
    CHECK_FALSE(segment->parent_id().has_value());
    CHECK(h.strategy->call_count() == 1);

    HttpResponseInfo response;
    h.interceptor->on_end_request(ctx, &response);
    CHECK(response.header_count(TraceHeader::kHeaderKey) == 0);
}

// ============================================================================
// Error path
// ============================================================================

TEST_CASE("RequestInterceptor: begin then error opens once and closes once", "[interceptor][error]") {
    Harness h;
    RequestContext ctx(make_request());

    h.interceptor->on_begin_request(ctx);
    const auto opened = ctx.segment;
    h.interceptor->on_error(ctx, ExceptionInfo("std::runtime_error", "db down"));
    CHECK(ctx.segment == opened);

    HttpResponseInfo response;
    response.status = 500;
    h.interceptor->on_end_request(ctx, &response);
    h.interceptor->on_end_request(ctx, &response);

    const auto stats = h.recorder->get_stats();
    CHECK(stats.segments_begun == 1);
    CHECK(stats.segments_ended == 1);
    CHECK(h.sink->size() == 1);
    CHECK(h.strategy->call_count() == 1);
}

TEST_CASE("RequestInterceptor: error without begin still traces the request", "[interceptor][error]") {
    Harness h;
    RequestContext ctx(make_request());

    h.interceptor->on_error(ctx, ExceptionInfo("std::logic_error", "early failure"));
    CHECK(ctx.state == SegmentState::OPEN);
    REQUIRE(ctx.segment);

    h.interceptor->on_begin_request(ctx);
    CHECK(h.recorder->get_stats().segments_begun == 1);

    h.interceptor->on_end_request(ctx, nullptr);
    CHECK(ctx.state == SegmentState::CLOSED);
    REQUIRE(ctx.segment->exceptions().size() == 1);
    CHECK(ctx.segment->exceptions()[0].message == "early failure");
}

TEST_CASE("RequestInterceptor: exception is attached before close", "[interceptor][error]") {
    Harness h;
    RequestContext ctx(make_request());

    h.interceptor->on_begin_request(ctx);
    h.interceptor->on_error(ctx, ExceptionInfo("std::runtime_error", "first"));
    h.interceptor->on_error(ctx, ExceptionInfo("std::runtime_error", "second"));
    h.interceptor->on_end_request(ctx, nullptr);

    const auto segment = ctx.segment;
    REQUIRE(segment->exceptions().size() == 1);
    CHECK(segment->exceptions()[0] == ExceptionInfo("std::runtime_error", "first"));
    CHECK(segment->has_fault());
    CHECK(segment->http_information(HttpDirection::RESPONSE).empty());

    REQUIRE(h.sink->size() == 1);
    CHECK(h.sink->documents()[0].find(R"("message":"first")") != std::string::npos);
    CHECK(h.interceptor->get_stats().errors_seen == 2);
}

// ============================================================================
// Attributes
// ============================================================================

TEST_CASE("RequestInterceptor: forwarded client address", "[interceptor][attributes]") {
    Harness h;
    auto request = make_request();
    request.set_header("X-Forwarded-For", "203.0.113.5, 70.41.3.18");
    RequestContext ctx(std::move(request));

    h.interceptor->on_begin_request(ctx);
    const auto& attrs = ctx.segment->http_information(HttpDirection::REQUEST);
    CHECK(std::get<std::string>(attrs.at("client_ip")) == "203.0.113.5");
    CHECK(std::get<bool>(attrs.at("x_forwarded_for")));
}

TEST_CASE("RequestInterceptor: direct client address has no forwarding flag", "[interceptor][attributes]") {
    Harness h;
    RequestContext ctx(make_request());

    h.interceptor->on_begin_request(ctx);
    const auto& attrs = ctx.segment->http_information(HttpDirection::REQUEST);
    CHECK(std::get<std::string>(attrs.at("client_ip")) == "10.0.0.7");
    CHECK(attrs.count("x_forwarded_for") == 0);
}

TEST_CASE("RequestInterceptor: response status marks the segment", "[interceptor][attributes]") {
    Harness h;
    RequestContext ctx(make_request());
    h.interceptor->on_begin_request(ctx);

    HttpResponseInfo response;
    response.status = 503;
    h.interceptor->on_end_request(ctx, &response);
    CHECK(ctx.segment->has_fault());
    CHECK(std::get<int64_t>(ctx.segment->http_information(HttpDirection::RESPONSE).at("status")) == 503);
}

TEST_CASE("RequestInterceptor: tracing disabled skips attributes but still closes", "[interceptor][attributes]") {
    Harness h({"default", SampleDecision::SAMPLED}, true);
    RequestContext ctx(make_request());

    h.interceptor->on_begin_request(ctx);
    REQUIRE(ctx.segment);
    CHECK(ctx.segment->http_information(HttpDirection::REQUEST).empty());

    HttpResponseInfo response;
    response.status = 404;
    h.interceptor->on_end_request(ctx, &response);
    CHECK(ctx.state == SegmentState::CLOSED);
    CHECK(ctx.segment->http_information(HttpDirection::RESPONSE).empty());
    CHECK_FALSE(ctx.segment->has_error());
    CHECK(h.sink->size() == 0);
}

// ============================================================================
// Collaborator failures
// ============================================================================

TEST_CASE("RequestInterceptor: failing strategy falls back to not sampled", "[interceptor][failure]") {
    Harness h;
    h.strategy->set_should_throw(true);
    RequestContext ctx(make_request(std::string("Root=") + kRoot + ";Sampled=?"));

    h.interceptor->on_begin_request(ctx);
    REQUIRE(ctx.segment);
    CHECK(segment_of(ctx)->sampled() == SampleDecision::NOT_SAMPLED);

    HttpResponseInfo response;
    h.interceptor->on_end_request(ctx, &response);
    CHECK(ctx.state == SegmentState::CLOSED);
    const auto echoed = TraceHeader::parse(response.header(TraceHeader::kHeaderKey).value_or(""));
    REQUIRE(echoed.has_value());
    CHECK(echoed->sampled == SampleDecision::NOT_SAMPLED);
}

TEST_CASE("RequestInterceptor: recorder failure never reaches the host", "[interceptor][failure]") {
    MockSamplingStrategy strategy;
    MockRecorder recorder(strategy);
    recorder.fail_begin = true;
    recorder.fail_end = true;
    TracingConfiguration configuration;
    (void)configuration.configure_naming_strategy(std::make_shared<FixedSegmentNamingStrategy>("svc"));
    StatusEntityMarker marker;
    RequestInterceptor interceptor(recorder, configuration, marker);

    RequestContext ctx(make_request(std::string("Root=") + kRoot + ";Sampled=?"));
    CHECK_NOTHROW(interceptor.on_begin_request(ctx));
    CHECK(ctx.state == SegmentState::OPEN);
    CHECK_FALSE(ctx.segment);

    HttpResponseInfo response;
    CHECK_NOTHROW(interceptor.on_end_request(ctx, &response));
    CHECK(ctx.state == SegmentState::CLOSED);
    CHECK(recorder.context.calls() == 1);

    // Nothing to recover the decision from, so the echo keeps the request flag
    const auto echoed = TraceHeader::parse(response.header(TraceHeader::kHeaderKey).value_or(""));
    REQUIRE(echoed.has_value());
    CHECK(echoed->sampled == SampleDecision::REQUESTED);
}

TEST_CASE("RequestInterceptor: non-standard collaborator throws never reach the host", "[interceptor][failure]") {
    MockSamplingStrategy strategy;
    strategy.set_throw_non_standard(true);
    MockRecorder recorder(strategy);
    recorder.fail_end = true;
    recorder.throw_non_standard = true;
    TracingConfiguration configuration;
    (void)configuration.configure_naming_strategy(std::make_shared<UnnameableStrategy>());
    StatusEntityMarker marker;
    RequestInterceptor interceptor(recorder, configuration, marker);

    RequestContext ctx(make_request(std::string("Root=") + kRoot + ";Sampled=?"));
    CHECK_NOTHROW(interceptor.on_begin_request(ctx));
    CHECK(ctx.segment_name == "unnamed");
    REQUIRE(ctx.segment);
    CHECK(segment_of(ctx)->sampled() == SampleDecision::NOT_SAMPLED);

    CHECK_NOTHROW(interceptor.on_error(ctx, ExceptionInfo("std::runtime_error", "boom")));

    HttpResponseInfo response;
    CHECK_NOTHROW(interceptor.on_end_request(ctx, &response));
    CHECK(ctx.state == SegmentState::CLOSED);
    CHECK(recorder.ended.size() == 1);
    CHECK(response.header_count(TraceHeader::kHeaderKey) == 1);
}

TEST_CASE("RequestInterceptor: decision recovered from a non-segment stays requested", "[interceptor][failure]") {
    MockSamplingStrategy strategy;
    MockRecorder recorder(strategy);
    recorder.return_subsegment = true;
    TracingConfiguration configuration;
    (void)configuration.configure_naming_strategy(std::make_shared<FixedSegmentNamingStrategy>("svc"));
    StatusEntityMarker marker;
    RequestInterceptor interceptor(recorder, configuration, marker);

    RequestContext ctx(make_request(std::string("Root=") + kRoot + ";Sampled=?"));
    interceptor.on_begin_request(ctx);
    HttpResponseInfo response;
    interceptor.on_end_request(ctx, &response);

    CHECK(ctx.state == SegmentState::CLOSED);
    CHECK(recorder.ended.size() == 1);
    CHECK(recorder.context.calls() == 0);
    const auto echoed = TraceHeader::parse(response.header(TraceHeader::kHeaderKey).value_or(""));
    REQUIRE(echoed.has_value());
    CHECK(echoed->sampled == SampleDecision::REQUESTED);
}

TEST_CASE("RequestInterceptor: tracing-name environment override", "[interceptor]") {
    Harness h;
    ::setenv(kTracingNameEnvVar, "env-named", 1);
    RequestContext ctx(make_request());
    h.interceptor->on_begin_request(ctx);
    ::unsetenv(kTracingNameEnvVar);

    CHECK(ctx.segment_name == "env-named");
    CHECK(ctx.segment->name() == "env-named");
}
