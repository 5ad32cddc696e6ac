#include "config/config_loader.hpp"
#include "config/tracing_configuration.hpp"
#include "core/utils.hpp"
#include "interceptor/request_interceptor.hpp"
#include "naming/segment_naming_strategy.hpp"
#include "recorder/entity_marker.hpp"
#include "recorder/recorder.hpp"
#include "recorder/segment_sink.hpp"
#include "sampling/fixed_rate_sampling_strategy.hpp"
#include "server/httplib_binding.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <memory>
#include <stdexcept>

using namespace tracehook;

// Global instance for signal handling
httplib::Server* g_server = nullptr;

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));
    if (g_server) {
        g_server->stop();
    }
}

namespace {

std::shared_ptr<const ISegmentNamingStrategy> make_naming_strategy(const ServiceConfig& service) {
    if (!service.host_pattern.empty()) {
        utils::log::info(std::format("Segment naming: dynamic (pattern '{}', fallback '{}')",
            service.host_pattern, service.name));
        return std::make_shared<DynamicSegmentNamingStrategy>(service.name, service.host_pattern);
    }
    utils::log::info(std::format("Segment naming: fixed '{}'", service.name));
    return std::make_shared<FixedSegmentNamingStrategy>(service.name);
}

void register_routes(httplib::Server& svr, const Recorder& recorder,
                     const RequestInterceptor& interceptor) {
    svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(R"({"status":"healthy"})", "application/json");
    });

    svr.Get("/hello", [](const httplib::Request& req, httplib::Response& res) {
        const std::string name = req.has_param("name") ? req.get_param_value("name") : "world";
        res.set_content(std::format(R"({{"message":"hello, {}"}})", utils::escape_json(name)),
                        "application/json");
    });

    svr.Get("/fail", [](const httplib::Request&, httplib::Response&) {
        throw std::runtime_error("requested failure");
    });

    svr.Get("/stats", [&recorder, &interceptor](const httplib::Request&, httplib::Response& res) {
        const auto rs = recorder.get_stats();
        const auto is = interceptor.get_stats();
        const auto ss = interceptor.sampling_stats();
        res.set_content(std::format(
            R"({{"segments_begun":{},"segments_ended":{},"segments_emitted":{},"sink_failures":{},)"
            R"("requests_begun":{},"requests_ended":{},"errors_seen":{},"headers_written":{},)"
            R"("strategy_calls":{},"sampling_passthrough":{},"strategy_failures":{}}})",
            rs.segments_begun, rs.segments_ended, rs.segments_emitted, rs.sink_failures,
            is.requests_begun, is.requests_ended, is.errors_seen, is.headers_written,
            ss.strategy_calls, ss.passthrough, ss.strategy_failures), "application/json");
    });
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        utils::log::info("tracehook demo starting...");

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        std::string config_file = "config/tracehook.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        // [1/4] Configuration (defaults when the file is absent)
        InterceptorConfig config;
        if (std::filesystem::exists(config_file)) {
            utils::log::info(std::format("[1/4] Loading configuration from {}", config_file));
            auto result = ConfigLoader::load_from_file(config_file);
            if (!result.success) {
                utils::log::error(result.error_message);
                return 1;
            }
            config = std::move(result.config);
        } else {
            utils::log::warn(std::format("[1/4] {} not found, using defaults", config_file));
        }

        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }

        // [2/4] Recorder
        FixedRateSamplingStrategy::Config sampling_cfg;
        sampling_cfg.rate = config.sampling.rate;
        sampling_cfg.rule_name = config.sampling.rule_name;

        Recorder::Config recorder_cfg;
        recorder_cfg.origin = config.service.origin;
        recorder_cfg.tracing_disabled = config.tracing.disabled;
        recorder_cfg.context_missing = config.tracing.context_missing;

        Recorder recorder(recorder_cfg, std::make_unique<FixedRateSamplingStrategy>(sampling_cfg));
        recorder.add_sink(std::make_shared<LogSegmentSink>());
        utils::log::info(std::format("[2/4] Recorder: sampling rate {}, tracing {}, context_missing={}",
            config.sampling.rate, config.tracing.disabled ? "disabled" : "enabled",
            context_missing_strategy_name(config.tracing.context_missing)));

        // [3/4] Interceptor
        TracingConfiguration tracing_config;
        tracing_config.configure_naming_strategy(make_naming_strategy(config.service));

        StatusEntityMarker marker;
        RequestInterceptor interceptor(recorder, tracing_config, marker);
        HttplibTracingBinding binding(interceptor);
        utils::log::info("[3/4] Request interceptor ready");

        // [4/4] HTTP server
        httplib::Server svr;
        const size_t pool_size = config.server.thread_pool_size;
        svr.new_task_queue = [pool_size] {
            return new httplib::ThreadPool(pool_size);
        };
        binding.install(svr);
        register_routes(svr, recorder, interceptor);
        g_server = &svr;

        utils::log::info(std::format("[4/4] Listening on http://{}:{} ({} threads)",
            config.server.host, config.server.port, pool_size));
        if (!svr.listen(config.server.host, config.server.port)) {
            throw std::runtime_error("Failed to start HTTP server");
        }
        g_server = nullptr;

        utils::log::info(std::format("Server stopped ({} requests still in flight)",
            binding.in_flight()));

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
