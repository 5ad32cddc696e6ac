#pragma once

#include "recorder/trace_context.hpp"

#include <cstddef>
#include <string>

namespace tracehook {

// ============================================================================
// Configuration Types (mirror the TOML sections)
// ============================================================================

struct ServiceConfig {
    std::string name = "tracehook";
    std::string origin;               // e.g. "AWS::EC2::Instance" (empty = unset)
    std::string host_pattern;         // non-empty selects dynamic naming
};

struct TracingSettings {
    bool disabled = false;
    ContextMissingStrategy context_missing = ContextMissingStrategy::LOG_ERROR;
};

struct SamplingConfig {
    double rate = 1.0;
    std::string rule_name = "default";
};

struct LoggingConfig {
    std::string level = "info";
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8080;
    size_t thread_pool_size = 4;
};

struct InterceptorConfig {
    ServiceConfig service;
    TracingSettings tracing;
    SamplingConfig sampling;
    LoggingConfig logging;
    ServerConfig server;
};

} // namespace tracehook
