#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>

namespace tracehook {

/**
 * @brief Request snapshot handed to the sampling strategy
 *
 * Built fresh for each request and never cached.
 */
struct SamplingInput {
    const std::string host;
    const std::string url_path;
    const std::string http_method;
    const std::string segment_name;
    const std::string service_origin;

    SamplingInput(std::string h, std::string path, std::string method,
                  std::string name, std::string origin)
        : host(std::move(h)), url_path(std::move(path)), http_method(std::move(method)),
          segment_name(std::move(name)), service_origin(std::move(origin)) {}
};

/**
 * @brief Decision plus the rule that produced it (if any)
 */
struct SamplingResponse {
    std::optional<std::string> rule_name;
    SampleDecision decision = SampleDecision::UNKNOWN;

    SamplingResponse() = default;
    SamplingResponse(std::optional<std::string> rule, SampleDecision d)
        : rule_name(std::move(rule)), decision(d) {}

    explicit SamplingResponse(SampleDecision d) : decision(d) {}

    bool operator==(const SamplingResponse&) const = default;
};

} // namespace tracehook
