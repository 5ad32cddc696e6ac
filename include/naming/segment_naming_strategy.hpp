#pragma once

#include "interceptor/http_message.hpp"

#include <string>
#include <string_view>

namespace tracehook {

/// Environment variable that overrides every naming strategy
inline constexpr const char* kTracingNameEnvVar = "AWS_XRAY_TRACING_NAME";

/**
 * @brief Converts a request into a segment name
 */
class ISegmentNamingStrategy {
public:
    virtual ~ISegmentNamingStrategy() = default;

    [[nodiscard]] virtual std::string get_segment_name(const HttpRequestInfo& request) const = 0;
};

/**
 * @brief Same name for every request (typically the service name)
 */
class FixedSegmentNamingStrategy : public ISegmentNamingStrategy {
public:
    /// @throws std::invalid_argument if fixed_name is empty
    explicit FixedSegmentNamingStrategy(std::string fixed_name);

    [[nodiscard]] std::string get_segment_name(const HttpRequestInfo& request) const override;

    [[nodiscard]] const std::string& fixed_name() const { return fixed_name_; }

private:
    std::string fixed_name_;
};

/**
 * @brief Names the segment after the request host when it matches a pattern
 *
 * Pattern supports '*' (any run) and '?' (one char), case-insensitive.
 * Requests whose host does not match (or carry none) get the fallback name.
 */
class DynamicSegmentNamingStrategy : public ISegmentNamingStrategy {
public:
    /// @throws std::invalid_argument if fallback_name is empty
    DynamicSegmentNamingStrategy(std::string fallback_name, std::string host_pattern = "*");

    [[nodiscard]] std::string get_segment_name(const HttpRequestInfo& request) const override;

private:
    std::string fallback_name_;
    std::string host_pattern_;
};

/// Glob match with '*' and '?', ASCII case-insensitive
[[nodiscard]] bool wildcard_match(std::string_view pattern, std::string_view text);

} // namespace tracehook
