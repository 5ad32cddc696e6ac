#include "naming/segment_naming_strategy.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace tracehook {

namespace {

std::optional<std::string> env_override() {
    const char* value = std::getenv(kTracingNameEnvVar);
    if (value == nullptr || *value == '\0') return std::nullopt;
    return std::string(value);
}

/// "example.com:8080" -> "example.com"; bracketed IPv6 kept intact
std::string_view strip_port(std::string_view host) {
    if (!host.empty() && host.front() == '[') {
        const auto close = host.find(']');
        return close == std::string_view::npos ? host : host.substr(0, close + 1);
    }
    const auto colon = host.rfind(':');
    return colon == std::string_view::npos ? host : host.substr(0, colon);
}

} // anonymous namespace

bool wildcard_match(std::string_view pattern, std::string_view text) {
    size_t p = 0, t = 0;
    size_t star = std::string_view::npos, match = 0;

    while (t < text.size()) {
        if (p < pattern.size() &&
            (pattern[p] == '?' ||
             std::tolower(static_cast<unsigned char>(pattern[p])) ==
             std::tolower(static_cast<unsigned char>(text[t])))) {
            ++p;
            ++t;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            match = t;
        } else if (star != std::string_view::npos) {
            p = star + 1;
            t = ++match;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') ++p;
    return p == pattern.size();
}

// ============================================================================
// FixedSegmentNamingStrategy
// ============================================================================

FixedSegmentNamingStrategy::FixedSegmentNamingStrategy(std::string fixed_name)
    : fixed_name_(std::move(fixed_name)) {
    if (utils::trim(fixed_name_).empty()) {
        throw std::invalid_argument("FixedSegmentNamingStrategy: segment name must not be empty");
    }
}

std::string FixedSegmentNamingStrategy::get_segment_name(const HttpRequestInfo& /*request*/) const {
    if (auto name = env_override()) return *name;
    return fixed_name_;
}

// ============================================================================
// DynamicSegmentNamingStrategy
// ============================================================================

DynamicSegmentNamingStrategy::DynamicSegmentNamingStrategy(std::string fallback_name,
                                                           std::string host_pattern)
    : fallback_name_(std::move(fallback_name)),
      host_pattern_(std::move(host_pattern)) {
    if (utils::trim(fallback_name_).empty()) {
        throw std::invalid_argument("DynamicSegmentNamingStrategy: fallback name must not be empty");
    }
}

std::string DynamicSegmentNamingStrategy::get_segment_name(const HttpRequestInfo& request) const {
    if (auto name = env_override()) return *name;

    const auto host = strip_port(request.host);
    if (!host.empty() && wildcard_match(host_pattern_, host)) {
        return std::string(host);
    }
    return fallback_name_;
}

} // namespace tracehook
