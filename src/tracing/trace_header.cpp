#include "tracing/trace_header.hpp"
#include "tracing/trace_id.hpp"
#include "core/utils.hpp"

#include <format>

namespace tracehook {

namespace {

constexpr std::string_view kRootKey = "Root";
constexpr std::string_view kParentKey = "Parent";
constexpr std::string_view kSampledKey = "Sampled";

std::optional<SampleDecision> parse_sampled(std::string_view value) {
    if (value == "1") return SampleDecision::SAMPLED;
    if (value == "0") return SampleDecision::NOT_SAMPLED;
    if (value == "?") return SampleDecision::REQUESTED;
    return std::nullopt;
}

const char* sampled_token(SampleDecision d) {
    switch (d) {
        case SampleDecision::SAMPLED:     return "1";
        case SampleDecision::NOT_SAMPLED: return "0";
        case SampleDecision::REQUESTED:   return "?";
        case SampleDecision::UNKNOWN:     break;
    }
    return "";
}

} // anonymous namespace

std::optional<TraceHeader> TraceHeader::parse(std::string_view header) {
    if (utils::trim(header).empty()) return std::nullopt;

    TraceHeader result;
    bool has_root = false;
    bool has_parent = false;
    bool has_sampled = false;

    for (const auto raw : utils::split(header, ';')) {
        const auto token = utils::trim(raw);
        if (token.empty()) continue;  // tolerate trailing ';'

        const auto eq = token.find('=');
        if (eq == std::string_view::npos) return std::nullopt;

        const auto key = utils::trim(token.substr(0, eq));
        const auto value = utils::trim(token.substr(eq + 1));

        if (key == kRootKey) {
            if (has_root || !TraceId::is_valid(value)) return std::nullopt;
            result.root_trace_id = std::string(value);
            has_root = true;
        } else if (key == kParentKey) {
            if (has_parent || !EntityId::is_valid(value)) return std::nullopt;
            result.parent_id = std::string(value);
            has_parent = true;
        } else if (key == kSampledKey) {
            const auto decision = parse_sampled(value);
            if (has_sampled || !decision) return std::nullopt;
            result.sampled = *decision;
            has_sampled = true;
        } else if (key.empty()) {
            return std::nullopt;
        }
        // Other keys (Self, Lineage, custom data) are not ours to interpret
    }

    if (!has_root) return std::nullopt;
    return result;
}

TraceHeader TraceHeader::create_new() {
    TraceHeader header;
    header.root_trace_id = TraceId::new_id();
    header.parent_id = std::nullopt;
    header.sampled = SampleDecision::UNKNOWN;
    return header;
}

TraceHeader TraceHeader::from_header_value(const std::optional<std::string>& header_value) {
    if (header_value) {
        if (auto parsed = parse(*header_value)) {
            return std::move(*parsed);
        }
    }

    // Root node of a new trace (or a header we cannot trust)
    utils::log::debug(std::format(
        "Trace header doesn't exist or not valid: ({}). Injecting a new one.",
        header_value.value_or("")));
    return create_new();
}

std::string TraceHeader::to_string() const {
    std::string result = std::format("{}={}", kRootKey, root_trace_id);
    if (parent_id) {
        result += std::format(";{}={}", kParentKey, *parent_id);
    }
    if (sampled != SampleDecision::UNKNOWN) {
        result += std::format(";{}={}", kSampledKey, sampled_token(sampled));
    }
    return result;
}

} // namespace tracehook
