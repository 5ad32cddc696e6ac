#include "sampling/sampling_arbiter.hpp"
#include "core/utils.hpp"

#include <format>

namespace tracehook {

SamplingArbiter::SamplingArbiter(ISamplingStrategy& strategy)
    : strategy_(strategy) {}

SamplingResponse SamplingArbiter::decide(TraceHeader& header, const SamplingInput& input) {
    if (is_resolved(header.sampled)) {
        passthrough_.fetch_add(1, std::memory_order_relaxed);
        return {std::nullopt, header.sampled};
    }

    strategy_calls_.fetch_add(1, std::memory_order_relaxed);

    SamplingResponse response;
    try {
        response = strategy_.should_trace(input);
    } catch (const std::exception& e) {
        strategy_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format(
            "Sampling strategy failed for {} {}: {}. Request will not be sampled.",
            input.http_method, input.url_path, e.what()));
        response = SamplingResponse(SampleDecision::NOT_SAMPLED);
    } catch (...) {
        strategy_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format(
            "Sampling strategy raised a non-standard exception for {} {}. Request will not be sampled.",
            input.http_method, input.url_path));
        response = SamplingResponse(SampleDecision::NOT_SAMPLED);
    }

    header.sampled = response.decision;
    return {response.rule_name, header.sampled};
}

SamplingArbiter::Stats SamplingArbiter::get_stats() const {
    return {
        strategy_calls_.load(std::memory_order_relaxed),
        passthrough_.load(std::memory_order_relaxed),
        strategy_failures_.load(std::memory_order_relaxed),
    };
}

} // namespace tracehook
