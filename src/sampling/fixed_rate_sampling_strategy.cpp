#include "sampling/fixed_rate_sampling_strategy.hpp"

#include <algorithm>
#include <random>

namespace tracehook {

FixedRateSamplingStrategy::FixedRateSamplingStrategy(const Config& config)
    : config_(config) {
    config_.rate = std::clamp(config_.rate, 0.0, 1.0);
}

SamplingResponse FixedRateSamplingStrategy::should_trace(const SamplingInput& /*input*/) {
    total_checked_.fetch_add(1, std::memory_order_relaxed);

    if (rate_check()) {
        total_sampled_.fetch_add(1, std::memory_order_relaxed);
        return {config_.rule_name, SampleDecision::SAMPLED};
    }
    return {config_.rule_name, SampleDecision::NOT_SAMPLED};
}

bool FixedRateSamplingStrategy::rate_check() const {
    if (config_.rate >= 1.0) return true;
    if (config_.rate <= 0.0) return false;

    static thread_local std::mt19937 rng(std::random_device{}());
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(rng) < config_.rate;
}

FixedRateSamplingStrategy::Stats FixedRateSamplingStrategy::get_stats() const {
    const uint64_t checked = total_checked_.load(std::memory_order_relaxed);
    const uint64_t sampled = total_sampled_.load(std::memory_order_relaxed);
    return {checked, sampled, checked - sampled};
}

} // namespace tracehook
