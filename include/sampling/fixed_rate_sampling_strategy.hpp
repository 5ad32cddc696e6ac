#pragma once

#include "sampling/isampling_strategy.hpp"

#include <atomic>
#include <cstdint>
#include <string>

namespace tracehook {

/**
 * @brief Samples a fixed fraction of requests and reports one rule name
 *
 * Fallback strategy used when no rule engine is plugged in.
 */
class FixedRateSamplingStrategy : public ISamplingStrategy {
public:
    struct Config {
        double rate = 1.0;                  // 1.0 = sample everything
        std::string rule_name = "default";
    };

    explicit FixedRateSamplingStrategy(const Config& config);

    [[nodiscard]] SamplingResponse should_trace(const SamplingInput& input) override;

    struct Stats {
        uint64_t total_checked;
        uint64_t total_sampled;
        uint64_t total_dropped;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    [[nodiscard]] bool rate_check() const;

    Config config_;
    std::atomic<uint64_t> total_checked_{0};
    std::atomic<uint64_t> total_sampled_{0};
};

} // namespace tracehook
