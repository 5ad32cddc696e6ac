#pragma once

#include "sampling/isampling_strategy.hpp"
#include "tracing/trace_header.hpp"

#include <atomic>
#include <cstdint>

namespace tracehook {

/**
 * @brief Decides whether a request is sampled
 *
 * An upstream decision (SAMPLED / NOT_SAMPLED) is honored as-is and the
 * strategy is never consulted. UNKNOWN and REQUESTED are handed to the
 * strategy, whose decision overwrites TraceHeader::sampled.
 *
 * A throwing strategy does not stop the request: the failure is logged and
 * the decision falls back to NOT_SAMPLED.
 */
class SamplingArbiter {
public:
    explicit SamplingArbiter(ISamplingStrategy& strategy);

    [[nodiscard]] SamplingResponse decide(TraceHeader& header, const SamplingInput& input);

    struct Stats {
        uint64_t strategy_calls;
        uint64_t passthrough;
        uint64_t strategy_failures;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    ISamplingStrategy& strategy_;
    std::atomic<uint64_t> strategy_calls_{0};
    std::atomic<uint64_t> passthrough_{0};
    std::atomic<uint64_t> strategy_failures_{0};
};

} // namespace tracehook
