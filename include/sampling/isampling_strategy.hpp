#pragma once

#include "sampling/sampling_types.hpp"

namespace tracehook {

/**
 * @brief Abstract sampling strategy
 *
 * Evaluates local/centralized rules and returns a decision for one request.
 * Implementations must be thread-safe; they are shared by every request.
 * May throw; callers treat a throw as a failed evaluation.
 */
class ISamplingStrategy {
public:
    virtual ~ISamplingStrategy() = default;

    [[nodiscard]] virtual SamplingResponse should_trace(const SamplingInput& input) = 0;
};

} // namespace tracehook
