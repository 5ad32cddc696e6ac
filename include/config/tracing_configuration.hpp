#pragma once

#include "naming/segment_naming_strategy.hpp"

#include <memory>
#include <shared_mutex>

namespace tracehook {

/**
 * @brief Process-wide tracing configuration
 *
 * Constructed once at startup and passed by reference to every interceptor.
 * The naming strategy is set at most once: later attempts are silent no-ops,
 * so several hosts can race to initialize without coordinating.
 */
class TracingConfiguration {
public:
    TracingConfiguration() = default;

    TracingConfiguration(const TracingConfiguration&) = delete;
    TracingConfiguration& operator=(const TracingConfiguration&) = delete;

    /**
     * @brief Install the naming strategy if none is configured yet
     * @return true if installed, false if one was already configured
     * @throws std::invalid_argument if strategy is null
     */
    bool configure_naming_strategy(std::shared_ptr<const ISegmentNamingStrategy> strategy);

    [[nodiscard]] bool is_configured() const;

    /// @throws std::logic_error if no strategy has been configured
    [[nodiscard]] std::shared_ptr<const ISegmentNamingStrategy> naming_strategy() const;

private:
    mutable std::shared_mutex mutex_;
    std::shared_ptr<const ISegmentNamingStrategy> naming_strategy_;
};

} // namespace tracehook
