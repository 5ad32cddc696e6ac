#include "config/tracing_configuration.hpp"

#include <mutex>
#include <stdexcept>

namespace tracehook {

bool TracingConfiguration::configure_naming_strategy(
    std::shared_ptr<const ISegmentNamingStrategy> strategy) {
    if (!strategy) {
        throw std::invalid_argument("segment naming strategy must not be null");
    }

    std::unique_lock lock(mutex_);
    if (naming_strategy_) {
        return false;
    }
    naming_strategy_ = std::move(strategy);
    return true;
}

bool TracingConfiguration::is_configured() const {
    std::shared_lock lock(mutex_);
    return naming_strategy_ != nullptr;
}

std::shared_ptr<const ISegmentNamingStrategy> TracingConfiguration::naming_strategy() const {
    std::shared_lock lock(mutex_);
    if (!naming_strategy_) {
        throw std::logic_error("segment naming strategy is not configured");
    }
    return naming_strategy_;
}

} // namespace tracehook
