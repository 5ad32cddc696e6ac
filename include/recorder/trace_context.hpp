#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tracehook {

class IRecorder;

/**
 * @brief Raised when an operation needs an active segment and none exists
 */
class EntityNotAvailableError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief What to do when a segment was expected but none is available
 */
enum class ContextMissingStrategy {
    LOG_ERROR,      // log and continue
    RUNTIME_ERROR,  // rethrow the EntityNotAvailableError
    IGNORE          // silently continue
};

[[nodiscard]] std::optional<ContextMissingStrategy> parse_context_missing_strategy(std::string_view name);
[[nodiscard]] const char* context_missing_strategy_name(ContextMissingStrategy strategy);

/**
 * @brief Policy hook for missing-entity situations
 */
class ITraceContext {
public:
    virtual ~ITraceContext() = default;

    virtual void handle_entity_missing(IRecorder& recorder,
                                       const EntityNotAvailableError& error,
                                       std::string_view message) = 0;
};

class DefaultTraceContext : public ITraceContext {
public:
    explicit DefaultTraceContext(ContextMissingStrategy strategy = ContextMissingStrategy::LOG_ERROR)
        : strategy_(strategy) {}

    void handle_entity_missing(IRecorder& recorder,
                               const EntityNotAvailableError& error,
                               std::string_view message) override;

    [[nodiscard]] ContextMissingStrategy strategy() const { return strategy_; }

private:
    ContextMissingStrategy strategy_;
};

} // namespace tracehook
