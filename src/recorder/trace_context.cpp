#include "recorder/trace_context.hpp"
#include "core/utils.hpp"

#include <format>

namespace tracehook {

std::optional<ContextMissingStrategy> parse_context_missing_strategy(std::string_view name) {
    const auto lower = utils::to_lower(name);
    if (lower == "log_error")     return ContextMissingStrategy::LOG_ERROR;
    if (lower == "runtime_error") return ContextMissingStrategy::RUNTIME_ERROR;
    if (lower == "ignore")        return ContextMissingStrategy::IGNORE;
    return std::nullopt;
}

const char* context_missing_strategy_name(ContextMissingStrategy strategy) {
    switch (strategy) {
        case ContextMissingStrategy::LOG_ERROR:     return "log_error";
        case ContextMissingStrategy::RUNTIME_ERROR: return "runtime_error";
        case ContextMissingStrategy::IGNORE:        return "ignore";
    }
    return "log_error";
}

void DefaultTraceContext::handle_entity_missing(IRecorder& /*recorder*/,
                                                const EntityNotAvailableError& error,
                                                std::string_view message) {
    switch (strategy_) {
        case ContextMissingStrategy::LOG_ERROR:
            utils::log::error(std::format("{} ({})", message, error.what()));
            break;
        case ContextMissingStrategy::RUNTIME_ERROR:
            throw error;
        case ContextMissingStrategy::IGNORE:
            break;
    }
}

} // namespace tracehook
