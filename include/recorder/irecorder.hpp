#pragma once

#include "core/types.hpp"
#include "recorder/entity.hpp"
#include "recorder/trace_context.hpp"
#include "sampling/isampling_strategy.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace tracehook {

/**
 * @brief Segment recorder
 *
 * Owns segment storage, ID generation and emission. Callers hold the
 * returned handle from begin_segment() until end_segment(); there is no
 * ambient "current segment" lookup. Implementations must be thread-safe.
 */
class IRecorder {
public:
    virtual ~IRecorder() = default;

    /**
     * @brief Open a segment
     * @param start_time Host-reported request timestamp (segment start)
     * @throws std::exception on recorder failure
     */
    [[nodiscard]] virtual EntityPtr begin_segment(
        const std::string& name,
        const std::string& trace_id,
        const std::optional<std::string>& parent_id,
        const SamplingResponse& sampling,
        std::chrono::system_clock::time_point start_time) = 0;

    /// Close the segment and hand it off for emission
    virtual void end_segment(const EntityPtr& entity) = 0;

    virtual void add_http_information(Entity& entity, HttpDirection direction,
                                      const HttpAttributes& attributes) = 0;

    virtual void add_exception(Entity& entity, const ExceptionInfo& exception) = 0;

    [[nodiscard]] virtual bool is_tracing_disabled() const = 0;

    [[nodiscard]] virtual ISamplingStrategy& sampling_strategy() = 0;

    /// Service origin reported to sampling (e.g. "AWS::EC2::Instance")
    [[nodiscard]] virtual std::string origin() const = 0;

    [[nodiscard]] virtual ITraceContext& trace_context() = 0;
};

} // namespace tracehook
