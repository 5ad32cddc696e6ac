#pragma once

#include "recorder/irecorder.hpp"
#include "recorder/segment_sink.hpp"
#include "recorder/trace_context.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tracehook {

/**
 * @brief In-process segment recorder
 *
 * - Segments are always opened and closed, even with tracing disabled;
 *   they are just never emitted.
 * - An unresolved decision (UNKNOWN / REQUESTED) handed to begin_segment()
 *   is settled with the recorder's own sampling strategy, so the segment
 *   always carries the decision actually used.
 * - On end_segment() a sampled segment's JSON document is written to every
 *   sink.
 */
class Recorder : public IRecorder {
public:
    struct Config {
        std::string origin;
        bool tracing_disabled = false;
        ContextMissingStrategy context_missing = ContextMissingStrategy::LOG_ERROR;
    };

    Recorder(const Config& config, std::unique_ptr<ISamplingStrategy> strategy);

    [[nodiscard]] EntityPtr begin_segment(
        const std::string& name,
        const std::string& trace_id,
        const std::optional<std::string>& parent_id,
        const SamplingResponse& sampling,
        std::chrono::system_clock::time_point start_time) override;

    void end_segment(const EntityPtr& entity) override;

    void add_http_information(Entity& entity, HttpDirection direction,
                              const HttpAttributes& attributes) override;

    void add_exception(Entity& entity, const ExceptionInfo& exception) override;

    [[nodiscard]] bool is_tracing_disabled() const override {
        return tracing_disabled_.load(std::memory_order_relaxed);
    }
    void set_tracing_disabled(bool disabled) {
        tracing_disabled_.store(disabled, std::memory_order_relaxed);
    }

    [[nodiscard]] ISamplingStrategy& sampling_strategy() override { return *strategy_; }
    [[nodiscard]] std::string origin() const override { return config_.origin; }
    [[nodiscard]] ITraceContext& trace_context() override { return trace_context_; }

    void add_sink(std::shared_ptr<ISegmentSink> sink);

    struct Stats {
        uint64_t segments_begun;
        uint64_t segments_ended;
        uint64_t segments_emitted;
        uint64_t sink_failures;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    void emit(const Segment& segment);

    Config config_;
    std::unique_ptr<ISamplingStrategy> strategy_;
    DefaultTraceContext trace_context_;
    std::atomic<bool> tracing_disabled_;

    mutable std::mutex sinks_mutex_;
    std::vector<std::shared_ptr<ISegmentSink>> sinks_;

    std::atomic<uint64_t> segments_begun_{0};
    std::atomic<uint64_t> segments_ended_{0};
    std::atomic<uint64_t> segments_emitted_{0};
    std::atomic<uint64_t> sink_failures_{0};
};

} // namespace tracehook
