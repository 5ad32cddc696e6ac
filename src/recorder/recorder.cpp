#include "recorder/recorder.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace tracehook {

Recorder::Recorder(const Config& config, std::unique_ptr<ISamplingStrategy> strategy)
    : config_(config),
      strategy_(std::move(strategy)),
      trace_context_(config.context_missing),
      tracing_disabled_(config.tracing_disabled) {
    if (!strategy_) {
        throw std::invalid_argument("Recorder requires a sampling strategy");
    }
}

EntityPtr Recorder::begin_segment(
    const std::string& name,
    const std::string& trace_id,
    const std::optional<std::string>& parent_id,
    const SamplingResponse& sampling,
    std::chrono::system_clock::time_point start_time) {

    auto segment = std::make_shared<Segment>(name, trace_id, parent_id, start_time);
    segment->set_origin(config_.origin);
    segment->set_rule_name(sampling.rule_name);

    if (is_resolved(sampling.decision)) {
        segment->set_sampled(sampling.decision);
    } else {
        // Caller left the decision open; settle it here
        try {
            const SamplingInput input("", "", "", name, config_.origin);
            const auto own = strategy_->should_trace(input);
            segment->set_sampled(is_resolved(own.decision) ? own.decision : SampleDecision::NOT_SAMPLED);
            if (own.rule_name) segment->set_rule_name(own.rule_name);
        } catch (const std::exception& e) {
            utils::log::warn(std::format(
                "Recorder sampling failed for segment '{}': {}", name, e.what()));
            segment->set_sampled(SampleDecision::NOT_SAMPLED);
        } catch (...) {
            utils::log::warn(std::format(
                "Recorder sampling failed for segment '{}'", name));
            segment->set_sampled(SampleDecision::NOT_SAMPLED);
        }
    }

    segments_begun_.fetch_add(1, std::memory_order_relaxed);
    return segment;
}

void Recorder::end_segment(const EntityPtr& entity) {
    if (!entity) {
        throw EntityNotAvailableError("end_segment called without a segment");
    }

    if (!entity->close(std::chrono::system_clock::now())) {
        utils::log::warn(std::format("Segment {} was already closed", entity->id()));
        return;
    }
    segments_ended_.fetch_add(1, std::memory_order_relaxed);

    const auto* segment = dynamic_cast<const Segment*>(entity.get());
    if (!segment) return;
    if (is_tracing_disabled() || segment->sampled() != SampleDecision::SAMPLED) return;

    emit(*segment);
}

void Recorder::add_http_information(Entity& entity, HttpDirection direction,
                                    const HttpAttributes& attributes) {
    entity.add_http_information(direction, attributes);
}

void Recorder::add_exception(Entity& entity, const ExceptionInfo& exception) {
    entity.add_exception(exception);
    entity.mark_fault();
}

void Recorder::add_sink(std::shared_ptr<ISegmentSink> sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    sinks_.push_back(std::move(sink));
}

void Recorder::emit(const Segment& segment) {
    const auto document = segment.to_json();

    std::lock_guard<std::mutex> lock(sinks_mutex_);
    for (const auto& sink : sinks_) {
        if (!sink->write(document)) {
            sink_failures_.fetch_add(1, std::memory_order_relaxed);
            utils::log::warn(std::format("Segment sink '{}' rejected segment {}",
                sink->name(), segment.id()));
        }
    }
    segments_emitted_.fetch_add(1, std::memory_order_relaxed);
}

Recorder::Stats Recorder::get_stats() const {
    return {
        segments_begun_.load(std::memory_order_relaxed),
        segments_ended_.load(std::memory_order_relaxed),
        segments_emitted_.load(std::memory_order_relaxed),
        sink_failures_.load(std::memory_order_relaxed),
    };
}

} // namespace tracehook
