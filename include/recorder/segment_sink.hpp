#pragma once

#include <string>
#include <string_view>

namespace tracehook {

/**
 * @brief Abstract interface for finished-segment destinations
 *
 * Receives the JSON document of every sampled segment when it closes.
 * Called concurrently from request threads; implementations synchronize
 * internally.
 */
class ISegmentSink {
public:
    virtual ~ISegmentSink() = default;

    /// Write one segment document. Returns true on success.
    [[nodiscard]] virtual bool write(std::string_view segment_json) = 0;

    /// Human-readable sink name for logging (e.g. "log")
    [[nodiscard]] virtual std::string name() const = 0;
};

/**
 * @brief Writes segment documents through the process logger at INFO
 */
class LogSegmentSink : public ISegmentSink {
public:
    [[nodiscard]] bool write(std::string_view segment_json) override;
    [[nodiscard]] std::string name() const override { return "log"; }
};

} // namespace tracehook
