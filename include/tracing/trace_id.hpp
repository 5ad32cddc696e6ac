#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace tracehook {

/**
 * @brief Root trace identifier
 *
 * Format: "1-{time}-{random}"
 *   time:   8 hex chars, epoch seconds at creation
 *   random: 24 hex chars (96-bit)
 */
struct TraceId {
    static constexpr size_t kLength = 35;

    /// Generate a fresh trace id stamped with the current time
    [[nodiscard]] static std::string new_id();

    /// Generate a trace id stamped with `now`
    [[nodiscard]] static std::string new_id(std::chrono::system_clock::time_point now);

    [[nodiscard]] static bool is_valid(std::string_view id);
};

/**
 * @brief Segment / subsegment identifier: 16 hex chars (64-bit)
 */
struct EntityId {
    static constexpr size_t kLength = 16;

    [[nodiscard]] static std::string new_id();
    [[nodiscard]] static bool is_valid(std::string_view id);
};

} // namespace tracehook
