#include "tracing/trace_id.hpp"
#include "core/utils.hpp"

#include <format>

namespace tracehook {

namespace {

bool is_all_zeros(std::string_view s) {
    for (char c : s) {
        if (c != '0') return false;
    }
    return true;
}

} // anonymous namespace

std::string TraceId::new_id() {
    return new_id(std::chrono::system_clock::now());
}

std::string TraceId::new_id(std::chrono::system_clock::time_point now) {
    const auto epoch = std::chrono::duration_cast<std::chrono::seconds>(
        now.time_since_epoch()).count();
    return std::format("1-{:08x}-{}", static_cast<uint32_t>(epoch), utils::random_hex(12));
}

bool TraceId::is_valid(std::string_view id) {
    // "1-" + 8 + "-" + 24
    if (id.size() != kLength) return false;
    if (id[0] != '1' || id[1] != '-' || id[10] != '-') return false;

    const auto time_part = id.substr(2, 8);
    const auto random_part = id.substr(11, 24);
    return utils::is_hex(time_part) && utils::is_hex(random_part);
}

std::string EntityId::new_id() {
    return utils::random_hex(8);
}

bool EntityId::is_valid(std::string_view id) {
    return id.size() == kLength && utils::is_hex(id) && !is_all_zeros(id);
}

} // namespace tracehook
