#include "recorder/segment_sink.hpp"
#include "core/utils.hpp"

#include <format>

namespace tracehook {

bool LogSegmentSink::write(std::string_view segment_json) {
    utils::log::info(std::format("segment {}", segment_json));
    return true;
}

} // namespace tracehook
