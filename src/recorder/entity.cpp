#include "recorder/entity.hpp"
#include "core/utils.hpp"
#include "tracing/trace_id.hpp"

#include <format>
#include <type_traits>

namespace tracehook {

namespace {

std::string attribute_to_json(const AttributeValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return std::format("\"{}\"", utils::escape_json(v));
        } else if constexpr (std::is_same_v<T, bool>) {
            return utils::booltostr(v);
        } else {
            return std::to_string(v);
        }
    }, value);
}

template<typename Map>
std::string attributes_to_json(const Map& attributes) {
    std::string out = "{";
    bool first = true;
    for (const auto& [key, value] : attributes) {
        if (!first) out += ',';
        first = false;
        out += std::format("\"{}\":{}", utils::escape_json(key), attribute_to_json(value));
    }
    out += '}';
    return out;
}

} // anonymous namespace

// ============================================================================
// Entity
// ============================================================================

Entity::Entity(std::string name, std::string trace_id, std::optional<std::string> parent_id,
               std::chrono::system_clock::time_point start_time)
    : id_(EntityId::new_id()),
      name_(std::move(name)),
      trace_id_(std::move(trace_id)),
      parent_id_(std::move(parent_id)),
      start_time_(start_time) {}

bool Entity::close(std::chrono::system_clock::time_point end_time) {
    if (end_time_) return false;
    end_time_ = end_time;
    return true;
}

void Entity::add_http_information(HttpDirection direction, const HttpAttributes& attributes) {
    auto& target = (direction == HttpDirection::REQUEST) ? http_request_ : http_response_;
    for (const auto& [key, value] : attributes) {
        target.insert_or_assign(key, value);
    }
}

const HttpAttributes& Entity::http_information(HttpDirection direction) const {
    return (direction == HttpDirection::REQUEST) ? http_request_ : http_response_;
}

void Entity::add_exception(ExceptionInfo exception) {
    exceptions_.push_back(std::move(exception));
    exception_ids_.push_back(EntityId::new_id());
}

void Entity::add_aws_metadata(const std::string& namespace_key, const std::string& key,
                              AttributeValue value) {
    aws_[namespace_key].insert_or_assign(key, std::move(value));
}

std::optional<AttributeValue> Entity::aws_metadata(const std::string& namespace_key,
                                                   const std::string& key) const {
    const auto ns = aws_.find(namespace_key);
    if (ns == aws_.end()) return std::nullopt;
    const auto it = ns->second.find(key);
    if (it == ns->second.end()) return std::nullopt;
    return it->second;
}

std::string Entity::to_json() const {
    std::string out = std::format(
        "{{\"id\":\"{}\",\"name\":\"{}\",\"trace_id\":\"{}\",\"start_time\":{:.6f}",
        id_, utils::escape_json(name_), trace_id_, utils::to_epoch_seconds(start_time_));

    if (parent_id_) {
        out += std::format(",\"parent_id\":\"{}\"", *parent_id_);
    }
    if (end_time_) {
        out += std::format(",\"end_time\":{:.6f}", utils::to_epoch_seconds(*end_time_));
    } else {
        out += ",\"in_progress\":true";
    }

    if (!http_request_.empty() || !http_response_.empty()) {
        out += ",\"http\":{";
        bool need_comma = false;
        if (!http_request_.empty()) {
            out += "\"request\":" + attributes_to_json(http_request_);
            need_comma = true;
        }
        if (!http_response_.empty()) {
            if (need_comma) out += ',';
            out += "\"response\":" + attributes_to_json(http_response_);
        }
        out += '}';
    }

    if (has_error_) out += ",\"error\":true";
    if (is_throttled_) out += ",\"throttle\":true";
    if (has_fault_) out += ",\"fault\":true";

    if (!exceptions_.empty()) {
        out += ",\"cause\":{\"exceptions\":[";
        for (size_t i = 0; i < exceptions_.size(); ++i) {
            if (i > 0) out += ',';
            out += std::format("{{\"id\":\"{}\",\"type\":\"{}\",\"message\":\"{}\"}}",
                exception_ids_[i],
                utils::escape_json(exceptions_[i].type),
                utils::escape_json(exceptions_[i].message));
        }
        out += "]}";
    }

    if (!aws_.empty()) {
        out += ",\"aws\":{";
        bool first = true;
        for (const auto& [ns, values] : aws_) {
            if (!first) out += ',';
            first = false;
            out += std::format("\"{}\":{}", utils::escape_json(ns), attributes_to_json(values));
        }
        out += '}';
    }

    out += extra_json_fields();
    out += '}';
    return out;
}

// ============================================================================
// Segment
// ============================================================================

Segment::Segment(std::string name, std::string trace_id, std::optional<std::string> parent_id,
                 std::chrono::system_clock::time_point start_time)
    : Entity(std::move(name), std::move(trace_id), std::move(parent_id), start_time) {}

std::string Segment::extra_json_fields() const {
    std::string out;
    if (!origin_.empty()) {
        out += std::format(",\"origin\":\"{}\"", utils::escape_json(origin_));
    }
    if (rule_name_) {
        out += std::format(",\"sampling_rule\":\"{}\"", utils::escape_json(*rule_name_));
    }
    return out;
}

} // namespace tracehook
