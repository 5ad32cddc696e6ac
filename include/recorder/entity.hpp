#pragma once

#include "core/types.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tracehook {

/**
 * @brief Unit of recorded work (segment or subsegment)
 *
 * Holds timing, HTTP attributes, fault/error flags and exceptions.
 * An entity is mutated by the single flow of control handling its request;
 * it carries no internal locking.
 */
class Entity {
public:
    virtual ~Entity() = default;

    Entity(const Entity&) = delete;
    Entity& operator=(const Entity&) = delete;

    [[nodiscard]] const std::string& id() const { return id_; }
    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::string& trace_id() const { return trace_id_; }
    [[nodiscard]] const std::optional<std::string>& parent_id() const { return parent_id_; }

    [[nodiscard]] std::chrono::system_clock::time_point start_time() const { return start_time_; }
    [[nodiscard]] std::optional<std::chrono::system_clock::time_point> end_time() const { return end_time_; }
    [[nodiscard]] bool is_in_progress() const { return !end_time_.has_value(); }

    /// Record the end time. Returns false if already closed.
    bool close(std::chrono::system_clock::time_point end_time);

    /// Merge attributes into the http.request / http.response block
    void add_http_information(HttpDirection direction, const HttpAttributes& attributes);
    [[nodiscard]] const HttpAttributes& http_information(HttpDirection direction) const;

    /// Record an exception under a fresh id; the id is fixed for the entity's lifetime
    void add_exception(ExceptionInfo exception);
    [[nodiscard]] const std::vector<ExceptionInfo>& exceptions() const { return exceptions_; }
    [[nodiscard]] const std::vector<std::string>& exception_ids() const { return exception_ids_; }

    // Status flags (4xx -> error, 429 -> throttle, 5xx -> fault)
    void mark_error() { has_error_ = true; }
    void mark_throttle() { is_throttled_ = true; }
    void mark_fault() { has_fault_ = true; }
    [[nodiscard]] bool has_error() const { return has_error_; }
    [[nodiscard]] bool is_throttled() const { return is_throttled_; }
    [[nodiscard]] bool has_fault() const { return has_fault_; }

    /// aws.{namespace_key}.{key} = value metadata block
    void add_aws_metadata(const std::string& namespace_key, const std::string& key, AttributeValue value);
    [[nodiscard]] std::optional<AttributeValue> aws_metadata(const std::string& namespace_key,
                                                             const std::string& key) const;

    /// Serialize to a JSON document
    [[nodiscard]] virtual std::string to_json() const;

protected:
    Entity(std::string name, std::string trace_id, std::optional<std::string> parent_id,
           std::chrono::system_clock::time_point start_time);

    /// Fields specific to the concrete entity kind, appended to to_json()
    [[nodiscard]] virtual std::string extra_json_fields() const { return {}; }

private:
    std::string id_;
    std::string name_;
    std::string trace_id_;
    std::optional<std::string> parent_id_;
    std::chrono::system_clock::time_point start_time_;
    std::optional<std::chrono::system_clock::time_point> end_time_;

    HttpAttributes http_request_;
    HttpAttributes http_response_;
    std::vector<ExceptionInfo> exceptions_;
    std::vector<std::string> exception_ids_;   // parallel to exceptions_
    std::map<std::string, std::map<std::string, AttributeValue>> aws_;

    bool has_error_ = false;
    bool is_throttled_ = false;
    bool has_fault_ = false;
};

/**
 * @brief Top-level entity for one service's handling of one request
 *
 * Carries the sampling decision actually used, which may differ from the
 * propagation header when the recorder decided on its own.
 */
class Segment : public Entity {
public:
    Segment(std::string name, std::string trace_id, std::optional<std::string> parent_id,
            std::chrono::system_clock::time_point start_time);

    [[nodiscard]] SampleDecision sampled() const { return sampled_; }
    void set_sampled(SampleDecision decision) { sampled_ = decision; }

    [[nodiscard]] const std::optional<std::string>& rule_name() const { return rule_name_; }
    void set_rule_name(std::optional<std::string> rule) { rule_name_ = std::move(rule); }

    [[nodiscard]] const std::string& origin() const { return origin_; }
    void set_origin(std::string origin) { origin_ = std::move(origin); }

protected:
    [[nodiscard]] std::string extra_json_fields() const override;

private:
    SampleDecision sampled_ = SampleDecision::UNKNOWN;
    std::optional<std::string> rule_name_;
    std::string origin_;
};

using EntityPtr = std::shared_ptr<Entity>;

} // namespace tracehook
