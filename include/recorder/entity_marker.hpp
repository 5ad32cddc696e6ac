#pragma once

#include "core/error.hpp"
#include "recorder/entity.hpp"

namespace tracehook {

/**
 * @brief Annotates entities with status flags and instrumentation metadata
 */
class IEntityMarker {
public:
    virtual ~IEntityMarker() = default;

    /// Set error / throttle / fault flags from an HTTP status code
    virtual void mark_entity_from_status(Entity& entity, int status_code) = 0;

    /// Flag the entity as produced by automatic instrumentation
    [[nodiscard]] virtual Status add_auto_instrumentation_mark(Entity& entity) = 0;
};

/**
 * @brief Default marker
 *
 * 4xx -> error (429 additionally throttle), 5xx -> fault.
 * The instrumentation mark lands in aws.xray.auto_instrumentation.
 */
class StatusEntityMarker : public IEntityMarker {
public:
    void mark_entity_from_status(Entity& entity, int status_code) override;
    [[nodiscard]] Status add_auto_instrumentation_mark(Entity& entity) override;
};

} // namespace tracehook
