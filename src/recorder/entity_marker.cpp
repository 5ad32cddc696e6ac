#include "recorder/entity_marker.hpp"

#include <format>

namespace tracehook {

void StatusEntityMarker::mark_entity_from_status(Entity& entity, int status_code) {
    if (status_code >= 400 && status_code <= 499) {
        entity.mark_error();
        if (status_code == 429) {
            entity.mark_throttle();
        }
    } else if (status_code >= 500 && status_code <= 599) {
        entity.mark_fault();
    }
}

Status StatusEntityMarker::add_auto_instrumentation_mark(Entity& entity) {
    if (!entity.is_in_progress()) {
        return Status::error(ErrorCategory::ENTITY_CLOSED,
            std::format("Entity {} is already closed", entity.id()));
    }
    entity.add_aws_metadata("xray", "auto_instrumentation", true);
    return Status::ok();
}

} // namespace tracehook
