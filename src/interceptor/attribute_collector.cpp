#include "interceptor/attribute_collector.hpp"
#include "core/utils.hpp"

namespace tracehook {

AttributeCollector::AttributeCollector(IEntityMarker& marker)
    : marker_(marker) {}

HttpAttributes AttributeCollector::collect_request(const HttpRequestInfo& request) const {
    HttpAttributes attributes;

    attributes["url"] = request.absolute_url();
    attributes["method"] = request.method;
    if (auto user_agent = request.header(kUserAgentHeader)) {
        attributes["user_agent"] = std::move(*user_agent);
    }

    if (auto forwarded = forwarded_client_ip(request)) {
        attributes["client_ip"] = std::move(*forwarded);
        attributes["x_forwarded_for"] = true;
    } else {
        attributes["client_ip"] = request.peer_address;
    }

    return attributes;
}

HttpAttributes AttributeCollector::collect_response(const HttpResponseInfo& response,
                                                    Entity& entity) const {
    HttpAttributes attributes;
    attributes["status"] = static_cast<int64_t>(response.status);

    marker_.mark_entity_from_status(entity, response.status);
    return attributes;
}

std::optional<std::string> AttributeCollector::forwarded_client_ip(const HttpRequestInfo& request) {
    const auto xff = request.header(kForwardedForHeader);
    if (!xff || xff->empty()) return std::nullopt;

    // Leftmost entry is the original client in a proxy chain
    const auto comma = xff->find(',');
    const std::string_view first = std::string_view(*xff).substr(0, comma);
    return std::string(utils::trim(first));
}

} // namespace tracehook
