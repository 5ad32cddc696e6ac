#pragma once

#include "core/types.hpp"
#include "interceptor/http_message.hpp"
#include "recorder/entity_marker.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace tracehook {

/**
 * @brief Extracts HTTP metadata for the segment
 *
 * Request:  url, user_agent, method, client_ip [, x_forwarded_for]
 * Response: status (and forwards it to the entity marker)
 */
class AttributeCollector {
public:
    static constexpr std::string_view kForwardedForHeader = "X-Forwarded-For";
    static constexpr std::string_view kUserAgentHeader = "User-Agent";

    explicit AttributeCollector(IEntityMarker& marker);

    [[nodiscard]] HttpAttributes collect_request(const HttpRequestInfo& request) const;

    /// Marks `entity` from the status code and returns the response attributes
    [[nodiscard]] HttpAttributes collect_response(const HttpResponseInfo& response, Entity& entity) const;

    /**
     * @brief Original client from X-Forwarded-For
     *
     * Leftmost comma-separated entry, trimmed. nullopt when the header is
     * absent or empty.
     */
    [[nodiscard]] static std::optional<std::string> forwarded_client_ip(const HttpRequestInfo& request);

private:
    IEntityMarker& marker_;
};

} // namespace tracehook
