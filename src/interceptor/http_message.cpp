#include "interceptor/http_message.hpp"
#include "core/utils.hpp"

#include <algorithm>

namespace tracehook {

// ============================================================================
// HttpRequestInfo
// ============================================================================

void HttpRequestInfo::set_header(std::string_view name, std::string value) {
    headers_.insert_or_assign(utils::to_lower(name), std::move(value));
}

void HttpRequestInfo::add_header(std::string_view name, std::string value) {
    headers_.try_emplace(utils::to_lower(name), std::move(value));
}

std::optional<std::string> HttpRequestInfo::header(std::string_view name) const {
    const auto it = headers_.find(utils::to_lower(name));
    if (it == headers_.end()) return std::nullopt;
    return it->second;
}

std::string HttpRequestInfo::absolute_url() const {
    std::string url = scheme + "://" + host;
    if (path.empty() || path.front() != '/') url += '/';
    url += path;
    if (!query.empty()) {
        url += '?';
        url += query;
    }
    return url;
}

// ============================================================================
// HttpResponseInfo
// ============================================================================

void HttpResponseInfo::set_header(std::string_view name, std::string value) {
    std::erase_if(headers_, [name](const auto& h) { return utils::iequals(h.first, name); });
    headers_.emplace_back(std::string(name), std::move(value));
}

std::optional<std::string> HttpResponseInfo::header(std::string_view name) const {
    for (const auto& [key, value] : headers_) {
        if (utils::iequals(key, name)) return value;
    }
    return std::nullopt;
}

size_t HttpResponseInfo::header_count(std::string_view name) const {
    return static_cast<size_t>(std::count_if(headers_.begin(), headers_.end(),
        [name](const auto& h) { return utils::iequals(h.first, name); }));
}

} // namespace tracehook
