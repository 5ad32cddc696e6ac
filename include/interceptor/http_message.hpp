#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tracehook {

/**
 * @brief Host-neutral view of an inbound HTTP request
 *
 * Header names are stored lowercased; lookups are case-insensitive.
 */
struct HttpRequestInfo {
    std::string method;
    std::string scheme = "http";
    std::string host;           // Host header value (may carry a port)
    std::string path;           // absolute path, no query
    std::string query;          // raw query string without '?'
    std::string peer_address;   // directly observed remote address

    /// Moment the host reported the request; becomes the segment start time
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();

    void set_header(std::string_view name, std::string value);
    /// Add a header as received on the wire; a repeated field keeps its first value
    void add_header(std::string_view name, std::string value);
    [[nodiscard]] std::optional<std::string> header(std::string_view name) const;
    [[nodiscard]] const std::unordered_map<std::string, std::string>& headers() const { return headers_; }

    /// scheme://host/path?query
    [[nodiscard]] std::string absolute_url() const;

private:
    std::unordered_map<std::string, std::string> headers_;
};

/**
 * @brief Host-neutral view of an outbound HTTP response
 *
 * Only carries what tracing reads (status) and what it writes (headers).
 */
struct HttpResponseInfo {
    int status = 200;

    /// Set a header, replacing any previous value under the same name
    void set_header(std::string_view name, std::string value);
    [[nodiscard]] std::optional<std::string> header(std::string_view name) const;
    [[nodiscard]] size_t header_count(std::string_view name) const;
    [[nodiscard]] const std::vector<std::pair<std::string, std::string>>& headers() const { return headers_; }

private:
    std::vector<std::pair<std::string, std::string>> headers_;
};

} // namespace tracehook
