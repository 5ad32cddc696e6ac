#pragma once

#include "interceptor/request_context.hpp"
#include "interceptor/request_interceptor.hpp"

#include <atomic>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace tracehook {

/**
 * @brief Raises request lifecycle events from cpp-httplib's routing hooks
 *
 * pre-routing  -> on_begin_request (never claims the request)
 * exception    -> on_error, then a 500 response
 * post-routing -> on_end_request, response headers copied back
 *
 * httplib runs post-routing before the response headers are written, so the
 * trace header echo reaches the client. One RequestContext lives in the
 * in-flight table per request, keyed by the httplib::Request address.
 */
class HttplibTracingBinding {
public:
    explicit HttplibTracingBinding(IRequestLifecycle& lifecycle, std::string scheme = "http");

    HttplibTracingBinding(const HttplibTracingBinding&) = delete;
    HttplibTracingBinding& operator=(const HttplibTracingBinding&) = delete;

    /// Registers the pre-routing, post-routing and exception handlers
    void install(httplib::Server& server);

    // Hook bodies, public so they can be driven without a listening socket
    void on_pre_routing(const httplib::Request& req);
    void on_exception(const httplib::Request& req, httplib::Response& res, std::exception_ptr ep);
    void on_post_routing(const httplib::Request& req, httplib::Response& res);

    /// Requests that have begun but not yet ended
    [[nodiscard]] size_t in_flight() const;

    /// Host-neutral view of an httplib request
    [[nodiscard]] HttpRequestInfo to_request_info(const httplib::Request& req) const;

    /// Type name and message of the exception held by `ep`
    [[nodiscard]] static ExceptionInfo describe_exception(std::exception_ptr ep);

    struct Stats {
        uint64_t requests_bound;
        uint64_t requests_released;
        uint64_t orphan_ends;
        uint64_t exceptions_handled;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    RequestContext& acquire(const httplib::Request& req);

    IRequestLifecycle& lifecycle_;
    const std::string scheme_;

    mutable std::mutex mutex_;
    std::unordered_map<const httplib::Request*, std::unique_ptr<RequestContext>> in_flight_;

    std::atomic<uint64_t> requests_bound_{0};
    std::atomic<uint64_t> requests_released_{0};
    std::atomic<uint64_t> orphan_ends_{0};
    std::atomic<uint64_t> exceptions_handled_{0};
};

} // namespace tracehook
