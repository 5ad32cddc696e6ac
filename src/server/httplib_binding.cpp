#include "server/httplib_binding.hpp"
#include "core/utils.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <chrono>
#include <format>
#include <stdexcept>
#include <string_view>

namespace tracehook {

namespace {

/// Strip IPv6-mapped IPv4 prefix (::ffff:) if present.
/// cpp-httplib may return "::ffff:172.18.0.4" as remote_addr in Docker.
std::string_view strip_ipv6_mapped(std::string_view addr) {
    constexpr std::string_view prefix = "::ffff:";
    if (addr.size() > prefix.size() && addr.substr(0, prefix.size()) == prefix) {
        return addr.substr(prefix.size());
    }
    return addr;
}

} // anonymous namespace

HttplibTracingBinding::HttplibTracingBinding(IRequestLifecycle& lifecycle, std::string scheme)
    : lifecycle_(lifecycle), scheme_(std::move(scheme)) {}

void HttplibTracingBinding::install(httplib::Server& server) {
    server.set_pre_routing_handler([this](const httplib::Request& req, httplib::Response&) {
        on_pre_routing(req);
        return httplib::Server::HandlerResponse::Unhandled;
    });
    server.set_exception_handler(
        [this](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
            on_exception(req, res, std::move(ep));
        });
    server.set_post_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        on_post_routing(req, res);
    });
}

// ============================================================================
// Hooks
// ============================================================================

void HttplibTracingBinding::on_pre_routing(const httplib::Request& req) {
    auto& ctx = acquire(req);
    lifecycle_.on_begin_request(ctx);
}

void HttplibTracingBinding::on_exception(const httplib::Request& req, httplib::Response& res,
                                         std::exception_ptr ep) {
    exceptions_handled_.fetch_add(1, std::memory_order_relaxed);
    const auto info = describe_exception(std::move(ep));

    auto& ctx = acquire(req);
    lifecycle_.on_error(ctx, info);

    res.status = 500;
    res.set_content(std::format(R"({{"error":"{}"}})", utils::escape_json(info.message)),
                    "application/json");
}

void HttplibTracingBinding::on_post_routing(const httplib::Request& req, httplib::Response& res) {
    std::unique_ptr<RequestContext> ctx;
    {
        std::lock_guard lock(mutex_);
        const auto it = in_flight_.find(&req);
        if (it != in_flight_.end()) {
            ctx = std::move(it->second);
            in_flight_.erase(it);
        }
    }
    if (!ctx) {
        // httplib answers malformed requests without running pre-routing
        orphan_ends_.fetch_add(1, std::memory_order_relaxed);
        return;
    }
    requests_released_.fetch_add(1, std::memory_order_relaxed);

    HttpResponseInfo response;
    response.status = res.status;
    lifecycle_.on_end_request(*ctx, &response);

    for (const auto& [name, value] : response.headers()) {
        // Response::set_header appends; keep a single value per name
        res.headers.erase(name);
        res.set_header(name, value);
    }
}

// ============================================================================
// Helpers
// ============================================================================

RequestContext& HttplibTracingBinding::acquire(const httplib::Request& req) {
    std::lock_guard lock(mutex_);
    auto& slot = in_flight_[&req];
    if (!slot) {
        slot = std::make_unique<RequestContext>(to_request_info(req));
        requests_bound_.fetch_add(1, std::memory_order_relaxed);
    }
    return *slot;
}

HttpRequestInfo HttplibTracingBinding::to_request_info(const httplib::Request& req) const {
    HttpRequestInfo info;
    info.method = req.method;
    info.scheme = scheme_;
    info.host = req.get_header_value("Host");
    info.path = req.path;
    if (const auto q = req.target.find('?'); q != std::string::npos) {
        info.query = req.target.substr(q + 1);
    }
    info.peer_address = std::string(strip_ipv6_mapped(req.remote_addr));
    info.timestamp = std::chrono::system_clock::now();
    // Multimap in arrival order; the first line of a repeated field wins,
    // as with Request::get_header_value
    for (const auto& [name, value] : req.headers) {
        info.add_header(name, value);
    }
    return info;
}

ExceptionInfo HttplibTracingBinding::describe_exception(std::exception_ptr ep) {
    if (!ep) return ExceptionInfo("unknown", "no exception");
    try {
        std::rethrow_exception(ep);
    } catch (const std::invalid_argument& e) {
        return ExceptionInfo("std::invalid_argument", e.what());
    } catch (const std::out_of_range& e) {
        return ExceptionInfo("std::out_of_range", e.what());
    } catch (const std::logic_error& e) {
        return ExceptionInfo("std::logic_error", e.what());
    } catch (const std::runtime_error& e) {
        return ExceptionInfo("std::runtime_error", e.what());
    } catch (const std::exception& e) {
        return ExceptionInfo("std::exception", e.what());
    } catch (...) {
        return ExceptionInfo("unknown", "non-standard exception");
    }
}

size_t HttplibTracingBinding::in_flight() const {
    std::lock_guard lock(mutex_);
    return in_flight_.size();
}

HttplibTracingBinding::Stats HttplibTracingBinding::get_stats() const {
    return {
        requests_bound_.load(std::memory_order_relaxed),
        requests_released_.load(std::memory_order_relaxed),
        orphan_ends_.load(std::memory_order_relaxed),
        exceptions_handled_.load(std::memory_order_relaxed),
    };
}

} // namespace tracehook
