#pragma once

#include "vault/network/http_types.hpp"

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace vault {
namespace network {

/**
 * @brief Request plus its decoded query string
 */
struct HttpContext {
    const HttpRequest& request;
    std::unordered_map<std::string, std::string> query;

    explicit HttpContext(const HttpRequest& req) : request(req), query(req.query_params()) {}

    std::string get_query(const std::string& name, const std::string& default_value = "") const {
        auto it = query.find(name);
        return (it != query.end()) ? it->second : default_value;
    }
};

using RouteHandler = std::function<HttpResponse(const HttpContext&)>;

/**
 * @brief Middleware: return false to short-circuit with @p response
 */
using Middleware = std::function<bool(const HttpContext&, HttpResponse&)>;

struct Route {
    HttpMethod method;
    std::string path;
    RouteHandler handler;
};

/**
 * @brief HTTP Router for organizing request handlers
 *
 * Features:
 * - Method-based routing on exact paths
 * - Query strings are stripped before matching and exposed on the context
 * - 405 when the path exists under another method
 * - Middleware support (logging, auth)
 *
 * Example usage:
 * @code
 * HttpRouter router;
 * router.post("/upload/init", [](const HttpContext& ctx) {
 *     auto body = ctx.request.body_as_string();
 *     ...
 * });
 * router.use([](const HttpContext& ctx, HttpResponse&) {
 *     spdlog::debug("{} {}", HttpMethodUtils::to_string(ctx.request.method), ctx.request.url);
 *     return true;
 * });
 * @endcode
 */
class HttpRouter {
public:
    HttpRouter();

    void get(const std::string& path, RouteHandler handler);
    void post(const std::string& path, RouteHandler handler);
    void put(const std::string& path, RouteHandler handler);
    void add_route(HttpMethod method, const std::string& path, RouteHandler handler);

    /**
     * @brief Add middleware to run before route handlers
     *
     * Middleware is executed in the order it's added. If middleware returns
     * false, request handling stops and its response is sent.
     */
    void use(Middleware middleware);

    void set_not_found_handler(RouteHandler handler);

    /**
     * @brief Dispatch a request to the route registered for its method and path
     *
     * A handler that throws is answered with 500 and logged.
     */
    HttpResponse handle_request(const HttpRequest& request) const;

    std::vector<std::string> list_routes() const;
    size_t route_count() const { return routes_.size(); }

private:
    std::vector<Route> routes_;
    std::vector<Middleware> middlewares_;
    RouteHandler not_found_handler_;

    static HttpResponse default_not_found_handler(const HttpContext& ctx);

    const Route* find_route(HttpMethod method, const std::string& path) const;
    bool path_known(const std::string& path) const;
};

} // namespace network
} // namespace vault
