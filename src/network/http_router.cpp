#include "vault/network/http_router.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <sstream>

namespace vault {
namespace network {

// ────────────────────────────────────────────────────────────
// HttpRouter Implementation
// ────────────────────────────────────────────────────────────

HttpRouter::HttpRouter()
    : not_found_handler_(default_not_found_handler) {
}

void HttpRouter::get(const std::string& path, RouteHandler handler) {
    add_route(HttpMethod::GET, path, std::move(handler));
}

void HttpRouter::post(const std::string& path, RouteHandler handler) {
    add_route(HttpMethod::POST, path, std::move(handler));
}

void HttpRouter::put(const std::string& path, RouteHandler handler) {
    add_route(HttpMethod::PUT, path, std::move(handler));
}

void HttpRouter::add_route(HttpMethod method, const std::string& path, RouteHandler handler) {
    routes_.push_back(Route{method, path, std::move(handler)});
    spdlog::debug("Registered route: {} {}", HttpMethodUtils::to_string(method), path);
}

void HttpRouter::use(Middleware middleware) {
    middlewares_.push_back(std::move(middleware));
}

void HttpRouter::set_not_found_handler(RouteHandler handler) {
    not_found_handler_ = std::move(handler);
}

HttpResponse HttpRouter::handle_request(const HttpRequest& request) const {
    HttpContext ctx(request);
    HttpResponse response(HttpStatus::OK);

    for (const auto& middleware : middlewares_) {
        if (!middleware(ctx, response)) {
            return response;
        }
    }

    const std::string path = request.path();
    const Route* route = find_route(request.method, path);

    if (route == nullptr) {
        if (path_known(path)) {
            response = HttpResponse(HttpStatus::METHOD_NOT_ALLOWED);
            response.set_header("Content-Type", "application/json");
            response.set_body(nlohmann::json{{"error", "method not allowed"}}.dump());
            return response;
        }
        return not_found_handler_(ctx);
    }

    try {
        response = route->handler(ctx);
    } catch (const std::exception& e) {
        spdlog::error("Route handler for {} {} threw: {}",
                      HttpMethodUtils::to_string(request.method), path, e.what());

        response = HttpResponse(HttpStatus::INTERNAL_SERVER_ERROR);
        response.set_header("Content-Type", "application/json");
        response.set_body(nlohmann::json{{"error", "internal server error"}}.dump());
    }
    return response;
}

std::vector<std::string> HttpRouter::list_routes() const {
    std::vector<std::string> route_list;
    for (const auto& route : routes_) {
        std::ostringstream oss;
        oss << HttpMethodUtils::to_string(route.method) << " " << route.path;
        route_list.push_back(oss.str());
    }
    return route_list;
}

HttpResponse HttpRouter::default_not_found_handler(const HttpContext& ctx) {
    HttpResponse response(HttpStatus::NOT_FOUND);
    response.set_header("Content-Type", "application/json");
    response.set_body(nlohmann::json{{"error", "not found"}, {"path", ctx.request.path()}}.dump());
    return response;
}

const Route* HttpRouter::find_route(HttpMethod method, const std::string& path) const {
    for (const auto& route : routes_) {
        if (route.method == method && route.path == path) {
            return &route;
        }
    }
    return nullptr;
}

bool HttpRouter::path_known(const std::string& path) const {
    for (const auto& route : routes_) {
        if (route.path == path) {
            return true;
        }
    }
    return false;
}

} // namespace network
} // namespace vault
