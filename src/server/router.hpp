/**
 * @file router.hpp
 * @brief Method + path-pattern dispatch.
 *
 * Patterns are '/'-separated; a segment written as {name} captures one path
 * segment. Routes are matched in registration order, so literal routes must
 * be added before a capture at the same position ("/devices/current" before
 * "/devices/{id}").
 */

#pragma once

#include "server/http_message.hpp"

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace archetype {

using PathParams = std::map<std::string, std::string>;
using RouteHandler = std::function<HttpResponse(const HttpRequest&, const PathParams&)>;

class Router {
public:
    void add(std::string method, std::string_view pattern, RouteHandler handler);

    /// 404 when no pattern matches, 405 when only the method differs.
    [[nodiscard]] HttpResponse dispatch(const HttpRequest& request) const;

    [[nodiscard]] size_t route_count() const noexcept { return routes_.size(); }

private:
    struct Route {
        std::string method;
        std::vector<std::string> segments;
        RouteHandler handler;
    };

    static std::vector<std::string> split_path(std::string_view path);
    static bool match(const Route& route, const std::vector<std::string>& segments, PathParams& params);

    std::vector<Route> routes_;
};

}  // namespace archetype
