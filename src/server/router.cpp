/**
 * @file router.cpp
 * @brief Router implementation.
 */

#include "server/router.hpp"

namespace archetype {

std::vector<std::string> Router::split_path(std::string_view path) {
    std::vector<std::string> out;
    while (!path.empty()) {
        auto slash = path.find('/');
        auto segment = path.substr(0, slash);
        if (!segment.empty()) out.emplace_back(segment);
        if (slash == std::string_view::npos) break;
        path.remove_prefix(slash + 1);
    }
    return out;
}

void Router::add(std::string method, std::string_view pattern, RouteHandler handler) {
    routes_.push_back(Route{std::move(method), split_path(pattern), std::move(handler)});
}

bool Router::match(const Route& route, const std::vector<std::string>& segments,
                   PathParams& params) {
    if (route.segments.size() != segments.size()) return false;
    PathParams captured;
    for (size_t i = 0; i < segments.size(); ++i) {
        const auto& expected = route.segments[i];
        if (expected.size() > 2 && expected.front() == '{' && expected.back() == '}') {
            captured[expected.substr(1, expected.size() - 2)] = segments[i];
        } else if (expected != segments[i]) {
            return false;
        }
    }
    params = std::move(captured);
    return true;
}

HttpResponse Router::dispatch(const HttpRequest& request) const {
    auto segments = split_path(request.path);
    bool path_matched = false;

    for (const auto& route : routes_) {
        PathParams params;
        if (!match(route, segments, params)) continue;
        if (route.method != request.method) {
            path_matched = true;
            continue;
        }
        return route.handler(request, params);
    }

    if (path_matched) {
        return HttpResponse::error(405, "MethodNotAllowed",
                                   request.method + " is not allowed on " + request.path);
    }
    return HttpResponse::error(404, "NotFound", "No route for " + request.path);
}

}  // namespace archetype
