/**
 * @file qbm/apidoc/routing/api_router.h
 * @brief Path-level router collecting documented method routers.
 *
 * `ApiRouter` mounts method routers under path patterns, dispatches requests to them and
 * keeps the path items drained from documented routers until they are written into a
 * document by `finish_api()`.
 *
 * @code
 * qb::apidoc::GenContext ctx;
 * qb::apidoc::ApiRouter<> app;
 * {
 *     qb::apidoc::GenScope scope(ctx);
 *     app.api_route("/users/:id", qb::apidoc::get(get_user).del(delete_user));
 * }
 * qb::apidoc::openapi::DocumentGenerator doc("Users API", "1.0.0");
 * app.finish_api(doc);
 * @endcode
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#pragma once

#include "./api_method_router.h"
#include "./path_pattern.h"
#include "../http/message.h"
#include "../http/method_router.h"
#include "../logger.h"
#include "../openapi/document.h"
#include "../openapi/path_item.h"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace qb::apidoc {

namespace detail {

/**
 * @brief Declares at path level the parameters of `pattern` that some operation of `item`
 *        leaves undocumented, as required strings.
 */
inline void declare_path_parameters(const PathPattern &pattern, openapi::PathItem &item) {
    for (const auto &name : pattern.parameter_names()) {
        bool documented = !item.empty();
        for (Method m : CANONICAL_METHODS) {
            const auto *op = item.get(m);
            if (op && !op->find_parameter(name, "path")) {
                documented = false;
            }
        }
        if (documented) {
            continue;
        }

        bool declared = false;
        for (const auto &p : item.parameters) {
            declared = declared || (p.is_object() && p.value("name", "") == name &&
                                    p.value("in", "") == "path");
        }
        if (!declared) {
            item.parameters.push_back(openapi::make_parameter(name, "path", {{"type", "string"}}, true));
        }
    }
}

} // namespace detail

template <typename State = NoState>
class ApiRouter {
    struct MountedRoute {
        PathPattern pattern;
        http::MethodRouter<State> router;
    };

    std::vector<MountedRoute> _routes;                ///< In mount order.
    std::map<std::string, openapi::PathItem> _paths; ///< OpenAPI path -> documentation.

    MountedRoute *find_route(const PathPattern &pattern) {
        for (auto &route : _routes) {
            if (route.pattern == pattern) {
                return &route;
            }
        }
        return nullptr;
    }

    void mount(PathPattern pattern, http::MethodRouter<State> router) {
        if (auto *existing = find_route(pattern)) {
            existing->router.merge(std::move(router));
            return;
        }
        _routes.push_back({std::move(pattern), std::move(router)});
    }

    /** Drops documentation for methods `router` registers and `incoming` does not document. */
    void forget_undocumented(const std::string &key, const http::MethodRouter<State> &router,
                             const openapi::PathItem *incoming) {
        auto it = _paths.find(key);
        if (it == _paths.end()) {
            return;
        }
        for (Method m : router.methods()) {
            if ((!incoming || !incoming->get(m)) && it->second.erase(m)) {
                LOG_APIDOC_WARN("ApiRouter: undocumented " << method_to_string(m)
                                << " handler replaces documented operation on " << key);
            }
        }
        if (it->second.empty() && it->second.parameters.empty()) {
            _paths.erase(it);
        }
    }

public:
    ApiRouter() = default;

    /**
     * @brief Mounts a documented method router under `path`.
     *
     * The router's documentation is drained immediately. A path mounted twice merges
     * both handlers and documentation; a method present on both sides takes the later one,
     * and loses its documentation if the later one is hidden.
     * @throws std::invalid_argument if `path` is not a valid pattern.
     * @return Reference to this router for chaining.
     */
    ApiRouter &api_route(const std::string &path, ApiMethodRouter<State> router) {
        PathPattern pattern(path);
        openapi::PathItem item = router.take_path_item();

        const std::string key = pattern.openapi_path();
        http::MethodRouter<State> dispatcher = std::move(router).into_router();
        forget_undocumented(key, dispatcher, &item);

        auto it = _paths.find(key);
        if (it == _paths.end()) {
            _paths.emplace(key, std::move(item));
        } else if (auto overwritten = it->second.merge(std::move(item))) {
            LOG_APIDOC_WARN("ApiRouter::api_route: " << overwritten << " operation(s) overwritten on " << key);
        }

        mount(std::move(pattern), std::move(dispatcher));
        LOG_APIDOC_DEBUG("mounted documented route " << key);
        return *this;
    }

    /**
     * @brief Mounts an undocumented method router under `path`.
     * Methods it registers drop any documentation collected for them on the same path.
     * @return Reference to this router for chaining.
     */
    ApiRouter &route(const std::string &path, http::MethodRouter<State> router) {
        PathPattern pattern(path);
        LOG_APIDOC_DEBUG("mounted route " << pattern.openapi_path());
        forget_undocumented(pattern.openapi_path(), router, nullptr);
        mount(std::move(pattern), std::move(router));
        return *this;
    }

    /**
     * @brief Routes a request by path, then by method.
     *
     * Among the patterns matching the path, the one with the fewest parameter segments
     * is chosen. Captured parameters are stored in `req.params`.
     * @return The handler's response, `404` if no path matches, or `405` from the method router.
     */
    http::Response dispatch(http::Request &req, const State &state = State{}) const {
        const MountedRoute *best = nullptr;
        for (const auto &route : _routes) {
            http::FieldMap captured;
            if (!route.pattern.match(req.path, captured)) {
                continue;
            }
            if (!best || route.pattern.parameter_count() < best->pattern.parameter_count()) {
                best = &route;
            }
        }

        if (!best) {
            LOG_APIDOC_TRACE("no route for " << method_to_string(req.method) << " " << req.path);
            return http::Response::text(404, "Not Found");
        }
        best->pattern.match(req.path, req.params);
        return best->router.call(req, state);
    }

    /** @brief Documentation collected so far, by OpenAPI path. */
    [[nodiscard]] const std::map<std::string, openapi::PathItem> &paths() const noexcept { return _paths; }

    /**
     * @brief Writes every collected path item into `doc` and clears the collection.
     *
     * Path parameters appearing in a pattern but not documented by every operation are
     * declared at path level as required strings.
     * @return Reference to this router for chaining.
     */
    ApiRouter &finish_api(openapi::DocumentGenerator &doc) {
        auto paths = std::exchange(_paths, {});
        for (auto &[path, item] : paths) {
            detail::declare_path_parameters(PathPattern(path), item);
            doc.add_path_item(path, std::move(item));
        }
        LOG_APIDOC_DEBUG("finished api with " << paths.size() << " path(s)");
        return *this;
    }
};

} // namespace qb::apidoc
