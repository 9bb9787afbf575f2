/**
 * @file qbm/apidoc/http/method_router.h
 * @brief Per-path dispatcher selecting an endpoint by HTTP method.
 *
 * A `MethodRouter` holds at most one endpoint per documented method for a single path.
 * It supports wrapping its endpoints with middleware (`layer`, `route_layer`), merging
 * with another router for the same path, and rebinding the shared state it expects
 * (`with_state`). It knows nothing about documentation; `ApiMethodRouter` keeps the
 * documentation side in step with it.
 *
 * Dispatch rules:
 * - a registered method calls its endpoint;
 * - HEAD without its own endpoint is served by the GET endpoint with the body removed;
 * - any other method is answered by the fallback, by default `405 Method Not Allowed`
 *   with an `Allow` header listing the registered methods.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Transport
 */
#pragma once

#include "./message.h"
#include "../logger.h"
#include "../types.h"

#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace qb::apidoc::http {

/**
 * @brief Continuation handed to a middleware; invoking it runs the wrapped endpoint.
 */
using Next = std::function<Response(Request &)>;

/**
 * @brief Middleware wrapping an endpoint.
 *
 * A middleware may inspect or modify the request, call `next` to run the wrapped endpoint
 * and post-process its response, or return a response without calling `next`.
 */
using Middleware = std::function<Response(Request &, const Next &)>;

template <typename State = NoState>
class MethodRouter {
public:
    using EndpointFn = std::function<Response(Request &, const State &)>;

private:
    std::map<Method, EndpointFn> _endpoints;
    EndpointFn _fallback; ///< Empty means the built-in 405 response.
    std::vector<Middleware> _fallback_layers; ///< Layers over the built-in 405, innermost first.

    template <typename>
    friend class MethodRouter;

    static EndpointFn wrap(EndpointFn inner, Middleware mw) {
        return [inner = std::move(inner), mw](Request &req, const State &state) -> Response {
            return mw(req, [&inner, &state](Request &r) { return inner(r, state); });
        };
    }

    Response method_not_allowed() const {
        Response res(405);
        auto allow = allow_header();
        if (!allow.empty()) {
            res.set_header("Allow", allow);
        }
        return res;
    }

    bool has_fallback() const noexcept { return _fallback || !_fallback_layers.empty(); }

    Response call_fallback(Request &req, const State &state) const {
        if (_fallback) {
            return _fallback(req, state);
        }
        // the Allow header reflects the methods registered at dispatch time
        Next chain = [this](Request &) { return method_not_allowed(); };
        for (const auto &mw : _fallback_layers) {
            chain = [mw, inner = std::move(chain)](Request &r) { return mw(r, inner); };
        }
        return chain(req);
    }

public:
    MethodRouter() = default;

    /**
     * @brief Registers (or replaces) the endpoint for a method.
     * @throws std::invalid_argument if `fn` is empty or `m` is outside the documented set.
     * @return Reference to this router for chaining.
     */
    MethodRouter &on(Method m, EndpointFn fn) {
        if (!is_known_method(m)) {
            throw std::invalid_argument("MethodRouter::on: unknown method.");
        }
        if (!fn) {
            throw std::invalid_argument("MethodRouter::on: endpoint cannot be null.");
        }
        _endpoints.insert_or_assign(m, std::move(fn));
        return *this;
    }

    MethodRouter &get(EndpointFn fn) { return on(Method::GET, std::move(fn)); }
    MethodRouter &post(EndpointFn fn) { return on(Method::POST, std::move(fn)); }
    MethodRouter &put(EndpointFn fn) { return on(Method::PUT, std::move(fn)); }
    MethodRouter &patch(EndpointFn fn) { return on(Method::PATCH, std::move(fn)); }
    MethodRouter &del(EndpointFn fn) { return on(Method::DEL, std::move(fn)); }
    MethodRouter &head(EndpointFn fn) { return on(Method::HEAD, std::move(fn)); }
    MethodRouter &options(EndpointFn fn) { return on(Method::OPTIONS, std::move(fn)); }
    MethodRouter &trace(EndpointFn fn) { return on(Method::TRACE, std::move(fn)); }

    /**
     * @brief Replaces the response produced for methods without an endpoint.
     * @return Reference to this router for chaining.
     */
    MethodRouter &fallback(EndpointFn fn) {
        _fallback = std::move(fn);
        _fallback_layers.clear();
        return *this;
    }

    /** @brief `true` if an endpoint is registered for `m`. */
    [[nodiscard]] bool has(Method m) const { return _endpoints.count(m) != 0; }

    /** @brief `true` if no endpoint is registered. */
    [[nodiscard]] bool empty() const noexcept { return _endpoints.empty(); }

    /** @brief Registered methods in canonical order. */
    [[nodiscard]] std::vector<Method> methods() const {
        std::vector<Method> out;
        for (Method m : CANONICAL_METHODS) {
            if (has(m)) {
                out.push_back(m);
            }
        }
        return out;
    }

    /** @brief Value of the `Allow` header: registered methods, plus HEAD when GET is registered. */
    [[nodiscard]] std::string allow_header() const {
        std::string allow;
        for (Method m : CANONICAL_METHODS) {
            bool allowed = has(m) || (m == Method::HEAD && has(Method::GET));
            if (!allowed) {
                continue;
            }
            if (!allow.empty()) {
                allow.append(", ");
            }
            allow.append(method_to_string(m));
        }
        return allow;
    }

    /**
     * @brief Wraps every endpoint and the fallback with a middleware.
     * @return Reference to this router for chaining.
     */
    MethodRouter &layer(Middleware mw) {
        if (!mw) {
            throw std::invalid_argument("MethodRouter::layer: middleware cannot be null.");
        }
        for (auto &[m, fn] : _endpoints) {
            fn = wrap(std::move(fn), mw);
        }
        if (_fallback) {
            _fallback = wrap(std::move(_fallback), std::move(mw));
        } else {
            _fallback_layers.push_back(std::move(mw));
        }
        return *this;
    }

    /**
     * @brief Wraps only the registered endpoints with a middleware.
     * Requests answered by the fallback do not pass through it.
     * @return Reference to this router for chaining.
     */
    MethodRouter &route_layer(Middleware mw) {
        if (!mw) {
            throw std::invalid_argument("MethodRouter::route_layer: middleware cannot be null.");
        }
        for (auto &[m, fn] : _endpoints) {
            fn = wrap(std::move(fn), mw);
        }
        return *this;
    }

    /**
     * @brief Adds every endpoint of `other`; a method present in both takes `other`'s endpoint.
     * `other`'s fallback is kept only if this router has none.
     * @return Reference to this router for chaining.
     */
    MethodRouter &merge(MethodRouter other) {
        for (auto &[m, fn] : other._endpoints) {
            if (has(m)) {
                LOG_APIDOC_WARN("MethodRouter::merge: overriding endpoint for " << method_to_string(m));
            }
            _endpoints.insert_or_assign(m, std::move(fn));
        }
        if (!has_fallback()) {
            _fallback = std::move(other._fallback);
            _fallback_layers = std::move(other._fallback_layers);
        }
        return *this;
    }

    /**
     * @brief Provides the state this router expects and rebinds it to a new state type.
     *
     * Every endpoint (and a custom fallback, if any) captures `state`; the returned router
     * expects `NewState` at dispatch time, which its endpoints ignore.
     */
    template <typename NewState = NoState>
    [[nodiscard]] MethodRouter<NewState> with_state(State state) const {
        auto shared = std::make_shared<const State>(std::move(state));
        auto bind = [shared](const EndpointFn &fn) -> typename MethodRouter<NewState>::EndpointFn {
            return [fn, shared](Request &req, const NewState &) { return fn(req, *shared); };
        };

        MethodRouter<NewState> out;
        for (const auto &[m, fn] : _endpoints) {
            out._endpoints.emplace(m, bind(fn));
        }
        if (_fallback) {
            out._fallback = bind(_fallback);
        }
        out._fallback_layers = _fallback_layers;
        return out;
    }

    /**
     * @brief Dispatches a request to the endpoint registered for its method.
     * @param req The request; endpoints may modify it.
     * @param state Shared state handed to the endpoint.
     */
    Response call(Request &req, const State &state = State{}) const {
        auto it = _endpoints.find(req.method);
        if (it != _endpoints.end()) {
            return it->second(req, state);
        }

        if (req.method == Method::HEAD) {
            auto get_it = _endpoints.find(Method::GET);
            if (get_it != _endpoints.end()) {
                Response res = get_it->second(req, state);
                res.body.clear();
                return res;
            }
        }

        return call_fallback(req, state);
    }
};

} // namespace qb::apidoc::http
