/**
 * @file qbm/apidoc/routing/api_method_router.h
 * @brief Documented per-path method router.
 *
 * `ApiMethodRouter` pairs a transport `http::MethodRouter` with one documentation record
 * per registered method. Every registration goes through the same steps:
 *
 * 1. the handler is converted to an `OperationHandler` (endpoint + documentation);
 * 2. a fresh `openapi::Operation` is documented by the handler's input and output under
 *    the generation context current on this thread (see `GenScope`);
 * 3. the optional transform edits the record;
 * 4. the endpoint is registered on the dispatcher and, unless the transform hid it, the
 *    record is stored under the method.
 *
 * The free functions at the bottom of this file (`qb::apidoc::get`, `qb::apidoc::post_with`, ...)
 * start a router with one method registered, to be chained with further methods:
 *
 * @code
 * qb::apidoc::GenScope scope(ctx);
 * auto users = qb::apidoc::get(list_users).post_with(create_user, [](qb::apidoc::TransformOperation op) {
 *     return op.summary("Create a user");
 * });
 * qb::apidoc::openapi::PathItem item = users.take_path_item();
 * @endcode
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#pragma once

#include "../gen/context.h"
#include "../http/method_router.h"
#include "../logger.h"
#include "../openapi/operation.h"
#include "../openapi/path_item.h"
#include "../operation/handler.h"
#include "../operation/operation_io.h"
#include "../operation/transform.h"
#include "../types.h"

#include <map>
#include <optional>
#include <stdexcept>
#include <utility>

namespace qb::apidoc {

namespace detail {

/** @brief Transform leaving the operation untouched. */
struct IdentityTransform {
    TransformOperation operator()(TransformOperation op) const { return op; }
};

} // namespace detail

template <typename State = NoState>
class ApiMethodRouter {
public:
    using Dispatcher = http::MethodRouter<State>;

private:
    std::map<Method, openapi::Operation> _operations;
    Dispatcher _router;

    template <typename>
    friend class ApiMethodRouter;

public:
    ApiMethodRouter() = default;

    /**
     * @brief Wraps an undocumented method router.
     * Its handlers dispatch as before and no documentation record is created for them.
     */
    explicit ApiMethodRouter(Dispatcher router) : _router(std::move(router)) {}

    /**
     * @brief Registers a handler for `m` and documents it, then applies `transform`.
     *
     * Documentation errors (response conflicts, duplicate parameters) are recorded in the
     * current generation context and never fail the registration. A previously registered
     * handler for `m` is replaced along with its documentation.
     *
     * @param m Method to register.
     * @param handler Typed handler callable or `OperationHandler<State>`.
     * @param transform Callable `TransformOperation(TransformOperation)`.
     * @throws std::invalid_argument if `m` is outside the documented set.
     * @throws std::logic_error if no `GenScope` is active on this thread.
     * @return Reference to this router for chaining.
     */
    template <typename H, typename Fn>
    ApiMethodRouter &on_with(Method m, H &&handler, Fn &&transform) {
        if (!is_known_method(m)) {
            throw std::invalid_argument("ApiMethodRouter::on: unknown method.");
        }

        OperationHandler<State> op_handler = to_operation_handler<State>(std::forward<H>(handler));

        std::optional<openapi::Operation> record = in_context([&](GenContext &ctx) {
            openapi::Operation op;
            infer_operation(ctx, op, op_handler.input(), op_handler.output());
            TransformOperation edited = std::forward<Fn>(transform)(TransformOperation(op, ctx));
            return edited.is_hidden() ? std::nullopt : std::optional<openapi::Operation>(std::move(op));
        });

        _router.on(m, op_handler.endpoint());
        if (record) {
            _operations.insert_or_assign(m, std::move(*record));
            LOG_APIDOC_DEBUG("registered documented " << method_to_string(m) << " operation");
        } else {
            _operations.erase(m);
            LOG_APIDOC_DEBUG("registered hidden " << method_to_string(m) << " operation");
        }
        return *this;
    }

    /** @brief Registers a handler for `m` and documents it. @see on_with() */
    template <typename H>
    ApiMethodRouter &on(Method m, H &&handler) {
        return on_with(m, std::forward<H>(handler), detail::IdentityTransform{});
    }

    template <typename H>
    ApiMethodRouter &get(H &&h) { return on(Method::GET, std::forward<H>(h)); }
    template <typename H>
    ApiMethodRouter &post(H &&h) { return on(Method::POST, std::forward<H>(h)); }
    template <typename H>
    ApiMethodRouter &put(H &&h) { return on(Method::PUT, std::forward<H>(h)); }
    template <typename H>
    ApiMethodRouter &patch(H &&h) { return on(Method::PATCH, std::forward<H>(h)); }
    template <typename H>
    ApiMethodRouter &del(H &&h) { return on(Method::DEL, std::forward<H>(h)); }
    template <typename H>
    ApiMethodRouter &head(H &&h) { return on(Method::HEAD, std::forward<H>(h)); }
    template <typename H>
    ApiMethodRouter &options(H &&h) { return on(Method::OPTIONS, std::forward<H>(h)); }
    template <typename H>
    ApiMethodRouter &trace(H &&h) { return on(Method::TRACE, std::forward<H>(h)); }

    template <typename H, typename Fn>
    ApiMethodRouter &get_with(H &&h, Fn &&t) { return on_with(Method::GET, std::forward<H>(h), std::forward<Fn>(t)); }
    template <typename H, typename Fn>
    ApiMethodRouter &post_with(H &&h, Fn &&t) { return on_with(Method::POST, std::forward<H>(h), std::forward<Fn>(t)); }
    template <typename H, typename Fn>
    ApiMethodRouter &put_with(H &&h, Fn &&t) { return on_with(Method::PUT, std::forward<H>(h), std::forward<Fn>(t)); }
    template <typename H, typename Fn>
    ApiMethodRouter &patch_with(H &&h, Fn &&t) { return on_with(Method::PATCH, std::forward<H>(h), std::forward<Fn>(t)); }
    template <typename H, typename Fn>
    ApiMethodRouter &del_with(H &&h, Fn &&t) { return on_with(Method::DEL, std::forward<H>(h), std::forward<Fn>(t)); }
    template <typename H, typename Fn>
    ApiMethodRouter &head_with(H &&h, Fn &&t) { return on_with(Method::HEAD, std::forward<H>(h), std::forward<Fn>(t)); }
    template <typename H, typename Fn>
    ApiMethodRouter &options_with(H &&h, Fn &&t) { return on_with(Method::OPTIONS, std::forward<H>(h), std::forward<Fn>(t)); }
    template <typename H, typename Fn>
    ApiMethodRouter &trace_with(H &&h, Fn &&t) { return on_with(Method::TRACE, std::forward<H>(h), std::forward<Fn>(t)); }

    /**
     * @brief Provides the state the handlers expect and rebinds the router to `NewState`.
     * The documentation records are carried over unchanged.
     */
    template <typename NewState = NoState>
    [[nodiscard]] ApiMethodRouter<NewState> with_state(State state) const {
        ApiMethodRouter<NewState> out;
        out._operations = _operations;
        out._router = _router.template with_state<NewState>(std::move(state));
        return out;
    }

    /**
     * @brief Adds every method of `other`, documentation and handlers alike.
     * A method registered on both sides takes `other`'s handler and documentation.
     * @return Reference to this router for chaining.
     */
    ApiMethodRouter &merge(ApiMethodRouter other) {
        for (Method m : other._router.methods()) {
            // a hidden handler on the other side replaces ours undocumented
            if (!other._operations.count(m)) {
                _operations.erase(m);
            }
        }
        for (auto &[m, op] : other._operations) {
            if (_operations.count(m)) {
                LOG_APIDOC_WARN("ApiMethodRouter::merge: overriding documentation for " << method_to_string(m));
            }
            _operations.insert_or_assign(m, std::move(op));
        }
        _router.merge(std::move(other._router));
        return *this;
    }

    /**
     * @brief Adds every handler of an undocumented method router.
     * Methods it registers replace ours and lose their documentation.
     * @return Reference to this router for chaining.
     */
    ApiMethodRouter &merge(Dispatcher other) {
        return merge(ApiMethodRouter(std::move(other)));
    }

    /**
     * @brief Wraps every handler and the fallback with a middleware. Documentation is unchanged.
     * @return Reference to this router for chaining.
     */
    ApiMethodRouter &layer(http::Middleware mw) {
        _router.layer(std::move(mw));
        return *this;
    }

    /**
     * @brief Wraps only the registered handlers with a middleware. Documentation is unchanged.
     * @return Reference to this router for chaining.
     */
    ApiMethodRouter &route_layer(http::Middleware mw) {
        _router.route_layer(std::move(mw));
        return *this;
    }

    /** @brief Dispatches a request through the wrapped method router. */
    http::Response call(http::Request &req, const State &state = State{}) const {
        return _router.call(req, state);
    }

    /** @brief Documentation records not yet drained, by method. */
    [[nodiscard]] const std::map<Method, openapi::Operation> &operations() const noexcept { return _operations; }

    [[nodiscard]] const Dispatcher &router() const noexcept { return _router; }

    /**
     * @brief Releases the method router, dropping any documentation not yet drained.
     */
    [[nodiscard]] Dispatcher into_router() && {
        if (!_operations.empty()) {
            LOG_APIDOC_DEBUG("dropping " << _operations.size() << " undrained operation record(s)");
        }
        _operations.clear();
        return std::move(_router);
    }

    /**
     * @brief Moves every documentation record into a fresh path item.
     *
     * The router keeps its handlers but holds no record afterwards, so a second call
     * returns an empty path item.
     * @throws std::logic_error if a record is stored under a method outside the documented set.
     */
    [[nodiscard]] openapi::PathItem take_path_item() {
        auto records = std::exchange(_operations, {});
        openapi::PathItem item;

        for (Method m : CANONICAL_METHODS) {
            auto it = records.find(m);
            if (it == records.end()) {
                continue;
            }
            item.set(m, std::move(it->second));
            records.erase(it);
        }
        // anything left is not a documented method; PathItem rejects it
        for (auto &[m, op] : records) {
            item.set(m, std::move(op));
        }

        LOG_APIDOC_TRACE("drained " << item.size() << " operation(s) into path item");
        return item;
    }
};

/**
 * @name Top-level registration
 * Each function returns a new `ApiMethodRouter<State>` with one method registered.
 * @{
 */
template <typename State = NoState, typename H>
ApiMethodRouter<State> on(Method m, H &&h) {
    ApiMethodRouter<State> r;
    r.on(m, std::forward<H>(h));
    return r;
}

template <typename State = NoState, typename H, typename Fn>
ApiMethodRouter<State> on_with(Method m, H &&h, Fn &&t) {
    ApiMethodRouter<State> r;
    r.on_with(m, std::forward<H>(h), std::forward<Fn>(t));
    return r;
}

template <typename State = NoState, typename H>
ApiMethodRouter<State> get(H &&h) { return on<State>(Method::GET, std::forward<H>(h)); }
template <typename State = NoState, typename H>
ApiMethodRouter<State> post(H &&h) { return on<State>(Method::POST, std::forward<H>(h)); }
template <typename State = NoState, typename H>
ApiMethodRouter<State> put(H &&h) { return on<State>(Method::PUT, std::forward<H>(h)); }
template <typename State = NoState, typename H>
ApiMethodRouter<State> patch(H &&h) { return on<State>(Method::PATCH, std::forward<H>(h)); }
template <typename State = NoState, typename H>
ApiMethodRouter<State> del(H &&h) { return on<State>(Method::DEL, std::forward<H>(h)); }
template <typename State = NoState, typename H>
ApiMethodRouter<State> head(H &&h) { return on<State>(Method::HEAD, std::forward<H>(h)); }
template <typename State = NoState, typename H>
ApiMethodRouter<State> options(H &&h) { return on<State>(Method::OPTIONS, std::forward<H>(h)); }
template <typename State = NoState, typename H>
ApiMethodRouter<State> trace(H &&h) { return on<State>(Method::TRACE, std::forward<H>(h)); }

template <typename State = NoState, typename H, typename Fn>
ApiMethodRouter<State> get_with(H &&h, Fn &&t) { return on_with<State>(Method::GET, std::forward<H>(h), std::forward<Fn>(t)); }
template <typename State = NoState, typename H, typename Fn>
ApiMethodRouter<State> post_with(H &&h, Fn &&t) { return on_with<State>(Method::POST, std::forward<H>(h), std::forward<Fn>(t)); }
template <typename State = NoState, typename H, typename Fn>
ApiMethodRouter<State> put_with(H &&h, Fn &&t) { return on_with<State>(Method::PUT, std::forward<H>(h), std::forward<Fn>(t)); }
template <typename State = NoState, typename H, typename Fn>
ApiMethodRouter<State> patch_with(H &&h, Fn &&t) { return on_with<State>(Method::PATCH, std::forward<H>(h), std::forward<Fn>(t)); }
template <typename State = NoState, typename H, typename Fn>
ApiMethodRouter<State> del_with(H &&h, Fn &&t) { return on_with<State>(Method::DEL, std::forward<H>(h), std::forward<Fn>(t)); }
template <typename State = NoState, typename H, typename Fn>
ApiMethodRouter<State> head_with(H &&h, Fn &&t) { return on_with<State>(Method::HEAD, std::forward<H>(h), std::forward<Fn>(t)); }
template <typename State = NoState, typename H, typename Fn>
ApiMethodRouter<State> options_with(H &&h, Fn &&t) { return on_with<State>(Method::OPTIONS, std::forward<H>(h), std::forward<Fn>(t)); }
template <typename State = NoState, typename H, typename Fn>
ApiMethodRouter<State> trace_with(H &&h, Fn &&t) { return on_with<State>(Method::TRACE, std::forward<H>(h), std::forward<Fn>(t)); }
/** @} */

} // namespace qb::apidoc
