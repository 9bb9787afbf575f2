/**
 * @file qbm/apidoc/operation/handler.h
 * @brief Typed handlers: an endpoint together with the documentation of its input and output.
 *
 * A typed handler is any callable of one of the forms
 *
 * @code
 * Out handler();
 * Out handler(In input);
 * Out handler(In input, const State& state);
 * @endcode
 *
 * where `In` is an extractor type providing
 * `static std::optional<In> from_request(const http::Request&, http::Response& rejection)`
 * and `Out` is either `http::Response` or a type providing
 * `http::Response into_response() &&`. Both may additionally provide the static
 * documentation members adapted by `InputAdapter` / `OutputAdapter`.
 *
 * `make_handler()` turns such a callable into an `OperationHandler`, the pair of a
 * type-erased endpoint and the input/output documentation interfaces. An
 * `OperationHandler` may also be built directly with hand-written `IOperationInput` /
 * `IOperationOutput` implementations.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup ApiDoc
 */
#pragma once

#include "./operation_io.h"
#include "../http/message.h"
#include "../http/method_router.h"
#include "../types.h"

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <tuple>
#include <type_traits>
#include <utility>

namespace qb::apidoc {

/**
 * @brief Input type of handlers that take no argument.
 */
struct NoInput {
    static std::optional<NoInput> from_request(const http::Request &, http::Response &) {
        return NoInput{};
    }
};

namespace detail {

template <typename T>
struct callable_traits : callable_traits<decltype(&T::operator())> {};

template <typename R, typename... A>
struct callable_traits<R (*)(A...)> {
    using result_type = R;
    using args_tuple = std::tuple<A...>;
    static constexpr std::size_t arity = sizeof...(A);
};

template <typename R, typename... A>
struct callable_traits<R(A...)> : callable_traits<R (*)(A...)> {};

template <typename C, typename R, typename... A>
struct callable_traits<R (C::*)(A...)> : callable_traits<R (*)(A...)> {};

template <typename C, typename R, typename... A>
struct callable_traits<R (C::*)(A...) const> : callable_traits<R (*)(A...)> {};

template <typename Traits, bool HasInput = (Traits::arity > 0)>
struct handler_input {
    using type = NoInput;
};

template <typename Traits>
struct handler_input<Traits, true> {
    using type = std::decay_t<std::tuple_element_t<0, typename Traits::args_tuple>>;
};

template <typename Out>
http::Response to_response(Out &&out) {
    if constexpr (std::is_same_v<std::decay_t<Out>, http::Response>) {
        return std::forward<Out>(out);
    } else {
        return std::move(out).into_response();
    }
}

template <typename T>
struct is_operation_handler : std::false_type {};

} // namespace detail

/**
 * @brief An endpoint bound to the documentation of its input and output.
 * @tparam State Shared state type the endpoint expects at dispatch time.
 */
template <typename State = NoState>
class OperationHandler {
public:
    using EndpointFn = typename http::MethodRouter<State>::EndpointFn;

private:
    EndpointFn _endpoint;
    std::shared_ptr<const IOperationInput> _input;
    std::shared_ptr<const IOperationOutput> _output;

public:
    /**
     * @throws std::invalid_argument if any of the three parts is null.
     */
    OperationHandler(EndpointFn endpoint,
                     std::shared_ptr<const IOperationInput> input,
                     std::shared_ptr<const IOperationOutput> output)
        : _endpoint(std::move(endpoint)), _input(std::move(input)), _output(std::move(output)) {
        if (!_endpoint) {
            throw std::invalid_argument("OperationHandler: endpoint cannot be null.");
        }
        if (!_input || !_output) {
            throw std::invalid_argument("OperationHandler: input and output documentation cannot be null.");
        }
    }

    [[nodiscard]] const EndpointFn &endpoint() const noexcept { return _endpoint; }
    [[nodiscard]] const IOperationInput &input() const noexcept { return *_input; }
    [[nodiscard]] const IOperationOutput &output() const noexcept { return *_output; }
};

namespace detail {
template <typename State>
struct is_operation_handler<OperationHandler<State>> : std::true_type {};
} // namespace detail

/**
 * @brief Builds an `OperationHandler` from a typed handler callable.
 *
 * The input and output types are deduced from the callable's signature; a request the
 * input type cannot extract is answered with the rejection response it produced.
 */
template <typename State = NoState, typename F>
OperationHandler<State> make_handler(F fn) {
    using traits = detail::callable_traits<std::remove_pointer_t<std::decay_t<F>>>;
    using In = typename detail::handler_input<traits>::type;
    using Out = std::decay_t<typename traits::result_type>;
    static_assert(traits::arity <= 2, "handler takes at most an input and the shared state");

    auto endpoint = [fn = std::move(fn)](http::Request &req, const State &state) -> http::Response {
        http::Response rejection(400);
        std::optional<In> input = In::from_request(req, rejection);
        if (!input) {
            return rejection;
        }
        if constexpr (traits::arity == 0) {
            return detail::to_response(fn());
        } else if constexpr (traits::arity == 1) {
            return detail::to_response(fn(std::move(*input)));
        } else {
            return detail::to_response(fn(std::move(*input), state));
        }
    };

    return OperationHandler<State>(std::move(endpoint),
                                   std::make_shared<InputAdapter<In>>(),
                                   std::make_shared<OutputAdapter<Out>>());
}

/**
 * @brief Returns `handler` unchanged if it already is an `OperationHandler`, otherwise
 *        builds one with `make_handler()`.
 */
template <typename State, typename H>
OperationHandler<State> to_operation_handler(H &&handler) {
    if constexpr (detail::is_operation_handler<std::decay_t<H>>::value) {
        static_assert(std::is_same_v<std::decay_t<H>, OperationHandler<State>>,
                      "OperationHandler state type does not match the router state type");
        return std::forward<H>(handler);
    } else {
        return make_handler<State>(std::forward<H>(handler));
    }
}

} // namespace qb::apidoc
