/**
 * @file qbm/apidoc/operation/operation_io.h
 * @brief Capability contracts through which handler input and output types document themselves.
 *
 * A handler's input type contributes the request shape of an operation (parameters,
 * request body) and may list "early" responses: outcomes that occur before the handler
 * body runs, such as a request validation failure. A handler's output type lists the
 * responses the handler itself can produce.
 *
 * The contracts are the `IOperationInput` and `IOperationOutput` interfaces. Concrete
 * input/output types usually provide the same members as statics instead; `InputAdapter`
 * and `OutputAdapter` adapt such a type to the interfaces. A missing static simply means
 * the type contributes nothing for that part.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup ApiDoc
 */
#pragma once

#include "../gen/context.h"
#include "../openapi/operation.h"
#include "../types.h"

#include <qb/json.h>
#include <type_traits>
#include <utility>
#include <vector>

namespace qb::apidoc {

/** @brief One inferred (outcome key, documented response) pair. */
using InferredResponse = std::pair<OutcomeKey, openapi::Response>;
using InferredResponses = std::vector<InferredResponse>;

/**
 * @brief Documentation capability of a handler input type.
 */
class IOperationInput {
public:
    virtual ~IOperationInput() = default;

    /**
     * @brief Populates the request shape (parameters, request body) of `op`.
     */
    virtual void operation_input(GenContext &ctx, openapi::Operation &op) const = 0;

    /**
     * @brief Responses that can be produced before the handler body executes.
     */
    virtual InferredResponses inferred_early_responses(GenContext & /*ctx*/, openapi::Operation & /*op*/) const {
        return {};
    }
};

/**
 * @brief Documentation capability of a handler output type.
 */
class IOperationOutput {
public:
    virtual ~IOperationOutput() = default;

    /**
     * @brief Responses the handler can produce through this output type.
     */
    virtual InferredResponses inferred_responses(GenContext &ctx, openapi::Operation &op) const = 0;
};

namespace detail {

template <typename T, typename = void>
struct has_operation_input : std::false_type {};

template <typename T>
struct has_operation_input<T, std::void_t<decltype(T::operation_input(
    std::declval<GenContext &>(), std::declval<openapi::Operation &>()))>> : std::true_type {};

template <typename T, typename = void>
struct has_inferred_early_responses : std::false_type {};

template <typename T>
struct has_inferred_early_responses<T, std::void_t<decltype(T::inferred_early_responses(
    std::declval<GenContext &>(), std::declval<openapi::Operation &>()))>> : std::true_type {};

template <typename T, typename = void>
struct has_inferred_responses : std::false_type {};

template <typename T>
struct has_inferred_responses<T, std::void_t<decltype(T::inferred_responses(
    std::declval<GenContext &>(), std::declval<openapi::Operation &>()))>> : std::true_type {};

} // namespace detail

/**
 * @brief Adapts the static documentation members of an input type to `IOperationInput`.
 */
template <typename T>
class InputAdapter : public IOperationInput {
public:
    void operation_input(GenContext &ctx, openapi::Operation &op) const override {
        if constexpr (detail::has_operation_input<T>::value) {
            T::operation_input(ctx, op);
        }
    }

    InferredResponses inferred_early_responses(GenContext &ctx, openapi::Operation &op) const override {
        if constexpr (detail::has_inferred_early_responses<T>::value) {
            return T::inferred_early_responses(ctx, op);
        } else {
            return {};
        }
    }
};

/**
 * @brief Adapts the static documentation members of an output type to `IOperationOutput`.
 */
template <typename T>
class OutputAdapter : public IOperationOutput {
public:
    InferredResponses inferred_responses(GenContext &ctx, openapi::Operation &op) const override {
        if constexpr (detail::has_inferred_responses<T>::value) {
            return T::inferred_responses(ctx, op);
        } else {
            return {};
        }
    }
};

/**
 * @brief Adds parameters to `op`, reporting each duplicate (name, in) pair as an error.
 */
void add_parameters(GenContext &ctx, openapi::Operation &op, std::vector<qb::json> parameters);

/**
 * @brief Sets the request body of `op`, reporting a second request body as an error.
 */
void set_request_body(GenContext &ctx, openapi::Operation &op, qb::json body);

/**
 * @brief Inserts one inferred response, reporting a conflict through `ctx`.
 *
 * Follows `openapi::Responses::insert_inferred()`: first write wins, except that an
 * `Early` response overrides an `Output` response at the same key.
 */
void set_inferred_response(GenContext &ctx, openapi::Operation &op, const OutcomeKey &key,
                           openapi::Response response, openapi::ResponseSource source);

/**
 * @brief Runs input and output inference for one route registration.
 *
 * Order: the input populates the request shape; then, if response inference is enabled,
 * the output's responses are inserted, followed by the input's early responses.
 */
void infer_operation(GenContext &ctx, openapi::Operation &op,
                     const IOperationInput &input, const IOperationOutput &output);

} // namespace qb::apidoc
