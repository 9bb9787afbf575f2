/**
 * @file qbm/apidoc/operation/transform.h
 * @brief Fluent editing of an operation record after inference.
 *
 * A transform is any callable taking and returning a `TransformOperation`. The `_with`
 * registration variants invoke it exactly once, after the handler's input and output
 * have documented the operation:
 *
 * @code
 * router.get_with(list_users, [](qb::apidoc::TransformOperation op) {
 *     return op.summary("List users")
 *              .tag("users")
 *              .response(401, "Missing or invalid credentials");
 * });
 * @endcode
 *
 * Transforms only see the documentation; the handler wiring is not reachable from here.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup ApiDoc
 */
#pragma once

#include "./operation_io.h"
#include "../gen/context.h"
#include "../openapi/operation.h"

#include <qb/json.h>
#include <string>
#include <utility>
#include <vector>

namespace qb::apidoc {

class TransformOperation {
    openapi::Operation *_op;
    GenContext *_ctx;
    bool _hidden = false;

public:
    TransformOperation(openapi::Operation &op, GenContext &ctx) : _op(&op), _ctx(&ctx) {}

    TransformOperation &summary(std::string text);
    TransformOperation &description(std::string text);
    TransformOperation &tag(const std::string &name);

    /** @brief Sets the operation id. */
    TransformOperation &id(std::string operation_id);

    TransformOperation &deprecated(bool value = true);

    /**
     * @brief Excludes the operation from the generated document.
     * The handler is still routed; only its documentation record is dropped.
     */
    TransformOperation &hidden(bool value = true);

    /** @brief Adds a security requirement naming a scheme declared on the document. */
    TransformOperation &security_requirement(const std::string &scheme,
                                             const std::vector<std::string> &scopes = {});

    /**
     * @brief Adds a parameter. A duplicate (name, in) is reported to the generation context.
     */
    TransformOperation &parameter(qb::json parameter);

    /** @brief Sets the response for `status`, replacing whatever was inferred. */
    TransformOperation &response(uint16_t status, openapi::Response res);

    /**
     * @brief Sets the response for `status` with a description and an optional JSON body schema.
     */
    TransformOperation &response(uint16_t status, std::string description, qb::json schema = nullptr);

    /** @brief Sets the "default" response, replacing whatever was inferred. */
    TransformOperation &default_response(openapi::Response res);

    /**
     * @brief Applies the documentation of input type `T` explicitly.
     * Useful when the handler reads the request itself. Its early responses are added with
     * the usual precedence and conflict reporting.
     */
    template <typename T>
    TransformOperation &input() {
        InputAdapter<T> adapter;
        adapter.operation_input(*_ctx, *_op);
        for (auto &[key, res] : adapter.inferred_early_responses(*_ctx, *_op)) {
            set_inferred_response(*_ctx, *_op, key, std::move(res), openapi::ResponseSource::Early);
        }
        return *this;
    }

    /** @brief Applies the documented responses of output type `T` explicitly. */
    template <typename T>
    TransformOperation &output() {
        for (auto &[key, res] : OutputAdapter<T>().inferred_responses(*_ctx, *_op)) {
            set_inferred_response(*_ctx, *_op, key, std::move(res), openapi::ResponseSource::Output);
        }
        return *this;
    }

    /** @brief Applies another transform to this operation. */
    template <typename Fn>
    TransformOperation with(Fn &&transform) {
        return std::forward<Fn>(transform)(std::move(*this));
    }

    [[nodiscard]] bool is_hidden() const noexcept { return _hidden; }

    /** @brief The record being edited. */
    [[nodiscard]] openapi::Operation &inner() noexcept { return *_op; }
    [[nodiscard]] GenContext &context() noexcept { return *_ctx; }
};

} // namespace qb::apidoc
