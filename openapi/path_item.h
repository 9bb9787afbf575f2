/**
 * @file qbm/apidoc/openapi/path_item.h
 * @brief Path fragment: one optional operation slot per documented method.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup OpenAPI
 */
#pragma once

#include "./operation.h"
#include "../types.h"

#include <qb/json.h>
#include <array>
#include <optional>
#include <string>

namespace qb::apidoc::openapi {

/**
 * @brief Documentation for all methods of one path (OpenAPI Path Item Object).
 *
 * A `PathItem` is produced by draining an `ApiMethodRouter` and is then inserted into
 * the document under its path string.
 */
class PathItem {
    std::array<std::optional<Operation>, METHOD_COUNT> _operations;

public:
    std::string summary;
    std::string description;
    qb::json parameters = qb::json::array(); ///< Parameters shared by every operation of the path.

    /**
     * @brief Accesses the slot for a method.
     * @throws std::logic_error if `m` is outside the closed method set. Such a value can only
     *         come from code that bypassed the normal registration path.
     */
    [[nodiscard]] std::optional<Operation> &slot(Method m);
    [[nodiscard]] const std::optional<Operation> &slot(Method m) const;

    /** @brief Places `op` in the slot for `m`, replacing any previous operation. */
    void set(Method m, Operation op);

    /** @brief Empties the slot for `m`. @return `true` if it held an operation. */
    bool erase(Method m);

    /** @brief Returns the operation documented for `m`, or `nullptr`. */
    [[nodiscard]] const Operation *get(Method m) const;

    /** @brief `true` if no method slot holds an operation. */
    [[nodiscard]] bool empty() const noexcept;

    /** @brief Number of occupied method slots. */
    [[nodiscard]] std::size_t size() const noexcept;

    /**
     * @brief Moves every occupied slot of `other` into this item.
     *
     * A method present in both is overwritten by `other`'s operation.
     * @return Number of methods that were overwritten.
     */
    std::size_t merge(PathItem &&other);

    /** @brief Serialises to an OpenAPI Path Item Object, methods in canonical order. */
    [[nodiscard]] qb::json to_json() const;
};

} // namespace qb::apidoc::openapi
