/**
 * @file qbm/apidoc/openapi/operation.h
 * @brief The Operation record: accumulated documentation for one method on one path.
 *
 * An `Operation` is created fresh for every route registration, populated by the
 * handler's input and output adapters, optionally edited by a transform, and then moved
 * into the method router's per-method store until it is drained into a `PathItem`.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup OpenAPI
 */
#pragma once

#include "./responses.h"

#include <qb/json.h>
#include <optional>
#include <string>
#include <vector>

namespace qb::apidoc::openapi {

/**
 * @brief Documentation for a single operation (OpenAPI Operation Object).
 */
class Operation {
public:
    std::string operation_id;
    std::string summary;
    std::string description;
    std::vector<std::string> tags;
    bool deprecated = false;
    std::optional<qb::json> request_body;      ///< Request Body Object
    qb::json security = qb::json::array();     ///< Security Requirement Objects
    qb::json extensions = qb::json::object();  ///< "x-..." fields copied verbatim
    Responses responses;

private:
    std::vector<qb::json> _parameters; ///< Parameter Objects, unique by (name, in)

public:
    /**
     * @brief Adds a parameter unless one with the same name and location exists.
     * @param parameter OpenAPI Parameter Object; must contain "name" and "in".
     * @return `false` if a parameter with the same (name, in) is already declared.
     * @throws std::invalid_argument if `parameter` lacks "name" or "in".
     */
    bool add_parameter(qb::json parameter);

    /** @brief Finds a parameter by name and location. @return `nullptr` if absent. */
    [[nodiscard]] const qb::json *find_parameter(const std::string &name, const std::string &in) const;

    [[nodiscard]] const std::vector<qb::json> &parameters() const noexcept { return _parameters; }

    /**
     * @brief Sets the request body unless one is already declared.
     * @return `false` if a request body was already present (it is kept).
     */
    bool set_request_body(qb::json body);

    /** @brief Adds a tag unless already present. */
    void add_tag(const std::string &tag);

    /** @brief Serialises to an OpenAPI Operation Object. */
    [[nodiscard]] qb::json to_json() const;
};

/**
 * @brief Builds a path/query/header/cookie Parameter Object.
 * @param name Parameter name.
 * @param in Location: "path", "query", "header" or "cookie".
 * @param schema Schema Object of the parameter value.
 * @param required Whether the parameter is required (always true for "path").
 * @param description Optional description.
 */
[[nodiscard]] qb::json make_parameter(const std::string &name, const std::string &in, qb::json schema,
                                      bool required = false, const std::string &description = "");

} // namespace qb::apidoc::openapi
