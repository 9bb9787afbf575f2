/**
 * @file qbm/apidoc/openapi/response.h
 * @brief Documented response value (OpenAPI Response Object).
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup OpenAPI
 */
#pragma once

#include <qb/json.h>
#include <string>
#include <utility>

namespace qb::apidoc::openapi {

/**
 * @brief A documented response for one outcome of an operation.
 */
struct Response {
    std::string description;
    qb::json content = qb::json::object();    ///< media type -> Media Type Object
    qb::json headers = qb::json::object();    ///< header name -> Header Object
    qb::json extensions = qb::json::object(); ///< "x-..." fields copied verbatim

    Response() = default;
    explicit Response(std::string desc) : description(std::move(desc)) {}

    /**
     * @brief Builds a response whose body is described by a schema under one media type.
     * @param desc Response description.
     * @param media_type Media type key, e.g. "application/json".
     * @param schema Schema Object for the body.
     */
    static Response with_schema(std::string desc, const std::string &media_type, qb::json schema);

    /**
     * @brief Adds or replaces the schema for a media type.
     * @return Reference to this response for chaining.
     */
    Response &media(const std::string &media_type, qb::json schema);

    /**
     * @brief Adds a documented response header.
     * @return Reference to this response for chaining.
     */
    Response &header(const std::string &name, qb::json schema, const std::string &desc = "");

    /** @brief Serialises to an OpenAPI Response Object. */
    [[nodiscard]] qb::json to_json() const;

    bool operator==(const Response &rhs) const {
        return description == rhs.description && content == rhs.content &&
               headers == rhs.headers && extensions == rhs.extensions;
    }
    bool operator!=(const Response &rhs) const { return !(*this == rhs); }
};

} // namespace qb::apidoc::openapi
