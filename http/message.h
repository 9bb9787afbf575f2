/**
 * @file qbm/apidoc/http/message.h
 * @brief Minimal request and response messages exchanged with route handlers.
 *
 * Wire parsing and socket transport are outside this module: a server front end builds a
 * `Request` from whatever it received and serialises the returned `Response`. Header
 * names are compared case-insensitively.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Transport
 */
#pragma once

#include "../types.h"

#include <qb/json.h>
#include <qb/system/container/unordered_map.h> // For qb::unordered_map, qb::icase_unordered_map
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace qb::apidoc::http {

using FieldMap = qb::unordered_map<std::string, std::string>;
using HeaderMap = qb::icase_unordered_map<std::string>;

/**
 * @brief An incoming request as seen by a handler.
 */
struct Request {
    Method method = Method::GET;
    std::string path = "/";
    HeaderMap headers; ///< name -> value, case-insensitive
    FieldMap query;   ///< decoded query string parameters
    FieldMap params;  ///< path parameters captured by the path router
    std::string body;

    Request() = default;
    Request(Method m, std::string p, std::string b = "")
        : method(m), path(std::move(p)), body(std::move(b)) {}

    /** @brief Sets or replaces a header. @return Reference to this request. */
    Request &set_header(const std::string &name, std::string value);

    /** @brief Returns a header value, or `std::nullopt`. */
    [[nodiscard]] std::optional<std::string> header(const std::string &name) const;

    /** @brief Returns a path parameter value, or `std::nullopt`. */
    [[nodiscard]] std::optional<std::string> param(const std::string &name) const;
};

/**
 * @brief A response produced by a handler, a middleware or the router itself.
 */
struct Response {
    uint16_t status = 200;
    HeaderMap headers; ///< name -> value, case-insensitive
    std::string body;

    Response() = default;
    explicit Response(uint16_t code, std::string b = "") : status(code), body(std::move(b)) {}

    /** @brief Sets or replaces a header. @return Reference to this response. */
    Response &set_header(const std::string &name, std::string value);

    /** @brief Returns a header value, or `std::nullopt`. */
    [[nodiscard]] std::optional<std::string> header(const std::string &name) const;

    /** @brief `application/json` response with `value` serialised as the body. */
    [[nodiscard]] static Response json(uint16_t code, const qb::json &value);

    /** @brief `text/plain` response. */
    [[nodiscard]] static Response text(uint16_t code, std::string body);

    /** @brief Response with a status and no body. */
    [[nodiscard]] static Response empty(uint16_t code) { return Response(code); }
};

} // namespace qb::apidoc::http
