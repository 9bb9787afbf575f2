/**
 * @file qbm/apidoc/types.h
 * @brief Core enumerations and value types shared by the qbm-apidoc module.
 *
 * This file defines the closed set of documented HTTP methods (`Method`), the canonical
 * order in which they are emitted into a generated document, the `OutcomeKey` used to
 * address a documented response (an explicit status code or the "default" slot), and the
 * `NoState` placeholder used when a router carries no shared application state.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup ApiDoc
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace qb::apidoc {

/**
 * @brief HTTP methods that can carry a documented operation.
 *
 * This is exactly the set of fields an OpenAPI Path Item Object may hold an Operation
 * Object for. Any other method value reaching the documentation layer is a defect.
 */
enum class Method : uint8_t {
    GET,
    POST,
    PUT,
    PATCH,
    DEL, ///< DELETE method. "DEL" is used to stay clear of the DELETE macro some platform headers define.
    HEAD,
    OPTIONS,
    TRACE
};

/** @brief Number of methods in the closed `Method` set. */
inline constexpr std::size_t METHOD_COUNT = 8;

/**
 * @brief Canonical emission order (OpenAPI Path Item field order).
 *
 * Every place that iterates over documented methods uses this order, never insertion
 * order, so that generated output is stable.
 */
inline constexpr std::array<Method, METHOD_COUNT> CANONICAL_METHODS = {
    Method::GET,     Method::PUT,  Method::POST,  Method::DEL,
    Method::OPTIONS, Method::HEAD, Method::PATCH, Method::TRACE};

/**
 * @brief Checks that a `Method` value belongs to the closed set.
 * @param m Method value, possibly produced by an unchecked cast.
 * @return `true` if `m` is one of the eight known methods.
 */
[[nodiscard]] constexpr bool is_known_method(Method m) noexcept {
    return static_cast<uint8_t>(m) < METHOD_COUNT;
}

/**
 * @brief Converts a method to its wire representation ("GET", "POST", ...).
 * @return The upper-case name, or "UNKNOWN_METHOD" for values outside the set.
 */
[[nodiscard]] inline std::string method_to_string(Method m) noexcept {
    switch (m) {
        case Method::GET:     return "GET";
        case Method::POST:    return "POST";
        case Method::PUT:     return "PUT";
        case Method::PATCH:   return "PATCH";
        case Method::DEL:     return "DELETE";
        case Method::HEAD:    return "HEAD";
        case Method::OPTIONS: return "OPTIONS";
        case Method::TRACE:   return "TRACE";
        default:              return "UNKNOWN_METHOD";
    }
}

/**
 * @brief Converts a method to its OpenAPI Path Item field name ("get", "post", ...).
 * @return The lower-case field name, or an empty string for values outside the set.
 */
[[nodiscard]] std::string method_key(Method m);

/**
 * @brief Parses a method name, case-insensitively.
 * @param name Method name such as "get" or "DELETE".
 * @return The method, or `std::nullopt` if `name` is not one of the eight documented methods.
 */
[[nodiscard]] std::optional<Method> method_from_string(std::string_view name);

/**
 * @brief Identifies the response slot a documented response occupies.
 *
 * Either an explicit numeric status code or the "default" sentinel, which in OpenAPI
 * describes every status not otherwise listed.
 */
class OutcomeKey {
    std::optional<uint16_t> _status;

    explicit OutcomeKey(std::optional<uint16_t> status) noexcept : _status(status) {}

public:
    /** @brief Key for an explicit status code. */
    [[nodiscard]] static OutcomeKey status(uint16_t code) noexcept { return OutcomeKey(code); }

    /** @brief Key for the "default" response slot. */
    [[nodiscard]] static OutcomeKey fallback() noexcept { return OutcomeKey(std::nullopt); }

    [[nodiscard]] bool is_default() const noexcept { return !_status.has_value(); }
    [[nodiscard]] std::optional<uint16_t> code() const noexcept { return _status; }

    /** @brief OpenAPI response map key: "200", "404", ... or "default". */
    [[nodiscard]] std::string to_string() const {
        return _status ? std::to_string(*_status) : std::string("default");
    }

    bool operator==(const OutcomeKey &other) const noexcept { return _status == other._status; }
    bool operator!=(const OutcomeKey &other) const noexcept { return !(*this == other); }
};

/**
 * @brief Placeholder state type for routers that do not need shared application state.
 */
struct NoState {};

} // namespace qb::apidoc
