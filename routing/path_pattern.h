/**
 * @file qbm/apidoc/routing/path_pattern.h
 * @brief Route path patterns with named parameter segments.
 *
 * A pattern is a `/`-separated path whose segments are either static text or a named
 * parameter written `:name` or `{name}`. Leading and trailing slashes and empty segments
 * are ignored, so `/users/:id/` and `users/{id}` denote the same pattern.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#pragma once

#include "../http/message.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace qb::apidoc {

class PathPattern {
public:
    enum class SegmentType {
        STATIC,   ///< Exact text, e.g. "users".
        PARAMETER ///< Named parameter, e.g. ":id" or "{id}".
    };

    struct Segment {
        SegmentType type;
        std::string text; ///< Static text, or the parameter name.
    };

private:
    std::vector<Segment> _segments;

public:
    /**
     * @brief Parses a pattern.
     * @throws std::invalid_argument if a parameter segment has an empty name.
     */
    explicit PathPattern(std::string_view pattern);

    [[nodiscard]] const std::vector<Segment> &segments() const noexcept { return _segments; }

    /** @brief Parameter names, in path order. */
    [[nodiscard]] std::vector<std::string> parameter_names() const;

    [[nodiscard]] std::size_t parameter_count() const noexcept;

    /**
     * @brief Matches a request path, capturing parameter values.
     * @param path Request path without query string.
     * @param params Receives captured parameters; left untouched on mismatch.
     * @return `true` on match.
     */
    bool match(std::string_view path, http::FieldMap &params) const;

    /** @brief The pattern in OpenAPI form: leading slash, parameters as `{name}`. */
    [[nodiscard]] std::string openapi_path() const;

    bool operator==(const PathPattern &rhs) const;
    bool operator!=(const PathPattern &rhs) const { return !(*this == rhs); }
};

/** @brief Splits a path into its non-empty `/`-separated segments. */
[[nodiscard]] std::vector<std::string_view> split_path(std::string_view path);

} // namespace qb::apidoc
