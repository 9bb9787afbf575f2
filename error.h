/**
 * @file qbm/apidoc/error.h
 * @brief Documentation errors reported during a generation pass.
 *
 * These errors describe problems with the generated documentation only. They are
 * accumulated by the `GenContext` and never abort route registration or dispatch.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup ApiDoc
 */
#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace qb::apidoc {

/**
 * @brief Kinds of documentation errors.
 */
enum class ErrorKind {
    InferredResponseConflict,        ///< Two inferences claimed the same explicit status code.
    InferredDefaultResponseConflict, ///< Two inferences claimed the "default" response.
    DuplicateParameter,              ///< An input adapter declared the same parameter twice.
    DuplicateRequestBody,            ///< An input adapter declared a second request body.
    Other                            ///< Any other issue raised by an adapter or transform.
};

/**
 * @brief A single documentation error.
 */
struct Error {
    ErrorKind kind;
    std::optional<uint16_t> status; ///< Outcome status for response conflicts.
    std::string message;

    Error(ErrorKind k, std::string msg, std::optional<uint16_t> code = std::nullopt)
        : kind(k), status(code), message(std::move(msg)) {}

    [[nodiscard]] static Error inferred_response_conflict(uint16_t status);
    [[nodiscard]] static Error inferred_default_response_conflict();
    [[nodiscard]] static Error duplicate_parameter(const std::string &name, const std::string &in);
    [[nodiscard]] static Error duplicate_request_body();
    [[nodiscard]] static Error other(std::string message);

    bool operator==(const Error &rhs) const noexcept {
        return kind == rhs.kind && status == rhs.status && message == rhs.message;
    }
};

/** @brief Returns a short name for an error kind, e.g. "InferredResponseConflict". */
[[nodiscard]] const char *error_kind_name(ErrorKind kind) noexcept;

std::ostream &operator<<(std::ostream &os, const Error &error);

} // namespace qb::apidoc
