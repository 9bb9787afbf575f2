/**
 * @file qbm/apidoc/openapi/responses.h
 * @brief Response registry of an operation, with conflict detection on insertion.
 *
 * The registry maps each outcome key (an explicit status code, or "default") to at most
 * one documented response. Responses produced by inference are inserted through
 * `insert_inferred()`, which never silently overwrites: a second write to an occupied key
 * is reported back as a conflict. The single exception is precedence of early responses
 * (known before the handler body runs, e.g. request validation failures) over responses
 * inferred from the handler's return type.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup OpenAPI
 */
#pragma once

#include "./response.h"
#include "../error.h"
#include "../types.h"

#include <qb/json.h>
#include <cstddef>
#include <map>
#include <optional>
#include <vector>

namespace qb::apidoc::openapi {

/**
 * @brief Where a registered response came from.
 */
enum class ResponseSource {
    Explicit, ///< Set by the caller (transform or direct edit).
    Output,   ///< Inferred from the handler's output type.
    Early     ///< Inferred from the handler's input type, before the handler body runs.
};

/**
 * @brief Outcome of `Responses::insert_inferred()`.
 */
struct InsertResult {
    bool inserted = false;         ///< The response is now stored under the key.
    bool replaced = false;         ///< An existing output-inferred response was overridden.
    std::optional<Error> conflict; ///< Set when the key was occupied and nothing was written.

    [[nodiscard]] explicit operator bool() const noexcept { return inserted; }
};

/**
 * @brief Per-operation mapping from outcome key to documented response.
 */
class Responses {
public:
    struct Entry {
        Response response;
        ResponseSource source;
    };

private:
    std::map<uint16_t, Entry> _responses; ///< Ordered by status for stable output.
    std::optional<Entry> _default;

    [[nodiscard]] const Entry *entry(const OutcomeKey &key) const;

public:
    /**
     * @brief Inserts an inferred response.
     *
     * - Unoccupied key: the response is stored.
     * - Key held by an `Output` entry and `source == Early`: the early response replaces it.
     * - Any other occupied key: nothing is written and `conflict` is set to
     *   `InferredResponseConflict(status)` or `InferredDefaultResponseConflict`.
     *
     * @param key Outcome key to insert under.
     * @param response Documented response.
     * @param source Inference source, `Output` or `Early`.
     * @return What happened; the caller is expected to report `conflict` if present.
     */
    InsertResult insert_inferred(const OutcomeKey &key, Response response, ResponseSource source);

    /**
     * @brief Stores an explicit response, replacing whatever the key held.
     */
    void set(const OutcomeKey &key, Response response);

    /** @brief Removes the response under `key`. @return `true` if something was removed. */
    bool remove(const OutcomeKey &key);

    [[nodiscard]] bool contains(const OutcomeKey &key) const { return entry(key) != nullptr; }

    /** @brief Returns the response under `key`, or `nullptr`. */
    [[nodiscard]] const Response *find(const OutcomeKey &key) const;

    /** @brief Returns the source of the response under `key`, if any. */
    [[nodiscard]] std::optional<ResponseSource> source(const OutcomeKey &key) const;

    /** @brief Explicit status codes present, ascending. */
    [[nodiscard]] std::vector<uint16_t> status_codes() const;

    [[nodiscard]] bool has_default() const noexcept { return _default.has_value(); }

    /** @brief Number of stored responses, including the default one. */
    [[nodiscard]] std::size_t size() const noexcept {
        return _responses.size() + (_default ? 1 : 0);
    }

    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

    /** @brief Serialises to an OpenAPI Responses Object. */
    [[nodiscard]] qb::json to_json() const;
};

} // namespace qb::apidoc::openapi
