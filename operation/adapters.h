/**
 * @file qbm/apidoc/operation/adapters.h
 * @brief Ready-made handler input extractors and output types that document themselves.
 *
 * Data types used with these adapters describe themselves with a
 * `static qb::json json_schema()` member and convert from/to `qb::json` through the
 * usual `from_json` / `to_json` overloads. The schema is taken as given; this module does
 * not derive schemas from C++ types.
 *
 * Inputs:
 * - `Json<T>`:   request body `application/json`.
 * - `Path<T>`:   path parameters, one per property of `T`'s object schema.
 * - `Query<T>`:  query parameters, one per property of `T`'s object schema.
 * - `Inputs<Ts...>`: several extractors applied in order.
 *
 * Outputs:
 * - `JsonResponse<T>`: 200 with a JSON body.
 * - `NoContent`:       204 without body.
 * - `Text`:            200 `text/plain`.
 * - `Either<T, E>`:    one of two output types; documents both.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup ApiDoc
 */
#pragma once

#include "./handler.h"
#include "./operation_io.h"
#include "../http/message.h"

#include <qb/json.h>
#include <cstdlib>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>

namespace qb::apidoc {

namespace detail {

/** @brief Builds parameter objects for each property of an object schema. */
std::vector<qb::json> parameters_from_schema(const qb::json &schema, const std::string &in);

/**
 * @brief Converts raw string fields to a JSON object typed after `schema`'s properties.
 * @return `std::nullopt` if a field declared as number/integer/boolean does not parse.
 */
std::optional<qb::json> fields_to_json(const http::FieldMap &fields, const qb::json &schema);

/** @brief The early 400 response shared by the parameter extractors. */
openapi::Response bad_request_response(const std::string &what);

} // namespace detail

/**
 * @brief JSON request body extractor.
 *
 * Rejections: 415 without an `application/json` content type, 400 for malformed JSON,
 * 422 when the JSON does not convert to `T`. They are documented as early responses when
 * the generation context asks for all error responses.
 */
template <typename T>
struct Json {
    T value;

    static std::optional<Json> from_request(const http::Request &req, http::Response &rejection) {
        auto content_type = req.header("Content-Type");
        if (!content_type || content_type->find("application/json") == std::string::npos) {
            rejection = http::Response::text(415, "Expected request with `Content-Type: application/json`");
            return std::nullopt;
        }

        qb::json body;
        try {
            body = qb::json::parse(req.body);
        } catch (const qb::json::parse_error &e) {
            rejection = http::Response::text(400, std::string("Failed to parse the request body as JSON: ") + e.what());
            return std::nullopt;
        }

        try {
            return Json{body.get<T>()};
        } catch (const qb::json::exception &e) {
            rejection = http::Response::text(422, std::string("Failed to deserialize the JSON body: ") + e.what());
            return std::nullopt;
        }
    }

    static void operation_input(GenContext &ctx, openapi::Operation &op) {
        set_request_body(ctx, op, {
            {"content", {{"application/json", {{"schema", T::json_schema()}}}}},
            {"required", true}
        });
    }

    static InferredResponses inferred_early_responses(GenContext &ctx, openapi::Operation &) {
        if (!ctx.all_error_responses()) {
            return {};
        }
        return {
            {OutcomeKey::status(400), openapi::Response::with_schema(
                "The request body is not valid JSON", "text/plain", {{"type", "string"}})},
            {OutcomeKey::status(415), openapi::Response::with_schema(
                "The request is missing the `application/json` content type", "text/plain", {{"type", "string"}})},
            {OutcomeKey::status(422), openapi::Response::with_schema(
                "The request body does not match the expected structure", "text/plain", {{"type", "string"}})}
        };
    }
};

/**
 * @brief Path parameters extractor. Every property of `T`'s schema is a required path parameter.
 */
template <typename T>
struct Path {
    T value;

    static std::optional<Path> from_request(const http::Request &req, http::Response &rejection) {
        auto fields = detail::fields_to_json(req.params, T::json_schema());
        if (!fields) {
            rejection = http::Response::text(400, "Invalid URL: cannot parse path parameters");
            return std::nullopt;
        }
        try {
            return Path{fields->template get<T>()};
        } catch (const qb::json::exception &e) {
            rejection = http::Response::text(400, std::string("Invalid URL: ") + e.what());
            return std::nullopt;
        }
    }

    static void operation_input(GenContext &ctx, openapi::Operation &op) {
        add_parameters(ctx, op, detail::parameters_from_schema(T::json_schema(), "path"));
    }

    static InferredResponses inferred_early_responses(GenContext &ctx, openapi::Operation &) {
        if (!ctx.all_error_responses()) {
            return {};
        }
        return {{OutcomeKey::status(400), detail::bad_request_response("path parameters")}};
    }
};

/**
 * @brief Query string extractor. Required parameters follow the schema's "required" list.
 */
template <typename T>
struct Query {
    T value;

    static std::optional<Query> from_request(const http::Request &req, http::Response &rejection) {
        auto fields = detail::fields_to_json(req.query, T::json_schema());
        if (!fields) {
            rejection = http::Response::text(400, "Failed to deserialize query string");
            return std::nullopt;
        }
        try {
            return Query{fields->template get<T>()};
        } catch (const qb::json::exception &e) {
            rejection = http::Response::text(400, std::string("Failed to deserialize query string: ") + e.what());
            return std::nullopt;
        }
    }

    static void operation_input(GenContext &ctx, openapi::Operation &op) {
        add_parameters(ctx, op, detail::parameters_from_schema(T::json_schema(), "query"));
    }

    static InferredResponses inferred_early_responses(GenContext &ctx, openapi::Operation &) {
        if (!ctx.all_error_responses()) {
            return {};
        }
        return {{OutcomeKey::status(400), detail::bad_request_response("query string")}};
    }
};

/**
 * @brief Applies several extractors in order. The first rejection wins.
 */
template <typename... Ts>
struct Inputs {
    std::tuple<Ts...> values;

    template <std::size_t I>
    auto &get() { return std::get<I>(values); }

    static std::optional<Inputs> from_request(const http::Request &req, http::Response &rejection) {
        std::tuple<std::optional<Ts>...> parts;
        bool ok = extract_all(req, rejection, parts, std::index_sequence_for<Ts...>{});
        if (!ok) {
            return std::nullopt;
        }
        return std::apply([](auto &...p) { return Inputs{std::tuple<Ts...>(std::move(*p)...)}; }, parts);
    }

    static void operation_input(GenContext &ctx, openapi::Operation &op) {
        (InputAdapter<Ts>().operation_input(ctx, op), ...);
    }

    static InferredResponses inferred_early_responses(GenContext &ctx, openapi::Operation &op) {
        InferredResponses out;
        auto append = [&](InferredResponses part) {
            for (auto &r : part) {
                out.push_back(std::move(r));
            }
        };
        (append(InputAdapter<Ts>().inferred_early_responses(ctx, op)), ...);
        return out;
    }

private:
    template <std::size_t... I>
    static bool extract_all(const http::Request &req, http::Response &rejection,
                            std::tuple<std::optional<Ts>...> &parts, std::index_sequence<I...>) {
        bool ok = true;
        // short-circuits on the first failing extractor
        ((ok = ok && (std::get<I>(parts) = Ts::from_request(req, rejection)).has_value()), ...);
        return ok;
    }
};

/**
 * @brief 200 response with `value` serialised as JSON.
 */
template <typename T>
struct JsonResponse {
    T value;
    uint16_t status = 200;

    http::Response into_response() && {
        return http::Response::json(status, qb::json(value));
    }

    static InferredResponses inferred_responses(GenContext &, openapi::Operation &) {
        return {{OutcomeKey::status(200), openapi::Response::with_schema("", "application/json", T::json_schema())}};
    }
};

/**
 * @brief 204 response without body.
 */
struct NoContent {
    http::Response into_response() && { return http::Response::empty(204); }

    static InferredResponses inferred_responses(GenContext &, openapi::Operation &) {
        return {{OutcomeKey::status(204), openapi::Response("no content")}};
    }
};

/**
 * @brief 200 `text/plain` response.
 */
struct Text {
    std::string value;

    http::Response into_response() && { return http::Response::text(200, std::move(value)); }

    static InferredResponses inferred_responses(GenContext &, openapi::Operation &) {
        return {{OutcomeKey::status(200),
                 openapi::Response::with_schema("plain text", "text/plain; charset=utf-8", {{"type", "string"}})}};
    }
};

/**
 * @brief Either of two output types. Documents `T`'s responses, then `E`'s.
 *
 * Both sides claiming the same outcome key is reported as a conflict like any other pair
 * of output-inferred responses.
 */
template <typename T, typename E>
struct Either {
    std::variant<T, E> value;

    Either(T v) : value(std::in_place_index<0>, std::move(v)) {}
    Either(E v) : value(std::in_place_index<1>, std::move(v)) {}

    http::Response into_response() && {
        return std::visit([](auto &&v) { return detail::to_response(std::move(v)); }, std::move(value));
    }

    static InferredResponses inferred_responses(GenContext &ctx, openapi::Operation &op) {
        InferredResponses out = OutputAdapter<T>().inferred_responses(ctx, op);
        for (auto &r : OutputAdapter<E>().inferred_responses(ctx, op)) {
            out.push_back(std::move(r));
        }
        return out;
    }
};

} // namespace qb::apidoc
