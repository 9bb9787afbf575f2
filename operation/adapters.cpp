#include "adapters.h"

#include <algorithm>
#include <cerrno>

namespace qb::apidoc::detail {

namespace {

bool is_required(const qb::json &schema, const std::string &name) {
    if (!schema.contains("required") || !schema["required"].is_array()) {
        return false;
    }
    const auto &required = schema["required"];
    return std::find(required.begin(), required.end(), name) != required.end();
}

std::optional<qb::json> convert_field(const std::string &raw, const qb::json &property) {
    const std::string type = property.is_object() ? property.value("type", "string") : "string";

    if (type == "integer") {
        if (raw.empty()) {
            return std::nullopt;
        }
        char *end = nullptr;
        errno = 0;
        long long v = std::strtoll(raw.c_str(), &end, 10);
        if (errno != 0 || *end != '\0') {
            return std::nullopt;
        }
        return qb::json(v);
    }
    if (type == "number") {
        if (raw.empty()) {
            return std::nullopt;
        }
        char *end = nullptr;
        errno = 0;
        double v = std::strtod(raw.c_str(), &end);
        if (errno != 0 || *end != '\0') {
            return std::nullopt;
        }
        return qb::json(v);
    }
    if (type == "boolean") {
        if (raw == "true" || raw == "1") {
            return qb::json(true);
        }
        if (raw == "false" || raw == "0") {
            return qb::json(false);
        }
        return std::nullopt;
    }
    return qb::json(raw);
}

} // anonymous namespace

std::vector<qb::json> parameters_from_schema(const qb::json &schema, const std::string &in) {
    std::vector<qb::json> out;
    if (!schema.is_object() || !schema.contains("properties")) {
        return out;
    }

    for (const auto &[name, property] : schema["properties"].items()) {
        const std::string description =
            property.is_object() ? property.value("description", "") : std::string();
        out.push_back(openapi::make_parameter(name, in, property, is_required(schema, name), description));
    }
    return out;
}

std::optional<qb::json> fields_to_json(const http::FieldMap &fields, const qb::json &schema) {
    qb::json out = qb::json::object();
    const bool typed = schema.is_object() && schema.contains("properties");

    for (const auto &[name, raw] : fields) {
        if (!typed || !schema["properties"].contains(name)) {
            out[name] = raw;
            continue;
        }
        auto value = convert_field(raw, schema["properties"][name]);
        if (!value) {
            return std::nullopt;
        }
        out[name] = std::move(*value);
    }
    return out;
}

openapi::Response bad_request_response(const std::string &what) {
    return openapi::Response::with_schema("Invalid " + what, "text/plain", {{"type", "string"}});
}

} // namespace qb::apidoc::detail
