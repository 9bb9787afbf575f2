#include "operation.h"

#include <algorithm>
#include <stdexcept>

namespace qb::apidoc::openapi {

bool Operation::add_parameter(qb::json parameter) {
    if (!parameter.is_object() || !parameter.contains("name") || !parameter.contains("in")) {
        throw std::invalid_argument("Operation::add_parameter: parameter requires \"name\" and \"in\".");
    }

    const auto name = parameter["name"].get<std::string>();
    const auto in = parameter["in"].get<std::string>();
    if (find_parameter(name, in)) {
        return false;
    }

    _parameters.push_back(std::move(parameter));
    return true;
}

const qb::json *Operation::find_parameter(const std::string &name, const std::string &in) const {
    auto it = std::find_if(_parameters.begin(), _parameters.end(), [&](const qb::json &p) {
        return p.value("name", "") == name && p.value("in", "") == in;
    });
    return it != _parameters.end() ? &*it : nullptr;
}

bool Operation::set_request_body(qb::json body) {
    if (request_body) {
        return false;
    }
    request_body = std::move(body);
    return true;
}

void Operation::add_tag(const std::string &tag) {
    if (std::find(tags.begin(), tags.end(), tag) == tags.end()) {
        tags.push_back(tag);
    }
}

qb::json Operation::to_json() const {
    qb::json op = qb::json::object();

    if (!tags.empty()) {
        op["tags"] = tags;
    }
    if (!summary.empty()) {
        op["summary"] = summary;
    }
    if (!description.empty()) {
        op["description"] = description;
    }
    if (!operation_id.empty()) {
        op["operationId"] = operation_id;
    }
    if (!_parameters.empty()) {
        op["parameters"] = qb::json::array();
        for (const auto &p : _parameters) {
            op["parameters"].push_back(p);
        }
    }
    if (request_body) {
        op["requestBody"] = *request_body;
    }

    // OpenAPI requires "responses"; an operation with nothing documented still emits {}
    op["responses"] = responses.to_json();

    if (deprecated) {
        op["deprecated"] = true;
    }
    if (!security.empty()) {
        op["security"] = security;
    }
    for (auto it = extensions.begin(); it != extensions.end(); ++it) {
        op[it.key()] = it.value();
    }
    return op;
}

qb::json make_parameter(const std::string &name, const std::string &in, qb::json schema,
                        bool required, const std::string &description) {
    qb::json param = {
        {"name", name},
        {"in", in},
        {"required", in == "path" ? true : required},
        {"schema", std::move(schema)}
    };
    if (!description.empty()) {
        param["description"] = description;
    }
    return param;
}

} // namespace qb::apidoc::openapi
