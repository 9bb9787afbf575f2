#include "transform.h"

namespace qb::apidoc {

TransformOperation &TransformOperation::summary(std::string text) {
    _op->summary = std::move(text);
    return *this;
}

TransformOperation &TransformOperation::description(std::string text) {
    _op->description = std::move(text);
    return *this;
}

TransformOperation &TransformOperation::tag(const std::string &name) {
    _op->add_tag(name);
    return *this;
}

TransformOperation &TransformOperation::id(std::string operation_id) {
    _op->operation_id = std::move(operation_id);
    return *this;
}

TransformOperation &TransformOperation::deprecated(bool value) {
    _op->deprecated = value;
    return *this;
}

TransformOperation &TransformOperation::hidden(bool value) {
    _hidden = value;
    return *this;
}

TransformOperation &TransformOperation::security_requirement(const std::string &scheme,
                                                             const std::vector<std::string> &scopes) {
    qb::json requirement = qb::json::object();
    requirement[scheme] = scopes;
    _op->security.push_back(std::move(requirement));
    return *this;
}

TransformOperation &TransformOperation::parameter(qb::json parameter) {
    add_parameters(*_ctx, *_op, {std::move(parameter)});
    return *this;
}

TransformOperation &TransformOperation::response(uint16_t status, openapi::Response res) {
    _op->responses.set(OutcomeKey::status(status), std::move(res));
    return *this;
}

TransformOperation &TransformOperation::response(uint16_t status, std::string description, qb::json schema) {
    if (schema.is_null()) {
        return response(status, openapi::Response(std::move(description)));
    }
    return response(status, openapi::Response::with_schema(std::move(description), "application/json",
                                                           std::move(schema)));
}

TransformOperation &TransformOperation::default_response(openapi::Response res) {
    _op->responses.set(OutcomeKey::fallback(), std::move(res));
    return *this;
}

} // namespace qb::apidoc
