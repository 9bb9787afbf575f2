#include "response.h"

namespace qb::apidoc::openapi {

Response Response::with_schema(std::string desc, const std::string &media_type, qb::json schema) {
    Response res(std::move(desc));
    res.media(media_type, std::move(schema));
    return res;
}

Response &Response::media(const std::string &media_type, qb::json schema) {
    content[media_type] = {{"schema", std::move(schema)}};
    return *this;
}

Response &Response::header(const std::string &name, qb::json schema, const std::string &desc) {
    qb::json header = {{"schema", std::move(schema)}};
    if (!desc.empty()) {
        header["description"] = desc;
    }
    headers[name] = std::move(header);
    return *this;
}

qb::json Response::to_json() const {
    // "description" is required by OpenAPI, even when empty
    qb::json res = {{"description", description}};

    if (!content.empty()) {
        res["content"] = content;
    }
    if (!headers.empty()) {
        res["headers"] = headers;
    }
    for (auto it = extensions.begin(); it != extensions.end(); ++it) {
        res[it.key()] = it.value();
    }
    return res;
}

} // namespace qb::apidoc::openapi
