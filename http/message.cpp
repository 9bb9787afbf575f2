#include "message.h"

namespace qb::apidoc::http {

namespace {

template <typename Map>
std::optional<std::string> lookup(const Map &fields, const std::string &key) {
    auto it = fields.find(key);
    if (it == fields.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // anonymous namespace

Request &Request::set_header(const std::string &name, std::string value) {
    headers[name] = std::move(value);
    return *this;
}

std::optional<std::string> Request::header(const std::string &name) const {
    return lookup(headers, name);
}

std::optional<std::string> Request::param(const std::string &name) const {
    return lookup(params, name);
}

Response &Response::set_header(const std::string &name, std::string value) {
    headers[name] = std::move(value);
    return *this;
}

std::optional<std::string> Response::header(const std::string &name) const {
    return lookup(headers, name);
}

Response Response::json(uint16_t code, const qb::json &value) {
    Response res(code, value.dump());
    res.set_header("Content-Type", "application/json");
    return res;
}

Response Response::text(uint16_t code, std::string body) {
    Response res(code, std::move(body));
    res.set_header("Content-Type", "text/plain; charset=utf-8");
    return res;
}

} // namespace qb::apidoc::http
