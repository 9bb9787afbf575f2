#include "types.h"

#include <qb/system/container/unordered_map.h> // For qb::icase_unordered_map

namespace qb::apidoc {

namespace {

const qb::icase_unordered_map<Method> &string_to_method_map() {
    static const qb::icase_unordered_map<Method> map = {
        {"GET", Method::GET},
        {"POST", Method::POST},
        {"PUT", Method::PUT},
        {"PATCH", Method::PATCH},
        {"DELETE", Method::DEL},
        {"HEAD", Method::HEAD},
        {"OPTIONS", Method::OPTIONS},
        {"TRACE", Method::TRACE}
    };
    return map;
}

} // anonymous namespace

std::string method_key(Method m) {
    switch (m) {
        case Method::GET:     return "get";
        case Method::POST:    return "post";
        case Method::PUT:     return "put";
        case Method::PATCH:   return "patch";
        case Method::DEL:     return "delete";
        case Method::HEAD:    return "head";
        case Method::OPTIONS: return "options";
        case Method::TRACE:   return "trace";
        default:              return {};
    }
}

std::optional<Method> method_from_string(std::string_view name) {
    const auto &map = string_to_method_map();
    auto it = map.find(std::string(name));
    if (it == map.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace qb::apidoc
