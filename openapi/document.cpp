#include "document.h"
#include "../logger.h"

namespace qb::apidoc::openapi {

DocumentGenerator::DocumentGenerator(const std::string &title_, const std::string &version_,
                                     const std::string &description_) {
    title(title_);
    version(version_);
    if (!description_.empty()) {
        description(description_);
    }
}

DocumentGenerator &DocumentGenerator::title(const std::string &title) {
    _info["title"] = title;
    return *this;
}

DocumentGenerator &DocumentGenerator::version(const std::string &version) {
    _info["version"] = version;
    return *this;
}

DocumentGenerator &DocumentGenerator::description(const std::string &description) {
    _info["description"] = description;
    return *this;
}

DocumentGenerator &DocumentGenerator::contact(const std::string &name, const std::string &email,
                                              const std::string &url) {
    qb::json contact = qb::json::object();
    if (!name.empty()) {
        contact["name"] = name;
    }
    if (!email.empty()) {
        contact["email"] = email;
    }
    if (!url.empty()) {
        contact["url"] = url;
    }
    if (!contact.empty()) {
        _info["contact"] = contact;
    }
    return *this;
}

DocumentGenerator &DocumentGenerator::license(const std::string &name, const std::string &url) {
    qb::json license = qb::json::object();
    if (!name.empty()) {
        license["name"] = name;
    }
    if (!url.empty()) {
        license["url"] = url;
    }
    if (!license.empty()) {
        _info["license"] = license;
    }
    return *this;
}

DocumentGenerator &DocumentGenerator::add_server(const std::string &url, const std::string &description) {
    qb::json server = {{"url", url}};
    if (!description.empty()) {
        server["description"] = description;
    }
    _servers.push_back(server);
    return *this;
}

DocumentGenerator &DocumentGenerator::add_bearer_auth(const std::string &name, const std::string &scheme,
                                                      const std::string &bearer_format) {
    qb::json security_scheme = {
        {"type", "http"},
        {"scheme", scheme}
    };
    if (!bearer_format.empty()) {
        security_scheme["bearerFormat"] = bearer_format;
    }
    _components["securitySchemes"][name] = security_scheme;
    return *this;
}

DocumentGenerator &DocumentGenerator::add_api_key_auth(const std::string &name, const std::string &in,
                                                       const std::string &param_name) {
    _components["securitySchemes"][name] = {
        {"type", "apiKey"},
        {"in", in},
        {"name", param_name}
    };
    return *this;
}

DocumentGenerator &DocumentGenerator::add_tag(const std::string &name, const std::string &description) {
    for (const auto &existing : _tags) {
        if (existing["name"] == name) {
            return *this;
        }
    }

    qb::json tag = {{"name", name}};
    if (!description.empty()) {
        tag["description"] = description;
    }
    _tags.push_back(tag);
    return *this;
}

DocumentGenerator &DocumentGenerator::add_schema(const std::string &name, const qb::json &schema) {
    _components["schemas"][name] = schema;
    return *this;
}

DocumentGenerator &DocumentGenerator::add_path_item(const std::string &path, PathItem item) {
    if (_path_specs.contains(path)) {
        LOG_APIDOC_WARN("DocumentGenerator: path item replaces hand-written specification for " << path);
        _path_specs.erase(path);
    }

    auto it = _items.find(path);
    if (it == _items.end()) {
        _items.emplace(path, std::move(item));
        return *this;
    }

    auto overwritten = it->second.merge(std::move(item));
    if (overwritten) {
        LOG_APIDOC_WARN("DocumentGenerator: " << overwritten << " operation(s) overwritten on " << path);
    }
    return *this;
}

DocumentGenerator &DocumentGenerator::add_path_specification(const std::string &path,
                                                             const qb::json &path_spec) {
    _items.erase(path);
    _path_specs[path] = path_spec;
    return *this;
}

const PathItem *DocumentGenerator::path_item(const std::string &path) const {
    auto it = _items.find(path);
    return it != _items.end() ? &it->second : nullptr;
}

qb::json DocumentGenerator::paths() const {
    qb::json paths = qb::json::object();
    for (const auto &[path, item] : _items) {
        paths[path] = item.to_json();
    }
    for (auto it = _path_specs.begin(); it != _path_specs.end(); ++it) {
        paths[it.key()] = it.value();
    }
    return paths;
}

qb::json DocumentGenerator::generate_document() const {
    qb::json doc = {
        {"openapi", OPENAPI_VERSION},
        {"info", _info},
        {"paths", paths()}
    };
    if (!_servers.empty()) {
        doc["servers"] = _servers;
    }
    if (!_tags.empty()) {
        doc["tags"] = _tags;
    }
    if (!_components.empty()) {
        doc["components"] = _components;
    }
    return doc;
}

std::string DocumentGenerator::generate_json(bool pretty) const {
    qb::json doc = generate_document();
    return pretty ? doc.dump(4) : doc.dump();
}

} // namespace qb::apidoc::openapi
