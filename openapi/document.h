/**
 * @file qbm/apidoc/openapi/document.h
 * @brief OpenAPI 3.0 document assembly.
 *
 * The generator holds the document-level metadata (info, servers, tags, security
 * schemes, schema components) and the Path Item Objects collected from the routers,
 * and serialises them into one OpenAPI document.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup OpenAPI
 */
#pragma once

#include "./path_item.h"

#include <qb/json.h>
#include <map>
#include <string>

namespace qb::apidoc::openapi {

/**
 * @brief OpenAPI document generator
 */
class DocumentGenerator {
public:
    static constexpr const char *OPENAPI_VERSION = "3.0.3";

    /**
     * @brief Constructor with basic API info
     * @param title API title
     * @param version API version
     * @param description API description
     */
    explicit DocumentGenerator(const std::string &title = "API Documentation",
                               const std::string &version = "1.0.0",
                               const std::string &description = "");

    DocumentGenerator &title(const std::string &title);
    DocumentGenerator &version(const std::string &version);
    DocumentGenerator &description(const std::string &description);

    /**
     * @brief Set API contact information. Empty fields are omitted.
     * @return Reference to this generator
     */
    DocumentGenerator &contact(const std::string &name, const std::string &email, const std::string &url);

    /**
     * @brief Set API license information. Empty fields are omitted.
     * @return Reference to this generator
     */
    DocumentGenerator &license(const std::string &name, const std::string &url);

    /**
     * @brief Add a server to the API
     * @param url Server URL
     * @param description Server description
     * @return Reference to this generator
     */
    DocumentGenerator &add_server(const std::string &url, const std::string &description = "");

    /**
     * @brief Add an HTTP bearer security scheme
     * @param name Security scheme name
     * @param scheme Authentication scheme type
     * @param bearer_format Bearer format (e.g., JWT)
     * @return Reference to this generator
     */
    DocumentGenerator &add_bearer_auth(const std::string &name = "bearerAuth",
                                       const std::string &scheme = "bearer",
                                       const std::string &bearer_format = "JWT");

    /**
     * @brief Add an API key security scheme
     * @param name Security scheme name
     * @param in Location of the API key (header, query, cookie)
     * @param param_name Name of the parameter
     * @return Reference to this generator
     */
    DocumentGenerator &add_api_key_auth(const std::string &name, const std::string &in,
                                        const std::string &param_name);

    /**
     * @brief Add API tag. A tag already declared is kept as is.
     * @return Reference to this generator
     */
    DocumentGenerator &add_tag(const std::string &name, const std::string &description = "");

    /**
     * @brief Add a schema definition to the components section
     * @return Reference to this generator
     */
    DocumentGenerator &add_schema(const std::string &name, const qb::json &schema);

    /**
     * @brief Adds a Path Item under `path`.
     *
     * If the path already has operations, `item`'s operations are merged into it; a method
     * present in both is overwritten and a warning is logged.
     * @return Reference to this generator
     */
    DocumentGenerator &add_path_item(const std::string &path, PathItem item);

    /**
     * @brief Add a hand-written Path Item Object, replacing anything stored under `path`.
     * @return Reference to this generator
     */
    DocumentGenerator &add_path_specification(const std::string &path, const qb::json &path_spec);

    /** @brief Path item stored under `path`, or `nullptr`. */
    [[nodiscard]] const PathItem *path_item(const std::string &path) const;

    /** @brief The Paths Object: typed path items and hand-written specifications. */
    [[nodiscard]] qb::json paths() const;

    /**
     * @brief Generate OpenAPI document as JSON object
     */
    [[nodiscard]] qb::json generate_document() const;

    /**
     * @brief Generate OpenAPI document as JSON string
     * @param pretty Whether to pretty-print the JSON
     */
    [[nodiscard]] std::string generate_json(bool pretty = true) const;

private:
    qb::json _info = qb::json::object();
    qb::json _servers = qb::json::array();
    qb::json _components = qb::json::object();
    qb::json _tags = qb::json::array();
    std::map<std::string, PathItem> _items;   ///< Ordered by path for stable output.
    qb::json _path_specs = qb::json::object(); ///< Hand-written Path Item Objects.
};

} // namespace qb::apidoc::openapi
