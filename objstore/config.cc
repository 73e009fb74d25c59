/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "objstore/config.hh"

#include <stdexcept>
#include <string>
#include <boost/lexical_cast.hpp>
#include <yaml-cpp/yaml.h>

#include "objstore/client_helpers/part_buffer.hh"
#include "objstore/http.hh"
#include "objstore/object_storage.hh"

using namespace std::string_literals;

namespace objstore {

static std::optional<seastar::sstring> get_opt_string(const YAML::Node& node, const char* key) {
    auto tmp = node[key];
    if (!tmp) {
        return std::nullopt;
    }
    return seastar::sstring(tmp.as<std::string>());
}

endpoint_config endpoint_config::decode(const YAML::Node& node) {
    if (!node || !node.IsMap()) {
        throw std::invalid_argument("Endpoint configuration must be a map");
    }
    auto name = node["name"];
    if (!name) {
        throw std::invalid_argument(fmt::format("Endpoint configuration has no name: {}", boost::lexical_cast<std::string>(node)));
    }

    endpoint_config ep;
    auto endpoint = name.as<std::string>();
    if (endpoint.find("://") != std::string::npos) {
        auto url = http_utils::parse_simple_url(endpoint);
        if (!url.path.empty() && url.path != "/") {
            throw std::invalid_argument(fmt::format("Endpoint {} must not have a path", endpoint));
        }
        ep.host = url.host;
        ep.port = url.port;
        ep.use_https = url.is_https();
    } else {
        // bare host name, port and scheme given separately
        ep.host = endpoint;
        ep.use_https = node["https"].as<bool>(false);
        ep.port = node["port"].as<unsigned>(ep.use_https ? 443 : 80);
    }
    if (auto max_conn = node["max_connections"]) {
        ep.max_connections = max_conn.as<unsigned>();
        if (*ep.max_connections == 0) {
            throw std::invalid_argument("max_connections must be positive");
        }
    }
    return ep;
}

upload_request_config upload_request_config::decode(const YAML::Node& node) {
    upload_request_config cfg;
    if (!node) {
        return cfg;
    }
    if (!node.IsMap()) {
        throw std::invalid_argument("Upload request configuration must be a map");
    }
    cfg.acl = get_opt_string(node, "acl");
    cfg.content_type = get_opt_string(node, "content_type");
    cfg.grant_full_control = get_opt_string(node, "grant_full_control");
    cfg.grant_read = get_opt_string(node, "grant_read");
    cfg.grant_read_acp = get_opt_string(node, "grant_read_acp");
    cfg.grant_write_acp = get_opt_string(node, "grant_write_acp");
    cfg.server_side_encryption = get_opt_string(node, "server_side_encryption");
    cfg.sse_customer_algorithm = get_opt_string(node, "sse_customer_algorithm");
    cfg.sse_customer_key = get_opt_string(node, "sse_customer_key");
    cfg.sse_customer_key_md5 = get_opt_string(node, "sse_customer_key_md5");
    cfg.ssekms_encryption_context = get_opt_string(node, "ssekms_encryption_context");
    cfg.ssekms_key_id = get_opt_string(node, "ssekms_key_id");
    cfg.request_payer = get_opt_string(node, "request_payer");
    return cfg;
}

void validate_transmit_size(size_t size) {
    if (size == 0) {
        throw std::invalid_argument("Transmit size must be positive");
    }
}

objstore_config objstore_config::decode(const YAML::Node& node) {
    objstore_config cfg;
    cfg.endpoint = endpoint_config::decode(node["endpoint"]);
    cfg.bucket = node["bucket"].as<std::string>(""s);
    cfg.min_part_size = node["min_part_size"].as<size_t>(aws_minimum_part_size);
    validate_min_part_size(cfg.min_part_size);
    cfg.transmit_size = node["transmit_size"].as<size_t>(default_transmit_size);
    validate_transmit_size(cfg.transmit_size);
    cfg.request = upload_request_config::decode(node["request"]);
    return cfg;
}

objstore_config objstore_config::load(const std::filesystem::path& path) {
    YAML::Node node;
    try {
        node = YAML::LoadFile(path.native());
    } catch (const YAML::Exception& e) {
        throw std::invalid_argument(fmt::format("Cannot load {}: {}", path.native(), e.what()));
    }
    return decode(node);
}

} // namespace objstore
