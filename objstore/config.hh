/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <filesystem>
#include <optional>
#include <fmt/format.h>
#include <seastar/core/shared_ptr.hh>
#include <seastar/core/sstring.hh>

namespace YAML {
class Node;
}

namespace objstore {

struct endpoint_config {
    seastar::sstring host;
    unsigned port = 443;
    bool use_https = true;
    std::optional<unsigned> max_connections;

    static endpoint_config decode(const YAML::Node& node);
};

using endpoint_config_ptr = seastar::lw_shared_ptr<endpoint_config>;

// Object metadata sent with the initiate call. The encryption and payer
// settings also go with every part and with the completion request.
struct upload_request_config {
    std::optional<seastar::sstring> acl;
    std::optional<seastar::sstring> content_type;
    std::optional<seastar::sstring> grant_full_control;
    std::optional<seastar::sstring> grant_read;
    std::optional<seastar::sstring> grant_read_acp;
    std::optional<seastar::sstring> grant_write_acp;
    std::optional<seastar::sstring> server_side_encryption;
    std::optional<seastar::sstring> sse_customer_algorithm;
    std::optional<seastar::sstring> sse_customer_key;
    std::optional<seastar::sstring> sse_customer_key_md5;
    std::optional<seastar::sstring> ssekms_encryption_context;
    std::optional<seastar::sstring> ssekms_key_id;
    std::optional<seastar::sstring> request_payer;

    bool operator==(const upload_request_config&) const = default;

    static upload_request_config decode(const YAML::Node& node);
};

// Size of the chunks objstore-upload reads from its input file.
static constexpr size_t default_transmit_size = 64 * 1024;

// Throws std::invalid_argument for a zero chunk size.
void validate_transmit_size(size_t size);

struct objstore_config {
    endpoint_config endpoint;
    seastar::sstring bucket;
    size_t min_part_size;
    size_t transmit_size;
    upload_request_config request;

    static objstore_config decode(const YAML::Node& node);
    static objstore_config load(const std::filesystem::path& path);
};

} // namespace objstore

template <>
struct fmt::formatter<objstore::endpoint_config> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }
    auto format(const objstore::endpoint_config& cfg, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "http{}://{}:{}", cfg.use_https ? "s" : "", cfg.host, cfg.port);
    }
};
