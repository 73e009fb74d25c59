/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <seastar/core/semaphore.hh>
#include <seastar/core/shared_ptr.hh>
#include <seastar/http/client.hh>
#include <seastar/net/inet_address.hh>
#include <seastar/net/tls.hh>
#include <seastar/util/log.hh>

namespace objstore::http_utils {

struct url_info {
    std::string scheme;
    std::string host;
    std::string path;
    uint16_t port;

    bool is_https() const;
};

url_info parse_simple_url(std::string_view uri);

seastar::future<seastar::shared_ptr<seastar::tls::certificate_credentials>> system_trust_credentials();

// Resolves the host on first use and hands out plain or TLS connections,
// round-robin over the resolved addresses.
class dns_connection_factory : public seastar::http::experimental::connection_factory {
    std::string _host;
    int _port;
    bool _use_https;
    seastar::logger& _logger;
    seastar::shared_ptr<seastar::tls::certificate_credentials> _creds;
    std::vector<seastar::net::inet_address> _addr_list;
    size_t _addr_pos = 0;
    bool _initialized = false;
    seastar::semaphore _init_semaphore{1};

    seastar::future<> initialize();
    seastar::future<seastar::connected_socket> connect();

public:
    dns_connection_factory(std::string host, int port, bool use_https, seastar::logger& logger,
                           seastar::shared_ptr<seastar::tls::certificate_credentials> creds = {});

    seastar::future<seastar::connected_socket> make(seastar::abort_source*) override;
};

} // namespace objstore::http_utils
