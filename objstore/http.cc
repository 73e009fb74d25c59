/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "objstore/http.hh"

#include <stdexcept>
#include <string>
#include <strings.h>
#include <boost/regex.hpp>
#include <fmt/format.h>
#include <seastar/core/coroutine.hh>
#include <seastar/net/dns.hh>

using namespace seastar;

namespace objstore::http_utils {

future<shared_ptr<tls::certificate_credentials>> system_trust_credentials() {
    static thread_local shared_ptr<tls::certificate_credentials> system_trust_credentials;
    if (!system_trust_credentials) {
        // can race, and overwrite the object. that is fine.
        auto cred = make_shared<tls::certificate_credentials>();
        co_await cred->set_system_trust();
        system_trust_credentials = std::move(cred);
    }
    co_return system_trust_credentials;
}

dns_connection_factory::dns_connection_factory(std::string host, int port, bool use_https, logger& logger, shared_ptr<tls::certificate_credentials> creds)
    : _host(std::move(host))
    , _port(port)
    , _use_https(use_https)
    , _logger(logger)
    , _creds(std::move(creds))
{}

future<> dns_connection_factory::initialize() {
    auto units = co_await get_units(_init_semaphore, 1);
    if (_initialized) {
        co_return;
    }
    auto hent = co_await net::dns::get_host_by_name(_host, net::inet_address::family::INET);
    _addr_list.clear();
    for (const auto& entry : hent.addr_entries) {
        _addr_list.push_back(entry.addr);
    }
    if (_addr_list.empty()) {
        throw std::runtime_error(fmt::format("No addresses resolved for {}", _host));
    }
    if (_use_https && !_creds) {
        _creds = co_await system_trust_credentials();
    }
    _logger.debug("Initialized addresses={} tls={}", _addr_list.size(), _use_https ? "yes" : "no");
    _initialized = true;
}

future<connected_socket> dns_connection_factory::connect() {
    if (!_initialized) [[unlikely]] {
        co_await initialize();
    }
    auto socket_addr = socket_address(_addr_list[_addr_pos++ % _addr_list.size()], _port);
    if (_use_https) {
        _logger.debug("Making new HTTPS connection addr={} host={}", socket_addr, _host);
        co_return co_await tls::connect(_creds, socket_addr, tls::tls_options{.server_name = _host});
    }
    _logger.debug("Making new HTTP connection addr={} host={}", socket_addr, _host);
    co_return co_await seastar::connect(socket_addr, {}, transport::TCP);
}

future<connected_socket> dns_connection_factory::make(abort_source*) {
    return connect();
}

static const char HTTPS[] = "https";

url_info parse_simple_url(std::string_view uri) {
    /**
     * https://en.wikipedia.org/wiki/IPv6#Addressing
     * In case a port is included with a numerical ipv6 address,
     * the address part is encases in a "[]" wrapper, like
     * http://[2001:db8:4006:812::200e]:8080
     */
    static boost::regex simple_url(R"foo(([a-zA-Z]+):\/\/((?:\[[^\]]+\])|[^\/:]+)(:\d+)?(\/.*)?)foo");

    boost::smatch m;
    std::string tmp(uri);

    if (!boost::regex_match(tmp, m, simple_url)) {
        throw std::invalid_argument(fmt::format("Could not parse URI {}", uri));
    }

    auto scheme = m[1].str();
    auto host = m[2].str();
    auto port = m[3].str();
    auto path = m[4].str();

    bool https = (strcasecmp(scheme.c_str(), HTTPS) == 0);

    // check for numeric ipv6 address + port case
    if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    unsigned port_number = https ? 443 : 80;
    if (!port.empty()) {
        // the regex guarantees digits only
        auto digits = port.substr(1);
        port_number = digits.size() > 5 ? 0 : std::stoul(digits);
        if (port_number == 0 || port_number > 65535) {
            throw std::invalid_argument(fmt::format("Invalid port in URI {}", uri));
        }
    }
    return url_info {
        .scheme = std::move(scheme),
        .host = std::move(host),
        .path = std::move(path),
        .port = uint16_t(port_number)
    };
}

bool url_info::is_https() const {
    return strcasecmp(scheme.c_str(), HTTPS) == 0;
}

} // namespace objstore::http_utils
