/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <stdexcept>
#include <fmt/format.h>
#include <seastar/core/units.hh>
#include <seastar/testing/test_case.hh>
#include <seastar/testing/thread_test_case.hh>
#include <yaml-cpp/yaml.h>

#include "objstore/config.hh"
#include "objstore/http.hh"
#include "objstore/object_storage.hh"

using namespace seastar;
using namespace objstore;

SEASTAR_THREAD_TEST_CASE(test_parse_simple_url) {
    auto url = http_utils::parse_simple_url("https://s3.us-east-1.amazonaws.com");
    BOOST_REQUIRE_EQUAL(url.host, "s3.us-east-1.amazonaws.com");
    BOOST_REQUIRE_EQUAL(url.port, 443);
    BOOST_REQUIRE(url.is_https());

    url = http_utils::parse_simple_url("http://[::1]:9000/");
    BOOST_REQUIRE_EQUAL(url.host, "::1");
    BOOST_REQUIRE_EQUAL(url.port, 9000);
    BOOST_REQUIRE_EQUAL(url.path, "/");
    BOOST_REQUIRE(!url.is_https());

    BOOST_REQUIRE_THROW(http_utils::parse_simple_url("localhost:9000"), std::invalid_argument);
}

SEASTAR_THREAD_TEST_CASE(test_endpoint_from_url) {
    auto ep = endpoint_config::decode(YAML::Load("{name: 'http://minio.local:9000', max_connections: 4}"));
    BOOST_REQUIRE_EQUAL(ep.host, "minio.local");
    BOOST_REQUIRE_EQUAL(ep.port, 9000);
    BOOST_REQUIRE(!ep.use_https);
    BOOST_REQUIRE(ep.max_connections == 4u);
    BOOST_REQUIRE_EQUAL(fmt::format("{}", ep), "http://minio.local:9000");
}

SEASTAR_THREAD_TEST_CASE(test_endpoint_from_host) {
    auto ep = endpoint_config::decode(YAML::Load("{name: s3.amazonaws.com, https: true}"));
    BOOST_REQUIRE_EQUAL(ep.host, "s3.amazonaws.com");
    BOOST_REQUIRE_EQUAL(ep.port, 443);
    BOOST_REQUIRE(ep.use_https);
    BOOST_REQUIRE(!ep.max_connections);

    ep = endpoint_config::decode(YAML::Load("{name: localhost}"));
    BOOST_REQUIRE_EQUAL(ep.port, 80);
    BOOST_REQUIRE(!ep.use_https);

    ep = endpoint_config::decode(YAML::Load("{name: localhost, port: 9000}"));
    BOOST_REQUIRE_EQUAL(ep.port, 9000);
}

SEASTAR_THREAD_TEST_CASE(test_bad_endpoints) {
    BOOST_REQUIRE_THROW(endpoint_config::decode(YAML::Load("localhost")), std::invalid_argument);
    BOOST_REQUIRE_THROW(endpoint_config::decode(YAML::Load("{port: 9000}")), std::invalid_argument);
    BOOST_REQUIRE_THROW(endpoint_config::decode(YAML::Load("{name: 'http://host/bucket'}")), std::invalid_argument);
    BOOST_REQUIRE_THROW(endpoint_config::decode(YAML::Load("{name: host, max_connections: 0}")), std::invalid_argument);
    BOOST_REQUIRE_THROW(endpoint_config::decode(YAML::Load("{name: 'https://host:70000'}")), std::invalid_argument);
    BOOST_REQUIRE_THROW(endpoint_config::decode(YAML::Load("{name: 'https://host:99999999999999999999'}")), std::invalid_argument);
    BOOST_REQUIRE_THROW(endpoint_config::decode(YAML::Load("{name: 'http://host:0'}")), std::invalid_argument);
    BOOST_REQUIRE_EQUAL(endpoint_config::decode(YAML::Load("{name: 'http://host:65535'}")).port, 65535);
}

SEASTAR_THREAD_TEST_CASE(test_request_config) {
    auto cfg = upload_request_config::decode(YAML::Load(R"(
acl: private
content_type: application/json
server_side_encryption: AES256
request_payer: requester
)"));
    BOOST_REQUIRE(cfg.acl == "private");
    BOOST_REQUIRE(cfg.content_type == "application/json");
    BOOST_REQUIRE(cfg.server_side_encryption == "AES256");
    BOOST_REQUIRE(cfg.request_payer == "requester");
    BOOST_REQUIRE(!cfg.grant_read);
    BOOST_REQUIRE(!cfg.sse_customer_key);

    BOOST_REQUIRE(upload_request_config::decode(YAML::Node()) == upload_request_config{});
    BOOST_REQUIRE_THROW(upload_request_config::decode(YAML::Load("[a, b]")), std::invalid_argument);
}

SEASTAR_THREAD_TEST_CASE(test_objstore_config) {
    auto cfg = objstore_config::decode(YAML::Load(R"(
endpoint:
  name: http://127.0.0.1:9000
bucket: backups
min_part_size: 1048576
request:
  acl: private
)"));
    BOOST_REQUIRE_EQUAL(cfg.endpoint.port, 9000);
    BOOST_REQUIRE_EQUAL(cfg.bucket, "backups");
    BOOST_REQUIRE_EQUAL(cfg.min_part_size, 1_MiB);
    BOOST_REQUIRE(cfg.request.acl == "private");

    cfg = objstore_config::decode(YAML::Load("{endpoint: {name: localhost}}"));
    BOOST_REQUIRE_EQUAL(cfg.min_part_size, aws_minimum_part_size);
    BOOST_REQUIRE_EQUAL(cfg.transmit_size, default_transmit_size);
    BOOST_REQUIRE(cfg.bucket.empty());

    BOOST_REQUIRE_THROW(objstore_config::decode(YAML::Load("{endpoint: {name: localhost}, min_part_size: 0}")), std::invalid_argument);
    BOOST_REQUIRE_THROW(objstore_config::decode(YAML::Load("{endpoint: {name: localhost}, min_part_size: 10485760}")), std::invalid_argument);
    BOOST_REQUIRE_THROW(objstore_config::decode(YAML::Load("{endpoint: {name: localhost}, transmit_size: 0}")), std::invalid_argument);
    BOOST_REQUIRE_EQUAL(objstore_config::decode(YAML::Load("{endpoint: {name: localhost}, transmit_size: 4096}")).transmit_size, 4096);
    BOOST_REQUIRE_THROW(validate_transmit_size(0), std::invalid_argument);
    BOOST_REQUIRE_NO_THROW(validate_transmit_size(1));
    BOOST_REQUIRE_THROW(objstore_config::load("/nonexistent/objstore.yaml"), std::invalid_argument);
}
