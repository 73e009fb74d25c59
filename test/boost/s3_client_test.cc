/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <algorithm>
#include <cerrno>
#include <limits>
#include <random>
#include <unordered_map>
#include <vector>
#include <fmt/format.h>
#include <seastar/core/units.hh>
#include <seastar/http/httpd.hh>
#include <seastar/net/inet_address.hh>
#include <seastar/testing/test_case.hh>
#include <seastar/testing/thread_test_case.hh>
#include <seastar/util/closeable.hh>

#include "objstore/client_helpers/upload_sink.hh"
#include "objstore/exceptions.hh"
#include "objstore/s3_client.hh"
#include "test/lib/fake_object_storage.hh"
#include "test/lib/log.hh"

using namespace seastar;
using namespace objstore;
using tests::make_chunk;

// Answers the multipart calls the way S3 does and remembers what it got.
// The tests run on a single shard, so the handler state is not shared.
struct server {
    enum class failure_policy : uint8_t {
        SUCCESS = 0,
        INITIATE_DENIED = 1,
        PART_FAILURE = 2,
        COMPLETE_ERROR_BODY = 3,
        NO_SUCH_UPLOAD = 4,
    };

    struct received_request {
        sstring method;
        sstring url;
        std::unordered_map<sstring, sstring> query;
        decltype(http::request::_headers) headers;
        sstring content;
    };

    class dummy_s3_request_handler : public httpd::handler_base {
    public:
        explicit dummy_s3_request_handler(server& test_server) : _test_server(test_server) {}
        future<std::unique_ptr<http::reply>> handle(const sstring& path, std::unique_ptr<http::request> req, std::unique_ptr<http::reply> rep) override {
            testlog.debug("{}\t{}", req->_method, req->get_url());
            auto& r = _test_server.requests.emplace_back();
            r.method = req->_method;
            r.url = req->get_url();
            for (const auto& [k, v] : req->query_parameters) {
                r.query[k] = v;
            }
            r.headers = req->_headers;
            r.content = req->content;

            sstring response_body;
            rep->set_status(http::reply::status_type::ok);
            if (req->_method == "PUT") {
                auto part = req->query_parameters.at("partNumber");
                if (_test_server.test_failure_policy == failure_policy::PART_FAILURE && part == "2") {
                    rep->set_status(http::reply::status_type::internal_server_error);
                    response_body = error_body("InternalError", "We encountered an internal error. Please try again.");
                } else {
                    rep->add_header("ETag", format("\"SomeTag_{}\"", part));
                }
            } else if (req->_method == "POST") {
                response_body = build_response(*req, *rep);
            } else {
                rep->set_status(http::reply::status_type::bad_request);
            }
            rep->write_body("xml", response_body);
            return make_ready_future<std::unique_ptr<http::reply>>(std::move(rep));
        }

    private:
        static sstring error_body(std::string_view code, std::string_view message) {
            return format(R"(<?xml version="1.0" encoding="UTF-8"?>

                             <Error>
                              <Code>{}</Code>
                              <Message>{}</Message>
                              <RequestId>656c76696e6727732072657175657374</RequestId>
                              <HostId>Uuag1LuByRx9e6j5Onimru9pO4ZVKnJ2Qz7/C1NPcfTWAtRPfTaOFg==</HostId>
                             </Error>)", code, message);
        }

        sstring build_response(const http::request& req, http::reply& rep) {
            if (req.query_parameters.contains("uploads")) {
                if (_test_server.test_failure_policy == failure_policy::INITIATE_DENIED) {
                    rep.set_status(http::reply::status_type::forbidden);
                    return error_body("AccessDenied", "Access Denied");
                }
                return R"(<InitiateMultipartUploadResult>
                                <Bucket>bucket</Bucket>
                                <Key>key</Key>
                                <UploadId>UploadId</UploadId>
                            </InitiateMultipartUploadResult>)";
            }
            switch (_test_server.test_failure_policy) {
            case failure_policy::COMPLETE_ERROR_BODY:
                // S3 may report a completion failure inside a 200 OK reply
                return error_body("InvalidPart", "One or more of the specified parts could not be found.");
            case failure_policy::NO_SUCH_UPLOAD:
                rep.set_status(http::reply::status_type::not_found);
                return error_body("NoSuchUpload", "The specified upload does not exist.");
            default:
                return R"(<CompleteMultipartUploadResult xmlns="http://s3.amazonaws.com/doc/2006-03-01/">
                                 <Location>http://Example-Bucket.s3.Region.amazonaws.com/Example-Object</Location>
                                 <Bucket>Example-Bucket</Bucket>
                                 <Key>Example-Object</Key>
                                 <ETag>"3858f62230ac3c915f300c664312c11f-9"</ETag>
                            </CompleteMultipartUploadResult>)";
            }
        }

        server& _test_server;
    };

    explicit server(failure_policy policy) : test_failure_policy(policy) {
        handler = std::make_unique<dummy_s3_request_handler>(*this);
    }

    future<> start(const std::string& address, uint16_t port) {
        net::inet_address addr(address);
        co_await http_server.start("test");
        co_await http_server.server().invoke_on_all([this] (httpd::http_server& server) {
            server._routes.add_default_handler(handler.get());
            return make_ready_future<>();
        });
        co_await http_server.listen(socket_address{addr, port});
    }

    future<> stop() {
        co_await http_server.stop();
    }

    std::vector<const received_request*> requests_with(std::string_view method, std::string_view param) const {
        std::vector<const received_request*> ret;
        for (const auto& r : requests) {
            if (r.method == method && r.query.contains(sstring(param))) {
                ret.push_back(&r);
            }
        }
        return ret;
    }

    failure_policy test_failure_policy;
    std::vector<received_request> requests;

private:
    std::unique_ptr<httpd::handler_base> handler;
    httpd::http_server_control http_server;
};

static uint16_t random_port() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<uint16_t> ports(std::numeric_limits<int16_t>::max(), std::numeric_limits<uint16_t>::max());
    return ports(gen);
}

static const std::string test_address = "127.0.0.1";

static endpoint_config_ptr make_test_endpoint(uint16_t port) {
    endpoint_config cfg = {
        .host = test_address,
        .port = port,
        .use_https = false,
    };
    return make_lw_shared<endpoint_config>(std::move(cfg));
}

static bool has_io_cause(const upload_error& e, int err) {
    try {
        std::rethrow_exception(e.cause());
    } catch (const storage_io_error& io) {
        return io.code().value() == err;
    } catch (...) {
        return false;
    }
}

// Streams total_size bytes in 1 KiB chunks, with 4 KiB parts.
static upload_result upload_through_client(uint16_t port, size_t total_size, const upload_request_config& cfg = {}) {
    auto client = s3_client::make(make_test_endpoint(port));
    auto close_client = deferred_close(*client);
    streaming_upload_sink sink(client, "test", "object", cfg, 4_KiB);
    for (size_t written = 0; written < total_size; written += 1_KiB) {
        sink.put(make_chunk(std::min<size_t>(1_KiB, total_size - written), 'x')).get();
    }
    return sink.finish().get();
}

SEASTAR_THREAD_TEST_CASE(test_multipart_upload_success) {
    auto port = random_port();
    server server(server::failure_policy::SUCCESS);
    server.start(test_address, port).get();
    auto close_server = deferred_stop(server);

    auto res = upload_through_client(port, 10_KiB);
    BOOST_REQUIRE_EQUAL(res.bucket, "Example-Bucket");
    BOOST_REQUIRE_EQUAL(res.key, "Example-Object");
    BOOST_REQUIRE_EQUAL(res.location, "http://Example-Bucket.s3.Region.amazonaws.com/Example-Object");
    BOOST_REQUIRE_EQUAL(res.etag, "\"3858f62230ac3c915f300c664312c11f-9\"");

    BOOST_REQUIRE_EQUAL(server.requests_with("POST", "uploads").size(), 1);
    auto parts = server.requests_with("PUT", "partNumber");
    BOOST_REQUIRE_EQUAL(parts.size(), 3);
    std::vector<size_t> sizes;
    for (unsigned i = 0; i < parts.size(); i++) {
        BOOST_REQUIRE_EQUAL(parts[i]->query.at("partNumber"), to_sstring(i + 1));
        BOOST_REQUIRE_EQUAL(parts[i]->query.at("uploadId"), "UploadId");
        sizes.push_back(parts[i]->content.size());
    }
    BOOST_REQUIRE(sizes == (std::vector<size_t>{4_KiB, 4_KiB, 2_KiB}));

    auto completes = server.requests_with("POST", "uploadId");
    BOOST_REQUIRE_EQUAL(completes.size(), 1);
    const auto& body = completes[0]->content;
    BOOST_REQUIRE(body.find("<CompleteMultipartUpload") != sstring::npos);
    BOOST_REQUIRE(body.find("</CompleteMultipartUpload>") != sstring::npos);
    for (unsigned i = 1; i <= 3; i++) {
        auto entry = fmt::format("<Part><ETag>\"SomeTag_{}\"</ETag><PartNumber>{}</PartNumber></Part>", i, i);
        BOOST_REQUIRE(body.find(entry) != sstring::npos);
    }
}

SEASTAR_THREAD_TEST_CASE(test_request_headers) {
    auto port = random_port();
    server server(server::failure_policy::SUCCESS);
    server.start(test_address, port).get();
    auto close_server = deferred_stop(server);

    upload_request_config cfg;
    cfg.acl = "bucket-owner-full-control";
    cfg.content_type = "text/plain";
    cfg.server_side_encryption = "aws:kms";
    cfg.ssekms_key_id = "key-id";
    cfg.sse_customer_algorithm = "AES256";
    cfg.request_payer = "requester";
    upload_through_client(port, 5_KiB, cfg);

    auto initiate = server.requests_with("POST", "uploads");
    BOOST_REQUIRE_EQUAL(initiate.size(), 1);
    const auto& h = initiate[0]->headers;
    BOOST_REQUIRE_EQUAL(h.at("x-amz-acl"), "bucket-owner-full-control");
    BOOST_REQUIRE_EQUAL(h.at("Content-Type"), "text/plain");
    BOOST_REQUIRE_EQUAL(h.at("x-amz-server-side-encryption"), "aws:kms");
    BOOST_REQUIRE_EQUAL(h.at("x-amz-server-side-encryption-aws-kms-key-id"), "key-id");
    BOOST_REQUIRE_EQUAL(h.at("x-amz-request-payer"), "requester");

    for (auto* part : server.requests_with("PUT", "partNumber")) {
        BOOST_REQUIRE_EQUAL(part->headers.at("x-amz-server-side-encryption-customer-algorithm"), "AES256");
        BOOST_REQUIRE_EQUAL(part->headers.at("x-amz-request-payer"), "requester");
        BOOST_REQUIRE(!part->headers.contains("x-amz-acl"));
    }

    auto completes = server.requests_with("POST", "uploadId");
    BOOST_REQUIRE_EQUAL(completes.size(), 1);
    BOOST_REQUIRE_EQUAL(completes[0]->headers.at("x-amz-request-payer"), "requester");
}

SEASTAR_THREAD_TEST_CASE(test_initiate_access_denied) {
    auto port = random_port();
    server server(server::failure_policy::INITIATE_DENIED);
    server.start(test_address, port).get();
    auto close_server = deferred_stop(server);

    BOOST_REQUIRE_EXCEPTION(upload_through_client(port, 8_KiB), initiate_upload_error, [] (const initiate_upload_error& e) {
        return has_io_cause(e, EACCES);
    });
    BOOST_REQUIRE(server.requests_with("PUT", "partNumber").empty());
}

SEASTAR_THREAD_TEST_CASE(test_part_failure_skips_completion) {
    auto port = random_port();
    server server(server::failure_policy::PART_FAILURE);
    server.start(test_address, port).get();
    auto close_server = deferred_stop(server);

    BOOST_REQUIRE_EXCEPTION(upload_through_client(port, 16_KiB), upload_part_error, [] (const upload_part_error& e) {
        return e.part_number() == 2 && has_io_cause(e, EIO);
    });
    BOOST_REQUIRE_EQUAL(server.requests_with("PUT", "partNumber").size(), 2);
    BOOST_REQUIRE(server.requests_with("POST", "uploadId").empty());
}

SEASTAR_THREAD_TEST_CASE(test_complete_error_in_ok_reply) {
    auto port = random_port();
    server server(server::failure_policy::COMPLETE_ERROR_BODY);
    server.start(test_address, port).get();
    auto close_server = deferred_stop(server);

    BOOST_REQUIRE_EXCEPTION(upload_through_client(port, 8_KiB), finalize_upload_error, [] (const finalize_upload_error& e) {
        return has_io_cause(e, EIO);
    });
}

SEASTAR_THREAD_TEST_CASE(test_complete_no_such_upload) {
    auto port = random_port();
    server server(server::failure_policy::NO_SUCH_UPLOAD);
    server.start(test_address, port).get();
    auto close_server = deferred_stop(server);

    BOOST_REQUIRE_EXCEPTION(upload_through_client(port, 8_KiB), finalize_upload_error, [] (const finalize_upload_error& e) {
        return has_io_cause(e, ENOENT);
    });
}

SEASTAR_THREAD_TEST_CASE(test_client_calls_map_errors) {
    auto port = random_port();
    server server(server::failure_policy::NO_SUCH_UPLOAD);
    server.start(test_address, port).get();
    auto close_server = deferred_stop(server);

    auto client = s3_client::make(make_test_endpoint(port));
    auto close_client = deferred_close(*client);
    auto id = client->initiate_upload("test", "object", {}, nullptr).get();
    BOOST_REQUIRE_EQUAL(id, "UploadId");
    BOOST_REQUIRE_EXCEPTION(client->complete_upload("test", "object", id, {}, {}, nullptr).get(), storage_io_error, [] (const storage_io_error& e) {
        return e.code().value() == ENOENT;
    });
}

SEASTAR_THREAD_TEST_CASE(test_request_aborted_before_sending) {
    auto port = random_port();
    server server(server::failure_policy::SUCCESS);
    server.start(test_address, port).get();
    auto close_server = deferred_stop(server);

    auto client = s3_client::make(make_test_endpoint(port));
    auto close_client = deferred_close(*client);
    abort_source as;
    as.request_abort();
    BOOST_REQUIRE_THROW(client->initiate_upload("test", "object", {}, &as).get(), abort_requested_exception);
    BOOST_REQUIRE(server.requests.empty());
}
