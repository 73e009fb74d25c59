/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "objstore/s3_client.hh"

#include <exception>
#include <stdexcept>
#include <fmt/format.h>
#include <seastar/core/coroutine.hh>
#include <seastar/core/metrics.hh>
#include <seastar/coroutine/exception.hh>
#include <seastar/http/exception.hh>
#include <seastar/util/short_streams.hh>

#include "objstore/http.hh"
#include "objstore/log.hh"
#include "objstore/store_error.hh"
#include "objstore/utils/client_utils.hh"

using namespace seastar;

namespace objstore {

static void set_header(http::request& req, const char* name, const std::optional<sstring>& value) {
    if (value) {
        req._headers[name] = *value;
    }
}

void add_initiate_headers(http::request& req, const upload_request_config& cfg) {
    set_header(req, "x-amz-acl", cfg.acl);
    set_header(req, "Content-Type", cfg.content_type);
    set_header(req, "x-amz-grant-full-control", cfg.grant_full_control);
    set_header(req, "x-amz-grant-read", cfg.grant_read);
    set_header(req, "x-amz-grant-read-acp", cfg.grant_read_acp);
    set_header(req, "x-amz-grant-write-acp", cfg.grant_write_acp);
    set_header(req, "x-amz-server-side-encryption", cfg.server_side_encryption);
    set_header(req, "x-amz-server-side-encryption-customer-algorithm", cfg.sse_customer_algorithm);
    set_header(req, "x-amz-server-side-encryption-customer-key", cfg.sse_customer_key);
    set_header(req, "x-amz-server-side-encryption-customer-key-MD5", cfg.sse_customer_key_md5);
    set_header(req, "x-amz-server-side-encryption-context", cfg.ssekms_encryption_context);
    set_header(req, "x-amz-server-side-encryption-aws-kms-key-id", cfg.ssekms_key_id);
    set_header(req, "x-amz-request-payer", cfg.request_payer);
}

void add_part_headers(http::request& req, const upload_request_config& cfg) {
    set_header(req, "x-amz-server-side-encryption-customer-algorithm", cfg.sse_customer_algorithm);
    set_header(req, "x-amz-server-side-encryption-customer-key", cfg.sse_customer_key);
    set_header(req, "x-amz-server-side-encryption-customer-key-MD5", cfg.sse_customer_key_md5);
    set_header(req, "x-amz-request-payer", cfg.request_payer);
}

void add_complete_headers(http::request& req, const upload_request_config& cfg) {
    set_header(req, "x-amz-request-payer", cfg.request_payer);
}

s3_client::s3_client(endpoint_config_ptr cfg, private_tag)
    : _cfg(std::move(cfg))
    , _http(std::make_unique<http_utils::dns_connection_factory>(_cfg->host, _cfg->port, _cfg->use_https, objlog),
            _cfg->max_connections.value_or(1),
            seastar::http::experimental::client::retry_requests::no)
{
    register_metrics();
}

shared_ptr<s3_client> s3_client::make(endpoint_config_ptr cfg) {
    return seastar::make_shared<s3_client>(std::move(cfg), private_tag{});
}

void s3_client::register_metrics() {
    namespace sm = seastar::metrics;
    auto ep_label = sm::label("endpoint")(_cfg->host);
    _metrics.add_group("objstore", {
        sm::make_counter("total_initiated_uploads", [this] { return _initiated; },
                sm::description("Total number of multipart uploads initiated"), {ep_label}),
        sm::make_counter("total_completed_uploads", [this] { return _completed; },
                sm::description("Total number of multipart uploads completed"), {ep_label}),
        sm::make_counter("total_part_uploads", [this] { return _write_stats.ops; },
                sm::description("Total number of uploaded parts"), {ep_label}),
        sm::make_counter("total_part_bytes", [this] { return _write_stats.bytes; },
                sm::description("Total number of bytes uploaded in parts"), {ep_label}),
        sm::make_counter("total_part_latency_sec", [this] { return _write_stats.duration.count(); },
                sm::description("Total time spent uploading parts"), {ep_label}),
        sm::make_counter("total_errors", [this] { return _write_stats.errors; },
                sm::description("Total number of failed requests"), {ep_label}),
    });
}

sstring s3_client::object_path(const sstring& bucket, const sstring& key) const {
    return format("/{}/{}", bucket, key);
}

future<> s3_client::do_make_request(http::request req, http::experimental::client::reply_handler handle, http::reply::status_type expected, abort_source* as) {
    // The http client does not check the abort status on entry
    if (as && as->abort_requested()) {
        co_await coroutine::return_exception_ptr(as->abort_requested_exception_ptr());
    }
    auto handler = [handle = std::move(handle), expected] (const http::reply& rep, input_stream<char>&& in) mutable -> future<> {
        auto payload = std::move(in);
        auto status_class = http::reply::classify_status(rep._status);

        if (status_class != http::reply::status_class::informational && status_class != http::reply::status_class::success) {
            auto error = store_error::parse(co_await util::read_entire_stream_contiguous(payload), rep._status);
            if (error) {
                co_await coroutine::return_exception(store_exception(std::move(*error)));
            }
            co_await coroutine::return_exception(store_exception(store_error::from_http_code(rep._status)));
        }

        if (rep._status != expected) {
            co_await coroutine::return_exception(httpd::unexpected_status_error(rep._status));
        }
        co_await handle(rep, std::move(payload));
    };
    if (as) {
        co_await _http.make_request(std::move(req), std::move(handler), *as, std::nullopt);
    } else {
        co_await _http.make_request(std::move(req), std::move(handler), std::nullopt);
    }
}

future<> s3_client::make_request(http::request req, http::experimental::client::reply_handler handle, http::reply::status_type expected, abort_source* as) {
    std::exception_ptr ex;
    try {
        co_await do_make_request(std::move(req), std::move(handle), expected, as);
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        _write_stats.errors++;
        if (as && as->abort_requested()) {
            co_await coroutine::return_exception_ptr(std::move(ex));
        }
        co_await coroutine::return_exception(map_store_exception(std::move(ex)));
    }
}

future<sstring> s3_client::initiate_upload(sstring bucket, sstring key, const upload_request_config& cfg, abort_source* as) {
    // see https://docs.aws.amazon.com/AmazonS3/latest/API/API_CreateMultipartUpload.html
    auto path = object_path(bucket, key);
    auto req = http::request::make("POST", _cfg->host, path);
    req.query_parameters["uploads"] = "";
    add_initiate_headers(req, cfg);
    objlog.trace("POST {} uploads", path);

    sstring upload_id;
    co_await make_request(std::move(req), [&upload_id] (const http::reply& rep, input_stream<char>&& in) -> future<> {
        auto input = std::move(in);
        auto body = co_await util::read_entire_stream_contiguous(input);
        upload_id = parse_multipart_upload_id(body);
    }, http::reply::status_type::ok, as);

    if (upload_id.empty()) {
        throw std::runtime_error(fmt::format("Empty upload id for {}", path));
    }
    _initiated++;
    objlog.trace("Initiated multipart upload for {} -> id = {}", path, upload_id);
    co_return upload_id;
}

future<sstring> s3_client::upload_part(sstring bucket, sstring key, sstring upload_id, unsigned part_number, part_data data, const upload_request_config& cfg, abort_source* as) {
    // see https://docs.aws.amazon.com/AmazonS3/latest/API/API_UploadPart.html
    auto path = object_path(bucket, key);
    auto req = http::request::make("PUT", _cfg->host, path);
    req.query_parameters.emplace("partNumber", to_sstring(part_number));
    req.query_parameters.emplace("uploadId", upload_id);
    add_part_headers(req, cfg);
    auto len = data.size();
    objlog.trace("PUT part {}, {} bytes (upload id {})", part_number, len, upload_id);

    req.write_body("bin", len, [data = std::move(data)] (output_stream<char>&& out_) -> future<> {
        auto out = std::move(out_);
        std::exception_ptr ex;
        try {
            for (const auto& buf : data.buffers()) {
                co_await out.write(buf.get(), buf.size());
            }
            co_await out.flush();
        } catch (...) {
            ex = std::current_exception();
        }
        co_await out.close();
        if (ex) {
            co_await coroutine::return_exception_ptr(std::move(ex));
        }
    });

    sstring etag;
    co_await make_request(std::move(req), [this, &etag, len, start = s3_clock::now()] (const http::reply& rep, input_stream<char>&& in) -> future<> {
        auto input = std::move(in);
        etag = rep.get_header("ETag");
        _write_stats.update(len, s3_clock::now() - start);
        co_await util::skip_entire_stream(input);
    }, http::reply::status_type::ok, as);

    if (etag.empty()) {
        throw std::runtime_error(fmt::format("No ETag in the reply for part {} of {}", part_number, path));
    }
    objlog.trace("Part {} -> etag = {} (upload id {})", part_number, etag, upload_id);
    co_return etag;
}

future<upload_result> s3_client::complete_upload(sstring bucket, sstring key, sstring upload_id, std::vector<completed_part> parts, const upload_request_config& cfg, abort_source* as) {
    // see https://docs.aws.amazon.com/AmazonS3/latest/API/API_CompleteMultipartUpload.html
    auto path = object_path(bucket, key);
    auto req = http::request::make("POST", _cfg->host, path);
    req.query_parameters.emplace("uploadId", upload_id);
    add_complete_headers(req, cfg);
    objlog.trace("POST upload completion {} parts (upload id {})", parts.size(), upload_id);

    auto body_size = prepare_multipart_upload_parts(parts);
    req.write_body("xml", body_size, [parts = std::move(parts)] (output_stream<char>&& out) -> future<> {
        co_await dump_multipart_upload_parts(std::move(out), parts);
    });

    upload_result result;
    co_await make_request(std::move(req), [&result] (const http::reply& rep, input_stream<char>&& in) -> future<> {
        auto input = std::move(in);
        auto body = co_await util::read_entire_stream_contiguous(input);
        result = parse_complete_multipart_upload(body);
    }, http::reply::status_type::ok, as);

    _completed++;
    co_return result;
}

future<> s3_client::close() {
    co_await _http.close();
}

} // namespace objstore
