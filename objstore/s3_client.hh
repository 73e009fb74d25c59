/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <chrono>
#include <optional>
#include <seastar/core/metrics_registration.hh>
#include <seastar/core/shared_ptr.hh>
#include <seastar/http/client.hh>
#include <seastar/http/reply.hh>
#include <seastar/http/request.hh>

#include "objstore/config.hh"
#include "objstore/object_storage.hh"

namespace objstore {

using s3_clock = std::chrono::steady_clock;

// Multipart upload calls against an S3-compatible REST endpoint, using
// path-style addressing (/bucket/key). Requests are not signed.
class s3_client final : public object_storage, public seastar::enable_shared_from_this<s3_client> {
    struct private_tag {};

    struct io_stats {
        uint64_t ops = 0;
        uint64_t bytes = 0;
        uint64_t errors = 0;
        std::chrono::duration<double> duration = std::chrono::duration<double>(0);

        void update(uint64_t len, std::chrono::duration<double> lat) {
            ops++;
            bytes += len;
            duration += lat;
        }
    };

    endpoint_config_ptr _cfg;
    seastar::http::experimental::client _http;
    io_stats _write_stats;
    uint64_t _initiated = 0;
    uint64_t _completed = 0;
    seastar::metrics::metric_groups _metrics;

    void register_metrics();

    // Fails with store_exception for error replies and with
    // unexpected_status_error if the status is not the expected one.
    seastar::future<> do_make_request(seastar::http::request req,
                                      seastar::http::experimental::client::reply_handler handle,
                                      seastar::http::reply::status_type expected,
                                      seastar::abort_source* as);

    // Same as above, failures are translated by map_store_exception().
    seastar::future<> make_request(seastar::http::request req,
                                   seastar::http::experimental::client::reply_handler handle,
                                   seastar::http::reply::status_type expected,
                                   seastar::abort_source* as);

    seastar::sstring object_path(const seastar::sstring& bucket, const seastar::sstring& key) const;

public:
    s3_client(endpoint_config_ptr cfg, private_tag);

    static seastar::shared_ptr<s3_client> make(endpoint_config_ptr cfg);

    seastar::future<seastar::sstring> initiate_upload(seastar::sstring bucket,
                                                      seastar::sstring key,
                                                      const upload_request_config& cfg,
                                                      seastar::abort_source* as) override;

    seastar::future<seastar::sstring> upload_part(seastar::sstring bucket,
                                                  seastar::sstring key,
                                                  seastar::sstring upload_id,
                                                  unsigned part_number,
                                                  part_data data,
                                                  const upload_request_config& cfg,
                                                  seastar::abort_source* as) override;

    seastar::future<upload_result> complete_upload(seastar::sstring bucket,
                                                   seastar::sstring key,
                                                   seastar::sstring upload_id,
                                                   std::vector<completed_part> parts,
                                                   const upload_request_config& cfg,
                                                   seastar::abort_source* as) override;

    seastar::future<> close() override;

    const endpoint_config& config() const noexcept { return *_cfg; }
};

// Headers for the initiate call.
void add_initiate_headers(seastar::http::request& req, const upload_request_config& cfg);
// SSE-C and payer headers, repeated on every part.
void add_part_headers(seastar::http::request& req, const upload_request_config& cfg);
// Payer header for the completion request.
void add_complete_headers(seastar::http::request& req, const upload_request_config& cfg);

} // namespace objstore
