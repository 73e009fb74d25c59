/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <seastar/core/abort_source.hh>
#include <seastar/core/future.hh>
#include <seastar/core/shared_ptr.hh>
#include <seastar/core/sstring.hh>

#include "objstore/object_storage.hh"

namespace objstore {

// Issues exactly one upload-part call per invocation. The caller records
// the returned part in its multipart_upload; nothing is retried here.
class part_uploader {
    seastar::shared_ptr<object_storage> _client;
    seastar::sstring _bucket;
    seastar::sstring _key;
    const upload_request_config& _cfg;
    seastar::abort_source* _as;

public:
    // cfg must outlive the uploader
    part_uploader(seastar::shared_ptr<object_storage> client,
                  seastar::sstring bucket,
                  seastar::sstring key,
                  const upload_request_config& cfg,
                  seastar::abort_source* as = nullptr);

    // Fails with upload_part_error wrapping the store failure.
    seastar::future<completed_part> upload_part(seastar::sstring upload_id, unsigned part_number, part_data data);
};

} // namespace objstore
