/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "objstore/client_helpers/part_uploader.hh"

#include <stdexcept>
#include <seastar/core/coroutine.hh>
#include <seastar/coroutine/exception.hh>

#include "objstore/exceptions.hh"
#include "objstore/log.hh"

namespace objstore {

part_uploader::part_uploader(seastar::shared_ptr<object_storage> client, seastar::sstring bucket, seastar::sstring key, const upload_request_config& cfg, seastar::abort_source* as)
    : _client(std::move(client))
    , _bucket(std::move(bucket))
    , _key(std::move(key))
    , _cfg(cfg)
    , _as(as)
{}

seastar::future<completed_part> part_uploader::upload_part(seastar::sstring upload_id, unsigned part_number, part_data data) {
    if (part_number == 0) {
        throw std::invalid_argument("Part numbers start at 1");
    }
    auto size = data.size();
    objlog.trace("Uploading part {} of /{}/{}, {} bytes (upload id {})", part_number, _bucket, _key, size, upload_id);

    std::exception_ptr ex;
    seastar::sstring etag;
    try {
        etag = co_await _client->upload_part(_bucket, _key, upload_id, part_number, std::move(data), _cfg, _as);
        if (etag.empty()) {
            throw std::runtime_error("Store returned an empty entity tag");
        }
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        co_await seastar::coroutine::return_exception(upload_part_error(_bucket, _key, part_number, std::move(ex)));
    }
    co_return completed_part{part_number, std::move(etag)};
}

} // namespace objstore
