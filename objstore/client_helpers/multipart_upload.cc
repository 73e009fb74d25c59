/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "objstore/client_helpers/multipart_upload.hh"

#include <algorithm>
#include <stdexcept>
#include <seastar/core/coroutine.hh>
#include <seastar/coroutine/exception.hh>

#include "objstore/exceptions.hh"
#include "objstore/log.hh"

namespace objstore {

multipart_upload::multipart_upload(seastar::shared_ptr<object_storage> client, seastar::sstring bucket, seastar::sstring key, upload_request_config cfg, seastar::abort_source* as)
    : _client(std::move(client))
    , _bucket(std::move(bucket))
    , _key(std::move(key))
    , _cfg(std::move(cfg))
    , _as(as)
{}

void multipart_upload::check_not_terminal(const char* op) const {
    if (_state == upload_state::finalized || _state == upload_state::aborted) {
        throw std::logic_error(fmt::format("{}() on {} multipart upload of /{}/{}", op, _state, _bucket, _key));
    }
}

seastar::future<seastar::sstring> multipart_upload::ensure_started() {
    if (_state == upload_state::aborted) {
        return seastar::make_exception_future<seastar::sstring>(_abort_cause);
    }
    if (_initiation) {
        return _initiation->get_future();
    }
    check_not_terminal("ensure_started");
    _initiation.emplace(start_upload());
    return _initiation->get_future();
}

seastar::future<seastar::sstring> multipart_upload::start_upload() {
    objlog.trace("Initiating multipart upload of /{}/{}", _bucket, _key);
    std::exception_ptr ex;
    seastar::sstring upload_id;
    try {
        upload_id = co_await _client->initiate_upload(_bucket, _key, _cfg, _as);
        if (upload_id.empty()) {
            throw std::runtime_error("Store returned an empty upload id");
        }
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        auto err = std::make_exception_ptr(initiate_upload_error(_bucket, _key, std::move(ex)));
        abort(err);
        co_await seastar::coroutine::return_exception_ptr(std::move(err));
    }
    _upload_id = upload_id;
    if (_state == upload_state::not_started) {
        _state = upload_state::started;
    }
    objlog.debug("Started multipart upload of /{}/{} (upload id {})", _bucket, _key, _upload_id);
    co_return upload_id;
}

unsigned multipart_upload::next_part_number() {
    check_not_terminal("next_part_number");
    if (_next_part_number > aws_maximum_parts_in_upload) {
        throw too_many_parts_error(_bucket, _key, aws_maximum_parts_in_upload);
    }
    return _next_part_number++;
}

void multipart_upload::record(completed_part part) {
    check_not_terminal("record");
    unsigned expected = _parts.empty() ? 1 : _parts.back().part_number + 1;
    if (part.part_number != expected || part.part_number >= _next_part_number) {
        throw std::logic_error(fmt::format("Part {} recorded out of order in /{}/{}, expected part {}", part.part_number, _bucket, _key, expected));
    }
    objlog.trace("Part {} of /{}/{} completed, etag = {}", part.part_number, _bucket, _key, part.etag);
    _parts.push_back(std::move(part));
    _state = upload_state::uploading;
}

seastar::future<upload_result> multipart_upload::finalize() {
    check_not_terminal("finalize");
    auto upload_id = co_await ensure_started();

    auto parts = _parts;
    std::ranges::sort(parts, {}, &completed_part::part_number);
    objlog.debug("Completing multipart upload of /{}/{} with {} parts (upload id {})", _bucket, _key, parts.size(), upload_id);

    std::exception_ptr ex;
    upload_result result;
    try {
        result = co_await _client->complete_upload(_bucket, _key, upload_id, std::move(parts), _cfg, _as);
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        auto err = std::make_exception_ptr(finalize_upload_error(_bucket, _key, std::move(ex)));
        abort(err);
        co_await seastar::coroutine::return_exception_ptr(std::move(err));
    }
    _state = upload_state::finalized;
    co_return result;
}

void multipart_upload::abort(std::exception_ptr cause) noexcept {
    if (_state == upload_state::finalized || _state == upload_state::aborted) {
        return;
    }
    _state = upload_state::aborted;
    _abort_cause = cause ? std::move(cause) : std::make_exception_ptr(std::runtime_error("multipart upload aborted"));
}

} // namespace objstore
