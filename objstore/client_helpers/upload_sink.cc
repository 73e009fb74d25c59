/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "objstore/client_helpers/upload_sink.hh"

#include <stdexcept>
#include <seastar/core/coroutine.hh>
#include <seastar/coroutine/exception.hh>
#include <seastar/util/backtrace.hh>

#include "objstore/log.hh"

namespace objstore {

streaming_upload_sink::streaming_upload_sink(seastar::shared_ptr<object_storage> client,
                                             seastar::sstring bucket,
                                             seastar::sstring key,
                                             upload_request_config cfg,
                                             size_t min_part_size,
                                             seastar::abort_source* as)
    : _session(client, bucket, key, std::move(cfg), as)
    , _uploader(std::move(client), std::move(bucket), std::move(key), _session.config(), as)
    , _buffer(min_part_size)
    , _as(as)
{}

void streaming_upload_sink::check_abort() const {
    if (_as) {
        _as->check();
    }
}

void streaming_upload_sink::fail(std::exception_ptr ex) noexcept {
    if (_failure) {
        return;
    }
    _failure = ex;
    _session.abort(std::move(ex));
    if (_session.upload_started()) {
        objlog.warn("Multipart upload of /{}/{} failed after {} parts, upload {} is left to the store's lifecycle policy: {}",
                    _session.bucket(), _session.key(), _session.parts_count(), _session.upload_id(), _failure);
    } else {
        objlog.warn("Multipart upload of /{}/{} failed: {}", _session.bucket(), _session.key(), _failure);
    }
}

seastar::future<> streaming_upload_sink::upload_part(part_data data) {
    auto part_number = _session.next_part_number();
    auto upload_id = co_await _session.ensure_started();
    check_abort();
    auto part = co_await _uploader.upload_part(std::move(upload_id), part_number, std::move(data));
    _session.record(std::move(part));
}

seastar::future<> streaming_upload_sink::put(seastar::temporary_buffer<char> buf) {
    if (_failure) {
        co_await seastar::coroutine::return_exception_ptr(_failure);
    }
    if (_finished) {
        co_await seastar::coroutine::return_exception(std::logic_error("put() after the end of the stream"));
    }
    if (_busy) {
        co_await seastar::coroutine::return_exception(std::logic_error("put() while a part upload is outstanding"));
    }

    _busy = true;
    std::exception_ptr ex;
    try {
        check_abort();
        if (auto part = _buffer.append(std::move(buf))) {
            co_await upload_part(std::move(*part));
        }
    } catch (...) {
        ex = std::current_exception();
    }
    _busy = false;
    if (ex) {
        fail(ex);
        co_await seastar::coroutine::return_exception_ptr(std::move(ex));
    }
}

seastar::future<upload_result> streaming_upload_sink::finish() {
    if (_failure) {
        co_await seastar::coroutine::return_exception_ptr(_failure);
    }
    if (_finished) {
        co_await seastar::coroutine::return_exception(std::logic_error("finish() called twice"));
    }
    if (_busy) {
        co_await seastar::coroutine::return_exception(std::logic_error("finish() while a part upload is outstanding"));
    }

    _finished = true;
    _busy = true;
    std::exception_ptr ex;
    upload_result result;
    try {
        check_abort();
        if (auto last = _buffer.flush()) {
            co_await upload_part(std::move(*last));
        }
        check_abort();
        result = co_await _session.finalize();
    } catch (...) {
        ex = std::current_exception();
    }
    _busy = false;
    if (ex) {
        fail(ex);
        co_await seastar::coroutine::return_exception_ptr(std::move(ex));
    }
    objlog.debug("Uploaded /{}/{} in {} parts: {}", _session.bucket(), _session.key(), _session.parts_count(), result);
    _result = result;
    co_return result;
}

seastar::future<upload_result> streaming_upload_sink::consume(seastar::input_stream<char>& in) {
    while (true) {
        seastar::temporary_buffer<char> buf;
        std::exception_ptr ex;
        try {
            buf = co_await in.read();
        } catch (...) {
            ex = std::current_exception();
        }
        if (ex) {
            // the stream ended without reaching its end, nothing to complete
            fail(ex);
            co_await seastar::coroutine::return_exception_ptr(std::move(ex));
        }
        if (buf.empty()) {
            break;
        }
        co_await put(std::move(buf));
    }
    co_return co_await finish();
}

class upload_data_sink final : public seastar::data_sink_impl {
    seastar::lw_shared_ptr<streaming_upload_sink> _sink;

public:
    explicit upload_data_sink(seastar::lw_shared_ptr<streaming_upload_sink> sink)
        : _sink(std::move(sink))
    {}

    virtual seastar::future<> put(seastar::net::packet) override {
        seastar::throw_with_backtrace<std::runtime_error>("upload sink put(net::packet) unsupported");
    }

    virtual seastar::future<> put(seastar::temporary_buffer<char> buf) override {
        return _sink->put(std::move(buf));
    }

    virtual seastar::future<> put(std::vector<seastar::temporary_buffer<char>> data) override {
        for (auto&& buf : data) {
            co_await _sink->put(std::move(buf));
        }
    }

    virtual seastar::future<> flush() override {
        if (!_sink->finished()) {
            co_await _sink->finish();
        }
    }

    // Closing without a flush abandons the upload, nothing is completed.
    virtual seastar::future<> close() override {
        if (!_sink->finished() && !_sink->failed()) {
            const auto& session = _sink->session();
            objlog.warn("Multipart upload of /{}/{} closed before the end of the stream, upload {} is left to the store's lifecycle policy",
                        session.bucket(), session.key(), session.upload_started() ? session.upload_id() : seastar::sstring("(not started)"));
        }
        co_return;
    }

    virtual size_t buffer_size() const noexcept override {
        return 128 * 1024;
    }
};

seastar::data_sink make_upload_data_sink(seastar::lw_shared_ptr<streaming_upload_sink> sink) {
    return seastar::data_sink(std::make_unique<upload_data_sink>(std::move(sink)));
}

} // namespace objstore
