/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <exception>
#include <optional>
#include <seastar/core/abort_source.hh>
#include <seastar/core/iostream.hh>
#include <seastar/core/shared_ptr.hh>
#include <seastar/core/temporary_buffer.hh>

#include "objstore/client_helpers/multipart_upload.hh"
#include "objstore/client_helpers/part_buffer.hh"
#include "objstore/client_helpers/part_uploader.hh"

namespace objstore {

// Feeds a live stream of chunks into one multipart upload.
//
// Each put() resolves only after the part it completed (if any) has been
// uploaded and recorded, so parts go out one at a time and in stream order.
// The first failure stops the sink: no completion request is sent, and every
// later put() or finish() fails with that same error. The already initiated
// upload is not aborted remotely.
class streaming_upload_sink {
    multipart_upload _session;
    part_uploader _uploader;
    part_buffer _buffer;
    seastar::abort_source* _as;

    std::exception_ptr _failure;
    std::optional<upload_result> _result;
    bool _busy = false;
    bool _finished = false;

    seastar::future<> upload_part(part_data data);
    void check_abort() const;
    void fail(std::exception_ptr ex) noexcept;

public:
    streaming_upload_sink(seastar::shared_ptr<object_storage> client,
                          seastar::sstring bucket,
                          seastar::sstring key,
                          upload_request_config cfg = {},
                          size_t min_part_size = aws_minimum_part_size,
                          seastar::abort_source* as = nullptr);

    streaming_upload_sink(const streaming_upload_sink&) = delete;
    streaming_upload_sink& operator=(const streaming_upload_sink&) = delete;

    // Must not be called again before the returned future resolves.
    seastar::future<> put(seastar::temporary_buffer<char> buf);

    // End of stream: uploads the residue as the last part and completes
    // the upload.
    seastar::future<upload_result> finish();

    // Drains the input stream through put(), then finish().
    seastar::future<upload_result> consume(seastar::input_stream<char>& in);

    const multipart_upload& session() const noexcept { return _session; }
    bool finished() const noexcept { return _finished; }
    bool failed() const noexcept { return bool(_failure); }
    std::exception_ptr failure() const noexcept { return _failure; }
    const std::optional<upload_result>& result() const noexcept { return _result; }
};

// Adapts the sink to seastar::data_sink so it can back an output_stream.
// flush() finishes the upload; the result is read back from the sink.
// close() without a flush abandons it.
seastar::data_sink make_upload_data_sink(seastar::lw_shared_ptr<streaming_upload_sink> sink);

} // namespace objstore
