/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <exception>
#include <optional>
#include <vector>
#include <fmt/format.h>
#include <seastar/core/abort_source.hh>
#include <seastar/core/shared_future.hh>
#include <seastar/core/shared_ptr.hh>
#include <seastar/core/sstring.hh>

#include "objstore/object_storage.hh"

namespace objstore {

enum class upload_state {
    not_started,
    started,
    uploading,
    finalized,
    aborted,
};

// State of one multipart upload: the memoized upload id, part number
// assignment and the parts completed so far. Owned by a single sink and
// driven strictly sequentially.
//
// An aborted upload is not cleaned up remotely; the store's own
// lifecycle policy reclaims it.
class multipart_upload {
    seastar::shared_ptr<object_storage> _client;
    seastar::sstring _bucket;
    seastar::sstring _key;
    upload_request_config _cfg;
    seastar::abort_source* _as;

    std::optional<seastar::shared_future<seastar::sstring>> _initiation;
    seastar::sstring _upload_id;
    unsigned _next_part_number = 1;
    std::vector<completed_part> _parts;
    upload_state _state = upload_state::not_started;
    std::exception_ptr _abort_cause;

    seastar::future<seastar::sstring> start_upload();
    void check_not_terminal(const char* op) const;

public:
    multipart_upload(seastar::shared_ptr<object_storage> client,
                     seastar::sstring bucket,
                     seastar::sstring key,
                     upload_request_config cfg,
                     seastar::abort_source* as = nullptr);

    multipart_upload(const multipart_upload&) = delete;
    multipart_upload& operator=(const multipart_upload&) = delete;

    // Issues the initiate call the first time it is needed. Every caller,
    // including concurrent ones, observes that single call's outcome.
    // Fails with initiate_upload_error, or with the abort cause once the
    // upload was aborted.
    seastar::future<seastar::sstring> ensure_started();

    // 1, 2, 3, ... Numbers are never reused, even if their upload fails.
    unsigned next_part_number();

    // Parts must be recorded in the order their numbers were issued.
    void record(completed_part part);

    // Completes the upload with the recorded parts, which may be none.
    // Fails with finalize_upload_error.
    seastar::future<upload_result> finalize();

    // Marks the upload as failed, keeping the first cause.
    void abort(std::exception_ptr cause) noexcept;

    upload_state state() const noexcept { return _state; }
    bool upload_started() const noexcept { return !_upload_id.empty(); }
    // Empty until the initiate call succeeded.
    const seastar::sstring& upload_id() const noexcept { return _upload_id; }
    const std::vector<completed_part>& parts() const noexcept { return _parts; }
    size_t parts_count() const noexcept { return _parts.size(); }
    const upload_request_config& config() const noexcept { return _cfg; }
    const seastar::sstring& bucket() const noexcept { return _bucket; }
    const seastar::sstring& key() const noexcept { return _key; }
    std::exception_ptr abort_cause() const noexcept { return _abort_cause; }
};

} // namespace objstore

template <>
struct fmt::formatter<objstore::upload_state> : fmt::formatter<std::string_view> {
    auto format(objstore::upload_state s, fmt::format_context& ctx) const {
        std::string_view name = "unknown";
        switch (s) {
        case objstore::upload_state::not_started: name = "not_started"; break;
        case objstore::upload_state::started: name = "started"; break;
        case objstore::upload_state::uploading: name = "uploading"; break;
        case objstore::upload_state::finalized: name = "finalized"; break;
        case objstore::upload_state::aborted: name = "aborted"; break;
        }
        return fmt::formatter<std::string_view>::format(name, ctx);
    }
};
