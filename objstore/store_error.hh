/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <exception>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <seastar/core/sstring.hh>
#include <seastar/http/reply.hh>

#include "objstore/exceptions.hh"

namespace objstore {

// The <Error> document an S3-compatible store returns for a rejected request.
// See https://docs.aws.amazon.com/AmazonS3/latest/API/ErrorResponses.html
class store_error {
    seastar::sstring _code;
    seastar::sstring _message;
    seastar::http::reply::status_type _status;

public:
    store_error(seastar::sstring code, seastar::sstring message, seastar::http::reply::status_type status);

    const seastar::sstring& code() const noexcept { return _code; }
    const seastar::sstring& message() const noexcept { return _message; }
    seastar::http::reply::status_type status() const noexcept { return _status; }

    // Returns nullopt when the body is not an <Error> document.
    static std::optional<store_error> parse(seastar::sstring body, seastar::http::reply::status_type status);
    static store_error from_http_code(seastar::http::reply::status_type status);
};

class store_exception : public std::runtime_error {
    store_error _error;

public:
    explicit store_exception(store_error error);

    const store_error& error() const noexcept { return _error; }
};

// Translates whatever a store request failed with into a storage_io_error
// carrying ENOENT, EACCES or EIO.
storage_io_error map_store_exception(std::exception_ptr ex);

} // namespace objstore
