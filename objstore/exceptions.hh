/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <system_error>
#include <seastar/core/sstring.hh>

namespace objstore {

// Transport or store level failure, classified by errno
// (ENOENT, EACCES or EIO).
class storage_io_error : public std::system_error {
public:
    storage_io_error(int err, std::string what)
        : std::system_error(err, std::system_category(), std::move(what))
    {}
};

// Base of the errors that end a multipart upload. The store or transport
// failure that caused it is kept as the nested cause.
class upload_error : public std::runtime_error {
    seastar::sstring _bucket;
    seastar::sstring _key;
    std::exception_ptr _cause;

protected:
    upload_error(const std::string& what, seastar::sstring bucket, seastar::sstring key, std::exception_ptr cause);

public:
    const seastar::sstring& bucket() const noexcept { return _bucket; }
    const seastar::sstring& key() const noexcept { return _key; }
    std::exception_ptr cause() const noexcept { return _cause; }
};

class initiate_upload_error final : public upload_error {
public:
    initiate_upload_error(seastar::sstring bucket, seastar::sstring key, std::exception_ptr cause);
};

class upload_part_error final : public upload_error {
    unsigned _part_number;

public:
    upload_part_error(seastar::sstring bucket, seastar::sstring key, unsigned part_number, std::exception_ptr cause);

    unsigned part_number() const noexcept { return _part_number; }
};

class finalize_upload_error final : public upload_error {
public:
    finalize_upload_error(seastar::sstring bucket, seastar::sstring key, std::exception_ptr cause);
};

// "Part numbers can be any number from 1 to 10,000, inclusive."
class too_many_parts_error final : public std::length_error {
public:
    too_many_parts_error(const seastar::sstring& bucket, const seastar::sstring& key, unsigned maximum);
};

} // namespace objstore
