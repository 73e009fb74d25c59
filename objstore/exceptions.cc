/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "objstore/exceptions.hh"

#include <fmt/format.h>
#include <seastar/util/log.hh>

namespace objstore {

upload_error::upload_error(const std::string& what, seastar::sstring bucket, seastar::sstring key, std::exception_ptr cause)
    : std::runtime_error(what)
    , _bucket(std::move(bucket))
    , _key(std::move(key))
    , _cause(std::move(cause))
{}

initiate_upload_error::initiate_upload_error(seastar::sstring bucket, seastar::sstring key, std::exception_ptr cause)
    : upload_error(fmt::format("Cannot initiate multipart upload of /{}/{}: {}", bucket, key, cause), bucket, key, cause)
{}

upload_part_error::upload_part_error(seastar::sstring bucket, seastar::sstring key, unsigned part_number, std::exception_ptr cause)
    : upload_error(fmt::format("Cannot upload part {} of /{}/{}: {}", part_number, bucket, key, cause), bucket, key, cause)
    , _part_number(part_number)
{}

finalize_upload_error::finalize_upload_error(seastar::sstring bucket, seastar::sstring key, std::exception_ptr cause)
    : upload_error(fmt::format("Cannot complete multipart upload of /{}/{}: {}", bucket, key, cause), bucket, key, cause)
{}

too_many_parts_error::too_many_parts_error(const seastar::sstring& bucket, const seastar::sstring& key, unsigned maximum)
    : std::length_error(fmt::format("Multipart upload of /{}/{} exceeds {} parts", bucket, key, maximum))
{}

} // namespace objstore
