/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <vector>
#include <fmt/format.h>
#include <seastar/core/abort_source.hh>
#include <seastar/core/future.hh>
#include <seastar/core/sstring.hh>
#include <seastar/core/units.hh>

#include "objstore/config.hh"
#include "objstore/part_data.hh"
#include "objstore/seastarx.hh"

namespace objstore {

// "Each part must be at least 5 MB in size, except the last part."
// https://docs.aws.amazon.com/AmazonS3/latest/API/API_UploadPart.html
static constexpr size_t aws_minimum_part_size = 5_MiB;
// "Part numbers can be any number from 1 to 10,000, inclusive."
// https://docs.aws.amazon.com/AmazonS3/latest/API/API_UploadPart.html
static constexpr unsigned aws_maximum_parts_in_upload = 10'000;

struct completed_part {
    unsigned part_number;
    seastar::sstring etag;

    bool operator==(const completed_part&) const = default;
};

// What the store reports about the object assembled by a completed upload.
struct upload_result {
    seastar::sstring location;
    seastar::sstring bucket;
    seastar::sstring key;
    seastar::sstring etag;
};

// The three multipart calls of an object store. Implementations report
// failures through exceptional futures; they never retry on their own
// behalf as far as this interface is concerned.
class object_storage {
public:
    virtual ~object_storage() = default;

    // Returns the upload id issued by the store.
    virtual seastar::future<seastar::sstring> initiate_upload(seastar::sstring bucket,
                                                              seastar::sstring key,
                                                              const upload_request_config& cfg,
                                                              seastar::abort_source* as) = 0;

    // Returns the entity tag of the stored part.
    virtual seastar::future<seastar::sstring> upload_part(seastar::sstring bucket,
                                                          seastar::sstring key,
                                                          seastar::sstring upload_id,
                                                          unsigned part_number,
                                                          part_data data,
                                                          const upload_request_config& cfg,
                                                          seastar::abort_source* as) = 0;

    // The parts must be listed in ascending part number order.
    virtual seastar::future<upload_result> complete_upload(seastar::sstring bucket,
                                                           seastar::sstring key,
                                                           seastar::sstring upload_id,
                                                           std::vector<completed_part> parts,
                                                           const upload_request_config& cfg,
                                                           seastar::abort_source* as) = 0;

    virtual seastar::future<> close() = 0;
};

} // namespace objstore

template <>
struct fmt::formatter<objstore::completed_part> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }
    auto format(const objstore::completed_part& p, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{{part={}, etag={}}}", p.part_number, p.etag);
    }
};

template <>
struct fmt::formatter<objstore::upload_result> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }
    auto format(const objstore::upload_result& r, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{{location={}, bucket={}, key={}, etag={}}}", r.location, r.bucket, r.key, r.etag);
    }
};
