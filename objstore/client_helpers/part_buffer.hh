/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <optional>
#include <seastar/core/temporary_buffer.hh>

#include "objstore/object_storage.hh"
#include "objstore/part_data.hh"

namespace objstore {

// Throws std::invalid_argument unless 0 < size <= aws_minimum_part_size.
// The minimum can only be lowered, for stores with smaller limits.
void validate_min_part_size(size_t size);

// Coalesces an arbitrarily chunked byte stream into parts of at least
// min_part_size bytes. Only the residue returned by flush() may be smaller.
// Chunks are never split, so a part can be much larger than the minimum.
class part_buffer {
    size_t _min_part_size;
    part_data _pending;
    bool _spent = false;

public:
    explicit part_buffer(size_t min_part_size = aws_minimum_part_size);

    // Returns the accumulated bytes once they reach the threshold.
    std::optional<part_data> append(seastar::temporary_buffer<char> chunk);

    // End of stream. Returns the residue, if any, and makes the buffer
    // unusable.
    std::optional<part_data> flush();

    size_t pending_size() const noexcept { return _pending.size(); }
    size_t min_part_size() const noexcept { return _min_part_size; }
    bool spent() const noexcept { return _spent; }
};

} // namespace objstore
