/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <vector>
#include <seastar/core/sstring.hh>
#include <seastar/core/temporary_buffer.hh>

namespace objstore {

// Bytes of one part, kept as the buffers they arrived in.
class part_data {
    std::vector<seastar::temporary_buffer<char>> _bufs;
    size_t _size = 0;

public:
    part_data() = default;
    part_data(part_data&&) noexcept = default;
    part_data& operator=(part_data&&) noexcept = default;

    void put(seastar::temporary_buffer<char> buf);

    size_t size() const noexcept { return _size; }
    bool empty() const noexcept { return _size == 0; }
    const std::vector<seastar::temporary_buffer<char>>& buffers() const noexcept { return _bufs; }

    // Copies the content into one contiguous string.
    seastar::sstring linearize() const;
};

} // namespace objstore
