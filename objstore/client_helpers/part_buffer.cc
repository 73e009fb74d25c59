/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "objstore/client_helpers/part_buffer.hh"

#include <stdexcept>
#include <utility>
#include <fmt/format.h>

namespace objstore {

void validate_min_part_size(size_t size) {
    if (size == 0 || size > aws_minimum_part_size) {
        throw std::invalid_argument(fmt::format("Minimum part size must be in (0, {}], got {}", aws_minimum_part_size, size));
    }
}

part_buffer::part_buffer(size_t min_part_size)
    : _min_part_size(min_part_size)
{
    validate_min_part_size(_min_part_size);
}

std::optional<part_data> part_buffer::append(seastar::temporary_buffer<char> chunk) {
    if (_spent) {
        throw std::logic_error("append() on a flushed part buffer");
    }
    _pending.put(std::move(chunk));
    if (_pending.size() < _min_part_size) {
        return std::nullopt;
    }
    return std::exchange(_pending, part_data{});
}

std::optional<part_data> part_buffer::flush() {
    if (_spent) {
        throw std::logic_error("flush() on a flushed part buffer");
    }
    _spent = true;
    if (_pending.empty()) {
        return std::nullopt;
    }
    return std::exchange(_pending, part_data{});
}

} // namespace objstore
