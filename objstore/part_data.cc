/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "objstore/part_data.hh"

#include <algorithm>

namespace objstore {

void part_data::put(seastar::temporary_buffer<char> buf) {
    if (buf.empty()) {
        return;
    }
    _size += buf.size();
    _bufs.push_back(std::move(buf));
}

seastar::sstring part_data::linearize() const {
    seastar::sstring ret(seastar::sstring::initialized_later(), _size);
    auto out = ret.data();
    for (const auto& buf : _bufs) {
        out = std::copy_n(buf.get(), buf.size(), out);
    }
    return ret;
}

} // namespace objstore
