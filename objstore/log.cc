/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "objstore/log.hh"

namespace objstore {

seastar::logger objlog("objstore");

} // namespace objstore
