/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once
#if __has_include(<rapidxml.h>)
#include <rapidxml.h>
#else
#include <rapidxml/rapidxml.hpp>
#endif
#include <initializer_list>
#include <string_view>
#include <vector>
#include <seastar/core/iostream.hh>
#include <seastar/core/sstring.hh>

#include "objstore/object_storage.hh"

namespace objstore {

seastar::sstring parse_multipart_upload_id(seastar::sstring& body);
upload_result parse_complete_multipart_upload(seastar::sstring& body);
size_t prepare_multipart_upload_parts(const std::vector<completed_part>& parts);
seastar::future<> dump_multipart_upload_parts(seastar::output_stream<char> out, const std::vector<completed_part>& parts);
rapidxml::xml_node<>* first_node_of(rapidxml::xml_node<>* root, std::initializer_list<std::string_view> names);

} // namespace objstore
