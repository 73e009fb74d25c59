/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "objstore/utils/client_utils.hh"

#include <memory>
#include <stdexcept>
#include <fmt/format.h>
#include <seastar/core/coroutine.hh>
#include <seastar/coroutine/exception.hh>

#include "objstore/log.hh"
#include "objstore/store_error.hh"

static constexpr std::string_view multipart_upload_complete_header = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\r\n"
                                                                     "<CompleteMultipartUpload xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">";

static constexpr std::string_view multipart_upload_complete_entry = "<Part><ETag>{}</ETag><PartNumber>{}</PartNumber></Part>";

static constexpr std::string_view multipart_upload_complete_trailer = "</CompleteMultipartUpload>";

namespace objstore {

using namespace seastar;

sstring parse_multipart_upload_id(sstring& body) {
    auto doc = std::make_unique<rapidxml::xml_document<>>();
    try {
        doc->parse<0>(body.data());
    } catch (const rapidxml::parse_error& e) {
        objlog.warn("cannot parse initiate multipart upload response: {}", e.what());
        throw std::runtime_error("cannot parse initiate multipart upload response");
    }
    auto uploadid_node = first_node_of(doc.get(), {"InitiateMultipartUploadResult", "UploadId"});
    return uploadid_node->value();
}

upload_result parse_complete_multipart_upload(sstring& body) {
    auto doc = std::make_unique<rapidxml::xml_document<>>();
    try {
        doc->parse<0>(body.data());
    } catch (const rapidxml::parse_error& e) {
        objlog.warn("cannot parse complete multipart upload response: {}", e.what());
        throw std::runtime_error("cannot parse complete multipart upload response");
    }
    // CompleteMultipartUpload may fail after the 200 OK headers were sent,
    // in which case the body is an <Error> document.
    if (auto error_node = doc->first_node("Error")) {
        auto code = error_node->first_node("Code");
        auto message = error_node->first_node("Message");
        throw store_exception(store_error(code ? code->value() : "", message ? message->value() : "", http::reply::status_type::ok));
    }
    auto root_node = first_node_of(doc.get(), {"CompleteMultipartUploadResult"});
    auto value_of = [root_node] (const char* name) -> sstring {
        auto node = root_node->first_node(name);
        return node ? sstring(node->value()) : sstring();
    };
    return upload_result{
        .location = value_of("Location"),
        .bucket = value_of("Bucket"),
        .key = value_of("Key"),
        .etag = value_of("ETag"),
    };
}

size_t prepare_multipart_upload_parts(const std::vector<completed_part>& parts) {
    size_t ret = multipart_upload_complete_header.size();

    for (auto& part : parts) {
        // length of the format string - four braces + length of the etag + length of the number
        ret += multipart_upload_complete_entry.size() - 4 + part.etag.size() + fmt::formatted_size("{}", part.part_number);
    }
    ret += multipart_upload_complete_trailer.size();
    return ret;
}

future<> dump_multipart_upload_parts(output_stream<char> out, const std::vector<completed_part>& parts) {
    std::exception_ptr ex;
    try {
        co_await out.write(multipart_upload_complete_header.data(), multipart_upload_complete_header.size());

        for (auto& part : parts) {
            co_await out.write(fmt::format(fmt::runtime(multipart_upload_complete_entry), part.etag, part.part_number));
        }
        co_await out.write(multipart_upload_complete_trailer.data(), multipart_upload_complete_trailer.size());
        co_await out.flush();
    } catch (...) {
        ex = std::current_exception();
    }
    co_await out.close();
    if (ex) {
        co_await coroutine::return_exception_ptr(std::move(ex));
    }
}

rapidxml::xml_node<>* first_node_of(rapidxml::xml_node<>* root,
                                    std::initializer_list<std::string_view> names) {
    auto* node = root;
    for (auto name : names) {
        node = node->first_node(name.data(), name.size());
        if (!node) {
            throw std::runtime_error(fmt::format("'{}' is not found", name));
        }
    }
    return node;
}

} // namespace objstore
