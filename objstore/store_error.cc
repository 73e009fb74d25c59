/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "objstore/store_error.hh"

#include <cerrno>
#include <memory>
#include <fmt/format.h>
#include <seastar/http/exception.hh>
#include <seastar/util/log.hh>

#include "objstore/log.hh"
#include "objstore/utils/client_utils.hh"

namespace objstore {

store_error::store_error(seastar::sstring code, seastar::sstring message, seastar::http::reply::status_type status)
    : _code(std::move(code))
    , _message(std::move(message))
    , _status(status)
{}

std::optional<store_error> store_error::parse(seastar::sstring body, seastar::http::reply::status_type status) {
    if (body.empty()) {
        return std::nullopt;
    }
    auto doc = std::make_unique<rapidxml::xml_document<>>();
    try {
        doc->parse<0>(body.data());
    } catch (const rapidxml::parse_error& e) {
        objlog.debug("cannot parse error response: {}", e.what());
        return std::nullopt;
    }
    auto error_node = doc->first_node("Error");
    if (!error_node) {
        return std::nullopt;
    }
    auto code_node = error_node->first_node("Code");
    auto message_node = error_node->first_node("Message");
    return store_error(code_node ? code_node->value() : "",
                       message_node ? message_node->value() : "",
                       status);
}

store_error store_error::from_http_code(seastar::http::reply::status_type status) {
    return store_error("", fmt::format("HTTP status {}", static_cast<int>(status)), status);
}

store_exception::store_exception(store_error error)
    : std::runtime_error(fmt::format("{} ({})", error.code().empty() ? seastar::sstring("UnknownError") : error.code(), error.message()))
    , _error(std::move(error))
{}

storage_io_error map_store_exception(std::exception_ptr ex) {
    using status_type = seastar::http::reply::status_type;

    try {
        std::rethrow_exception(std::move(ex));
    } catch (const store_exception& e) {
        const auto& code = e.error().code();
        auto status = e.error().status();
        if (code == "NoSuchBucket" || code == "NoSuchKey" || code == "NoSuchUpload" || status == status_type::not_found) {
            return {ENOENT, fmt::format("Object store request failed. Code: {}. Reason: {}", code, e.what())};
        }
        if (code == "AccessDenied" || status == status_type::forbidden || status == status_type::unauthorized) {
            return {EACCES, fmt::format("Object store request failed. Code: {}. Reason: {}", code, e.what())};
        }
        return {EIO, fmt::format("Object store request failed. Code: {}. Reason: {}", code, e.what())};
    } catch (const seastar::httpd::unexpected_status_error& e) {
        auto status = e.status();
        if (seastar::http::reply::classify_status(status) == seastar::http::reply::status_class::redirection || status == status_type::not_found) {
            return {ENOENT, fmt::format("Object doesn't exist ({})", static_cast<int>(status))};
        }
        if (status == status_type::forbidden || status == status_type::unauthorized) {
            return {EACCES, fmt::format("Object store access denied ({})", static_cast<int>(status))};
        }
        return {EIO, fmt::format("Object store request failed with ({})", static_cast<int>(status))};
    } catch (const storage_io_error& e) {
        return e;
    } catch (...) {
        return {EIO, fmt::format("Object store error ({})", std::current_exception())};
    }
}

} // namespace objstore
