/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <filesystem>
#include <iostream>
#include <seastar/core/app-template.hh>
#include <seastar/core/coroutine.hh>
#include <seastar/core/file.hh>
#include <seastar/core/fstream.hh>
#include <seastar/core/seastar.hh>
#include <seastar/coroutine/exception.hh>

#include "objstore/client_helpers/upload_sink.hh"
#include "objstore/config.hh"
#include "objstore/s3_client.hh"

namespace fs = std::filesystem;

seastar::logger ulog("upload");

// Streams a local file into the object store as one multipart upload,
// reading it in transmit_size chunks.
static seastar::future<objstore::upload_result> upload(const objstore::objstore_config& cfg, fs::path path, seastar::sstring bucket, seastar::sstring key, size_t transmit_size) {
    auto client = objstore::s3_client::make(seastar::make_lw_shared<objstore::endpoint_config>(cfg.endpoint));

    std::exception_ptr ex;
    objstore::upload_result result;
    try {
        auto f = co_await seastar::open_file_dma(path.native(), seastar::open_flags::ro);
        seastar::file_input_stream_options options;
        options.buffer_size = transmit_size;
        options.read_ahead = 2;
        auto in = seastar::make_file_input_stream(std::move(f), options);

        objstore::streaming_upload_sink sink(client, std::move(bucket), std::move(key), cfg.request, cfg.min_part_size);
        try {
            result = co_await sink.consume(in);
        } catch (...) {
            ex = std::current_exception();
        }
        co_await in.close();
    } catch (...) {
        ex = std::current_exception();
    }
    co_await client->close();
    if (ex) {
        co_await seastar::coroutine::return_exception_ptr(std::move(ex));
    }
    co_return result;
}

int main(int argc, char** argv) {
    namespace bpo = boost::program_options;
    seastar::app_template app;
    app.add_options()
        ("config", bpo::value<std::string>()->required(), "YAML configuration with the endpoint and request settings")
        ("file", bpo::value<std::string>()->required(), "file to upload")
        ("key", bpo::value<std::string>()->required(), "object key")
        ("bucket", bpo::value<std::string>(), "bucket, overrides the one in the configuration")
        ("min-part-size", bpo::value<size_t>(), "minimum part size in bytes, at most 5MiB")
        ("transmit-size", bpo::value<size_t>(), "size of the chunks read from the file, overrides the configuration")
    ;

    return app.run(argc, argv, [&app] () -> seastar::future<int> {
        auto& opts = app.configuration();
        try {
            auto cfg = objstore::objstore_config::load(opts["config"].as<std::string>());
            if (opts.contains("bucket")) {
                cfg.bucket = opts["bucket"].as<std::string>();
            }
            if (opts.contains("min-part-size")) {
                cfg.min_part_size = opts["min-part-size"].as<size_t>();
                objstore::validate_min_part_size(cfg.min_part_size);
            }
            if (opts.contains("transmit-size")) {
                cfg.transmit_size = opts["transmit-size"].as<size_t>();
                objstore::validate_transmit_size(cfg.transmit_size);
            }
            if (cfg.bucket.empty()) {
                throw std::invalid_argument("No bucket given");
            }
            ulog.info("Uploading {} to {}/{}/{}", opts["file"].as<std::string>(), cfg.endpoint, cfg.bucket, opts["key"].as<std::string>());
            auto result = co_await upload(cfg, opts["file"].as<std::string>(), cfg.bucket, opts["key"].as<std::string>(), cfg.transmit_size);
            std::cout << fmt::format("{}", result) << std::endl;
            co_return 0;
        } catch (...) {
            ulog.error("Upload failed: {}", std::current_exception());
        }
        co_return 1;
    });
}
