#include <tabstream/server/http_server.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <string>

auto main(int argc, char** argv) -> int {
    CLI::App app{"tabstream_server: stream CSV transforms over HTTP as NDJSON"};

    tabstream::server::ServerConfig config;
    bool verbose = false;
    std::string data_root;
    app.add_option("--host", config.host, "Address to bind")->capture_default_str();
    app.add_option("--port", config.port, "Port to listen on")
        ->check(CLI::Range(1, 65535))
        ->capture_default_str();
    app.add_option("--data-root", data_root,
                   "Directory request paths resolve under. "
                   "Defaults to TABSTREAM_DATA_ROOT, then the working directory.");
    app.add_option("--chunksize", config.default_chunk_size,
                   "Chunk size when a request gives none")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");

    CLI11_PARSE(app, argc, argv);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    if (data_root.empty()) {
        const char* env = std::getenv("TABSTREAM_DATA_ROOT");
        if (env != nullptr) {
            data_root = env;
        }
    }
    if (!data_root.empty()) {
        config.data_root = data_root;
    }

    tabstream::server::HttpServer server(config);
    return server.run();
}
