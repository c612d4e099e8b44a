#include <tabstream/emit/emitter.hpp>
#include <tabstream/pipeline/config.hpp>
#include <tabstream/pipeline/runner.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <map>
#include <optional>
#include <utility>
#include <string>

namespace {

auto exit_code_for(tabstream::ErrorKind kind) -> int {
    switch (kind) {
        case tabstream::ErrorKind::SourceNotFound:
            return 2;
        case tabstream::ErrorKind::SourceFormatError:
            return 3;
        default:
            return 1;
    }
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"tabstream_cat: stream a CSV file through a transform as NDJSON"};

    std::string path;
    std::size_t chunk_size = 50;
    std::string cols;
    bool verbose = false;
    std::map<std::string, std::string> params;

    app.add_option("path", path, "CSV file to read")->required();
    app.add_option("--chunksize", chunk_size, "Rows read per chunk")
        ->check(CLI::PositiveNumber);
    app.add_option("--cols", cols, "Comma separated columns to keep");
    app.add_option("--transform", params["transform"], "passthrough, scale or groupby");
    app.add_option("--scale-src", params["scale_src"], "Column to scale");
    app.add_option("--scale-factor", params["scale_factor"], "Scale multiplier");
    app.add_option("--scale-out", params["scale_out"], "Output column of the scale");
    app.add_option("--groupby", params["groupby_key"], "Group key column");
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");

    CLI11_PARSE(app, argc, argv);

    // Diagnostics go to stderr; stdout carries the records.
    spdlog::set_default_logger(spdlog::stderr_color_mt("tabstream"));
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);

    auto config = tabstream::pipeline::config_from_params(
        [&params](std::string_view name) -> std::optional<std::string> {
            auto it = params.find(std::string(name));
            if (it == params.end() || it->second.empty()) {
                return std::nullopt;
            }
            return it->second;
        });
    if (!config) {
        std::cerr << config.error().format() << '\n';
        return exit_code_for(config.error().kind);
    }

    tabstream::source::SourceOptions options;
    options.path = path;
    options.chunk_size = chunk_size;
    options.columns = tabstream::pipeline::split_column_list(cols);

    tabstream::pipeline::PipelineRunner runner(std::move(options), std::move(*config));
    auto summary = tabstream::emit::emit(runner, tabstream::emit::ostream_sink(std::cout));
    if (summary.outcome == tabstream::emit::EmitOutcome::Failed) {
        std::cerr << summary.error->format() << '\n';
        return exit_code_for(summary.error->kind);
    }
    spdlog::debug("{} records, {} bytes", summary.records, summary.bytes);
    return 0;
}
