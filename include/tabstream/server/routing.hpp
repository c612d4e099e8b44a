#pragma once

#include <tabstream/core/error.hpp>
#include <tabstream/pipeline/config.hpp>
#include <tabstream/source/chunk_source.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace tabstream::server {

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8000;
    /// Requested paths resolve under this directory; anything outside is not found.
    std::string data_root = ".";
    std::size_t default_chunk_size = 50;
    std::size_t max_chunk_size = 1'000'000;
};

/// Everything needed to construct one PipelineRunner.
struct RunRequest {
    source::SourceOptions source;
    pipeline::PipelineConfig pipeline;
};

/// Resolve `requested` under `root`. SourceNotFound when it escapes the root
/// or does not name a regular file.
[[nodiscard]] auto resolve_data_path(const std::filesystem::path& root, std::string_view requested)
    -> Result<std::filesystem::path>;

/// Build a run from request parameters: path, chunksize, cols, and the
/// transform parameters understood by pipeline::config_from_params().
[[nodiscard]] auto parse_run_request(const ServerConfig& config,
                                     const pipeline::ParamLookup& lookup) -> Result<RunRequest>;

/// HTTP status a failed run start maps to.
[[nodiscard]] auto http_status_for(ErrorKind kind) noexcept -> int;

/// JSON body describing `error`.
[[nodiscard]] auto error_body(const Error& error) -> std::string;

/// JSON document served at `/`.
[[nodiscard]] auto usage_body(const ServerConfig& config) -> std::string;

}  // namespace tabstream::server
