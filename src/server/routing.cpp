#include <tabstream/emit/ndjson.hpp>
#include <tabstream/server/routing.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <system_error>

namespace tabstream::server {

auto resolve_data_path(const std::filesystem::path& root, std::string_view requested)
    -> Result<std::filesystem::path> {
    if (requested.empty()) {
        return make_error(ErrorKind::SourceNotFound, "empty path");
    }
    std::error_code ec;
    auto base = std::filesystem::weakly_canonical(root, ec);
    if (ec) {
        return make_error(ErrorKind::SourceNotFound,
                          fmt::format("data root unavailable: {}", root.string()));
    }
    auto target = std::filesystem::weakly_canonical(base / std::string(requested), ec);
    if (ec) {
        return make_error(ErrorKind::SourceNotFound, fmt::format("not found: {}", requested));
    }

    // Target must lie inside base.
    auto mismatch = std::mismatch(base.begin(), base.end(), target.begin(), target.end());
    if (mismatch.first != base.end()) {
        return make_error(ErrorKind::SourceNotFound, fmt::format("not found: {}", requested));
    }
    if (!std::filesystem::is_regular_file(target, ec)) {
        return make_error(ErrorKind::SourceNotFound, fmt::format("not found: {}", requested));
    }
    return target;
}

auto parse_run_request(const ServerConfig& config, const pipeline::ParamLookup& lookup)
    -> Result<RunRequest> {
    RunRequest request;

    auto path = lookup("path");
    if (!path.has_value() || path->empty()) {
        return make_error(ErrorKind::InvalidArgument, "missing required parameter: path");
    }
    auto resolved = resolve_data_path(config.data_root, *path);
    if (!resolved) {
        return std::unexpected(resolved.error());
    }
    request.source.path = resolved->string();

    request.source.chunk_size = config.default_chunk_size;
    if (auto text = lookup("chunksize"); text.has_value()) {
        auto size = pipeline::parse_chunk_size(*text);
        if (!size) {
            return std::unexpected(size.error());
        }
        if (*size > config.max_chunk_size) {
            return make_error(ErrorKind::InvalidArgument,
                              fmt::format("chunksize {} exceeds the limit of {}", *size,
                                          config.max_chunk_size));
        }
        request.source.chunk_size = *size;
    }
    if (auto cols = lookup("cols"); cols.has_value()) {
        request.source.columns = pipeline::split_column_list(*cols);
    }

    auto pipeline_config = pipeline::config_from_params(lookup);
    if (!pipeline_config) {
        return std::unexpected(pipeline_config.error());
    }
    request.pipeline = std::move(*pipeline_config);
    return request;
}

auto http_status_for(ErrorKind kind) noexcept -> int {
    switch (kind) {
        case ErrorKind::SourceNotFound:
            return 404;
        case ErrorKind::ColumnNotFound:
        case ErrorKind::ScaleTargetInvalid:
        case ErrorKind::InvalidArgument:
            return 400;
        case ErrorKind::SourceFormatError:
        case ErrorKind::TypeMismatch:
            return 422;
    }
    return 500;
}

auto error_body(const Error& error) -> std::string {
    std::string out = "{\"error\":";
    emit::append_json_string(out, error_kind_name(error.kind));
    out.append(",\"detail\":");
    emit::append_json_string(out, error.message);
    out.append("}");
    return out;
}

auto usage_body(const ServerConfig& config) -> std::string {
    std::string out = "{\"try\":";
    emit::append_json_string(
        out, fmt::format("/stream/rows?path=data/sample.csv&chunksize={}", config.default_chunk_size));
    out.append(",\"format\":");
    emit::append_json_string(out, emit::kNdjsonContentType);
    out.append(",\"notes\":");
    emit::append_json_string(
        out,
        "Params: path (CSV, relative to the data root), chunksize, cols (csv), "
        "transform (passthrough|scale|groupby), scale_src, scale_factor, scale_out, groupby_key");
    out.append("}");
    return out;
}

}  // namespace tabstream::server
