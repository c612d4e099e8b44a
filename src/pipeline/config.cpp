#include <tabstream/pipeline/config.hpp>

#include <fmt/format.h>

#include <charconv>
#include <cmath>
#include <cstdlib>

namespace tabstream::pipeline {

namespace {

auto trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

auto lower(std::string_view text) -> std::string {
    std::string out(text);
    for (auto& ch : out) {
        if (ch >= 'A' && ch <= 'Z') {
            ch = static_cast<char>(ch - 'A' + 'a');
        }
    }
    return out;
}

auto parse_double(std::string_view text) -> std::optional<double> {
    std::string owned(trim(text));
    if (owned.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    double value = std::strtod(owned.c_str(), &end);
    if (end == owned.c_str() || *end != '\0') {
        return std::nullopt;
    }
    return value;
}

auto non_empty(const ParamLookup& lookup, std::string_view name) -> std::optional<std::string> {
    auto value = lookup(name);
    if (!value.has_value()) {
        return std::nullopt;
    }
    auto trimmed = trim(*value);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    return std::string(trimmed);
}

}  // namespace

auto transform_kind_name(TransformKind kind) noexcept -> std::string_view {
    switch (kind) {
        case TransformKind::Passthrough:
            return "passthrough";
        case TransformKind::ColumnScale:
            return "scale";
        case TransformKind::GroupAggregate:
            return "groupby";
    }
    return "unknown";
}

auto parse_transform_kind(std::string_view text) -> Result<TransformKind> {
    auto name = lower(trim(text));
    if (name == "passthrough" || name == "none") {
        return TransformKind::Passthrough;
    }
    if (name == "scale" || name == "column_scale") {
        return TransformKind::ColumnScale;
    }
    if (name == "groupby" || name == "group_aggregate") {
        return TransformKind::GroupAggregate;
    }
    return make_error(ErrorKind::InvalidArgument,
                      fmt::format("unknown transform '{}' (expected passthrough, scale or groupby)",
                                  text));
}

auto validate(const PipelineConfig& config, const Schema& schema) -> Result<void> {
    switch (config.transform) {
        case TransformKind::Passthrough:
            return {};
        case TransformKind::ColumnScale: {
            if (!schema.contains(config.scale_src)) {
                return make_error(ErrorKind::ColumnNotFound,
                                  fmt::format("scale column not found: {} (available: {})",
                                              config.scale_src, schema.format()));
            }
            if (config.scale_out.empty()) {
                return make_error(ErrorKind::ScaleTargetInvalid, "scale output column is empty");
            }
            if (config.scale_out != config.scale_src && schema.contains(config.scale_out)) {
                return make_error(
                    ErrorKind::ScaleTargetInvalid,
                    fmt::format("scale output column would overwrite existing column: {}",
                                config.scale_out));
            }
            if (!std::isfinite(config.scale_factor)) {
                return make_error(ErrorKind::ScaleTargetInvalid,
                                  fmt::format("scale factor must be finite, got {}",
                                              config.scale_factor));
            }
            return {};
        }
        case TransformKind::GroupAggregate:
            if (!schema.contains(config.groupby_key)) {
                return make_error(ErrorKind::ColumnNotFound,
                                  fmt::format("group-by column not found: {} (available: {})",
                                              config.groupby_key, schema.format()));
            }
            return {};
    }
    return make_error(ErrorKind::InvalidArgument, "unknown transform");
}

auto config_from_params(const ParamLookup& lookup) -> Result<PipelineConfig> {
    PipelineConfig config;
    auto transform = non_empty(lookup, "transform");
    auto scale_src = non_empty(lookup, "scale_src");
    auto scale_factor = non_empty(lookup, "scale_factor");
    auto scale_out = non_empty(lookup, "scale_out");
    auto groupby_key = non_empty(lookup, "groupby_key");

    if (transform.has_value()) {
        auto kind = parse_transform_kind(*transform);
        if (!kind) {
            return std::unexpected(kind.error());
        }
        config.transform = *kind;
    } else if (groupby_key.has_value() && scale_src.has_value()) {
        return make_error(ErrorKind::InvalidArgument,
                          "groupby_key and scale_src are mutually exclusive; set transform");
    } else if (groupby_key.has_value()) {
        config.transform = TransformKind::GroupAggregate;
    } else if (scale_src.has_value()) {
        config.transform = TransformKind::ColumnScale;
    }

    config.scale_src = scale_src.value_or("");
    config.scale_out = scale_out.value_or("");
    config.groupby_key = groupby_key.value_or("");
    if (scale_factor.has_value()) {
        auto factor = parse_double(*scale_factor);
        if (!factor.has_value()) {
            return make_error(ErrorKind::InvalidArgument,
                              fmt::format("scale_factor is not a number: {}", *scale_factor));
        }
        config.scale_factor = *factor;
    }
    return config;
}

auto split_column_list(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> names;
    std::size_t pos = 0;
    while (pos <= text.size()) {
        std::size_t comma = text.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = text.size();
        }
        auto token = trim(text.substr(pos, comma - pos));
        if (!token.empty()) {
            names.emplace_back(token);
        }
        if (comma == text.size()) {
            break;
        }
        pos = comma + 1;
    }
    return names;
}

auto parse_chunk_size(std::string_view text) -> Result<std::size_t> {
    auto trimmed = trim(text);
    std::size_t value = 0;
    auto result = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), value);
    if (trimmed.empty() || result.ec != std::errc() ||
        result.ptr != trimmed.data() + trimmed.size() || value == 0) {
        return make_error(ErrorKind::InvalidArgument,
                          fmt::format("chunksize must be a positive integer, got '{}'", text));
    }
    return value;
}

}  // namespace tabstream::pipeline
