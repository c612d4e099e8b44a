#pragma once

#include <tabstream/core/error.hpp>
#include <tabstream/core/value.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tabstream::pipeline {

enum class TransformKind : std::uint8_t {
    Passthrough,
    ColumnScale,
    GroupAggregate,
};

[[nodiscard]] auto transform_kind_name(TransformKind kind) noexcept -> std::string_view;

/// Accepts "passthrough"/"none", "scale"/"column_scale", "groupby"/"group_aggregate".
[[nodiscard]] auto parse_transform_kind(std::string_view text) -> Result<TransformKind>;

/// Immutable description of the transform a run applies.
struct PipelineConfig {
    TransformKind transform = TransformKind::Passthrough;
    std::string scale_src;
    double scale_factor = 1.0;
    std::string scale_out;
    std::string groupby_key;
};

/// Check the config against the source schema. ColumnNotFound or ScaleTargetInvalid.
[[nodiscard]] auto validate(const PipelineConfig& config, const Schema& schema) -> Result<void>;

/// Lookup of a named request parameter; nullopt when absent.
using ParamLookup = std::function<std::optional<std::string>(std::string_view)>;

/// Build a config from text parameters (query string or command line).
///
/// Recognised names: transform, scale_src, scale_factor, scale_out, groupby_key.
/// Without `transform`, the kind is inferred: groupby_key selects GroupAggregate,
/// scale_src selects ColumnScale, otherwise Passthrough.
[[nodiscard]] auto config_from_params(const ParamLookup& lookup) -> Result<PipelineConfig>;

/// Split "a,b,c" into trimmed, non-empty names.
[[nodiscard]] auto split_column_list(std::string_view text) -> std::vector<std::string>;

/// Parse a positive chunk size.
[[nodiscard]] auto parse_chunk_size(std::string_view text) -> Result<std::size_t>;

}  // namespace tabstream::pipeline
