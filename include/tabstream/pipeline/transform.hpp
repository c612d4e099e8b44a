#pragma once

#include <tabstream/core/error.hpp>
#include <tabstream/core/value.hpp>
#include <tabstream/pipeline/config.hpp>

#include <robin_hood.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tabstream::pipeline {

/// Row-level counters a transform updates while it runs.
struct TransformStats {
    /// ColumnScale rows whose source value was present but not numeric.
    std::uint64_t type_mismatches = 0;
    /// GroupAggregate rows skipped because the key was null.
    std::uint64_t null_keys = 0;
};

/// Running count and sum for one (group, column) pair.
struct GroupAccumulator {
    std::int64_t count = 0;
    std::int64_t int_sum = 0;
    double sum = 0.0;
    /// Every contributing value was int64 and int_sum has not overflowed.
    bool integral = true;
};

/// Cross-chunk state of a GroupAggregate run.
///
/// Groups are numbered in first-occurrence order; accumulators live in one flat
/// array laid out as slots[group * width + column].
class AggregationState {
   public:
    AggregationState() = default;

    /// Reset for `width` aggregated columns, dropping all groups.
    void reset(std::size_t width);

    /// Group id for `key`, creating the group on first sight.
    auto group_for(const Value& key) -> std::uint32_t;

    [[nodiscard]] auto slot(std::uint32_t group, std::size_t column) -> GroupAccumulator& {
        return slots_[static_cast<std::size_t>(group) * width_ + column];
    }
    [[nodiscard]] auto slot(std::uint32_t group, std::size_t column) const
        -> const GroupAccumulator& {
        return slots_[static_cast<std::size_t>(group) * width_ + column];
    }

    void add_row(std::uint32_t group) { ++row_counts_[group]; }
    [[nodiscard]] auto row_count(std::uint32_t group) const -> std::int64_t {
        return row_counts_[group];
    }

    /// Mark column as having held at least one numeric value in some group.
    void mark_numeric(std::size_t column) { observed_numeric_[column] = true; }
    [[nodiscard]] auto observed_numeric(std::size_t column) const -> bool {
        return observed_numeric_[column];
    }

    [[nodiscard]] auto group_count() const noexcept -> std::size_t { return keys_.size(); }
    [[nodiscard]] auto key(std::uint32_t group) const -> const Value& { return keys_[group]; }
    [[nodiscard]] auto width() const noexcept -> std::size_t { return width_; }

    /// Release every group and its accumulators.
    void clear() noexcept;

   private:
    robin_hood::unordered_flat_map<Value, std::uint32_t, std::hash<Value>> key_to_group_;
    std::vector<Value> keys_;
    std::vector<GroupAccumulator> slots_;
    std::vector<std::int64_t> row_counts_;
    std::vector<bool> observed_numeric_;
    std::size_t width_ = 0;
};

/// Emits every row unchanged.
class Passthrough {
   public:
    explicit Passthrough(SchemaPtr schema) : schema_(std::move(schema)) {}

    [[nodiscard]] auto apply(Chunk chunk, AggregationState& state, TransformStats& stats) const
        -> std::vector<Record>;
    [[nodiscard]] auto finish(AggregationState& state) const -> std::vector<Record>;
    [[nodiscard]] auto output_schema() const noexcept -> const SchemaPtr& { return schema_; }

   private:
    SchemaPtr schema_;
};

/// Writes scale_src * factor into scale_out; non-numeric input yields null.
class ColumnScale {
   public:
    ColumnScale(const SchemaPtr& input, std::size_t src, std::string out_name, double factor);

    [[nodiscard]] auto apply(Chunk chunk, AggregationState& state, TransformStats& stats) const
        -> std::vector<Record>;
    [[nodiscard]] auto finish(AggregationState& state) const -> std::vector<Record>;
    [[nodiscard]] auto output_schema() const noexcept -> const SchemaPtr& { return schema_; }

    [[nodiscard]] auto scale(const Value& value) const -> Value;

   private:
    SchemaPtr schema_;
    std::size_t src_ = 0;
    std::size_t out_ = 0;
    bool appends_ = false;
    double factor_ = 1.0;
    bool integral_factor_ = false;
    std::int64_t int_factor_ = 0;
};

/// Accumulates count/sum per group and numeric column; emits summaries at the end.
///
/// apply() never returns records: the read and accumulate phase streams with
/// bounded memory, while emission is a single burst from finish() after the
/// source is exhausted.
class GroupAggregate {
   public:
    GroupAggregate(const SchemaPtr& input, std::size_t key);

    [[nodiscard]] auto apply(Chunk chunk, AggregationState& state, TransformStats& stats) const
        -> std::vector<Record>;
    [[nodiscard]] auto finish(AggregationState& state) const -> std::vector<Record>;

    /// Column positions (in the input schema) that take part in aggregation.
    [[nodiscard]] auto value_columns() const noexcept -> const std::vector<std::size_t>& {
        return columns_;
    }

   private:
    SchemaPtr input_;
    std::size_t key_ = 0;
    std::vector<std::size_t> columns_;
};

/// Closed set of per-chunk computations.
using Transform = std::variant<Passthrough, ColumnScale, GroupAggregate>;

/// Validate `config` against `schema` and build the matching transform.
[[nodiscard]] auto make_transform(const PipelineConfig& config, const SchemaPtr& schema)
    -> Result<Transform>;

/// Prepare `state` for a run of `transform`.
void init_state(const Transform& transform, AggregationState& state);

[[nodiscard]] auto apply(const Transform& transform, Chunk chunk, AggregationState& state,
                         TransformStats& stats) -> std::vector<Record>;

[[nodiscard]] auto finish(const Transform& transform, AggregationState& state)
    -> std::vector<Record>;

}  // namespace tabstream::pipeline
