#include <tabstream/pipeline/transform.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace tabstream::pipeline {

namespace {

// Largest magnitude at which every integral double is exactly representable.
constexpr double kMaxExactIntegral = 9007199254740992.0;

// 2^63: doubles in [-2^63, 2^63) convert to int64 without overflow.
constexpr double kInt64Bound = 9223372036854775808.0;

/// Group identity of a key cell: integral doubles fold onto int64 so that `1` and
/// `1.0` share a group; NaN is treated as a missing key.
auto canonical_key(const Value& key) -> Value {
    const auto* d = std::get_if<double>(&key);
    if (d == nullptr) {
        return key;
    }
    if (std::isnan(*d)) {
        return std::monostate{};
    }
    if (std::trunc(*d) == *d && *d >= -kInt64Bound && *d < kInt64Bound) {
        return static_cast<std::int64_t>(*d);
    }
    return key;
}

auto rows_to_records(Chunk chunk, const SchemaPtr& schema) -> std::vector<Record> {
    std::vector<Record> records;
    records.reserve(chunk.rows.size());
    for (auto& row : chunk.rows) {
        records.push_back(Record{.schema = schema, .values = std::move(row)});
    }
    return records;
}

}  // namespace

// ─── AggregationState ─────────────────────────────────────────────────────────

void AggregationState::reset(std::size_t width) {
    clear();
    width_ = width;
    observed_numeric_.assign(width, false);
}

auto AggregationState::group_for(const Value& key) -> std::uint32_t {
    if (auto it = key_to_group_.find(key); it != key_to_group_.end()) {
        return it->second;
    }
    auto group = static_cast<std::uint32_t>(keys_.size());
    key_to_group_.emplace(key, group);
    keys_.push_back(key);
    slots_.resize(slots_.size() + width_);
    row_counts_.push_back(0);
    return group;
}

void AggregationState::clear() noexcept {
    key_to_group_.clear();
    std::vector<Value>().swap(keys_);
    std::vector<GroupAccumulator>().swap(slots_);
    std::vector<std::int64_t>().swap(row_counts_);
    std::fill(observed_numeric_.begin(), observed_numeric_.end(), false);
}

// ─── Passthrough ──────────────────────────────────────────────────────────────

auto Passthrough::apply(Chunk chunk, AggregationState& /*state*/, TransformStats& /*stats*/) const
    -> std::vector<Record> {
    return rows_to_records(std::move(chunk), schema_);
}

auto Passthrough::finish(AggregationState& /*state*/) const -> std::vector<Record> {
    return {};
}

// ─── ColumnScale ──────────────────────────────────────────────────────────────

ColumnScale::ColumnScale(const SchemaPtr& input, std::size_t src, std::string out_name,
                         double factor)
    : src_(src), factor_(factor) {
    if (auto pos = input->find(out_name); pos.has_value()) {
        schema_ = input;
        out_ = *pos;
    } else {
        auto extended = std::make_shared<Schema>(*input);
        out_ = extended->add_column(std::move(out_name));
        schema_ = std::move(extended);
        appends_ = true;
    }
    integral_factor_ = std::trunc(factor_) == factor_ && std::fabs(factor_) <= kMaxExactIntegral;
    if (integral_factor_) {
        int_factor_ = static_cast<std::int64_t>(factor_);
    }
}

auto ColumnScale::scale(const Value& value) const -> Value {
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        if (integral_factor_) {
            std::int64_t product = 0;
            if (!__builtin_mul_overflow(*i, int_factor_, &product)) {
                return product;
            }
        }
        return static_cast<double>(*i) * factor_;
    }
    if (const auto* d = std::get_if<double>(&value)) {
        return *d * factor_;
    }
    return std::monostate{};
}

auto ColumnScale::apply(Chunk chunk, AggregationState& /*state*/, TransformStats& stats) const
    -> std::vector<Record> {
    for (auto& row : chunk.rows) {
        const Value& input = row[src_];
        if (!is_null(input) && !is_numeric(input)) {
            ++stats.type_mismatches;
            spdlog::trace("scale: row {} column {} is not numeric",
                          chunk.first_row + static_cast<std::uint64_t>(&row - chunk.rows.data()),
                          schema_->name(src_));
        }
        Value scaled = scale(input);
        if (appends_) {
            row.push_back(std::move(scaled));
        } else {
            row[out_] = std::move(scaled);
        }
    }
    return rows_to_records(std::move(chunk), schema_);
}

auto ColumnScale::finish(AggregationState& /*state*/) const -> std::vector<Record> {
    return {};
}

// ─── GroupAggregate ───────────────────────────────────────────────────────────

GroupAggregate::GroupAggregate(const SchemaPtr& input, std::size_t key) : input_(input), key_(key) {
    columns_.reserve(input_->size());
    for (std::size_t i = 0; i < input_->size(); ++i) {
        if (i != key_) {
            columns_.push_back(i);
        }
    }
}

auto GroupAggregate::apply(Chunk chunk, AggregationState& state, TransformStats& stats) const
    -> std::vector<Record> {
    for (const auto& row : chunk.rows) {
        Value key = canonical_key(row[key_]);
        if (is_null(key)) {
            ++stats.null_keys;
            continue;
        }
        auto group = state.group_for(key);
        state.add_row(group);
        for (std::size_t c = 0; c < columns_.size(); ++c) {
            const Value& value = row[columns_[c]];
            auto& acc = state.slot(group, c);
            if (const auto* i = std::get_if<std::int64_t>(&value)) {
                ++acc.count;
                acc.sum += static_cast<double>(*i);
                if (acc.integral && __builtin_add_overflow(acc.int_sum, *i, &acc.int_sum)) {
                    acc.integral = false;
                }
                state.mark_numeric(c);
            } else if (const auto* d = std::get_if<double>(&value);
                       d != nullptr && !std::isnan(*d)) {
                // NaN is skipped like null; infinities are summed.
                ++acc.count;
                acc.sum += *d;
                acc.integral = false;
                state.mark_numeric(c);
            }
        }
    }
    return {};
}

auto GroupAggregate::finish(AggregationState& state) const -> std::vector<Record> {
    std::vector<std::size_t> numeric;
    for (std::size_t c = 0; c < columns_.size(); ++c) {
        if (state.observed_numeric(c)) {
            numeric.push_back(c);
        }
    }

    const auto& key_name = input_->name(key_);
    const bool collides = key_name == "count" || key_name == "sum" || key_name == "mean";
    const bool flat_names = numeric.size() == 1 && !collides;

    auto schema = std::make_shared<Schema>();
    // Derived names may clash with the key or each other; keep every output column distinct.
    auto add_unique = [&schema](std::string name) {
        if (schema->contains(name)) {
            std::size_t suffix = 1;
            while (schema->contains(fmt::format("{}.{}", name, suffix))) {
                ++suffix;
            }
            name = fmt::format("{}.{}", name, suffix);
        }
        schema->add_column(std::move(name));
    };
    add_unique(key_name);
    if (numeric.empty()) {
        add_unique(collides ? key_name + "_count" : "count");
    } else if (flat_names) {
        add_unique("count");
        add_unique("sum");
        add_unique("mean");
    } else {
        for (auto c : numeric) {
            const auto& name = input_->name(columns_[c]);
            add_unique(name + "_count");
            add_unique(name + "_sum");
            add_unique(name + "_mean");
        }
    }
    SchemaPtr out_schema = std::move(schema);

    std::vector<Record> records;
    records.reserve(state.group_count());
    for (std::uint32_t g = 0; g < state.group_count(); ++g) {
        Row row;
        row.reserve(out_schema->size());
        row.push_back(state.key(g));
        if (numeric.empty()) {
            row.emplace_back(state.row_count(g));
        }
        for (auto c : numeric) {
            const auto& acc = state.slot(g, c);
            row.emplace_back(acc.count);
            if (acc.integral) {
                row.emplace_back(acc.int_sum);
            } else {
                row.emplace_back(acc.sum);
            }
            if (acc.count == 0) {
                row.emplace_back(std::monostate{});
            } else {
                row.emplace_back(acc.sum / static_cast<double>(acc.count));
            }
        }
        records.push_back(Record{.schema = out_schema, .values = std::move(row)});
    }

    spdlog::debug("groupby {}: {} groups over {} numeric columns", key_name, records.size(),
                  numeric.size());
    state.clear();
    return records;
}

// ─── Variant dispatch ─────────────────────────────────────────────────────────

auto make_transform(const PipelineConfig& config, const SchemaPtr& schema) -> Result<Transform> {
    if (auto valid = validate(config, *schema); !valid) {
        return std::unexpected(valid.error());
    }
    switch (config.transform) {
        case TransformKind::Passthrough:
            return Transform{Passthrough{schema}};
        case TransformKind::ColumnScale:
            return Transform{ColumnScale{schema, *schema->find(config.scale_src),
                                         config.scale_out, config.scale_factor}};
        case TransformKind::GroupAggregate:
            return Transform{GroupAggregate{schema, *schema->find(config.groupby_key)}};
    }
    return make_error(ErrorKind::InvalidArgument,
                      fmt::format("unsupported transform: {}",
                                  static_cast<int>(config.transform)));
}

void init_state(const Transform& transform, AggregationState& state) {
    if (const auto* agg = std::get_if<GroupAggregate>(&transform)) {
        state.reset(agg->value_columns().size());
    } else {
        state.reset(0);
    }
}

auto apply(const Transform& transform, Chunk chunk, AggregationState& state,
           TransformStats& stats) -> std::vector<Record> {
    return std::visit(
        [&](const auto& t) { return t.apply(std::move(chunk), state, stats); }, transform);
}

auto finish(const Transform& transform, AggregationState& state) -> std::vector<Record> {
    return std::visit([&](const auto& t) { return t.finish(state); }, transform);
}

}  // namespace tabstream::pipeline
