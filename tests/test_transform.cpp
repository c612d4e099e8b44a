#include <tabstream/pipeline/transform.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>

namespace {

auto make_schema(std::vector<std::string> names) -> tabstream::SchemaPtr {
    return std::make_shared<const tabstream::Schema>(std::move(names));
}

auto make_chunk(const tabstream::SchemaPtr& schema, std::vector<tabstream::Row> rows,
                std::uint64_t first_row = 0) -> tabstream::Chunk {
    return tabstream::Chunk{.schema = schema, .rows = std::move(rows), .first_row = first_row};
}

auto str(const char* s) -> tabstream::Value {
    return tabstream::Value{std::string(s)};
}

auto i64(std::int64_t v) -> tabstream::Value {
    return tabstream::Value{v};
}

}  // namespace

using tabstream::pipeline::PipelineConfig;
using tabstream::pipeline::TransformKind;

TEST_CASE("ColumnScale - integral factor keeps integers") {
    auto schema = make_schema({"cat", "value"});
    tabstream::pipeline::ColumnScale scale(schema, 1, "value_scaled", 2.0);

    REQUIRE(std::get<std::int64_t>(scale.scale(i64(10))) == 20);
    REQUIRE(std::get<double>(scale.scale(tabstream::Value{1.25})) == Catch::Approx(2.5));
    REQUIRE(tabstream::is_null(scale.scale(tabstream::Value{})));
    REQUIRE(tabstream::is_null(scale.scale(str("abc"))));
}

TEST_CASE("ColumnScale - fractional factor and overflow promote to double") {
    auto schema = make_schema({"value"});
    tabstream::pipeline::ColumnScale half(schema, 0, "half", 0.5);
    REQUIRE(std::get<double>(half.scale(i64(3))) == Catch::Approx(1.5));

    tabstream::pipeline::ColumnScale big(schema, 0, "big", 4.0);
    auto scaled = big.scale(i64(std::numeric_limits<std::int64_t>::max()));
    REQUIRE(std::holds_alternative<double>(scaled));
}

TEST_CASE("ColumnScale - appends a new column and counts mismatches") {
    auto schema = make_schema({"cat", "value"});
    tabstream::pipeline::ColumnScale scale(schema, 1, "value_scaled", 3.0);
    tabstream::pipeline::AggregationState state;
    tabstream::pipeline::TransformStats stats;

    auto records = scale.apply(
        make_chunk(schema, {{str("x"), i64(2)}, {str("y"), str("n/a?")}, {str("z"), {}}}), state,
        stats);
    REQUIRE(records.size() == 3);
    REQUIRE(records[0].schema->names() ==
            std::vector<std::string>{"cat", "value", "value_scaled"});
    REQUIRE(std::get<std::int64_t>(*records[0].get("value_scaled")) == 6);
    REQUIRE(std::get<std::int64_t>(*records[0].get("value")) == 2);
    REQUIRE(tabstream::is_null(*records[1].get("value_scaled")));
    REQUIRE(std::get<std::string>(*records[1].get("value")) == "n/a?");
    REQUIRE(tabstream::is_null(*records[2].get("value_scaled")));
    REQUIRE(stats.type_mismatches == 1);
}

TEST_CASE("ColumnScale - scale_out equal to scale_src overwrites in place") {
    auto schema = make_schema({"value"});
    tabstream::pipeline::ColumnScale scale(schema, 0, "value", 10.0);
    tabstream::pipeline::AggregationState state;
    tabstream::pipeline::TransformStats stats;

    auto records = scale.apply(make_chunk(schema, {{i64(4)}}), state, stats);
    REQUIRE(records[0].schema->size() == 1);
    REQUIRE(std::get<std::int64_t>(records[0].values[0]) == 40);
}

TEST_CASE("GroupAggregate - emits nothing until finish") {
    auto schema = make_schema({"cat", "value"});
    tabstream::pipeline::GroupAggregate agg(schema, 0);
    tabstream::pipeline::AggregationState state;
    tabstream::pipeline::TransformStats stats;
    state.reset(agg.value_columns().size());

    REQUIRE(agg.apply(make_chunk(schema, {{str("x"), i64(10)}, {str("y"), i64(20)}}), state, stats)
                .empty());
    REQUIRE(agg.apply(make_chunk(schema, {{str("x"), i64(30)}}, 2), state, stats).empty());
    REQUIRE(state.group_count() == 2);

    auto records = agg.finish(state);
    REQUIRE(records.size() == 2);
    REQUIRE(records[0].schema->names() ==
            std::vector<std::string>{"cat", "count", "sum", "mean"});
    REQUIRE(std::get<std::string>(*records[0].get("cat")) == "x");
    REQUIRE(std::get<std::int64_t>(*records[0].get("count")) == 2);
    REQUIRE(std::get<std::int64_t>(*records[0].get("sum")) == 40);
    REQUIRE(std::get<double>(*records[0].get("mean")) == Catch::Approx(20.0));
    REQUIRE(std::get<std::string>(*records[1].get("cat")) == "y");
    REQUIRE(state.group_count() == 0);
}

TEST_CASE("GroupAggregate - several numeric columns get prefixed names") {
    auto schema = make_schema({"k", "a", "label", "b"});
    tabstream::pipeline::GroupAggregate agg(schema, 0);
    tabstream::pipeline::AggregationState state;
    tabstream::pipeline::TransformStats stats;
    state.reset(agg.value_columns().size());

    (void)agg.apply(make_chunk(schema, {{i64(1), i64(2), str("p"), tabstream::Value{0.5}},
                                        {i64(1), {}, str("q"), tabstream::Value{1.5}},
                                        {{}, i64(100), str("r"), i64(100)}}),
                    state, stats);
    auto records = agg.finish(state);

    REQUIRE(stats.null_keys == 1);
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].schema->names() ==
            std::vector<std::string>{"k", "a_count", "a_sum", "a_mean", "b_count", "b_sum",
                                     "b_mean"});
    REQUIRE(std::get<std::int64_t>(*records[0].get("a_count")) == 1);
    REQUIRE(std::get<std::int64_t>(*records[0].get("a_sum")) == 2);
    REQUIRE(std::get<std::int64_t>(*records[0].get("b_count")) == 2);
    REQUIRE(std::get<double>(*records[0].get("b_sum")) == Catch::Approx(2.0));
    REQUIRE(std::get<double>(*records[0].get("b_mean")) == Catch::Approx(1.0));
}

TEST_CASE("GroupAggregate - groups with no numeric values have a null mean") {
    auto schema = make_schema({"k", "v", "w"});
    tabstream::pipeline::GroupAggregate agg(schema, 0);
    tabstream::pipeline::AggregationState state;
    tabstream::pipeline::TransformStats stats;
    state.reset(agg.value_columns().size());

    (void)agg.apply(make_chunk(schema, {{str("a"), i64(1), i64(1)}, {str("b"), {}, i64(2)}}), state,
                    stats);
    auto records = agg.finish(state);
    REQUIRE(records.size() == 2);
    REQUIRE(std::get<std::int64_t>(*records[1].get("v_count")) == 0);
    REQUIRE(tabstream::is_null(*records[1].get("v_mean")));
}

TEST_CASE("GroupAggregate - no numeric columns counts rows per group") {
    auto schema = make_schema({"k", "label"});
    tabstream::pipeline::GroupAggregate agg(schema, 0);
    tabstream::pipeline::AggregationState state;
    tabstream::pipeline::TransformStats stats;
    state.reset(agg.value_columns().size());

    (void)agg.apply(make_chunk(schema, {{str("a"), str("p")}, {str("a"), str("q")}}), state, stats);
    auto records = agg.finish(state);
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].schema->names() == std::vector<std::string>{"k", "count"});
    REQUIRE(std::get<std::int64_t>(*records[0].get("count")) == 2);
}

TEST_CASE("make_transform - validates before building") {
    auto schema = make_schema({"cat", "value"});

    PipelineConfig bad;
    bad.transform = TransformKind::GroupAggregate;
    bad.groupby_key = "missing";
    auto failed = tabstream::pipeline::make_transform(bad, schema);
    REQUIRE_FALSE(failed.has_value());
    REQUIRE(failed.error().kind == tabstream::ErrorKind::ColumnNotFound);

    PipelineConfig good;
    good.transform = TransformKind::ColumnScale;
    good.scale_src = "value";
    good.scale_out = "value";
    good.scale_factor = 2.0;
    auto built = tabstream::pipeline::make_transform(good, schema);
    REQUIRE(built.has_value());
    REQUIRE(std::holds_alternative<tabstream::pipeline::ColumnScale>(*built));
}

TEST_CASE("GroupAggregate - integral doubles share a group with int keys") {
    auto schema = make_schema({"k", "v"});
    tabstream::pipeline::GroupAggregate agg(schema, 0);
    tabstream::pipeline::AggregationState state;
    tabstream::pipeline::TransformStats stats;
    state.reset(agg.value_columns().size());

    (void)agg.apply(make_chunk(schema, {{i64(1), i64(3)},
                                        {tabstream::Value{1.0}, i64(4)},
                                        {tabstream::Value{2.5}, i64(5)}}),
                    state, stats);
    auto records = agg.finish(state);
    REQUIRE(records.size() == 2);
    REQUIRE(std::get<std::int64_t>(*records[0].get("k")) == 1);
    REQUIRE(std::get<std::int64_t>(*records[0].get("count")) == 2);
    REQUIRE(std::get<std::int64_t>(*records[0].get("sum")) == 7);
    REQUIRE(std::get<double>(*records[1].get("k")) == Catch::Approx(2.5));
}

TEST_CASE("GroupAggregate - NaN keys are skipped like null keys") {
    auto schema = make_schema({"k", "v"});
    tabstream::pipeline::GroupAggregate agg(schema, 0);
    tabstream::pipeline::AggregationState state;
    tabstream::pipeline::TransformStats stats;
    state.reset(agg.value_columns().size());

    const double nan = std::numeric_limits<double>::quiet_NaN();
    (void)agg.apply(make_chunk(schema, {{tabstream::Value{nan}, i64(1)},
                                        {tabstream::Value{nan}, i64(2)},
                                        {str("a"), i64(3)}}),
                    state, stats);
    REQUIRE(state.group_count() == 1);
    auto records = agg.finish(state);
    REQUIRE(records.size() == 1);
    REQUIRE(std::get<std::string>(*records[0].get("k")) == "a");
    REQUIRE(stats.null_keys == 2);
}

TEST_CASE("GroupAggregate - NaN values are skipped, infinities are summed") {
    auto schema = make_schema({"k", "v"});
    tabstream::pipeline::GroupAggregate agg(schema, 0);
    tabstream::pipeline::AggregationState state;
    tabstream::pipeline::TransformStats stats;
    state.reset(agg.value_columns().size());

    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    (void)agg.apply(make_chunk(schema, {{str("a"), i64(2)},
                                        {str("a"), tabstream::Value{nan}},
                                        {str("a"), i64(4)},
                                        {str("b"), tabstream::Value{inf}},
                                        {str("b"), i64(1)}}),
                    state, stats);
    auto records = agg.finish(state);
    REQUIRE(records.size() == 2);
    REQUIRE(std::get<std::int64_t>(*records[0].get("count")) == 2);
    REQUIRE(std::get<std::int64_t>(*records[0].get("sum")) == 6);
    REQUIRE(std::get<double>(*records[0].get("mean")) == Catch::Approx(3.0));

    REQUIRE(std::get<std::int64_t>(*records[1].get("count")) == 2);
    REQUIRE(std::isinf(std::get<double>(*records[1].get("sum"))));
}
