#include <tabstream/core/error.hpp>
#include <tabstream/core/value.hpp>

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>
#include <unordered_set>

TEST_CASE("Schema - positions follow insertion order") {
    tabstream::Schema schema({"cat", "value"});
    REQUIRE(schema.size() == 2);
    REQUIRE(schema.find("cat") == 0);
    REQUIRE(schema.find("value") == 1);
    REQUIRE_FALSE(schema.find("missing").has_value());
    REQUIRE(schema.contains("value"));
}

TEST_CASE("Schema - add_column appends new names and reuses existing ones") {
    tabstream::Schema schema({"a"});
    REQUIRE(schema.add_column("b") == 1);
    REQUIRE(schema.add_column("a") == 0);
    REQUIRE(schema.size() == 2);
    REQUIRE(schema.names() == std::vector<std::string>{"a", "b"});
}

TEST_CASE("Schema - format quotes names that are not identifiers") {
    tabstream::Schema schema({"price", "trade size"});
    REQUIRE(schema.format() == "price, `trade size`");
    REQUIRE(tabstream::Schema{}.format() == "<none>");
}

TEST_CASE("Record - get by column name") {
    auto schema = std::make_shared<const tabstream::Schema>(std::vector<std::string>{"k", "v"});
    tabstream::Record record{.schema = schema, .values = {std::string("x"), std::int64_t{7}}};

    const auto* v = record.get("v");
    REQUIRE(v != nullptr);
    REQUIRE(std::get<std::int64_t>(*v) == 7);
    REQUIRE(record.get("nope") == nullptr);
}

TEST_CASE("Value - numeric helpers") {
    REQUIRE(tabstream::is_null(tabstream::Value{}));
    REQUIRE(tabstream::is_numeric(tabstream::Value{std::int64_t{3}}));
    REQUIRE(tabstream::is_numeric(tabstream::Value{2.5}));
    REQUIRE_FALSE(tabstream::is_numeric(tabstream::Value{std::string("3")}));
    REQUIRE(tabstream::as_double(tabstream::Value{std::int64_t{3}}) == 3.0);
}

TEST_CASE("Value - hash separates alternatives") {
    std::unordered_set<tabstream::Value> seen;
    seen.insert(tabstream::Value{std::int64_t{1}});
    seen.insert(tabstream::Value{1.0});
    seen.insert(tabstream::Value{std::string("1")});
    seen.insert(tabstream::Value{std::int64_t{1}});
    REQUIRE(seen.size() == 3);
}

TEST_CASE("Error - format carries kind and message") {
    tabstream::Error error{.kind = tabstream::ErrorKind::ColumnNotFound, .message = "no x"};
    REQUIRE(error.format() == "ColumnNotFound: no x");
    REQUIRE(error.is_configuration());
    REQUIRE_FALSE(tabstream::Error{.kind = tabstream::ErrorKind::SourceFormatError}.is_configuration());
}
