#include <tabstream/server/routing.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <map>
#include <string>

namespace {

auto data_root() -> std::filesystem::path {
    auto root = std::filesystem::temp_directory_path() / "tabstream_test_root";
    std::filesystem::create_directories(root / "data");
    std::ofstream(root / "data" / "sample.csv") << "cat,value\nx,1\n";
    std::ofstream(std::filesystem::temp_directory_path() / "tabstream_test_outside.csv")
        << "a\n1\n";
    return root;
}

auto lookup_from(std::map<std::string, std::string> params) -> tabstream::pipeline::ParamLookup {
    return [params = std::move(params)](std::string_view name) -> std::optional<std::string> {
        auto it = params.find(std::string(name));
        if (it == params.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

}  // namespace

TEST_CASE("resolve_data_path - files under the root") {
    auto root = data_root();
    auto resolved = tabstream::server::resolve_data_path(root, "data/sample.csv");
    REQUIRE(resolved.has_value());
    REQUIRE(resolved->filename() == "sample.csv");
}

TEST_CASE("resolve_data_path - traversal and missing files are not found") {
    auto root = data_root();

    auto escape = tabstream::server::resolve_data_path(root, "../tabstream_test_outside.csv");
    REQUIRE_FALSE(escape.has_value());
    REQUIRE(escape.error().kind == tabstream::ErrorKind::SourceNotFound);

    auto absolute = tabstream::server::resolve_data_path(
        root, (std::filesystem::temp_directory_path() / "tabstream_test_outside.csv").string());
    REQUIRE_FALSE(absolute.has_value());

    auto missing = tabstream::server::resolve_data_path(root, "data/none.csv");
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().kind == tabstream::ErrorKind::SourceNotFound);

    auto directory = tabstream::server::resolve_data_path(root, "data");
    REQUIRE_FALSE(directory.has_value());
}

TEST_CASE("parse_run_request - builds source options and config") {
    tabstream::server::ServerConfig config;
    config.data_root = data_root().string();

    auto request = tabstream::server::parse_run_request(
        config, lookup_from({{"path", "data/sample.csv"},
                             {"chunksize", "7"},
                             {"cols", "cat,value"},
                             {"groupby_key", "cat"}}));
    REQUIRE(request.has_value());
    REQUIRE(request->source.chunk_size == 7);
    REQUIRE(request->source.columns == std::vector<std::string>{"cat", "value"});
    REQUIRE(request->pipeline.transform == tabstream::pipeline::TransformKind::GroupAggregate);

    auto defaults = tabstream::server::parse_run_request(
        config, lookup_from({{"path", "data/sample.csv"}}));
    REQUIRE(defaults.has_value());
    REQUIRE(defaults->source.chunk_size == config.default_chunk_size);
}

TEST_CASE("parse_run_request - rejects bad parameters") {
    tabstream::server::ServerConfig config;
    config.data_root = data_root().string();
    config.max_chunk_size = 100;

    auto no_path = tabstream::server::parse_run_request(config, lookup_from({}));
    REQUIRE(no_path.error().kind == tabstream::ErrorKind::InvalidArgument);

    auto zero = tabstream::server::parse_run_request(
        config, lookup_from({{"path", "data/sample.csv"}, {"chunksize", "0"}}));
    REQUIRE(zero.error().kind == tabstream::ErrorKind::InvalidArgument);

    auto huge = tabstream::server::parse_run_request(
        config, lookup_from({{"path", "data/sample.csv"}, {"chunksize", "101"}}));
    REQUIRE(huge.error().kind == tabstream::ErrorKind::InvalidArgument);

    auto missing = tabstream::server::parse_run_request(
        config, lookup_from({{"path", "data/other.csv"}}));
    REQUIRE(missing.error().kind == tabstream::ErrorKind::SourceNotFound);
}

TEST_CASE("http_status_for - error kinds map to status codes") {
    using tabstream::ErrorKind;
    REQUIRE(tabstream::server::http_status_for(ErrorKind::SourceNotFound) == 404);
    REQUIRE(tabstream::server::http_status_for(ErrorKind::ColumnNotFound) == 400);
    REQUIRE(tabstream::server::http_status_for(ErrorKind::ScaleTargetInvalid) == 400);
    REQUIRE(tabstream::server::http_status_for(ErrorKind::InvalidArgument) == 400);
    REQUIRE(tabstream::server::http_status_for(ErrorKind::SourceFormatError) == 422);
}

TEST_CASE("error_body - JSON with kind and detail") {
    tabstream::Error error{.kind = tabstream::ErrorKind::ColumnNotFound, .message = "no \"x\""};
    REQUIRE(tabstream::server::error_body(error) ==
            "{\"error\":\"ColumnNotFound\",\"detail\":\"no \\\"x\\\"\"}");
}
