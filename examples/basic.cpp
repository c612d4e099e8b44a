#include <tabstream/emit/emitter.hpp>
#include <tabstream/emit/ndjson.hpp>
#include <tabstream/pipeline/runner.hpp>

#include <fmt/core.h>

#include <filesystem>
#include <fstream>
#include <iostream>

auto main() -> int {
    auto path = std::filesystem::temp_directory_path() / "tabstream_basic_trades.csv";
    {
        std::ofstream out(path);
        out << "symbol,price,qty\n"
               "AAPL,100.5,10\n"
               "MSFT,200.25,5\n"
               "AAPL,101.0,7\n"
               "GOOG,NA,3\n"
               "MSFT,199.75,2\n";
    }

    fmt::print("=== scale price by 100 into price_bps ===\n");
    tabstream::pipeline::PipelineRunner scaled(
        {.path = path.string(), .chunk_size = 2},
        {.transform = tabstream::pipeline::TransformKind::ColumnScale,
         .scale_src = "price",
         .scale_factor = 100.0,
         .scale_out = "price_bps"});
    auto first = tabstream::emit::emit(scaled, tabstream::emit::ostream_sink(std::cout));
    fmt::print("{} records, state {}\n", first.records,
               tabstream::pipeline::run_state_name(scaled.state()));

    fmt::print("\n=== group by symbol ===\n");
    tabstream::pipeline::PipelineRunner grouped(
        {.path = path.string(), .chunk_size = 2},
        {.transform = tabstream::pipeline::TransformKind::GroupAggregate, .groupby_key = "symbol"});
    while (true) {
        auto next = grouped.next();
        if (!next) {
            fmt::print("error: {}\n", next.error().format());
            return 1;
        }
        if (!next->has_value()) {
            break;
        }
        fmt::print("{}", tabstream::emit::to_ndjson(**next));
    }

    std::filesystem::remove(path);
    return 0;
}
