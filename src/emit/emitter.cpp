#include <tabstream/emit/emitter.hpp>
#include <tabstream/emit/ndjson.hpp>

#include <spdlog/spdlog.h>

#include <ostream>

namespace tabstream::emit {

auto emit(pipeline::PipelineRunner& runner, const FrameSink& sink) -> EmitSummary {
    EmitSummary summary;
    while (true) {
        auto next = runner.next();
        if (!next) {
            summary.outcome = EmitOutcome::Failed;
            summary.error = next.error();
            return summary;
        }
        if (!next->has_value()) {
            summary.outcome = runner.state() == pipeline::RunState::Cancelled
                                  ? EmitOutcome::Cancelled
                                  : EmitOutcome::Completed;
            return summary;
        }
        auto frame = to_ndjson(**next);
        if (!sink(frame)) {
            spdlog::debug("run {}: consumer went away after {} records", runner.id(),
                          summary.records);
            runner.cancel();
            summary.outcome = EmitOutcome::Cancelled;
            return summary;
        }
        ++summary.records;
        summary.bytes += frame.size();
    }
}

auto ostream_sink(std::ostream& out) -> FrameSink {
    return [&out](std::string_view frame) -> bool {
        out.write(frame.data(), static_cast<std::streamsize>(frame.size()));
        out.flush();
        return static_cast<bool>(out);
    };
}

}  // namespace tabstream::emit
