#pragma once

#include <tabstream/core/error.hpp>
#include <tabstream/pipeline/runner.hpp>

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string_view>

namespace tabstream::emit {

/// Writes one wire frame and flushes it. Returns false once the peer is gone.
using FrameSink = std::function<bool(std::string_view frame)>;

enum class EmitOutcome : std::uint8_t {
    Completed,
    Failed,
    Cancelled,
};

struct EmitSummary {
    std::uint64_t records = 0;
    std::uint64_t bytes = 0;
    EmitOutcome outcome = EmitOutcome::Completed;
    /// Set when outcome is Failed.
    std::optional<Error> error;
};

/// Drain `runner` into `sink`, one NDJSON frame per record.
///
/// A sink that reports a closed peer cancels the run; that is a normal
/// outcome, not an error. A pipeline error ends the stream; frames already
/// written stand.
[[nodiscard]] auto emit(pipeline::PipelineRunner& runner, const FrameSink& sink) -> EmitSummary;

/// Sink writing frames to `out`, flushing after each one.
[[nodiscard]] auto ostream_sink(std::ostream& out) -> FrameSink;

}  // namespace tabstream::emit
