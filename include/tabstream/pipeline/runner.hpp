#pragma once

#include <tabstream/core/error.hpp>
#include <tabstream/core/value.hpp>
#include <tabstream/pipeline/config.hpp>
#include <tabstream/pipeline/transform.hpp>
#include <tabstream/source/chunk_source.hpp>

#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string_view>

namespace tabstream::pipeline {

enum class RunState : std::uint8_t {
    Idle,
    Validating,
    Streaming,
    Completed,
    Failed,
    Cancelled,
};

[[nodiscard]] auto run_state_name(RunState state) noexcept -> std::string_view;

[[nodiscard]] inline auto is_terminal(RunState state) noexcept -> bool {
    return state == RunState::Completed || state == RunState::Failed ||
           state == RunState::Cancelled;
}

struct RunStats {
    std::uint64_t rows_read = 0;
    std::uint64_t chunks_read = 0;
    std::uint64_t bytes_read = 0;
    std::uint64_t records_emitted = 0;
    std::uint64_t type_mismatches = 0;
    std::uint64_t null_keys = 0;
};

/// One streaming pass of a transform over a CSV source.
///
/// Pull based: each next() hands out one record and only reads another chunk
/// once the records of the previous one are drained, so a consumer that stops
/// asking stops the reading. The first next() (or an explicit start()) reads
/// the first chunk and validates the config against the source schema;
/// configuration errors therefore fail the run before any record exists.
///
/// cancel() may be called from any thread. It stops reading between chunks,
/// closes the file and drops buffered records and aggregation state; later
/// next() calls return nullopt without an error.
class PipelineRunner {
   public:
    PipelineRunner(source::SourceOptions source, PipelineConfig config);

    PipelineRunner(const PipelineRunner&) = delete;
    auto operator=(const PipelineRunner&) -> PipelineRunner& = delete;

    /// Idle -> Validating -> Streaming, or Failed. No-op once started.
    [[nodiscard]] auto start() -> Result<void>;

    /// Next record, nullopt when the run is over (Completed or Cancelled).
    [[nodiscard]] auto next() -> Result<std::optional<Record>>;

    void cancel() noexcept;

    [[nodiscard]] auto state() const -> RunState;
    [[nodiscard]] auto stats() const -> RunStats;
    [[nodiscard]] auto error() const -> std::optional<Error>;
    /// True while the source file handle is held.
    [[nodiscard]] auto source_open() const -> bool;
    [[nodiscard]] auto config() const noexcept -> const PipelineConfig& { return config_; }
    [[nodiscard]] auto id() const noexcept -> std::uint64_t { return id_; }

   private:
    auto start_locked() -> Result<void>;
    auto fail_locked(Error error) -> std::unexpected<Error>;
    void release_locked() noexcept;
    /// Move the next batch of records into pending_. False once nothing is left.
    auto refill_locked() -> Result<bool>;

    mutable std::mutex mutex_;
    std::atomic<bool> cancel_requested_{false};
    std::uint64_t id_;

    source::ChunkSource source_;
    PipelineConfig config_;
    std::optional<Transform> transform_;
    AggregationState aggregation_;
    TransformStats transform_stats_;
    std::optional<Chunk> first_chunk_;
    std::deque<Record> pending_;
    bool source_done_ = false;
    bool finished_ = false;

    RunState state_ = RunState::Idle;
    std::optional<Error> error_;
    std::uint64_t emitted_ = 0;
};

}  // namespace tabstream::pipeline
