#include <tabstream/pipeline/runner.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace tabstream::pipeline {

namespace {

std::atomic<std::uint64_t> g_next_run_id{1};

}  // namespace

auto run_state_name(RunState state) noexcept -> std::string_view {
    switch (state) {
        case RunState::Idle:
            return "idle";
        case RunState::Validating:
            return "validating";
        case RunState::Streaming:
            return "streaming";
        case RunState::Completed:
            return "completed";
        case RunState::Failed:
            return "failed";
        case RunState::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

PipelineRunner::PipelineRunner(source::SourceOptions source, PipelineConfig config)
    : id_(g_next_run_id.fetch_add(1)), source_(std::move(source)), config_(std::move(config)) {}

auto PipelineRunner::start() -> Result<void> {
    std::lock_guard lock(mutex_);
    return start_locked();
}

auto PipelineRunner::start_locked() -> Result<void> {
    if (state_ != RunState::Idle) {
        if (error_.has_value()) {
            return std::unexpected(*error_);
        }
        return {};
    }
    if (cancel_requested_.load()) {
        release_locked();
        state_ = RunState::Cancelled;
        return {};
    }

    state_ = RunState::Validating;
    spdlog::debug("run {}: validating {} over {}", id_, transform_kind_name(config_.transform),
                  source_.options().path);

    auto chunk = source_.next_chunk();
    if (!chunk) {
        return fail_locked(chunk.error());
    }
    const auto& schema = source_.schema();
    if (schema == nullptr) {
        return fail_locked(Error{.kind = ErrorKind::SourceFormatError,
                                 .message = "source produced no schema"});
    }
    auto transform = make_transform(config_, schema);
    if (!transform) {
        return fail_locked(transform.error());
    }
    transform_ = std::move(*transform);
    init_state(*transform_, aggregation_);
    if (chunk->has_value()) {
        first_chunk_ = std::move(**chunk);
    } else {
        source_done_ = true;
    }

    state_ = RunState::Streaming;
    spdlog::debug("run {}: streaming ({} columns)", id_, schema->size());
    return {};
}

auto PipelineRunner::fail_locked(Error error) -> std::unexpected<Error> {
    release_locked();
    state_ = RunState::Failed;
    if (error.is_configuration() || error.kind == ErrorKind::SourceNotFound) {
        spdlog::info("run {}: rejected: {}", id_, error.format());
    } else {
        spdlog::error("run {}: failed after {} records: {}", id_, emitted_, error.format());
    }
    error_ = error;
    return std::unexpected(std::move(error));
}

void PipelineRunner::release_locked() noexcept {
    source_.close();
    aggregation_.clear();
    pending_.clear();
    first_chunk_.reset();
}

auto PipelineRunner::refill_locked() -> Result<bool> {
    std::optional<Chunk> chunk;
    if (first_chunk_.has_value()) {
        chunk = std::move(first_chunk_);
        first_chunk_.reset();
    } else if (!source_done_) {
        auto next = source_.next_chunk();
        if (!next) {
            return std::unexpected(next.error());
        }
        if (next->has_value()) {
            chunk = std::move(*next);
        } else {
            source_done_ = true;
        }
    }

    if (chunk.has_value()) {
        auto records = apply(*transform_, std::move(*chunk), aggregation_, transform_stats_);
        for (auto& record : records) {
            pending_.push_back(std::move(record));
        }
        return true;
    }
    if (!finished_) {
        finished_ = true;
        auto records = finish(*transform_, aggregation_);
        for (auto& record : records) {
            pending_.push_back(std::move(record));
        }
        return true;
    }
    return false;
}

auto PipelineRunner::next() -> Result<std::optional<Record>> {
    std::lock_guard lock(mutex_);
    if (state_ == RunState::Idle) {
        if (auto started = start_locked(); !started) {
            return std::unexpected(started.error());
        }
    }

    while (true) {
        if (state_ == RunState::Failed) {
            return std::unexpected(*error_);
        }
        if (state_ == RunState::Completed || state_ == RunState::Cancelled) {
            return std::optional<Record>{};
        }
        if (cancel_requested_.load()) {
            release_locked();
            state_ = RunState::Cancelled;
            spdlog::debug("run {}: cancelled after {} records", id_, emitted_);
            return std::optional<Record>{};
        }
        if (!pending_.empty()) {
            Record record = std::move(pending_.front());
            pending_.pop_front();
            ++emitted_;
            return std::optional<Record>{std::move(record)};
        }

        auto more = refill_locked();
        if (!more) {
            return fail_locked(more.error());
        }
        if (!*more) {
            source_.close();
            state_ = RunState::Completed;
            spdlog::info("run {}: completed: {} rows in {} chunks, {} records, {} type mismatches",
                         id_, source_.rows_read(), source_.chunks_read(), emitted_,
                         transform_stats_.type_mismatches);
            return std::optional<Record>{};
        }
    }
}

void PipelineRunner::cancel() noexcept {
    cancel_requested_.store(true);
    std::lock_guard lock(mutex_);
    if (is_terminal(state_)) {
        return;
    }
    release_locked();
    state_ = RunState::Cancelled;
    spdlog::debug("run {}: cancelled after {} records", id_, emitted_);
}

auto PipelineRunner::state() const -> RunState {
    std::lock_guard lock(mutex_);
    return state_;
}

auto PipelineRunner::stats() const -> RunStats {
    std::lock_guard lock(mutex_);
    return RunStats{
        .rows_read = source_.rows_read(),
        .chunks_read = source_.chunks_read(),
        .bytes_read = source_.bytes_read(),
        .records_emitted = emitted_,
        .type_mismatches = transform_stats_.type_mismatches,
        .null_keys = transform_stats_.null_keys,
    };
}

auto PipelineRunner::source_open() const -> bool {
    std::lock_guard lock(mutex_);
    return source_.is_open();
}

auto PipelineRunner::error() const -> std::optional<Error> {
    std::lock_guard lock(mutex_);
    return error_;
}

}  // namespace tabstream::pipeline
