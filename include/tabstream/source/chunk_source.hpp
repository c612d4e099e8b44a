#pragma once

#include <tabstream/core/error.hpp>
#include <tabstream/core/value.hpp>

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace tabstream::source {

/// Tokens read as null, matching the usual pandas defaults.
[[nodiscard]] auto default_null_tokens() -> std::unordered_set<std::string>;

struct SourceOptions {
    std::string path;
    /// Upper bound on rows per chunk. Must be positive.
    std::size_t chunk_size = 50;
    /// Column projection; empty keeps every column. Output keeps file order.
    std::vector<std::string> columns;
    std::unordered_set<std::string> null_tokens = default_null_tokens();
    char delimiter = ',';
};

/// Type one CSV cell: null token, then int64, then double, otherwise string.
[[nodiscard]] auto parse_cell(std::string text, const std::unordered_set<std::string>& null_tokens)
    -> Value;

/// Lazy, finite, non-restartable sequence of chunks read from a CSV file.
///
/// The file is opened on the first next_chunk() call, so a missing file or a
/// malformed header surfaces there rather than at construction. Each call
/// reads at most `chunk_size` records and nothing beyond them. The read handle
/// is released when the sequence is exhausted, on error, on close(), and on
/// destruction.
class ChunkSource {
   public:
    explicit ChunkSource(SourceOptions options);
    ~ChunkSource() = default;

    ChunkSource(const ChunkSource&) = delete;
    auto operator=(const ChunkSource&) -> ChunkSource& = delete;
    ChunkSource(ChunkSource&&) noexcept = default;
    auto operator=(ChunkSource&&) noexcept -> ChunkSource& = default;

    /// Next chunk in source order, or nullopt once the file is exhausted.
    [[nodiscard]] auto next_chunk() -> Result<std::optional<Chunk>>;

    /// Release the read handle early; later calls return nullopt.
    void close() noexcept;

    /// Output schema (after projection); null until the header has been read.
    [[nodiscard]] auto schema() const noexcept -> const SchemaPtr& { return schema_; }
    [[nodiscard]] auto options() const noexcept -> const SourceOptions& { return options_; }

    [[nodiscard]] auto is_open() const noexcept -> bool { return input_.is_open(); }
    [[nodiscard]] auto exhausted() const noexcept -> bool { return done_; }
    [[nodiscard]] auto rows_read() const noexcept -> std::uint64_t { return rows_read_; }
    [[nodiscard]] auto chunks_read() const noexcept -> std::uint64_t { return chunks_read_; }
    [[nodiscard]] auto bytes_read() const noexcept -> std::uint64_t { return bytes_read_; }

   private:
    [[nodiscard]] auto open() -> Result<void>;
    /// Read one logical record (quoted fields may span lines). False at end of file.
    [[nodiscard]] auto read_record(std::string& out) -> Result<bool>;
    [[nodiscard]] auto split_records(const std::string& text) const
        -> std::vector<std::vector<std::string>>;
    [[nodiscard]] auto fail(ErrorKind kind, std::string message) -> std::unexpected<Error>;

    SourceOptions options_;
    std::ifstream input_;
    SchemaPtr schema_;
    std::size_t source_width_ = 0;
    /// Source positions of the projected columns, in output order.
    std::vector<std::size_t> projection_;
    bool opened_ = false;
    bool done_ = false;
    std::uint64_t rows_read_ = 0;
    std::uint64_t chunks_read_ = 0;
    std::uint64_t bytes_read_ = 0;
    /// Physical line number of the last line read, for error messages.
    std::uint64_t line_no_ = 0;
};

}  // namespace tabstream::source
