#include <tabstream/source/chunk_source.hpp>

#include <fmt/format.h>
#include <rapidcsv.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <sstream>
#include <utility>

namespace tabstream::source {

namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

auto try_parse_int(const std::string& text, std::int64_t& out) -> bool {
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto result = std::from_chars(begin, end, out);
    return result.ec == std::errc() && result.ptr == end;
}

auto try_parse_double(const std::string& text, double& out) -> bool {
    char* end = nullptr;
    out = std::strtod(text.c_str(), &end);
    return end != text.c_str() && *end == '\0';
}

auto is_valid_utf8(std::string_view text) -> bool {
    std::size_t i = 0;
    while (i < text.size()) {
        auto lead = static_cast<unsigned char>(text[i]);
        std::size_t extra = 0;
        if (lead < 0x80) {
            extra = 0;
        } else if ((lead & 0xE0) == 0xC0 && lead >= 0xC2) {
            extra = 1;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
        } else if ((lead & 0xF8) == 0xF0 && lead <= 0xF4) {
            extra = 3;
        } else {
            return false;
        }
        if (extra > 0 && i + extra >= text.size()) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            if ((static_cast<unsigned char>(text[i + k]) & 0xC0) != 0x80) {
                return false;
            }
        }
        i += extra + 1;
    }
    return true;
}

/// Rename blank and repeated header cells the way pandas does ("Unnamed: 3", "a.1").
auto normalize_header(std::vector<std::string> cells) -> std::vector<std::string> {
    std::unordered_set<std::string> seen;
    std::vector<std::string> names;
    names.reserve(cells.size());
    for (std::size_t i = 0; i < cells.size(); ++i) {
        std::string name = cells[i].empty() ? fmt::format("Unnamed: {}", i) : std::move(cells[i]);
        if (seen.contains(name)) {
            std::size_t suffix = 1;
            while (seen.contains(fmt::format("{}.{}", name, suffix))) {
                ++suffix;
            }
            name = fmt::format("{}.{}", name, suffix);
        }
        seen.insert(name);
        names.push_back(std::move(name));
    }
    return names;
}

}  // namespace

auto default_null_tokens() -> std::unordered_set<std::string> {
    return {"", "NA", "N/A", "n/a", "NaN", "nan", "-NaN", "-nan", "null", "NULL", "None", "#N/A", "<NA>"};
}

auto parse_cell(std::string text, const std::unordered_set<std::string>& null_tokens) -> Value {
    if (null_tokens.contains(text)) {
        return std::monostate{};
    }
    std::int64_t int_value = 0;
    if (try_parse_int(text, int_value)) {
        return int_value;
    }
    double double_value = 0.0;
    if (try_parse_double(text, double_value)) {
        return double_value;
    }
    return text;
}

ChunkSource::ChunkSource(SourceOptions options) : options_(std::move(options)) {}

void ChunkSource::close() noexcept {
    done_ = true;
    if (input_.is_open()) {
        input_.close();
        spdlog::debug("chunk source: closed {} after {} rows", options_.path, rows_read_);
    }
}

auto ChunkSource::fail(ErrorKind kind, std::string message) -> std::unexpected<Error> {
    close();
    return make_error(kind, std::move(message));
}

auto ChunkSource::read_record(std::string& out) -> Result<bool> {
    out.clear();
    std::string line;
    bool in_quotes = false;
    std::uint64_t start_line = 0;
    while (std::getline(input_, line)) {
        ++line_no_;
        bytes_read_ += line.size() + 1;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!in_quotes && line.empty()) {
            continue;
        }
        if (in_quotes) {
            out.push_back('\n');
        } else {
            start_line = line_no_;
        }
        out.append(line);
        // A quote only opens a field at its start; inside a quoted field "" is a
        // literal quote and a lone quote closes the field.
        bool field_start = !in_quotes;
        for (std::size_t i = 0; i < line.size(); ++i) {
            char ch = line[i];
            if (in_quotes) {
                if (ch == '"') {
                    if (i + 1 < line.size() && line[i + 1] == '"') {
                        ++i;
                    } else {
                        in_quotes = false;
                    }
                }
                field_start = false;
            } else if (ch == '"' && field_start) {
                in_quotes = true;
                field_start = false;
            } else {
                field_start = ch == options_.delimiter;
            }
        }
        if (!in_quotes) {
            if (!is_valid_utf8(out)) {
                return fail(ErrorKind::SourceFormatError,
                            fmt::format("{}:{}: invalid UTF-8", options_.path, start_line));
            }
            return true;
        }
    }
    if (input_.bad()) {
        return fail(ErrorKind::SourceFormatError,
                    fmt::format("{}: read error after line {}", options_.path, line_no_));
    }
    if (in_quotes) {
        return fail(ErrorKind::SourceFormatError,
                    fmt::format("{}:{}: unterminated quoted field", options_.path, start_line));
    }
    return false;
}

auto ChunkSource::split_records(const std::string& text) const
    -> std::vector<std::vector<std::string>> {
    std::istringstream stream(text);
    rapidcsv::Document doc(stream,
                           rapidcsv::LabelParams(-1, -1),  // no header row, no row-name column
                           rapidcsv::SeparatorParams(options_.delimiter, false, false, true, true),
                           rapidcsv::ConverterParams(),
                           rapidcsv::LineReaderParams(false, '#', true));
    std::vector<std::vector<std::string>> records;
    records.reserve(doc.GetRowCount());
    for (std::size_t i = 0; i < doc.GetRowCount(); ++i) {
        records.push_back(doc.GetRow<std::string>(i));
    }
    return records;
}

auto ChunkSource::open() -> Result<void> {
    opened_ = true;
    if (options_.chunk_size == 0) {
        return fail(ErrorKind::InvalidArgument, "chunk size must be positive");
    }

    const std::filesystem::path path(options_.path);
    std::error_code ec;
    if (options_.path.empty() || !std::filesystem::is_regular_file(path, ec)) {
        return fail(ErrorKind::SourceNotFound, fmt::format("no such file: {}", options_.path));
    }
    input_.open(path, std::ios::binary);
    if (!input_) {
        return fail(ErrorKind::SourceNotFound, fmt::format("cannot open: {}", options_.path));
    }

    std::string header;
    auto got = read_record(header);
    if (!got) {
        return std::unexpected(got.error());
    }
    if (!*got) {
        return fail(ErrorKind::SourceFormatError, fmt::format("{}: csv is empty", options_.path));
    }
    if (header.starts_with(kUtf8Bom)) {
        header.erase(0, kUtf8Bom.size());
    }

    std::vector<std::vector<std::string>> cells;
    try {
        cells = split_records(header + '\n');
    } catch (const std::exception& e) {
        return fail(ErrorKind::SourceFormatError,
                    fmt::format("{}: malformed header: {}", options_.path, e.what()));
    }
    if (cells.size() != 1 || cells.front().empty()) {
        return fail(ErrorKind::SourceFormatError,
                    fmt::format("{}: csv has no headers", options_.path));
    }

    Schema source_schema(normalize_header(std::move(cells.front())));
    source_width_ = source_schema.size();

    if (options_.columns.empty()) {
        projection_.resize(source_width_);
        for (std::size_t i = 0; i < source_width_; ++i) {
            projection_[i] = i;
        }
        schema_ = std::make_shared<const Schema>(std::move(source_schema));
    } else {
        std::vector<bool> wanted(source_width_, false);
        for (const auto& name : options_.columns) {
            auto pos = source_schema.find(name);
            if (!pos.has_value()) {
                return fail(ErrorKind::ColumnNotFound,
                            fmt::format("selected column not found: {} (available: {})", name,
                                        source_schema.format()));
            }
            wanted[*pos] = true;
        }
        std::vector<std::string> names;
        for (std::size_t i = 0; i < source_width_; ++i) {
            if (wanted[i]) {
                projection_.push_back(i);
                names.push_back(source_schema.name(i));
            }
        }
        schema_ = std::make_shared<const Schema>(std::move(names));
    }

    spdlog::debug("chunk source: opened {} ({} columns, chunk size {})", options_.path,
                  schema_->size(), options_.chunk_size);
    return {};
}

auto ChunkSource::next_chunk() -> Result<std::optional<Chunk>> {
    if (done_) {
        return std::optional<Chunk>{};
    }
    if (!opened_) {
        if (auto opened = open(); !opened) {
            return std::unexpected(opened.error());
        }
    }

    std::string text;
    std::string record;
    std::vector<std::uint64_t> record_lines;
    record_lines.reserve(options_.chunk_size);
    while (record_lines.size() < options_.chunk_size) {
        auto got = read_record(record);
        if (!got) {
            return std::unexpected(got.error());
        }
        if (!*got) {
            break;
        }
        // The record just read ends at line_no_; its first line is what we report.
        record_lines.push_back(line_no_ - static_cast<std::uint64_t>(
                                              std::count(record.begin(), record.end(), '\n')));
        text.append(record);
        text.push_back('\n');
    }
    const bool hit_eof = record_lines.size() < options_.chunk_size;

    if (record_lines.empty()) {
        close();
        return std::optional<Chunk>{};
    }

    std::vector<std::vector<std::string>> records;
    try {
        records = split_records(text);
    } catch (const std::exception& e) {
        return fail(ErrorKind::SourceFormatError,
                    fmt::format("{}:{}: {}", options_.path, record_lines.front(), e.what()));
    }
    if (records.size() != record_lines.size()) {
        return fail(ErrorKind::SourceFormatError,
                    fmt::format("{}:{}: expected {} records in chunk, parsed {}", options_.path,
                                record_lines.front(), record_lines.size(), records.size()));
    }

    Chunk chunk;
    chunk.schema = schema_;
    chunk.first_row = rows_read_;
    chunk.rows.reserve(records.size());
    for (std::size_t r = 0; r < records.size(); ++r) {
        auto& fields = records[r];
        if (fields.size() != source_width_) {
            return fail(ErrorKind::SourceFormatError,
                        fmt::format("{}:{}: expected {} fields, found {}", options_.path,
                                    record_lines[r], source_width_, fields.size()));
        }
        Row row;
        row.reserve(projection_.size());
        for (auto pos : projection_) {
            row.push_back(parse_cell(std::move(fields[pos]), options_.null_tokens));
        }
        chunk.rows.push_back(std::move(row));
    }

    rows_read_ += chunk.rows.size();
    ++chunks_read_;
    spdlog::trace("chunk source: chunk {} rows [{}, {})", chunks_read_, chunk.first_row,
                  rows_read_);
    if (hit_eof) {
        close();
    }
    return std::optional<Chunk>{std::move(chunk)};
}

}  // namespace tabstream::source
