#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace tabstream {

/// A single cell. `std::monostate` is null.
using Value = std::variant<std::monostate, std::int64_t, double, std::string>;

/// One row, positionally aligned with a Schema.
using Row = std::vector<Value>;

[[nodiscard]] inline auto is_null(const Value& value) noexcept -> bool {
    return std::holds_alternative<std::monostate>(value);
}

[[nodiscard]] inline auto is_numeric(const Value& value) noexcept -> bool {
    return std::holds_alternative<std::int64_t>(value) || std::holds_alternative<double>(value);
}

/// Numeric view of a cell; callers check is_numeric() first.
[[nodiscard]] inline auto as_double(const Value& value) noexcept -> double {
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        return static_cast<double>(*i);
    }
    if (const auto* d = std::get_if<double>(&value)) {
        return *d;
    }
    return 0.0;
}

/// Ordered column names with a name -> position index.
class Schema {
   public:
    Schema() = default;
    explicit Schema(std::vector<std::string> names);

    /// Append a column; returns its position. Existing names keep their position.
    auto add_column(std::string name) -> std::size_t;

    [[nodiscard]] auto find(std::string_view name) const -> std::optional<std::size_t>;
    [[nodiscard]] auto contains(std::string_view name) const -> bool {
        return find(name).has_value();
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return names_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return names_.empty(); }
    [[nodiscard]] auto name(std::size_t pos) const -> const std::string& { return names_.at(pos); }
    [[nodiscard]] auto names() const noexcept -> const std::vector<std::string>& { return names_; }

    /// Comma separated list used in error messages.
    [[nodiscard]] auto format() const -> std::string;

    auto operator==(const Schema& other) const -> bool { return names_ == other.names_; }

   private:
    std::vector<std::string> names_;
    std::unordered_map<std::string, std::size_t> index_;
};

using SchemaPtr = std::shared_ptr<const Schema>;

/// A bounded, ordered slice of source rows sharing one schema.
struct Chunk {
    SchemaPtr schema;
    std::vector<Row> rows;
    /// Zero-based source row number of rows.front().
    std::uint64_t first_row = 0;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return rows.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return rows.empty(); }
};

/// One unit handed to the emitter: a row together with the schema naming its cells.
struct Record {
    SchemaPtr schema;
    Row values;

    /// Cell by column name; nullptr when the column is absent.
    [[nodiscard]] auto get(std::string_view column) const -> const Value*;
};

}  // namespace tabstream

namespace std {

template <>
struct hash<tabstream::Value> {
    auto operator()(const tabstream::Value& value) const noexcept -> std::size_t {
        std::size_t seed = value.index();
        std::size_t h = std::visit(
            [](const auto& v) -> std::size_t {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::monostate>) {
                    return 0;
                } else {
                    return std::hash<T>{}(v);
                }
            },
            value);
        seed ^= h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        return seed;
    }
};

}  // namespace std
