#include <tabstream/core/error.hpp>
#include <tabstream/core/value.hpp>

#include <fmt/format.h>

#include <cctype>
#include <utility>

namespace tabstream {

namespace {

auto is_simple_identifier(std::string_view name) -> bool {
    if (name.empty()) {
        return false;
    }
    unsigned char first = static_cast<unsigned char>(name.front());
    if (std::isalpha(first) == 0 && first != '_') {
        return false;
    }
    for (std::size_t i = 1; i < name.size(); ++i) {
        unsigned char ch = static_cast<unsigned char>(name[i]);
        if (std::isalnum(ch) == 0 && ch != '_') {
            return false;
        }
    }
    return true;
}

}  // namespace

Schema::Schema(std::vector<std::string> names) {
    names_.reserve(names.size());
    for (auto& name : names) {
        add_column(std::move(name));
    }
}

auto Schema::add_column(std::string name) -> std::size_t {
    if (auto it = index_.find(name); it != index_.end()) {
        return it->second;
    }
    std::size_t pos = names_.size();
    names_.push_back(std::move(name));
    index_.emplace(names_.back(), pos);
    return pos;
}

auto Schema::find(std::string_view name) const -> std::optional<std::size_t> {
    if (auto it = index_.find(std::string(name)); it != index_.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto Schema::format() const -> std::string {
    if (names_.empty()) {
        return "<none>";
    }
    std::string out;
    for (std::size_t i = 0; i < names_.size(); ++i) {
        if (i > 0) {
            out.append(", ");
        }
        if (is_simple_identifier(names_[i])) {
            out.append(names_[i]);
        } else {
            out.push_back('`');
            out.append(names_[i]);
            out.push_back('`');
        }
    }
    return out;
}

auto Record::get(std::string_view column) const -> const Value* {
    if (schema == nullptr) {
        return nullptr;
    }
    auto pos = schema->find(column);
    if (!pos.has_value() || *pos >= values.size()) {
        return nullptr;
    }
    return &values[*pos];
}

auto error_kind_name(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::SourceNotFound:
            return "SourceNotFound";
        case ErrorKind::SourceFormatError:
            return "SourceFormatError";
        case ErrorKind::ColumnNotFound:
            return "ColumnNotFound";
        case ErrorKind::ScaleTargetInvalid:
            return "ScaleTargetInvalid";
        case ErrorKind::TypeMismatch:
            return "TypeMismatch";
        case ErrorKind::InvalidArgument:
            return "InvalidArgument";
    }
    return "Unknown";
}

auto Error::format() const -> std::string {
    return fmt::format("{}: {}", error_kind_name(kind), message);
}

}  // namespace tabstream
