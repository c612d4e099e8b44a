#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace tabstream {

enum class ErrorKind : std::uint8_t {
    /// Path does not resolve to a readable file.
    SourceNotFound,
    /// Content cannot be parsed as a table (ragged rows, unterminated quotes, empty file).
    SourceFormatError,
    /// A configured column is absent from the source schema.
    ColumnNotFound,
    /// The scale target cannot be written (empty name, clobbers another column, bad factor).
    ScaleTargetInvalid,
    /// Row-level non-numeric input to ColumnScale. Recoverable; never returned from a run.
    TypeMismatch,
    /// Unusable run parameters (zero chunk size, unknown transform name, malformed number).
    InvalidArgument,
};

[[nodiscard]] auto error_kind_name(ErrorKind kind) noexcept -> std::string_view;

/// Error with a kind for dispatch and a message for humans.
struct Error {
    ErrorKind kind = ErrorKind::SourceFormatError;
    std::string message;

    /// True for errors detected while validating configuration, before any record.
    [[nodiscard]] auto is_configuration() const noexcept -> bool {
        return kind == ErrorKind::ColumnNotFound || kind == ErrorKind::ScaleTargetInvalid ||
               kind == ErrorKind::InvalidArgument;
    }

    [[nodiscard]] auto format() const -> std::string;
};

template <typename T>
using Result = std::expected<T, Error>;

[[nodiscard]] inline auto make_error(ErrorKind kind, std::string message)
    -> std::unexpected<Error> {
    return std::unexpected(Error{.kind = kind, .message = std::move(message)});
}

}  // namespace tabstream
