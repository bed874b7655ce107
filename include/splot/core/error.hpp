#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace splot {

/// Failure categories. Every one of them ends the current run; nothing is retried.
enum class ErrorKind : std::uint8_t {
    Parse,
    NonFiniteValue,
    DuplicateKey,
    LineageMismatch,
    CacheWriteRefused,
    ExternalCollaborator,
    // Source-boundary problems: unknown column, unreadable cell, bad option value.
    InvalidInput,
};

[[nodiscard]] auto to_string(ErrorKind kind) noexcept -> std::string_view;

/// Error value carried through std::expected.
struct Error {
    ErrorKind kind = ErrorKind::InvalidInput;
    std::string message;
    /// 1-based character offset into the operator sequence; 0 when not applicable.
    std::size_t position = 0;

    [[nodiscard]] auto format() const -> std::string;
};

template <typename T>
using Result = std::expected<T, Error>;

[[nodiscard]] auto make_error(ErrorKind kind, std::string message) -> std::unexpected<Error>;

}  // namespace splot
