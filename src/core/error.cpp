#include <splot/core/error.hpp>

#include <fmt/format.h>

#include <utility>

namespace splot {

auto to_string(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::Parse:
            return "parse error";
        case ErrorKind::NonFiniteValue:
            return "non-finite value";
        case ErrorKind::DuplicateKey:
            return "duplicate key";
        case ErrorKind::LineageMismatch:
            return "lineage mismatch";
        case ErrorKind::CacheWriteRefused:
            return "cache write refused";
        case ErrorKind::ExternalCollaborator:
            return "external collaborator failed";
        case ErrorKind::InvalidInput:
            return "invalid input";
    }
    return "unknown error";
}

auto Error::format() const -> std::string {
    if (position > 0) {
        return fmt::format("{} at {}: {}", to_string(kind), position, message);
    }
    return fmt::format("{}: {}", to_string(kind), message);
}

auto make_error(ErrorKind kind, std::string message) -> std::unexpected<Error> {
    return std::unexpected(Error{.kind = kind, .message = std::move(message)});
}

}  // namespace splot
