#pragma once

#include <splot/core/error.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace splot::parser {

/// The closed operator alphabet. Lowercase letters transform, uppercase letters dump.
enum class OpCode : std::uint8_t {
    // Transforms
    Cdf,         // c
    Derivative,  // d[left[,right]]
    Integral,    // i
    Merge,       // m
    Sort,        // o
    Step,        // s
    Average,     // a[left[,right]]
    Finite,      // f
    Unique,      // u
    Rotate,      // r

    // Dumps
    CacheWrite,  // C
    Print,       // O
    Plot,        // P
};

/// Static description of one operator letter.
struct OpInfo {
    char letter;
    OpCode code;
    std::string_view name;
    bool dump;
    /// Number of numeric arguments; omitted ones default to 0.
    std::size_t arity;
};

/// Look up an operator by its letter; nullptr for letters outside the alphabet.
[[nodiscard]] auto lookup(char letter) noexcept -> const OpInfo*;

/// Look up an operator by its code.
[[nodiscard]] auto info(OpCode code) noexcept -> const OpInfo&;

/// Range `[x - left, x + right]` used by the derivative and average operators.
struct Window {
    double left = 0.0;
    double right = 0.0;

    [[nodiscard]] auto span() const noexcept -> double { return left + right; }
    [[nodiscard]] auto is_zero() const noexcept -> bool { return left == 0.0 && right == 0.0; }
};

/// One parsed operator invocation.
struct Operator {
    OpCode code = OpCode::Sort;
    /// Always holds exactly `info(code).arity` values, defaults filled in.
    std::vector<double> args;
    /// 1-based offset of the operator letter in the source string.
    std::size_t position = 0;

    [[nodiscard]] auto letter() const noexcept -> char { return info(code).letter; }
    [[nodiscard]] auto is_dump() const noexcept -> bool { return info(code).dump; }
    /// Window argument pair; zero window for operators without arguments.
    [[nodiscard]] auto window() const noexcept -> Window;
    /// Letter plus canonical arguments (trailing defaults dropped).
    [[nodiscard]] auto canonical() const -> std::string;
};

/// An ordered operator sequence.
class OpSeq {
   public:
    OpSeq() = default;
    explicit OpSeq(std::vector<Operator> ops) : ops_(std::move(ops)) {}

    [[nodiscard]] auto ops() const noexcept -> const std::vector<Operator>& { return ops_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return ops_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return ops_.empty(); }
    [[nodiscard]] auto operator[](std::size_t idx) const noexcept -> const Operator& {
        return ops_[idx];
    }

    void push_back(Operator op) { ops_.push_back(std::move(op)); }

    /// Canonical text of the first `count` operators.
    [[nodiscard]] auto to_string(std::size_t count, bool include_dumps) const -> std::string;
    /// Canonical text of the whole sequence, dumps included.
    [[nodiscard]] auto to_string() const -> std::string { return to_string(ops_.size(), true); }

    /// Cache key of the first `count` operators: canonical text with dumps removed.
    [[nodiscard]] auto key(std::size_t count) const -> std::string {
        return to_string(count, false);
    }
    [[nodiscard]] auto key() const -> std::string { return key(ops_.size()); }

    /// True when the last operator is a dump.
    [[nodiscard]] auto ends_with_dump() const noexcept -> bool {
        return !ops_.empty() && ops_.back().is_dump();
    }

   private:
    std::vector<Operator> ops_;
};

/// Parse an operator-sequence string such as `"iCd1000CcC"`.
///
/// Grammar: `{ letter [ number { "," number } ] }`, where a number is a run
/// of `[0-9.+-]` characters that must parse as a finite double. The scan is
/// a single left-to-right pass; any unknown letter, stray character,
/// surplus argument or malformed number is a Parse error.
[[nodiscard]] auto parse(std::string_view source) -> Result<OpSeq>;

/// Shortest decimal (fixed notation) that reads back as the same double.
[[nodiscard]] auto format_argument(double value) -> std::string;

}  // namespace splot::parser
