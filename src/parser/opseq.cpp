#include <splot/parser/opseq.hpp>

#include <fmt/format.h>

#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <system_error>

namespace splot::parser {

namespace {

constexpr std::array<OpInfo, 13> kOperators = {{
    {.letter = 'c', .code = OpCode::Cdf, .name = "cdf", .dump = false, .arity = 0},
    {.letter = 'd', .code = OpCode::Derivative, .name = "derivative", .dump = false, .arity = 2},
    {.letter = 'i', .code = OpCode::Integral, .name = "integral", .dump = false, .arity = 0},
    {.letter = 'm', .code = OpCode::Merge, .name = "merge", .dump = false, .arity = 0},
    {.letter = 'o', .code = OpCode::Sort, .name = "sort", .dump = false, .arity = 0},
    {.letter = 's', .code = OpCode::Step, .name = "step", .dump = false, .arity = 0},
    {.letter = 'a', .code = OpCode::Average, .name = "average", .dump = false, .arity = 2},
    {.letter = 'f', .code = OpCode::Finite, .name = "finite", .dump = false, .arity = 0},
    {.letter = 'u', .code = OpCode::Unique, .name = "unique", .dump = false, .arity = 0},
    {.letter = 'r', .code = OpCode::Rotate, .name = "rotate", .dump = false, .arity = 0},
    {.letter = 'C', .code = OpCode::CacheWrite, .name = "cache", .dump = true, .arity = 0},
    {.letter = 'O', .code = OpCode::Print, .name = "print", .dump = true, .arity = 0},
    {.letter = 'P', .code = OpCode::Plot, .name = "plot", .dump = true, .arity = 0},
}};

auto is_argument_char(char ch) -> bool {
    return std::isdigit(static_cast<unsigned char>(ch)) != 0 || ch == '.' || ch == ',' ||
           ch == '-' || ch == '+';
}

auto parse_error(std::size_t position, std::string message) -> std::unexpected<Error> {
    return std::unexpected(Error{
        .kind = ErrorKind::Parse,
        .message = std::move(message),
        .position = position,
    });
}

// `text` is the raw argument run following an operator letter; `offset` is
// the 1-based position of its first character.
auto parse_arguments(std::string_view text, std::size_t offset) -> Result<std::vector<double>> {
    std::vector<double> values;
    std::size_t start = 0;
    while (true) {
        std::size_t comma = text.find(',', start);
        if (comma == std::string_view::npos) {
            comma = text.size();
        }
        std::string_view field = text.substr(start, comma - start);
        if (field.empty()) {
            return parse_error(offset + start, "empty operator argument");
        }
        std::string_view digits = field;
        if (digits.front() == '+') {
            digits.remove_prefix(1);
        }
        double value = 0.0;
        const char* begin = digits.data();
        const char* end = digits.data() + digits.size();
        auto [ptr, ec] = std::from_chars(begin, end, value);
        if (digits.empty() || ec == std::errc::invalid_argument || ptr != end) {
            return parse_error(offset + start, fmt::format("malformed number '{}'", field));
        }
        if (ec == std::errc::result_out_of_range || !std::isfinite(value)) {
            return parse_error(offset + start, fmt::format("number '{}' is not finite", field));
        }
        values.push_back(value);
        if (comma == text.size()) {
            break;
        }
        start = comma + 1;
    }
    return values;
}

}  // namespace

auto lookup(char letter) noexcept -> const OpInfo* {
    for (const auto& op : kOperators) {
        if (op.letter == letter) {
            return &op;
        }
    }
    return nullptr;
}

auto info(OpCode code) noexcept -> const OpInfo& {
    for (const auto& op : kOperators) {
        if (op.code == code) {
            return op;
        }
    }
    return kOperators.front();
}

auto format_argument(double value) -> std::string {
    if (value == 0.0) {
        return "0";
    }
    // Fixed notation keeps the text inside the argument alphabet (no 'e').
    std::array<char, 512> buffer{};
    auto [ptr, ec] =
        std::to_chars(buffer.data(), buffer.data() + buffer.size(), value, std::chars_format::fixed);
    if (ec != std::errc()) {
        return fmt::format("{}", value);
    }
    return std::string(buffer.data(), ptr);
}

auto Operator::window() const noexcept -> Window {
    if (args.size() < 2) {
        return Window{};
    }
    return Window{.left = args[0], .right = args[1]};
}

auto Operator::canonical() const -> std::string {
    std::string out(1, letter());
    std::size_t used = args.size();
    while (used > 0 && args[used - 1] == 0.0) {
        --used;
    }
    for (std::size_t i = 0; i < used; ++i) {
        if (i > 0) {
            out.push_back(',');
        }
        out.append(format_argument(args[i]));
    }
    return out;
}

auto OpSeq::to_string(std::size_t count, bool include_dumps) const -> std::string {
    std::string out;
    for (std::size_t i = 0; i < count && i < ops_.size(); ++i) {
        if (!include_dumps && ops_[i].is_dump()) {
            continue;
        }
        out.append(ops_[i].canonical());
    }
    return out;
}

auto parse(std::string_view source) -> Result<OpSeq> {
    std::vector<Operator> ops;

    std::size_t i = 0;
    const auto at_end = [&]() -> bool {
        return i >= source.size();
    };

    while (!at_end()) {
        const std::size_t op_start = i;
        const char ch = source[i++];
        const OpInfo* op_info = lookup(ch);
        if (op_info == nullptr) {
            if (std::isalpha(static_cast<unsigned char>(ch)) != 0) {
                return parse_error(op_start + 1, fmt::format("unknown operator '{}'", ch));
            }
            return parse_error(op_start + 1,
                               fmt::format("expected an operator letter, found '{}'", ch));
        }

        const std::size_t args_start = i;
        while (!at_end() && is_argument_char(source[i])) {
            ++i;
        }
        std::string_view arg_text = source.substr(args_start, i - args_start);

        std::vector<double> args;
        if (!arg_text.empty()) {
            auto parsed = parse_arguments(arg_text, args_start + 1);
            if (!parsed) {
                return std::unexpected(parsed.error());
            }
            args = std::move(*parsed);
        }

        if (args.size() > op_info->arity) {
            if (op_info->arity == 0) {
                return parse_error(op_start + 1,
                                   fmt::format("operator '{}' ({}) takes no arguments", ch,
                                               op_info->name));
            }
            return parse_error(op_start + 1,
                               fmt::format("operator '{}' ({}) takes at most {} arguments", ch,
                                           op_info->name, op_info->arity));
        }
        for (double value : args) {
            if (value < 0.0) {
                return parse_error(op_start + 1,
                                   fmt::format("operator '{}' ({}) needs a non-negative window",
                                               ch, op_info->name));
            }
        }
        args.resize(op_info->arity, 0.0);

        ops.push_back(Operator{
            .code = op_info->code,
            .args = std::move(args),
            .position = op_start + 1,
        });
    }

    return OpSeq{std::move(ops)};
}

}  // namespace splot::parser
