#include <splot/runtime/csv.hpp>

#include <fmt/format.h>
#include <rapidcsv.h>

#include <charconv>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iterator>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace splot::runtime {

namespace {

auto separator_of(TableEncoding encoding) -> char {
    return encoding == TableEncoding::Tsv ? '\t' : ',';
}

auto needs_quoting(std::string_view text, char separator) -> bool {
    if (text.empty()) {
        return false;
    }
    if (text.front() == ' ' || text.back() == ' ') {
        return true;
    }
    for (char ch : text) {
        if (ch == separator || ch == '"' || ch == '\n' || ch == '\r') {
            return true;
        }
    }
    return false;
}

auto quote_cell(std::string_view text, char separator) -> std::string {
    if (!needs_quoting(text, separator)) {
        return std::string(text);
    }
    std::string out;
    out.reserve(text.size() + 2);
    out.push_back('"');
    for (char ch : text) {
        if (ch == '"') {
            out.push_back('"');
        }
        out.push_back(ch);
    }
    out.push_back('"');
    return out;
}

auto csv_trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

auto try_parse_double(std::string_view text, double& out) -> bool {
    std::string owned(csv_trim(text));
    if (owned.empty()) {
        return false;
    }
    char* end = nullptr;
    out = std::strtod(owned.c_str(), &end);
    return end != owned.c_str() && *end == '\0';
}

// Resolved column position for one axis; nullopt for constant/row-number axes.
struct AxisColumn {
    std::optional<std::size_t> column;
    std::string name;
};

auto resolve_axis(const AxisExpr& expr, rapidcsv::Document& doc, bool header)
    -> Result<AxisColumn> {
    switch (expr.kind) {
        case AxisExpr::Kind::Index: {
            if (expr.index == 0 || expr.index > doc.GetColumnCount()) {
                return make_error(ErrorKind::InvalidInput,
                                  fmt::format("column {} out of range (input has {} columns)",
                                              expr.index, doc.GetColumnCount()));
            }
            std::string name =
                header ? doc.GetColumnNames()[expr.index - 1] : std::to_string(expr.index);
            return AxisColumn{.column = expr.index - 1, .name = std::move(name)};
        }
        case AxisExpr::Kind::Name: {
            if (!header) {
                return make_error(
                    ErrorKind::InvalidInput,
                    fmt::format("column '{}' requested by name but input has no header",
                                expr.name));
            }
            const auto idx = doc.GetColumnIdx(expr.name);
            if (idx < 0) {
                return make_error(ErrorKind::InvalidInput,
                                  fmt::format("column '{}' not found in header", expr.name));
            }
            return AxisColumn{.column = static_cast<std::size_t>(idx), .name = expr.name};
        }
        case AxisExpr::Kind::Constant:
            return AxisColumn{.column = std::nullopt, .name = fmt::format("{}", expr.constant)};
        case AxisExpr::Kind::RowNumber:
            return AxisColumn{.column = std::nullopt, .name = "#"};
    }
    return make_error(ErrorKind::InvalidInput, "unsupported axis expression");
}

auto axis_value(const AxisExpr& expr, const AxisColumn& axis, rapidcsv::Document& doc,
                std::size_t row) -> Result<double> {
    if (axis.column.has_value()) {
        auto cell = doc.GetCell<std::string>(*axis.column, row);
        double value = 0.0;
        if (!try_parse_double(cell, value)) {
            return make_error(ErrorKind::InvalidInput,
                              fmt::format("record {}: cannot read '{}' in column {} as a number",
                                          row + 1, cell, axis.name));
        }
        return value;
    }
    if (expr.kind == AxisExpr::Kind::RowNumber) {
        return static_cast<double>(row + 1);
    }
    return expr.constant;
}

auto read_document(rapidcsv::Document& doc, const ReadOptions& options) -> Result<Table> {
    auto x_axis = resolve_axis(options.x, doc, options.header);
    if (!x_axis) {
        return std::unexpected(x_axis.error());
    }
    auto y_axis = resolve_axis(options.y, doc, options.header);
    if (!y_axis) {
        return std::unexpected(y_axis.error());
    }

    Table table{x_axis->name, y_axis->name};
    const std::size_t rows = doc.GetRowCount();
    table.reserve(rows);
    for (std::size_t row = 0; row < rows; ++row) {
        auto x = axis_value(options.x, *x_axis, doc, row);
        if (!x) {
            return std::unexpected(x.error());
        }
        auto y = axis_value(options.y, *y_axis, doc, row);
        if (!y) {
            return std::unexpected(y.error());
        }
        table.add_row(*x, *y);
    }
    return table;
}

}  // namespace

auto parse_encoding(std::string_view text) -> Result<TableEncoding> {
    if (text == "csv") {
        return TableEncoding::Csv;
    }
    if (text == "tsv") {
        return TableEncoding::Tsv;
    }
    return make_error(ErrorKind::InvalidInput, fmt::format("unknown table encoding '{}'", text));
}

auto to_string(TableEncoding encoding) noexcept -> std::string_view {
    switch (encoding) {
        case TableEncoding::Csv:
            return "csv";
        case TableEncoding::Tsv:
            return "tsv";
    }
    return "csv";
}

void write_table(const Table& table, std::ostream& out, const WriteOptions& options) {
    const char sep = separator_of(options.encoding);
    if (options.header) {
        out << quote_cell(table.x_name, sep) << sep << quote_cell(table.y_name, sep) << '\n';
    }
    for (const auto& p : table.points) {
        out << fmt::format("{}{}{}\n", p.x, sep, p.y);
    }
}

auto AxisExpr::parse(std::string_view text) -> Result<AxisExpr> {
    auto trimmed = csv_trim(text);
    if (trimmed.empty()) {
        return make_error(ErrorKind::InvalidInput, "empty axis expression");
    }
    if (trimmed == "#") {
        return AxisExpr{.kind = Kind::RowNumber};
    }
    if (trimmed.front() == '=') {
        double value = 0.0;
        if (!try_parse_double(trimmed.substr(1), value)) {
            return make_error(ErrorKind::InvalidInput,
                              fmt::format("axis constant '{}' is not a number", trimmed));
        }
        return AxisExpr{.kind = Kind::Constant, .constant = value};
    }
    std::size_t index = 0;
    auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), index);
    if (ec == std::errc() && ptr == trimmed.data() + trimmed.size()) {
        if (index == 0) {
            return make_error(ErrorKind::InvalidInput, "column indexes start at 1");
        }
        return AxisExpr{.kind = Kind::Index, .index = index};
    }
    return AxisExpr{.kind = Kind::Name, .name = std::string(trimmed)};
}

auto AxisExpr::to_string() const -> std::string {
    switch (kind) {
        case Kind::Index:
            return std::to_string(index);
        case Kind::Name:
            return name;
        case Kind::Constant:
            return fmt::format("={}", constant);
        case Kind::RowNumber:
            return "#";
    }
    return {};
}

auto read_csv(std::istream& in, const ReadOptions& options) -> Result<Table> {
    // rapidcsv seeks to the start of the stream it is given; buffer what is
    // left so pipes and partially consumed streams read correctly.
    std::string content{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    std::istringstream buffer(std::move(content));
    try {
        rapidcsv::Document doc(buffer, rapidcsv::LabelParams(options.header ? 0 : -1, -1),
                               rapidcsv::SeparatorParams(','));
        return read_document(doc, options);
    } catch (const std::exception& e) {
        return make_error(ErrorKind::InvalidInput, fmt::format("malformed csv: {}", e.what()));
    }
}

auto read_csv(const std::filesystem::path& path, const ReadOptions& options) -> Result<Table> {
    std::ifstream input(path);
    if (!input) {
        return make_error(ErrorKind::ExternalCollaborator,
                          fmt::format("failed to open '{}'", path.string()));
    }
    return read_csv(input, options);
}

}  // namespace splot::runtime
