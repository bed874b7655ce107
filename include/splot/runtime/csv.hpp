#pragma once

#include <splot/core/error.hpp>
#include <splot/core/table.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>

namespace splot::runtime {

/// Tabular text encodings used for terminal output and cache payloads.
enum class TableEncoding : std::uint8_t {
    Csv,
    Tsv,
};

[[nodiscard]] auto parse_encoding(std::string_view text) -> Result<TableEncoding>;
[[nodiscard]] auto to_string(TableEncoding encoding) noexcept -> std::string_view;

struct WriteOptions {
    TableEncoding encoding = TableEncoding::Csv;
    bool header = true;
};

/// Write a table; numbers use the shortest text that reads back exactly.
void write_table(const Table& table, std::ostream& out, const WriteOptions& options = {});

/// Selects one axis out of a CSV source.
///
///   `3`      column 3 (1-based)
///   `price`  column named "price" (requires a header line)
///   `=1.5`   the constant 1.5 on every row
///   `#`      the 1-based row number
struct AxisExpr {
    enum class Kind : std::uint8_t {
        Index,
        Name,
        Constant,
        RowNumber,
    };

    Kind kind = Kind::Index;
    std::size_t index = 1;
    std::string name;
    double constant = 0.0;

    [[nodiscard]] static auto parse(std::string_view text) -> Result<AxisExpr>;
    /// Text that parses back to this expression.
    [[nodiscard]] auto to_string() const -> std::string;
};

struct ReadOptions {
    bool header = true;
    AxisExpr x = AxisExpr{.kind = AxisExpr::Kind::Index, .index = 1};
    AxisExpr y = AxisExpr{.kind = AxisExpr::Kind::Index, .index = 2};
};

/// Read a comma-separated stream (RFC 4180 quoting) into a two-column table.
[[nodiscard]] auto read_csv(std::istream& in, const ReadOptions& options = {}) -> Result<Table>;

/// Read a comma-separated file into a two-column table.
[[nodiscard]] auto read_csv(const std::filesystem::path& path, const ReadOptions& options = {})
    -> Result<Table>;

}  // namespace splot::runtime
