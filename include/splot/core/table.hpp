#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace splot {

/// One row of a two-column table.
struct Point {
    double x = 0.0;
    double y = 0.0;

    auto operator==(const Point&) const -> bool = default;
};

/// The in-memory two-column table every operator works on.
///
/// Row order is meaningful for order-dependent operators (merge, step) and
/// carries no guarantee otherwise until a sort runs. Tables are passed by
/// value and moved between operators; nothing shares a live table.
struct Table {
    std::string x_name = "x";
    std::string y_name = "y";
    std::vector<Point> points;

    Table() = default;
    Table(std::string x, std::string y, std::vector<Point> rows = {})
        : x_name(std::move(x)), y_name(std::move(y)), points(std::move(rows)) {}

    [[nodiscard]] auto rows() const noexcept -> std::size_t { return points.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return points.empty(); }

    void add_row(double x, double y) { points.push_back(Point{.x = x, .y = y}); }
    void reserve(std::size_t n) { points.reserve(n); }

    /// Same names, no rows.
    [[nodiscard]] auto empty_like() const -> Table { return Table{x_name, y_name}; }

    auto operator==(const Table&) const -> bool = default;
};

/// Index of the first row whose x is NaN or infinite.
[[nodiscard]] auto find_non_finite_x(const Table& table) -> std::optional<std::size_t>;

/// Index of the first row whose y is NaN or infinite.
[[nodiscard]] auto find_non_finite_y(const Table& table) -> std::optional<std::size_t>;

/// Stable ascending sort by x. Every x must be finite.
void sort_by_x(Table& table);

/// For a table sorted by x: index of the first row repeating its predecessor's x.
[[nodiscard]] auto find_duplicate_x(const Table& table) -> std::optional<std::size_t>;

}  // namespace splot
