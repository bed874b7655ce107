#include <splot/core/table.hpp>

#include <algorithm>
#include <cmath>

namespace splot {

auto find_non_finite_x(const Table& table) -> std::optional<std::size_t> {
    for (std::size_t i = 0; i < table.points.size(); ++i) {
        if (!std::isfinite(table.points[i].x)) {
            return i;
        }
    }
    return std::nullopt;
}

auto find_non_finite_y(const Table& table) -> std::optional<std::size_t> {
    for (std::size_t i = 0; i < table.points.size(); ++i) {
        if (!std::isfinite(table.points[i].y)) {
            return i;
        }
    }
    return std::nullopt;
}

void sort_by_x(Table& table) {
    std::stable_sort(table.points.begin(), table.points.end(),
                     [](const Point& lhs, const Point& rhs) { return lhs.x < rhs.x; });
}

auto find_duplicate_x(const Table& table) -> std::optional<std::size_t> {
    for (std::size_t i = 1; i < table.points.size(); ++i) {
        if (table.points[i].x == table.points[i - 1].x) {
            return i;
        }
    }
    return std::nullopt;
}

}  // namespace splot
