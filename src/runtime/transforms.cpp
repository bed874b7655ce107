#include <splot/runtime/transforms.hpp>

#include <fmt/format.h>
#include <robin_hood.h>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <string_view>
#include <vector>

namespace splot::runtime {

namespace {

auto window_suffix(parser::Window window) -> std::string {
    if (window.is_zero()) {
        return {};
    }
    return fmt::format("({},{})", parser::format_argument(window.left),
                       parser::format_argument(window.right));
}

auto non_finite_input(std::string_view op, std::string_view column, std::size_t row)
    -> std::unexpected<Error> {
    return make_error(ErrorKind::NonFiniteValue,
                      fmt::format("{}: column {} holds a non-finite value at row {}", op, column,
                                  row + 1));
}

auto require_finite_x(const Table& table, std::string_view op) -> Result<void> {
    if (auto row = find_non_finite_x(table)) {
        return non_finite_input(op, table.x_name, *row);
    }
    return {};
}

// Shared by the operators that differentiate or integrate over x: sort, then
// refuse repeated keys.
auto sort_unique_x(Table& table, std::string_view op) -> Result<void> {
    if (auto ok = require_finite_x(table, op); !ok) {
        return ok;
    }
    sort_by_x(table);
    if (auto row = find_duplicate_x(table)) {
        return make_error(ErrorKind::DuplicateKey,
                          fmt::format("{}: x value {} appears more than once", op,
                                      table.points[*row].x));
    }
    return {};
}

// Verifies values the operator computed.
auto require_finite_output(const Table& table, std::string_view op) -> Result<void> {
    if (auto row = find_non_finite_y(table)) {
        return make_error(ErrorKind::NonFiniteValue,
                          fmt::format("{}: produced a non-finite value at output row {}", op,
                                      *row + 1));
    }
    return {};
}

// Neumaier summation of values[begin, end).
auto compensated_sum(const std::vector<double>& values, std::size_t begin, std::size_t end)
    -> double {
    double sum = 0.0;
    double carry = 0.0;
    for (std::size_t i = begin; i < end; ++i) {
        const double v = values[i];
        const double t = sum + v;
        if (std::abs(sum) >= std::abs(v)) {
            carry += (sum - t) + v;
        } else {
            carry += (v - t) + sum;
        }
        sum = t;
    }
    return sum + carry;
}

}  // namespace

// ─── Sort-dependent operators ─────────────────────────────────────────────────

auto cdf(Table table) -> Result<Table> {
    if (auto row = find_non_finite_y(table)) {
        return non_finite_input("cdf", table.y_name, *row);
    }
    std::vector<double> values;
    values.reserve(table.rows());
    for (const auto& p : table.points) {
        values.push_back(p.y);
    }
    std::sort(values.begin(), values.end());

    Table out{table.y_name, "CDF"};
    out.reserve(values.size());
    const auto n = static_cast<double>(values.size());
    for (std::size_t i = 0; i < values.size(); ++i) {
        out.add_row(values[i], static_cast<double>(i + 1) / n);
    }
    return out;
}

auto derivative(Table table, parser::Window window) -> Result<Table> {
    if (auto ok = sort_unique_x(table, "derivative"); !ok) {
        return std::unexpected(ok.error());
    }

    Table out{table.x_name, fmt::format("{}:Derivation{}", table.y_name, window_suffix(window))};
    if (table.empty()) {
        return out;
    }
    const double span = window.span();
    std::size_t anchor = 0;
    for (std::size_t i = 1; i < table.rows(); ++i) {
        const auto& first = table.points[anchor];
        const auto& last = table.points[i];
        const double dx = last.x - first.x;
        if (dx < span) {
            continue;
        }
        out.add_row(last.x, (last.y - first.y) / dx);
        anchor = i;
    }
    if (auto ok = require_finite_output(out, "derivative"); !ok) {
        return std::unexpected(ok.error());
    }
    return out;
}

auto integral(Table table) -> Result<Table> {
    if (auto ok = sort_unique_x(table, "integral"); !ok) {
        return std::unexpected(ok.error());
    }

    Table out{table.x_name, fmt::format("{}:Integral", table.y_name)};
    out.reserve(table.rows());
    double acc = 0.0;
    for (std::size_t i = 0; i < table.rows(); ++i) {
        const auto& p = table.points[i];
        if (i > 0) {
            acc += p.y * (p.x - table.points[i - 1].x);
        }
        out.add_row(p.x, acc);
    }
    if (auto ok = require_finite_output(out, "integral"); !ok) {
        return std::unexpected(ok.error());
    }
    return out;
}

auto sort(Table table) -> Result<Table> {
    if (auto ok = require_finite_x(table, "sort"); !ok) {
        return std::unexpected(ok.error());
    }
    sort_by_x(table);
    return table;
}

// ─── Order-preserving operators ───────────────────────────────────────────────

auto merge(Table table) -> Result<Table> {
    Table out{table.x_name, fmt::format("{}:Merge", table.y_name)};
    for (const auto& p : table.points) {
        // A repeat of an earlier x after a different x starts a fresh streak.
        if (!out.empty() && out.points.back().x == p.x) {
            out.points.back().y += p.y;
        } else {
            out.add_row(p.x, p.y);
        }
    }
    if (auto ok = require_finite_output(out, "merge"); !ok) {
        return std::unexpected(ok.error());
    }
    return out;
}

auto step(Table table) -> Result<Table> {
    Table out{table.x_name, fmt::format("{}:Step", table.y_name)};
    if (table.rows() > 1) {
        out.reserve(table.rows() - 1);
    }
    for (std::size_t i = 1; i < table.rows(); ++i) {
        out.add_row(table.points[i].x, table.points[i].y - table.points[i - 1].y);
    }
    if (auto ok = require_finite_output(out, "step"); !ok) {
        return std::unexpected(ok.error());
    }
    return out;
}

auto average(Table table, parser::Window window) -> Result<Table> {
    if (auto ok = require_finite_x(table, "average"); !ok) {
        return std::unexpected(ok.error());
    }
    const std::size_t rows = table.rows();

    // Rows ordered by x, so each window is two binary searches.
    std::vector<std::size_t> idx(rows);
    std::iota(idx.begin(), idx.end(), 0);
    std::stable_sort(idx.begin(), idx.end(), [&](std::size_t lhs, std::size_t rhs) {
        return table.points[lhs].x < table.points[rhs].x;
    });
    std::vector<double> xs(rows);
    std::vector<double> ys(rows);
    for (std::size_t i = 0; i < rows; ++i) {
        xs[i] = table.points[idx[i]].x;
        ys[i] = table.points[idx[i]].y;
    }

    Table out{table.x_name, fmt::format("{}:Average{}", table.y_name, window_suffix(window))};
    out.reserve(rows);
    for (const auto& p : table.points) {
        auto lo = std::lower_bound(xs.begin(), xs.end(), p.x - window.left);
        auto hi = std::upper_bound(xs.begin(), xs.end(), p.x + window.right);
        const auto begin = static_cast<std::size_t>(lo - xs.begin());
        const auto end = static_cast<std::size_t>(hi - xs.begin());
        out.add_row(p.x, compensated_sum(ys, begin, end) / static_cast<double>(end - begin));
    }
    if (auto ok = require_finite_output(out, "average"); !ok) {
        return std::unexpected(ok.error());
    }
    return out;
}

auto finite(Table table) -> Result<Table> {
    std::erase_if(table.points, [](const Point& p) { return !std::isfinite(p.y); });
    return table;
}

auto unique(Table table) -> Result<Table> {
    if (auto ok = require_finite_x(table, "unique"); !ok) {
        return std::unexpected(ok.error());
    }
    robin_hood::unordered_flat_set<double> seen;
    seen.reserve(table.rows());
    Table out = table.empty_like();
    for (const auto& p : table.points) {
        // -0.0 and 0.0 are the same key.
        const double key = p.x == 0.0 ? 0.0 : p.x;
        if (!seen.insert(key).second) {
            continue;
        }
        out.points.push_back(p);
    }
    return out;
}

auto rotate(Table table) -> Result<Table> {
    std::swap(table.x_name, table.y_name);
    for (auto& p : table.points) {
        std::swap(p.x, p.y);
    }
    return table;
}

// ─── Dispatch ─────────────────────────────────────────────────────────────────

auto apply(const parser::Operator& op, Table table) -> Result<Table> {
    switch (op.code) {
        case parser::OpCode::Cdf:
            return cdf(std::move(table));
        case parser::OpCode::Derivative:
            return derivative(std::move(table), op.window());
        case parser::OpCode::Integral:
            return integral(std::move(table));
        case parser::OpCode::Merge:
            return merge(std::move(table));
        case parser::OpCode::Sort:
            return sort(std::move(table));
        case parser::OpCode::Step:
            return step(std::move(table));
        case parser::OpCode::Average:
            return average(std::move(table), op.window());
        case parser::OpCode::Finite:
            return finite(std::move(table));
        case parser::OpCode::Unique:
            return unique(std::move(table));
        case parser::OpCode::Rotate:
            return rotate(std::move(table));
        case parser::OpCode::CacheWrite:
        case parser::OpCode::Print:
        case parser::OpCode::Plot:
            return table;
    }
    return table;
}

}  // namespace splot::runtime
