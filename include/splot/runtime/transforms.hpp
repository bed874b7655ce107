#pragma once

#include <splot/core/error.hpp>
#include <splot/core/table.hpp>
#include <splot/parser/opseq.hpp>

#include <string>
#include <utility>

namespace splot::runtime {

// ─── Transform operators ──────────────────────────────────────────────────────
//  Each consumes a table and returns a new one. Any computed value that is not
//  finite fails the operator with ErrorKind::NonFiniteValue.

/// `c`: sort y, emit (y_i, i/n) with 1-based rank i. Columns become (y, "CDF").
[[nodiscard]] auto cdf(Table table) -> Result<Table>;

/// `d`: sort by x (x must be unique), then emit a slope each time x has advanced
/// by at least `window.span()` since the previous emitted point. A zero window
/// differentiates every consecutive pair.
[[nodiscard]] auto derivative(Table table, parser::Window window) -> Result<Table>;

/// `i`: sort by x (x must be unique), then accumulate y * dx from the first row.
/// The first row integrates to 0, so `d` after `i` recovers y from row 2 on.
[[nodiscard]] auto integral(Table table) -> Result<Table>;

/// `m`: sum y over runs of consecutive rows sharing the same x. No sort.
[[nodiscard]] auto merge(Table table) -> Result<Table>;

/// `o`: stable sort by ascending x.
[[nodiscard]] auto sort(Table table) -> Result<Table>;

/// `s`: y_i - y_{i-1} for every row after the first. No sort.
[[nodiscard]] auto step(Table table) -> Result<Table>;

/// `a`: for every row, the mean of all y whose x lies in [x - left, x + right].
/// Output keeps the input row order and row count.
[[nodiscard]] auto average(Table table, parser::Window window) -> Result<Table>;

/// `f`: drop rows whose y is NaN or infinite.
[[nodiscard]] auto finite(Table table) -> Result<Table>;

/// `u`: keep the first row of each distinct x, in input order.
[[nodiscard]] auto unique(Table table) -> Result<Table>;

/// `r`: swap the x and y columns, names included.
[[nodiscard]] auto rotate(Table table) -> Result<Table>;

/// Dispatch a transform operator. Dump operators return the table untouched.
[[nodiscard]] auto apply(const parser::Operator& op, Table table) -> Result<Table>;

}  // namespace splot::runtime
