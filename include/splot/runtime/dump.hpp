#pragma once

#include <splot/cache/store.hpp>
#include <splot/core/error.hpp>
#include <splot/core/table.hpp>
#include <splot/parser/opseq.hpp>
#include <splot/plot/gnuplot.hpp>
#include <splot/runtime/csv.hpp>

#include <cstddef>
#include <filesystem>
#include <iosfwd>

namespace splot::runtime {

/// Everything the dump operators need to reach outside the engine.
/// Pointers are borrowed; a null collaborator makes its dump fail.
struct DumpContext {
    std::ostream* out = nullptr;
    WriteOptions write_options;
    cache::CacheStore* store = nullptr;
    plot::Renderer* renderer = nullptr;
    /// Script settings for `P`; its series list is filled per plot.
    plot::GnuplotTemplate plot_template;
    bool preserve = false;
};

/// `C`: store `table` as the result of the first `count` operators of `seq`.
[[nodiscard]] auto write_cache(DumpContext& context, const parser::OpSeq& seq, std::size_t count,
                               const Table& table) -> Result<void>;

/// `O`: write `table` to the output stream.
[[nodiscard]] auto print_table(DumpContext& context, const Table& table) -> Result<void>;

/// `P`: write `table` to a temporary CSV file and render it.
[[nodiscard]] auto plot_table(DumpContext& context, const Table& table) -> Result<void>;

/// Write `table` as CSV with a header to `path`, for use as a gnuplot data file.
[[nodiscard]] auto write_data_file(const std::filesystem::path& path, const Table& table)
    -> Result<void>;

}  // namespace splot::runtime
