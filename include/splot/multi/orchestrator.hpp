#pragma once

#include <splot/core/error.hpp>
#include <splot/core/table.hpp>
#include <splot/plot/gnuplot.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace splot::multi {

/// One data series: `input|xexpr|yexpr|opseq[|label]`.
struct SeriesSpec {
    std::string input;
    std::string xexpr = "1";
    std::string yexpr = "2";
    std::string opseq;
    std::optional<std::string> label;
};

/// Parse a series specification. Empty x/y fields keep their defaults.
/// Series sequences may cache (`C`) but not print or plot.
[[nodiscard]] auto parse_series_spec(std::string_view text) -> Result<SeriesSpec>;

struct MultiOptions {
    bool header = true;
    /// Each series caches under `<root>/<lineage digest>`; no caching when unset.
    std::optional<std::filesystem::path> cache_root;
    plot::GnuplotTemplate plot_template;
    plot::PlotStyle style = plot::PlotStyle::Points;
    bool preserve = false;
};

/// Cache subdirectory for a series, stable for a given source and axes.
[[nodiscard]] auto series_cache_dir(const std::filesystem::path& root, const SeriesSpec& spec,
                                    bool header) -> std::filesystem::path;

/// Run every series concurrently and wait for all of them. Results are in
/// caller order; the first failure in that order is returned.
[[nodiscard]] auto run_all(const std::vector<SeriesSpec>& specs, const MultiOptions& options)
    -> Result<std::vector<Table>>;

/// Script settings with one series clause per data file, in order.
[[nodiscard]] auto compose(const MultiOptions& options, const std::vector<SeriesSpec>& specs,
                           const std::vector<std::filesystem::path>& data_paths)
    -> plot::GnuplotTemplate;

/// Run all series, then render them together. Nothing is rendered if any series fails.
[[nodiscard]] auto plot_all(const std::vector<SeriesSpec>& specs, const MultiOptions& options,
                            plot::Renderer& renderer) -> Result<void>;

}  // namespace splot::multi
