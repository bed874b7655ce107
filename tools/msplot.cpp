#include <splot/multi/orchestrator.hpp>
#include <splot/plot/gnuplot.hpp>

#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

namespace {

auto fail(const splot::Error& error) -> int {
    fmt::print(stderr, "msplot: {}\n", error.format());
    return 1;
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"msplot: run several splot series concurrently and plot them together"};
    app.set_version_flag("--version", "msplot 0.1.0");

    std::vector<std::string> series;
    bool header = true;
    std::string cache_root;
    std::string gnuplot_snippet;
    std::string terminal = "dumb";
    std::string style = "points";
    std::string output_file;
    std::string key_position = "top right";
    bool grid = false;
    std::string xlabel;
    std::string ylabel;
    bool preserve = false;
    bool verbose = false;

    app.add_option("-s,--series", series, "Series 'input|xexpr|yexpr|opseq[|label]'")
        ->required();
    app.add_flag("--header,!--no-header", header, "Inputs have a header line (default: yes)");
    app.add_option("-o,--output-dir", cache_root,
                   "Cache root; each series caches in its own subdirectory. "
                   "Defaults to SPLOT_CACHE_DIR; no caching when neither is set");
    app.add_option("-g,--gnuplot", gnuplot_snippet, "Extra gnuplot commands before 'plot'");
    app.add_option("--terminal", terminal, "Gnuplot terminal: dumb, x11 or postscript")
        ->check(CLI::IsMember({"dumb", "x11", "postscript"}));
    app.add_option("--style", style, "Plot style: points, lines or linespoints");
    app.add_option("--output-file", output_file, "PDF output (postscript terminal)");
    app.add_option("--key", key_position, "Legend position");
    app.add_flag("--grid", grid, "Draw a grid");
    app.add_option("--xlabel", xlabel, "x axis label");
    app.add_option("--ylabel", ylabel, "y axis label");
    app.add_flag("-p,--preserve", preserve, "Keep temporary script and data files");
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");

    CLI11_PARSE(app, argc, argv);

    // Tables go to stdout; keep log lines out of them.
    spdlog::set_default_logger(spdlog::stderr_color_mt("msplot"));
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    std::vector<splot::multi::SeriesSpec> specs;
    specs.reserve(series.size());
    for (const auto& text : series) {
        auto spec = splot::multi::parse_series_spec(text);
        if (!spec) {
            return fail(spec.error());
        }
        specs.push_back(std::move(*spec));
    }

    auto term = splot::plot::parse_terminal(terminal);
    if (!term) {
        return fail(term.error());
    }
    auto plot_style = splot::plot::parse_style(style);
    if (!plot_style) {
        return fail(plot_style.error());
    }

    splot::multi::MultiOptions options;
    options.header = header;
    if (cache_root.empty()) {
        if (const char* env = std::getenv("SPLOT_CACHE_DIR"); env != nullptr && *env != '\0') {
            cache_root = env;
        }
    }
    if (!cache_root.empty()) {
        options.cache_root = cache_root;
    }
    options.plot_template.terminal = *term;
    options.plot_template.custom = gnuplot_snippet;
    options.plot_template.key_position = key_position;
    options.plot_template.grid = grid;
    if (!output_file.empty()) {
        options.plot_template.output = output_file;
    }
    if (!xlabel.empty()) {
        options.plot_template.x_axis.label = xlabel;
    }
    if (!ylabel.empty()) {
        options.plot_template.y_axis.label = ylabel;
    }
    options.style = *plot_style;
    options.preserve = preserve;

    std::string executable = "gnuplot";
    if (const char* env = std::getenv("SPLOT_GNUPLOT"); env != nullptr && *env != '\0') {
        executable = env;
    }
    splot::plot::GnuplotRenderer renderer(splot::plot::GnuplotRenderer::Config{
        .executable = executable,
        .preserve = preserve,
    });

    if (auto ok = splot::multi::plot_all(specs, options, renderer); !ok) {
        return fail(ok.error());
    }
    return 0;
}
