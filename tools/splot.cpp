#include <splot/plot/gnuplot.hpp>
#include <splot/runtime/csv.hpp>
#include <splot/runtime/dump.hpp>
#include <splot/runtime/pipeline.hpp>

#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

namespace {

auto fail(const splot::Error& error) -> int {
    fmt::print(stderr, "splot: {}\n", error.format());
    return 1;
}

auto env_or(const char* name, std::string fallback) -> std::string {
    const char* value = std::getenv(name);
    if (value != nullptr && *value != '\0') {
        return value;
    }
    return fallback;
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"splot: transform a two-column table with an operator sequence and plot it"};
    app.set_version_flag("--version", "splot 0.1.0");

    std::string input = "-";
    std::string input_format = "csv";
    std::string opseq;
    std::string xexpr = "1";
    std::string yexpr = "2";
    bool header = true;
    std::string output_encoding = "csv";
    bool no_output_header = false;
    std::string cache_dir;
    std::string mode = "plot";
    std::string gnuplot_snippet;
    std::string terminal = "dumb";
    std::string output_file;
    bool preserve = false;
    bool verbose = false;

    app.add_option("-i,--input", input, "Input CSV file, '-' for standard input, or a cache "
                                        "directory with -f lnk");
    app.add_option("-f,--format", input_format, "Input format: csv or lnk")
        ->check(CLI::IsMember({"csv", "lnk"}));
    app.add_option("-e,--opseq", opseq, "Operator sequence, e.g. 'iCd1000CcC'");
    app.add_option("-x,--xexpr", xexpr, "x column: index, header name, '=constant' or '#'");
    app.add_option("-y,--yexpr", yexpr, "y column: index, header name, '=constant' or '#'");
    app.add_flag("--header,!--no-header", header, "Input has a header line (default: yes)");
    app.add_option("-F,--output-format", output_encoding, "Output encoding: csv or tsv")
        ->check(CLI::IsMember({"csv", "tsv"}));
    app.add_flag("--no-output-header", no_output_header, "Omit the header line on output");
    app.add_option("-o,--output-dir", cache_dir,
                   "Cache directory. Defaults to SPLOT_CACHE_DIR, then '.'; lnk input keeps its own");
    app.add_option("--mode", mode, "Final step: plot, dump or none")
        ->check(CLI::IsMember({"plot", "dump", "none"}));
    app.add_option("-g,--gnuplot", gnuplot_snippet, "Extra gnuplot commands before 'plot'");
    app.add_option("--terminal", terminal, "Gnuplot terminal: dumb, x11 or postscript")
        ->check(CLI::IsMember({"dumb", "x11", "postscript"}));
    app.add_option("--output-file", output_file, "PDF output (postscript terminal)");
    app.add_flag("-p,--preserve", preserve, "Keep temporary script and data files");
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");

    CLI11_PARSE(app, argc, argv);

    // Tables go to stdout; keep log lines out of them.
    spdlog::set_default_logger(spdlog::stderr_color_mt("splot"));
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    auto format = splot::runtime::parse_input_format(input_format);
    if (!format) {
        return fail(format.error());
    }
    std::optional<std::filesystem::path> requested_dir;
    if (!cache_dir.empty()) {
        requested_dir = cache_dir;
    }
    const auto store_dir = splot::runtime::default_cache_dir(
        *format, std::move(requested_dir), env_or("SPLOT_CACHE_DIR", "."));

    auto output_mode = splot::runtime::parse_output_mode(mode);
    if (!output_mode) {
        return fail(output_mode.error());
    }
    auto encoding = splot::runtime::parse_encoding(output_encoding);
    if (!encoding) {
        return fail(encoding.error());
    }
    auto term = splot::plot::parse_terminal(terminal);
    if (!term) {
        return fail(term.error());
    }

    splot::plot::GnuplotRenderer renderer(splot::plot::GnuplotRenderer::Config{
        .executable = env_or("SPLOT_GNUPLOT", "gnuplot"),
        .preserve = preserve,
    });

    splot::runtime::DumpContext context;
    context.out = &std::cout;
    context.write_options = splot::runtime::WriteOptions{
        .encoding = *encoding,
        .header = !no_output_header,
    };
    context.renderer = &renderer;
    context.plot_template.terminal = *term;
    context.plot_template.custom = gnuplot_snippet;
    if (!output_file.empty()) {
        context.plot_template.output = output_file;
    }
    context.preserve = preserve;

    splot::runtime::PipelineConfig config{
        .input = input,
        .format = *format,
        .xexpr = xexpr,
        .yexpr = yexpr,
        .header = header,
        .opseq = opseq,
        .mode = *output_mode,
        .cache_dir = store_dir,
        .standard_input = &std::cin,
    };

    auto result = splot::runtime::run_pipeline(config, std::move(context));
    if (!result) {
        return fail(result.error());
    }
    return 0;
}
