#include <splot/plot/gnuplot.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <random>
#include <system_error>

namespace splot::plot {

namespace fs = std::filesystem;

namespace {

void append_axis(fmt::memory_buffer& buf, std::string_view id, const AxisOptions& axis) {
    auto out = std::back_inserter(buf);
    fmt::format_to(out, "## {} axis\n", id);
    if (axis.logscale) {
        fmt::format_to(out, "set logscale {} {}\n", id, *axis.logscale);
    }
    if (axis.min || axis.max) {
        fmt::format_to(out, "set {}range [{}:{}]\n", id,
                       axis.min ? fmt::format("{}", *axis.min) : std::string("*"),
                       axis.max ? fmt::format("{}", *axis.max) : std::string("*"));
    }
    if (axis.label) {
        fmt::format_to(out, "set {}label \"{}\"\n", id, *axis.label);
    }
    if (id == "y2") {
        fmt::format_to(out, "set y2tics\n");
    }
}

auto style_text(PlotStyle style) -> std::string_view {
    switch (style) {
        case PlotStyle::Points:
            return "with points";
        case PlotStyle::Lines:
            return "with lines";
        case PlotStyle::Linespoints:
            return "with linespoints";
    }
    return "with points";
}

auto terminal_command(Terminal terminal) -> std::string_view {
    switch (terminal) {
        case Terminal::Dumb:
            return "dumb size `tput cols`,`echo $(($(tput lines) - 1))`";
        case Terminal::X11:
            return "x11 noenhanced";
        case Terminal::Postscript:
            return "postscript eps color noenhanced";
    }
    return "dumb";
}

}  // namespace

auto parse_terminal(std::string_view text) -> Result<Terminal> {
    if (text == "dumb") {
        return Terminal::Dumb;
    }
    if (text == "x11") {
        return Terminal::X11;
    }
    if (text == "postscript" || text == "ps") {
        return Terminal::Postscript;
    }
    return make_error(ErrorKind::InvalidInput,
                      fmt::format("unknown terminal '{}' (expected dumb, x11 or postscript)", text));
}

auto to_string(Terminal terminal) noexcept -> std::string_view {
    switch (terminal) {
        case Terminal::Dumb:
            return "dumb";
        case Terminal::X11:
            return "x11";
        case Terminal::Postscript:
            return "postscript";
    }
    return "dumb";
}

auto parse_style(std::string_view text) -> Result<PlotStyle> {
    if (text == "points" || text == "p") {
        return PlotStyle::Points;
    }
    if (text == "lines" || text == "l") {
        return PlotStyle::Lines;
    }
    if (text == "linespoints" || text == "lp") {
        return PlotStyle::Linespoints;
    }
    return make_error(ErrorKind::InvalidInput,
                      fmt::format("unknown plot style '{}' (expected points, lines or linespoints)",
                                  text));
}

auto GnuplotTemplate::render() const -> std::string {
    fmt::memory_buffer buf;
    auto out = std::back_inserter(buf);

    fmt::format_to(out, "#!/usr/bin/env -S gnuplot -p\n");
    fmt::format_to(out, "# Preamble\n");
    fmt::format_to(out, "set encoding utf8\n");
    fmt::format_to(out, "set datafile separator ','\n");
    fmt::format_to(out, "set key autotitle columnhead\n");
    fmt::format_to(out, "set terminal {}\n\n", terminal_command(terminal));

    fmt::format_to(out, "# Axes\n");
    if (x_axis.configured()) {
        append_axis(buf, "x", x_axis);
    }
    if (y_axis.configured()) {
        append_axis(buf, "y", y_axis);
    }
    bool any_y2 = false;
    for (const auto& s : series) {
        any_y2 = any_y2 || s.use_y2;
    }
    if (any_y2 && y2_axis.configured()) {
        append_axis(buf, "y2", y2_axis);
    }
    fmt::format_to(out, "\n");

    fmt::format_to(out, "# Global appearance\n");
    fmt::format_to(out, "set key {}\n", key_position);
    if (grid) {
        fmt::format_to(out, "set grid\n");
    }
    fmt::format_to(out, "\n");

    if (!custom.empty()) {
        fmt::format_to(out, "# Custom commands\n{}\n\n", custom);
    }
    if (output) {
        fmt::format_to(out, "set output '|ps2pdf -dEPSCrop - {}'\n", *output);
    }

    fmt::format_to(out, "plot\\\n");
    for (std::size_t i = 0; i < series.size(); ++i) {
        const auto& s = series[i];
        fmt::format_to(out, "\t'{}' using 1:2 axis x1y{} {}", s.data_path.string(),
                       s.use_y2 ? 2 : 1, style_text(s.style));
        if (s.label) {
            fmt::format_to(out, " title \"{}\"", *s.label);
        }
        if (!s.extra.empty()) {
            fmt::format_to(out, " {}", s.extra);
        }
        fmt::format_to(out, "{}\n", i + 1 < series.size() ? ",\\" : "");
    }
    return fmt::to_string(buf);
}

auto GnuplotRenderer::command_for(const fs::path& script_path) const -> std::string {
    return fmt::format("{} -p {}", shell_quote(config_.executable),
                       shell_quote(script_path.string()));
}

auto GnuplotRenderer::render(std::string_view script) -> Result<void> {
    const auto script_path = temp_path("splot-", ".gp");
    {
        std::ofstream out(script_path);
        if (!out) {
            return make_error(ErrorKind::ExternalCollaborator,
                              fmt::format("cannot create gnuplot script '{}'",
                                          script_path.string()));
        }
        out << script;
        if (!out) {
            return make_error(ErrorKind::ExternalCollaborator,
                              fmt::format("cannot write gnuplot script '{}'",
                                          script_path.string()));
        }
    }

    const auto command = command_for(script_path);
    spdlog::debug("running {}", command);
    const int status = std::system(command.c_str());

    if (config_.preserve) {
        spdlog::info("gnuplot script kept at {}", script_path.string());
    } else {
        std::error_code ec;
        fs::remove(script_path, ec);
    }

    if (status == -1) {
        return make_error(ErrorKind::ExternalCollaborator,
                          fmt::format("cannot start '{}'", config_.executable));
    }
    if (status != 0) {
        return make_error(ErrorKind::ExternalCollaborator,
                          fmt::format("'{}' failed (status {})", command, status));
    }
    return {};
}

auto temp_path(std::string_view prefix, std::string_view extension) -> fs::path {
    static constexpr std::string_view kCharset =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<std::size_t> pick(0, kCharset.size() - 1);

    const auto dir = fs::temp_directory_path();
    while (true) {
        std::string name(prefix);
        for (int i = 0; i < 16; ++i) {
            name.push_back(kCharset[pick(rng)]);
        }
        name.append(extension);
        auto candidate = dir / name;
        std::error_code ec;
        if (!fs::exists(candidate, ec)) {
            return candidate;
        }
    }
}

auto shell_quote(std::string_view text) -> std::string {
    std::string quoted = "'";
    for (char ch : text) {
        if (ch == '\'') {
            quoted.append("'\\''");
        } else {
            quoted.push_back(ch);
        }
    }
    quoted.push_back('\'');
    return quoted;
}

}  // namespace splot::plot
