#pragma once

#include <splot/core/error.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace splot::plot {

enum class Terminal : std::uint8_t {
    Dumb,
    X11,
    Postscript,
};

[[nodiscard]] auto parse_terminal(std::string_view text) -> Result<Terminal>;
[[nodiscard]] auto to_string(Terminal terminal) noexcept -> std::string_view;

enum class PlotStyle : std::uint8_t {
    Points,
    Lines,
    Linespoints,
};

[[nodiscard]] auto parse_style(std::string_view text) -> Result<PlotStyle>;

/// Settings for one of the four gnuplot axes. Unset fields emit nothing.
struct AxisOptions {
    std::optional<std::string> label;
    std::optional<double> min;
    std::optional<double> max;
    std::optional<double> logscale;

    [[nodiscard]] auto configured() const noexcept -> bool {
        return label || min || max || logscale;
    }
};

/// One `plot` clause.
struct SeriesOptions {
    std::filesystem::path data_path;
    std::optional<std::string> label;
    PlotStyle style = PlotStyle::Points;
    bool use_y2 = false;
    /// Appended verbatim to the clause.
    std::string extra;
};

/// Builds a gnuplot script: preamble, axes, appearance, user commands,
/// output redirection, then a single `plot` directive over all series.
struct GnuplotTemplate {
    Terminal terminal = Terminal::Dumb;
    /// User customization lines, inserted before the plot directive.
    std::string custom;
    /// PDF destination; only meaningful for the postscript terminal.
    std::optional<std::string> output;
    std::string key_position = "top right";
    bool grid = false;
    AxisOptions x_axis;
    AxisOptions y_axis;
    AxisOptions y2_axis;
    std::vector<SeriesOptions> series;

    [[nodiscard]] auto render() const -> std::string;
};

/// External plotting engine.
class Renderer {
   public:
    virtual ~Renderer() = default;
    /// Run `script`; any failure is an ExternalCollaborator error.
    [[nodiscard]] virtual auto render(std::string_view script) -> Result<void> = 0;
};

/// Runs `gnuplot -p` on a temporary script file.
class GnuplotRenderer final : public Renderer {
   public:
    struct Config {
        std::string executable = "gnuplot";
        /// Keep the temporary script after running.
        bool preserve = false;
    };

    explicit GnuplotRenderer(Config config) : config_(std::move(config)) {}

    [[nodiscard]] auto render(std::string_view script) -> Result<void> override;
    [[nodiscard]] auto command_for(const std::filesystem::path& script_path) const -> std::string;

   private:
    Config config_;
};

/// Unused path `<tmp>/<prefix><16 random chars><extension>`.
[[nodiscard]] auto temp_path(std::string_view prefix, std::string_view extension)
    -> std::filesystem::path;

/// Quote `text` for a POSIX shell.
[[nodiscard]] auto shell_quote(std::string_view text) -> std::string;

}  // namespace splot::plot
