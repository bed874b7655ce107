#pragma once

#include <splot/cache/cache_file.hpp>
#include <splot/core/error.hpp>
#include <splot/core/table.hpp>
#include <splot/parser/opseq.hpp>
#include <splot/runtime/dump.hpp>

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace splot::runtime {

enum class InputFormat : std::uint8_t {
    /// A CSV file, or `-` for standard input.
    Csv,
    /// A cache directory; its lineage record names the original source.
    Lnk,
};

[[nodiscard]] auto parse_input_format(std::string_view text) -> Result<InputFormat>;

/// What happens to the final table.
enum class OutputMode : std::uint8_t {
    Plot,
    Dump,
    None,
};

[[nodiscard]] auto parse_output_mode(std::string_view text) -> Result<OutputMode>;

/// Append `P` or `O` for the mode unless the sequence already ends in a dump.
void apply_output_mode(parser::OpSeq& seq, OutputMode mode);

struct PipelineConfig {
    std::string input = "-";
    InputFormat format = InputFormat::Csv;
    std::string xexpr = "1";
    std::string yexpr = "2";
    bool header = true;
    std::string opseq;
    OutputMode mode = OutputMode::None;
    /// Where `C` writes and where cached prefixes are looked up.
    std::optional<std::filesystem::path> cache_dir;
    /// Stream read for input `-`; std::cin when null.
    std::istream* standard_input = nullptr;
};

/// Cache directory for a run. An explicit directory always wins. Otherwise a
/// linked run stays in the directory it was given and CSV input uses `fallback`.
[[nodiscard]] auto default_cache_dir(InputFormat format,
                                     std::optional<std::filesystem::path> requested,
                                     std::filesystem::path fallback)
    -> std::optional<std::filesystem::path>;

/// Lineage for a named CSV input; nullopt for standard input.
[[nodiscard]] auto lineage_for(const PipelineConfig& config) -> std::optional<cache::Lineage>;

/// Parse, resolve against the cache and execute one operator sequence.
[[nodiscard]] auto run_pipeline(const PipelineConfig& config, DumpContext context)
    -> Result<Table>;

}  // namespace splot::runtime
