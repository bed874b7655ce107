#include <splot/runtime/pipeline.hpp>

#include <splot/cache/store.hpp>
#include <splot/runtime/driver.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iostream>
#include <system_error>
#include <utility>

namespace splot::runtime {

namespace fs = std::filesystem;

namespace {

auto absolute_source(const std::string& input) -> std::string {
    std::error_code ec;
    auto path = fs::absolute(input, ec);
    if (ec) {
        return input;
    }
    return path.lexically_normal().string();
}

auto csv_loader(std::string source, ReadOptions options) -> SourceLoader {
    return [source = std::move(source), options = std::move(options)]() -> Result<Table> {
        spdlog::debug("loading source {}", source);
        return read_csv(fs::path(source), options);
    };
}

auto stream_loader(std::istream& in, ReadOptions options) -> SourceLoader {
    return [&in, options = std::move(options)]() -> Result<Table> {
        spdlog::debug("loading source from standard input");
        return read_csv(in, options);
    };
}

auto read_options_for(const PipelineConfig& config) -> Result<ReadOptions> {
    auto x = AxisExpr::parse(config.xexpr);
    if (!x) {
        return std::unexpected(x.error());
    }
    auto y = AxisExpr::parse(config.yexpr);
    if (!y) {
        return std::unexpected(y.error());
    }
    return ReadOptions{.header = config.header, .x = std::move(*x), .y = std::move(*y)};
}

auto writes_cache(const parser::OpSeq& seq) -> bool {
    return std::ranges::any_of(seq.ops(), [](const parser::Operator& op) {
        return op.code == parser::OpCode::CacheWrite;
    });
}

}  // namespace

auto parse_input_format(std::string_view text) -> Result<InputFormat> {
    if (text == "csv") {
        return InputFormat::Csv;
    }
    if (text == "lnk") {
        return InputFormat::Lnk;
    }
    return make_error(ErrorKind::InvalidInput,
                      fmt::format("unknown input format '{}' (expected csv or lnk)", text));
}

auto parse_output_mode(std::string_view text) -> Result<OutputMode> {
    if (text == "plot") {
        return OutputMode::Plot;
    }
    if (text == "dump") {
        return OutputMode::Dump;
    }
    if (text == "none") {
        return OutputMode::None;
    }
    return make_error(ErrorKind::InvalidInput,
                      fmt::format("unknown mode '{}' (expected plot, dump or none)", text));
}

void apply_output_mode(parser::OpSeq& seq, OutputMode mode) {
    if (mode == OutputMode::None || seq.ends_with_dump()) {
        return;
    }
    const auto code = mode == OutputMode::Plot ? parser::OpCode::Plot : parser::OpCode::Print;
    seq.push_back(parser::Operator{.code = code, .args = {}, .position = 0});
}

auto default_cache_dir(InputFormat format, std::optional<fs::path> requested,
                       fs::path fallback) -> std::optional<fs::path> {
    if (requested) {
        return requested;
    }
    if (format == InputFormat::Lnk) {
        return std::nullopt;
    }
    return fallback;
}

auto lineage_for(const PipelineConfig& config) -> std::optional<cache::Lineage> {
    if (config.input == "-") {
        return std::nullopt;
    }
    return cache::Lineage{
        .source = absolute_source(config.input),
        .xexpr = config.xexpr,
        .yexpr = config.yexpr,
        .header = config.header,
    };
}

auto run_pipeline(const PipelineConfig& config, DumpContext context) -> Result<Table> {
    auto seq = parser::parse(config.opseq);
    if (!seq) {
        return std::unexpected(seq.error());
    }
    apply_output_mode(*seq, config.mode);
    spdlog::debug("operator sequence: '{}' (key '{}')", seq->to_string(), seq->key());

    std::optional<cache::CacheStore> store;
    SourceLoader loader;

    if (config.format == InputFormat::Lnk) {
        auto linked = cache::CacheStore::open_existing(config.input);
        if (!linked) {
            return std::unexpected(linked.error());
        }
        const auto lineage = *linked->lineage();
        auto options = lineage.read_options();
        if (!options) {
            return std::unexpected(options.error());
        }
        loader = csv_loader(lineage.source, std::move(*options));
        if (config.cache_dir && fs::path(*config.cache_dir) != fs::path(config.input)) {
            auto target = cache::CacheStore::open(*config.cache_dir, lineage);
            if (target) {
                store = std::move(*target);
            } else if (target.error().kind == ErrorKind::LineageMismatch &&
                       !writes_cache(*seq)) {
                spdlog::debug("ignoring cache directory: {}", target.error().message);
            } else {
                return std::unexpected(target.error());
            }
        } else {
            store = std::move(*linked);
        }
    } else {
        auto options = read_options_for(config);
        if (!options) {
            return std::unexpected(options.error());
        }
        auto lineage = lineage_for(config);
        if (lineage) {
            loader = csv_loader(lineage->source, std::move(*options));
        } else {
            std::istream& in = config.standard_input ? *config.standard_input : std::cin;
            loader = stream_loader(in, std::move(*options));
        }
        if (config.cache_dir) {
            auto opened = cache::CacheStore::open(*config.cache_dir, std::move(lineage));
            if (opened) {
                store = std::move(*opened);
            } else if (opened.error().kind == ErrorKind::LineageMismatch &&
                       !writes_cache(*seq)) {
                // Nothing will be written there, so the directory is just not usable.
                spdlog::debug("ignoring cache directory: {}", opened.error().message);
            } else {
                return std::unexpected(opened.error());
            }
        }
    }

    context.store = store ? &*store : nullptr;
    Driver driver(std::move(*seq), std::move(loader), std::move(context));
    return driver.run();
}

}  // namespace splot::runtime
