#include <splot/multi/orchestrator.hpp>

#include <splot/parser/opseq.hpp>
#include <splot/runtime/dump.hpp>
#include <splot/runtime/pipeline.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <functional>
#include <future>
#include <system_error>
#include <utility>

namespace splot::multi {

namespace fs = std::filesystem;

namespace {

auto split_fields(std::string_view text) -> std::vector<std::string_view> {
    std::vector<std::string_view> fields;
    std::size_t start = 0;
    while (true) {
        auto bar = text.find('|', start);
        if (bar == std::string_view::npos) {
            fields.push_back(text.substr(start));
            return fields;
        }
        fields.push_back(text.substr(start, bar - start));
        start = bar + 1;
    }
}

auto series_error(std::size_t index, const Error& error) -> std::unexpected<Error> {
    return std::unexpected(Error{
        .kind = error.kind,
        .message = fmt::format("series {}: {}", index + 1, error.message),
        .position = error.position,
    });
}

}  // namespace

auto parse_series_spec(std::string_view text) -> Result<SeriesSpec> {
    auto fields = split_fields(text);
    if (fields.size() < 4 || fields.size() > 5) {
        return make_error(ErrorKind::InvalidInput,
                          fmt::format("series '{}' must look like input|xexpr|yexpr|opseq[|label]",
                                      text));
    }
    if (fields[0].empty()) {
        return make_error(ErrorKind::InvalidInput, fmt::format("series '{}' has no input", text));
    }
    SeriesSpec spec;
    spec.input = fields[0];
    if (!fields[1].empty()) {
        spec.xexpr = fields[1];
    }
    if (!fields[2].empty()) {
        spec.yexpr = fields[2];
    }
    spec.opseq = fields[3];
    if (fields.size() == 5 && !fields[4].empty()) {
        spec.label = std::string(fields[4]);
    }

    auto seq = parser::parse(spec.opseq);
    if (!seq) {
        return std::unexpected(seq.error());
    }
    for (const auto& op : seq->ops()) {
        if (op.code == parser::OpCode::Print || op.code == parser::OpCode::Plot) {
            return make_error(ErrorKind::InvalidInput,
                              fmt::format("series '{}': '{}' is not allowed in a series; "
                                          "series are plotted together",
                                          text, op.letter()));
        }
    }
    return spec;
}

auto series_cache_dir(const fs::path& root, const SeriesSpec& spec, bool header) -> fs::path {
    const auto key = fmt::format("{}|{}|{}|{}", spec.input, spec.xexpr, spec.yexpr, header);
    return root / fmt::format("{:016x}", std::hash<std::string>{}(key));
}

auto run_all(const std::vector<SeriesSpec>& specs, const MultiOptions& options)
    -> Result<std::vector<Table>> {
    std::size_t from_stdin = 0;
    for (const auto& spec : specs) {
        from_stdin += spec.input == "-" ? 1 : 0;
    }
    if (from_stdin > 1) {
        return make_error(ErrorKind::InvalidInput, "only one series can read standard input");
    }

    std::vector<std::future<Result<Table>>> pending;
    pending.reserve(specs.size());
    for (const auto& spec : specs) {
        runtime::PipelineConfig config{
            .input = spec.input,
            .format = runtime::InputFormat::Csv,
            .xexpr = spec.xexpr,
            .yexpr = spec.yexpr,
            .header = options.header,
            .opseq = spec.opseq,
            .mode = runtime::OutputMode::None,
            .cache_dir = std::nullopt,
            .standard_input = nullptr,
        };
        if (options.cache_root) {
            config.cache_dir = series_cache_dir(*options.cache_root, spec, options.header);
        }
        pending.push_back(std::async(std::launch::async, [config = std::move(config)]() {
            return runtime::run_pipeline(config, runtime::DumpContext{});
        }));
    }

    // Wait for every series before looking at any result.
    std::vector<Result<Table>> results;
    results.reserve(pending.size());
    for (auto& future : pending) {
        results.push_back(future.get());
    }

    std::vector<Table> tables;
    tables.reserve(results.size());
    for (std::size_t i = 0; i < results.size(); ++i) {
        if (!results[i]) {
            return series_error(i, results[i].error());
        }
        spdlog::debug("series {} finished with {} rows", i + 1, results[i]->rows());
        tables.push_back(std::move(*results[i]));
    }
    return tables;
}

auto compose(const MultiOptions& options, const std::vector<SeriesSpec>& specs,
             const std::vector<fs::path>& data_paths) -> plot::GnuplotTemplate {
    auto script = options.plot_template;
    script.series.clear();
    for (std::size_t i = 0; i < data_paths.size(); ++i) {
        script.series.push_back(plot::SeriesOptions{
            .data_path = data_paths[i],
            .label = i < specs.size() ? specs[i].label : std::nullopt,
            .style = options.style,
        });
    }
    return script;
}

auto plot_all(const std::vector<SeriesSpec>& specs, const MultiOptions& options,
              plot::Renderer& renderer) -> Result<void> {
    auto tables = run_all(specs, options);
    if (!tables) {
        return std::unexpected(tables.error());
    }

    std::vector<fs::path> data_paths;
    auto cleanup = [&] {
        if (options.preserve) {
            for (const auto& path : data_paths) {
                spdlog::info("plot data kept at {}", path.string());
            }
            return;
        }
        std::error_code ec;
        for (const auto& path : data_paths) {
            fs::remove(path, ec);
        }
    };

    for (const auto& table : *tables) {
        data_paths.push_back(plot::temp_path("msplot-", ".csv"));
        if (auto ok = runtime::write_data_file(data_paths.back(), table); !ok) {
            cleanup();
            return ok;
        }
    }

    auto rendered = renderer.render(compose(options, specs, data_paths).render());
    cleanup();
    if (!rendered) {
        return rendered;
    }
    spdlog::info("plotted {} series", tables->size());
    return {};
}

}  // namespace splot::multi
