#include <splot/runtime/dump.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <ostream>
#include <system_error>

namespace splot::runtime {

auto write_cache(DumpContext& context, const parser::OpSeq& seq, std::size_t count,
                 const Table& table) -> Result<void> {
    if (context.store == nullptr) {
        return make_error(ErrorKind::CacheWriteRefused, "no cache directory configured");
    }
    auto entry = context.store->write(seq, count, table);
    if (!entry) {
        return std::unexpected(entry.error());
    }
    return {};
}

auto print_table(DumpContext& context, const Table& table) -> Result<void> {
    if (context.out == nullptr) {
        return make_error(ErrorKind::ExternalCollaborator, "no output stream configured");
    }
    write_table(table, *context.out, context.write_options);
    context.out->flush();
    if (!*context.out) {
        return make_error(ErrorKind::ExternalCollaborator, "failed to write table to output");
    }
    return {};
}

auto write_data_file(const std::filesystem::path& path, const Table& table) -> Result<void> {
    std::ofstream out(path);
    if (!out) {
        return make_error(ErrorKind::ExternalCollaborator,
                          fmt::format("cannot create data file '{}'", path.string()));
    }
    write_table(table, out, WriteOptions{.encoding = TableEncoding::Csv, .header = true});
    out.flush();
    if (!out) {
        return make_error(ErrorKind::ExternalCollaborator,
                          fmt::format("cannot write data file '{}'", path.string()));
    }
    return {};
}

auto plot_table(DumpContext& context, const Table& table) -> Result<void> {
    if (context.renderer == nullptr) {
        return make_error(ErrorKind::ExternalCollaborator, "no renderer configured");
    }
    const auto data_path = plot::temp_path("splot-", ".csv");
    if (auto ok = write_data_file(data_path, table); !ok) {
        return ok;
    }

    auto script = context.plot_template;
    script.series = {plot::SeriesOptions{.data_path = data_path}};
    auto rendered = context.renderer->render(script.render());

    if (context.preserve) {
        spdlog::info("plot data kept at {}", data_path.string());
    } else {
        std::error_code ec;
        std::filesystem::remove(data_path, ec);
    }
    if (!rendered) {
        return rendered;
    }
    spdlog::info("plotted {} rows of '{}'", table.rows(), table.y_name);
    return {};
}

}  // namespace splot::runtime
