#include <splot/runtime/driver.hpp>
#include <splot/runtime/transforms.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <utility>

namespace splot::runtime {

auto to_string(DriverState state) noexcept -> std::string_view {
    switch (state) {
        case DriverState::Init:
            return "init";
        case DriverState::Resolved:
            return "resolved";
        case DriverState::Running:
            return "running";
        case DriverState::Done:
            return "done";
        case DriverState::Failed:
            return "failed";
    }
    return "unknown";
}

Driver::Driver(parser::OpSeq seq, SourceLoader source, DumpContext context)
    : seq_(std::move(seq)), source_(std::move(source)), context_(std::move(context)) {}

auto Driver::fail(Error error) -> std::unexpected<Error> {
    state_ = DriverState::Failed;
    spdlog::debug("driver failed: {}", error.format());
    return std::unexpected(std::move(error));
}

auto Driver::resolve() -> Result<void> {
    if (state_ != DriverState::Init) {
        return {};
    }
    resolution_ = cache::Resolution{};
    const auto* store = context_.store;
    if (store != nullptr && store->lineage().has_value()) {
        auto entries = store->entries();
        if (!entries) {
            return fail(std::move(entries.error()));
        }
        auto index = cache::CacheIndex::build(std::move(*entries), *store->lineage());
        if (!index) {
            return fail(std::move(index.error()));
        }
        spdlog::debug("cache index of {}: [{}]", store->directory().string(),
                      fmt::join(index->keys(), ", "));
        resolution_ = cache::resolve(seq_, *index);
    }
    state_ = DriverState::Resolved;
    return {};
}

auto Driver::execute(const parser::Operator& op, std::size_t index, Table table)
    -> Result<Table> {
    switch (op.code) {
        case parser::OpCode::CacheWrite:
            if (auto ok = write_cache(context_, seq_, index + 1, table); !ok) {
                return std::unexpected(std::move(ok.error()));
            }
            return table;
        case parser::OpCode::Print:
            if (auto ok = print_table(context_, table); !ok) {
                return std::unexpected(std::move(ok.error()));
            }
            return table;
        case parser::OpCode::Plot:
            if (auto ok = plot_table(context_, table); !ok) {
                return std::unexpected(std::move(ok.error()));
            }
            return table;
        default:
            return apply(op, std::move(table));
    }
}

auto Driver::run() -> Result<Table> {
    if (state_ == DriverState::Init) {
        if (auto ok = resolve(); !ok) {
            return std::unexpected(ok.error());
        }
    }
    if (state_ != DriverState::Resolved) {
        return make_error(ErrorKind::InvalidInput,
                          fmt::format("driver cannot run from state '{}'", to_string(state_)));
    }
    state_ = DriverState::Running;

    const bool from_cache = resolution_.hit() && context_.store != nullptr;
    if (!from_cache && !source_) {
        return fail(Error{.kind = ErrorKind::InvalidInput, .message = "no input source"});
    }
    Result<Table> current = from_cache ? context_.store->load(*resolution_.entry) : source_();
    if (!current) {
        return fail(std::move(current.error()));
    }
    spdlog::debug("starting from {} ({} rows)",
                  from_cache ? fmt::format("cache '{}'", resolution_.matched_key)
                                    : std::string("source"),
                  current->rows());

    for (std::size_t i = resolution_.resume_at; i < seq_.size(); ++i) {
        const auto& op = seq_[i];
        const auto rows_in = current->rows();
        current = execute(op, i, std::move(*current));
        if (!current) {
            auto error = std::move(current.error());
            if (error.position == 0 && error.kind != ErrorKind::ExternalCollaborator) {
                error.position = op.position;
            }
            return fail(std::move(error));
        }
        spdlog::debug("{} ({}): {} -> {} rows", op.canonical(), parser::info(op.code).name,
                      rows_in, current->rows());
    }
    state_ = DriverState::Done;
    return current;
}

}  // namespace splot::runtime
