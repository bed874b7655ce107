#pragma once

#include <splot/cache/resolver.hpp>
#include <splot/core/error.hpp>
#include <splot/core/table.hpp>
#include <splot/parser/opseq.hpp>
#include <splot/runtime/dump.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>

namespace splot::runtime {

enum class DriverState : std::uint8_t {
    Init,
    Resolved,
    Running,
    Done,
    Failed,
};

[[nodiscard]] auto to_string(DriverState state) noexcept -> std::string_view;

/// Produces the initial table from the original source.
using SourceLoader = std::function<Result<Table>()>;

/// Runs one operator sequence, resuming from the cache when possible.
///
///   Init --resolve--> Resolved --run--> Running --> Done
///                                          \------> Failed
///
/// The source is only loaded when no cache entry covers a prefix. The first
/// failing operator stops the run; cache entries written before it remain.
class Driver {
   public:
    Driver(parser::OpSeq seq, SourceLoader source, DumpContext context);

    /// Consult the cache store. Without a store, or for a source with no
    /// lineage, resolution starts from the source.
    [[nodiscard]] auto resolve() -> Result<void>;

    /// Execute the remaining operators and return the final table.
    [[nodiscard]] auto run() -> Result<Table>;

    [[nodiscard]] auto state() const noexcept -> DriverState { return state_; }
    [[nodiscard]] auto resolution() const noexcept -> const cache::Resolution& {
        return resolution_;
    }
    [[nodiscard]] auto sequence() const noexcept -> const parser::OpSeq& { return seq_; }

   private:
    [[nodiscard]] auto fail(Error error) -> std::unexpected<Error>;
    [[nodiscard]] auto execute(const parser::Operator& op, std::size_t index, Table table)
        -> Result<Table>;

    parser::OpSeq seq_;
    SourceLoader source_;
    DumpContext context_;
    cache::Resolution resolution_;
    DriverState state_ = DriverState::Init;
};

}  // namespace splot::runtime
