#pragma once

#include <splot/cache/cache_file.hpp>
#include <splot/core/error.hpp>
#include <splot/parser/opseq.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace splot::cache {

/// Cache entries of one lineage, indexed by key.
///
/// When several entries share a key, the one with the largest write
/// sequence (the most recent write) is kept.
class CacheIndex {
   public:
    CacheIndex() = default;

    /// Index `entries`. Every entry must carry `lineage`; an entry recorded
    /// against another source fails with LineageMismatch.
    [[nodiscard]] static auto build(std::vector<CacheEntry> entries, const Lineage& lineage)
        -> Result<CacheIndex>;

    [[nodiscard]] auto find(std::string_view key) const -> const CacheEntry*;
    [[nodiscard]] auto size() const noexcept -> std::size_t { return by_key_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return by_key_.empty(); }
    [[nodiscard]] auto keys() const -> std::vector<std::string>;

   private:
    std::map<std::string, CacheEntry, std::less<>> by_key_;
};

/// Outcome of matching a requested sequence against a cache index.
struct Resolution {
    /// Entry to load, or nullopt to start from the original source.
    std::optional<CacheEntry> entry;
    /// Index of the first operator still to execute.
    std::size_t resume_at = 0;
    std::string matched_key;

    [[nodiscard]] auto hit() const noexcept -> bool { return entry.has_value(); }
};

/// Find the longest cached prefix of `seq`.
///
/// Keys are compared operator by operator on the dump-free canonical text,
/// so `id1` never matches inside `id10`. Execution resumes after the last
/// matched transform and any cache writes directly following it; print and
/// plot dumps at that point still run.
[[nodiscard]] auto resolve(const parser::OpSeq& seq, const CacheIndex& index) -> Resolution;

}  // namespace splot::cache
