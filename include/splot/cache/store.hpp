#pragma once

#include <splot/cache/cache_file.hpp>
#include <splot/core/error.hpp>
#include <splot/core/table.hpp>
#include <splot/parser/opseq.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace splot::cache {

inline constexpr std::string_view kCacheExtension = ".splnk";
inline constexpr std::string_view kLineageFileName = "lineage.splnk";

/// File name for a cache key; the empty key maps to `_.splnk`.
[[nodiscard]] auto entry_file_name(std::string_view key) -> std::string;

/// A directory of cache entries sharing one lineage.
///
/// The store never deletes entries. A write with an existing key replaces
/// the file, and its larger sequence number marks it as the newer one.
/// Writes from stores sharing a directory within one process are serialized.
class CacheStore {
   public:
    /// Open (or prepare) `dir` for a run whose source has the given lineage.
    /// Fails with LineageMismatch when the directory already records a
    /// different lineage. A store opened without lineage refuses writes.
    [[nodiscard]] static auto open(std::filesystem::path dir, std::optional<Lineage> lineage)
        -> Result<CacheStore>;

    /// Open an existing cache directory and adopt its recorded lineage.
    [[nodiscard]] static auto open_existing(std::filesystem::path dir) -> Result<CacheStore>;

    [[nodiscard]] auto directory() const noexcept -> const std::filesystem::path& { return dir_; }
    [[nodiscard]] auto lineage() const noexcept -> const std::optional<Lineage>& {
        return lineage_;
    }

    /// Headers of every entry on disk. Files that are not cache entries are ignored.
    [[nodiscard]] auto entries() const -> Result<std::vector<CacheEntry>>;

    /// Load the table stored in an entry.
    [[nodiscard]] auto load(const CacheEntry& entry) const -> Result<Table>;

    /// Store `table` as the result of the first `count` operators of `seq`.
    [[nodiscard]] auto write(const parser::OpSeq& seq, std::size_t count, const Table& table)
        -> Result<CacheEntry>;

   private:
    CacheStore(std::filesystem::path dir, std::optional<Lineage> lineage)
        : dir_(std::move(dir)), lineage_(std::move(lineage)) {}

    [[nodiscard]] auto next_sequence() const -> Result<std::uint64_t>;
    [[nodiscard]] auto ensure_lineage_record() -> Result<void>;

    std::filesystem::path dir_;
    std::optional<Lineage> lineage_;
    bool lineage_written_ = false;
};

}  // namespace splot::cache
