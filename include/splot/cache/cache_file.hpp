#pragma once

#include <splot/core/error.hpp>
#include <splot/core/table.hpp>
#include <splot/runtime/csv.hpp>

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>

namespace splot::cache {

/// Line separating the metadata header from the tabular payload.
inline constexpr std::string_view kMetadataDelimiter =
    "ENDOFMETADATAENDOFMETADATAENDOFMETADATAENDOFMETADATAENDOFMETADATA";

/// Where the initial table came from and how it was extracted, so that a
/// later run can re-open the original source when no cache entry applies.
struct Lineage {
    std::string source;
    std::string xexpr = "1";
    std::string yexpr = "2";
    bool header = true;

    auto operator==(const Lineage&) const -> bool = default;

    /// Reader settings that reproduce the initial table from `source`.
    [[nodiscard]] auto read_options() const -> Result<runtime::ReadOptions>;
};

/// Metadata stored in front of every cached table.
struct CacheHeader {
    /// Canonical operator prefix with dump letters removed.
    std::string key;
    /// Canonical operator prefix as written, dumps included.
    std::string opseq;
    Lineage lineage;
    /// Per-directory write counter; larger is newer.
    std::uint64_t sequence = 0;
};

/// A cache entry as discovered on disk. The table is loaded on demand.
struct CacheEntry {
    CacheHeader header;
    std::filesystem::path path;
};

/// Header plus payload.
struct CacheFile {
    CacheHeader header;
    Table table;
};

/// The header is a YAML mapping (`key`, `opseq`, `sequence`, `lineage`)
/// followed by the delimiter line and the table as CSV with a header line.
void write_cache_file(std::ostream& out, const CacheHeader& header, const Table& table);
[[nodiscard]] auto read_cache_header(std::istream& in) -> Result<CacheHeader>;
[[nodiscard]] auto read_cache_file(std::istream& in) -> Result<CacheFile>;

void write_lineage(std::ostream& out, const Lineage& lineage);
[[nodiscard]] auto read_lineage(std::istream& in) -> Result<Lineage>;

}  // namespace splot::cache
