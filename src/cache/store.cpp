#include <splot/cache/store.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <system_error>
#include <utility>

namespace splot::cache {

namespace fs = std::filesystem;

namespace {

auto io_error(std::string_view what, const fs::path& path) -> std::unexpected<Error> {
    return make_error(ErrorKind::ExternalCollaborator,
                      fmt::format("{} '{}'", what, path.string()));
}

auto io_error(std::string_view what, const fs::path& path, const std::error_code& ec)
    -> std::unexpected<Error> {
    return make_error(ErrorKind::ExternalCollaborator,
                      fmt::format("{} '{}': {}", what, path.string(), ec.message()));
}

auto read_lineage_file(const fs::path& path) -> Result<std::optional<Lineage>> {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::optional<Lineage>{};
    }
    std::ifstream in(path);
    if (!in) {
        return io_error("cannot open lineage record", path);
    }
    auto lineage = read_lineage(in);
    if (!lineage) {
        return std::unexpected(lineage.error());
    }
    return std::optional<Lineage>{std::move(*lineage)};
}

auto mismatch(const Lineage& recorded, const Lineage& requested, const fs::path& dir)
    -> std::unexpected<Error> {
    return make_error(ErrorKind::LineageMismatch,
                      fmt::format("cache directory '{}' belongs to source '{}' ({}, {}), "
                                  "not '{}' ({}, {})",
                                  dir.string(), recorded.source, recorded.xexpr, recorded.yexpr,
                                  requested.source, requested.xexpr, requested.yexpr));
}

auto staging_path(const fs::path& target) -> fs::path {
    static constexpr std::string_view kCharset =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<std::size_t> pick(0, kCharset.size() - 1);

    std::string suffix(".tmp-");
    for (int i = 0; i < 16; ++i) {
        suffix.push_back(kCharset[pick(rng)]);
    }
    fs::path staging = target;
    staging += suffix;
    return staging;
}

// Write through a uniquely named sibling so readers never see a partial entry
// and concurrent writers never share a staging file.
auto write_atomically(const fs::path& target, const auto& writer) -> Result<void> {
    const fs::path staging = staging_path(target);
    {
        std::ofstream out(staging, std::ios::binary | std::ios::trunc);
        if (!out) {
            return io_error("cannot create", staging);
        }
        writer(out);
        out.flush();
        if (!out) {
            std::error_code cleanup;
            fs::remove(staging, cleanup);
            return io_error("cannot write", staging);
        }
    }
    std::error_code ec;
    fs::rename(staging, target, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(staging, cleanup);
        return io_error("cannot replace", target, ec);
    }
    return {};
}

// Stores opened on the same directory in one process take turns writing.
auto directory_mutex(const fs::path& dir) -> std::mutex& {
    static std::mutex registry_mutex;
    static std::map<std::string, std::unique_ptr<std::mutex>, std::less<>> registry;

    std::error_code ec;
    auto resolved = fs::weakly_canonical(dir, ec);
    const std::string key = ec ? dir.lexically_normal().string() : resolved.string();

    std::lock_guard lock(registry_mutex);
    auto& slot = registry[key];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

}  // namespace

auto entry_file_name(std::string_view key) -> std::string {
    return fmt::format("{}{}", key.empty() ? "_" : key, kCacheExtension);
}

auto CacheStore::open(fs::path dir, std::optional<Lineage> lineage) -> Result<CacheStore> {
    auto recorded = read_lineage_file(dir / kLineageFileName);
    if (!recorded) {
        return std::unexpected(recorded.error());
    }
    CacheStore store(std::move(dir), std::move(lineage));
    if (recorded->has_value()) {
        if (store.lineage_.has_value() && **recorded != *store.lineage_) {
            return mismatch(**recorded, *store.lineage_, store.dir_);
        }
        store.lineage_written_ = store.lineage_.has_value();
    }
    return store;
}

auto CacheStore::open_existing(fs::path dir) -> Result<CacheStore> {
    auto recorded = read_lineage_file(dir / kLineageFileName);
    if (!recorded) {
        return std::unexpected(recorded.error());
    }
    if (!recorded->has_value()) {
        return make_error(ErrorKind::InvalidInput,
                          fmt::format("'{}' has no {}; not a splot cache directory",
                                      dir.string(), kLineageFileName));
    }
    CacheStore store(std::move(dir), std::move(*recorded));
    store.lineage_written_ = true;
    return store;
}

auto CacheStore::entries() const -> Result<std::vector<CacheEntry>> {
    std::vector<CacheEntry> found;
    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) {
        return found;
    }
    fs::directory_iterator it(dir_, ec);
    if (ec) {
        return io_error("cannot list cache directory", dir_, ec);
    }
    for (const auto& item : it) {
        const auto& path = item.path();
        if (!item.is_regular_file(ec) || path.extension() != kCacheExtension ||
            path.filename() == kLineageFileName) {
            continue;
        }
        std::ifstream in(path);
        if (!in) {
            return io_error("cannot open cache entry", path);
        }
        auto header = read_cache_header(in);
        if (!header) {
            return make_error(header.error().kind,
                              fmt::format("{}: {}", path.string(), header.error().message));
        }
        found.push_back(CacheEntry{.header = std::move(*header), .path = path});
    }
    std::ranges::sort(found, [](const CacheEntry& a, const CacheEntry& b) {
        return a.header.sequence < b.header.sequence;
    });
    return found;
}

auto CacheStore::load(const CacheEntry& entry) const -> Result<Table> {
    std::ifstream in(entry.path);
    if (!in) {
        return io_error("cannot open cache entry", entry.path);
    }
    auto file = read_cache_file(in);
    if (!file) {
        return make_error(file.error().kind,
                          fmt::format("{}: {}", entry.path.string(), file.error().message));
    }
    return std::move(file->table);
}

auto CacheStore::next_sequence() const -> Result<std::uint64_t> {
    auto existing = entries();
    if (!existing) {
        return std::unexpected(existing.error());
    }
    std::uint64_t highest = 0;
    for (const auto& entry : *existing) {
        highest = std::max(highest, entry.header.sequence);
    }
    return highest + 1;
}

auto CacheStore::ensure_lineage_record() -> Result<void> {
    if (lineage_written_) {
        return {};
    }
    // Another store may have claimed the directory since this one was opened.
    auto recorded = read_lineage_file(dir_ / kLineageFileName);
    if (!recorded) {
        return std::unexpected(recorded.error());
    }
    if (recorded->has_value()) {
        if (**recorded != *lineage_) {
            return mismatch(**recorded, *lineage_, dir_);
        }
        lineage_written_ = true;
        return {};
    }
    auto written = write_atomically(dir_ / kLineageFileName,
                                    [this](std::ostream& out) { write_lineage(out, *lineage_); });
    if (!written) {
        return written;
    }
    lineage_written_ = true;
    spdlog::debug("recorded lineage '{}' in {}", lineage_->source, dir_.string());
    return {};
}

auto CacheStore::write(const parser::OpSeq& seq, std::size_t count, const Table& table)
    -> Result<CacheEntry> {
    if (!lineage_) {
        return make_error(ErrorKind::CacheWriteRefused,
                          "the input has no re-openable source (stdin or unnamed stream)");
    }
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        return io_error("cannot create cache directory", dir_, ec);
    }
    std::lock_guard lock(directory_mutex(dir_));
    if (auto ok = ensure_lineage_record(); !ok) {
        return std::unexpected(ok.error());
    }
    auto sequence = next_sequence();
    if (!sequence) {
        return std::unexpected(sequence.error());
    }

    CacheEntry entry;
    entry.header = CacheHeader{
        .key = seq.key(count),
        .opseq = seq.to_string(count, true),
        .lineage = *lineage_,
        .sequence = *sequence,
    };
    entry.path = dir_ / entry_file_name(entry.header.key);

    auto written = write_atomically(entry.path, [&](std::ostream& out) {
        write_cache_file(out, entry.header, table);
    });
    if (!written) {
        return std::unexpected(written.error());
    }
    spdlog::info("cached {} rows as '{}' in {}", table.rows(), entry.header.key,
                 entry.path.string());
    return entry;
}

}  // namespace splot::cache
