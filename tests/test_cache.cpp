#include <splot/cache/cache_file.hpp>
#include <splot/cache/resolver.hpp>
#include <splot/cache/store.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <random>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using splot::ErrorKind;
using splot::Table;
using namespace splot::cache;

namespace {

struct TempDir {
    std::filesystem::path path;

    explicit TempDir(const char* name) {
        std::random_device rd;
        path = std::filesystem::temp_directory_path() /
               (std::string(name) + "-" + std::to_string(rd()));
        std::filesystem::remove_all(path);
        std::filesystem::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
};

auto sample_lineage() -> Lineage {
    return Lineage{.source = "/data/trades.csv", .xexpr = "1", .yexpr = "price", .header = true};
}

auto seq(const char* text) -> splot::parser::OpSeq {
    auto parsed = splot::parser::parse(text);
    REQUIRE(parsed.has_value());
    return *parsed;
}

auto entry_with(std::string key, std::uint64_t sequence, Lineage lineage = sample_lineage())
    -> CacheEntry {
    CacheEntry entry;
    entry.header.key = key;
    entry.header.opseq = key;
    entry.header.lineage = std::move(lineage);
    entry.header.sequence = sequence;
    entry.path = entry_file_name(key);
    return entry;
}

auto index_of(std::vector<CacheEntry> entries) -> CacheIndex {
    auto index = CacheIndex::build(std::move(entries), sample_lineage());
    REQUIRE(index.has_value());
    return *index;
}

}  // namespace

// ─── File format ──────────────────────────────────────────────────────────────

TEST_CASE("Cache file keeps metadata and table") {
    CacheHeader header{
        .key = "id1000",
        .opseq = "iCd1000",
        .lineage = sample_lineage(),
        .sequence = 7,
    };
    Table table{"x", "y:Derivation(1000)", {{1.0, 2.0}, {3.0, 0.5}}};

    std::stringstream buffer;
    write_cache_file(buffer, header, table);
    const auto text = buffer.str();
    REQUIRE(text.find("key: \"id1000\"\n") != std::string::npos);
    REQUIRE(text.find("sequence: 7\n") != std::string::npos);
    REQUIRE(text.find(std::string(kMetadataDelimiter) + "\nx,") != std::string::npos);

    auto file = read_cache_file(buffer);
    REQUIRE(file.has_value());
    REQUIRE(file->header.key == "id1000");
    REQUIRE(file->header.opseq == "iCd1000");
    REQUIRE(file->header.sequence == 7);
    REQUIRE(file->header.lineage == sample_lineage());
    REQUIRE(file->table == table);
}

TEST_CASE("Lineage record keeps awkward source paths") {
    auto lineage = sample_lineage();
    lineage.source = "/data/a \"quoted\" \\ path: #1\n~";
    lineage.xexpr = "#";
    lineage.yexpr = "=0.5";
    lineage.header = false;
    std::stringstream buffer;
    write_lineage(buffer, lineage);
    auto back = read_lineage(buffer);
    REQUIRE(back.has_value());
    REQUIRE(*back == lineage);
}

TEST_CASE("Malformed metadata is rejected") {
    std::istringstream scalar("key id1000\n");
    auto header = read_cache_header(scalar);
    REQUIRE_FALSE(header.has_value());
    REQUIRE(header.error().kind == ErrorKind::ExternalCollaborator);

    std::istringstream missing("key: \"i\"\nopseq: \"i\"\nsequence: 1\n");
    auto incomplete = read_cache_header(missing);
    REQUIRE_FALSE(incomplete.has_value());
    REQUIRE(incomplete.error().message.find("lineage") != std::string::npos);

    std::istringstream unclosed("key: [i\n");
    auto broken = read_cache_header(unclosed);
    REQUIRE_FALSE(broken.has_value());
    REQUIRE(broken.error().kind == ErrorKind::ExternalCollaborator);

    std::istringstream not_a_number(
        "key: \"i\"\nopseq: \"i\"\nsequence: first\nlineage: {source: \"/a.csv\"}\n");
    auto bad_sequence = read_cache_header(not_a_number);
    REQUIRE_FALSE(bad_sequence.has_value());
    REQUIRE(bad_sequence.error().message.find("sequence") != std::string::npos);
}

TEST_CASE("Entry file names") {
    REQUIRE(entry_file_name("id1000") == "id1000.splnk");
    REQUIRE(entry_file_name("") == "_.splnk");
}

// ─── Store ────────────────────────────────────────────────────────────────────

TEST_CASE("Store writes entries with increasing sequence numbers") {
    TempDir dir("splot-store");
    auto store = CacheStore::open(dir.path, sample_lineage());
    REQUIRE(store.has_value());

    Table first{"x", "y", {{1.0, 1.0}}};
    Table second{"x", "y:Integral", {{1.0, 0.0}}};
    auto ops = seq("iCd1000C");
    auto a = store->write(ops, 2, first);
    auto b = store->write(ops, 4, second);
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    REQUIRE(a->header.key == "i");
    REQUIRE(a->header.opseq == "iC");
    REQUIRE(b->header.key == "id1000");
    REQUIRE(b->header.sequence > a->header.sequence);
    REQUIRE(std::filesystem::exists(dir.path / "lineage.splnk"));
    REQUIRE(std::filesystem::exists(dir.path / "id1000.splnk"));

    auto entries = store->entries();
    REQUIRE(entries.has_value());
    REQUIRE(entries->size() == 2);
    auto loaded = store->load(entries->back());
    REQUIRE(loaded.has_value());
    REQUIRE(*loaded == second);
}

TEST_CASE("Sequence numbers continue across store instances") {
    TempDir dir("splot-sequence");
    Table table{"x", "y", {{1.0, 1.0}}};
    std::uint64_t previous = 0;
    for (int run = 0; run < 3; ++run) {
        auto store = CacheStore::open(dir.path, sample_lineage());
        REQUIRE(store.has_value());
        auto entry = store->write(seq("oC"), 1, table);
        REQUIRE(entry.has_value());
        REQUIRE(entry->header.sequence > previous);
        previous = entry->header.sequence;
    }
}

TEST_CASE("Stores sharing a directory write concurrently") {
    TempDir dir("splot-concurrent");
    Table table{"x", "y", {{1.0, 2.0}, {2.0, 3.0}}};
    constexpr int kWriters = 8;
    constexpr int kWritesEach = 5;
    const auto cached = seq("iC");
    const auto stepped = seq("iCs");

    std::vector<std::vector<splot::Result<CacheEntry>>> results(kWriters);
    std::vector<std::thread> writers;
    for (int w = 0; w < kWriters; ++w) {
        writers.emplace_back([&, w] {
            auto store = CacheStore::open(dir.path, sample_lineage());
            if (!store) {
                results[w].emplace_back(std::unexpected(store.error()));
                return;
            }
            for (int i = 0; i < kWritesEach; ++i) {
                results[w].push_back(store->write(w % 2 == 0 ? cached : stepped, 1, table));
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }

    std::set<std::uint64_t> sequences;
    for (const auto& batch : results) {
        REQUIRE(batch.size() == kWritesEach);
        for (const auto& entry : batch) {
            INFO((entry ? std::string() : entry.error().format()));
            REQUIRE(entry.has_value());
            REQUIRE(entry->header.key == "i");
            sequences.insert(entry->header.sequence);
        }
    }
    REQUIRE(sequences.size() == kWriters * kWritesEach);

    auto store = CacheStore::open(dir.path, sample_lineage());
    REQUIRE(store.has_value());
    auto entries = store->entries();
    REQUIRE(entries.has_value());
    REQUIRE(entries->size() == 1);
    REQUIRE(entries->front().header.sequence == *sequences.rbegin());
    for (const auto& item : std::filesystem::directory_iterator(dir.path)) {
        INFO(item.path().string());
        REQUIRE(item.path().extension() == kCacheExtension);
    }
}

TEST_CASE("A store checks the lineage record again before its first write") {
    TempDir dir("splot-claimed");
    auto first = CacheStore::open(dir.path, sample_lineage());
    auto other_lineage = sample_lineage();
    other_lineage.source = "/data/other.csv";
    auto second = CacheStore::open(dir.path, other_lineage);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());

    REQUIRE(first->write(seq("oC"), 1, Table{}).has_value());
    auto refused = second->write(seq("oC"), 1, Table{});
    REQUIRE_FALSE(refused.has_value());
    REQUIRE(refused.error().kind == ErrorKind::LineageMismatch);
}

TEST_CASE("A failed replace reports the rename error") {
    TempDir dir("splot-replace");
    auto store = CacheStore::open(dir.path, sample_lineage());
    REQUIRE(store.has_value());
    // A non-empty directory where the entry file should go makes the rename fail.
    std::filesystem::create_directories(dir.path / "o.splnk" / "blocker");
    auto entry = store->write(seq("oC"), 1, Table{});
    REQUIRE_FALSE(entry.has_value());
    REQUIRE(entry.error().kind == ErrorKind::ExternalCollaborator);
    REQUIRE(entry.error().message.find("cannot replace") != std::string::npos);
    REQUIRE(entry.error().message.find("Success") == std::string::npos);
    for (const auto& item : std::filesystem::directory_iterator(dir.path)) {
        INFO(item.path().string());
        REQUIRE(item.path().filename().string().find(".tmp-") == std::string::npos);
    }
}

TEST_CASE("Store without lineage refuses writes") {
    TempDir dir("splot-nolineage");
    auto store = CacheStore::open(dir.path, std::nullopt);
    REQUIRE(store.has_value());
    auto entry = store->write(seq("C"), 1, Table{});
    REQUIRE_FALSE(entry.has_value());
    REQUIRE(entry.error().kind == ErrorKind::CacheWriteRefused);
    REQUIRE_FALSE(std::filesystem::exists(dir.path / "lineage.splnk"));
}

TEST_CASE("Opening a directory with another lineage is a mismatch") {
    TempDir dir("splot-mismatch");
    {
        auto store = CacheStore::open(dir.path, sample_lineage());
        REQUIRE(store.has_value());
        REQUIRE(store->write(seq("oC"), 1, Table{}).has_value());
    }
    auto other = sample_lineage();
    other.source = "/data/other.csv";
    auto store = CacheStore::open(dir.path, other);
    REQUIRE_FALSE(store.has_value());
    REQUIRE(store.error().kind == ErrorKind::LineageMismatch);
}

TEST_CASE("open_existing adopts the recorded lineage") {
    TempDir dir("splot-existing");
    {
        auto store = CacheStore::open(dir.path, sample_lineage());
        REQUIRE(store.has_value());
        REQUIRE(store->write(seq("oC"), 1, Table{}).has_value());
    }
    auto store = CacheStore::open_existing(dir.path);
    REQUIRE(store.has_value());
    REQUIRE(store->lineage() == sample_lineage());

    TempDir empty("splot-empty");
    auto none = CacheStore::open_existing(empty.path);
    REQUIRE_FALSE(none.has_value());
    REQUIRE(none.error().kind == ErrorKind::InvalidInput);
}

TEST_CASE("Lineage read options follow the recorded axes") {
    auto options = sample_lineage().read_options();
    REQUIRE(options.has_value());
    REQUIRE(options->header);
    REQUIRE(options->x.index == 1);
    REQUIRE(options->y.name == "price");
}

// ─── Resolver ─────────────────────────────────────────────────────────────────

TEST_CASE("Resolver picks the longest cached prefix") {
    auto index = index_of({entry_with("i", 1), entry_with("id1000", 2), entry_with("id1000c", 3)});
    auto resolution = resolve(seq("id1000s"), index);
    REQUIRE(resolution.hit());
    REQUIRE(resolution.matched_key == "id1000");
    REQUIRE(resolution.resume_at == 2);
}

TEST_CASE("Resolver skips interleaved dumps of the requested sequence") {
    auto index = index_of({entry_with("i", 1), entry_with("id1000", 2), entry_with("id1000c", 3)});

    auto full = resolve(seq("iCd1000CcC"), index);
    REQUIRE(full.hit());
    REQUIRE(full.matched_key == "id1000c");
    REQUIRE(full.resume_at == 6);

    auto partial = resolve(seq("iCd1000CsO"), index);
    REQUIRE(partial.hit());
    REQUIRE(partial.matched_key == "id1000");
    REQUIRE(partial.resume_at == 4);
}

TEST_CASE("Resolver keeps trailing print and plot dumps") {
    auto index = index_of({entry_with("id1000", 1)});
    auto resolution = resolve(seq("id1000P"), index);
    REQUIRE(resolution.hit());
    REQUIRE(resolution.resume_at == 2);
}

TEST_CASE("Resolver matches whole operators only") {
    auto index = index_of({entry_with("id1", 1)});
    auto resolution = resolve(seq("id10"), index);
    REQUIRE_FALSE(resolution.hit());
    REQUIRE(resolution.resume_at == 0);
}

TEST_CASE("Resolver compares canonical arguments") {
    auto index = index_of({entry_with("id1000", 1)});
    auto resolution = resolve(seq("id1000,0s"), index);
    REQUIRE(resolution.hit());
    REQUIRE(resolution.resume_at == 2);
}

TEST_CASE("Resolver misses when nothing matches") {
    auto index = index_of({entry_with("o", 1), entry_with("", 2)});
    auto resolution = resolve(seq("CiO"), index);
    REQUIRE_FALSE(resolution.hit());
    REQUIRE(resolution.resume_at == 0);
}

TEST_CASE("Most recent write wins among equal keys") {
    auto older = entry_with("i", 4);
    older.path = "older.splnk";
    auto newer = entry_with("i", 9);
    newer.path = "newer.splnk";
    auto index = index_of({newer, older});
    REQUIRE(index.size() == 1);
    REQUIRE(index.find("i")->header.sequence == 9);
    REQUIRE(resolve(seq("is"), index).entry->path == "newer.splnk");
}

TEST_CASE("Entries from another lineage are refused") {
    auto other = sample_lineage();
    other.yexpr = "qty";
    auto index = CacheIndex::build({entry_with("i", 1), entry_with("o", 2, other)},
                                   sample_lineage());
    REQUIRE_FALSE(index.has_value());
    REQUIRE(index.error().kind == ErrorKind::LineageMismatch);
}
