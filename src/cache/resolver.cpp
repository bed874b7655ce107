#include <splot/cache/resolver.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <utility>

namespace splot::cache {

auto CacheIndex::build(std::vector<CacheEntry> entries, const Lineage& lineage)
    -> Result<CacheIndex> {
    CacheIndex index;
    for (auto& entry : entries) {
        if (entry.header.lineage != lineage) {
            return make_error(ErrorKind::LineageMismatch,
                              fmt::format("cache entry '{}' was produced from '{}', expected '{}'",
                                          entry.path.string(), entry.header.lineage.source,
                                          lineage.source));
        }
        auto it = index.by_key_.find(entry.header.key);
        if (it == index.by_key_.end()) {
            index.by_key_.emplace(entry.header.key, std::move(entry));
        } else if (entry.header.sequence > it->second.header.sequence) {
            it->second = std::move(entry);
        }
    }
    return index;
}

auto CacheIndex::find(std::string_view key) const -> const CacheEntry* {
    auto it = by_key_.find(key);
    return it == by_key_.end() ? nullptr : &it->second;
}

auto CacheIndex::keys() const -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(by_key_.size());
    for (const auto& [key, entry] : by_key_) {
        out.push_back(key);
    }
    return out;
}

auto resolve(const parser::OpSeq& seq, const CacheIndex& index) -> Resolution {
    // prefixes[k] is the dump-free canonical text of the first k operators.
    std::vector<std::string> prefixes;
    prefixes.reserve(seq.size() + 1);
    prefixes.emplace_back();
    for (const auto& op : seq.ops()) {
        std::string next = prefixes.back();
        if (!op.is_dump()) {
            next += op.canonical();
        }
        prefixes.push_back(std::move(next));
    }

    // Scanning from the end visits longer keys first. A key is tried only at
    // the transform that completes it.
    for (std::size_t k = seq.size(); k > 0; --k) {
        const auto& key = prefixes[k];
        if (key.empty()) {
            break;
        }
        if (seq[k - 1].is_dump()) {
            continue;
        }
        const auto* entry = index.find(key);
        if (entry == nullptr) {
            continue;
        }
        // Cache writes right after the match would store the same key again.
        std::size_t resume = k;
        while (resume < seq.size() && seq[resume].code == parser::OpCode::CacheWrite) {
            ++resume;
        }
        spdlog::debug("cache hit '{}' (sequence {}), resuming at operator {} of {}", key,
                      entry->header.sequence, resume + 1, seq.size());
        return Resolution{.entry = *entry, .resume_at = resume, .matched_key = key};
    }
    spdlog::debug("no cached prefix of '{}' among {} keys", seq.to_string(), index.size());
    return Resolution{};
}

}  // namespace splot::cache
