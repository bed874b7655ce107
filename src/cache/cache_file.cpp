#include <splot/cache/cache_file.hpp>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include <istream>
#include <ostream>
#include <utility>

namespace splot::cache {

namespace {

auto bad_header(std::string_view why) -> std::unexpected<Error> {
    return make_error(ErrorKind::ExternalCollaborator,
                      fmt::format("malformed cache metadata: {}", why));
}

// Everything up to the delimiter line, or the whole stream for a lineage record.
auto read_block(std::istream& in) -> std::string {
    std::string block;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line == kMetadataDelimiter) {
            break;
        }
        block.append(line).push_back('\n');
    }
    return block;
}

auto load_block(std::istream& in) -> Result<YAML::Node> {
    try {
        auto node = YAML::Load(read_block(in));
        if (!node.IsMap()) {
            return bad_header("expected a mapping");
        }
        return node;
    } catch (const YAML::Exception& e) {
        return bad_header(e.what());
    }
}

template <typename T>
auto field(const YAML::Node& node, const char* name) -> Result<T> {
    const auto value = node[name];
    if (!value) {
        return bad_header(fmt::format("missing '{}'", name));
    }
    try {
        return value.as<T>();
    } catch (const YAML::Exception& e) {
        return bad_header(fmt::format("'{}': {}", name, e.what()));
    }
}

void emit_string(YAML::Emitter& out, const char* name, const std::string& value) {
    out << YAML::Key << name << YAML::Value << YAML::DoubleQuoted << value;
}

void emit_lineage(YAML::Emitter& out, const Lineage& lineage) {
    out << YAML::BeginMap;
    emit_string(out, "source", lineage.source);
    emit_string(out, "xexpr", lineage.xexpr);
    emit_string(out, "yexpr", lineage.yexpr);
    out << YAML::Key << "header" << YAML::Value << lineage.header;
    out << YAML::EndMap;
}

auto decode_lineage(const YAML::Node& node) -> Result<Lineage> {
    if (!node.IsMap()) {
        return bad_header("lineage is not a mapping");
    }
    auto source = field<std::string>(node, "source");
    if (!source) {
        return std::unexpected(source.error());
    }
    Lineage lineage;
    lineage.source = std::move(*source);
    lineage.xexpr = node["xexpr"].as<std::string>(lineage.xexpr);
    lineage.yexpr = node["yexpr"].as<std::string>(lineage.yexpr);
    lineage.header = node["header"].as<bool>(lineage.header);
    return lineage;
}

}  // namespace

auto Lineage::read_options() const -> Result<runtime::ReadOptions> {
    auto x = runtime::AxisExpr::parse(xexpr);
    if (!x) {
        return std::unexpected(x.error());
    }
    auto y = runtime::AxisExpr::parse(yexpr);
    if (!y) {
        return std::unexpected(y.error());
    }
    return runtime::ReadOptions{.header = header, .x = std::move(*x), .y = std::move(*y)};
}

void write_cache_file(std::ostream& out, const CacheHeader& header, const Table& table) {
    YAML::Emitter yaml;
    yaml << YAML::BeginMap;
    emit_string(yaml, "key", header.key);
    emit_string(yaml, "opseq", header.opseq);
    yaml << YAML::Key << "sequence" << YAML::Value << header.sequence;
    yaml << YAML::Key << "lineage" << YAML::Value;
    emit_lineage(yaml, header.lineage);
    yaml << YAML::EndMap;

    out << yaml.c_str() << '\n' << kMetadataDelimiter << '\n';
    runtime::write_table(table, out, runtime::WriteOptions{.header = true});
}

auto read_cache_header(std::istream& in) -> Result<CacheHeader> {
    auto node = load_block(in);
    if (!node) {
        return std::unexpected(node.error());
    }
    auto key = field<std::string>(*node, "key");
    if (!key) {
        return std::unexpected(key.error());
    }
    auto opseq = field<std::string>(*node, "opseq");
    if (!opseq) {
        return std::unexpected(opseq.error());
    }
    auto sequence = field<std::uint64_t>(*node, "sequence");
    if (!sequence) {
        return std::unexpected(sequence.error());
    }
    const auto lineage_node = (*node)["lineage"];
    if (!lineage_node) {
        return bad_header("missing 'lineage'");
    }
    auto lineage = decode_lineage(lineage_node);
    if (!lineage) {
        return std::unexpected(lineage.error());
    }
    return CacheHeader{
        .key = std::move(*key),
        .opseq = std::move(*opseq),
        .lineage = std::move(*lineage),
        .sequence = *sequence,
    };
}

auto read_cache_file(std::istream& in) -> Result<CacheFile> {
    auto header = read_cache_header(in);
    if (!header) {
        return std::unexpected(header.error());
    }
    auto table = runtime::read_csv(in, runtime::ReadOptions{});
    if (!table) {
        return std::unexpected(table.error());
    }
    return CacheFile{.header = std::move(*header), .table = std::move(*table)};
}

void write_lineage(std::ostream& out, const Lineage& lineage) {
    YAML::Emitter yaml;
    emit_lineage(yaml, lineage);
    out << yaml.c_str() << '\n';
}

auto read_lineage(std::istream& in) -> Result<Lineage> {
    auto node = load_block(in);
    if (!node) {
        return std::unexpected(node.error());
    }
    return decode_lineage(*node);
}

}  // namespace splot::cache
