#pragma once
#include <algorithm>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>
#include "base_parser.hpp"
#include "parser_registry.hpp"
#include "scanner.hpp"

namespace testing_support {

inline BufferPtr bufferOf(std::vector<uint8_t> bytes, const std::string& name = "input") {
    return Buffer::fromBytes(std::move(bytes), name);
}

inline void put(std::vector<uint8_t>& out, size_t pos, const std::string& text) {
    if (out.size() < pos + text.size())
        out.resize(pos + text.size());
    for (size_t i = 0; i < text.size(); ++i)
        out[pos + i] = static_cast<uint8_t>(text[i]);
}

inline void put_le16(std::vector<uint8_t>& out, size_t pos, uint16_t v) {
    if (out.size() < pos + 2)
        out.resize(pos + 2);
    out[pos] = static_cast<uint8_t>(v);
    out[pos + 1] = static_cast<uint8_t>(v >> 8);
}

inline void put_le32(std::vector<uint8_t>& out, size_t pos, uint32_t v) {
    if (out.size() < pos + 4)
        out.resize(pos + 4);
    for (size_t i = 0; i < 4; ++i)
        out[pos + i] = static_cast<uint8_t>(v >> (8 * i));
}

inline void put_be32(std::vector<uint8_t>& out, size_t pos, uint32_t v) {
    if (out.size() < pos + 4)
        out.resize(pos + 4);
    for (size_t i = 0; i < 4; ++i)
        out[pos + i] = static_cast<uint8_t>(v >> (24 - 8 * i));
}

// A parser whose every stage is scripted by the test.
class ScriptedParser : public BaseParser {
public:
    struct State : ParsedState {
        size_t consumed = 0;
        ByteRegion region;
    };

    // (path hint, offset, length) relative to the artifact
    using ChildSpec = std::tuple<std::string, size_t, size_t>;

    ScriptedParser(std::string id, std::vector<Signature> sigs) : id(std::move(id)), sigs(std::move(sigs)) {}

    std::string name() const override { return id; }
    std::vector<Signature> signatures() const override { return sigs; }

    ParseResult parse(const ByteRegion& region) const override {
        if (onParse)
            onParse(region);
        if (accepts && !accepts(region))
            return ParseResult::mismatch("rejected by test");
        auto state = std::make_unique<State>();
        state->consumed = consumed ? consumed(region) : region.length();
        state->region = region;
        return ParseResult::ok(std::move(state));
    }

    size_t consumedLength(const ParsedState& state) const override {
        return stateAs<State>(state).consumed;
    }

    std::optional<ByteRegion> carve(const ParsedState& /*state*/, const ByteRegion& region) const override {
        if (!carveRange)
            return std::nullopt;
        return ByteRegion(region.buffer(), region.offset() + carveRange->first, carveRange->second);
    }

    std::vector<ChildEntry> extractChildren(const ParsedState& /*state*/, const ByteRegion& region) const override {
        std::vector<ChildEntry> out;
        for (const auto& [hint, offset, length] : children)
            out.push_back({hint, ByteRegion(region.buffer(), region.offset() + offset, length)});
        if (decoded)
            out.push_back({"decoded", makeOwnedRegion(decoded(region))});
        return out;
    }

    Description describe(const ParsedState& /*state*/) const override {
        if (onDescribe)
            onDescribe();
        Description d;
        d.labels = {id};
        return d;
    }

    std::string id;
    std::vector<Signature> sigs;
    std::function<void(const ByteRegion&)> onParse;
    std::function<bool(const ByteRegion&)> accepts;
    std::function<size_t(const ByteRegion&)> consumed;
    std::optional<std::pair<size_t, size_t>> carveRange;
    std::vector<ChildSpec> children;
    std::function<std::vector<uint8_t>(const ByteRegion&)> decoded;
    std::function<void()> onDescribe;
};

inline std::unique_ptr<ScriptedParser> scripted(const std::string& id, const std::string& magic, size_t at = 0) {
    return std::make_unique<ScriptedParser>(id, std::vector<Signature>{Signature(at, magic)});
}

inline std::function<size_t(const ByteRegion&)> fixedLength(size_t n) {
    return [n](const ByteRegion&) { return n; };
}

template <typename... P>
std::shared_ptr<const ParserTable> tableOf(std::unique_ptr<P>... parsers) {
    std::vector<std::unique_ptr<BaseParser>> all;
    (all.push_back(std::move(parsers)), ...);
    return ParserTable::build(std::move(all));
}

// Variant id of a registered parser in the process-wide table.
inline size_t registeredVariant(const std::string& name) {
    auto table = ParserRegistry::instance().freeze();
    const auto& names = table->variantNames();
    for (size_t v = 0; v < names.size(); ++v)
        if (names[v] == name)
            return v;
    throw std::out_of_range("no parser named " + name);
}

// Scans with the process-wide parser table.
inline ScanReport scanWithRegistry(std::vector<uint8_t> bytes, ScanConfig config = ScanConfig()) {
    config.workerCount = config.workerCount ? config.workerCount : 1;
    Scanner scanner(ParserRegistry::instance().freeze(), config);
    return scanner.scan(bufferOf(std::move(bytes)), "input");
}

inline const ScanResult* findArtifact(const ScanResult& node, const std::string& type) {
    if (node.type == type)
        return &node;
    for (const auto& child : node.children)
        if (const ScanResult* hit = findArtifact(child, type))
            return hit;
    return nullptr;
}

inline size_t maxDepth(const ScanResult& node) {
    size_t deepest = node.depth;
    for (const auto& child : node.children)
        deepest = std::max(deepest, maxDepth(child));
    return deepest;
}

} // namespace testing_support
