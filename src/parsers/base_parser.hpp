#pragma once
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "byte_region.hpp"
#include "scanresult.hpp"
#include "signature_index.hpp"

// Whatever a parser learned in parse(); handed back to every later stage.
class ParsedState {
public:
    virtual ~ParsedState() = default;
};

// Outcome of parse(): either a parsed state or the reason the bytes are not
// this format. A mismatch is ordinary control flow, not an error.
class ParseResult {
public:
    static ParseResult ok(std::unique_ptr<ParsedState> state) {
        ParseResult r;
        r.parsed = std::move(state);
        return r;
    }

    static ParseResult mismatch(std::string reason) {
        ParseResult r;
        r.why = std::move(reason);
        return r;
    }

    bool isOk() const { return parsed != nullptr; }
    const std::string& reason() const { return why; }
    std::unique_ptr<ParsedState> takeState() { return std::move(parsed); }

private:
    std::unique_ptr<ParsedState> parsed;
    std::string why;
};

struct ChildEntry {
    std::string pathHint;
    ByteRegion region;
};

struct Description {
    std::set<std::string> labels;
    Metadata metadata;
};

// Contract for a format plugin. The engine calls, in order:
// signatures, parse, consumedLength, carve, extractChildren, describe.
// Every stage after parse needs the ParsedState that only parse can make.
// Parsers are shared by all workers and must not keep per-call state.
class BaseParser {
public:
    virtual ~BaseParser() = default;
    virtual std::string name() const = 0;

    // Empty means a fallback parser, tried only where a region starts.
    virtual std::vector<Signature> signatures() const = 0;

    // region runs from the candidate offset to the end of the scanned region.
    virtual ParseResult parse(const ByteRegion& region) const = 0;

    // Bytes the format occupies from the start of region; a pure function of state.
    virtual size_t consumedLength(const ParsedState& state) const = 0;

    // Trimmed region to keep when the logical file is shorter than what it occupies.
    virtual std::optional<ByteRegion> carve(const ParsedState& /*state*/, const ByteRegion& /*region*/) const {
        return std::nullopt;
    }

    virtual std::vector<ChildEntry> extractChildren(const ParsedState& /*state*/, const ByteRegion& /*region*/) const {
        return {};
    }

    virtual Description describe(const ParsedState& state) const = 0;
};

template <typename T>
const T& stateAs(const ParsedState& state) {
    return dynamic_cast<const T&>(state);
}
