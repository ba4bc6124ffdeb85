#pragma once
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <variant>
#include <vector>
#include "byte_region.hpp"

using MetaValue = std::variant<bool, int64_t, uint64_t, double, std::string>;
using Metadata = std::map<std::string, MetaValue>;

std::string metaToString(const MetaValue& value);

namespace label {
    const std::string unrecognized = "unrecognized data";
    const std::string gap          = "gap";
    const std::string duplicate    = "duplicate";
    const std::string depthLimit   = "depth limit";
    const std::string tooSmall     = "too small";
    const std::string incomplete   = "incomplete";
}

// One node of the result tree. Offsets are relative to the parent node's
// region; region keeps the backing bytes alive for writers.
struct ScanResult {
    std::string pathHint;
    std::string type;                  // parser name, empty unless a parser validated
    size_t offset = 0;
    size_t length = 0;
    std::set<std::string> labels;
    Metadata metadata;
    std::vector<ScanResult> children;  // ordered by offset, or by extraction order
    unsigned depth = 0;
    ByteRegion region;

    bool isArtifact() const { return !type.empty(); }
    bool hasLabel(const std::string& l) const { return labels.count(l) != 0; }
};
