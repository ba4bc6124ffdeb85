#pragma once
#include <optional>
#include <string>
#include <vector>
#include "base_parser.hpp"
#include "failure_report.hpp"
#include "parser_registry.hpp"

// A validated candidate, with everything the plugin said about it.
struct DispatchMatch {
    size_t variant = 0;
    std::string parserName;
    ByteRegion claimed;    // [pos, pos + consumed) of the scanned region
    ByteRegion artifact;   // claimed, or the plugin's carved sub-range
    std::vector<ChildEntry> children;
    Description description;
};

// Runs the parser lifecycle for each candidate at one offset and returns the
// first variant that validates and keeps its contract.
class DispatchEngine {
public:
    DispatchEngine(const ParserTable& table, FailureReport& failures);

    // pos is relative to scanned; candidates must be in priority order.
    std::optional<DispatchMatch> dispatch(const ByteRegion& scanned, size_t pos,
                                          const std::vector<size_t>& candidates) const;

private:
    std::optional<DispatchMatch> attempt(size_t variant, const ByteRegion& region) const;
    void violation(size_t variant, const ByteRegion& region, const std::string& message) const;

    const ParserTable& table;
    FailureReport& failures;
};
