#pragma once
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include "errors.hpp"

struct FailureRecord {
    FailureKind kind;
    std::string variant;
    uint64_t bufferId = 0;
    size_t offset = 0;
    std::string message;
};

// Snapshot handed to callers once the session is over.
struct FailureSummary {
    std::vector<FailureRecord> records;
    std::vector<std::string> poisoned;
    size_t unexpectedFaults = 0;
    size_t contractViolations = 0;
    size_t overlaps = 0;
};

// Session-wide side channel for plugin failures. Variants are addressed by
// their index in the parser table.
class FailureReport {
public:
    FailureReport(std::vector<std::string> variantNames, unsigned poisonThreshold);

    // Returns true if this fault is the one that poisoned the variant.
    bool recordFault(size_t variant, uint64_t bufferId, size_t offset, const std::string& message);
    void recordContractViolation(size_t variant, uint64_t bufferId, size_t offset, const std::string& message);
    void recordOverlap(size_t variant, uint64_t bufferId, size_t offset, const std::string& message);

    bool isPoisoned(size_t variant) const;
    unsigned faultCount(size_t variant) const;

    FailureSummary summary() const;

private:
    void poisonLocked(size_t variant, uint64_t bufferId, size_t offset, const std::string& reason);

    std::vector<std::string> names;
    unsigned threshold;

    mutable std::mutex mutex;
    std::vector<unsigned> faults;
    std::vector<bool> poisoned;
    std::vector<FailureRecord> records;
};
