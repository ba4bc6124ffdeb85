#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

enum class ClaimStatus {
    Claimed,
    Overlap
};

struct Interval {
    size_t offset = 0;
    size_t length = 0;

    size_t end() const { return offset + length; }
    bool operator==(const Interval& other) const { return offset == other.offset && length == other.length; }
};

// Disjoint claimed intervals of one buffer. All methods are serialized, since
// gap tasks over the same buffer run on different workers.
class ClaimLedger {
public:
    ClaimStatus tryClaim(size_t offset, size_t length);
    // Complement of the claims inside [windowOffset, windowOffset + windowLength).
    std::vector<Interval> unclaimedGaps(size_t windowOffset, size_t windowLength) const;
    std::vector<Interval> claimed() const;
    bool isClaimed(size_t offset) const;

private:
    mutable std::mutex mutex;
    std::map<size_t, size_t> intervals; // start -> end
};

// One ledger per buffer id. The map lock is only held to find or create a
// ledger; claims on different buffers never contend.
class CarvingLedger {
public:
    ClaimStatus tryClaim(uint64_t bufferId, size_t offset, size_t length);
    std::vector<Interval> unclaimedGaps(uint64_t bufferId, size_t windowOffset, size_t windowLength) const;
    std::vector<Interval> claimed(uint64_t bufferId) const;
    size_t bufferCount() const;

private:
    std::shared_ptr<ClaimLedger> ledgerFor(uint64_t bufferId);
    std::shared_ptr<const ClaimLedger> find(uint64_t bufferId) const;

    mutable std::mutex mutex;
    std::unordered_map<uint64_t, std::shared_ptr<ClaimLedger>> ledgers;
};
