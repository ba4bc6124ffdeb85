#include "claim_ledger.hpp"
#include <algorithm>
#include <iterator>
#include <stdexcept>

ClaimStatus ClaimLedger::tryClaim(size_t offset, size_t length) {
    if (length == 0)
        throw std::invalid_argument("zero-length claim");
    const size_t end = offset + length;

    std::lock_guard<std::mutex> lock(mutex);
    auto next = intervals.lower_bound(offset);
    if (next != intervals.end() && next->first < end)
        return ClaimStatus::Overlap;
    if (next != intervals.begin()) {
        auto prev = std::prev(next);
        if (prev->second > offset)
            return ClaimStatus::Overlap;
    }
    intervals.emplace(offset, end);
    return ClaimStatus::Claimed;
}

std::vector<Interval> ClaimLedger::unclaimedGaps(size_t windowOffset, size_t windowLength) const {
    std::vector<Interval> gaps;
    const size_t windowEnd = windowOffset + windowLength;
    size_t cursor = windowOffset;

    std::lock_guard<std::mutex> lock(mutex);
    auto it = intervals.upper_bound(windowOffset);
    if (it != intervals.begin())
        --it;
    for (; it != intervals.end() && it->first < windowEnd; ++it) {
        if (it->second <= cursor)
            continue;
        if (it->first > cursor)
            gaps.push_back({cursor, it->first - cursor});
        cursor = std::max(cursor, it->second);
    }
    if (cursor < windowEnd)
        gaps.push_back({cursor, windowEnd - cursor});
    return gaps;
}

std::vector<Interval> ClaimLedger::claimed() const {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<Interval> result;
    result.reserve(intervals.size());
    for (const auto& [start, end] : intervals)
        result.push_back({start, end - start});
    return result;
}

bool ClaimLedger::isClaimed(size_t offset) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = intervals.upper_bound(offset);
    if (it == intervals.begin())
        return false;
    --it;
    return offset < it->second;
}

ClaimStatus CarvingLedger::tryClaim(uint64_t bufferId, size_t offset, size_t length) {
    return ledgerFor(bufferId)->tryClaim(offset, length);
}

std::vector<Interval> CarvingLedger::unclaimedGaps(uint64_t bufferId, size_t windowOffset, size_t windowLength) const {
    auto ledger = find(bufferId);
    if (!ledger) {
        if (windowLength == 0)
            return {};
        return {{windowOffset, windowLength}};
    }
    return ledger->unclaimedGaps(windowOffset, windowLength);
}

std::vector<Interval> CarvingLedger::claimed(uint64_t bufferId) const {
    auto ledger = find(bufferId);
    return ledger ? ledger->claimed() : std::vector<Interval>{};
}

size_t CarvingLedger::bufferCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return ledgers.size();
}

std::shared_ptr<ClaimLedger> CarvingLedger::ledgerFor(uint64_t bufferId) {
    std::lock_guard<std::mutex> lock(mutex);
    auto& slot = ledgers[bufferId];
    if (!slot)
        slot = std::make_shared<ClaimLedger>();
    return slot;
}

std::shared_ptr<const ClaimLedger> CarvingLedger::find(uint64_t bufferId) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = ledgers.find(bufferId);
    if (it == ledgers.end())
        return nullptr;
    return it->second;
}
