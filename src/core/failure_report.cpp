#include "failure_report.hpp"
#include <algorithm>
#include <tuple>
#include "logger.hpp"

FailureReport::FailureReport(std::vector<std::string> variantNames, unsigned poisonThreshold)
    : names(std::move(variantNames)),
      threshold(poisonThreshold == 0 ? 1 : poisonThreshold),
      faults(names.size(), 0),
      poisoned(names.size(), false) {}

bool FailureReport::recordFault(size_t variant, uint64_t bufferId, size_t offset, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex);
    records.push_back({FailureKind::UnexpectedFault, names.at(variant), bufferId, offset, message});
    ++faults[variant];
    if (poisoned[variant] || faults[variant] < threshold)
        return false;
    poisonLocked(variant, bufferId, offset,
                 std::to_string(faults[variant]) + " unexpected faults");
    return true;
}

void FailureReport::recordContractViolation(size_t variant, uint64_t bufferId, size_t offset, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex);
    records.push_back({FailureKind::ContractViolation, names.at(variant), bufferId, offset, message});
    if (!poisoned[variant])
        poisonLocked(variant, bufferId, offset, "contract violation: " + message);
}

void FailureReport::recordOverlap(size_t variant, uint64_t bufferId, size_t offset, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex);
    records.push_back({FailureKind::Overlap, names.at(variant), bufferId, offset, message});
}

bool FailureReport::isPoisoned(size_t variant) const {
    std::lock_guard<std::mutex> lock(mutex);
    return variant < poisoned.size() && poisoned[variant];
}

unsigned FailureReport::faultCount(size_t variant) const {
    std::lock_guard<std::mutex> lock(mutex);
    return variant < faults.size() ? faults[variant] : 0;
}

FailureSummary FailureReport::summary() const {
    std::lock_guard<std::mutex> lock(mutex);
    FailureSummary s;
    s.records = records;
    // Workers finish in any order; sort so reports compare equal across runs.
    std::stable_sort(s.records.begin(), s.records.end(), [](const FailureRecord& a, const FailureRecord& b) {
        return std::tie(a.variant, a.kind, a.offset, a.message) < std::tie(b.variant, b.kind, b.offset, b.message);
    });
    for (size_t i = 0; i < names.size(); ++i) {
        if (poisoned[i])
            s.poisoned.push_back(names[i]);
    }
    for (const auto& r : records) {
        switch (r.kind) {
            case FailureKind::UnexpectedFault: ++s.unexpectedFaults; break;
            case FailureKind::ContractViolation: ++s.contractViolations; break;
            case FailureKind::Overlap: ++s.overlaps; break;
            case FailureKind::Poisoned: break;
        }
    }
    return s;
}

void FailureReport::poisonLocked(size_t variant, uint64_t bufferId, size_t offset, const std::string& reason) {
    poisoned[variant] = true;
    records.push_back({FailureKind::Poisoned, names[variant], bufferId, offset, reason});
    Logger::error("Parser " + names[variant] + " disabled for this session (" + reason + ")");
}
