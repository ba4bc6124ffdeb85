#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

// Thrown by checked ByteRegion reads. The dispatch engine turns it into a
// structural mismatch at the parse boundary, so it never escapes a scan.
class BufferBoundsError : public std::out_of_range {
public:
    BufferBoundsError(size_t position, size_t count, size_t available)
        : std::out_of_range("read of " + std::to_string(count) + " bytes at " +
                            std::to_string(position) + " exceeds region of " +
                            std::to_string(available) + " bytes"),
          position(position), count(count), available(available) {}

    size_t position;
    size_t count;
    size_t available;
};

enum class FailureKind {
    UnexpectedFault,
    ContractViolation,
    Overlap,
    Poisoned
};

inline const char* failureKindName(FailureKind kind) {
    switch (kind) {
        case FailureKind::UnexpectedFault: return "unexpected fault";
        case FailureKind::ContractViolation: return "contract violation";
        case FailureKind::Overlap: return "overlap";
        case FailureKind::Poisoned: return "poisoned";
    }
    return "unknown";
}
