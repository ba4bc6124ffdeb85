#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "byte_region.hpp"

// Session table of regions already handed to the scheduler, keyed by
// (length, crc32). A hit is confirmed byte for byte before it counts.
class ContentDedup {
public:
    // Path of the first region with identical bytes, or nullopt after
    // recording this region under path.
    std::optional<std::string> findOrInsert(const ByteRegion& region, const std::string& path);
    size_t size() const;

private:
    struct Entry {
        ByteRegion region;
        std::string path;
    };

    mutable std::mutex mutex;
    std::unordered_multimap<uint64_t, Entry> entries;
};
