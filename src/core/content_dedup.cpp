#include "content_dedup.hpp"
#include <cstring>
#include "helpers.hpp"

std::optional<std::string> ContentDedup::findOrInsert(const ByteRegion& region, const std::string& path) {
    const uint64_t key = (static_cast<uint64_t>(region.length()) << 32) ^ crc32_of(region.data(), region.length());

    std::lock_guard<std::mutex> lock(mutex);
    auto range = entries.equal_range(key);
    for (auto it = range.first; it != range.second; ++it) {
        const ByteRegion& seen = it->second.region;
        if (seen.length() != region.length())
            continue;
        if (seen.data() == region.data() ||
            std::memcmp(seen.data(), region.data(), region.length()) == 0)
            return it->second.path;
    }
    entries.emplace(key, Entry{region, path});
    return std::nullopt;
}

size_t ContentDedup::size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return entries.size();
}
