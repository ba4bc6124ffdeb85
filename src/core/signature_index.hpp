#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <vector>
#include "byte_region.hpp"

// Magic bytes at a fixed offset from the start of the format.
struct Signature {
    size_t offset = 0;
    std::vector<uint8_t> pattern;

    Signature() = default;
    Signature(size_t offset, std::vector<uint8_t> pattern) : offset(offset), pattern(std::move(pattern)) {}
    Signature(size_t offset, const std::string& text) : offset(offset), pattern(text.begin(), text.end()) {}

    size_t span() const { return offset + pattern.size(); }
};

// Variant ids are positions in the frozen parser table, so a lower id is a
// higher priority and sorting ids gives the dispatch order.
class SignatureIndex {
public:
    void add(size_t variant, const Signature& signature);
    void addFallback(size_t variant);

    // Variants with a signature that fits and matches at pos (relative to region),
    // ascending by id, without duplicates.
    std::vector<size_t> candidatesAt(const ByteRegion& region, size_t pos) const;
    // candidatesAt() merged with the fallback variants, for region starts.
    std::vector<size_t> candidatesAtStart(const ByteRegion& region, size_t pos = 0) const;

    const std::vector<size_t>& fallbacks() const { return fallbackVariants; }
    // Smallest offset+length over all signatures; 1 when there are none.
    size_t minSpan() const { return smallestSpan == 0 ? 1 : smallestSpan; }
    size_t entryCount() const { return entries; }
    size_t anchorCount() const { return anchors.size(); }

private:
    struct Entry {
        std::vector<uint8_t> pattern;
        size_t variant;
    };
    // All patterns sharing one relative offset, bucketed by their first byte.
    struct Anchor {
        size_t offset = 0;
        std::array<std::vector<Entry>, 256> buckets;
    };

    std::vector<Anchor> anchors;
    std::vector<size_t> fallbackVariants;
    size_t smallestSpan = 0;
    size_t entries = 0;
};
