#include "signature_index.hpp"
#include <algorithm>
#include <cstring>
#include <stdexcept>

void SignatureIndex::add(size_t variant, const Signature& signature) {
    if (signature.pattern.empty())
        throw std::invalid_argument("empty signature pattern");

    auto it = std::find_if(anchors.begin(), anchors.end(),
                           [&](const Anchor& a) { return a.offset == signature.offset; });
    if (it == anchors.end()) {
        Anchor anchor;
        anchor.offset = signature.offset;
        anchors.push_back(std::move(anchor));
        std::sort(anchors.begin(), anchors.end(),
                  [](const Anchor& a, const Anchor& b) { return a.offset < b.offset; });
        it = std::find_if(anchors.begin(), anchors.end(),
                          [&](const Anchor& a) { return a.offset == signature.offset; });
    }

    it->buckets[signature.pattern[0]].push_back({signature.pattern, variant});
    ++entries;

    if (smallestSpan == 0 || signature.span() < smallestSpan)
        smallestSpan = signature.span();
}

void SignatureIndex::addFallback(size_t variant) {
    if (std::find(fallbackVariants.begin(), fallbackVariants.end(), variant) == fallbackVariants.end()) {
        fallbackVariants.push_back(variant);
        std::sort(fallbackVariants.begin(), fallbackVariants.end());
    }
}

std::vector<size_t> SignatureIndex::candidatesAt(const ByteRegion& region, size_t pos) const {
    std::vector<size_t> result;
    const size_t length = region.length();
    if (pos >= length)
        return result;

    const uint8_t* data = region.data();
    for (const auto& anchor : anchors) {
        if (anchor.offset >= length - pos)
            break; // anchors are sorted, every later one is out of range too

        const size_t at = pos + anchor.offset;
        for (const auto& entry : anchor.buckets[data[at]]) {
            if (entry.pattern.size() > length - at)
                continue;
            if (std::memcmp(data + at, entry.pattern.data(), entry.pattern.size()) == 0)
                result.push_back(entry.variant);
        }
    }

    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}

std::vector<size_t> SignatureIndex::candidatesAtStart(const ByteRegion& region, size_t pos) const {
    std::vector<size_t> result = candidatesAt(region, pos);
    if (pos >= region.length() || fallbackVariants.empty())
        return result;

    result.insert(result.end(), fallbackVariants.begin(), fallbackVariants.end());
    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}
