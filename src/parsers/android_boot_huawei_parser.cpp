#include "base_parser.hpp"
#include "parser_registration.hpp"
#include "helpers.hpp"
#include <algorithm>
#include <string>
#include <vector>

// Huawei Android bootloader image:
//   0   magic 3C D6 1A CE
//   4   major version, minor version (LE u32)
//   12  image version, 64 bytes
//   76  meta header size (always 76), entry table size
//   84  entries of {name[72], offset, size}, offsets relative to the image
static constexpr size_t HUAWEI_META_HEADER_SIZE = 76;
static constexpr size_t HUAWEI_TABLE_OFFSET = 84;
static constexpr size_t HUAWEI_ENTRY_SIZE = 80;

class AndroidBootHuaweiParser : public BaseParser {
public:
    struct Entry {
        std::string name;
        uint32_t offset;
        uint32_t size;
    };

    struct State : ParsedState {
        uint32_t majorVersion = 0;
        uint32_t minorVersion = 0;
        std::string imageVersion;
        std::vector<Entry> entries;
        size_t unpackedSize = 0;
    };

    std::string name() const override { return "androidboothuawei"; }

    std::vector<Signature> signatures() const override {
        return {Signature(0, std::vector<uint8_t>{0x3C, 0xD6, 0x1A, 0xCE})};
    }

    ParseResult parse(const ByteRegion& region) const override {
        auto state = std::make_unique<State>();
        state->majorVersion = region.le32(4);
        state->minorVersion = region.le32(8);
        state->imageVersion = region.string(12, 64);

        if (region.le32(76) != HUAWEI_META_HEADER_SIZE)
            return ParseResult::mismatch("invalid header size");

        uint32_t tableSize = region.le32(80);
        if (tableSize == 0 || tableSize % HUAWEI_ENTRY_SIZE != 0)
            return ParseResult::mismatch("entry table size " + std::to_string(tableSize) + " is not a whole number of entries");
        region.require(HUAWEI_TABLE_OFFSET, tableSize);

        size_t unpacked = HUAWEI_TABLE_OFFSET + tableSize;
        for (size_t pos = HUAWEI_TABLE_OFFSET; pos < HUAWEI_TABLE_OFFSET + tableSize; pos += HUAWEI_ENTRY_SIZE) {
            Entry e;
            e.name = region.string(pos, 72);
            e.offset = region.le32(pos + 72);
            e.size = region.le32(pos + 76);
            unpacked = std::max(unpacked, static_cast<size_t>(e.offset) + e.size);
            state->entries.push_back(e);
        }

        if (unpacked > region.length())
            return ParseResult::mismatch("not enough data");

        std::vector<Entry> used;
        for (const auto& e : state->entries)
            if (e.size != 0 && !e.name.empty())
                used.push_back(e);
        std::sort(used.begin(), used.end(), [](const Entry& a, const Entry& b) { return a.offset < b.offset; });
        for (size_t i = 1; i < used.size(); ++i) {
            if (static_cast<size_t>(used[i - 1].offset) + used[i - 1].size > used[i].offset)
                return ParseResult::mismatch("entries " + used[i - 1].name + " and " + used[i].name + " overlap");
        }
        state->unpackedSize = unpacked;
        return ParseResult::ok(std::move(state));
    }

    size_t consumedLength(const ParsedState& state) const override {
        return stateAs<State>(state).unpackedSize;
    }

    std::vector<ChildEntry> extractChildren(const ParsedState& state, const ByteRegion& region) const override {
        std::vector<ChildEntry> children;
        for (const auto& e : stateAs<State>(state).entries) {
            if (e.size == 0 || e.name.empty())
                continue;
            children.push_back({e.name, region.sub(e.offset, e.size)});
        }
        return children;
    }

    Description describe(const ParsedState& state) const override {
        const auto& s = stateAs<State>(state);
        Description d;
        d.labels = {"android", "bootloader", "huawei"};
        d.metadata["version"] = std::to_string(s.majorVersion) + "." + std::to_string(s.minorVersion);
        if (!s.imageVersion.empty())
            d.metadata["image_version"] = s.imageVersion;

        uint64_t partitions = 0;
        std::string layout;
        for (const auto& e : s.entries) {
            if (e.size == 0)
                continue;
            if (!layout.empty())
                layout += ", ";
            layout += e.name + "@" + hex_offset(e.offset) + "+" + std::to_string(e.size);
            ++partitions;
        }
        d.metadata["partition_count"] = partitions;
        d.metadata["partitions"] = layout;
        return d;
    }
};

REGISTER_PARSER(AndroidBootHuaweiParser, 10)
