#include "base_parser.hpp"
#include "parser_registration.hpp"
#include <algorithm>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>
#include "helpers.hpp"

static constexpr size_t MBR_SECTOR = 512;
static constexpr size_t MBR_TABLE = 446;

// Partition type lookup
static const std::unordered_map<uint8_t, std::string> typeNames = {
    {0x07, "NTFS/exFAT"}, {0x83, "Linux"}, {0x82, "Linux swap"},
    {0x0B, "FAT32"}, {0x0C, "FAT32 LBA"}, {0x0E, "FAT16 LBA"},
    {0x05, "Extended"}, {0x0F, "Extended LBA"}, {0xA5, "FreeBSD"},
    {0xA6, "OpenBSD"}, {0xAF, "MacOS X HFS"}, {0xEE, "GPT protective"}
};

class MBRParser : public BaseParser {
public:
    struct Partition {
        unsigned index;
        uint8_t type;
        bool bootable;
        uint64_t start;
        uint64_t size;
    };

    struct State : ParsedState {
        std::vector<Partition> partitions;
        size_t length = 0;
    };

    std::string name() const override { return "mbr"; }

    std::vector<Signature> signatures() const override {
        return {Signature(510, std::vector<uint8_t>{0x55, 0xAA})};
    }

    ParseResult parse(const ByteRegion& region) const override {
        auto s = std::make_unique<State>();
        uint64_t end = MBR_SECTOR;

        for (unsigned i = 0; i < 4; i++) {
            size_t off = MBR_TABLE + i * 16;
            uint8_t status = region.u8(off);
            uint8_t type = region.u8(off + 4);
            uint32_t lbaFirst = region.le32(off + 8);
            uint32_t sectors = region.le32(off + 12);

            if (status != 0x00 && status != 0x80)
                return ParseResult::mismatch("bad boot indicator in entry " + std::to_string(i));
            if (type == 0 || sectors == 0)
                continue;
            if (lbaFirst == 0)
                return ParseResult::mismatch("partition " + std::to_string(i) + " overlaps the boot sector");

            Partition p{i, type, status == 0x80, uint64_t(lbaFirst) * MBR_SECTOR, uint64_t(sectors) * MBR_SECTOR};
            end = std::max(end, p.start + p.size);
            s->partitions.push_back(p);
        }

        if (s->partitions.empty())
            return ParseResult::mismatch("no partitions");

        std::vector<Partition> byStart = s->partitions;
        std::sort(byStart.begin(), byStart.end(), [](const Partition& a, const Partition& b) { return a.start < b.start; });
        for (size_t i = 1; i < byStart.size(); i++) {
            if (byStart[i - 1].start + byStart[i - 1].size > byStart[i].start)
                return ParseResult::mismatch("partitions " + std::to_string(byStart[i - 1].index) + " and " +
                                             std::to_string(byStart[i].index) + " overlap");
        }
        if (end > region.length())
            return ParseResult::mismatch("partitions extend past the end of the data");

        s->length = end;
        return ParseResult::ok(std::move(s));
    }

    size_t consumedLength(const ParsedState& state) const override {
        return stateAs<State>(state).length;
    }

    std::vector<ChildEntry> extractChildren(const ParsedState& state, const ByteRegion& region) const override {
        std::vector<ChildEntry> children;
        for (const auto& p : stateAs<State>(state).partitions)
            children.push_back({"partition" + std::to_string(p.index) + "-" + typeName(p.type),
                                region.sub(p.start, p.size)});
        return children;
    }

    Description describe(const ParsedState& state) const override {
        const auto& s = stateAs<State>(state);
        Description d;
        d.labels = {"mbr", "filesystem"};
        d.metadata["partition_count"] = static_cast<uint64_t>(s.partitions.size());
        for (const auto& p : s.partitions) {
            std::string key = "partition" + std::to_string(p.index);
            d.metadata[key] = typeName(p.type) + " at " + hex_offset(p.start) + ", " +
                              std::to_string(p.size) + " bytes" + (p.bootable ? ", bootable" : "");
        }
        return d;
    }

private:
    static std::string typeName(uint8_t type) {
        auto it = typeNames.find(type);
        return it != typeNames.end() ? it->second : "type-" + to_hex(type);
    }
};

REGISTER_PARSER(MBRParser, 70)
