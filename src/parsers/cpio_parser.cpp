#include "base_parser.hpp"
#include "parser_registration.hpp"
#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

static constexpr size_t CPIO_HEADER_SIZE = 110;
static constexpr uint32_t CPIO_MODE_TYPE = 0170000;
static constexpr uint32_t CPIO_MODE_REGULAR = 0100000;

static size_t pad4(size_t v) { return (v + 3) & ~static_cast<size_t>(3); }

class CPIOParser : public BaseParser {
public:
    struct Member {
        std::string name;
        uint32_t mode;
        size_t dataOffset;
        size_t size;
    };

    struct State : ParsedState {
        bool withChecksum = false;
        std::vector<Member> members;
        size_t length = 0;
    };

    std::string name() const override { return "cpio"; }

    std::vector<Signature> signatures() const override {
        return {Signature(0, std::string("070701")), Signature(0, std::string("070702"))};
    }

    ParseResult parse(const ByteRegion& region) const override;

    size_t consumedLength(const ParsedState& state) const override {
        return stateAs<State>(state).length;
    }

    std::vector<ChildEntry> extractChildren(const ParsedState& state, const ByteRegion& region) const override {
        std::vector<ChildEntry> children;
        for (const auto& m : stateAs<State>(state).members) {
            if ((m.mode & CPIO_MODE_TYPE) == CPIO_MODE_REGULAR && m.size > 0)
                children.push_back({m.name, region.sub(m.dataOffset, m.size)});
        }
        return children;
    }

    Description describe(const ParsedState& state) const override {
        const auto& s = stateAs<State>(state);
        Description d;
        d.labels = {"cpio", "archive"};
        d.metadata["format"] = std::string(s.withChecksum ? "newc+crc" : "newc");
        d.metadata["entries"] = static_cast<uint64_t>(s.members.size());
        return d;
    }

private:
    // Eight ASCII hex digits.
    static bool read_hex(const ByteRegion& region, size_t pos, uint32_t& value) {
        value = 0;
        for (size_t i = 0; i < 8; i++) {
            uint8_t c = region.u8(pos + i);
            uint32_t digit;
            if (c >= '0' && c <= '9') digit = c - '0';
            else if (c >= 'a' && c <= 'f') digit = c - 'a' + 10;
            else if (c >= 'A' && c <= 'F') digit = c - 'A' + 10;
            else return false;
            value = (value << 4) | digit;
        }
        return true;
    }
};

ParseResult CPIOParser::parse(const ByteRegion& region) const {
    auto s = std::make_unique<State>();
    s->withChecksum = region.matches(0, std::string("070702"));
    const std::string magic = s->withChecksum ? "070702" : "070701";

    size_t pos = 0;
    while (true) {
        if (!region.matches(pos, magic))
            return ParseResult::mismatch("entry at +" + std::to_string(pos) + " has no header, trailer missing");
        region.require(pos, CPIO_HEADER_SIZE);

        uint32_t mode, filesize, namesize;
        if (!read_hex(region, pos + 14, mode) || !read_hex(region, pos + 54, filesize) ||
            !read_hex(region, pos + 94, namesize))
            return ParseResult::mismatch("non-hex header field");
        if (namesize == 0)
            return ParseResult::mismatch("empty file name");

        size_t nameStart = pos + CPIO_HEADER_SIZE;
        region.require(nameStart, namesize);
        // namesize counts the terminating NUL
        std::string entryName = region.string(nameStart, namesize - 1);
        size_t dataOffset = pad4(nameStart + namesize);

        if (entryName == "TRAILER!!!") {
            s->length = std::min(dataOffset, region.length());
            break;
        }

        region.require(dataOffset, filesize);
        s->members.push_back({entryName, mode, dataOffset, filesize});
        pos = pad4(dataOffset + filesize);
    }

    return ParseResult::ok(std::move(s));
}

REGISTER_PARSER(CPIOParser, 50)
