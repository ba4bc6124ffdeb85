#include "base_parser.hpp"
#include "parser_registration.hpp"
#include <cstdint>
#include <string>
#include <vector>
#include "helpers.hpp"

static constexpr size_t TAR_BLOCK = 512;

class TARParser : public BaseParser {
public:
    struct Member {
        std::string name;
        char typeflag;
        size_t dataOffset;
        size_t size;
    };

    struct State : ParsedState {
        std::vector<Member> members;
        size_t length = 0;
        bool terminated = false;
    };

    std::string name() const override { return "tar"; }

    std::vector<Signature> signatures() const override {
        return {Signature(257, std::string("ustar"))};
    }

    ParseResult parse(const ByteRegion& region) const override;

    size_t consumedLength(const ParsedState& state) const override {
        return stateAs<State>(state).length;
    }

    std::vector<ChildEntry> extractChildren(const ParsedState& state, const ByteRegion& region) const override {
        std::vector<ChildEntry> children;
        for (const auto& m : stateAs<State>(state).members) {
            if ((m.typeflag == '0' || m.typeflag == '\0') && m.size > 0)
                children.push_back({m.name, region.sub(m.dataOffset, m.size)});
        }
        return children;
    }

    Description describe(const ParsedState& state) const override {
        const auto& s = stateAs<State>(state);
        Description d;
        d.labels = {"tar", "archive"};
        d.metadata["entries"] = static_cast<uint64_t>(s.members.size());
        d.metadata["terminated"] = s.terminated;
        return d;
    }

private:
    static bool read_octal(const ByteRegion& hdr, size_t pos, size_t len, uint64_t& value);
    static bool checksumOK(const ByteRegion& hdr);
    static bool isZeroBlock(const ByteRegion& hdr);
};

// Octal digits padded with spaces or NULs, or GNU base-256 when the top bit is set.
bool TARParser::read_octal(const ByteRegion& hdr, size_t pos, size_t len, uint64_t& value) {
    value = 0;
    if (hdr.u8(pos) & 0x80) {
        for (size_t i = 1; i < len; i++) {
            if (value >> 56)
                return false;
            value = (value << 8) | hdr.u8(pos + i);
        }
        return true;
    }

    size_t i = 0;
    while (i < len && hdr.u8(pos + i) == ' ')
        i++;
    bool digits = false;
    for (; i < len; i++) {
        uint8_t c = hdr.u8(pos + i);
        if (c == 0 || c == ' ')
            break;
        if (c < '0' || c > '7')
            return false;
        value = (value << 3) | static_cast<uint64_t>(c - '0');
        digits = true;
    }
    return digits;
}

// The checksum field itself counts as eight spaces.
bool TARParser::checksumOK(const ByteRegion& hdr) {
    uint64_t stored;
    if (!read_octal(hdr, 148, 8, stored))
        return false;
    uint64_t sum = 0;
    for (size_t i = 0; i < TAR_BLOCK; i++)
        sum += (i >= 148 && i < 156) ? ' ' : hdr.u8(i);
    return sum == stored;
}

bool TARParser::isZeroBlock(const ByteRegion& hdr) {
    const uint8_t* p = hdr.data();
    for (size_t i = 0; i < TAR_BLOCK; i++)
        if (p[i] != 0) return false;
    return true;
}

ParseResult TARParser::parse(const ByteRegion& region) const {
    auto s = std::make_unique<State>();

    size_t pos = 0;
    while (region.has(pos, TAR_BLOCK)) {
        ByteRegion hdr = region.sub(pos, TAR_BLOCK);

        // End of archive: two consecutive zero blocks
        if (isZeroBlock(hdr)) {
            pos += TAR_BLOCK;
            if (region.has(pos, TAR_BLOCK) && isZeroBlock(region.sub(pos, TAR_BLOCK)))
                pos += TAR_BLOCK;
            s->terminated = true;
            break;
        }

        if (!hdr.matches(257, std::string("ustar")) || !checksumOK(hdr)) {
            if (pos == 0)
                return ParseResult::mismatch("header checksum mismatch");
            break;
        }

        uint64_t size;
        if (!read_octal(hdr, 124, 12, size)) {
            if (pos == 0)
                return ParseResult::mismatch("bad size field");
            break;
        }

        Member m;
        m.typeflag = static_cast<char>(hdr.u8(156));
        std::string prefix = hdr.string(345, 155);
        m.name = hdr.string(0, 100);
        if (!prefix.empty())
            m.name = prefix + "/" + m.name;
        m.dataOffset = pos + TAR_BLOCK;
        m.size = 0;

        // Directories, links and devices carry no data blocks
        bool hasData = m.typeflag == '0' || m.typeflag == '\0' || m.typeflag == '7';
        if (hasData && size > region.length() - m.dataOffset) {
            if (pos == 0)
                return ParseResult::mismatch("first member size " + std::to_string(size) + " exceeds the data");
            break;
        }
        uint64_t blocks = hasData ? (size + TAR_BLOCK - 1) / TAR_BLOCK : 0;
        if (!region.has(m.dataOffset, blocks * TAR_BLOCK)) {
            if (pos == 0)
                return ParseResult::mismatch("first member runs past the end of the data");
            break;
        }
        if (hasData)
            m.size = size;

        s->members.push_back(m);
        pos = m.dataOffset + blocks * TAR_BLOCK;
    }

    if (s->members.empty())
        return ParseResult::mismatch("no members");
    s->length = pos;
    return ParseResult::ok(std::move(s));
}

REGISTER_PARSER(TARParser, 50)
