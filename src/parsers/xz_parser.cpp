#include "base_parser.hpp"
#include "parser_registration.hpp"
#include <algorithm>
#include <string>
#include <vector>
#include <zlib.h>
#include "decompress.hpp"

static const uint8_t XZ_MAGIC[6] = {0xFD, 0x37, 0x7A, 0x58, 0x5A, 0x00};

class XZParser : public BaseParser {
public:
    struct State : ParsedState {
        uint8_t checkType = 0;
        size_t streamSize = 0;
        ByteRegion decompressed;
    };

    std::string name() const override { return "xz"; }

    std::vector<Signature> signatures() const override {
        return {Signature(0, std::vector<uint8_t>(std::begin(XZ_MAGIC), std::end(XZ_MAGIC)))};
    }

    ParseResult parse(const ByteRegion& region) const override {
        if (!parse_xz_header(region))
            return ParseResult::mismatch("stream header CRC mismatch");

        DecodeResult out = decodeXzStream(region.data(), region.length());
        if (!out.ok)
            return ParseResult::mismatch("xz: " + out.error);

        auto s = std::make_unique<State>();
        s->checkType = region.u8(7) & 0x0F;
        s->streamSize = out.consumed;
        s->decompressed = makeOwnedRegion(std::move(out.data), "xz.uncompressed");
        return ParseResult::ok(std::move(s));
    }

    size_t consumedLength(const ParsedState& state) const override {
        return stateAs<State>(state).streamSize;
    }

    std::vector<ChildEntry> extractChildren(const ParsedState& state, const ByteRegion& /*region*/) const override {
        const auto& s = stateAs<State>(state);
        if (s.decompressed.empty())
            return {};
        return {{"xz.uncompressed", s.decompressed}};
    }

    Description describe(const ParsedState& state) const override {
        const auto& s = stateAs<State>(state);
        Description d;
        d.labels = {"xz", "compressed"};
        d.metadata["check"] = checkName(s.checkType);
        d.metadata["uncompressed_size"] = static_cast<uint64_t>(s.decompressed.length());
        return d;
    }

private:
    // 12-byte stream header: magic, two flag bytes, CRC32 of the flags.
    static bool parse_xz_header(const ByteRegion& region) {
        region.require(0, 12);
        uint32_t crc_stored = region.le32(8);
        uint32_t crc_calc = crc32(crc32(0L, Z_NULL, 0), region.data() + 6, 2);
        return crc_stored == crc_calc;
    }

    static std::string checkName(uint8_t check) {
        switch (check) {
            case 0x00: return "none";
            case 0x01: return "crc32";
            case 0x04: return "crc64";
            case 0x0A: return "sha256";
            default: return "unknown";
        }
    }
};

REGISTER_PARSER(XZParser, 30)
