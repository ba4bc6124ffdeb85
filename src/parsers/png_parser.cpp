#include "base_parser.hpp"
#include "parser_registration.hpp"
#include <cstdint>
#include <string>
#include <vector>
#include <zlib.h>

// PNG magic + IHDR length=13 + "IHDR"
static const uint8_t PNG_SIG[] = {
    0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A,
    0x00, 0x00, 0x00, 0x0D,
    'I', 'H', 'D', 'R'
};

class PNGParser : public BaseParser {
public:
    struct State : ParsedState {
        uint32_t width = 0;
        uint32_t height = 0;
        uint8_t bitDepth = 0;
        uint8_t colorType = 0;
        uint8_t interlace = 0;
        size_t chunks = 0;
        size_t length = 0;
    };

    std::string name() const override { return "png"; }

    std::vector<Signature> signatures() const override {
        return {Signature(0, std::vector<uint8_t>(std::begin(PNG_SIG), std::end(PNG_SIG)))};
    }

    ParseResult parse(const ByteRegion& region) const override {
        auto s = std::make_unique<State>();
        s->width     = region.be32(16);
        s->height    = region.be32(20);
        s->bitDepth  = region.u8(24);
        s->colorType = region.u8(25);
        s->interlace = region.u8(28);
        if (s->width == 0 || s->height == 0)
            return ParseResult::mismatch("zero image dimension");

        // Walk chunks from IHDR on: length, type, data, CRC over type+data
        size_t pos = 8;
        while (true) {
            uint32_t len = region.be32(pos);
            if (len > 0x7FFFFFFF)
                return ParseResult::mismatch("chunk length out of range");
            region.require(pos + 8, static_cast<size_t>(len) + 4);

            const uint8_t* type = region.data() + pos + 4;
            uint32_t stored = region.be32(pos + 8 + len);
            uint32_t crc = crc32(crc32(0L, Z_NULL, 0), type, 4 + len);
            if (crc != stored)
                return ParseResult::mismatch("chunk CRC mismatch at +" + std::to_string(pos));

            s->chunks++;
            bool iend = region.matches(pos + 4, std::string("IEND"));
            pos += 12 + static_cast<size_t>(len);
            if (iend)
                break;
        }

        s->length = pos;
        return ParseResult::ok(std::move(s));
    }

    size_t consumedLength(const ParsedState& state) const override {
        return stateAs<State>(state).length;
    }

    Description describe(const ParsedState& state) const override {
        const auto& s = stateAs<State>(state);
        Description d;
        d.labels = {"png", "graphics"};
        d.metadata["width"] = static_cast<uint64_t>(s.width);
        d.metadata["height"] = static_cast<uint64_t>(s.height);
        d.metadata["bit_depth"] = static_cast<uint64_t>(s.bitDepth);
        d.metadata["color_type"] = static_cast<uint64_t>(s.colorType);
        d.metadata["interlaced"] = s.interlace != 0;
        d.metadata["chunks"] = static_cast<uint64_t>(s.chunks);
        return d;
    }
};

REGISTER_PARSER(PNGParser, 60)
