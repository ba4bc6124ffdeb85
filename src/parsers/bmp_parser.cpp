#include "base_parser.hpp"
#include "parser_registration.hpp"
#include <cstdint>
#include <string>
#include <vector>

class BMPParser : public BaseParser {
public:
    struct State : ParsedState {
        uint32_t fileSize = 0;
        uint32_t dataOffset = 0;
        uint32_t dibSize = 0;
        int32_t width = 0;
        int32_t height = 0;
        uint16_t bpp = 0;
        uint32_t compression = 0;
    };

    std::string name() const override { return "bmp"; }

    std::vector<Signature> signatures() const override {
        return {Signature(0, std::string("BM"))};
    }

    ParseResult parse(const ByteRegion& region) const override {
        auto s = std::make_unique<State>();

        // File header
        s->fileSize   = region.le32(2);
        s->dataOffset = region.le32(10);

        // DIB header; BITMAPCOREHEADER (12) and larger
        s->dibSize = region.le32(14);
        if (s->dibSize != 12 && s->dibSize < 40)
            return ParseResult::mismatch("unknown DIB header size " + std::to_string(s->dibSize));

        uint16_t planes;
        if (s->dibSize == 12) {
            s->width  = region.le16(18);
            s->height = region.le16(20);
            planes    = region.le16(22);
            s->bpp    = region.le16(24);
        } else {
            s->width       = static_cast<int32_t>(region.le32(18));
            s->height      = static_cast<int32_t>(region.le32(22));
            planes         = region.le16(26);
            s->bpp         = region.le16(28);
            s->compression = region.le32(30);
        }

        if (planes != 1)
            return ParseResult::mismatch("planes != 1");
        if (s->bpp == 0 || s->bpp > 64)
            return ParseResult::mismatch("implausible bit depth " + std::to_string(s->bpp));
        if (s->width <= 0 || s->height == 0)
            return ParseResult::mismatch("empty image");

        size_t headers = 14 + static_cast<size_t>(s->dibSize);
        if (s->fileSize < headers)
            return ParseResult::mismatch("declared size smaller than the headers");
        if (s->dataOffset < headers || s->dataOffset > s->fileSize)
            return ParseResult::mismatch("pixel data offset outside the file");
        if (s->fileSize > region.length())
            return ParseResult::mismatch("not enough data");

        return ParseResult::ok(std::move(s));
    }

    size_t consumedLength(const ParsedState& state) const override {
        return stateAs<State>(state).fileSize;
    }

    Description describe(const ParsedState& state) const override {
        const auto& s = stateAs<State>(state);
        Description d;
        d.labels = {"bmp", "graphics"};
        d.metadata["width"] = static_cast<int64_t>(s.width);
        d.metadata["height"] = static_cast<int64_t>(s.height);
        d.metadata["bpp"] = static_cast<uint64_t>(s.bpp);
        d.metadata["compression"] = static_cast<uint64_t>(s.compression);
        d.metadata["dib_header_size"] = static_cast<uint64_t>(s.dibSize);
        return d;
    }
};

REGISTER_PARSER(BMPParser, 60)
