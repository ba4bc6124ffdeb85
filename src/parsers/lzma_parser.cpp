#include "base_parser.hpp"
#include "parser_registration.hpp"
#include <cstdint>
#include <string>
#include <vector>
#include "decompress.hpp"
#include "helpers.hpp"

// Dictionary sizes seen in the wild for properties byte 0x5D
static const uint32_t supported_dicts[] = {
    0x04000000, 0x02000000, 0x01000000, 0x00800000, 0x00400000,
    0x00200000, 0x00100000, 0x00080000, 0x00040000, 0x00020000,
    0x00010000
};

class LZMAParser : public BaseParser {
public:
    struct State : ParsedState {
        uint32_t dictSize = 0;
        uint64_t declaredSize = 0;
        size_t streamSize = 0;
        ByteRegion decompressed;
    };

    std::string name() const override { return "lzma"; }

    std::vector<Signature> signatures() const override {
        return {Signature(0, std::vector<uint8_t>{0x5D, 0x00, 0x00})};
    }

    ParseResult parse(const ByteRegion& region) const override {
        auto s = std::make_unique<State>();
        s->dictSize = region.le32(1);
        s->declaredSize = region.le64(5);

        bool dictOK = false;
        for (auto d : supported_dicts)
            if (s->dictSize == d) dictOK = true;
        if (!dictOK)
            return ParseResult::mismatch("unusual dictionary size " + std::to_string(s->dictSize));

        bool sizeKnown = s->declaredSize != UINT64_MAX;
        if (sizeKnown && s->declaredSize > MAX_ANALYZED_FILE_SIZE)
            return ParseResult::mismatch("declared size too large");

        DecodeResult out = decodeLzmaAlone(region.data(), region.length());
        if (!out.ok)
            return ParseResult::mismatch("lzma: " + out.error);
        if (sizeKnown && out.data.size() != s->declaredSize)
            return ParseResult::mismatch("decoded size differs from the header");

        s->streamSize = out.consumed;
        s->decompressed = makeOwnedRegion(std::move(out.data), "lzma.uncompressed");
        return ParseResult::ok(std::move(s));
    }

    size_t consumedLength(const ParsedState& state) const override {
        return stateAs<State>(state).streamSize;
    }

    std::vector<ChildEntry> extractChildren(const ParsedState& state, const ByteRegion& /*region*/) const override {
        const auto& s = stateAs<State>(state);
        if (s.decompressed.empty())
            return {};
        return {{"lzma.uncompressed", s.decompressed}};
    }

    Description describe(const ParsedState& state) const override {
        const auto& s = stateAs<State>(state);
        Description d;
        d.labels = {"lzma", "compressed"};
        d.metadata["dictionary_size"] = static_cast<uint64_t>(s.dictSize);
        d.metadata["uncompressed_size"] = static_cast<uint64_t>(s.decompressed.length());
        return d;
    }
};

REGISTER_PARSER(LZMAParser, 40)
