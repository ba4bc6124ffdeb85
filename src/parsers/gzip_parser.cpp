#include "base_parser.hpp"
#include "parser_registration.hpp"
#include <cstdint>
#include <string>
#include <vector>
#include "decompress.hpp"
#include "helpers.hpp"

constexpr uint8_t GZIP_ID1 = 0x1F;
constexpr uint8_t GZIP_ID2 = 0x8B;
constexpr uint8_t GZIP_CM_DEFLATE = 0x08;

constexpr uint8_t GZIP_FHCRC    = 0x02;
constexpr uint8_t GZIP_FEXTRA   = 0x04;
constexpr uint8_t GZIP_FNAME    = 0x08;
constexpr uint8_t GZIP_FCOMMENT = 0x10;
constexpr uint8_t GZIP_RESERVED = 0xE0;

class GzipParser : public BaseParser {
public:
    struct State : ParsedState {
        uint8_t flags = 0;
        uint32_t mtime = 0;
        uint8_t os = 0;
        std::string originalName;
        std::string comment;
        size_t compressedSize = 0;
        ByteRegion decompressed;
    };

    std::string name() const override { return "gzip"; }

    std::vector<Signature> signatures() const override {
        return {Signature(0, std::vector<uint8_t>{GZIP_ID1, GZIP_ID2, GZIP_CM_DEFLATE})};
    }

    ParseResult parse(const ByteRegion& region) const override {
        auto s = std::make_unique<State>();
        s->flags = region.u8(3);
        s->mtime = region.le32(4);
        s->os    = region.u8(9);

        if (s->flags & GZIP_RESERVED)
            return ParseResult::mismatch("reserved flag bits set");

        size_t cursor = 10;
        if (s->flags & GZIP_FEXTRA)
            cursor += 2 + region.le16(cursor);
        if (s->flags & GZIP_FNAME)
            s->originalName = readField(region, cursor);
        if (s->flags & GZIP_FCOMMENT)
            s->comment = readField(region, cursor);
        if (s->flags & GZIP_FHCRC)
            cursor += 2;
        region.require(cursor, 0);

        // zlib checks CRC32 and ISIZE from the trailer
        DecodeResult out = inflateGzipMember(region.data(), region.length());
        if (!out.ok)
            return ParseResult::mismatch("inflate: " + out.error);

        s->compressedSize = out.consumed;
        std::string hint = s->originalName.empty() ? "gzip.uncompressed" : s->originalName;
        s->decompressed = makeOwnedRegion(std::move(out.data), hint);
        return ParseResult::ok(std::move(s));
    }

    size_t consumedLength(const ParsedState& state) const override {
        return stateAs<State>(state).compressedSize;
    }

    std::vector<ChildEntry> extractChildren(const ParsedState& state, const ByteRegion& /*region*/) const override {
        const auto& s = stateAs<State>(state);
        if (s.decompressed.empty())
            return {};
        return {{s.decompressed.buffer()->name(), s.decompressed}};
    }

    Description describe(const ParsedState& state) const override {
        const auto& s = stateAs<State>(state);
        Description d;
        d.labels = {"gzip", "compressed"};
        d.metadata["mtime"] = format_timestamp(s.mtime);
        d.metadata["os"] = static_cast<uint64_t>(s.os);
        d.metadata["uncompressed_size"] = static_cast<uint64_t>(s.decompressed.length());
        if (!s.originalName.empty())
            d.metadata["original_name"] = s.originalName;
        if (!s.comment.empty())
            d.metadata["comment"] = s.comment;
        return d;
    }

private:
    // NUL-terminated header field; advances cursor past the terminator.
    static std::string readField(const ByteRegion& region, size_t& cursor) {
        std::string field;
        uint8_t c;
        while ((c = region.u8(cursor++)) != 0)
            field.push_back(static_cast<char>(c));
        return field;
    }
};

REGISTER_PARSER(GzipParser, 30)
