#include "base_parser.hpp"
#include "parser_registration.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <zip.h>
#include "helpers.hpp"
#include "logger.hpp"

static constexpr size_t ZIP_EOCD_SIZE = 22;

class ZIPParser : public BaseParser {
public:
    struct Member {
        std::string name;
        ByteRegion data;
    };

    struct State : ParsedState {
        size_t archiveSize = 0;
        uint16_t declaredEntries = 0;
        std::string comment;
        std::vector<Member> members;
        size_t unreadable = 0;
    };

    std::string name() const override { return "zip"; }

    std::vector<Signature> signatures() const override {
        return {Signature(0, std::vector<uint8_t>{0x50, 0x4B, 0x03, 0x04})};
    }

    ParseResult parse(const ByteRegion& region) const override;

    size_t consumedLength(const ParsedState& state) const override {
        return stateAs<State>(state).archiveSize;
    }

    std::vector<ChildEntry> extractChildren(const ParsedState& state, const ByteRegion& /*region*/) const override {
        std::vector<ChildEntry> children;
        for (const auto& m : stateAs<State>(state).members)
            children.push_back({m.name, m.data});
        return children;
    }

    Description describe(const ParsedState& state) const override {
        const auto& s = stateAs<State>(state);
        Description d;
        d.labels = {"zip", "archive"};
        d.metadata["entries"] = static_cast<uint64_t>(s.declaredEntries);
        if (!s.comment.empty())
            d.metadata["comment"] = s.comment;
        if (s.unreadable)
            d.metadata["unreadable_entries"] = static_cast<uint64_t>(s.unreadable);
        return d;
    }

private:
    std::optional<size_t> findEndOfCentralDirectory(const ByteRegion& region) const;
    bool validateCRCForSomeEntries(const ByteRegion& region, size_t cdStart, size_t cdEnd,
                                   unsigned maxEntriesToCheck = 5) const;
    bool validateCRCEntry(const ByteRegion& region, size_t cdEntryOffset) const;
    void readMembers(const ByteRegion& archive, State& state) const;
};

ParseResult ZIPParser::parse(const ByteRegion& region) const {
    std::optional<size_t> eocd = findEndOfCentralDirectory(region);
    if (!eocd)
        return ParseResult::mismatch("no end of central directory that fits this archive");

    auto s = std::make_unique<State>();
    uint16_t commentLen = region.le16(*eocd + 20);
    s->archiveSize = *eocd + ZIP_EOCD_SIZE + commentLen;
    s->declaredEntries = region.le16(*eocd + 10);
    s->comment = std::string(reinterpret_cast<const char*>(region.data() + *eocd + ZIP_EOCD_SIZE), commentLen);

    readMembers(region.first(s->archiveSize), *s);
    return ParseResult::ok(std::move(s));
}

// Forward search for the first EOCD (50 4B 05 06) whose central directory
// lies inside [0, eocd) and agrees with the local headers.
std::optional<size_t> ZIPParser::findEndOfCentralDirectory(const ByteRegion& region) const {
    static const uint8_t sig[4] = {0x50, 0x4B, 0x05, 0x06};

    for (size_t i = 0; region.has(i, ZIP_EOCD_SIZE); ++i) {
        if (!region.matches(i, sig, sizeof(sig)))
            continue;

        uint16_t commentLen = region.le16(i + 20);
        if (!region.has(i + ZIP_EOCD_SIZE, commentLen))
            continue;

        uint32_t sizeCD = region.le32(i + 12);
        uint32_t offCD  = region.le32(i + 16);
        size_t cdStart = offCD;
        size_t cdEnd   = cdStart + sizeCD;

        // CD must be entirely before EOCD
        if (cdEnd > i)
            continue;
        if (!validateCRCForSomeEntries(region, cdStart, cdEnd))
            continue;

        return i;
    }
    return std::nullopt;
}

// A handful of entries is enough to tell a real central directory from noise.
bool ZIPParser::validateCRCForSomeEntries(const ByteRegion& region, size_t cdStart, size_t cdEnd,
                                          unsigned maxEntriesToCheck) const {
    static const uint8_t cdSig[4] = {0x50, 0x4B, 0x01, 0x02};
    size_t pos = cdStart;
    unsigned checked = 0;
    unsigned valid = 0;

    while (pos + 46 <= cdEnd && checked < maxEntriesToCheck) {
        if (!region.matches(pos, cdSig, sizeof(cdSig)))
            break;

        uint16_t nameLen    = region.le16(pos + 28);
        uint16_t extraLen   = region.le16(pos + 30);
        uint16_t commentLen = region.le16(pos + 32);

        size_t entrySize = 46 + static_cast<size_t>(nameLen) + extraLen + commentLen;
        if (pos + entrySize > cdEnd)
            break;

        if (validateCRCEntry(region, pos))
            valid++;

        checked++;
        pos += entrySize;
    }

    return checked > 0 && valid > 0;
}

// Compares the CRC in one central directory entry with its local header.
bool ZIPParser::validateCRCEntry(const ByteRegion& region, size_t cdEntryOffset) const {
    static const uint8_t lfhSig[4] = {0x50, 0x4B, 0x03, 0x04};
    uint32_t crcCentral = region.le32(cdEntryOffset + 16);
    size_t localHeader = region.le32(cdEntryOffset + 42);

    if (!region.has(localHeader, 30) || !region.matches(localHeader, lfhSig, sizeof(lfhSig)))
        return false;
    // Bit 3: CRC lives in the data descriptor, local header holds zero
    if (region.le16(localHeader + 6) & 0x0008)
        return true;
    return region.le32(localHeader + 14) == crcCentral;
}

void ZIPParser::readMembers(const ByteRegion& archive, State& state) const {
    zip_error_t error;
    zip_error_init(&error);

    zip_source_t* src = zip_source_buffer_create(archive.data(), archive.length(), 0, &error);
    if (!src) {
        Logger::warn("zip: failed to create source: " + std::string(zip_error_strerror(&error)));
        zip_error_fini(&error);
        return;
    }

    zip_t* za = zip_open_from_source(src, ZIP_RDONLY, &error);
    if (!za) {
        Logger::warn("zip: libzip cannot open archive at " + hex_offset(archive.offset()) + ": " +
                     zip_error_strerror(&error));
        zip_source_free(src);
        zip_error_fini(&error);
        return;
    }

    zip_int64_t num_entries = zip_get_num_entries(za, 0);
    for (zip_uint64_t i = 0; i < static_cast<zip_uint64_t>(num_entries); ++i) {
        zip_stat_t st;
        zip_stat_init(&st);
        if (zip_stat_index(za, i, 0, &st) != 0 || !(st.valid & ZIP_STAT_SIZE) || st.size == 0)
            continue;
        if (st.size > MAX_ANALYZED_FILE_SIZE) {
            state.unreadable++;
            continue;
        }

        std::string memberName = (st.valid & ZIP_STAT_NAME) && st.name ? st.name : "entry-" + std::to_string(i);
        if (!memberName.empty() && memberName.back() == '/')
            continue;

        zip_file_t* zf = zip_fopen_index(za, i, 0);
        if (!zf) {
            Logger::debug("zip: cannot open member " + memberName + ": " + zip_strerror(za));
            state.unreadable++;
            continue;
        }

        std::vector<uint8_t> fileData(st.size);
        zip_int64_t got = zip_fread(zf, fileData.data(), st.size);
        zip_fclose(zf);
        if (got < 0 || static_cast<zip_uint64_t>(got) != st.size) {
            Logger::debug("zip: short read on member " + memberName);
            state.unreadable++;
            continue;
        }

        state.members.push_back({memberName, makeOwnedRegion(std::move(fileData), memberName)});
    }

    zip_discard(za);
    zip_error_fini(&error);
}

REGISTER_PARSER(ZIPParser, 50)
