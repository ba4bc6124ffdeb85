#include "base_parser.hpp"
#include "parser_registration.hpp"
#include <cstring>
#include <string>
#include <vector>
#include <zlib.h>
#include "helpers.hpp"

static constexpr size_t UIMAGE_HEADER_SIZE = 64;

class UImageParser : public BaseParser {
public:
    struct State : ParsedState {
        uint32_t timestamp = 0;
        uint32_t dataSize = 0;
        uint32_t loadAddr = 0;
        uint32_t entryPoint = 0;
        uint32_t dataCrc = 0;
        uint8_t osType = 0;
        uint8_t archType = 0;
        uint8_t imgType = 0;
        uint8_t compType = 0;
        std::string imageName;
    };

    std::string name() const override { return "uimage"; }

    std::vector<Signature> signatures() const override {
        return {Signature(0, std::vector<uint8_t>{0x27, 0x05, 0x19, 0x56})};
    }

    ParseResult parse(const ByteRegion& region) const override;
    size_t consumedLength(const ParsedState& state) const override;
    std::vector<ChildEntry> extractChildren(const ParsedState& state, const ByteRegion& region) const override;
    Description describe(const ParsedState& state) const override;

private:
    static std::string get_os_name(uint8_t os);
    static std::string get_arch_name(uint8_t arch);
    static std::string get_compression_type(uint8_t comp);
    static std::string get_image_type(uint8_t type);
};

std::string UImageParser::get_os_name(uint8_t os) {
    switch (os) {
        case 0: return "Invalid";
        case 1: return "OpenBSD";
        case 2: return "NetBSD";
        case 3: return "FreeBSD";
        case 4: return "4.4BSD";
        case 5: return "Linux";
        case 6: return "SVR4";
        case 7: return "Esix";
        case 8: return "Solaris";
        case 9: return "Irix";
        case 10: return "SCO";
        case 11: return "Dell";
        case 12: return "NCR";
        case 13: return "LynxOS";
        case 14: return "VxWorks";
        case 15: return "psos";
        case 16: return "QNX";
        case 17: return "U-Boot";
        case 18: return "RTEMS";
        case 19: return "OSE";
        case 20: return "Plan 9";
        case 21: return "Inferno";
        case 22: return "Linux Kernel";
        default: return "Unknown";
    }
}

std::string UImageParser::get_arch_name(uint8_t arch) {
    switch (arch) {
        case 0: return "Invalid";
        case 1: return "Alpha";
        case 2: return "ARM";
        case 3: return "AVR32";
        case 4: return "Blackfin";
        case 5: return "x86";
        case 6: return "IA64";
        case 7: return "MIPS";
        case 8: return "NDS32";
        case 9: return "Nios-II";
        case 10: return "PowerPC";
        case 11: return "RISC-V";
        case 12: return "S390";
        case 13: return "SH";
        case 14: return "SPARC";
        case 15: return "x86_64";
        default: return "Unknown";
    }
}

std::string UImageParser::get_image_type(uint8_t type) {
    switch (type) {
        case 1: return "Standalone";
        case 2: return "Kernel";
        case 3: return "RAMDisk";
        case 4: return "Multi";
        case 5: return "Firmware";
        case 6: return "Script";
        case 7: return "Filesystem";
        case 8: return "Flat Device Tree";
        case 9: return "Kernel with FDT";
        default: return "Unknown";
    }
}

std::string UImageParser::get_compression_type(uint8_t comp) {
    switch (comp) {
        case 0: return "None";
        case 1: return "gzip";
        case 2: return "bzip2";
        case 3: return "lzma";
        case 4: return "lz4";
        case 5: return "zstd";
        default: return "Unknown";
    }
}

ParseResult UImageParser::parse(const ByteRegion& region) const {
    region.require(0, UIMAGE_HEADER_SIZE);

    // Header CRC covers the header with its own CRC field zeroed
    uint32_t headerCrc = region.be32(4);
    uint8_t header[UIMAGE_HEADER_SIZE];
    std::memcpy(header, region.data(), UIMAGE_HEADER_SIZE);
    std::memset(header + 4, 0, 4);
    uint32_t computed = crc32(crc32(0L, Z_NULL, 0), header, UIMAGE_HEADER_SIZE);
    if (computed != headerCrc)
        return ParseResult::mismatch("header CRC mismatch");

    auto s = std::make_unique<State>();
    s->timestamp  = region.be32(8);
    s->dataSize   = region.be32(12);
    s->loadAddr   = region.be32(16);
    s->entryPoint = region.be32(20);
    s->dataCrc    = region.be32(24);
    s->osType     = region.u8(28);
    s->archType   = region.u8(29);
    s->imgType    = region.u8(30);
    s->compType   = region.u8(31);
    s->imageName  = region.string(32, 32);

    if (get_compression_type(s->compType) == "Unknown")
        return ParseResult::mismatch("unknown compression " + std::to_string(s->compType));
    if (!region.has(UIMAGE_HEADER_SIZE, s->dataSize))
        return ParseResult::mismatch("payload runs past the end of the data");

    uint32_t dataCrc = crc32(crc32(0L, Z_NULL, 0), region.data() + UIMAGE_HEADER_SIZE, s->dataSize);
    if (dataCrc != s->dataCrc)
        return ParseResult::mismatch("payload CRC mismatch");

    return ParseResult::ok(std::move(s));
}

size_t UImageParser::consumedLength(const ParsedState& state) const {
    return UIMAGE_HEADER_SIZE + stateAs<State>(state).dataSize;
}

std::vector<ChildEntry> UImageParser::extractChildren(const ParsedState& state, const ByteRegion& region) const {
    const auto& s = stateAs<State>(state);
    if (s.dataSize == 0)
        return {};
    std::string hint = s.imageName.empty() ? "uimage_payload" : s.imageName;
    return {{hint, region.sub(UIMAGE_HEADER_SIZE, s.dataSize)}};
}

Description UImageParser::describe(const ParsedState& state) const {
    const auto& s = stateAs<State>(state);
    Description d;
    d.labels = {"uimage", "firmware"};
    d.metadata["name"] = s.imageName;
    d.metadata["timestamp"] = format_timestamp(s.timestamp);
    d.metadata["os"] = get_os_name(s.osType);
    d.metadata["cpu"] = get_arch_name(s.archType);
    d.metadata["image_type"] = get_image_type(s.imgType);
    d.metadata["compression"] = get_compression_type(s.compType);
    d.metadata["load_address"] = hex_offset(s.loadAddr);
    d.metadata["entry_point"] = hex_offset(s.entryPoint);
    d.metadata["data_size"] = static_cast<uint64_t>(s.dataSize);
    return d;
}

REGISTER_PARSER(UImageParser, 20)
