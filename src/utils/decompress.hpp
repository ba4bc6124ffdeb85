#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "helpers.hpp"

struct DecodeResult {
    bool ok = false;
    std::vector<uint8_t> data;
    size_t consumed = 0;     // input bytes up to and including the stream end
    std::string error;
};

// One gzip member (header, deflate data, CRC32/ISIZE trailer). zlib checks the
// trailer itself, so ok means the member is intact.
DecodeResult inflateGzipMember(const uint8_t* input, size_t size, size_t maxOutput = MAX_ANALYZED_FILE_SIZE);

// One .xz stream, stopping at its footer.
DecodeResult decodeXzStream(const uint8_t* input, size_t size, size_t maxOutput = MAX_ANALYZED_FILE_SIZE);

// A legacy .lzma ("LZMA alone") stream.
DecodeResult decodeLzmaAlone(const uint8_t* input, size_t size, size_t maxOutput = MAX_ANALYZED_FILE_SIZE);
