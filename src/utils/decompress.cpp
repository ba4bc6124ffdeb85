#include "decompress.hpp"
#include <algorithm>
#include <lzma.h>
#include <zlib.h>

namespace {

constexpr size_t CHUNK = 1 << 16;

DecodeResult lzmaDecode(lzma_stream& strm, const uint8_t* input, size_t size, size_t maxOutput) {
    DecodeResult result;
    std::vector<uint8_t> buf(CHUNK);

    strm.next_in = input;
    strm.avail_in = size;

    while (true) {
        strm.next_out = buf.data();
        strm.avail_out = buf.size();

        lzma_ret ret = lzma_code(&strm, LZMA_FINISH);
        size_t produced = buf.size() - strm.avail_out;
        if (result.data.size() + produced > maxOutput) {
            result.error = "output exceeds " + std::to_string(maxOutput) + " bytes";
            break;
        }
        result.data.insert(result.data.end(), buf.data(), buf.data() + produced);

        if (ret == LZMA_STREAM_END) {
            result.ok = true;
            result.consumed = static_cast<size_t>(strm.total_in);
            break;
        }
        if (ret != LZMA_OK) {
            result.error = ret == LZMA_BUF_ERROR ? "truncated stream" : "decoder error " + std::to_string(ret);
            break;
        }
    }

    lzma_end(&strm);
    if (!result.ok)
        result.data.clear();
    return result;
}

} // namespace

DecodeResult inflateGzipMember(const uint8_t* input, size_t size, size_t maxOutput) {
    DecodeResult result;
    if (size > MAX_ANALYZED_FILE_SIZE) {
        result.error = "input too large";
        return result;
    }

    z_stream strm{};
    strm.next_in = const_cast<Bytef*>(input);
    strm.avail_in = static_cast<uInt>(size);

    // 16+MAX_WBITS tells zlib to expect GZIP header
    if (inflateInit2(&strm, 16 + MAX_WBITS) != Z_OK) {
        result.error = "inflateInit2 failed";
        return result;
    }

    std::vector<uint8_t> buffer(CHUNK);
    int ret;
    do {
        strm.next_out = buffer.data();
        strm.avail_out = static_cast<uInt>(buffer.size());

        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret == Z_STREAM_ERROR || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR || ret == Z_NEED_DICT) {
            result.error = strm.msg ? strm.msg : "inflate failed";
            break;
        }

        size_t have = buffer.size() - strm.avail_out;
        if (result.data.size() + have > maxOutput) {
            result.error = "output exceeds " + std::to_string(maxOutput) + " bytes";
            break;
        }
        result.data.insert(result.data.end(), buffer.begin(), buffer.begin() + have);

        // No progress possible: the input ended before the stream did.
        if (ret == Z_BUF_ERROR || (ret == Z_OK && strm.avail_in == 0 && have == 0)) {
            result.error = "truncated stream";
            break;
        }
    } while (ret != Z_STREAM_END);

    if (ret == Z_STREAM_END && result.error.empty()) {
        result.ok = true;
        result.consumed = size - strm.avail_in;
    } else {
        result.data.clear();
    }
    inflateEnd(&strm);
    return result;
}

DecodeResult decodeXzStream(const uint8_t* input, size_t size, size_t maxOutput) {
    lzma_stream strm = LZMA_STREAM_INIT;
    if (lzma_stream_decoder(&strm, UINT64_MAX, 0) != LZMA_OK) {
        DecodeResult result;
        result.error = "failed to init xz decoder";
        return result;
    }
    return lzmaDecode(strm, input, size, maxOutput);
}

DecodeResult decodeLzmaAlone(const uint8_t* input, size_t size, size_t maxOutput) {
    lzma_stream strm = LZMA_STREAM_INIT;
    if (lzma_alone_decoder(&strm, UINT64_MAX) != LZMA_OK) {
        DecodeResult result;
        result.error = "failed to init lzma decoder";
        return result;
    }
    return lzmaDecode(strm, input, size, maxOutput);
}
