#include "helpers.hpp"
#include <algorithm>
#include <array>
#include <charconv>
#include <stdexcept>
#include <vector>
#include <zlib.h>

std::string format_timestamp(uint32_t ts) {
    std::time_t t = static_cast<std::time_t>(ts);
    std::tm gmt{};
    gmtime_r(&t, &gmt);
    std::ostringstream oss;
    oss << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S UTC");
    return oss.str();
}

std::string to_hex(uint64_t value)
{
   std::array<char, 24> buffer;
   auto result = std::to_chars(buffer.data(), buffer.data() + buffer.size(),
                              value, 16);  // base 16

   std::string hex(buffer.data(), result.ptr);
   return hex;
}

std::string hex_offset(uint64_t value) {
    return "0x" + to_hex(value);
}

uint64_t parse_count(const std::string& text, uint64_t max) {
    uint64_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto result = std::from_chars(first, last, value, 10);
    if (text.empty() || result.ec != std::errc() || result.ptr != last)
        throw std::invalid_argument("not a non-negative number: '" + text + "'");
    if (value > max)
        throw std::out_of_range(text + " is above the limit of " + std::to_string(max));
    return value;
}

std::string sanitize_path_hint(const std::string& hint) {
    std::vector<std::string> parts;
    std::string current;
    auto flush = [&]() {
        if (!current.empty() && current != "." && current != "..")
            parts.push_back(current);
        current.clear();
    };
    for (char c : hint) {
        if (c == '/' || c == '\\') {
            flush();
        } else if (static_cast<unsigned char>(c) < 0x20) {
            current += '_';
        } else {
            current += c;
        }
    }
    flush();

    std::string result;
    for (const auto& part : parts) {
        if (!result.empty())
            result += '/';
        result += part;
    }
    return result.empty() ? "unnamed" : result;
}

uint32_t crc32_of(const uint8_t* data, size_t size) {
    uLong crc = crc32(0L, Z_NULL, 0);
    // zlib takes uInt lengths; feed large regions in slices.
    while (size > 0) {
        uInt chunk = static_cast<uInt>(std::min<size_t>(size, 1u << 30));
        crc = crc32(crc, data, chunk);
        data += chunk;
        size -= chunk;
    }
    return static_cast<uint32_t>(crc);
}
