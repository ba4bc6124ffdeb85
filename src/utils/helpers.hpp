#pragma once
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>

#define MAX_ANALYZED_FILE_SIZE (1024ULL * 1024 * 1024)

std::string format_timestamp(uint32_t ts);
std::string to_hex(uint64_t value);
// "0x" + to_hex(value)
std::string hex_offset(uint64_t value);

// Parses a decimal count from the command line; throws std::invalid_argument,
// or std::out_of_range when the value is above max.
uint64_t parse_count(const std::string& text, uint64_t max = std::numeric_limits<uint64_t>::max());

// Turns an archive member name into a relative path that cannot leave the
// extraction directory.
std::string sanitize_path_hint(const std::string& hint);

// Whole-file digest used to spot byte-identical regions.
uint32_t crc32_of(const uint8_t* data, size_t size);
