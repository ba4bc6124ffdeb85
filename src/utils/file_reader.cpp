#include "file_reader.hpp"
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <vector>
#include "helpers.hpp"

BufferPtr readFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
        throw std::runtime_error("not a regular file: " + path.string());

    auto size = std::filesystem::file_size(path, ec);
    if (ec)
        throw std::runtime_error("cannot stat " + path.string() + ": " + ec.message());
    if (size > MAX_ANALYZED_FILE_SIZE)
        throw std::runtime_error(path.string() + " is larger than " + std::to_string(MAX_ANALYZED_FILE_SIZE) + " bytes");

    std::ifstream file(path, std::ios::binary);
    if (!file)
        throw std::runtime_error("cannot open file " + path.string());

    std::vector<uint8_t> blob((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());
    if (file.bad())
        throw std::runtime_error("read error on " + path.string());
    return Buffer::fromBytes(std::move(blob), path.filename().string());
}
