#pragma once
#include <filesystem>
#include "byte_region.hpp"

// Loads a regular file into a root buffer named after the file.
// Throws std::runtime_error when the file is missing, unreadable or larger
// than MAX_ANALYZED_FILE_SIZE.
BufferPtr readFile(const std::filesystem::path& path);
