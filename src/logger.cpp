#include "logger.hpp"

LogLevel Logger::level = LogLevel::INFO;
std::mutex Logger::mutex;
