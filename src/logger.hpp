#pragma once
#include <iostream>
#include <mutex>
#include <string>

namespace ansi {
    const std::string reset   = "\033[0m";
    const std::string bold    = "\033[1m";
    const std::string cyan    = "\033[36m";
    const std::string red     = "\033[31m";
    const std::string yellow  = "\033[33m";
    const std::string green   = "\033[32m";
    const std::string magenta = "\033[35m";
    const std::string white   = "\033[37m";
    const std::string gray    = "\033[90m";
}

enum class LogLevel {
    NONE,
    ERROR,
    WARN,
    INFO,
    DEBUG
};

// Workers log concurrently, so every line is written under one lock.
class Logger {
public:
    static LogLevel level;

    static void setLevel(LogLevel newLevel) {
        level = newLevel;
    }

    static void debug(const std::string& msg) {
        if (level >= LogLevel::DEBUG) {
            write(ansi::gray + "[DEBUG] " + msg);
        }
    }

    static void info(const std::string& msg) {
        if (level >= LogLevel::INFO) {
            write(ansi::white + "[INFO] " + msg);
        }
    }

    static void warn(const std::string& msg) {
        if (level >= LogLevel::WARN) {
            write(ansi::yellow + "[WARN] " + msg);
        }
    }

    static void error(const std::string& msg) {
        if (level >= LogLevel::ERROR) {
            write(ansi::red + "[ERROR] " + msg);
        }
    }

private:
    static std::mutex mutex;

    static void write(const std::string& line) {
        std::lock_guard<std::mutex> lock(mutex);
        std::cerr << line << ansi::reset << "\n";
    }
};
