#pragma once
#include <filesystem>
#include <set>
#include <string>
#include "scanresult.hpp"

namespace fs = std::filesystem;

// Writes the bytes behind a result tree to disk:
//   <out>/<input>.extracted/<hex offset>-<type>/<type>.bin      the artifact
//   <out>/<input>.extracted/<hex offset>-<type>/<path hint>     each extracted child
//   .../<path hint>.extracted/...                              what was found inside it
// Offsets are relative to the buffer the directory stands for. A name that is
// already taken in this run gets a "-1", "-2", ... suffix.
class CarveWriter {
public:
    explicit CarveWriter(fs::path extractionPath);

    // Returns the number of files written. Failures are logged and skipped.
    size_t write(const ScanResult& root, const std::string& inputName);

    size_t failures() const { return failed; }

private:
    void writeNode(const ScanResult& node, const fs::path& dir, size_t base);
    void writeArtifact(const ScanResult& artifact, const fs::path& dir, size_t offset);
    fs::path claim(const fs::path& wanted);
    bool writeBytes(const ByteRegion& region, const fs::path& outPath);

    fs::path extractionPath;
    std::set<fs::path> taken;
    size_t written = 0;
    size_t failed = 0;
};
