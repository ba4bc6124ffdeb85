#include "carve_writer.hpp"
#include <fstream>
#include <system_error>
#include "helpers.hpp"
#include "logger.hpp"

CarveWriter::CarveWriter(fs::path extractionPath) : extractionPath(std::move(extractionPath)) {}

size_t CarveWriter::write(const ScanResult& root, const std::string& inputName) {
    written = 0;
    failed = 0;
    taken.clear();
    fs::path base = extractionPath / (sanitize_path_hint(fs::path(inputName).filename().string()) + ".extracted");
    writeNode(root, base, 0);
    if (written)
        Logger::info("Wrote " + std::to_string(written) + " files under " + base.string());
    return written;
}

// Plain nodes (the input, rescanned gaps) only hold artifacts further down.
// base is the position of node within the buffer dir stands for.
void CarveWriter::writeNode(const ScanResult& node, const fs::path& dir, size_t base) {
    for (const auto& child : node.children) {
        if (child.isArtifact())
            writeArtifact(child, dir, base + child.offset);
        else if (!child.children.empty())
            writeNode(child, dir, base + child.offset);
    }
}

void CarveWriter::writeArtifact(const ScanResult& artifact, const fs::path& dir, size_t offset) {
    fs::path artifactDir = claim(dir / (to_hex(offset) + "-" + sanitize_path_hint(artifact.type)));
    std::error_code ec;
    fs::create_directories(artifactDir, ec);
    if (ec) {
        Logger::error("Cannot create " + artifactDir.string() + ": " + ec.message());
        ++failed;
        return;
    }

    writeBytes(artifact.region, artifactDir / (sanitize_path_hint(artifact.type) + ".bin"));

    for (const auto& entry : artifact.children) {
        fs::path entryPath = claim(artifactDir / sanitize_path_hint(entry.pathHint));
        fs::create_directories(entryPath.parent_path(), ec);
        if (ec) {
            Logger::error("Cannot create " + entryPath.parent_path().string() + ": " + ec.message());
            ++failed;
            continue;
        }
        if (!writeBytes(entry.region, entryPath))
            continue;
        if (!entry.children.empty())
            writeNode(entry, fs::path(entryPath.string() + ".extracted"), 0);
    }
}

fs::path CarveWriter::claim(const fs::path& wanted) {
    fs::path candidate = wanted;
    for (unsigned n = 1; !taken.insert(candidate).second; ++n)
        candidate = fs::path(wanted.string() + "-" + std::to_string(n));
    if (candidate != wanted)
        Logger::warn(wanted.string() + " already written, using " + candidate.filename().string());
    return candidate;
}

bool CarveWriter::writeBytes(const ByteRegion& region, const fs::path& outPath) {
    if (!region.valid()) {
        ++failed;
        return false;
    }
    std::ofstream out(outPath, std::ios::binary);
    if (!out) {
        Logger::error("Cannot open " + outPath.string() + " for writing");
        ++failed;
        return false;
    }
    out.write(reinterpret_cast<const char*>(region.data()), static_cast<std::streamsize>(region.length()));
    if (!out) {
        Logger::error("Short write to " + outPath.string());
        ++failed;
        return false;
    }
    ++written;
    Logger::debug("Wrote " + outPath.string());
    return true;
}
