#include "printer.hpp"
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include "cJSON.h"
#include "helpers.hpp"
#include "logger.hpp"

static void addMetaValue(cJSON* obj, const std::string& key, const MetaValue& value) {
    struct Visitor {
        cJSON* obj;
        const char* key;
        void operator()(bool v) const { cJSON_AddBoolToObject(obj, key, v); }
        void operator()(int64_t v) const { cJSON_AddNumberToObject(obj, key, static_cast<double>(v)); }
        void operator()(uint64_t v) const { cJSON_AddNumberToObject(obj, key, static_cast<double>(v)); }
        void operator()(double v) const { cJSON_AddNumberToObject(obj, key, v); }
        void operator()(const std::string& v) const { cJSON_AddStringToObject(obj, key, v.c_str()); }
    };
    std::visit(Visitor{obj, key.c_str()}, value);
}

static cJSON* build_json_result(const ScanResult& r) {
    cJSON* item = cJSON_CreateObject();
    cJSON_AddStringToObject(item, "path_hint", r.pathHint.c_str());
    if (r.isArtifact())
        cJSON_AddStringToObject(item, "type", r.type.c_str());
    cJSON_AddNumberToObject(item, "offset", static_cast<double>(r.offset));
    cJSON_AddNumberToObject(item, "length", static_cast<double>(r.length));
    cJSON_AddNumberToObject(item, "depth", r.depth);

    cJSON* labels = cJSON_AddArrayToObject(item, "labels");
    for (const auto& l : r.labels)
        cJSON_AddItemToArray(labels, cJSON_CreateString(l.c_str()));

    cJSON* metadata = cJSON_AddObjectToObject(item, "metadata");
    for (const auto& [key, value] : r.metadata)
        addMetaValue(metadata, key, value);

    cJSON* childArray = cJSON_AddArrayToObject(item, "children");
    for (const auto& child : r.children)
        cJSON_AddItemToArray(childArray, build_json_result(child));

    return item;
}

cJSON* build_json_report(const ScanReport& report, const std::string& inputFile) {
    cJSON* root = cJSON_CreateObject();
    cJSON_AddStringToObject(root, "file", inputFile.c_str());
    cJSON_AddBoolToObject(root, "complete", report.complete());
    cJSON_AddItemToObject(root, "tree", build_json_result(report.root));

    cJSON* failures = cJSON_AddArrayToObject(root, "failures");
    for (const auto& f : report.failures.records) {
        cJSON* rec = cJSON_CreateObject();
        cJSON_AddStringToObject(rec, "kind", failureKindName(f.kind));
        cJSON_AddStringToObject(rec, "variant", f.variant.c_str());
        cJSON_AddNumberToObject(rec, "buffer", static_cast<double>(f.bufferId));
        cJSON_AddNumberToObject(rec, "offset", static_cast<double>(f.offset));
        cJSON_AddStringToObject(rec, "message", f.message.c_str());
        cJSON_AddItemToArray(failures, rec);
    }

    cJSON* poisoned = cJSON_AddArrayToObject(root, "poisoned");
    for (const auto& name : report.failures.poisoned)
        cJSON_AddItemToArray(poisoned, cJSON_CreateString(name.c_str()));

    const ScanStats& s = report.stats;
    cJSON* stats = cJSON_AddObjectToObject(root, "stats");
    cJSON_AddNumberToObject(stats, "tasks", static_cast<double>(s.tasks));
    cJSON_AddNumberToObject(stats, "artifacts", static_cast<double>(s.artifacts));
    cJSON_AddNumberToObject(stats, "unrecognized", static_cast<double>(s.unrecognized));
    cJSON_AddNumberToObject(stats, "duplicates", static_cast<double>(s.duplicates));
    cJSON_AddNumberToObject(stats, "inline_tasks", static_cast<double>(s.inlineTasks));
    cJSON_AddNumberToObject(stats, "task_errors", static_cast<double>(s.taskErrors));
    cJSON_AddNumberToObject(stats, "buffers", static_cast<double>(s.buffers));
    return root;
}

bool dumpJson(const ScanReport& report, const std::string& inputFile, const std::string& filename) {
    std::ofstream outFile(filename, std::ios::binary);
    if (!outFile.is_open()) {
        Logger::error("Cannot open " + filename + " for writing");
        return false;
    }

    cJSON* root = build_json_report(report, inputFile);
    char* jsonStr = cJSON_Print(root);
    cJSON_Delete(root);
    if (!jsonStr) {
        Logger::error("Failed to serialize the scan report");
        return false;
    }
    outFile.write(jsonStr, static_cast<std::streamsize>(std::strlen(jsonStr)));
    free(jsonStr);
    if (!outFile) {
        Logger::error("Short write to " + filename);
        return false;
    }
    return true;
}

// Wrap long text into multiple lines
static std::vector<std::string> wrapText(const std::string& text, size_t width) {
    std::vector<std::string> lines;
    std::istringstream words(text);
    std::string word, line;
    while (words >> word) {
        if (!line.empty() && line.size() + word.size() + 1 > width) {
            lines.push_back(line);
            line.clear();
        }
        if (!line.empty()) line += " ";
        line += word;
    }
    if (!line.empty()) lines.push_back(line);
    return lines;
}

static std::string joinLabels(const std::set<std::string>& labels) {
    std::string out;
    for (const auto& l : labels) {
        if (!out.empty()) out += ", ";
        out += l;
    }
    return out;
}

static void printScanResult(const ScanResult& sr, const std::string& prefix = "", bool last = true) {
    // Offset in cyan, type in bold yellow, length in green
    std::ostringstream oss;
    oss << ansi::cyan << "[0x" << std::hex << std::setw(4) << std::setfill('0') << sr.offset << "]" << ansi::reset << " ";
    if (sr.isArtifact())
        oss << ansi::bold << ansi::yellow << sr.type << ansi::reset;
    else if (!sr.pathHint.empty())
        oss << ansi::bold << sr.pathHint << ansi::reset;
    else
        oss << ansi::gray << "data" << ansi::reset;
    oss << " (length=" << ansi::green << std::dec << sr.length << ansi::reset << ")";

    std::cout << prefix << (last ? "└── " : "├── ") << oss.str() << "\n";

    std::string childPrefix = prefix + (last ? "    " : "│   ");

    if (!sr.labels.empty())
        std::cout << childPrefix << ansi::magenta << "Labels: " << joinLabels(sr.labels) << ansi::reset << "\n";

    if (!sr.metadata.empty()) {
        std::string info;
        for (const auto& [key, value] : sr.metadata) {
            if (!info.empty()) info += ", ";
            info += key + "=" + metaToString(value);
        }
        auto lines = wrapText(info, 60);
        for (size_t i = 0; i < lines.size(); ++i) {
            std::cout << childPrefix << ansi::gray << (i == 0 ? "Info: " : "      ") << lines[i] << ansi::reset << "\n";
        }
    }

    for (size_t i = 0; i < sr.children.size(); ++i) {
        printScanResult(sr.children[i], childPrefix, i == sr.children.size() - 1);
    }
}

void printScanResults(const ScanReport& report, const std::string& inputFile) {
    std::cout << "* " << inputFile << " (" << report.root.length << " bytes)";
    if (!report.complete())
        std::cout << " " << ansi::yellow << "[incomplete]" << ansi::reset;
    std::cout << std::endl;
    for (size_t i = 0; i < report.root.children.size(); ++i) {
        printScanResult(report.root.children[i], "", i == report.root.children.size() - 1);
    }
    if (report.root.children.empty() && !report.root.labels.empty())
        std::cout << "    " << ansi::magenta << joinLabels(report.root.labels) << ansi::reset << "\n";
}

void printFailures(const FailureSummary& failures) {
    if (failures.records.empty())
        return;
    std::cout << ansi::bold << "Parser failures" << ansi::reset << " ("
              << failures.contractViolations << " contract violations, "
              << failures.unexpectedFaults << " faults, "
              << failures.overlaps << " overlaps)\n";
    for (const auto& f : failures.records) {
        std::cout << "  " << ansi::red << failureKindName(f.kind) << ansi::reset << " " << f.variant
                  << " @" << hex_offset(f.offset) << ": " << f.message << "\n";
    }
    if (!failures.poisoned.empty()) {
        std::cout << "  " << ansi::yellow << "Disabled:";
        for (const auto& name : failures.poisoned)
            std::cout << " " << name;
        std::cout << ansi::reset << "\n";
    }
}
