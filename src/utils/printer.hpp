#pragma once
#include <string>
#include "scanner.hpp"

void printScanResults(const ScanReport& report, const std::string& inputFile);
void printFailures(const FailureSummary& failures);

// Returns false if the file cannot be written.
bool dumpJson(const ScanReport& report, const std::string& inputFile, const std::string& filename);
// Exposed for tests; the caller owns the result and frees it with cJSON_Delete.
struct cJSON* build_json_report(const ScanReport& report, const std::string& inputFile);
