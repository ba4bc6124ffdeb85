#pragma once
#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "failure_report.hpp"
#include "parser_registry.hpp"
#include "scanresult.hpp"

namespace fs = std::filesystem;

struct DispatchMatch;

enum class GapPolicy {
    Leaf,    // unclaimed ranges stay "unrecognized data" leaves
    Rescan   // interior gaps get an anchored second pass
};

struct ScanConfig {
    unsigned maxDepth = 8;
    size_t minRegionSize = 0;        // 0: smallest signature span
    bool dedupByContentHash = true;
    GapPolicy gapPolicy = GapPolicy::Leaf;
    unsigned workerCount = 0;        // 0: hardware concurrency
    size_t queueCapacity = 1024;
    unsigned poisonThreshold = 3;
};

enum class ScanStatus {
    Complete,
    Aborted
};

struct ScanStats {
    size_t tasks = 0;
    size_t artifacts = 0;
    size_t unrecognized = 0;
    size_t duplicates = 0;
    size_t inlineTasks = 0;
    size_t taskErrors = 0;
    size_t buffers = 0;
};

struct ScanReport {
    ScanResult root;
    ScanStatus status = ScanStatus::Complete;
    FailureSummary failures;
    ScanStats stats;

    bool complete() const { return status == ScanStatus::Complete; }
};

// Drives one scan session at a time: a pool of workers drains a queue of
// (region, depth) tasks, each task sweeps its region for signatures, claims
// what validates, and hands the extracted children to the next depth level.
// Levels run one after another.
class Scanner {
public:
    explicit Scanner(std::shared_ptr<const ParserTable> table, ScanConfig config = ScanConfig());

    ScanReport scan(const fs::path& filePath);
    ScanReport scan(const BufferPtr& buffer, const std::string& pathHint);

    // Only sets a flag, so it is safe from a signal handler. Running tasks
    // finish; nothing new is dequeued.
    void stop();

private:
    struct Session;
    struct ScanTask;

    void runLevel(Session& session, std::vector<ScanTask>& level, unsigned workers);
    void runWorker(Session& session);
    void execute(Session& session, ScanTask& task);
    void process(Session& session, ScanTask& task);
    void schedule(Session& session, ScanTask task);
    void runInline(Session& session, ScanTask& task);

    // Both return true when interrupted by stop().
    bool sweep(Session& session, const ScanTask& task, std::vector<DispatchMatch>& matches);
    bool anchoredScan(Session& session, const ScanTask& task, std::vector<DispatchMatch>& matches);
    bool claim(Session& session, const DispatchMatch& match);
    void attach(Session& session, ScanTask& task, std::vector<DispatchMatch>& matches, bool interrupted);

    std::shared_ptr<const ParserTable> table;
    ScanConfig settings;
    std::atomic<bool> stopFlag{false};
};
