#include "scanner.hpp"
#include <algorithm>
#include <chrono>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>
#include "claim_ledger.hpp"
#include "content_dedup.hpp"
#include "dispatch.hpp"
#include "file_reader.hpp"
#include "helpers.hpp"
#include "logger.hpp"
#include "work_queue.hpp"

enum class TaskMode {
    Primary,   // full signature sweep of a buffer
    Gap        // anchored pass over an interior gap, same buffer
};

struct Scanner::ScanTask {
    ByteRegion region;
    unsigned depth = 0;
    ScanResult* target = nullptr;
    TaskMode mode = TaskMode::Primary;
    std::string path;
    std::vector<size_t> treePosition;   // child indices from the root, for pre-order
};

struct Scanner::Session {
    Session(const ParserTable& table, const ScanConfig& config)
        : failures(table.variantNames(), config.poisonThreshold),
          engine(table, failures),
          queue(config.queueCapacity) {}

    FailureReport failures;
    DispatchEngine engine;
    CarvingLedger ledger;
    ContentDedup dedup;
    WorkQueue<ScanTask> queue;
    size_t minRegion = 1;

    // Child tasks produced by the current level, released after it finishes.
    std::mutex nextLevelMutex;
    std::vector<ScanTask> nextLevel;

    std::atomic<size_t> tasks{0};
    std::atomic<size_t> artifacts{0};
    std::atomic<size_t> unrecognized{0};
    std::atomic<size_t> duplicates{0};
    std::atomic<size_t> inlineTasks{0};
    std::atomic<size_t> taskErrors{0};
};

Scanner::Scanner(std::shared_ptr<const ParserTable> table, ScanConfig config)
    : table(std::move(table)), settings(config) {
    if (!this->table)
        throw std::invalid_argument("Scanner needs a parser table");
}

void Scanner::stop() {
    stopFlag.store(true);
}

ScanReport Scanner::scan(const fs::path& filePath) {
    Logger::debug("Scanner::scan " + filePath.string());
    BufferPtr buffer = readFile(filePath);
    return scan(buffer, filePath.filename().string());
}

ScanReport Scanner::scan(const BufferPtr& buffer, const std::string& pathHint) {
    stopFlag.store(false);

    Session session(*table, settings);
    session.minRegion = std::max<size_t>(1, settings.minRegionSize ? settings.minRegionSize
                                                                    : table->index().minSpan());

    ScanReport report;
    ScanResult& root = report.root;
    root.pathHint = pathHint;
    root.region = ByteRegion(buffer);
    root.length = root.region.length();
    root.depth = 0;

    ScanTask first;
    first.region = root.region;
    first.target = &root;
    first.path = pathHint;

    unsigned workers = settings.workerCount;
    if (workers == 0)
        workers = std::max(1u, std::thread::hardware_concurrency());

    auto start = std::chrono::steady_clock::now();
    std::vector<ScanTask> level;
    level.push_back(std::move(first));
    while (!level.empty()) {
        runLevel(session, level, workers);
        level.clear();
        std::lock_guard<std::mutex> lock(session.nextLevelMutex);
        level.swap(session.nextLevel);
    }

    report.status = stopFlag.load() ? ScanStatus::Aborted : ScanStatus::Complete;
    report.failures = session.failures.summary();
    report.stats.tasks = session.tasks;
    report.stats.artifacts = session.artifacts;
    report.stats.unrecognized = session.unrecognized;
    report.stats.duplicates = session.duplicates;
    report.stats.inlineTasks = session.inlineTasks;
    report.stats.taskErrors = session.taskErrors;
    report.stats.buffers = session.ledger.bufferCount();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
    Logger::debug("Scanned " + pathHint + ": " + std::to_string(report.stats.tasks) + " tasks, " +
                  std::to_string(report.stats.artifacts) + " artifacts in " + std::to_string(elapsed) + "ms");
    if (!report.complete())
        Logger::warn("Scan of " + pathHint + " was stopped, the result tree is incomplete");
    return report;
}

// Runs one depth level to completion. Dedup is decided here, in tree order,
// before any task of the level starts, so which copy of repeated content gets
// scanned never depends on worker timing.
void Scanner::runLevel(Session& session, std::vector<ScanTask>& level, unsigned workers) {
    std::sort(level.begin(), level.end(), [](const ScanTask& a, const ScanTask& b) {
        return a.treePosition < b.treePosition;
    });

    std::vector<ScanTask> runnable;
    runnable.reserve(level.size());
    for (auto& task : level) {
        if (settings.dedupByContentHash) {
            if (auto firstCopy = session.dedup.findOrInsert(task.region, task.path)) {
                task.target->labels.insert(label::duplicate);
                task.target->metadata["duplicate_of"] = *firstCopy;
                ++session.duplicates;
                continue;
            }
        }
        runnable.push_back(std::move(task));
    }

    // The seeding hold keeps workers from seeing an idle queue before every
    // task of the level has been handed out. Workers start once the queue
    // first fills up, or after seeding.
    session.queue.beginInline();
    std::vector<std::thread> pool;
    auto startPool = [&]() {
        pool.reserve(workers);
        for (unsigned i = 0; i < workers; ++i)
            pool.emplace_back(&Scanner::runWorker, this, std::ref(session));
    };

    for (auto& task : runnable) {
        if (stopFlag.load()) {
            task.target->labels.insert(label::incomplete);
            continue;
        }
        if (!pool.empty()) {
            schedule(session, std::move(task));
        } else if (!session.queue.tryPush(task)) {
            runInline(session, task);
            startPool();
        }
    }
    if (pool.empty())
        startPool();
    session.queue.done();
    session.queue.wake();

    for (auto& t : pool)
        t.join();

    // Tasks that were still queued when stop() arrived, and the children
    // they would have released.
    for (auto& task : session.queue.drain())
        task.target->labels.insert(label::incomplete);
    if (stopFlag.load()) {
        std::lock_guard<std::mutex> lock(session.nextLevelMutex);
        for (auto& task : session.nextLevel)
            task.target->labels.insert(label::incomplete);
        session.nextLevel.clear();
    }
}

void Scanner::runWorker(Session& session) {
    while (auto task = session.queue.pop(stopFlag)) {
        execute(session, *task);
        session.queue.done();
    }
    session.queue.wake();
}

void Scanner::execute(Session& session, ScanTask& task) {
    try {
        process(session, task);
    } catch (const std::exception& e) {
        // Keeps one broken task from taking the worker (and the pool) down.
        ++session.taskErrors;
        Logger::error("Task " + task.path + " failed: " + e.what());
        task.target->labels.insert(label::incomplete);
        task.target->metadata["error"] = std::string(e.what());
    }
}

void Scanner::schedule(Session& session, ScanTask task) {
    if (session.queue.tryPush(task))
        return;
    // Queue is full: run it here instead of blocking on the queue.
    runInline(session, task);
}

void Scanner::runInline(Session& session, ScanTask& task) {
    session.queue.beginInline();
    ++session.inlineTasks;
    execute(session, task);
    session.queue.done();
}

void Scanner::process(Session& session, ScanTask& task) {
    ++session.tasks;
    ScanResult& node = *task.target;

    if (stopFlag.load(std::memory_order_relaxed)) {
        node.labels.insert(label::incomplete);
        return;
    }

    if (task.mode == TaskMode::Primary) {
        if (task.depth >= settings.maxDepth) {
            Logger::debug("Depth limit reached at " + task.path);
            node.labels.insert(label::unrecognized);
            node.labels.insert(label::depthLimit);
            ++session.unrecognized;
            return;
        }
        if (task.region.length() < session.minRegion) {
            node.labels.insert(label::unrecognized);
            node.labels.insert(label::tooSmall);
            ++session.unrecognized;
            return;
        }
    }

    std::vector<DispatchMatch> matches;
    bool interrupted = task.mode == TaskMode::Primary ? sweep(session, task, matches)
                                                      : anchoredScan(session, task, matches);
    attach(session, task, matches, interrupted);
}

bool Scanner::sweep(Session& session, const ScanTask& task, std::vector<DispatchMatch>& matches) {
    const SignatureIndex& index = table->index();
    const ByteRegion& region = task.region;
    const size_t length = region.length();

    size_t pos = 0;
    while (pos < length) {
        if (stopFlag.load(std::memory_order_relaxed))
            return true;

        std::vector<size_t> candidates = pos == 0 ? index.candidatesAtStart(region, pos)
                                                  : index.candidatesAt(region, pos);
        if (candidates.empty()) {
            ++pos;
            continue;
        }

        auto match = session.engine.dispatch(region, pos, candidates);
        if (!match || !claim(session, *match)) {
            ++pos;
            continue;
        }
        pos += match->claimed.length();
        matches.push_back(std::move(*match));
    }
    return false;
}

bool Scanner::anchoredScan(Session& session, const ScanTask& task, std::vector<DispatchMatch>& matches) {
    const SignatureIndex& index = table->index();
    const ByteRegion& region = task.region;

    size_t pos = 0;
    while (pos < region.length()) {
        if (stopFlag.load(std::memory_order_relaxed))
            return true;
        auto match = session.engine.dispatch(region, pos, index.candidatesAtStart(region, pos));
        if (!match || !claim(session, *match))
            break;
        pos += match->claimed.length();
        matches.push_back(std::move(*match));
    }
    return false;
}

bool Scanner::claim(Session& session, const DispatchMatch& match) {
    const ByteRegion& claimed = match.claimed;
    ClaimStatus status = session.ledger.tryClaim(claimed.bufferId(), claimed.offset(), claimed.length());
    if (status == ClaimStatus::Overlap) {
        std::string message = "range " + hex_offset(claimed.offset()) + "+" + std::to_string(claimed.length()) +
                              " is already claimed";
        Logger::error("Dropping " + match.parserName + " match: " + message);
        session.failures.recordOverlap(match.variant, claimed.bufferId(), claimed.offset(), message);
        return false;
    }
    Logger::debug(hex_offset(claimed.offset()) + " " + match.parserName + " (" + std::to_string(claimed.length()) + " bytes)");
    return true;
}

void Scanner::attach(Session& session, ScanTask& task, std::vector<DispatchMatch>& matches, bool interrupted) {
    ScanResult& node = *task.target;
    const ByteRegion& region = task.region;

    if (interrupted)
        node.labels.insert(label::incomplete);

    if (matches.empty()) {
        if (!interrupted) {
            node.labels.insert(label::unrecognized);
            ++session.unrecognized;
        }
        return;
    }

    std::vector<Interval> gaps = session.ledger.unclaimedGaps(region.bufferId(), region.offset(), region.length());

    std::vector<ScanResult> children;
    std::vector<std::pair<size_t, ScanTask>> pending;
    size_t mi = 0;
    size_t gi = 0;

    while (mi < matches.size() || gi < gaps.size()) {
        bool takeMatch = gi == gaps.size() ||
                         (mi < matches.size() && matches[mi].claimed.offset() < gaps[gi].offset);

        if (!takeMatch) {
            const Interval& gap = gaps[gi++];
            ScanResult g;
            g.offset = gap.offset - region.offset();
            g.length = gap.length;
            g.depth = task.depth;
            g.region = ByteRegion(region.buffer(), gap.offset, gap.length);

            bool rescan = task.mode == TaskMode::Primary && settings.gapPolicy == GapPolicy::Rescan &&
                          !interrupted && g.offset > 0 && g.length >= session.minRegion;
            if (rescan) {
                g.labels.insert(label::gap);
                ScanTask t;
                t.region = g.region;
                t.depth = task.depth;
                t.mode = TaskMode::Gap;
                t.path = task.path + "/" + hex_offset(g.offset) + "-gap";
                t.treePosition = task.treePosition;
                t.treePosition.push_back(children.size());
                pending.emplace_back(children.size(), std::move(t));
            } else {
                g.labels.insert(label::unrecognized);
                ++session.unrecognized;
            }
            children.push_back(std::move(g));
            continue;
        }

        DispatchMatch& m = matches[mi++];
        ++session.artifacts;

        ScanResult a;
        a.type = m.parserName;
        a.offset = m.claimed.offset() - region.offset();
        a.length = m.claimed.length();
        a.depth = task.depth;
        a.labels = std::move(m.description.labels);
        a.metadata = std::move(m.description.metadata);
        a.region = m.artifact;
        if (!(m.artifact == m.claimed)) {
            a.metadata["carved_offset"] = static_cast<uint64_t>(m.artifact.offset() - m.claimed.offset());
            a.metadata["carved_length"] = static_cast<uint64_t>(m.artifact.length());
        }

        for (size_t i = 0; i < m.children.size(); ++i) {
            const ChildEntry& entry = m.children[i];
            ScanResult c;
            c.pathHint = entry.pathHint.empty() ? "child-" + std::to_string(i) : entry.pathHint;
            c.length = entry.region.length();
            c.depth = task.depth + 1;
            if (entry.region.sharesStorageWith(m.artifact)) {
                c.offset = entry.region.storagePosition() - m.artifact.storagePosition();
            } else {
                c.metadata["decoded"] = true;
            }
            // Every child gets a buffer of its own, hence its own ledger.
            c.region = ByteRegion(Buffer::window(entry.region.buffer(), entry.region.offset(),
                                                 entry.region.length(), c.pathHint));

            a.children.push_back(std::move(c));
        }
        children.push_back(std::move(a));
    }

    node.children = std::move(children);

    // The child vectors are final from here on, so the raw pointers handed to
    // other workers stay valid and sibling order never depends on timing.
    // Gap tasks stay on this level; extracted children wait for the next one.
    for (auto& [index, t] : pending) {
        t.target = &node.children[index];
        schedule(session, std::move(t));
    }

    std::vector<ScanTask> released;
    for (size_t ai = 0; ai < node.children.size(); ++ai) {
        ScanResult& artifact = node.children[ai];
        if (!artifact.isArtifact())
            continue;
        const std::string artifactPath = task.path + "/" + hex_offset(artifact.offset) + "-" + artifact.type;
        for (size_t ci = 0; ci < artifact.children.size(); ++ci) {
            ScanResult& child = artifact.children[ci];
            if (interrupted) {
                child.labels.insert(label::incomplete);
                continue;
            }
            ScanTask t;
            t.region = child.region;
            t.depth = child.depth;
            t.target = &child;
            t.path = artifactPath + "/" + child.pathHint;
            t.treePosition = task.treePosition;
            t.treePosition.push_back(ai);
            t.treePosition.push_back(ci);
            released.push_back(std::move(t));
        }
    }
    if (!released.empty()) {
        std::lock_guard<std::mutex> lock(session.nextLevelMutex);
        for (auto& t : released)
            session.nextLevel.push_back(std::move(t));
    }
}
