#include <atomic>
#include <chrono>
#include <climits>
#include <cstdint>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>
#include "carve_writer.hpp"
#include "helpers.hpp"
#include "logger.hpp"
#include "printer.hpp"
#include "scanner.hpp"

namespace fs = std::filesystem;

struct Config {
    ScanConfig scan;
    bool extract = false;
    bool jsonOutput = false;
    std::string jsonFile;
    bool listParsers = false;
    std::string extractionPath = "extractions/";
    std::string inputFile;
};

class ArgParser {
public:
    struct OptionInfo {
        bool takesValue;
        std::string canonicalName;
    };

    std::unordered_map<std::string, OptionInfo> optionDefs;
    std::unordered_map<std::string, std::string> parsedOptions;
    std::vector<std::string> positional;

    void addOption(const std::string& name, bool takesValue, const std::string& canonical) {
        optionDefs[name] = {takesValue, canonical};
    }

    void parse(int argc, char* argv[]) {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (optionDefs.count(arg)) {
                const auto& info = optionDefs[arg];

                if (info.takesValue) {
                    if (i + 1 >= argc) {
                        throw std::runtime_error("Missing value for option: " + arg);
                    }
                    parsedOptions[info.canonicalName] = argv[++i];
                } else {
                    parsedOptions[info.canonicalName] = "true";
                }
            }
            else if (arg.size() > 1 && arg[0] == '-') {
                throw std::runtime_error("Unknown option: " + arg);
            }
            else {
                positional.push_back(arg);
            }
        }
    }

    bool has(const std::string& canonical) const {
        return parsedOptions.count(canonical);
    }

    std::string get(const std::string& canonical, const std::string& def = "") const {
        auto it = parsedOptions.find(canonical);
        return it != parsedOptions.end() ? it->second : def;
    }

    uint64_t getCount(const std::string& canonical, uint64_t max) const {
        try {
            return parse_count(get(canonical), max);
        } catch (const std::invalid_argument&) {
            throw std::runtime_error("Invalid value for --" + canonical + ": '" + get(canonical) + "'");
        } catch (const std::out_of_range&) {
            throw std::runtime_error("Value for --" + canonical + " is too large: " + get(canonical));
        }
    }
};

static void printUsage() {
    std::cout << "Usage: deepcarve [options] <input_file>\n"
              << "  -r, --max-depth N        Maximum extraction depth (default 8)\n"
              << "  -m, --min-size N         Skip regions smaller than N bytes (default: smallest signature)\n"
              << "  -j, --jobs N             Worker threads (default: hardware concurrency)\n"
              << "  -g, --gap-rescan         Try anchored parsers at the start of unclaimed gaps\n"
              << "      --no-dedup           Rescan byte-identical children\n"
              << "  -p, --poison N           Disable a parser after N unexpected faults (default 3)\n"
              << "  -e, --extract            Write artifacts and extracted files to disk\n"
              << "  -C, --extractionPath DIR Extraction directory (default extractions/)\n"
              << "  -O, --jsonPath FILE      Write the result tree as JSON\n"
              << "  -l, --list               List the registered parsers and exit\n"
              << "  -d, --debug              Debug output\n"
              << "  -q, --quiet              Errors only\n"
              << "  -h, --help               Show this help message\n";
}

Config parseArgs(int argc, char* argv[]) {
    Config config;
    ArgParser args;
    args.addOption("-h", false, "help");
    args.addOption("--help", false, "help");

    args.addOption("-e", false, "extract");
    args.addOption("--extract", false, "extract");

    args.addOption("-d", false, "debug");
    args.addOption("--debug", false, "debug");

    args.addOption("-q", false, "quiet");
    args.addOption("--quiet", false, "quiet");

    args.addOption("-l", false, "list");
    args.addOption("--list", false, "list");

    args.addOption("-C", true, "extractionPath");
    args.addOption("--extractionPath", true, "extractionPath");

    args.addOption("-O", true, "jsonPath");
    args.addOption("--jsonPath", true, "jsonPath");

    args.addOption("-r", true, "max-depth");
    args.addOption("--max-depth", true, "max-depth");

    args.addOption("-m", true, "min-size");
    args.addOption("--min-size", true, "min-size");

    args.addOption("-j", true, "jobs");
    args.addOption("--jobs", true, "jobs");

    args.addOption("-p", true, "poison");
    args.addOption("--poison", true, "poison");

    args.addOption("-g", false, "gap-rescan");
    args.addOption("--gap-rescan", false, "gap-rescan");

    args.addOption("--no-dedup", false, "no-dedup");

    args.parse(argc, argv);

    if (args.has("quiet"))
        Logger::setLevel(LogLevel::ERROR);

    if (args.has("debug")) {
        Logger::setLevel(LogLevel::DEBUG);
        Logger::debug("Enabling Debug Mode");
    }

    if (args.has("list")) {
        config.listParsers = true;
        return config;
    }

    if (args.has("help") || args.positional.empty()) {
        printUsage();
        std::exit(args.has("help") ? 0 : 1);
    }

    if (args.has("extract")) {
        Logger::debug("Enabling extraction");
        config.extract = true;
    }

    if (args.has("max-depth")) {
        config.scan.maxDepth = static_cast<unsigned>(args.getCount("max-depth", UINT_MAX));
        Logger::debug("Setting max depth to " + std::to_string(config.scan.maxDepth));
    }

    if (args.has("min-size"))
        config.scan.minRegionSize = args.getCount("min-size", SIZE_MAX);

    if (args.has("jobs")) {
        config.scan.workerCount = static_cast<unsigned>(args.getCount("jobs", UINT_MAX));
        if (config.scan.workerCount == 0)
            throw std::runtime_error("--jobs must be at least 1");
    }

    if (args.has("poison")) {
        config.scan.poisonThreshold = static_cast<unsigned>(args.getCount("poison", UINT_MAX));
        if (config.scan.poisonThreshold == 0)
            throw std::runtime_error("--poison must be at least 1");
    }

    if (args.has("gap-rescan"))
        config.scan.gapPolicy = GapPolicy::Rescan;

    if (args.has("no-dedup"))
        config.scan.dedupByContentHash = false;

    if (args.has("extractionPath")) {
        config.extractionPath = args.get("extractionPath");
        Logger::debug("Setting extraction path to " + config.extractionPath);
    }

    if (args.has("jsonPath")) {
        config.jsonFile = args.get("jsonPath");
        config.jsonOutput = true;
        Logger::debug("Setting json output path to " + config.jsonFile);
    }

    if (args.positional.size() > 1)
        throw std::runtime_error("Expected exactly one input file");
    config.inputFile = args.positional.back();

    return config;
}

static std::atomic<Scanner*> activeScanner{nullptr};

extern "C" void onInterrupt(int) {
    Scanner* scanner = activeScanner.load();
    if (scanner)
        scanner->stop();
}

static void listParsers(const ParserTable& table) {
    std::cout << "Registered parsers, in dispatch order:\n";
    for (size_t v = 0; v < table.size(); ++v) {
        std::cout << "  " << std::to_string(v) << "  " << ansi::yellow << table.name(v) << ansi::reset;
        for (const auto& sig : table.parser(v).signatures()) {
            std::cout << "  @" << sig.offset << ":";
            for (uint8_t b : sig.pattern)
                std::cout << " " << to_hex(b);
        }
        std::cout << "\n";
    }
}

int main(int argc, char* argv[]) {
    Logger::setLevel(LogLevel::INFO);

    Config config;
    try {
        config = parseArgs(argc, argv);
    } catch (const std::exception& e) {
        Logger::error(e.what());
        printUsage();
        return 1;
    }

    std::shared_ptr<const ParserTable> table = ParserRegistry::instance().freeze();
    if (config.listParsers) {
        listParsers(*table);
        return 0;
    }

    Scanner scanner(table, config.scan);
    activeScanner.store(&scanner);
    std::signal(SIGINT, onInterrupt);

    Logger::info("Opening " + config.inputFile + "...");
    auto start = std::chrono::steady_clock::now();

    ScanReport report;
    try {
        report = scanner.scan(fs::path(config.inputFile));
    } catch (const std::exception& e) {
        std::signal(SIGINT, SIG_DFL);
        activeScanner.store(nullptr);
        Logger::error(e.what());
        return 1;
    }
    std::signal(SIGINT, SIG_DFL);
    activeScanner.store(nullptr);

    printScanResults(report, config.inputFile);
    printFailures(report.failures);

    int status = 0;
    if (config.jsonOutput && !dumpJson(report, config.inputFile, config.jsonFile))
        status = 1;

    if (config.extract) {
        CarveWriter writer{fs::path(config.extractionPath)};
        writer.write(report.root, config.inputFile);
        if (writer.failures())
            status = 1;
    }

    auto end = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    Logger::info("Total elapsed time: " + std::to_string(elapsed) + "ms");

    return status;
}
