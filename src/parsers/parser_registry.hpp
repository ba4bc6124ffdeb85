// parser_registry.hpp
#pragma once
#include "base_parser.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Frozen, read-only set of parsers. Position in the table is the variant id
// and the dispatch priority.
class ParserTable {
public:
    struct Rejection {
        std::string name;
        std::string reason;
    };

    // parsers must already be in priority order. Parsers with a bad
    // declaration are dropped and listed in rejected().
    static std::shared_ptr<const ParserTable> build(std::vector<std::unique_ptr<BaseParser>> parsers);

    size_t size() const { return parsers.size(); }
    const BaseParser& parser(size_t variant) const { return *parsers.at(variant); }
    const std::string& name(size_t variant) const { return names.at(variant); }
    const std::vector<std::string>& variantNames() const { return names; }
    const SignatureIndex& index() const { return signatureIndex; }
    const std::vector<Rejection>& rejected() const { return rejections; }

private:
    ParserTable() = default;

    std::vector<std::unique_ptr<BaseParser>> parsers;
    std::vector<std::string> names;
    SignatureIndex signatureIndex;
    std::vector<Rejection> rejections;
};

class ParserRegistry {
public:
    using Creator = std::function<std::unique_ptr<BaseParser>()>;

    static ParserRegistry& instance() {
        static ParserRegistry registry;
        return registry;
    }

    // Lower priority values are tried first. Throws once frozen.
    void registerParser(int priority, Creator creator);

    // Builds the table on first call; later calls return the same table.
    std::shared_ptr<const ParserTable> freeze();
    bool frozen() const;

private:
    struct Registration {
        int priority;
        Creator creator;
    };

    mutable std::mutex mutex;
    std::vector<Registration> creators;
    std::shared_ptr<const ParserTable> table;
};
