#include "parser_registry.hpp"
#include <algorithm>
#include <set>
#include <stdexcept>
#include "logger.hpp"

std::shared_ptr<const ParserTable> ParserTable::build(std::vector<std::unique_ptr<BaseParser>> candidates) {
    std::shared_ptr<ParserTable> table(new ParserTable());
    std::set<std::string> seen;

    for (auto& parser : candidates) {
        if (!parser) {
            table->rejections.push_back({"", "null parser"});
            continue;
        }
        std::string name = parser->name();
        if (name.empty()) {
            table->rejections.push_back({name, "empty name"});
            continue;
        }
        if (seen.count(name)) {
            table->rejections.push_back({name, "duplicate name"});
            continue;
        }
        std::vector<Signature> signatures = parser->signatures();
        auto empty = std::find_if(signatures.begin(), signatures.end(),
                                  [](const Signature& s) { return s.pattern.empty(); });
        if (empty != signatures.end()) {
            table->rejections.push_back({name, "empty signature pattern"});
            continue;
        }

        size_t variant = table->parsers.size();
        if (signatures.empty()) {
            table->signatureIndex.addFallback(variant);
        } else {
            for (const auto& signature : signatures)
                table->signatureIndex.add(variant, signature);
        }
        seen.insert(name);
        table->names.push_back(name);
        table->parsers.push_back(std::move(parser));
    }

    for (const auto& r : table->rejections)
        Logger::error("Rejected parser '" + r.name + "': " + r.reason);

    return table;
}

void ParserRegistry::registerParser(int priority, Creator creator) {
    std::lock_guard<std::mutex> lock(mutex);
    if (table)
        throw std::logic_error("parser registry is frozen");
    creators.push_back({priority, std::move(creator)});
}

std::shared_ptr<const ParserTable> ParserRegistry::freeze() {
    std::lock_guard<std::mutex> lock(mutex);
    if (table)
        return table;

    struct Instance {
        int priority;
        std::string name;
        std::unique_ptr<BaseParser> parser;
    };
    std::vector<Instance> instances;
    for (const auto& registration : creators) {
        auto parser = registration.creator();
        std::string name = parser ? parser->name() : std::string();
        instances.push_back({registration.priority, name, std::move(parser)});
    }
    std::stable_sort(instances.begin(), instances.end(), [](const Instance& a, const Instance& b) {
        if (a.priority != b.priority)
            return a.priority < b.priority;
        return a.name < b.name;
    });

    std::vector<std::unique_ptr<BaseParser>> ordered;
    for (auto& instance : instances)
        ordered.push_back(std::move(instance.parser));

    table = ParserTable::build(std::move(ordered));
    Logger::debug("Parser registry frozen with " + std::to_string(table->size()) + " parsers, " +
                  std::to_string(table->index().entryCount()) + " signatures");
    return table;
}

bool ParserRegistry::frozen() const {
    std::lock_guard<std::mutex> lock(mutex);
    return table != nullptr;
}
