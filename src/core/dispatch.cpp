#include "dispatch.hpp"
#include <algorithm>
#include <exception>
#include <vector>
#include "helpers.hpp"
#include "logger.hpp"

DispatchEngine::DispatchEngine(const ParserTable& table, FailureReport& failures)
    : table(table), failures(failures) {}

std::optional<DispatchMatch> DispatchEngine::dispatch(const ByteRegion& scanned, size_t pos,
                                                      const std::vector<size_t>& candidates) const {
    if (pos >= scanned.length())
        return std::nullopt;
    ByteRegion region = scanned.from(pos);

    for (size_t variant : candidates) {
        if (failures.isPoisoned(variant))
            continue;
        auto match = attempt(variant, region);
        if (match)
            return match;
    }
    return std::nullopt;
}

std::optional<DispatchMatch> DispatchEngine::attempt(size_t variant, const ByteRegion& region) const {
    const BaseParser& parser = table.parser(variant);
    const std::string& name = table.name(variant);

    std::unique_ptr<ParsedState> state;
    try {
        ParseResult result = parser.parse(region);
        if (!result.isOk()) {
            Logger::debug(to_hex(region.offset()) + " " + name + ": " + result.reason());
            return std::nullopt;
        }
        state = result.takeState();
    } catch (const BufferBoundsError& e) {
        Logger::debug(to_hex(region.offset()) + " " + name + ": " + e.what());
        return std::nullopt;
    } catch (const std::exception& e) {
        bool poisoned = failures.recordFault(variant, region.bufferId(), region.offset(), e.what());
        Logger::error("Parser " + name + " faulted at " + to_hex(region.offset()) + ": " + e.what());
        if (poisoned)
            Logger::debug("Skipping " + name + " for the rest of the session");
        return std::nullopt;
    }

    DispatchMatch match;
    match.variant = variant;
    match.parserName = name;

    // Everything below is the plugin describing bytes it already accepted,
    // so a throw here is a broken contract rather than a mismatch.
    try {
        size_t consumed = parser.consumedLength(*state);
        if (consumed == 0 || consumed > region.length()) {
            violation(variant, region, "consumed length " + std::to_string(consumed) +
                                       " outside (0, " + std::to_string(region.length()) + "]");
            return std::nullopt;
        }
        match.claimed = region.first(consumed);

        std::optional<ByteRegion> carved = parser.carve(*state, match.claimed);
        if (carved) {
            if (carved->empty() || !match.claimed.contains(*carved)) {
                violation(variant, region, "carved region is empty or outside the consumed range");
                return std::nullopt;
            }
            match.artifact = *carved;
        } else {
            match.artifact = match.claimed;
        }

        match.children = parser.extractChildren(*state, match.artifact);
        for (const auto& child : match.children) {
            if (!child.region.valid()) {
                violation(variant, region, "child '" + child.pathHint + "' has no buffer");
                return std::nullopt;
            }
            if (child.region.sharesStorageWith(match.artifact) && !match.artifact.contains(child.region)) {
                violation(variant, region, "child '" + child.pathHint + "' lies outside the artifact");
                return std::nullopt;
            }
        }

        // Children carved from the artifact's own bytes must not share any.
        std::vector<const ChildEntry*> inPlace;
        for (const auto& child : match.children)
            if (!child.region.empty() && child.region.sharesStorageWith(match.artifact))
                inPlace.push_back(&child);
        std::sort(inPlace.begin(), inPlace.end(), [](const ChildEntry* a, const ChildEntry* b) {
            return a->region.storagePosition() < b->region.storagePosition();
        });
        for (size_t i = 1; i < inPlace.size(); ++i) {
            const ChildEntry& prev = *inPlace[i - 1];
            if (prev.region.storagePosition() + prev.region.length() > inPlace[i]->region.storagePosition()) {
                violation(variant, region, "children '" + prev.pathHint + "' and '" + inPlace[i]->pathHint + "' overlap");
                return std::nullopt;
            }
        }

        match.description = parser.describe(*state);
    } catch (const std::exception& e) {
        violation(variant, region, std::string("threw after a successful parse: ") + e.what());
        return std::nullopt;
    }

    return match;
}

void DispatchEngine::violation(size_t variant, const ByteRegion& region, const std::string& message) const {
    Logger::error("Contract violation by " + table.name(variant) + " at " + to_hex(region.offset()) + ": " + message);
    failures.recordContractViolation(variant, region.bufferId(), region.offset(), message);
}
