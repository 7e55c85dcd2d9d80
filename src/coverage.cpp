/**
 * dexref - Coverage Aggregator Implementation
 */

#include "dexref/coverage.hpp"
#include "dexref/resolvers.hpp"
#include <algorithm>
#include <set>

namespace dexref {

namespace {

CoverageMap empty_coverage() {
    CoverageMap coverage;
    for (const auto& type_name : all_type_names()) {
        coverage[type_name] = {};
    }
    return coverage;
}

void sort_entries(CoverageMap& coverage) {
    for (auto& entry : coverage) {
        std::stable_sort(entry.second.begin(), entry.second.end(),
                         [](const CoverageEntry& a, const CoverageEntry& b) {
                             return a.pokemon < b.pokemon;
                         });
    }
}

} // namespace

Resolution<CoverageReport> coverage_report(const std::vector<Pokemon>& roster,
                                           const ResourceStore& store) {
    CoverageReport report;
    report.offense = empty_coverage();
    report.defense = empty_coverage();

    std::set<std::string> seen;

    for (const auto& member : roster) {
        const PokemonSnapshot& snapshot = member.snapshot;
        const std::string& name = snapshot.display_name();
        if (!seen.insert(name).second) continue;

        // Offense: one entry per covered type, listing every own type that grants it
        std::map<std::string, CoverageEntry> offense_entries;
        for (const auto& own_type : snapshot.types()) {
            auto type = resolve_type(own_type, snapshot.generation, store);
            if (!type.ok()) {
                return Resolution<CoverageReport>::failure(type.error);
            }

            TypeChart offense = type.get().charts().offense;
            for (const auto& value : offense.values()) {
                if (value.second <= 1.0f) continue;

                auto it = offense_entries.find(value.first);
                if (it == offense_entries.end()) {
                    offense_entries[value.first] = CoverageEntry{name, {own_type}, value.second};
                } else {
                    it->second.via_types.push_back(own_type);
                    it->second.multiplier = std::max(it->second.multiplier, value.second);
                }
            }
        }
        for (auto& entry : offense_entries) {
            report.offense[entry.first].push_back(std::move(entry.second));
        }

        // Defense: labelled by the resisting multiplier itself
        for (const auto& value : member.defense_chart.values()) {
            if (value.second < 1.0f) {
                report.defense[value.first].push_back(CoverageEntry{name, {}, value.second});
            }
        }
    }

    sort_entries(report.offense);
    sort_entries(report.defense);

    return Resolution<CoverageReport>::success(std::move(report));
}

} // namespace dexref
