/**
 * dexref - Coverage Aggregator
 *
 * For a roster, which types each member threatens offensively (> 1x from
 * one of its own types) and which types it resists defensively (< 1x on
 * its combined defense chart).
 */

#pragma once

#include "models.hpp"
#include "resolution.hpp"
#include <map>

namespace dexref {

class ResourceStore;

struct CoverageEntry {
    std::string pokemon;
    std::vector<std::string> via_types;   // own types granting offense; empty for defense
    float multiplier = 1.0f;
};

/**
 * Every roster type maps to a list, empty when nothing covers it.
 * Types iterate alphabetically; entries are sorted by Pokémon name.
 */
using CoverageMap = std::map<std::string, std::vector<CoverageEntry>>;

struct CoverageReport {
    CoverageMap offense;
    CoverageMap defense;
};

/**
 * Build the report. Each member's types are resolved at its own
 * generation; the first failure is returned and no partial report is kept.
 */
Resolution<CoverageReport> coverage_report(const std::vector<Pokemon>& roster,
                                           const ResourceStore& store);

} // namespace dexref
