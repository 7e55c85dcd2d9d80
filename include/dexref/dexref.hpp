/**
 * dexref - Ruleset Reference Engine
 *
 * Generation-aware resolution of Pokémon, moves, types and abilities, and
 * the type-effectiveness analysis built on it.
 *
 * Include this header to get access to the complete API.
 */

#pragma once

// Core types
#include "types.hpp"
#include "records.hpp"
#include "resolution.hpp"

// Storage
#include "resource_store.hpp"

// Resolution
#include "generation.hpp"
#include "override_matcher.hpp"
#include "type_chart.hpp"
#include "models.hpp"
#include "resolvers.hpp"
#include "evolution.hpp"

// Analysis
#include "coverage.hpp"
#include "matchup.hpp"

namespace dexref {

/**
 * Version information. Datasets must match at the major.minor level.
 */
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 4;
constexpr int VERSION_PATCH = 0;

inline std::string get_version() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

} // namespace dexref
