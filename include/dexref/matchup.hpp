/**
 * dexref - Matchup Composer
 *
 * Which of an attacker's damaging moves hit a defender hard, grouped by
 * weakness tier. A full report runs each direction independently.
 */

#pragma once

#include "models.hpp"

namespace dexref {

struct MoveMatchup {
    MoveSnapshot move;
    float multiplier = 1.0f;
    bool stab = false;       // move type is one of the attacker's types
};

struct MatchupOptions {
    bool verbose = false;     // keep every tier, not only >= 2x
    bool stab_only = false;
};

/**
 * Attacker's moves against the defender's defense chart. Status moves are
 * never included. Each tier is sorted by move name.
 */
WeaknessGroups<MoveMatchup> matchup_direction(const Pokemon& attacker, const Pokemon& defender,
                                              const MatchupOptions& options);

struct MatchupReport {
    WeaknessGroups<MoveMatchup> attacker_vs_defender;
    WeaknessGroups<MoveMatchup> defender_vs_attacker;
};

MatchupReport matchup_report(const Pokemon& attacker, const Pokemon& defender,
                             const MatchupOptions& options);

} // namespace dexref
