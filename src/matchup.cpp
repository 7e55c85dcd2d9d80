/**
 * dexref - Matchup Composer Implementation
 */

#include "dexref/matchup.hpp"
#include <algorithm>

namespace dexref {

WeaknessGroups<MoveMatchup> matchup_direction(const Pokemon& attacker, const Pokemon& defender,
                                              const MatchupOptions& options) {
    const TypeChart& defense = defender.defense_chart;
    const PokemonSnapshot& own = attacker.snapshot;

    auto groups = group_by_tier<MoveMatchup, MoveSnapshot>(
        attacker.moves,
        [&](const MoveSnapshot& move) -> std::optional<std::pair<MoveMatchup, float>> {
            if (!move.is_damaging()) return std::nullopt;

            // Moves of a type outside the roster have no multiplier.
            auto multiplier = defense.multiplier_of(move.type);
            if (!multiplier) return std::nullopt;

            bool stab = own.has_type(move.type);
            bool stab_qualified = !options.stab_only || stab;
            bool verbose_qualified = options.verbose || *multiplier >= 2.0f;
            if (!stab_qualified || !verbose_qualified) return std::nullopt;

            return std::make_pair(MoveMatchup{move, *multiplier, stab}, *multiplier);
        });

    for (auto& tier : groups.tiers) {
        std::stable_sort(tier.begin(), tier.end(), [](const MoveMatchup& a, const MoveMatchup& b) {
            return a.move.name < b.move.name;
        });
    }

    return groups;
}

MatchupReport matchup_report(const Pokemon& attacker, const Pokemon& defender,
                             const MatchupOptions& options) {
    MatchupReport report;
    report.attacker_vs_defender = matchup_direction(attacker, defender, options);
    report.defender_vs_attacker = matchup_direction(defender, attacker, options);
    return report;
}

} // namespace dexref
