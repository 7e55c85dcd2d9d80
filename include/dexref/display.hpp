/**
 * dexref - Terminal Display
 *
 * Plain-text renderers for the CLI. Colour is ANSI 256 and optional; with
 * colour disabled every renderer produces plain text.
 */

#pragma once

#include "coverage.hpp"
#include "evolution.hpp"
#include "matchup.hpp"

namespace dexref {

enum class Color : uint8_t {
    HEADER,
    RED,
    ORANGE,
    YELLOW,
    GREEN,
    CYAN,
    BLUE,
    VIOLET
};

/**
 * Pick a colour for a value on a 0..ceiling scale, hottest first.
 */
Color rate(int value, int ceiling);

Color tier_color(WeaknessTier tier);

class Style {
public:
    explicit Style(bool color_enabled) : color_enabled_(color_enabled) {}

    bool color_enabled() const { return color_enabled_; }

    std::string paint(const std::string& text, Color color) const;
    std::string bold(const std::string& text, Color color) const;
    std::string underline(const std::string& text, Color color) const;

private:
    bool color_enabled_;

    std::string wrap(const std::string& text, const std::string& prefix) const;
};

std::string format_multiplier(float multiplier);

std::string render_pokemon(const Pokemon& pokemon, const Style& style);
std::string render_stats(const Stats& stats, const Style& style);
std::string render_weaknesses(const TypeChart& defense, const Style& style);
std::string render_move_list(const Pokemon& pokemon, const Style& style);
std::string render_evolution(const EvolutionStep& root, const Style& style);
std::string render_type_pair(const TypePairCharts& types, const Style& style);
std::string render_move(const MoveSnapshot& move, const Style& style);
std::string render_ability(const AbilitySnapshot& ability, const Style& style);
std::string render_matchup(const Pokemon& attacker, const Pokemon& defender,
                           const MatchupReport& report, const Style& style);
std::string render_coverage(const CoverageReport& report, const Style& style);

} // namespace dexref
