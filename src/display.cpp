/**
 * dexref - Terminal Display Implementation
 */

#include "dexref/display.hpp"
#include <iomanip>
#include <sstream>

namespace dexref {

namespace {

const char* const RESET = "\x1b[0m";

int ansi_code(Color color) {
    switch (color) {
        case Color::HEADER: return 10;
        case Color::RED: return 160;
        case Color::ORANGE: return 172;
        case Color::YELLOW: return 184;
        case Color::GREEN: return 77;
        case Color::CYAN: return 43;
        case Color::BLUE: return 33;
        case Color::VIOLET: return 99;
        default: return 15;
    }
}

std::string foreground(Color color) {
    return "\x1b[38;5;" + std::to_string(ansi_code(color)) + "m";
}

std::string join(const std::vector<std::string>& items, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < items.size(); i++) {
        if (i > 0) result += separator;
        result += items[i];
    }
    return result;
}

std::string or_na(const std::optional<int>& value) {
    return value ? std::to_string(*value) : "N/A";
}

/**
 * One line per non-empty tier: "\n<tier>: <items>". "\nNone" when empty.
 */
template <typename T, typename Format>
std::string format_groups(const WeaknessGroups<T>& groups, Format format_item) {
    std::string output;

    for (size_t i = 0; i < WEAKNESS_TIER_COUNT; i++) {
        auto tier = static_cast<WeaknessTier>(i);
        const auto& items = groups.at(tier);
        if (items.empty()) continue;

        std::vector<std::string> formatted;
        for (const auto& item : items) {
            formatted.push_back(format_item(item, tier_color(tier)));
        }
        output += "\n" + std::string(to_string(tier)) + ": " + join(formatted, " ");
    }

    return output.empty() ? "\nNone" : output;
}

std::string render_chart(const TypeChart& chart, const Style& style) {
    std::string label = chart.label() + " " + to_string(chart.kind());
    auto groups = group_chart(chart);
    return style.bold(label, Color::HEADER) +
           format_groups(groups, [&](const std::string& type_name, Color color) {
               return style.paint(type_name, color);
           });
}

std::string render_move_groups(const WeaknessGroups<MoveMatchup>& groups, const Style& style) {
    return format_groups(groups, [&](const MoveMatchup& entry, Color color) {
        const std::string& damage_class = entry.move.damage_class;
        const char* marker = damage_class == "special" ? "s" : (damage_class == "physical" ? "p" : "?");
        std::string text = entry.move.name + "(" + marker + ")";
        return entry.stab ? style.underline(text, color) : style.paint(text, color);
    });
}

std::string render_header_line(const Pokemon& pokemon, const Style& style) {
    const PokemonSnapshot& snapshot = pokemon.snapshot;
    std::string line = style.bold(snapshot.display_name(), Color::HEADER);
    if (snapshot.nickname) line += " (" + snapshot.name + ")";
    line += " " + snapshot.primary_type;
    if (snapshot.secondary_type) line += " " + *snapshot.secondary_type;
    return line;
}

void render_step(std::ostringstream& out, const EvolutionStep& step, size_t depth, const Style& style) {
    std::vector<std::string> methods;
    for (const auto& method : step.methods) {
        methods.push_back(method.describe());
    }

    out << "\n" << std::string(depth * 2, ' ') << style.paint(step.name, Color::GREEN);
    if (!methods.empty()) {
        out << " " << style.paint(join(methods, " / "), Color::BLUE);
    }

    for (const auto& child : step.evolves_to) {
        render_step(out, child, depth + 1, style);
    }
}

} // namespace

// ============================================================================
// STYLE
// ============================================================================

Color rate(int value, int ceiling) {
    double number = value;
    double top = ceiling;
    if (number > top * 0.83) return Color::RED;
    if (number > top * 0.66) return Color::ORANGE;
    if (number > top * 0.50) return Color::YELLOW;
    if (number > top * 0.33) return Color::GREEN;
    if (number > top * 0.16) return Color::BLUE;
    return Color::VIOLET;
}

Color tier_color(WeaknessTier tier) {
    switch (tier) {
        case WeaknessTier::QUAD: return Color::RED;
        case WeaknessTier::DOUBLE: return Color::ORANGE;
        case WeaknessTier::NEUTRAL: return Color::GREEN;
        case WeaknessTier::HALF: return Color::CYAN;
        case WeaknessTier::QUARTER: return Color::BLUE;
        case WeaknessTier::ZERO: return Color::VIOLET;
        case WeaknessTier::OTHER: return Color::YELLOW;
        default: return Color::YELLOW;
    }
}

std::string Style::wrap(const std::string& text, const std::string& prefix) const {
    if (!color_enabled_) return text;
    return prefix + text + RESET;
}

std::string Style::paint(const std::string& text, Color color) const {
    return wrap(text, foreground(color));
}

std::string Style::bold(const std::string& text, Color color) const {
    return wrap(text, "\x1b[1m" + foreground(color));
}

std::string Style::underline(const std::string& text, Color color) const {
    return wrap(text, "\x1b[4m" + foreground(color));
}

std::string format_multiplier(float multiplier) {
    std::ostringstream out;
    out << multiplier;
    return out.str();
}

// ============================================================================
// RENDERERS
// ============================================================================

std::string render_stats(const Stats& stats, const Style& style) {
    // 200 bounds nearly every base stat; 720 is the highest total
    auto cell = [&](int value, int ceiling) {
        std::ostringstream padded;
        padded << std::left << std::setw(6) << value;
        return style.paint(padded.str(), rate(value, ceiling));
    };

    std::ostringstream total;
    total << std::left << std::setw(6) << stats.total();

    return "hp    atk   def   satk  sdef  spd   total\n" +
           cell(stats.hp, 200) + cell(stats.attack, 200) + cell(stats.defense, 200) +
           cell(stats.special_attack, 200) + cell(stats.special_defense, 200) +
           cell(stats.speed, 200) + style.bold(total.str(), rate(stats.total(), 720));
}

std::string render_pokemon(const Pokemon& pokemon, const Style& style) {
    const PokemonSnapshot& snapshot = pokemon.snapshot;

    std::vector<std::string> abilities;
    for (const auto& ability : snapshot.abilities) {
        abilities.push_back(ability.is_hidden ? ability.name + "(h)" : ability.name);
    }

    std::ostringstream out;
    out << render_header_line(pokemon, style) << " "
        << style.paint(to_string(snapshot.group), Color::YELLOW) << "\n"
        << join(abilities, " ") << "\n"
        << render_stats(snapshot.stats, style) << "\n"
        << "gen-" << snapshot.generation << "\n\n"
        << render_weaknesses(pokemon.defense_chart, style);
    return out.str();
}

std::string render_weaknesses(const TypeChart& defense, const Style& style) {
    return render_chart(defense, style);
}

std::string render_move_list(const Pokemon& pokemon, const Style& style) {
    std::ostringstream out;
    out << style.bold("moves", Color::HEADER);

    std::map<std::string, const LearnMove*> learned;
    for (const auto& learn : pokemon.snapshot.learn_moves) {
        learned[learn.name] = &learn;
    }

    for (const auto& move : pokemon.moves) {
        std::string text = move.name + " " + move.type + " " + move.damage_class;
        if (move.power) text += " " + std::to_string(*move.power);

        auto it = learned.find(move.name);
        if (it != learned.end()) {
            text += " [" + it->second->learn_method;
            if (it->second->learn_method == "level-up") {
                text += " " + std::to_string(it->second->learn_level);
            }
            text += "]";
        }

        Color color = pokemon.snapshot.has_type(move.type) ? Color::GREEN : Color::CYAN;
        out << "\n" << style.paint(text, color);
    }

    return out.str();
}

std::string render_evolution(const EvolutionStep& root, const Style& style) {
    std::ostringstream out;
    out << style.bold("evolution", Color::HEADER);
    render_step(out, root, 0, style);
    return out.str();
}

std::string render_type_pair(const TypePairCharts& types, const Style& style) {
    std::ostringstream out;
    out << render_chart(types.primary_offense, style) << "\n\n";
    if (types.secondary_offense) {
        out << render_chart(*types.secondary_offense, style) << "\n\n";
    }
    out << render_chart(types.defense, style);
    return out.str();
}

std::string render_move(const MoveSnapshot& move, const Style& style) {
    std::ostringstream stats;
    stats << "power: " << style.paint(or_na(move.power), Color::RED)
          << "  accuracy: " << style.paint(or_na(move.accuracy), Color::GREEN)
          << "  pp: " << style.paint(or_na(move.pp), Color::BLUE);

    std::ostringstream out;
    out << style.bold(move.name, Color::HEADER) << "\n"
        << move.type << " " << move.damage_class << "\n"
        << stats.str() << "\n"
        << move.effect_text();
    return out.str();
}

std::string render_ability(const AbilitySnapshot& ability, const Style& style) {
    return style.bold(ability.name, Color::HEADER) + "\n" + ability.effect;
}

std::string render_matchup(const Pokemon& attacker, const Pokemon& defender,
                           const MatchupReport& report, const Style& style) {
    std::ostringstream out;
    out << render_header_line(defender, style) << "\n"
        << render_stats(defender.snapshot.stats, style) << "\n"
        << render_header_line(attacker, style) << "\n"
        << render_stats(attacker.snapshot.stats, style) << "\n\n"
        << style.bold(attacker.name() + "'s moves vs " + defender.name(), Color::HEADER)
        << render_move_groups(report.attacker_vs_defender, style) << "\n\n"
        << style.bold(defender.name() + "'s moves vs " + attacker.name(), Color::HEADER)
        << render_move_groups(report.defender_vs_attacker, style);
    return out.str();
}

std::string render_coverage(const CoverageReport& report, const Style& style) {
    std::ostringstream out;

    out << style.bold("offense", Color::HEADER);
    for (const auto& entry : report.offense) {
        std::vector<std::string> labels;
        for (const auto& member : entry.second) {
            labels.push_back(member.pokemon + "(" + join(member.via_types, " ") + ")");
        }
        Color color = labels.empty() ? Color::RED : Color::GREEN;
        out << "\n" << style.paint(entry.first, color) << ": " << join(labels, " ");
    }

    out << "\n\n" << style.bold("defense", Color::HEADER);
    for (const auto& entry : report.defense) {
        std::vector<std::string> labels;
        for (const auto& member : entry.second) {
            labels.push_back(member.pokemon + "(" + format_multiplier(member.multiplier) + ")");
        }
        Color color = labels.empty() ? Color::RED : Color::GREEN;
        out << "\n" << style.paint(entry.first, color) << ": " << join(labels, " ");
    }

    return out.str();
}

} // namespace dexref
