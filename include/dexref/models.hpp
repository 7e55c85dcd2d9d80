/**
 * dexref - Resolved Snapshots
 *
 * Transient entity views as they existed in one generation. Snapshots are
 * built fresh per query by the resolvers and never written back.
 */

#pragma once

#include "type_chart.hpp"

namespace dexref {

// ============================================================================
// MOVES, TYPES, ABILITIES
// ============================================================================

struct MoveSnapshot {
    std::string name;
    std::optional<int> power;
    std::optional<int> accuracy;
    std::optional<int> pp;
    std::optional<int> effect_chance;
    std::string effect;             // may embed $effect_chance
    std::string type;
    std::string damage_class;
    Generation generation = 0;

    bool is_damaging() const { return damage_class != "status"; }

    /**
     * Effect text with $effect_chance replaced by the chance, if any.
     */
    std::string effect_text() const {
        static const std::string placeholder = "$effect_chance";
        if (!effect_chance) return effect;

        std::string text = effect;
        std::string chance = std::to_string(*effect_chance);
        size_t pos = 0;
        while ((pos = text.find(placeholder, pos)) != std::string::npos) {
            text.replace(pos, placeholder.size(), chance);
            pos += chance.size();
        }
        return text;
    }
};

struct TypeSnapshot {
    std::string name;
    DamageRelations relations;
    Generation generation = 0;

    TypeCharts charts() const { return build_charts(name, relations); }
};

struct AbilitySnapshot {
    std::string name;
    std::string effect;
    Generation generation = 0;
};

// ============================================================================
// POKEMON
// ============================================================================

struct Stats {
    int hp = 0;
    int attack = 0;
    int defense = 0;
    int special_attack = 0;
    int special_defense = 0;
    int speed = 0;

    int total() const {
        return hp + attack + defense + special_attack + special_defense + speed;
    }
};

struct LearnMove {
    std::string name;
    std::string learn_method;
    int learn_level = 0;
};

struct PokemonAbility {
    std::string name;
    bool is_hidden = false;
};

struct PokemonSnapshot {
    std::string name;
    std::optional<std::string> nickname;    // custom Pokémon only
    std::string species;
    std::string primary_type;
    std::optional<std::string> secondary_type;
    Stats stats;
    PokemonGroup group = PokemonGroup::REGULAR;
    std::vector<LearnMove> learn_moves;     // sorted by move name
    std::vector<PokemonAbility> abilities;
    Generation generation = 0;

    const std::string& display_name() const { return nickname ? *nickname : name; }

    std::vector<std::string> types() const {
        std::vector<std::string> result{primary_type};
        if (secondary_type) result.push_back(*secondary_type);
        return result;
    }

    bool has_type(const std::string& type_name) const {
        return primary_type == type_name ||
               (secondary_type && *secondary_type == type_name);
    }
};

/**
 * A Pokémon ready for analysis: its snapshot, combined defense chart and
 * resolved move list.
 */
struct Pokemon {
    PokemonSnapshot snapshot;
    TypeChart defense_chart;
    std::vector<MoveSnapshot> moves;    // sorted by name

    const std::string& name() const { return snapshot.display_name(); }
};

/**
 * Charts for the type command: each type's offense chart and the combined
 * defense chart.
 */
struct TypePairCharts {
    TypeSnapshot primary;
    std::optional<TypeSnapshot> secondary;
    TypeChart primary_offense;
    std::optional<TypeChart> secondary_offense;
    TypeChart defense;
};

inline PokemonGroup group_of(const SpeciesRow& species) {
    if (species.is_mythical) return PokemonGroup::MYTHICAL;
    if (species.is_legendary) return PokemonGroup::LEGENDARY;
    if (species.is_baby) return PokemonGroup::BABY;
    return PokemonGroup::REGULAR;
}

} // namespace dexref
