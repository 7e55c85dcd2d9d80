/**
 * dexref - Stored Records
 *
 * Row-level shapes held by the resource store. Records are immutable once
 * loaded; the resolvers only ever derive transient snapshots from them.
 *
 * Base records carry the generation an entity was introduced in. Change
 * records carry the generation their override is tagged with upstream.
 */

#pragma once

#include "types.hpp"

namespace dexref {

/**
 * The six damage relation sets of a type.
 *
 * "to" sets describe the type attacking, "from" sets describe it defending.
 */
struct DamageRelations {
    std::vector<std::string> no_damage_to;
    std::vector<std::string> half_damage_to;
    std::vector<std::string> double_damage_to;
    std::vector<std::string> no_damage_from;
    std::vector<std::string> half_damage_from;
    std::vector<std::string> double_damage_from;

    bool operator==(const DamageRelations& other) const {
        return no_damage_to == other.no_damage_to &&
               half_damage_to == other.half_damage_to &&
               double_damage_to == other.double_damage_to &&
               no_damage_from == other.no_damage_from &&
               half_damage_from == other.half_damage_from &&
               double_damage_from == other.double_damage_from;
    }
};

struct GameRow {
    RowID id = 0;
    std::string name;
    int order = 0;
    Generation generation = 0;
};

struct MoveRow {
    RowID id = 0;
    std::string name;
    std::optional<int> power;
    std::optional<int> accuracy;
    std::optional<int> pp;
    std::optional<int> effect_chance;
    std::string effect;
    std::string type;
    std::string damage_class;   // "physical", "special", "status"
    Generation generation = 0;
};

/**
 * Past move values. Unset fields fall back to the base move.
 */
struct MoveChangeRow {
    RowID move_id = 0;
    std::optional<int> power;
    std::optional<int> accuracy;
    std::optional<int> pp;
    std::optional<int> effect_chance;
    std::optional<std::string> effect;
    std::optional<std::string> type;
    Generation generation = 0;
};

struct TypeRow {
    RowID id = 0;
    std::string name;
    DamageRelations relations;
    Generation generation = 0;
};

/**
 * Past damage relations. Replaces all six relation sets at once.
 */
struct TypeChangeRow {
    RowID type_id = 0;
    DamageRelations relations;
    Generation generation = 0;
};

struct AbilityRow {
    RowID id = 0;
    std::string name;
    std::string effect;
    Generation generation = 0;
};

struct AbilityChangeRow {
    RowID ability_id = 0;
    std::string effect;
    Generation generation = 0;
};

struct SpeciesRow {
    RowID id = 0;
    std::string name;
    bool is_baby = false;
    bool is_legendary = false;
    bool is_mythical = false;
    std::optional<RowID> evolution_id;
};

/**
 * A whole evolution chain, serialized as JSON.
 */
struct EvolutionRow {
    RowID id = 0;
    std::string evolution;
};

struct PokemonRow {
    RowID id = 0;
    std::string name;
    std::string primary_type;
    std::optional<std::string> secondary_type;
    int hp = 0;
    int attack = 0;
    int defense = 0;
    int special_attack = 0;
    int special_defense = 0;
    int speed = 0;
    RowID species_id = 0;
};

struct PokemonMoveRow {
    RowID pokemon_id = 0;
    std::string move_name;
    std::string learn_method;   // "level-up", "machine", "egg", "tutor", ...
    int learn_level = 0;
    Generation generation = 0;
};

struct PokemonAbilityRow {
    RowID pokemon_id = 0;
    std::string ability_name;
    bool is_hidden = false;
    int slot = 0;
};

struct PokemonTypeChangeRow {
    RowID pokemon_id = 0;
    std::string primary_type;
    std::optional<std::string> secondary_type;
    Generation generation = 0;
};

} // namespace dexref
