/**
 * Shared dataset for the tests.
 *
 * A small slice of the real ruleset: five games out of play order, a
 * handful of types with one historical chart change, moves and abilities
 * with historical values tagged the three ways upstream tags them, and
 * Pokémon introduced in different generations.
 */

#pragma once

#include "dexref/custom.hpp"
#include "dexref/resource_store.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace dexref_test {

inline const char* dataset_json() {
    return R"JSON({
  "meta": {"version": "0.4.2"},
  "games": [
    {"id": 8, "name": "sword-shield", "order": 8, "generation": 8},
    {"id": 1, "name": "red-blue", "order": 1, "generation": 1},
    {"id": 2, "name": "gold-silver", "order": 2, "generation": "https://pokeapi.co/api/v2/generation/2/"},
    {"id": 3, "name": "ruby-sapphire", "order": 3, "generation": "generation-iii"},
    {"id": 6, "name": "x-y", "order": 6, "generation": 6}
  ],
  "types": [
    {"id": 1, "name": "normal", "generation": 1,
     "half_damage_to": ["rock", "steel"], "no_damage_to": ["ghost"],
     "double_damage_from": ["fighting"], "no_damage_from": ["ghost"]},
    {"id": 5, "name": "ground", "generation": 1,
     "double_damage_to": ["fire", "electric", "poison", "rock", "steel"],
     "half_damage_to": ["grass", "bug"], "no_damage_to": ["flying"],
     "double_damage_from": ["water", "grass", "ice"],
     "half_damage_from": ["poison", "rock"], "no_damage_from": ["electric"]},
    {"id": 6, "name": "rock", "generation": 1,
     "double_damage_to": ["fire", "ice", "flying", "bug"],
     "half_damage_to": ["fighting", "ground", "steel"],
     "double_damage_from": ["water", "grass", "fighting", "ground", "steel"],
     "half_damage_from": ["normal", "fire", "poison", "flying"]},
    {"id": 8, "name": "ghost", "generation": 1,
     "double_damage_to": ["psychic", "ghost"], "half_damage_to": ["dark"], "no_damage_to": ["normal"],
     "double_damage_from": ["ghost", "dark"], "half_damage_from": ["poison", "bug"],
     "no_damage_from": ["normal", "fighting"]},
    {"id": 10, "name": "fire", "generation": 1,
     "double_damage_to": ["grass", "ice", "bug", "steel"],
     "half_damage_to": ["fire", "water", "rock", "dragon"],
     "double_damage_from": ["water", "ground", "rock"],
     "half_damage_from": ["fire", "grass", "ice", "bug", "steel", "fairy"]},
    {"id": 11, "name": "water", "generation": 1,
     "double_damage_to": ["fire", "ground", "rock"],
     "half_damage_to": ["water", "grass", "dragon"],
     "double_damage_from": ["electric", "grass"],
     "half_damage_from": ["fire", "water", "ice", "steel"]},
    {"id": 12, "name": "grass", "generation": 1,
     "double_damage_to": "water,ground,rock",
     "half_damage_to": "fire,grass,poison,flying,bug,dragon,steel",
     "double_damage_from": "fire,ice,poison,flying,bug",
     "half_damage_from": "water,electric,grass,ground"},
    {"id": 13, "name": "electric", "generation": 1,
     "double_damage_to": ["water", "flying"],
     "half_damage_to": ["electric", "grass", "dragon"], "no_damage_to": ["ground"],
     "double_damage_from": ["ground"],
     "half_damage_from": ["electric", "flying", "steel"]},
    {"id": 18, "name": "fairy", "generation": "https://pokeapi.co/api/v2/generation/6/",
     "double_damage_to": ["fighting", "dragon", "dark"],
     "half_damage_to": ["fire", "poison", "steel"],
     "double_damage_from": ["poison", "steel"],
     "half_damage_from": ["fighting", "bug", "dark"], "no_damage_from": ["dragon"]}
  ],
  "type_changes": [
    {"type_id": 8, "generation": 1,
     "double_damage_to": ["ghost"], "no_damage_to": ["normal", "psychic"],
     "double_damage_from": ["ghost"], "half_damage_from": ["poison", "bug"],
     "no_damage_from": ["normal", "fighting"]}
  ],
  "moves": [
    {"id": 33, "name": "tackle", "power": 40, "accuracy": 100, "pp": 35,
     "effect": "Inflicts regular damage.", "type": "normal", "damage_class": "physical", "generation": 1},
    {"id": 45, "name": "growl", "power": null, "accuracy": 100, "pp": 40,
     "effect": "Lowers the target's Attack by one stage.", "type": "normal", "damage_class": "status", "generation": 1},
    {"id": 57, "name": "surf", "power": 90, "accuracy": 100, "pp": 15,
     "effect": "Inflicts regular damage.", "type": "water", "damage_class": "special", "generation": 1},
    {"id": 85, "name": "thunderbolt", "power": 90, "accuracy": 100, "pp": 15, "effect_chance": 10,
     "effect": "Has a $effect_chance% chance to paralyze the target.",
     "type": "electric", "damage_class": "special", "generation": 1},
    {"id": 89, "name": "earthquake", "power": 100, "accuracy": 100, "pp": 10,
     "effect": "Inflicts regular damage.", "type": "ground", "damage_class": "physical", "generation": 1},
    {"id": 157, "name": "rock-slide", "power": 75, "accuracy": 90, "pp": 10, "effect_chance": 30,
     "effect": "Has a $effect_chance% chance to make the target flinch.",
     "type": "rock", "damage_class": "physical", "generation": 1},
    {"id": 172, "name": "flame-wheel", "power": 60, "accuracy": 100, "pp": 25,
     "effect": "Inflicts regular damage.", "type": "fire", "damage_class": "physical", "generation": 2},
    {"id": 247, "name": "shadow-ball", "power": 80, "accuracy": 100, "pp": 15,
     "effect": "Inflicts regular damage.", "type": "ghost", "damage_class": "special", "generation": 2},
    {"id": 585, "name": "moonblast", "power": 95, "accuracy": 100, "pp": 15,
     "effect": "Inflicts regular damage.", "type": "fairy", "damage_class": "special", "version_group": "x-y"},
    {"id": 999, "name": "broken-move", "generation": 1}
  ],
  "move_changes": [
    {"move_id": 33, "power": 50, "generation": 7},
    {"move_id": 33, "power": 35, "accuracy": 95, "generation": 5},
    {"move_id": 85, "power": 95, "version_group": "x-y"}
  ],
  "abilities": [
    {"id": 5, "name": "sturdy", "effect": "Prevents being knocked out from full HP.", "generation": 3},
    {"id": 9, "name": "static", "effect": "Contact may paralyze the attacker.", "generation": 3},
    {"id": 69, "name": "rock-head", "effect": "Protects against recoil damage.", "generation": 3}
  ],
  "ability_changes": [
    {"ability_id": 9, "effect": "Contact has a 30% chance to paralyze.", "generation": "generation-iv"}
  ],
  "species": [
    {"id": 25, "name": "pikachu", "evolution_id": 10},
    {"id": 26, "name": "raichu", "evolution_id": 10},
    {"id": 35, "name": "clefairy"},
    {"id": 74, "name": "geodude", "evolution_id": 20},
    {"id": 134, "name": "vaporeon"},
    {"id": 172, "name": "pichu", "is_baby": true, "evolution_id": 10},
    {"id": 700, "name": "sylveon"}
  ],
  "evolutions": [
    {"id": 10, "evolution": {
      "name": "pichu", "methods": [],
      "evolves_to": [{
        "name": "pikachu",
        "methods": [{"trigger": "level-up", "min_happiness": 220}],
        "evolves_to": [{
          "name": "raichu",
          "methods": [{"trigger": "use-item", "item": "thunder-stone"}],
          "evolves_to": []
        }]
      }]
    }}
  ],
  "pokemon": [
    {"id": 25, "name": "pikachu", "primary_type": "electric", "species_id": 25,
     "hp": 35, "attack": 55, "defense": 40, "special_attack": 50, "special_defense": 50, "speed": 90},
    {"id": 35, "name": "clefairy", "primary_type": "fairy", "species_id": 35,
     "hp": 70, "attack": 45, "defense": 48, "special_attack": 60, "special_defense": 65, "speed": 35},
    {"id": 74, "name": "geodude", "primary_type": "rock", "secondary_type": "ground", "species_id": 74,
     "hp": 40, "attack": 80, "defense": 100, "special_attack": 30, "special_defense": 30, "speed": 20},
    {"id": 134, "name": "vaporeon", "primary_type": "water", "species_id": 134,
     "hp": 130, "attack": 65, "defense": 60, "special_attack": 110, "special_defense": 95, "speed": 65},
    {"id": 700, "name": "sylveon", "primary_type": "fairy", "species_id": 700,
     "hp": 95, "attack": 65, "defense": 65, "special_attack": 110, "special_defense": 130, "speed": 60}
  ],
  "pokemon_type_changes": [
    {"pokemon_id": 35, "primary_type": "normal", "generation": 5}
  ],
  "pokemon_moves": [
    {"pokemon_id": 25, "name": "thunderbolt", "learn_method": "machine", "generation": 1},
    {"pokemon_id": 25, "name": "growl", "learn_method": "level-up", "learn_level": 1, "generation": 1},
    {"pokemon_id": 25, "name": "tackle", "learn_method": "level-up", "learn_level": 5, "generation": 1},
    {"pokemon_id": 25, "name": "thunderbolt", "learn_method": "level-up", "learn_level": 26, "version_group": "sword-shield"},
    {"pokemon_id": 35, "name": "growl", "learn_method": "level-up", "learn_level": 1, "generation": 1},
    {"pokemon_id": 35, "name": "tackle", "learn_method": "level-up", "learn_level": 1, "generation": 1},
    {"pokemon_id": 74, "name": "tackle", "learn_method": "level-up", "learn_level": 1, "generation": 1},
    {"pokemon_id": 74, "name": "rock-slide", "learn_method": "machine", "generation": 1},
    {"pokemon_id": 74, "name": "earthquake", "learn_method": "machine", "generation": 1},
    {"pokemon_id": 134, "name": "surf", "learn_method": "machine", "generation": 1},
    {"pokemon_id": 134, "name": "tackle", "learn_method": "level-up", "learn_level": 1, "generation": 1},
    {"pokemon_id": 134, "name": "growl", "learn_method": "level-up", "learn_level": 1, "generation": 1},
    {"pokemon_id": 700, "name": "moonblast", "learn_method": "level-up", "learn_level": 1, "version_group": "x-y"},
    {"pokemon_id": 700, "name": "tackle", "learn_method": "level-up", "learn_level": 1, "version_group": "x-y"}
  ],
  "pokemon_abilities": [
    {"pokemon_id": 25, "name": "lightning-rod", "is_hidden": true, "slot": 3},
    {"pokemon_id": 25, "name": "static", "slot": 1},
    {"pokemon_id": 74, "name": "rock-head", "slot": 1},
    {"pokemon_id": 74, "name": "sturdy", "slot": 2}
  ]
})JSON";
}

inline const char* custom_json() {
    return R"JSON({
  "pokemon": [
    {"nickname": "Sparky", "base": "pikachu", "generation": 3, "moves": ["thunderbolt", "tackle"]},
    {"nickname": "rocky", "base": "geodude", "generation": 8, "moves": [], "types": ["water"]}
  ]
})JSON";
}

/**
 * The fixture store, loaded once and shared read-only across tests.
 */
inline const dexref::JsonResourceStore& fixture_store() {
    static const dexref::JsonResourceStore store = [] {
        dexref::JsonResourceStore loaded;
        if (!loaded.load_from_string(dataset_json())) {
            throw std::runtime_error("Fixture dataset failed to load: " + loaded.last_error());
        }
        return loaded;
    }();
    return store;
}

inline dexref::CustomCollection fixture_custom() {
    dexref::CustomCollection custom;
    if (!custom.load(nlohmann::json::parse(custom_json()))) {
        throw std::runtime_error("Fixture custom Pokémon failed to load");
    }
    return custom;
}

} // namespace dexref_test
