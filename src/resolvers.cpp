/**
 * dexref - Entity Resolvers Implementation
 *
 * Change records are fetched from the target generation upward; the
 * override matcher picks the applicable one.
 */

#include "dexref/resolvers.hpp"
#include "dexref/custom.hpp"
#include "dexref/override_matcher.hpp"
#include "dexref/resource_store.hpp"
#include <map>

namespace dexref {

Resolution<MoveSnapshot> resolve_move(const std::string& name, Generation generation,
                                      const ResourceStore& store) {
    const MoveRow* row = store.select_move_by_name(name);
    if (!row) {
        return Resolution<MoveSnapshot>::failure(not_found("Move", name));
    }
    if (generation < row->generation) {
        return Resolution<MoveSnapshot>::failure(not_present(name, generation));
    }

    MoveSnapshot move;
    move.name = row->name;
    move.power = row->power;
    move.accuracy = row->accuracy;
    move.pp = row->pp;
    move.effect_chance = row->effect_chance;
    move.effect = row->effect;
    move.type = row->type;
    move.damage_class = row->damage_class;
    move.generation = generation;

    auto changes = store.select_move_changes(row->id, generation);
    auto past = match_override(generation, as_pasts<MovePast>(changes));
    if (past) {
        const MoveChangeRow& change = *past;
        if (change.power) move.power = change.power;
        if (change.accuracy) move.accuracy = change.accuracy;
        if (change.pp) move.pp = change.pp;
        if (change.effect_chance) move.effect_chance = change.effect_chance;
        if (change.effect) move.effect = *change.effect;
        if (change.type) move.type = *change.type;
    }

    return Resolution<MoveSnapshot>::success(std::move(move));
}

Resolution<TypeSnapshot> resolve_type(const std::string& name, Generation generation,
                                      const ResourceStore& store) {
    const TypeRow* row = store.select_type_by_name(name);
    if (!row) {
        return Resolution<TypeSnapshot>::failure(not_found("Type", name));
    }
    if (generation < row->generation) {
        return Resolution<TypeSnapshot>::failure(not_present(name, generation));
    }

    TypeSnapshot type;
    type.name = row->name;
    type.relations = row->relations;
    type.generation = generation;

    // All six relation sets are replaced together.
    auto changes = store.select_type_changes(row->id, generation);
    auto past = match_override(generation, as_pasts<TypePast>(changes));
    if (past) {
        type.relations = *past;
    }

    return Resolution<TypeSnapshot>::success(std::move(type));
}

Resolution<AbilitySnapshot> resolve_ability(const std::string& name, Generation generation,
                                            const ResourceStore& store) {
    const AbilityRow* row = store.select_ability_by_name(name);
    if (!row) {
        return Resolution<AbilitySnapshot>::failure(not_found("Ability", name));
    }
    if (generation < row->generation) {
        return Resolution<AbilitySnapshot>::failure(not_present(name, generation));
    }

    AbilitySnapshot ability;
    ability.name = row->name;
    ability.effect = row->effect;
    ability.generation = generation;

    auto changes = store.select_ability_changes(row->id, generation);
    auto past = match_override(generation, as_pasts<AbilityPast>(changes));
    if (past) {
        ability.effect = *past;
    }

    return Resolution<AbilitySnapshot>::success(std::move(ability));
}

Resolution<PokemonSnapshot> resolve_pokemon(const std::string& name, Generation generation,
                                            const ResourceStore& store) {
    const PokemonRow* row = store.select_pokemon_by_name(name);
    if (!row) {
        return Resolution<PokemonSnapshot>::failure(not_found("Pokémon", name));
    }

    const SpeciesRow* species = store.select_species_by_id(row->species_id);
    if (!species) {
        return Resolution<PokemonSnapshot>::failure(
            ResolutionErrorKind::MALFORMED_OVERRIDE,
            "Species " + std::to_string(row->species_id) + " of '" + name + "' is missing.");
    }

    // Species metadata does not say when a form appeared; a Pokémon with
    // nothing to learn by this generation is treated as absent.
    auto learn_rows = store.select_learn_moves(row->id, generation);
    if (learn_rows.empty()) {
        return Resolution<PokemonSnapshot>::failure(not_present(name, generation));
    }

    PokemonSnapshot pokemon;
    pokemon.name = row->name;
    pokemon.species = species->name;
    pokemon.primary_type = row->primary_type;
    pokemon.secondary_type = row->secondary_type;
    pokemon.stats = Stats{row->hp, row->attack, row->defense,
                          row->special_attack, row->special_defense, row->speed};
    pokemon.group = group_of(*species);
    pokemon.generation = generation;

    auto changes = store.select_pokemon_type_changes(row->id, generation);
    auto past = match_override(generation, as_pasts<PokemonTypePast>(changes));
    if (past) {
        pokemon.primary_type = past->first;
        pokemon.secondary_type = past->second;
    }

    // Rows arrive oldest first, so the latest generation's entry wins.
    std::map<std::string, LearnMove> learn_moves;
    for (const auto& learn : learn_rows) {
        learn_moves[learn.move_name] = LearnMove{learn.move_name, learn.learn_method, learn.learn_level};
    }
    for (auto& entry : learn_moves) {
        pokemon.learn_moves.push_back(std::move(entry.second));
    }

    for (const auto& ability : store.select_pokemon_abilities(row->id)) {
        pokemon.abilities.push_back(PokemonAbility{ability.ability_name, ability.is_hidden});
    }

    return Resolution<PokemonSnapshot>::success(std::move(pokemon));
}

Resolution<TypeChart> defense_chart_of(const PokemonSnapshot& snapshot, const ResourceStore& store) {
    auto primary = resolve_type(snapshot.primary_type, snapshot.generation, store);
    if (!primary.ok()) {
        return Resolution<TypeChart>::failure(primary.error);
    }

    TypeChart chart = primary.get().charts().defense;

    if (snapshot.secondary_type) {
        auto secondary = resolve_type(*snapshot.secondary_type, snapshot.generation, store);
        if (!secondary.ok()) {
            return Resolution<TypeChart>::failure(secondary.error);
        }
        chart = chart.combine(secondary.get().charts().defense);
    }

    return Resolution<TypeChart>::success(std::move(chart));
}

Resolution<TypePairCharts> resolve_type_pair(const std::string& primary,
                                             const std::optional<std::string>& secondary,
                                             Generation generation,
                                             const ResourceStore& store) {
    auto primary_type = resolve_type(primary, generation, store);
    if (!primary_type.ok()) {
        return Resolution<TypePairCharts>::failure(primary_type.error);
    }

    TypeCharts primary_charts = primary_type.get().charts();

    TypePairCharts result;
    result.primary = primary_type.get();
    result.primary_offense = primary_charts.offense;
    result.defense = primary_charts.defense;

    if (secondary) {
        auto secondary_type = resolve_type(*secondary, generation, store);
        if (!secondary_type.ok()) {
            return Resolution<TypePairCharts>::failure(secondary_type.error);
        }

        TypeCharts secondary_charts = secondary_type.get().charts();
        result.secondary = secondary_type.get();
        result.secondary_offense = secondary_charts.offense;
        result.defense = result.defense.combine(secondary_charts.defense);
    }

    return Resolution<TypePairCharts>::success(std::move(result));
}

Resolution<Pokemon> load_pokemon(const PokemonSnapshot& snapshot,
                                 const std::vector<std::string>& move_names,
                                 const ResourceStore& store) {
    auto chart = defense_chart_of(snapshot, store);
    if (!chart.ok()) {
        return Resolution<Pokemon>::failure(chart.error);
    }

    std::vector<std::string> names = move_names;
    if (names.empty()) {
        for (const auto& learn : snapshot.learn_moves) {
            names.push_back(learn.name);
        }
    }

    std::map<std::string, MoveSnapshot> moves;
    for (const auto& move_name : names) {
        auto move = resolve_move(move_name, snapshot.generation, store);
        if (!move.ok()) {
            return Resolution<Pokemon>::failure(move.error);
        }
        moves[move.get().name] = std::move(move.get());
    }

    Pokemon pokemon;
    pokemon.snapshot = snapshot;
    pokemon.defense_chart = std::move(chart.get());
    for (auto& entry : moves) {
        pokemon.moves.push_back(std::move(entry.second));
    }

    return Resolution<Pokemon>::success(std::move(pokemon));
}

Resolution<Pokemon> load_custom_pokemon(const CustomPokemon& custom, const ResourceStore& store) {
    auto base = resolve_pokemon(custom.base, custom.generation, store);
    if (!base.ok()) {
        return Resolution<Pokemon>::failure(base.error);
    }

    PokemonSnapshot snapshot = std::move(base.get());
    snapshot.nickname = custom.nickname;
    if (custom.types) {
        snapshot.primary_type = custom.types->first;
        snapshot.secondary_type = custom.types->second;
    }

    return load_pokemon(snapshot, custom.moves, store);
}

Resolution<Pokemon> load_pokemon(const std::string& name, Generation generation,
                                 const ResourceStore& store,
                                 const CustomCollection* custom) {
    if (custom) {
        const CustomPokemon* entry = custom->find_pokemon(name);
        if (entry) {
            return load_custom_pokemon(*entry, store);
        }
    }

    auto snapshot = resolve_pokemon(name, generation, store);
    if (!snapshot.ok()) {
        return Resolution<Pokemon>::failure(snapshot.error);
    }

    return load_pokemon(snapshot.get(), {}, store);
}

} // namespace dexref
