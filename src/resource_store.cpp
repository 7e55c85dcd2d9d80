/**
 * dexref - Resource Store Implementation
 *
 * Loads the dataset file using nlohmann/json. Rows that fail to parse are
 * skipped with a warning; a missing table or an incompatible dataset
 * version fails the whole load.
 */

#include "dexref/resource_store.hpp"
#include "dexref/dexref.hpp"
#include "dexref/generation.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

namespace dexref {

namespace {

const char* const REQUIRED_TABLES[] = {
    "games", "moves", "types", "abilities", "species", "pokemon"
};

std::optional<int> optional_int(const json& row_json, const char* key) {
    if (!row_json.contains(key) || row_json[key].is_null()) return std::nullopt;
    if (!row_json[key].is_number_integer()) return std::nullopt;
    return row_json[key].get<int>();
}

std::optional<std::string> optional_string(const json& row_json, const char* key) {
    if (!row_json.contains(key) || !row_json[key].is_string()) return std::nullopt;
    return row_json[key].get<std::string>();
}

// Field readers that fall back to the default on a null or mistyped value.
int int_or(const json& row_json, const char* key, int fallback) {
    return optional_int(row_json, key).value_or(fallback);
}

std::string string_or(const json& row_json, const char* key) {
    return optional_string(row_json, key).value_or("");
}

bool bool_or(const json& row_json, const char* key, bool fallback) {
    if (!row_json.contains(key) || !row_json[key].is_boolean()) return fallback;
    return row_json[key].get<bool>();
}

bool has_id(const json& row_json, const char* key) {
    return row_json.is_object() && row_json.contains(key) && row_json[key].is_number_integer();
}

/**
 * Generation of a row: an integer or reference under "generation", or a
 * game name under "version_group".
 */
std::optional<Generation> read_generation(const json& row_json, const GenerationResolver& resolver) {
    if (row_json.contains("generation")) {
        const auto& value = row_json["generation"];
        if (value.is_number_integer()) return value.get<int>();
        if (value.is_string()) {
            auto resolved = resolver.generation_of_reference(value.get<std::string>());
            if (resolved.ok()) return resolved.get();
        }
        return std::nullopt;
    }
    if (row_json.contains("version_group") && row_json["version_group"].is_string()) {
        auto resolved = resolver.generation_of_game(row_json["version_group"].get<std::string>());
        if (resolved.ok()) return resolved.get();
    }
    return std::nullopt;
}

template <typename Row>
void sort_by_generation(std::unordered_map<RowID, std::vector<Row>>& table) {
    for (auto& entry : table) {
        std::stable_sort(entry.second.begin(), entry.second.end(),
                         [](const Row& a, const Row& b) { return a.generation < b.generation; });
    }
}

template <typename Row>
std::vector<Row> changes_from(const std::unordered_map<RowID, std::vector<Row>>& table,
                              RowID id, Generation min_generation) {
    std::vector<Row> result;
    auto it = table.find(id);
    if (it == table.end()) return result;
    for (const auto& row : it->second) {
        if (row.generation >= min_generation) result.push_back(row);
    }
    return result;
}

} // namespace

std::optional<bool> versions_within_minor_level(const std::string& lhs, const std::string& rhs) {
    auto parse = [](const std::string& version) -> std::optional<std::pair<int, int>> {
        std::istringstream stream(version);
        std::string part;
        std::vector<int> parts;
        while (std::getline(stream, part, '.')) {
            if (part.empty() || !std::all_of(part.begin(), part.end(), [](char c) { return c >= '0' && c <= '9'; }) || part.size() > 6) {
                return std::nullopt;
            }
            parts.push_back(std::stoi(part));
        }
        if (parts.size() != 3) return std::nullopt;
        return std::make_pair(parts[0], parts[1]);
    };

    auto a = parse(lhs);
    auto b = parse(rhs);
    if (!a || !b) return std::nullopt;
    return *a == *b;
}

JsonResourceStore::JsonResourceStore() {}

// ============================================================================
// LOADING
// ============================================================================

bool JsonResourceStore::load_from_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return fail("Failed to open: " + filepath + ". Run the setup step to fetch the dataset.");
    }

    try {
        json data = json::parse(file);
        return load(data);
    } catch (const json::parse_error& e) {
        return fail(std::string("JSON parse error: ") + e.what());
    } catch (const std::exception& e) {
        return fail(std::string("Error: ") + e.what());
    }
}

bool JsonResourceStore::load_from_string(const std::string& text) {
    try {
        json data = json::parse(text);
        return load(data);
    } catch (const json::parse_error& e) {
        return fail(std::string("JSON parse error: ") + e.what());
    } catch (const std::exception& e) {
        return fail(std::string("Error: ") + e.what());
    }
}

bool JsonResourceStore::load(const json& data, bool check_version) {
    clear();

    if (!data.is_object()) {
        return fail("Dataset is not a JSON object");
    }

    if (data.contains("meta") && data["meta"].is_object()) {
        dataset_version_ = string_or(data["meta"], "version");
    }

    if (check_version) {
        auto compatible = versions_within_minor_level(dataset_version_, get_version());
        if (!compatible) {
            return fail("Dataset version '" + dataset_version_ + "' could not be read. Regenerate the dataset.");
        }
        if (!*compatible) {
            return fail("Dataset version " + dataset_version_ + " is incompatible with dexref " +
                        get_version() + ". Regenerate the dataset.");
        }
    }

    for (const char* table : REQUIRED_TABLES) {
        if (!data.contains(table) || !data[table].is_array()) {
            return fail(std::string("No '") + table + "' array found");
        }
    }

    try {
        int skipped = 0;

        // Games first: every other table may be tagged by game name.
        for (const auto& row_json : data["games"]) {
            auto row = parse_game(row_json);
            if (row) games_.push_back(std::move(*row)); else skipped++;
        }
        std::stable_sort(games_.begin(), games_.end(),
                         [](const GameRow& a, const GameRow& b) { return a.order < b.order; });

        GenerationResolver resolver(games_);

        for (const auto& row_json : data["moves"]) {
            auto row = parse_move(row_json, resolver);
            if (row) moves_.insert(std::move(*row)); else skipped++;
        }
        for (const auto& row_json : data["types"]) {
            auto row = parse_type(row_json, resolver);
            if (row) types_.insert(std::move(*row)); else skipped++;
        }
        for (const auto& row_json : data["abilities"]) {
            auto row = parse_ability(row_json, resolver);
            if (row) abilities_.insert(std::move(*row)); else skipped++;
        }
        for (const auto& row_json : data["species"]) {
            auto row = parse_species(row_json);
            if (row) species_.insert(std::move(*row)); else skipped++;
        }
        for (const auto& row_json : data["pokemon"]) {
            auto row = parse_pokemon(row_json);
            if (row) pokemon_.insert(std::move(*row)); else skipped++;
        }

        if (data.contains("evolutions") && data["evolutions"].is_array()) {
            for (const auto& row_json : data["evolutions"]) {
                auto row = parse_evolution(row_json);
                if (row) evolutions_[row->id] = std::move(*row); else skipped++;
            }
        }
        if (data.contains("move_changes") && data["move_changes"].is_array()) {
            for (const auto& row_json : data["move_changes"]) {
                auto row = parse_move_change(row_json, resolver);
                if (row) move_changes_[row->move_id].push_back(std::move(*row)); else skipped++;
            }
        }
        if (data.contains("type_changes") && data["type_changes"].is_array()) {
            for (const auto& row_json : data["type_changes"]) {
                auto row = parse_type_change(row_json, resolver);
                if (row) type_changes_[row->type_id].push_back(std::move(*row)); else skipped++;
            }
        }
        if (data.contains("ability_changes") && data["ability_changes"].is_array()) {
            for (const auto& row_json : data["ability_changes"]) {
                auto row = parse_ability_change(row_json, resolver);
                if (row) ability_changes_[row->ability_id].push_back(std::move(*row)); else skipped++;
            }
        }
        if (data.contains("pokemon_type_changes") && data["pokemon_type_changes"].is_array()) {
            for (const auto& row_json : data["pokemon_type_changes"]) {
                auto row = parse_pokemon_type_change(row_json, resolver);
                if (row) pokemon_type_changes_[row->pokemon_id].push_back(std::move(*row)); else skipped++;
            }
        }
        if (data.contains("pokemon_moves") && data["pokemon_moves"].is_array()) {
            for (const auto& row_json : data["pokemon_moves"]) {
                auto row = parse_pokemon_move(row_json, resolver);
                if (row) pokemon_moves_[row->pokemon_id].push_back(std::move(*row)); else skipped++;
            }
        }
        if (data.contains("pokemon_abilities") && data["pokemon_abilities"].is_array()) {
            for (const auto& row_json : data["pokemon_abilities"]) {
                auto row = parse_pokemon_ability(row_json);
                if (row) pokemon_abilities_[row->pokemon_id].push_back(std::move(*row)); else skipped++;
            }
        }

        sort_by_generation(move_changes_);
        sort_by_generation(type_changes_);
        sort_by_generation(ability_changes_);
        sort_by_generation(pokemon_type_changes_);
        sort_by_generation(pokemon_moves_);

        for (auto& entry : pokemon_abilities_) {
            std::stable_sort(entry.second.begin(), entry.second.end(),
                             [](const PokemonAbilityRow& a, const PokemonAbilityRow& b) {
                                 return a.slot < b.slot;
                             });
        }

        if (skipped > 0) {
            std::cerr << "[ResourceStore] Skipped " << skipped << " malformed rows" << std::endl;
        }

        return true;

    } catch (const json::exception& e) {
        return fail(std::string("Error: ") + e.what());
    }
}

void JsonResourceStore::clear() {
    last_error_.clear();
    dataset_version_.clear();
    games_.clear();
    moves_.clear();
    types_.clear();
    abilities_.clear();
    species_.clear();
    pokemon_.clear();
    evolutions_.clear();
    move_changes_.clear();
    type_changes_.clear();
    ability_changes_.clear();
    pokemon_type_changes_.clear();
    pokemon_moves_.clear();
    pokemon_abilities_.clear();
}

bool JsonResourceStore::fail(const std::string& message) {
    last_error_ = message;
    std::cerr << "[ResourceStore] " << message << std::endl;
    return false;
}

// ============================================================================
// ROW PARSING
// ============================================================================

std::optional<GameRow> JsonResourceStore::parse_game(const json& row_json) const {
    if (!has_id(row_json, "id")) return std::nullopt;

    GameRow row;
    row.id = row_json["id"].get<RowID>();
    row.name = string_or(row_json, "name");
    row.order = int_or(row_json, "order", static_cast<int>(row.id));

    // Games carry a generation number or reference, never a version group.
    auto generation = read_generation(row_json, GenerationResolver());
    if (row.name.empty() || !generation) return std::nullopt;
    row.generation = *generation;
    return row;
}

std::optional<MoveRow> JsonResourceStore::parse_move(const json& row_json, const GenerationResolver& resolver) const {
    if (!has_id(row_json, "id")) return std::nullopt;

    MoveRow row;
    row.id = row_json["id"].get<RowID>();
    row.name = string_or(row_json, "name");
    row.power = optional_int(row_json, "power");
    row.accuracy = optional_int(row_json, "accuracy");
    row.pp = optional_int(row_json, "pp");
    row.effect_chance = optional_int(row_json, "effect_chance");
    row.effect = string_or(row_json, "effect");
    row.type = string_or(row_json, "type");
    row.damage_class = string_or(row_json, "damage_class");

    auto generation = read_generation(row_json, resolver);
    if (row.name.empty() || row.type.empty() || !generation) return std::nullopt;
    row.generation = *generation;
    return row;
}

std::optional<MoveChangeRow> JsonResourceStore::parse_move_change(const json& row_json, const GenerationResolver& resolver) const {
    if (!has_id(row_json, "move_id")) return std::nullopt;

    MoveChangeRow row;
    row.move_id = row_json["move_id"].get<RowID>();
    row.power = optional_int(row_json, "power");
    row.accuracy = optional_int(row_json, "accuracy");
    row.pp = optional_int(row_json, "pp");
    row.effect_chance = optional_int(row_json, "effect_chance");
    row.effect = optional_string(row_json, "effect");
    row.type = optional_string(row_json, "type");

    auto generation = read_generation(row_json, resolver);
    if (!generation) return std::nullopt;
    row.generation = *generation;
    return row;
}

std::optional<TypeRow> JsonResourceStore::parse_type(const json& row_json, const GenerationResolver& resolver) const {
    if (!has_id(row_json, "id")) return std::nullopt;

    TypeRow row;
    row.id = row_json["id"].get<RowID>();
    row.name = string_or(row_json, "name");
    row.relations = parse_relations(row_json);

    auto generation = read_generation(row_json, resolver);
    if (row.name.empty() || !generation) return std::nullopt;
    row.generation = *generation;
    return row;
}

std::optional<TypeChangeRow> JsonResourceStore::parse_type_change(const json& row_json, const GenerationResolver& resolver) const {
    if (!has_id(row_json, "type_id")) return std::nullopt;

    TypeChangeRow row;
    row.type_id = row_json["type_id"].get<RowID>();
    row.relations = parse_relations(row_json);

    auto generation = read_generation(row_json, resolver);
    if (!generation) return std::nullopt;
    row.generation = *generation;
    return row;
}

std::optional<AbilityRow> JsonResourceStore::parse_ability(const json& row_json, const GenerationResolver& resolver) const {
    if (!has_id(row_json, "id")) return std::nullopt;

    AbilityRow row;
    row.id = row_json["id"].get<RowID>();
    row.name = string_or(row_json, "name");
    row.effect = string_or(row_json, "effect");

    auto generation = read_generation(row_json, resolver);
    if (row.name.empty() || !generation) return std::nullopt;
    row.generation = *generation;
    return row;
}

std::optional<AbilityChangeRow> JsonResourceStore::parse_ability_change(const json& row_json, const GenerationResolver& resolver) const {
    if (!has_id(row_json, "ability_id")) return std::nullopt;

    AbilityChangeRow row;
    row.ability_id = row_json["ability_id"].get<RowID>();
    row.effect = string_or(row_json, "effect");

    auto generation = read_generation(row_json, resolver);
    if (!generation) return std::nullopt;
    row.generation = *generation;
    return row;
}

std::optional<SpeciesRow> JsonResourceStore::parse_species(const json& row_json) const {
    if (!has_id(row_json, "id")) return std::nullopt;

    SpeciesRow row;
    row.id = row_json["id"].get<RowID>();
    row.name = string_or(row_json, "name");
    row.is_baby = bool_or(row_json, "is_baby", false);
    row.is_legendary = bool_or(row_json, "is_legendary", false);
    row.is_mythical = bool_or(row_json, "is_mythical", false);
    if (has_id(row_json, "evolution_id")) {
        row.evolution_id = row_json["evolution_id"].get<RowID>();
    }

    if (row.name.empty()) return std::nullopt;
    return row;
}

std::optional<EvolutionRow> JsonResourceStore::parse_evolution(const json& row_json) const {
    if (!has_id(row_json, "id") || !row_json.contains("evolution")) return std::nullopt;

    EvolutionRow row;
    row.id = row_json["id"].get<RowID>();

    // Chains are stored serialized; accept either the text or the object.
    const auto& evolution = row_json["evolution"];
    if (evolution.is_string()) {
        row.evolution = evolution.get<std::string>();
    } else if (evolution.is_object()) {
        row.evolution = evolution.dump();
    } else {
        return std::nullopt;
    }
    return row;
}

std::optional<PokemonRow> JsonResourceStore::parse_pokemon(const json& row_json) const {
    if (!has_id(row_json, "id") || !has_id(row_json, "species_id")) return std::nullopt;

    PokemonRow row;
    row.id = row_json["id"].get<RowID>();
    row.name = string_or(row_json, "name");
    row.primary_type = string_or(row_json, "primary_type");
    row.secondary_type = optional_string(row_json, "secondary_type");
    row.hp = int_or(row_json, "hp", 0);
    row.attack = int_or(row_json, "attack", 0);
    row.defense = int_or(row_json, "defense", 0);
    row.special_attack = int_or(row_json, "special_attack", 0);
    row.special_defense = int_or(row_json, "special_defense", 0);
    row.speed = int_or(row_json, "speed", 0);
    row.species_id = row_json["species_id"].get<RowID>();

    if (row.name.empty() || row.primary_type.empty()) return std::nullopt;
    return row;
}

std::optional<PokemonMoveRow> JsonResourceStore::parse_pokemon_move(const json& row_json, const GenerationResolver& resolver) const {
    if (!has_id(row_json, "pokemon_id")) return std::nullopt;

    PokemonMoveRow row;
    row.pokemon_id = row_json["pokemon_id"].get<RowID>();
    row.move_name = string_or(row_json, "name");
    row.learn_method = string_or(row_json, "learn_method");
    row.learn_level = int_or(row_json, "learn_level", 0);

    auto generation = read_generation(row_json, resolver);
    if (row.move_name.empty() || !generation) return std::nullopt;
    row.generation = *generation;
    return row;
}

std::optional<PokemonAbilityRow> JsonResourceStore::parse_pokemon_ability(const json& row_json) const {
    if (!has_id(row_json, "pokemon_id")) return std::nullopt;

    PokemonAbilityRow row;
    row.pokemon_id = row_json["pokemon_id"].get<RowID>();
    row.ability_name = string_or(row_json, "name");
    row.is_hidden = bool_or(row_json, "is_hidden", false);
    row.slot = int_or(row_json, "slot", 0);

    if (row.ability_name.empty()) return std::nullopt;
    return row;
}

std::optional<PokemonTypeChangeRow> JsonResourceStore::parse_pokemon_type_change(const json& row_json, const GenerationResolver& resolver) const {
    if (!has_id(row_json, "pokemon_id")) return std::nullopt;

    PokemonTypeChangeRow row;
    row.pokemon_id = row_json["pokemon_id"].get<RowID>();
    row.primary_type = string_or(row_json, "primary_type");
    row.secondary_type = optional_string(row_json, "secondary_type");

    auto generation = read_generation(row_json, resolver);
    if (row.primary_type.empty() || !generation) return std::nullopt;
    row.generation = *generation;
    return row;
}

DamageRelations JsonResourceStore::parse_relations(const json& row_json) {
    DamageRelations relations;
    if (row_json.contains("no_damage_to")) relations.no_damage_to = parse_type_list(row_json["no_damage_to"]);
    if (row_json.contains("half_damage_to")) relations.half_damage_to = parse_type_list(row_json["half_damage_to"]);
    if (row_json.contains("double_damage_to")) relations.double_damage_to = parse_type_list(row_json["double_damage_to"]);
    if (row_json.contains("no_damage_from")) relations.no_damage_from = parse_type_list(row_json["no_damage_from"]);
    if (row_json.contains("half_damage_from")) relations.half_damage_from = parse_type_list(row_json["half_damage_from"]);
    if (row_json.contains("double_damage_from")) relations.double_damage_from = parse_type_list(row_json["double_damage_from"]);
    return relations;
}

std::vector<std::string> JsonResourceStore::parse_type_list(const json& value) {
    std::vector<std::string> types;

    if (value.is_array()) {
        for (const auto& t : value) {
            if (t.is_string()) types.push_back(t.get<std::string>());
        }
    } else if (value.is_string()) {
        // Comma-joined list
        std::istringstream stream(value.get<std::string>());
        std::string part;
        while (std::getline(stream, part, ',')) {
            if (!part.empty()) types.push_back(part);
        }
    }

    return types;
}

// ============================================================================
// QUERIES
// ============================================================================

const GameRow* JsonResourceStore::select_game(const std::string& name) const {
    for (const auto& game : games_) {
        if (game.name == name) return &game;
    }
    return nullptr;
}

std::vector<GameRow> JsonResourceStore::select_games() const {
    return games_;
}

const MoveRow* JsonResourceStore::select_move_by_name(const std::string& name) const {
    return moves_.by_name(name);
}

const TypeRow* JsonResourceStore::select_type_by_name(const std::string& name) const {
    return types_.by_name(name);
}

const AbilityRow* JsonResourceStore::select_ability_by_name(const std::string& name) const {
    return abilities_.by_name(name);
}

const PokemonRow* JsonResourceStore::select_pokemon_by_name(const std::string& name) const {
    return pokemon_.by_name(name);
}

const SpeciesRow* JsonResourceStore::select_species_by_name(const std::string& name) const {
    return species_.by_name(name);
}

const SpeciesRow* JsonResourceStore::select_species_by_id(RowID id) const {
    return species_.by_id(id);
}

const EvolutionRow* JsonResourceStore::select_evolution_by_id(RowID id) const {
    auto it = evolutions_.find(id);
    return it != evolutions_.end() ? &it->second : nullptr;
}

std::vector<MoveChangeRow> JsonResourceStore::select_move_changes(RowID move_id, Generation min_generation) const {
    return changes_from(move_changes_, move_id, min_generation);
}

std::vector<TypeChangeRow> JsonResourceStore::select_type_changes(RowID type_id, Generation min_generation) const {
    return changes_from(type_changes_, type_id, min_generation);
}

std::vector<AbilityChangeRow> JsonResourceStore::select_ability_changes(RowID ability_id, Generation min_generation) const {
    return changes_from(ability_changes_, ability_id, min_generation);
}

std::vector<PokemonTypeChangeRow> JsonResourceStore::select_pokemon_type_changes(RowID pokemon_id, Generation min_generation) const {
    return changes_from(pokemon_type_changes_, pokemon_id, min_generation);
}

std::vector<PokemonMoveRow> JsonResourceStore::select_learn_moves(RowID pokemon_id, Generation max_generation) const {
    std::vector<PokemonMoveRow> result;
    auto it = pokemon_moves_.find(pokemon_id);
    if (it == pokemon_moves_.end()) return result;
    for (const auto& row : it->second) {
        if (row.generation <= max_generation) result.push_back(row);
    }
    return result;
}

std::vector<PokemonAbilityRow> JsonResourceStore::select_pokemon_abilities(RowID pokemon_id) const {
    auto it = pokemon_abilities_.find(pokemon_id);
    if (it == pokemon_abilities_.end()) return {};
    return it->second;
}

std::vector<std::string> JsonResourceStore::select_all_names(ResourceKind kind) const {
    switch (kind) {
        case ResourceKind::POKEMON: return pokemon_.names();
        case ResourceKind::MOVES: return moves_.names();
        case ResourceKind::ABILITIES: return abilities_.names();
        case ResourceKind::TYPES: return types_.names();
        case ResourceKind::SPECIES: return species_.names();
        case ResourceKind::GAMES: {
            std::vector<std::string> names;
            for (const auto& game : games_) names.push_back(game.name);
            return names;
        }
        default: return {};
    }
}

} // namespace dexref
