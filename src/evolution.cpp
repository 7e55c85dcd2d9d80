/**
 * dexref - Evolution Tree Implementation
 */

#include "dexref/evolution.hpp"
#include "dexref/resource_store.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace dexref {

namespace {

template <typename T>
void read_optional(const json& method_json, const char* key, std::optional<T>& field) {
    if (method_json.contains(key) && !method_json[key].is_null()) {
        field = method_json[key].get<T>();
    }
}

template <typename T>
void write_optional(json& method_json, const char* key, const std::optional<T>& field) {
    if (field) method_json[key] = *field;
}

EvolutionMethod parse_method(const json& method_json) {
    EvolutionMethod method;
    method.trigger = method_json.value("trigger", "");
    read_optional(method_json, "item", method.item);
    read_optional(method_json, "gender", method.gender);
    read_optional(method_json, "held_item", method.held_item);
    read_optional(method_json, "known_move", method.known_move);
    read_optional(method_json, "known_move_type", method.known_move_type);
    read_optional(method_json, "location", method.location);
    read_optional(method_json, "min_level", method.min_level);
    read_optional(method_json, "min_happiness", method.min_happiness);
    read_optional(method_json, "min_beauty", method.min_beauty);
    read_optional(method_json, "min_affection", method.min_affection);
    read_optional(method_json, "needs_overworld_rain", method.needs_overworld_rain);
    read_optional(method_json, "party_species", method.party_species);
    read_optional(method_json, "party_type", method.party_type);
    read_optional(method_json, "relative_physical_stats", method.relative_physical_stats);
    read_optional(method_json, "time_of_day", method.time_of_day);
    read_optional(method_json, "trade_species", method.trade_species);
    read_optional(method_json, "turn_upside_down", method.turn_upside_down);
    return method;
}

EvolutionStep parse_step(const json& step_json) {
    EvolutionStep step;
    step.name = step_json.at("name").get<std::string>();

    if (step_json.contains("methods") && step_json["methods"].is_array()) {
        for (const auto& method_json : step_json["methods"]) {
            step.methods.push_back(parse_method(method_json));
        }
    }

    if (step_json.contains("evolves_to") && step_json["evolves_to"].is_array()) {
        for (const auto& child_json : step_json["evolves_to"]) {
            step.evolves_to.push_back(parse_step(child_json));
        }
    }

    return step;
}

} // namespace

std::string EvolutionMethod::describe() const {
    std::string output = trigger;

    if (item) output += " " + *item;
    if (gender) {
        const char* label = *gender == 1 ? "female" : (*gender == 2 ? "male" : "other");
        output += std::string(" gender-") + label;
    }
    if (held_item) output += " " + *held_item;
    if (known_move) output += " " + *known_move;
    if (known_move_type) output += " " + *known_move_type;
    if (location) output += " " + *location;
    if (min_level) output += " level-" + std::to_string(*min_level);
    if (min_happiness) output += " happiness-" + std::to_string(*min_happiness);
    if (min_beauty) output += " beauty-" + std::to_string(*min_beauty);
    if (min_affection) output += " affection-" + std::to_string(*min_affection);
    if (needs_overworld_rain && *needs_overworld_rain) output += " rain";
    if (party_species) output += " " + *party_species;
    if (party_type) output += " " + *party_type;
    if (relative_physical_stats) output += " physical-" + std::to_string(*relative_physical_stats);
    if (time_of_day) output += " " + *time_of_day;
    if (trade_species) output += " " + *trade_species;
    if (turn_upside_down && *turn_upside_down) output += " upside-down";

    return output;
}

Resolution<EvolutionStep> decode_evolution(const std::string& text) {
    try {
        json chain = json::parse(text);
        if (!chain.is_object()) {
            return Resolution<EvolutionStep>::failure(
                ResolutionErrorKind::MALFORMED_OVERRIDE, "Stored evolution chain is not an object.");
        }
        return Resolution<EvolutionStep>::success(parse_step(chain));
    } catch (const json::exception& e) {
        return Resolution<EvolutionStep>::failure(
            ResolutionErrorKind::MALFORMED_OVERRIDE,
            std::string("Stored evolution chain could not be read: ") + e.what());
    }
}

json encode_evolution(const EvolutionStep& step) {
    json step_json;
    step_json["name"] = step.name;

    step_json["methods"] = json::array();
    for (const auto& method : step.methods) {
        json method_json;
        method_json["trigger"] = method.trigger;
        write_optional(method_json, "item", method.item);
        write_optional(method_json, "gender", method.gender);
        write_optional(method_json, "held_item", method.held_item);
        write_optional(method_json, "known_move", method.known_move);
        write_optional(method_json, "known_move_type", method.known_move_type);
        write_optional(method_json, "location", method.location);
        write_optional(method_json, "min_level", method.min_level);
        write_optional(method_json, "min_happiness", method.min_happiness);
        write_optional(method_json, "min_beauty", method.min_beauty);
        write_optional(method_json, "min_affection", method.min_affection);
        write_optional(method_json, "needs_overworld_rain", method.needs_overworld_rain);
        write_optional(method_json, "party_species", method.party_species);
        write_optional(method_json, "party_type", method.party_type);
        write_optional(method_json, "relative_physical_stats", method.relative_physical_stats);
        write_optional(method_json, "time_of_day", method.time_of_day);
        write_optional(method_json, "trade_species", method.trade_species);
        write_optional(method_json, "turn_upside_down", method.turn_upside_down);
        step_json["methods"].push_back(method_json);
    }

    step_json["evolves_to"] = json::array();
    for (const auto& child : step.evolves_to) {
        step_json["evolves_to"].push_back(encode_evolution(child));
    }

    return step_json;
}

Resolution<EvolutionStep> evolution_tree_of(const std::string& species_name, const ResourceStore& store) {
    const SpeciesRow* species = store.select_species_by_name(species_name);
    if (!species) {
        return Resolution<EvolutionStep>::failure(not_found("Species", species_name));
    }

    // Species without a family evolve into nothing.
    if (!species->evolution_id) {
        EvolutionStep single;
        single.name = species->name;
        return Resolution<EvolutionStep>::success(std::move(single));
    }

    const EvolutionRow* row = store.select_evolution_by_id(*species->evolution_id);
    if (!row) {
        return Resolution<EvolutionStep>::failure(
            ResolutionErrorKind::MALFORMED_OVERRIDE,
            "Evolution chain " + std::to_string(*species->evolution_id) +
            " of species '" + species_name + "' is missing.");
    }

    return decode_evolution(row->evolution);
}

} // namespace dexref
