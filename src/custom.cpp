/**
 * dexref - Custom Pokémon Implementation
 */

#include "dexref/custom.hpp"
#include "dexref/name_validator.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace dexref {

bool CustomCollection::load_from_json(const std::string& filepath) {
    if (!std::filesystem::exists(filepath)) {
        pokemon_.clear();
        return true;
    }

    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[CustomCollection] Failed to open: " << filepath << std::endl;
        return false;
    }

    try {
        json data = json::parse(file);
        return load(data);
    } catch (const json::parse_error& e) {
        std::cerr << "[CustomCollection] JSON parse error: " << e.what() << std::endl;
        return false;
    }
}

bool CustomCollection::load(const json& data) {
    pokemon_.clear();

    if (!data.contains("pokemon") || !data["pokemon"].is_array()) {
        std::cerr << "[CustomCollection] No 'pokemon' array found" << std::endl;
        return false;
    }

    try {
        for (const auto& entry : data["pokemon"]) {
            CustomPokemon custom;
            custom.nickname = entry.at("nickname").get<std::string>();
            custom.base = entry.at("base").get<std::string>();
            custom.generation = entry.at("generation").get<int>();

            if (entry.contains("moves") && entry["moves"].is_array()) {
                for (const auto& m : entry["moves"]) {
                    custom.moves.push_back(m.get<std::string>());
                }
            }

            if (entry.contains("types") && entry["types"].is_array() && !entry["types"].empty()) {
                const auto& types = entry["types"];
                std::optional<std::string> secondary;
                if (types.size() > 1 && types[1].is_string()) {
                    secondary = types[1].get<std::string>();
                }
                custom.types = std::make_pair(types[0].get<std::string>(), secondary);
            }

            pokemon_.push_back(std::move(custom));
        }
    } catch (const json::exception& e) {
        std::cerr << "[CustomCollection] Error: " << e.what() << std::endl;
        pokemon_.clear();
        return false;
    }

    return true;
}

bool CustomCollection::save_to_json(const std::string& filepath) const {
    json data;
    data["pokemon"] = json::array();

    for (const auto& custom : pokemon_) {
        json entry;
        entry["nickname"] = custom.nickname;
        entry["base"] = custom.base;
        entry["generation"] = custom.generation;
        entry["moves"] = custom.moves;
        if (custom.types) {
            json types = json::array({custom.types->first});
            if (custom.types->second) types.push_back(*custom.types->second);
            entry["types"] = types;
        }
        data["pokemon"].push_back(entry);
    }

    std::filesystem::path path(filepath);
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    std::ofstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[CustomCollection] Failed to write: " << filepath << std::endl;
        return false;
    }
    file << data.dump(2) << std::endl;
    return true;
}

const CustomPokemon* CustomCollection::find_pokemon(const std::string& nickname) const {
    std::string wanted = to_lower(nickname);
    for (const auto& custom : pokemon_) {
        if (to_lower(custom.nickname) == wanted) return &custom;
    }
    return nullptr;
}

void CustomCollection::add(CustomPokemon pokemon) {
    pokemon_.push_back(std::move(pokemon));
}

} // namespace dexref
