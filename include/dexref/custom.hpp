/**
 * dexref - Custom Pokémon
 *
 * User-defined Pokémon stored in a JSON file: a nickname for a base
 * species pinned to a generation, with a chosen move list and an optional
 * type override.
 */

#pragma once

#include "types.hpp"
#include <utility>
#include <nlohmann/json_fwd.hpp>

namespace dexref {

struct CustomPokemon {
    std::string nickname;
    std::string base;
    Generation generation = 0;
    std::vector<std::string> moves;
    std::optional<std::pair<std::string, std::optional<std::string>>> types;
};

class CustomCollection {
public:
    CustomCollection() = default;

    /**
     * Load from a file. A missing file is an empty collection.
     */
    bool load_from_json(const std::string& filepath);

    bool load(const nlohmann::json& data);

    /**
     * Write the collection back, creating parent directories as needed.
     */
    bool save_to_json(const std::string& filepath) const;

    /**
     * Case-insensitive nickname lookup.
     */
    const CustomPokemon* find_pokemon(const std::string& nickname) const;

    void add(CustomPokemon pokemon);

    const std::vector<CustomPokemon>& pokemon() const { return pokemon_; }
    size_t size() const { return pokemon_.size(); }

private:
    std::vector<CustomPokemon> pokemon_;
};

} // namespace dexref
