/**
 * dexref - Generation Resolver
 *
 * Maps game-version names and generation-tagged upstream references to
 * integer generations. A pure lookup over a table preloaded from the games.
 */

#pragma once

#include "records.hpp"
#include "resolution.hpp"
#include <unordered_map>

namespace dexref {

class ResourceStore;

class GenerationResolver {
public:
    GenerationResolver() = default;
    explicit GenerationResolver(const std::vector<GameRow>& games);

    static GenerationResolver from_store(const ResourceStore& store);

    /**
     * Generation a game version belongs to. NOT_FOUND for an unknown game.
     */
    Resolution<Generation> generation_of_game(const std::string& game_name) const;

    /**
     * Generation embedded in an upstream reference.
     *
     * Accepts a resource URL ending in "generation/<n>/", a generation name
     * such as "generation-iv", or a plain integer.
     */
    Resolution<Generation> generation_of_reference(const std::string& ref) const;

    /**
     * The game with the highest play order, if any game is known.
     */
    std::optional<GameRow> latest_game() const;

    Generation latest_generation() const;

    bool empty() const { return games_.empty(); }

private:
    std::vector<GameRow> games_;
    std::unordered_map<std::string, Generation> by_name_;
};

/**
 * Parse a lowercase roman numeral ("iv") to an integer. Returns nullopt on
 * anything that is not a well-formed numeral.
 */
std::optional<int> parse_roman_numeral(const std::string& numeral);

} // namespace dexref
