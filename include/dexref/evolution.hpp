/**
 * dexref - Evolution Tree
 *
 * Evolution families are generation-independent and stored per chain as
 * serialized JSON. Each step owns its children.
 */

#pragma once

#include "resolution.hpp"
#include <nlohmann/json_fwd.hpp>

namespace dexref {

class ResourceStore;

/**
 * One way of reaching an evolution step. Unset fields are not a condition.
 */
struct EvolutionMethod {
    std::string trigger;
    std::optional<std::string> item;
    std::optional<int> gender;                 // 1 = female, 2 = male
    std::optional<std::string> held_item;
    std::optional<std::string> known_move;
    std::optional<std::string> known_move_type;
    std::optional<std::string> location;
    std::optional<int> min_level;
    std::optional<int> min_happiness;
    std::optional<int> min_beauty;
    std::optional<int> min_affection;
    std::optional<bool> needs_overworld_rain;
    std::optional<std::string> party_species;
    std::optional<std::string> party_type;
    std::optional<int> relative_physical_stats;
    std::optional<std::string> time_of_day;
    std::optional<std::string> trade_species;
    std::optional<bool> turn_upside_down;

    /**
     * Short description, e.g. "level-up level-16" or "use-item fire-stone".
     */
    std::string describe() const;
};

struct EvolutionStep {
    std::string name;
    std::vector<EvolutionMethod> methods;
    std::vector<EvolutionStep> evolves_to;

    size_t size() const {
        size_t count = 1;
        for (const auto& child : evolves_to) count += child.size();
        return count;
    }
};

/**
 * Decode a serialized chain. MALFORMED_OVERRIDE if the text is not a chain.
 */
Resolution<EvolutionStep> decode_evolution(const std::string& text);

nlohmann::json encode_evolution(const EvolutionStep& step);

/**
 * The whole evolution family of a species.
 */
Resolution<EvolutionStep> evolution_tree_of(const std::string& species_name, const ResourceStore& store);

} // namespace dexref
