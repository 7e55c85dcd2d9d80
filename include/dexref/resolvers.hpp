/**
 * dexref - Entity Resolvers
 *
 * Resolve a name to the entity as it existed in a target generation:
 *   1. look up the base record by exact name (NOT_FOUND otherwise)
 *   2. reject generations before its introduction
 *   3. apply the applicable historical override, if any
 *   4. for Pokémon, require at least one move learnable by that generation
 *
 * Names are matched as stored; case-folding and suggestions belong to
 * NameValidator.
 */

#pragma once

#include "models.hpp"
#include "resolution.hpp"

namespace dexref {

class ResourceStore;
class CustomCollection;
struct CustomPokemon;

Resolution<MoveSnapshot> resolve_move(const std::string& name, Generation generation,
                                      const ResourceStore& store);

Resolution<TypeSnapshot> resolve_type(const std::string& name, Generation generation,
                                      const ResourceStore& store);

Resolution<AbilitySnapshot> resolve_ability(const std::string& name, Generation generation,
                                            const ResourceStore& store);

Resolution<PokemonSnapshot> resolve_pokemon(const std::string& name, Generation generation,
                                            const ResourceStore& store);

/**
 * Combined defense chart of a snapshot, its types resolved at the
 * snapshot's own generation.
 */
Resolution<TypeChart> defense_chart_of(const PokemonSnapshot& snapshot, const ResourceStore& store);

/**
 * Offense charts of each type and the combined defense chart of the pair.
 */
Resolution<TypePairCharts> resolve_type_pair(const std::string& primary,
                                             const std::optional<std::string>& secondary,
                                             Generation generation,
                                             const ResourceStore& store);

/**
 * Attach the defense chart and resolved moves to a snapshot.
 *
 * With an empty move_names, every learnable move is resolved.
 */
Resolution<Pokemon> load_pokemon(const PokemonSnapshot& snapshot,
                                 const std::vector<std::string>& move_names,
                                 const ResourceStore& store);

/**
 * Resolve a custom Pokémon from its base at its own generation.
 */
Resolution<Pokemon> load_custom_pokemon(const CustomPokemon& custom, const ResourceStore& store);

/**
 * Resolve a name to a full Pokémon. Custom nicknames take precedence over
 * stored names when a collection is given.
 */
Resolution<Pokemon> load_pokemon(const std::string& name, Generation generation,
                                 const ResourceStore& store,
                                 const CustomCollection* custom = nullptr);

} // namespace dexref
