/**
 * dexref - Resource Store
 *
 * Read-only row queries over the locally cached ruleset data.
 *
 * ResourceStore is the handle the resolvers are given. JsonResourceStore
 * implements it over a dataset file produced by the fetch step, loaded once
 * and immutable afterwards, so concurrent readers are safe.
 */

#pragma once

#include "records.hpp"
#include <map>
#include <unordered_map>
#include <nlohmann/json_fwd.hpp>

namespace dexref {

class GenerationResolver;

/**
 * ResourceStore - Query interface consumed by the core.
 *
 * Lookups return nullptr when no row matches. Change queries return rows
 * with generation >= min_generation, ascending by generation.
 */
class ResourceStore {
public:
    virtual ~ResourceStore() = default;

    virtual const GameRow* select_game(const std::string& name) const = 0;
    virtual std::vector<GameRow> select_games() const = 0;

    virtual const MoveRow* select_move_by_name(const std::string& name) const = 0;
    virtual const TypeRow* select_type_by_name(const std::string& name) const = 0;
    virtual const AbilityRow* select_ability_by_name(const std::string& name) const = 0;
    virtual const PokemonRow* select_pokemon_by_name(const std::string& name) const = 0;
    virtual const SpeciesRow* select_species_by_name(const std::string& name) const = 0;
    virtual const SpeciesRow* select_species_by_id(RowID id) const = 0;
    virtual const EvolutionRow* select_evolution_by_id(RowID id) const = 0;

    virtual std::vector<MoveChangeRow> select_move_changes(RowID move_id, Generation min_generation) const = 0;
    virtual std::vector<TypeChangeRow> select_type_changes(RowID type_id, Generation min_generation) const = 0;
    virtual std::vector<AbilityChangeRow> select_ability_changes(RowID ability_id, Generation min_generation) const = 0;
    virtual std::vector<PokemonTypeChangeRow> select_pokemon_type_changes(RowID pokemon_id, Generation min_generation) const = 0;

    /**
     * Learnable moves recorded at or before max_generation, ascending by generation.
     */
    virtual std::vector<PokemonMoveRow> select_learn_moves(RowID pokemon_id, Generation max_generation) const = 0;

    virtual std::vector<PokemonAbilityRow> select_pokemon_abilities(RowID pokemon_id) const = 0;

    /**
     * All names of a resource, ordered by id (games by play order).
     */
    virtual std::vector<std::string> select_all_names(ResourceKind kind) const = 0;
};

/**
 * Compare two "major.minor.patch" versions at the major.minor level.
 *
 * Returns nullopt if either string is not a valid version.
 */
std::optional<bool> versions_within_minor_level(const std::string& lhs, const std::string& rhs);

/**
 * JsonResourceStore - Dataset-file backed store.
 *
 * Games are loaded first: change, learn-move and base rows may carry an
 * upstream tag (a version group name or a generation reference URL) instead
 * of an integer generation, and are normalised against the games table.
 */
class JsonResourceStore : public ResourceStore {
public:
    JsonResourceStore();
    ~JsonResourceStore() override = default;

    /**
     * Load a dataset from a JSON file. Returns false and logs the reason on failure.
     */
    bool load_from_json(const std::string& filepath);

    /**
     * Load a dataset from JSON text.
     */
    bool load_from_string(const std::string& text);

    /**
     * Load a parsed dataset document, replacing any previous contents.
     *
     * When check_version is set, the dataset's meta.version must match the
     * program version at the major.minor level.
     */
    bool load(const nlohmann::json& data, bool check_version = true);

    const std::string& dataset_version() const { return dataset_version_; }
    const std::string& last_error() const { return last_error_; }

    size_t pokemon_count() const { return pokemon_.size(); }
    size_t move_count() const { return moves_.size(); }

    // ResourceStore
    const GameRow* select_game(const std::string& name) const override;
    std::vector<GameRow> select_games() const override;

    const MoveRow* select_move_by_name(const std::string& name) const override;
    const TypeRow* select_type_by_name(const std::string& name) const override;
    const AbilityRow* select_ability_by_name(const std::string& name) const override;
    const PokemonRow* select_pokemon_by_name(const std::string& name) const override;
    const SpeciesRow* select_species_by_name(const std::string& name) const override;
    const SpeciesRow* select_species_by_id(RowID id) const override;
    const EvolutionRow* select_evolution_by_id(RowID id) const override;

    std::vector<MoveChangeRow> select_move_changes(RowID move_id, Generation min_generation) const override;
    std::vector<TypeChangeRow> select_type_changes(RowID type_id, Generation min_generation) const override;
    std::vector<AbilityChangeRow> select_ability_changes(RowID ability_id, Generation min_generation) const override;
    std::vector<PokemonTypeChangeRow> select_pokemon_type_changes(RowID pokemon_id, Generation min_generation) const override;

    std::vector<PokemonMoveRow> select_learn_moves(RowID pokemon_id, Generation max_generation) const override;
    std::vector<PokemonAbilityRow> select_pokemon_abilities(RowID pokemon_id) const override;

    std::vector<std::string> select_all_names(ResourceKind kind) const override;

private:
    /**
     * Rows keyed by id with a name index.
     */
    template <typename Row>
    class NamedTable {
    public:
        void insert(Row row) {
            name_index_[row.name] = row.id;
            rows_[row.id] = std::move(row);
        }

        const Row* by_id(RowID id) const {
            auto it = rows_.find(id);
            return it != rows_.end() ? &it->second : nullptr;
        }

        const Row* by_name(const std::string& name) const {
            auto it = name_index_.find(name);
            return it != name_index_.end() ? by_id(it->second) : nullptr;
        }

        std::vector<std::string> names() const {
            std::vector<std::string> result;
            result.reserve(rows_.size());
            for (const auto& entry : rows_) {
                result.push_back(entry.second.name);
            }
            return result;
        }

        size_t size() const { return rows_.size(); }

        void clear() {
            rows_.clear();
            name_index_.clear();
        }

    private:
        std::map<RowID, Row> rows_;
        std::unordered_map<std::string, RowID> name_index_;
    };

    std::string dataset_version_;
    std::string last_error_;

    std::vector<GameRow> games_;   // ordered by play order
    NamedTable<MoveRow> moves_;
    NamedTable<TypeRow> types_;
    NamedTable<AbilityRow> abilities_;
    NamedTable<SpeciesRow> species_;
    NamedTable<PokemonRow> pokemon_;
    std::map<RowID, EvolutionRow> evolutions_;

    std::unordered_map<RowID, std::vector<MoveChangeRow>> move_changes_;
    std::unordered_map<RowID, std::vector<TypeChangeRow>> type_changes_;
    std::unordered_map<RowID, std::vector<AbilityChangeRow>> ability_changes_;
    std::unordered_map<RowID, std::vector<PokemonTypeChangeRow>> pokemon_type_changes_;
    std::unordered_map<RowID, std::vector<PokemonMoveRow>> pokemon_moves_;
    std::unordered_map<RowID, std::vector<PokemonAbilityRow>> pokemon_abilities_;

    void clear();
    bool fail(const std::string& message);

    // Parse helpers
    std::optional<GameRow> parse_game(const nlohmann::json& row_json) const;
    std::optional<MoveRow> parse_move(const nlohmann::json& row_json, const GenerationResolver& resolver) const;
    std::optional<MoveChangeRow> parse_move_change(const nlohmann::json& row_json, const GenerationResolver& resolver) const;
    std::optional<TypeRow> parse_type(const nlohmann::json& row_json, const GenerationResolver& resolver) const;
    std::optional<TypeChangeRow> parse_type_change(const nlohmann::json& row_json, const GenerationResolver& resolver) const;
    std::optional<AbilityRow> parse_ability(const nlohmann::json& row_json, const GenerationResolver& resolver) const;
    std::optional<AbilityChangeRow> parse_ability_change(const nlohmann::json& row_json, const GenerationResolver& resolver) const;
    std::optional<SpeciesRow> parse_species(const nlohmann::json& row_json) const;
    std::optional<EvolutionRow> parse_evolution(const nlohmann::json& row_json) const;
    std::optional<PokemonRow> parse_pokemon(const nlohmann::json& row_json) const;
    std::optional<PokemonMoveRow> parse_pokemon_move(const nlohmann::json& row_json, const GenerationResolver& resolver) const;
    std::optional<PokemonAbilityRow> parse_pokemon_ability(const nlohmann::json& row_json) const;
    std::optional<PokemonTypeChangeRow> parse_pokemon_type_change(const nlohmann::json& row_json, const GenerationResolver& resolver) const;

    static DamageRelations parse_relations(const nlohmann::json& row_json);
    static std::vector<std::string> parse_type_list(const nlohmann::json& value);
};

} // namespace dexref
