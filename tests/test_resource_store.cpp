/**
 * Tests for the Resource Store
 */

#include <sstream>
#include "dexref/dexref.hpp"

using namespace dexref;
using dexref_test::fixture_store;

namespace {

nlohmann::json fixture_document() {
    return nlohmann::json::parse(dexref_test::dataset_json());
}

} // namespace

// ============================================================================
// LOADING
// ============================================================================

TEST(ResourceStore, LoadsFixture) {
    const auto& store = fixture_store();

    TEST_ASSERT_EQ("0.4.2", store.dataset_version());
    TEST_ASSERT_EQ(5u, store.pokemon_count());
    TEST_ASSERT_TRUE(store.last_error().empty());
}

TEST(ResourceStore, SkipsMalformedRows) {
    const auto& store = fixture_store();

    // broken-move has no type
    TEST_ASSERT_NULL(store.select_move_by_name("broken-move"));
    TEST_ASSERT_EQ(9u, store.move_count());
}

TEST(ResourceStore, RejectsIncompatibleVersion) {
    auto data = fixture_document();
    data["meta"]["version"] = "0.3.9";

    JsonResourceStore store;
    TEST_ASSERT_FALSE(store.load(data));
    TEST_ASSERT(store.last_error().find("incompatible") != std::string::npos);
}

TEST(ResourceStore, RejectsUnreadableVersion) {
    auto data = fixture_document();
    data.erase("meta");

    JsonResourceStore store;
    TEST_ASSERT_FALSE(store.load(data));
    TEST_ASSERT_FALSE(store.last_error().empty());
}

TEST(ResourceStore, VersionCheckCanBeSkipped) {
    auto data = fixture_document();
    data["meta"]["version"] = "9.9.9";

    JsonResourceStore store;
    TEST_ASSERT_TRUE(store.load(data, false));
    TEST_ASSERT_NOT_NULL(store.select_pokemon_by_name("pikachu"));
}

TEST(ResourceStore, RejectsMissingTable) {
    auto data = fixture_document();
    data.erase("pokemon");

    JsonResourceStore store;
    TEST_ASSERT_FALSE(store.load(data));
    TEST_ASSERT(store.last_error().find("pokemon") != std::string::npos);
}

TEST(ResourceStore, RejectsInvalidJson) {
    JsonResourceStore store;
    TEST_ASSERT_FALSE(store.load_from_string("{ not json"));
    TEST_ASSERT_FALSE(store.load_from_json("/nonexistent/dexref/resource.json"));
}

TEST(ResourceStore, NullFieldsFallBackToDefaults) {
    auto data = fixture_document();
    for (auto& row : data["pokemon"]) {
        if (row["name"] == "geodude") row["hp"] = nullptr;
    }
    data["pokemon_moves"][0]["learn_level"] = nullptr;
    data["species"][0]["is_baby"] = "no";

    JsonResourceStore store;
    TEST_ASSERT_TRUE(store.load(data));

    const PokemonRow* geodude = store.select_pokemon_by_name("geodude");
    TEST_ASSERT_NOT_NULL(geodude);
    TEST_ASSERT_EQ(0, geodude->hp);
    TEST_ASSERT_NOT_NULL(store.select_pokemon_by_name("pikachu"));
    TEST_ASSERT_EQ(5u, store.pokemon_count());

    const PokemonRow* pikachu = store.select_pokemon_by_name("pikachu");
    TEST_ASSERT_FALSE(store.select_learn_moves(pikachu->id, 8).empty());
}

TEST(ResourceStore, NonStringVersionIsUnreadable) {
    JsonResourceStore store;
    TEST_ASSERT_FALSE(store.load_from_string(
        R"({"meta": {"version": 4}, "games": [], "moves": [], "types": [],
            "abilities": [], "species": [], "pokemon": []})"));
    TEST_ASSERT(store.last_error().find("could not be read") != std::string::npos);
}

TEST(ResourceStore, VersionComparison) {
    TEST_ASSERT_TRUE(*versions_within_minor_level("0.4.0", "0.4.7"));
    TEST_ASSERT_FALSE(*versions_within_minor_level("0.4.0", "0.5.0"));
    TEST_ASSERT_FALSE(*versions_within_minor_level("1.4.0", "0.4.0"));
    TEST_ASSERT_FALSE(versions_within_minor_level("0.4", "0.4.0").has_value());
    TEST_ASSERT_FALSE(versions_within_minor_level("a.b.c", "0.4.0").has_value());
}

// ============================================================================
// ROW NORMALISATION
// ============================================================================

TEST(ResourceStore, CommaJoinedRelations) {
    const TypeRow* grass = fixture_store().select_type_by_name("grass");
    TEST_ASSERT_NOT_NULL(grass);

    const auto& double_to = grass->relations.double_damage_to;
    TEST_ASSERT_EQ(3u, double_to.size());
    TEST_ASSERT_EQ("water", double_to[0]);
    TEST_ASSERT_EQ("rock", double_to[2]);
    TEST_ASSERT_EQ(4u, grass->relations.half_damage_from.size());
}

TEST(ResourceStore, GenerationTagForms) {
    const auto& store = fixture_store();

    // Reference URL
    TEST_ASSERT_EQ(6, store.select_type_by_name("fairy")->generation);
    // Version group
    TEST_ASSERT_EQ(6, store.select_move_by_name("moonblast")->generation);

    // Roman-numeral reference on a change row
    const AbilityRow* ability = store.select_ability_by_name("static");
    auto changes = store.select_ability_changes(ability->id, 1);
    TEST_ASSERT_EQ(1u, changes.size());
    TEST_ASSERT_EQ(4, changes[0].generation);
}

// ============================================================================
// QUERIES
// ============================================================================

TEST(ResourceStore, ChangesAscendingFromMinimum) {
    const auto& store = fixture_store();
    const MoveRow* tackle = store.select_move_by_name("tackle");

    auto all = store.select_move_changes(tackle->id, 1);
    TEST_ASSERT_EQ(2u, all.size());
    TEST_ASSERT_EQ(5, all[0].generation);
    TEST_ASSERT_EQ(7, all[1].generation);

    auto later = store.select_move_changes(tackle->id, 6);
    TEST_ASSERT_EQ(1u, later.size());
    TEST_ASSERT_EQ(7, later[0].generation);
}

TEST(ResourceStore, LearnMovesUpToGeneration) {
    const auto& store = fixture_store();
    const PokemonRow* pikachu = store.select_pokemon_by_name("pikachu");

    TEST_ASSERT_EQ(3u, store.select_learn_moves(pikachu->id, 7).size());
    TEST_ASSERT_EQ(4u, store.select_learn_moves(pikachu->id, 8).size());

    const PokemonRow* sylveon = store.select_pokemon_by_name("sylveon");
    TEST_ASSERT_TRUE(store.select_learn_moves(sylveon->id, 5).empty());
}

TEST(ResourceStore, AbilitiesBySlot) {
    const auto& store = fixture_store();
    auto abilities = store.select_pokemon_abilities(store.select_pokemon_by_name("pikachu")->id);

    TEST_ASSERT_EQ(2u, abilities.size());
    TEST_ASSERT_EQ("static", abilities[0].ability_name);
    TEST_ASSERT_TRUE(abilities[1].is_hidden);
}

TEST(ResourceStore, AllNamesOrdered) {
    const auto& store = fixture_store();

    auto games = store.select_all_names(ResourceKind::GAMES);
    TEST_ASSERT_EQ(5u, games.size());
    TEST_ASSERT_EQ("red-blue", games[0]);
    TEST_ASSERT_EQ("sword-shield", games[4]);

    auto pokemon = store.select_all_names(ResourceKind::POKEMON);
    TEST_ASSERT_EQ("pikachu", pokemon[0]);
    TEST_ASSERT_EQ("sylveon", pokemon[4]);
}

TEST(ResourceStore, MissingRowsAreNull) {
    const auto& store = fixture_store();

    TEST_ASSERT_NULL(store.select_game("pearl"));
    TEST_ASSERT_NULL(store.select_pokemon_by_name("mewtwo"));
    TEST_ASSERT_NULL(store.select_species_by_id(9999));
    TEST_ASSERT_NULL(store.select_evolution_by_id(20));
    TEST_ASSERT_NOT_NULL(store.select_evolution_by_id(10));
}
