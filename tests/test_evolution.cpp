/**
 * Tests for Evolution Trees
 */

#include <sstream>
#include "dexref/evolution.hpp"

using namespace dexref;
using dexref_test::fixture_store;

TEST(Evolution, WholeFamilyFromAnyMember) {
    auto tree = evolution_tree_of("raichu", fixture_store());
    TEST_ASSERT_TRUE(tree.ok());

    const EvolutionStep& root = tree.get();
    TEST_ASSERT_EQ("pichu", root.name);
    TEST_ASSERT_EQ(3u, root.size());
    TEST_ASSERT_TRUE(root.methods.empty());

    const EvolutionStep& pikachu = root.evolves_to[0];
    TEST_ASSERT_EQ("pikachu", pikachu.name);
    TEST_ASSERT_EQ(220, *pikachu.methods[0].min_happiness);
    TEST_ASSERT_EQ("raichu", pikachu.evolves_to[0].name);
}

TEST(Evolution, MethodDescription) {
    auto tree = evolution_tree_of("pikachu", fixture_store());
    TEST_ASSERT_TRUE(tree.ok());
    const EvolutionStep& pikachu = tree.get().evolves_to[0];

    TEST_ASSERT_EQ("level-up happiness-220", pikachu.methods[0].describe());
    TEST_ASSERT_EQ("use-item thunder-stone", pikachu.evolves_to[0].methods[0].describe());
}

TEST(Evolution, SpeciesWithoutFamily) {
    auto tree = evolution_tree_of("vaporeon", fixture_store());
    TEST_ASSERT_TRUE(tree.ok());
    TEST_ASSERT_EQ("vaporeon", tree.get().name);
    TEST_ASSERT_EQ(1u, tree.get().size());
}

TEST(Evolution, MissingChain) {
    auto tree = evolution_tree_of("geodude", fixture_store());
    TEST_ASSERT_FALSE(tree.ok());
    TEST_ASSERT(tree.error.kind == ResolutionErrorKind::MALFORMED_OVERRIDE);
}

TEST(Evolution, UnknownSpecies) {
    auto tree = evolution_tree_of("missingno", fixture_store());
    TEST_ASSERT_FALSE(tree.ok());
    TEST_ASSERT_EQ("Species 'missingno' not found.", tree.error.message);
}

TEST(Evolution, MalformedText) {
    TEST_ASSERT_FALSE(decode_evolution("[1, 2]").ok());
    TEST_ASSERT_FALSE(decode_evolution("{").ok());
    TEST_ASSERT_FALSE(decode_evolution("{\"methods\": []}").ok());
}

TEST(Evolution, EncodeKeepsOnlySetConditions) {
    EvolutionStep step;
    step.name = "eevee";
    EvolutionMethod method;
    method.trigger = "level-up";
    method.time_of_day = "night";
    method.min_happiness = 160;
    EvolutionStep umbreon;
    umbreon.name = "umbreon";
    umbreon.methods.push_back(method);
    step.evolves_to.push_back(umbreon);

    nlohmann::json encoded = encode_evolution(step);
    const auto& child = encoded["evolves_to"][0];
    TEST_ASSERT_EQ("umbreon", child["name"].get<std::string>());
    TEST_ASSERT_TRUE(child["methods"][0].contains("time_of_day"));
    TEST_ASSERT_FALSE(child["methods"][0].contains("item"));

    auto decoded = decode_evolution(encoded.dump());
    TEST_ASSERT_TRUE(decoded.ok());
    TEST_ASSERT_EQ("level-up happiness-160 night", decoded.get().evolves_to[0].methods[0].describe());
}
