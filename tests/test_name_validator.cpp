/**
 * Tests for the Name Validator
 */

#include <sstream>
#include "dexref/name_validator.hpp"

using namespace dexref;
using dexref_test::fixture_store;

TEST(NameValidator, CaseFolds) {
    NameValidator validator(fixture_store());

    auto result = validator.validate(ResourceKind::POKEMON, "PiKaChU");
    TEST_ASSERT_TRUE(result.ok());
    TEST_ASSERT_EQ("pikachu", result.get());
}

TEST(NameValidator, SuggestsCloseNames) {
    NameValidator validator(fixture_store());

    auto result = validator.validate(ResourceKind::POKEMON, "pikachuu");
    TEST_ASSERT_FALSE(result.ok());
    TEST_ASSERT(result.error.kind == ResolutionErrorKind::NOT_FOUND);
    TEST_ASSERT_EQ("Pokémon 'pikachuu' not found. Potential matches: pikachu.", result.error.message);
}

TEST(NameValidator, SuggestsContainingNames) {
    NameValidator validator(fixture_store());

    auto result = validator.validate(ResourceKind::MOVES, "thunder");
    TEST_ASSERT_FALSE(result.ok());
    TEST_ASSERT_EQ("Move 'thunder' not found. Potential matches: thunderbolt.", result.error.message);
}

TEST(NameValidator, NoSuggestions) {
    NameValidator validator(fixture_store());

    auto result = validator.validate(ResourceKind::GAMES, "pearl");
    TEST_ASSERT_FALSE(result.ok());
    TEST_ASSERT_EQ("Game 'pearl' not found.", result.error.message);
}

TEST(NameValidator, TooManyMatches) {
    std::vector<std::string> candidates;
    for (int i = 0; i < 25; i++) {
        candidates.push_back("move-" + std::to_string(i));
    }

    auto result = validate_name("Move", candidates, "move");
    TEST_ASSERT_FALSE(result.ok());
    TEST_ASSERT_EQ("Move 'move' not found. Potential matches found; too many to display.", result.error.message);
}

TEST(NameValidator, SpellcheckNeedsFirstCharacter) {
    std::vector<std::string> candidates = {"surf", "turf"};

    auto matches = potential_matches(candidates, "sorf");
    TEST_ASSERT_EQ(1u, matches.size());
    TEST_ASSERT_EQ("surf", matches[0]);
}

TEST(NameValidator, FirstCharacterIsACodePoint) {
    TEST_ASSERT_EQ("s", first_character("surf"));
    TEST_ASSERT_EQ("\xC3\xA9", first_character("\xC3\xA9toile"));
    TEST_ASSERT_EQ("", first_character(""));

    // Both letters share a UTF-8 lead byte
    const std::string e_grave = "\xC3\xA8";
    const std::string e_acute = "\xC3\xA9";
    std::vector<std::string> candidates = {e_grave + "be", e_acute + "b" + e_acute};
    auto matches = potential_matches(candidates, e_acute + "be");
    TEST_ASSERT_EQ(1u, matches.size());
    TEST_ASSERT_EQ(e_acute + "b" + e_acute, matches[0]);
}

TEST(NameValidator, EditDistance) {
    TEST_ASSERT_EQ(3u, levenshtein("kitten", "sitting"));
    TEST_ASSERT_EQ(0u, levenshtein("surf", "surf"));
    TEST_ASSERT_EQ(4u, levenshtein("", "surf"));
}
