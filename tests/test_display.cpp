/**
 * Tests for Terminal Display
 */

#include <sstream>
#include "dexref/display.hpp"

using namespace dexref;

TEST(Display, PlainWhenColorDisabled) {
    Style style(false);
    TEST_ASSERT_EQ("fire", style.paint("fire", Color::RED));
    TEST_ASSERT_EQ("fire", style.bold("fire", Color::RED));
    TEST_ASSERT_EQ("fire", style.underline("fire", Color::RED));
}

TEST(Display, AnsiWhenColorEnabled) {
    Style style(true);
    TEST_ASSERT_EQ("\x1b[38;5;160mfire\x1b[0m", style.paint("fire", Color::RED));
    TEST_ASSERT_EQ("\x1b[4m\x1b[38;5;160mfire\x1b[0m", style.underline("fire", Color::RED));
}

TEST(Display, Multipliers) {
    TEST_ASSERT_EQ("4", format_multiplier(4.0f));
    TEST_ASSERT_EQ("0.5", format_multiplier(0.5f));
    TEST_ASSERT_EQ("0.25", format_multiplier(0.25f));
}

TEST(Display, StatRating) {
    TEST_ASSERT(rate(190, 200) == Color::RED);
    TEST_ASSERT(rate(90, 200) == Color::GREEN);
    TEST_ASSERT(rate(10, 200) == Color::VIOLET);
}

TEST(Display, EmptyChartTiersRenderNone) {
    Pokemon pokemon;
    pokemon.snapshot.name = "pikachu";
    pokemon.snapshot.primary_type = "electric";

    MatchupReport report;
    std::string output = render_matchup(pokemon, pokemon, report, Style(false));
    TEST_ASSERT(output.find("pikachu's moves vs pikachu\nNone") != std::string::npos);
}

TEST(Display, WeaknessLines) {
    auto chart = TypeChart::neutral(ChartKind::DEFENSE, "rock ground");
    chart.set("water", 4.0f);
    chart.set("grass", 4.0f);

    std::string output = render_weaknesses(chart, Style(false));
    TEST_ASSERT(output.find("rock ground defense") == 0);
    TEST_ASSERT(output.find("\nquad: grass water") != std::string::npos);
}
