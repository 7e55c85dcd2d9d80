/**
 * Tests for the Command Line Interface
 */

#include <sstream>
#include <filesystem>
#include <fstream>
#include "dexref/cli.hpp"
#include "dexref/config.hpp"
#include "dexref/trace_logger.hpp"

using namespace dexref;
using dexref_test::fixture_store;
using dexref_test::fixture_custom;

namespace {

CommandResult run_command(const std::vector<std::string>& argv, std::ostringstream& out,
                          std::optional<std::string> game = std::nullopt) {
    ParseResult parsed = parse_args(argv);
    if (!parsed.valid) {
        throw std::runtime_error("Arguments did not parse: " + parsed.reason);
    }

    static const CustomCollection custom = fixture_custom();
    Console console(fixture_store(), custom, false, std::move(game));
    return console.run(parsed.options, out);
}

} // namespace

// ============================================================================
// ARGUMENT PARSING
// ============================================================================

TEST(Cli, ParsesGlobalAndCommandFlags) {
    ParseResult parsed = parse_args({"--game", "x-y", "--no-color", "pokemon", "pikachu", "--moves"});
    TEST_ASSERT_TRUE(parsed.valid);

    const CliOptions& options = parsed.options;
    TEST_ASSERT_EQ("x-y", *options.game);
    TEST_ASSERT_FALSE(*options.color);
    TEST_ASSERT_EQ("pokemon", options.command);
    TEST_ASSERT_EQ(1u, options.args.size());
    TEST_ASSERT_TRUE(options.moves);
    TEST_ASSERT_FALSE(options.evolution);
}

TEST(Cli, NoArgumentsIsHelp) {
    TEST_ASSERT_EQ("help", parse_args({}).options.command);
    TEST_ASSERT_EQ("help", parse_args({"pokemon", "--help"}).options.command);
}

TEST(Cli, RejectsBadArity) {
    TEST_ASSERT_FALSE(parse_args({"pokemon"}).valid);
    TEST_ASSERT_FALSE(parse_args({"match", "pikachu"}).valid);
    TEST_ASSERT_FALSE(parse_args({"match", "a", "b", "c", "d", "e", "f", "g", "h"}).valid);
    TEST_ASSERT_TRUE(parse_args({"match", "a", "b", "c", "d", "e", "f", "g"}).valid);
    TEST_ASSERT_FALSE(parse_args({"coverage", "a", "b", "c", "d", "e", "f", "g"}).valid);
    TEST_ASSERT_FALSE(parse_args({"type", "rock", "ground", "water"}).valid);
    TEST_ASSERT_FALSE(parse_args({"config", "--unset"}).valid);
}

TEST(Cli, RejectsUnknownInput) {
    TEST_ASSERT_FALSE(parse_args({"evolve", "pikachu"}).valid);
    TEST_ASSERT_FALSE(parse_args({"pokemon", "pikachu", "--shiny"}).valid);
    TEST_ASSERT_FALSE(parse_args({"resource", "items"}).valid);
    TEST_ASSERT_FALSE(parse_args({"pokemon", "pikachu", "--game"}).valid);
}

TEST(Cli, ShortFlags) {
    ParseResult parsed = parse_args({"-g", "x-y", "pokemon", "pikachu", "-m", "-e"});
    TEST_ASSERT_TRUE(parsed.valid);
    TEST_ASSERT_EQ("x-y", *parsed.options.game);
    TEST_ASSERT_TRUE(parsed.options.moves);
    TEST_ASSERT_TRUE(parsed.options.evolution);

    parsed = parse_args({"match", "geodude", "pikachu", "-v", "-s"});
    TEST_ASSERT_TRUE(parsed.valid);
    TEST_ASSERT_TRUE(parsed.options.verbose);
    TEST_ASSERT_TRUE(parsed.options.stab_only);
    TEST_ASSERT_EQ(2u, parsed.options.args.size());

    parsed = parse_args({"resource", "games", "-d", ","});
    TEST_ASSERT_TRUE(parsed.valid);
    TEST_ASSERT_EQ(",", parsed.options.delimiter);
}

TEST(Cli, RejectsUnknownShortFlag) {
    ParseResult parsed = parse_args({"pokemon", "pikachu", "-x"});
    TEST_ASSERT_FALSE(parsed.valid);
    TEST_ASSERT_EQ("Unknown option -x.", parsed.reason);
    TEST_ASSERT_FALSE(parse_args({"match", "-geodude", "pikachu"}).valid);
}

TEST(Cli, DelimiterEscapes) {
    ParseResult parsed = parse_args({"resource", "types", "--delimiter", "\\t"});
    TEST_ASSERT_TRUE(parsed.valid);
    TEST_ASSERT_EQ("\t", parsed.options.delimiter);
}

// ============================================================================
// COMMANDS
// ============================================================================

TEST(Cli, ResourceListing) {
    std::ostringstream out;
    CommandResult result = run_command({"resource", "games", "--delimiter", ","}, out);
    TEST_ASSERT_TRUE(result.success);
    TEST_ASSERT_EQ("red-blue,gold-silver,ruby-sapphire,x-y,sword-shield\n", out.str());
}

TEST(Cli, MoveAtConfiguredGame) {
    std::ostringstream out;
    CommandResult result = run_command({"move", "Tackle"}, out, std::string("ruby-sapphire"));
    TEST_ASSERT_TRUE(result.success);
    TEST_ASSERT(out.str().find("power: 35") != std::string::npos);
}

TEST(Cli, LatestGameByDefault) {
    std::ostringstream out;
    run_command({"move", "tackle"}, out);
    TEST_ASSERT(out.str().find("power: 40") != std::string::npos);
}

TEST(Cli, UnknownGame) {
    std::ostringstream out;
    CommandResult result = run_command({"move", "tackle"}, out, std::string("pearl"));
    TEST_ASSERT_FALSE(result.success);
    TEST_ASSERT_EQ("Game 'pearl' not found.", result.message);
    TEST_ASSERT_TRUE(out.str().empty());
}

TEST(Cli, UnknownPokemonSuggests) {
    std::ostringstream out;
    CommandResult result = run_command({"pokemon", "pikachuu"}, out);
    TEST_ASSERT_FALSE(result.success);
    TEST_ASSERT(result.message.find("Potential matches: pikachu") != std::string::npos);
}

TEST(Cli, PokemonWithEvolution) {
    std::ostringstream out;
    CommandResult result = run_command({"pokemon", "pikachu", "--moves", "--evolution"}, out);
    TEST_ASSERT_TRUE(result.success);

    std::string text = out.str();
    TEST_ASSERT(text.find("pikachu electric regular") == 0);
    TEST_ASSERT(text.find("\ndouble: ground") != std::string::npos);
    TEST_ASSERT(text.find("thunderbolt electric special 90 [level-up 26]") != std::string::npos);
    TEST_ASSERT(text.find("\n  pikachu level-up happiness-220") != std::string::npos);
}

TEST(Cli, TypeCommand) {
    std::ostringstream out;
    CommandResult result = run_command({"type", "rock", "ground"}, out);
    TEST_ASSERT_TRUE(result.success);
    TEST_ASSERT(out.str().find("rock ground defense\nquad: grass water") != std::string::npos);
}

TEST(Cli, MatchCommand) {
    std::ostringstream out;
    CommandResult result = run_command({"match", "geodude", "pikachu"}, out);
    TEST_ASSERT_TRUE(result.success);

    std::string text = out.str();
    TEST_ASSERT(text.find("pikachu's moves vs geodude\nNone") != std::string::npos);
    TEST_ASSERT(text.find("geodude's moves vs pikachu\ndouble: earthquake(p)") != std::string::npos);
}

TEST(Cli, MatchFailsBeforePrinting) {
    std::ostringstream out;
    CommandResult result = run_command({"match", "geodude", "sylveon"}, out, std::string("gold-silver"));
    TEST_ASSERT_FALSE(result.success);
    TEST_ASSERT_EQ("'sylveon' is not present in generation 2.", result.message);
    TEST_ASSERT_TRUE(out.str().empty());
}

TEST(Cli, CoverageWithCustomPokemon) {
    std::ostringstream out;
    CommandResult result = run_command({"coverage", "geodude", "sparky"}, out);
    TEST_ASSERT_TRUE(result.success);
    TEST_ASSERT(out.str().find("\nflying: Sparky(electric) geodude(rock)") != std::string::npos);
}

TEST(Cli, TraceRecordsResolutions) {
    auto dir = std::filesystem::temp_directory_path() / "dexref_trace_test";
    std::filesystem::remove_all(dir);

    std::string log_path;
    {
        TraceLogger trace(dir.string());
        TEST_ASSERT_TRUE(trace.is_enabled());
        log_path = trace.get_log_path();

        CustomCollection custom;
        Console console(fixture_store(), custom, false, std::string("ruby-sapphire"), &trace);
        std::ostringstream out;
        TEST_ASSERT_TRUE(console.run(parse_args({"move", "tackle"}).options, out).success);
        TEST_ASSERT_FALSE(console.run(parse_args({"move", "splash"}).options, out).success);
        trace.log_end(1);
    }

    std::ifstream file(log_path);
    std::stringstream contents;
    contents << file.rdbuf();
    std::string text = contents.str();

    TEST_ASSERT(text.find("GENERATION: 3") != std::string::npos);
    TEST_ASSERT(text.find("[MOVE] tackle (gen 3)") != std::string::npos);
    TEST_ASSERT(text.find("Power: 35") != std::string::npos);
    TEST_ASSERT(text.find("[ERROR] not_found") != std::string::npos);
    TEST_ASSERT(text.find("EXIT: 1") != std::string::npos);

    std::filesystem::remove_all(dir);
}

TEST(Cli, ConfigSetGetUnset) {
    auto dir = std::filesystem::temp_directory_path() / "dexref_cli_config_test";
    std::filesystem::remove_all(dir);
    std::string path = (dir / "config.json").string();
    ConfigCollection config;

    std::ostringstream out;
    TEST_ASSERT_TRUE(run_config_command(parse_args({"config", "game", "x-y"}).options, config, path, out).success);
    TEST_ASSERT_TRUE(std::filesystem::exists(path));

    run_config_command(parse_args({"config", "game"}).options, config, path, out);
    TEST_ASSERT_EQ("x-y\n", out.str());

    TEST_ASSERT_TRUE(run_config_command(parse_args({"config", "game", "--unset"}).options, config, path, out).success);
    TEST_ASSERT_FALSE(config.get_value("game").has_value());

    std::filesystem::remove_all(dir);
}
