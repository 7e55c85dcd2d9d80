/**
 * dexref - Command Line Interface Implementation
 */

#include "dexref/cli.hpp"
#include "dexref/config.hpp"
#include "dexref/display.hpp"
#include "dexref/generation.hpp"
#include "dexref/name_validator.hpp"
#include "dexref/resolvers.hpp"
#include "dexref/resource_store.hpp"
#include "dexref/trace_logger.hpp"
#include <ostream>

namespace dexref {

// ============================================================================
// ARGUMENT PARSING
// ============================================================================

namespace {

// Single-letter aliases of the long options
std::string expand_short(const std::string& flag) {
    if (flag == "-g") return "--game";
    if (flag == "-m") return "--moves";
    if (flag == "-e") return "--evolution";
    if (flag == "-s") return "--stab-only";
    if (flag == "-v") return "--verbose";
    if (flag == "-d") return "--delimiter";
    return flag;
}

bool takes_value(const std::string& flag) {
    return flag == "--game" || flag == "--data" || flag == "--trace" || flag == "--delimiter";
}

/**
 * Turn escapes like "\t" typed on a shell into the characters they name.
 */
std::string unescape(const std::string& text) {
    std::string result;
    for (size_t i = 0; i < text.size(); i++) {
        if (text[i] == '\\' && i + 1 < text.size()) {
            char next = text[i + 1];
            if (next == 'n') { result += '\n'; i++; continue; }
            if (next == 't') { result += '\t'; i++; continue; }
        }
        result += text[i];
    }
    return result;
}

ParseResult invalid(const std::string& reason) {
    ParseResult result;
    result.valid = false;
    result.reason = reason;
    return result;
}

std::optional<ResourceKind> resource_kind(const std::string& name) {
    if (name == "pokemon") return ResourceKind::POKEMON;
    if (name == "moves") return ResourceKind::MOVES;
    if (name == "abilities") return ResourceKind::ABILITIES;
    if (name == "types") return ResourceKind::TYPES;
    if (name == "games") return ResourceKind::GAMES;
    return std::nullopt;
}

} // namespace

ParseResult parse_args(const std::vector<std::string>& argv) {
    ParseResult result;
    CliOptions& options = result.options;

    for (size_t i = 0; i < argv.size(); i++) {
        const std::string arg = expand_short(argv[i]);

        if (arg == "--help" || arg == "-h") {
            options.command = "help";
            result.valid = true;
            return result;
        }

        if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
            std::string value;
            if (takes_value(arg)) {
                if (i + 1 >= argv.size()) {
                    return invalid("Option " + arg + " needs a value.");
                }
                value = argv[++i];
            }

            if (arg == "--game") options.game = value;
            else if (arg == "--data") options.data_path = value;
            else if (arg == "--trace") options.trace_dir = value;
            else if (arg == "--delimiter") options.delimiter = unescape(value);
            else if (arg == "--color") options.color = true;
            else if (arg == "--no-color") options.color = false;
            else if (arg == "--moves") options.moves = true;
            else if (arg == "--evolution") options.evolution = true;
            else if (arg == "--verbose") options.verbose = true;
            else if (arg == "--stab-only") options.stab_only = true;
            else if (arg == "--unset") options.unset = true;
            else return invalid("Unknown option " + arg + ".");
            continue;
        }

        if (arg.size() > 1 && arg[0] == '-') {
            return invalid("Unknown option " + arg + ".");
        }

        if (options.command.empty()) {
            options.command = arg;
        } else {
            options.args.push_back(arg);
        }
    }

    const std::string& command = options.command;
    const size_t count = options.args.size();

    if (command.empty() || command == "help") {
        options.command = "help";
    } else if (command == "pokemon" || command == "move" || command == "ability") {
        if (count != 1) return invalid("Command '" + command + "' takes exactly one name.");
    } else if (command == "type") {
        if (count < 1 || count > 2) return invalid("Command 'type' takes one or two types.");
    } else if (command == "match") {
        if (count < 2 || count > MAX_ROSTER + 1) {
            return invalid("Command 'match' takes 1 to 6 defenders followed by one attacker.");
        }
    } else if (command == "coverage") {
        if (count < 1 || count > MAX_ROSTER) return invalid("Command 'coverage' takes 1 to 6 Pokémon.");
    } else if (command == "resource") {
        if (count != 1 || !resource_kind(options.args[0])) {
            return invalid("Command 'resource' takes one of: pokemon moves abilities types games.");
        }
    } else if (command == "config") {
        if (count > 2) return invalid("Command 'config' takes at most a key and a value.");
        if (options.unset && count != 1) return invalid("--unset takes exactly one key.");
    } else {
        return invalid("Unknown command '" + command + "'.");
    }

    result.valid = true;
    return result;
}

std::string usage() {
    return R"(dexref - Pokémon ruleset reference

Usage:
  dexref [-g|--game G] [--color|--no-color] [--data PATH] [--trace DIR] <command>

Commands:
  pokemon <name>                            - Pokémon summary and weaknesses
        [-m|--moves] [-e|--evolution]
  type <primary> [secondary]                - Offense and defense charts
  move <name>                               - Move details
  ability <name>                            - Ability effect
  match <defender>... <attacker>            - Move matchups (1-6 defenders)
        [-v|--verbose] [-s|--stab-only]
  coverage <name>...                        - Roster type coverage (1-6 names)
  resource <pokemon|moves|abilities|types|games> [-d|--delimiter D]
  config [key [value]] [--unset]            - Show or change settings

Config keys:
  game     default game version (latest when unset)
  color    true / false
  data     dataset path
  custom   custom Pokémon file path
)";
}

// ============================================================================
// CONSOLE
// ============================================================================

Console::Console(const ResourceStore& store, const CustomCollection& custom,
                 bool color_enabled, std::optional<std::string> game,
                 TraceLogger* trace)
    : store_(store), custom_(custom), color_enabled_(color_enabled),
      game_(std::move(game)), trace_(trace) {}

Resolution<Generation> Console::generation() const {
    GenerationResolver resolver = GenerationResolver::from_store(store_);

    if (game_) {
        NameValidator validator(store_);
        auto game = validator.validate(ResourceKind::GAMES, *game_);
        if (!game.ok()) return Resolution<Generation>::failure(game.error);
        return resolver.generation_of_game(game.get());
    }

    auto latest = resolver.latest_game();
    if (!latest) {
        return Resolution<Generation>::failure(ResolutionErrorKind::NOT_FOUND,
                                               "The dataset has no games.");
    }
    return Resolution<Generation>::success(latest->generation);
}

CommandResult Console::fail(const ResolutionError& error) {
    if (trace_) trace_->log_error(error);
    return CommandResult{false, error.message};
}

CommandResult Console::run(const CliOptions& options, std::ostream& out) {
    if (options.command == "resource") {
        return cmd_resource(options, out);
    }

    auto generation = this->generation();
    if (!generation.ok()) return fail(generation.error);

    if (trace_) {
        std::vector<std::string> args{options.command};
        args.insert(args.end(), options.args.begin(), options.args.end());
        trace_->log_command(args, generation.get());
    }

    if (options.command == "pokemon") return cmd_pokemon(options, generation.get(), out);
    if (options.command == "type") return cmd_type(options, generation.get(), out);
    if (options.command == "move") return cmd_move(options, generation.get(), out);
    if (options.command == "ability") return cmd_ability(options, generation.get(), out);
    if (options.command == "match") return cmd_match(options, generation.get(), out);
    if (options.command == "coverage") return cmd_coverage(options, generation.get(), out);

    return CommandResult{false, "Unknown command '" + options.command + "'."};
}

Resolution<Pokemon> Console::load_named_pokemon(const std::string& name, Generation generation) {
    Resolution<Pokemon> pokemon;

    if (const CustomPokemon* custom = custom_.find_pokemon(name)) {
        pokemon = load_custom_pokemon(*custom, store_);
    } else {
        NameValidator validator(store_);
        auto valid = validator.validate(ResourceKind::POKEMON, name);
        if (!valid.ok()) return Resolution<Pokemon>::failure(valid.error);
        pokemon = load_pokemon(valid.get(), generation, store_);
    }

    if (pokemon.ok() && trace_) trace_->log_pokemon(pokemon.get());
    return pokemon;
}

CommandResult Console::cmd_pokemon(const CliOptions& options, Generation generation, std::ostream& out) {
    auto pokemon = load_named_pokemon(options.args[0], generation);
    if (!pokemon.ok()) return fail(pokemon.error);

    Style style(color_enabled_);
    out << render_pokemon(pokemon.get(), style) << "\n";

    if (options.moves) {
        out << "\n" << render_move_list(pokemon.get(), style) << "\n";
    }

    if (options.evolution) {
        auto tree = evolution_tree_of(pokemon.get().snapshot.species, store_);
        if (!tree.ok()) return fail(tree.error);
        out << "\n" << render_evolution(tree.get(), style) << "\n";
    }

    return {};
}

CommandResult Console::cmd_type(const CliOptions& options, Generation generation, std::ostream& out) {
    NameValidator validator(store_);

    auto primary = validator.validate(ResourceKind::TYPES, options.args[0]);
    if (!primary.ok()) return fail(primary.error);

    std::optional<std::string> secondary;
    if (options.args.size() > 1) {
        auto valid = validator.validate(ResourceKind::TYPES, options.args[1]);
        if (!valid.ok()) return fail(valid.error);
        secondary = valid.get();
    }

    auto types = resolve_type_pair(primary.get(), secondary, generation, store_);
    if (!types.ok()) return fail(types.error);
    if (trace_) trace_->log_types(types.get());

    out << render_type_pair(types.get(), Style(color_enabled_)) << "\n";
    return {};
}

CommandResult Console::cmd_move(const CliOptions& options, Generation generation, std::ostream& out) {
    NameValidator validator(store_);
    auto name = validator.validate(ResourceKind::MOVES, options.args[0]);
    if (!name.ok()) return fail(name.error);

    auto move = resolve_move(name.get(), generation, store_);
    if (!move.ok()) return fail(move.error);
    if (trace_) trace_->log_move(move.get());

    out << render_move(move.get(), Style(color_enabled_)) << "\n";
    return {};
}

CommandResult Console::cmd_ability(const CliOptions& options, Generation generation, std::ostream& out) {
    NameValidator validator(store_);
    auto name = validator.validate(ResourceKind::ABILITIES, options.args[0]);
    if (!name.ok()) return fail(name.error);

    auto ability = resolve_ability(name.get(), generation, store_);
    if (!ability.ok()) return fail(ability.error);
    if (trace_) trace_->log_ability(ability.get());

    out << render_ability(ability.get(), Style(color_enabled_)) << "\n";
    return {};
}

CommandResult Console::cmd_match(const CliOptions& options, Generation generation, std::ostream& out) {
    auto attacker = load_named_pokemon(options.args.back(), generation);
    if (!attacker.ok()) return fail(attacker.error);

    // Load every defender before printing anything
    std::vector<Pokemon> defenders;
    for (size_t i = 0; i + 1 < options.args.size(); i++) {
        auto defender = load_named_pokemon(options.args[i], generation);
        if (!defender.ok()) return fail(defender.error);
        defenders.push_back(std::move(defender.get()));
    }

    MatchupOptions matchup_options;
    matchup_options.verbose = options.verbose;
    matchup_options.stab_only = options.stab_only;

    Style style(color_enabled_);
    for (const auto& defender : defenders) {
        auto report = matchup_report(attacker.get(), defender, matchup_options);
        out << render_matchup(attacker.get(), defender, report, style) << "\n\n";
    }

    return {};
}

CommandResult Console::cmd_coverage(const CliOptions& options, Generation generation, std::ostream& out) {
    std::vector<Pokemon> roster;
    for (const auto& name : options.args) {
        auto pokemon = load_named_pokemon(name, generation);
        if (!pokemon.ok()) return fail(pokemon.error);
        roster.push_back(std::move(pokemon.get()));
    }

    auto report = coverage_report(roster, store_);
    if (!report.ok()) return fail(report.error);

    out << render_coverage(report.get(), Style(color_enabled_)) << "\n";
    return {};
}

CommandResult Console::cmd_resource(const CliOptions& options, std::ostream& out) {
    auto kind = resource_kind(options.args[0]);
    if (!kind) {
        return CommandResult{false, "Unknown resource '" + options.args[0] + "'."};
    }

    auto names = store_.select_all_names(*kind);
    for (size_t i = 0; i < names.size(); i++) {
        if (i > 0) out << options.delimiter;
        out << names[i];
    }
    out << "\n";
    return {};
}

// ============================================================================
// CONFIG COMMAND
// ============================================================================

CommandResult run_config_command(const CliOptions& options, ConfigCollection& config,
                                 const std::string& config_path, std::ostream& out) {
    if (options.args.empty()) {
        for (const auto& entry : config.values()) {
            out << entry.first << ": " << entry.second << "\n";
        }
        return {};
    }

    const std::string& key = options.args[0];

    if (options.unset) {
        config.unset_value(key);
    } else if (options.args.size() > 1) {
        config.set_value(key, options.args[1]);
    } else {
        auto value = config.get_value(key);
        if (value) out << *value << "\n";
        return {};
    }

    if (!config.save_to_json(config_path)) {
        return CommandResult{false, "Could not write config to " + config_path + "."};
    }
    return {};
}

} // namespace dexref
