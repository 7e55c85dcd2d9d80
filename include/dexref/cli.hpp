/**
 * dexref - Command Line Interface
 *
 * Argument parsing and command execution for the dexref executable.
 *
 *   dexref [--game G] [--color|--no-color] [--data PATH] [--trace DIR] <command>
 */

#pragma once

#include "custom.hpp"
#include "models.hpp"
#include "resolution.hpp"
#include <iosfwd>

namespace dexref {

class ConfigCollection;
class ResourceStore;
class TraceLogger;

constexpr size_t MAX_ROSTER = 6;

struct CliOptions {
    // Global flags
    std::optional<std::string> game;
    std::optional<bool> color;
    std::optional<std::string> data_path;
    std::optional<std::string> trace_dir;

    std::string command;
    std::vector<std::string> args;

    // Command flags
    bool moves = false;
    bool evolution = false;
    bool verbose = false;
    bool stab_only = false;
    bool unset = false;
    std::string delimiter = "\n";
};

struct ParseResult {
    bool valid = false;
    std::string reason;
    CliOptions options;
};

/**
 * Parse argv (without the program name). "help" and "--help" parse to the
 * "help" command.
 */
ParseResult parse_args(const std::vector<std::string>& argv);

std::string usage();

struct CommandResult {
    bool success = true;
    std::string message;     // error text when !success
};

/**
 * Commands that need the dataset.
 */
class Console {
public:
    Console(const ResourceStore& store, const CustomCollection& custom,
            bool color_enabled, std::optional<std::string> game,
            TraceLogger* trace = nullptr);

    CommandResult run(const CliOptions& options, std::ostream& out);

    /**
     * Generation of the configured game, or of the latest game.
     */
    Resolution<Generation> generation() const;

private:
    const ResourceStore& store_;
    const CustomCollection& custom_;
    bool color_enabled_;
    std::optional<std::string> game_;
    TraceLogger* trace_;

    CommandResult cmd_pokemon(const CliOptions& options, Generation generation, std::ostream& out);
    CommandResult cmd_type(const CliOptions& options, Generation generation, std::ostream& out);
    CommandResult cmd_move(const CliOptions& options, Generation generation, std::ostream& out);
    CommandResult cmd_ability(const CliOptions& options, Generation generation, std::ostream& out);
    CommandResult cmd_match(const CliOptions& options, Generation generation, std::ostream& out);
    CommandResult cmd_coverage(const CliOptions& options, Generation generation, std::ostream& out);
    CommandResult cmd_resource(const CliOptions& options, std::ostream& out);

    /**
     * Custom nickname, else a validated stored name, loaded in full.
     */
    Resolution<Pokemon> load_named_pokemon(const std::string& name, Generation generation);

    CommandResult fail(const ResolutionError& error);
};

/**
 * The config command: list all keys, print one, set one, or unset one.
 */
CommandResult run_config_command(const CliOptions& options, ConfigCollection& config,
                                 const std::string& config_path, std::ostream& out);

} // namespace dexref
