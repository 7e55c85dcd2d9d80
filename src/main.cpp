/**
 * dexref - Command Line Entry Point
 *
 * Settings precedence: command-line flags, then config.json, then defaults.
 */

#include "dexref/cli.hpp"
#include "dexref/config.hpp"
#include "dexref/resource_store.hpp"
#include "dexref/trace_logger.hpp"
#include <cstdlib>
#include <iostream>
#include <memory>

using namespace dexref;

namespace {

int report_error(const std::string& message) {
    std::cerr << "error: " << message << std::endl;
    return 1;
}

bool default_color(const ConfigCollection& config) {
    if (auto configured = config.get_bool("color")) return *configured;
    const char* no_color = std::getenv("NO_COLOR");
    return !(no_color && *no_color);
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    ParseResult parsed = parse_args(args);
    if (!parsed.valid) {
        std::cerr << usage() << std::endl;
        return report_error(parsed.reason);
    }

    const CliOptions& options = parsed.options;
    if (options.command == "help") {
        std::cout << usage();
        return 0;
    }

    std::string config_path = default_config_path();
    ConfigCollection config;
    if (!config.load_from_json(config_path)) {
        return report_error("Could not read config at " + config_path + ".");
    }

    if (options.command == "config") {
        CommandResult result = run_config_command(options, config, config_path, std::cout);
        return result.success ? 0 : report_error(result.message);
    }

    std::string data_path = options.data_path.value_or(config.get_value("data").value_or(default_data_path()));
    std::string custom_path = config.get_value("custom").value_or(default_custom_path());

    JsonResourceStore store;
    if (!store.load_from_json(data_path)) {
        return report_error(store.last_error());
    }

    CustomCollection custom;
    if (!custom.load_from_json(custom_path)) {
        return report_error("Could not read custom Pokémon at " + custom_path + ".");
    }

    std::unique_ptr<TraceLogger> trace;
    if (options.trace_dir) {
        trace = std::make_unique<TraceLogger>(*options.trace_dir);
    }

    bool color_enabled = options.color.value_or(default_color(config));
    std::optional<std::string> game = options.game ? options.game : config.get_value("game");

    Console console(store, custom, color_enabled, game, trace.get());
    CommandResult result = console.run(options, std::cout);

    int exit_code = result.success ? 0 : report_error(result.message);
    if (trace) trace->log_end(exit_code);
    return exit_code;
}
