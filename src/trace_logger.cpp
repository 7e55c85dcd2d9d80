/**
 * dexref - Trace Logger Implementation
 */

#include "dexref/trace_logger.hpp"
#include <filesystem>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <iostream>

namespace dexref {

TraceLogger::TraceLogger(const std::string& output_dir) {
    // Create output directory if it doesn't exist
    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        std::cerr << "[Trace Logger] Failed to create " << output_dir << ": " << ec.message() << std::endl;
        enabled_ = false;
        return;
    }

    // Create timestamped log file
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm = *std::localtime(&time_t);

    std::ostringstream filename;
    filename << output_dir << "/trace_"
             << std::put_time(&tm, "%Y%m%d_%H%M%S") << ".log";
    log_path_ = filename.str();

    log_file_.open(log_path_);
    if (!log_file_.is_open()) {
        std::cerr << "[Trace Logger] Failed to open log file: " << log_path_ << std::endl;
        enabled_ = false;
        return;
    }

    log_file_ << std::string(80, '=') << "\n";
    log_file_ << "DEXREF RESOLUTION TRACE\n";

    std::ostringstream timestamp;
    timestamp << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    log_file_ << "Started: " << timestamp.str() << "\n";
    log_file_ << std::string(80, '=') << "\n\n";

    std::cerr << "[Trace Logger] Logging to: " << log_path_ << std::endl;
}

TraceLogger::~TraceLogger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

std::string TraceLogger::format_chart(const TypeChart& chart) {
    std::ostringstream out;
    bool first = true;
    for (const auto& entry : chart.values()) {
        if (entry.second == 1.0f) continue;
        if (!first) out << " ";
        out << entry.first << ":" << entry.second;
        first = false;
    }
    return first ? "(all neutral)" : out.str();
}

std::string TraceLogger::format_optional(const std::optional<int>& value) {
    return value ? std::to_string(*value) : "-";
}

void TraceLogger::log_command(const std::vector<std::string>& args, Generation generation) {
    if (!enabled_) return;

    log_file_ << "COMMAND:";
    for (const auto& arg : args) log_file_ << " " << arg;
    log_file_ << "\nGENERATION: " << generation << "\n\n";
    log_file_.flush();
}

void TraceLogger::log_pokemon(const Pokemon& pokemon) {
    if (!enabled_) return;

    const PokemonSnapshot& snapshot = pokemon.snapshot;
    log_file_ << "[POKEMON] " << snapshot.display_name() << " (species " << snapshot.species
              << ", gen " << snapshot.generation << ", " << to_string(snapshot.group) << ")\n";
    log_file_ << "  Types:   " << snapshot.primary_type;
    if (snapshot.secondary_type) log_file_ << " / " << *snapshot.secondary_type;
    log_file_ << "\n";
    log_file_ << "  Defense: " << format_chart(pokemon.defense_chart) << "\n";
    log_file_ << "  Learnable: " << snapshot.learn_moves.size()
              << " | Resolved moves: " << pokemon.moves.size() << "\n\n";
    log_file_.flush();
}

void TraceLogger::log_move(const MoveSnapshot& move) {
    if (!enabled_) return;

    log_file_ << "[MOVE] " << move.name << " (gen " << move.generation << ")\n";
    log_file_ << "  Type: " << move.type << " | Class: " << move.damage_class
              << " | Power: " << format_optional(move.power)
              << " | Accuracy: " << format_optional(move.accuracy)
              << " | PP: " << format_optional(move.pp)
              << " | Chance: " << format_optional(move.effect_chance) << "\n\n";
    log_file_.flush();
}

void TraceLogger::log_types(const TypePairCharts& types) {
    if (!enabled_) return;

    log_file_ << "[TYPE] " << types.defense.label() << " (gen " << types.primary.generation << ")\n";
    log_file_ << "  Offense " << types.primary.name << ": " << format_chart(types.primary_offense) << "\n";
    if (types.secondary && types.secondary_offense) {
        log_file_ << "  Offense " << types.secondary->name << ": "
                  << format_chart(*types.secondary_offense) << "\n";
    }
    log_file_ << "  Defense: " << format_chart(types.defense) << "\n\n";
    log_file_.flush();
}

void TraceLogger::log_ability(const AbilitySnapshot& ability) {
    if (!enabled_) return;

    log_file_ << "[ABILITY] " << ability.name << " (gen " << ability.generation << ")\n";
    log_file_ << "  " << ability.effect << "\n\n";
    log_file_.flush();
}

void TraceLogger::log_error(const ResolutionError& error) {
    if (!enabled_) return;

    log_file_ << "[ERROR] " << to_string(error.kind) << ": " << error.message << "\n\n";
    log_file_.flush();
}

void TraceLogger::log_end(int exit_code) {
    if (!enabled_) return;

    log_file_ << std::string(80, '=') << "\n";
    log_file_ << "EXIT: " << exit_code << "\n";
    log_file_ << std::string(80, '=') << "\n";
    log_file_.flush();
}

} // namespace dexref
