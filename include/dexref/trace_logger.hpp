/**
 * dexref - Trace Logger
 *
 * Records every resolution a command performs, with the generation it was
 * resolved at and the values that were picked, into a timestamped file.
 * Useful for checking which historical override applied.
 */

#pragma once

#include "models.hpp"
#include "resolution.hpp"
#include <fstream>

namespace dexref {

class TraceLogger {
public:
    /**
     * Constructor - creates timestamped log file.
     *
     * @param output_dir Directory for log files
     */
    explicit TraceLogger(const std::string& output_dir = "dexref-traces");

    ~TraceLogger();

    void log_command(const std::vector<std::string>& args, Generation generation);

    void log_pokemon(const Pokemon& pokemon);
    void log_move(const MoveSnapshot& move);
    void log_types(const TypePairCharts& types);
    void log_ability(const AbilitySnapshot& ability);

    void log_error(const ResolutionError& error);

    void log_end(int exit_code);

    const std::string& get_log_path() const { return log_path_; }

    bool is_enabled() const { return enabled_; }

    void set_enabled(bool enabled) { enabled_ = enabled; }

private:
    std::string log_path_;
    std::ofstream log_file_;
    bool enabled_ = true;

    /**
     * Format a chart as "type:mult" pairs, skipping neutral entries.
     */
    static std::string format_chart(const TypeChart& chart);

    static std::string format_optional(const std::optional<int>& value);
};

} // namespace dexref
