/**
 * dexref - Configuration
 *
 * String key-value settings kept in a JSON file under the user's config
 * directory, and the default locations of the other application files.
 *
 * Known keys:
 *   game    default game version
 *   color   "true" / "false"
 *   data    dataset path
 *   custom  custom Pokémon file path
 */

#pragma once

#include <map>
#include <optional>
#include <string>

namespace dexref {

class ConfigCollection {
public:
    ConfigCollection() = default;

    /**
     * Load from a file. A missing file is an empty collection.
     */
    bool load_from_json(const std::string& filepath);

    bool load_from_string(const std::string& text);

    /**
     * Write back, creating parent directories as needed.
     */
    bool save_to_json(const std::string& filepath) const;

    std::string dump() const;

    const std::map<std::string, std::string>& values() const { return values_; }

    std::optional<std::string> get_value(const std::string& key) const;

    /**
     * Set a key, returning the previous value if there was one.
     */
    std::optional<std::string> set_value(const std::string& key, const std::string& value);

    std::optional<std::string> unset_value(const std::string& key);

    /**
     * Interpret a key as a boolean ("true"/"false", "1"/"0", "yes"/"no").
     */
    std::optional<bool> get_bool(const std::string& key) const;

private:
    std::map<std::string, std::string> values_;
};

/**
 * $XDG_CONFIG_HOME/dexref, falling back to ~/.config/dexref.
 */
std::string config_directory();

/**
 * $XDG_DATA_HOME/dexref, falling back to ~/.local/share/dexref.
 */
std::string data_directory();

std::string default_config_path();
std::string default_custom_path();
std::string default_data_path();

} // namespace dexref
