/**
 * dexref - Configuration Implementation
 */

#include "dexref/config.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace dexref {

namespace {

std::string xdg_directory(const char* variable, const char* fallback) {
    const char* base = std::getenv(variable);
    if (base && *base) {
        return (std::filesystem::path(base) / "dexref").string();
    }

    const char* home = std::getenv("HOME");
    std::filesystem::path root = (home && *home) ? std::filesystem::path(home) : std::filesystem::path(".");
    return (root / fallback / "dexref").string();
}

bool parse_config(const json& data, std::map<std::string, std::string>& values) {
    if (!data.is_object()) {
        std::cerr << "[Config] Config is not a JSON object" << std::endl;
        return false;
    }

    values.clear();
    for (auto it = data.begin(); it != data.end(); ++it) {
        if (it.value().is_string()) {
            values[it.key()] = it.value().get<std::string>();
        } else if (it.value().is_boolean()) {
            values[it.key()] = it.value().get<bool>() ? "true" : "false";
        } else {
            std::cerr << "[Config] Ignoring non-string value for '" << it.key() << "'" << std::endl;
        }
    }
    return true;
}

} // namespace

bool ConfigCollection::load_from_json(const std::string& filepath) {
    if (!std::filesystem::exists(filepath)) {
        values_.clear();
        return true;
    }

    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[Config] Failed to open: " << filepath << std::endl;
        return false;
    }

    try {
        json data = json::parse(file);
        return parse_config(data, values_);
    } catch (const json::parse_error& e) {
        std::cerr << "[Config] JSON parse error: " << e.what() << std::endl;
        return false;
    }
}

bool ConfigCollection::load_from_string(const std::string& text) {
    try {
        json data = json::parse(text);
        return parse_config(data, values_);
    } catch (const json::parse_error& e) {
        std::cerr << "[Config] JSON parse error: " << e.what() << std::endl;
        return false;
    }
}

bool ConfigCollection::save_to_json(const std::string& filepath) const {
    std::filesystem::path path(filepath);
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            std::cerr << "[Config] Failed to create " << path.parent_path() << ": " << ec.message() << std::endl;
            return false;
        }
    }

    std::ofstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[Config] Failed to write: " << filepath << std::endl;
        return false;
    }
    file << dump() << std::endl;
    return true;
}

std::string ConfigCollection::dump() const {
    json data = json::object();
    for (const auto& entry : values_) {
        data[entry.first] = entry.second;
    }
    return data.dump(2);
}

std::optional<std::string> ConfigCollection::get_value(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> ConfigCollection::set_value(const std::string& key, const std::string& value) {
    auto previous = get_value(key);
    values_[key] = value;
    return previous;
}

std::optional<std::string> ConfigCollection::unset_value(const std::string& key) {
    auto previous = get_value(key);
    values_.erase(key);
    return previous;
}

std::optional<bool> ConfigCollection::get_bool(const std::string& key) const {
    auto value = get_value(key);
    if (!value) return std::nullopt;
    if (*value == "true" || *value == "1" || *value == "yes") return true;
    if (*value == "false" || *value == "0" || *value == "no") return false;
    return std::nullopt;
}

std::string config_directory() {
    return xdg_directory("XDG_CONFIG_HOME", ".config");
}

std::string data_directory() {
    return xdg_directory("XDG_DATA_HOME", ".local/share");
}

std::string default_config_path() {
    return (std::filesystem::path(config_directory()) / "config.json").string();
}

std::string default_custom_path() {
    return (std::filesystem::path(config_directory()) / "custom.json").string();
}

std::string default_data_path() {
    return (std::filesystem::path(data_directory()) / "resource.json").string();
}

} // namespace dexref
