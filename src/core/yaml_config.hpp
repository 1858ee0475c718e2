/**
 * yaml_config.hpp - Simple YAML configuration loader for seedhound
 *
 * Parses a subset of YAML (key: value pairs with sections) without external dependencies.
 * Command-line arguments override config file settings.
 */

#pragma once

#include <string>
#include <fstream>
#include <sstream>
#include <map>
#include <vector>
#include <filesystem>
#include <iostream>
#include <algorithm>
#include <cstdlib>
#include "errors.hpp"

namespace seedhound {

/**
 * Application configuration loaded from seedhound.yml
 */
struct AppConfig {
    // Search description
    std::string mode;                     // "password" or "seed"
    std::string tokens_file;
    std::string mnemonic;
    std::string wordlist;
    std::string wildcards_file;
    int max_typos = -1;                   // -1 = not set
    int max_swaps = -1;
    int max_substitutions = -1;
    int max_combined = -1;

    // Typo families
    bool typo_case = false;
    bool typo_repeat = false;
    bool typo_delete = false;
    bool typo_transpose = false;
    std::string typo_replace;
    std::string typo_insert;
    std::string typos_map;
    int close_distance = -1;

    // Oracle
    std::string oracle_type;
    std::vector<std::string> targets;
    std::string address_db;
    std::vector<std::string> paths;
    int address_limit = -1;
    std::string passphrase;

    // Workers
    std::string worker;                   // "i/M" or "i,j/M"
    int threads = -1;
    int devices = -1;
    size_t batch_size = 0;

    // Autosave
    std::string autosave_file;
    double autosave_interval_seconds = -1;
    unsigned long long autosave_interval_candidates = 0;

    // Settings
    bool verbose = false;
    bool debug = false;
    int performance_seconds = -1;

    std::string loaded_from;

    /**
     * Get possible config file paths (in order of priority)
     */
    static std::vector<std::string> get_config_paths() {
        std::vector<std::string> paths;

        // 1. Current directory
        paths.push_back("./seedhound.yml");
        paths.push_back("./seedhound.yaml");

        // 2. User home directory
        const char* home_env = std::getenv("HOME");
        std::string home = home_env ? home_env : "";
        if (!home.empty()) {
            paths.push_back(home + "/.seedhound/seedhound.yml");
            paths.push_back(home + "/.seedhound/seedhound.yaml");
        }

        return paths;
    }

    /**
     * Load configuration from a YAML file.
     * Returns true if a config file was found and loaded.
     *
     * @throws ConfigurationError if an explicit path is missing or a value
     *         cannot be parsed
     */
    bool load(const std::string& explicit_path = "") {
        std::string config_path;

        if (!explicit_path.empty()) {
            if (!std::filesystem::exists(explicit_path)) {
                throw ConfigurationError("config file not found: " + explicit_path);
            }
            config_path = explicit_path;
        } else {
            for (const auto& path : get_config_paths()) {
                if (std::filesystem::exists(path)) {
                    config_path = path;
                    break;
                }
            }
        }

        if (config_path.empty()) {
            return false;  // No config file found (this is OK)
        }

        std::ifstream file(config_path);
        if (!file.is_open()) {
            throw ConfigurationError("failed to open config file: " + config_path);
        }
        load_stream(file, config_path);
        loaded_from = config_path;
        return true;
    }

    /** Parse YAML text; `source` names the input in error messages. */
    void load_stream(std::istream& in, const std::string& source) {
        std::string line;
        std::string current_section;
        int line_number = 0;

        while (std::getline(in, line)) {
            line_number++;

            // Trim leading whitespace and count indent
            size_t indent = 0;
            while (indent < line.length() && (line[indent] == ' ' || line[indent] == '\t')) {
                indent++;
            }
            std::string trimmed = line.substr(indent);

            // Skip empty lines and comments
            if (trimmed.empty() || trimmed[0] == '#' || trimmed.substr(0, 3) == "---") {
                continue;
            }

            // Remove trailing comments (a '#' inside quotes is kept)
            trimmed = strip_comment(trimmed);

            while (!trimmed.empty() && (trimmed.back() == ' ' || trimmed.back() == '\t')) {
                trimmed.pop_back();
            }

            if (trimmed.empty()) continue;

            size_t colon_pos = trimmed.find(':');
            if (colon_pos == std::string::npos) {
                throw ConfigurationError(source + ":" + std::to_string(line_number) +
                                         ": expected 'key: value'");
            }

            std::string key = trimmed.substr(0, colon_pos);
            std::string value = (colon_pos + 1 < trimmed.length()) ? trimmed.substr(colon_pos + 1) : "";

            while (!key.empty() && (key.back() == ' ' || key.back() == '\t')) key.pop_back();
            while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) value.erase(0, 1);
            while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) value.pop_back();

            // Section header (no value after colon)
            if (value.empty() && indent == 0) {
                current_section = key;
                continue;
            }

            value = unquote(value);

            try {
                parse_value(current_section, key, value);
            } catch (const ConfigurationError& e) {
                throw ConfigurationError(source + ":" + std::to_string(line_number) + ": " + e.what());
            } catch (const std::logic_error&) {
                // std::stoi and friends
                throw ConfigurationError(source + ":" + std::to_string(line_number) +
                                         ": invalid value '" + value + "' for " +
                                         current_section + "." + key);
            }
        }
    }

private:
    void parse_value(const std::string& section, const std::string& key, const std::string& value) {
        if (section == "search") {
            if (key == "mode") mode = value;
            else if (key == "tokens") tokens_file = value;
            else if (key == "mnemonic") mnemonic = value;
            else if (key == "wordlist") wordlist = value;
            else if (key == "wildcards") wildcards_file = value;
            else if (key == "max_typos") max_typos = parse_count(value);
            else if (key == "max_swaps") max_swaps = parse_count(value);
            else if (key == "max_substitutions") max_substitutions = parse_count(value);
            else if (key == "max_combined") max_combined = parse_count(value);
            else unknown(section, key);
        }
        else if (section == "typos") {
            if (key == "case") typo_case = parse_bool(value);
            else if (key == "repeat") typo_repeat = parse_bool(value);
            else if (key == "delete") typo_delete = parse_bool(value);
            else if (key == "transpose") typo_transpose = parse_bool(value);
            else if (key == "replace") typo_replace = value;
            else if (key == "insert") typo_insert = value;
            else if (key == "map") typos_map = value;
            else if (key == "close_distance") close_distance = parse_count(value);
            else unknown(section, key);
        }
        else if (section == "oracle") {
            if (key == "type") oracle_type = value;
            else if (key == "targets" || key == "target") {
                for (auto& t : parse_string_list(value)) targets.push_back(t);
            }
            else if (key == "address_db") address_db = value;
            else if (key == "paths") paths = parse_string_list(value);
            else if (key == "address_limit") address_limit = parse_count(value);
            else if (key == "passphrase") passphrase = value;
            else unknown(section, key);
        }
        else if (section == "workers") {
            if (key == "worker") worker = value;
            else if (key == "threads") threads = parse_count(value);
            else if (key == "devices") devices = parse_count(value);
            else if (key == "batch_size") batch_size = std::stoull(value);
            else unknown(section, key);
        }
        else if (section == "autosave") {
            if (key == "file") autosave_file = value;
            else if (key == "interval_seconds") autosave_interval_seconds = std::stod(value);
            else if (key == "interval_candidates") autosave_interval_candidates = std::stoull(value);
            else unknown(section, key);
        }
        else if (section == "settings") {
            if (key == "verbose") verbose = parse_bool(value);
            else if (key == "debug") debug = parse_bool(value);
            else if (key == "performance_seconds") performance_seconds = parse_count(value);
            else unknown(section, key);
        }
        else {
            throw ConfigurationError("unknown section '" + section + "'");
        }
    }

    static void unknown(const std::string& section, const std::string& key) {
        throw ConfigurationError("unknown key '" + key + "' in section '" + section + "'");
    }

    static int parse_count(const std::string& value) {
        int n = std::stoi(value);
        if (n < 0) throw ConfigurationError("value must not be negative: " + value);
        return n;
    }

    static std::string strip_comment(const std::string& text) {
        char quote = 0;
        for (size_t i = 0; i < text.size(); i++) {
            char c = text[i];
            if (quote) {
                if (c == quote) quote = 0;
            } else if (c == '"' || c == '\'') {
                quote = c;
            } else if (c == '#' && (i == 0 || text[i - 1] == ' ' || text[i - 1] == '\t')) {
                return text.substr(0, i);
            }
        }
        return text;
    }

    static std::string unquote(const std::string& value) {
        if (value.length() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            return value.substr(1, value.length() - 2);
        }
        return value;
    }

    static bool parse_bool(const std::string& value) {
        std::string lower = value;
        std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
        return (lower == "true" || lower == "yes" || lower == "1" || lower == "on");
    }

    static std::vector<std::string> parse_string_list(const std::string& value) {
        std::vector<std::string> result;

        if (value.empty() || value == "[]") return result;

        std::string clean = value;
        if (clean.front() == '[') clean.erase(0, 1);
        if (!clean.empty() && clean.back() == ']') clean.pop_back();

        std::stringstream ss(clean);
        std::string item;
        while (std::getline(ss, item, ',')) {
            while (!item.empty() && (item.front() == ' ' || item.front() == '\t')) item.erase(0, 1);
            while (!item.empty() && (item.back() == ' ' || item.back() == '\t')) item.pop_back();
            item = unquote(item);
            if (!item.empty()) result.push_back(item);
        }
        return result;
    }
};

/**
 * Apply config file settings to Arguments struct.
 * Only applies settings the command line left at their defaults.
 */
template<typename Arguments>
void apply_config_to_args(Arguments& args, const AppConfig& config) {
    // Search
    if (args.mode.empty() && !config.mode.empty()) args.mode = config.mode;
    if (args.tokens_file.empty()) args.tokens_file = config.tokens_file;
    if (args.mnemonic.empty()) args.mnemonic = config.mnemonic;
    if (args.wordlist.empty()) args.wordlist = config.wordlist;
    if (args.wildcards_file.empty()) args.wildcards_file = config.wildcards_file;
    if (args.max_typos < 0) args.max_typos = config.max_typos;
    if (args.max_swaps < 0) args.max_swaps = config.max_swaps;
    if (args.max_substitutions < 0) args.max_substitutions = config.max_substitutions;
    if (args.max_combined < 0) args.max_combined = config.max_combined;

    // Typo families are switches: the config can only turn them on
    if (config.typo_case) args.typo_case = true;
    if (config.typo_repeat) args.typo_repeat = true;
    if (config.typo_delete) args.typo_delete = true;
    if (config.typo_transpose) args.typo_transpose = true;
    if (args.typo_replace.empty()) args.typo_replace = config.typo_replace;
    if (args.typo_insert.empty()) args.typo_insert = config.typo_insert;
    if (args.typos_map.empty()) args.typos_map = config.typos_map;
    if (args.close_distance < 0) args.close_distance = config.close_distance;

    // Oracle
    if (args.oracle_type.empty()) args.oracle_type = config.oracle_type;
    if (args.targets.empty()) args.targets = config.targets;
    if (args.address_db.empty()) args.address_db = config.address_db;
    if (args.paths.empty()) args.paths = config.paths;
    if (args.address_limit < 0) args.address_limit = config.address_limit;
    if (args.passphrase.empty()) args.passphrase = config.passphrase;

    // Workers
    if (args.worker.empty()) args.worker = config.worker;
    if (args.threads < 0) args.threads = config.threads;
    if (args.devices < 0) args.devices = config.devices;
    if (args.batch_size == 0) args.batch_size = config.batch_size;

    // Autosave
    if (args.autosave_file.empty()) args.autosave_file = config.autosave_file;
    if (args.autosave_interval_seconds < 0) args.autosave_interval_seconds = config.autosave_interval_seconds;
    if (args.autosave_interval_candidates == 0) args.autosave_interval_candidates = config.autosave_interval_candidates;

    // Settings
    if (config.verbose) args.verbose = true;
    if (config.debug) args.debug = true;
    if (args.performance_seconds < 0) args.performance_seconds = config.performance_seconds;
}

}  // namespace seedhound
