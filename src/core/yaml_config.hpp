/**
 * yaml_config.hpp - Simple YAML configuration loader for cryptex
 *
 * Parses a subset of YAML (key: value pairs with sections, flow and block
 * string lists) without external dependencies.
 * Command-line arguments override config file settings.
 */

#pragma once

#include <string>
#include <fstream>
#include <sstream>
#include <map>
#include <vector>
#include <optional>
#include <filesystem>
#include <iostream>
#include <algorithm>
#include <stdexcept>
#include <cstdint>
#include <cstdlib>
#include <cctype>
#include "types.hpp"

namespace cryptex {

/**
 * Application configuration loaded from config.yml
 */
struct AppConfig {
    // Solver configuration
    uint32_t feasibility_threshold = SolverOptions::DEFAULT_FEASIBILITY_THRESHOLD;
    uint32_t success_threshold = SolverOptions::DEFAULT_SUCCESS_THRESHOLD;
    std::string xor_key = "KEY";
    uint64_t seed = 0;                  // 0 = nondeterministic
    bool strict_tokens = true;

    // Dictionary configuration (nullopt = built-in list)
    std::optional<std::vector<std::string>> dictionary_candidates;

    // Simulated processing latency
    uint32_t latency_min_ms = 500;
    uint32_t latency_max_ms = 2000;

    // Settings
    bool verbose = false;
    bool debug = false;

    // Paths (empty = ~/.cryptex defaults)
    std::string log_dir;
    std::string progress_file;

    /**
     * Get possible config file paths (in order of priority)
     */
    static std::vector<std::string> get_config_paths() {
        std::vector<std::string> paths;

        // 1. Current directory
        paths.push_back("./config.yml");
        paths.push_back("./config.yaml");

        // 2. User home directory
        const char* home_env = std::getenv("HOME");
        std::string home = home_env ? home_env : "";
        if (!home.empty()) {
            paths.push_back(home + "/.cryptex/config.yml");
            paths.push_back(home + "/.cryptex/config.yaml");
        }

        return paths;
    }

    /**
     * Load configuration from YAML file.
     * Returns true if a config file was found and loaded.
     */
    bool load(const std::string& explicit_path = "") {
        std::string config_path;

        if (!explicit_path.empty()) {
            if (std::filesystem::exists(explicit_path)) {
                config_path = explicit_path;
            } else {
                std::cerr << "[!] Config file not found: " << explicit_path << "\n";
                return false;
            }
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
            std::cerr << "[!] Failed to open config file: " << config_path << "\n";
            return false;
        }

        std::cout << "[*] Loading config from: " << config_path << "\n";
        load_from_stream(file);
        return true;
    }

    /**
     * Parse YAML text. Bad lines are reported with their number and skipped.
     * Returns the number of lines that failed to parse.
     */
    size_t load_from_stream(std::istream& in) {
        std::string line;
        std::string current_section;
        std::string current_list;      // Key collecting "- item" lines
        std::vector<std::string> list_items;
        int line_number = 0;
        size_t errors = 0;

        auto flush_list = [&]() {
            if (current_list.empty()) return;
            try {
                parse_list(current_section, current_list, list_items);
            } catch (const std::exception& e) {
                std::cerr << "[!] Config parse error in list '" << current_list << "': " << e.what() << "\n";
                errors++;
            }
            current_list.clear();
            list_items.clear();
        };

        while (std::getline(in, line)) {
            line_number++;

            size_t indent = 0;
            while (indent < line.length() && (line[indent] == ' ' || line[indent] == '\t')) {
                indent++;
            }
            std::string trimmed = strip_comment(line.substr(indent));

            while (!trimmed.empty() && (trimmed.back() == ' ' || trimmed.back() == '\t' || trimmed.back() == '\r')) {
                trimmed.pop_back();
            }

            if (trimmed.empty() || trimmed.substr(0, 3) == "---") continue;

            // Block list item
            if (trimmed[0] == '-' && !current_list.empty()) {
                list_items.push_back(unquote(trim(trimmed.substr(1))));
                continue;
            }
            flush_list();

            size_t colon_pos = trimmed.find(':');
            if (colon_pos == std::string::npos) {
                std::cerr << "[!] Config parse error at line " << line_number << ": expected 'key: value'\n";
                errors++;
                continue;
            }

            std::string key = trim(trimmed.substr(0, colon_pos));
            std::string value = trim(trimmed.substr(colon_pos + 1));

            // Section header
            if (value.empty() && indent == 0) {
                current_section = key;
                continue;
            }

            // Start of a block list
            if (value.empty()) {
                current_list = key;
                continue;
            }

            try {
                if (value.front() == '[') {
                    parse_list(current_section, key, parse_flow_list(value));
                } else {
                    parse_value(current_section, key, unquote(value));
                }
            } catch (const std::exception& e) {
                std::cerr << "[!] Config parse error at line " << line_number << ": " << e.what() << "\n";
                errors++;
            }
        }
        flush_list();

        return errors;
    }

    /**
     * Engine options from the solver section.
     */
    SolverOptions solver_options() const {
        SolverOptions options;
        options.feasibility_threshold = feasibility_threshold;
        options.success_threshold = success_threshold;
        options.xor_key = xor_key;
        if (seed != 0) options.seed = seed;
        options.strict_tokens = strict_tokens;
        return options;
    }

    /**
     * Settings the engine will accept but report as failures at solve time.
     */
    std::vector<std::string> validate() const {
        std::vector<std::string> problems;
        if (xor_key.empty()) {
            problems.push_back("solver.xor_key is empty; XOR decoding will be reported as misconfigured");
        }
        if (success_threshold > feasibility_threshold) {
            problems.push_back("solver.success_threshold exceeds solver.feasibility_threshold");
        }
        if (latency_min_ms > latency_max_ms) {
            problems.push_back("simulation.latency_min_ms exceeds simulation.latency_max_ms");
        }
        return problems;
    }

    /**
     * Strict unsigned parsing shared with the command line: digits only,
     * no sign, no trailing text. Out-of-range values throw std::out_of_range.
     */
    static uint64_t parse_u64(const std::string& value) {
        if (value.empty() || !std::isdigit(static_cast<unsigned char>(value[0]))) {
            throw std::invalid_argument("not an unsigned integer: " + value);
        }
        size_t consumed = 0;
        uint64_t result = std::stoull(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument("not an unsigned integer: " + value);
        }
        return result;
    }

    static uint32_t parse_u32(const std::string& value) {
        uint64_t result = parse_u64(value);
        if (result > UINT32_MAX) {
            throw std::out_of_range("value out of range: " + value);
        }
        return static_cast<uint32_t>(result);
    }

private:
    void parse_value(const std::string& section, const std::string& key, const std::string& value) {
        if (section == "solver") {
            if (key == "feasibility_threshold") feasibility_threshold = parse_u32(value);
            else if (key == "success_threshold") success_threshold = parse_u32(value);
            else if (key == "xor_key") xor_key = value;
            else if (key == "seed") seed = parse_u64(value);
            else if (key == "strict_tokens") strict_tokens = parse_bool(value);
        }
        else if (section == "simulation") {
            if (key == "latency_min_ms") latency_min_ms = parse_u32(value);
            else if (key == "latency_max_ms") latency_max_ms = parse_u32(value);
        }
        else if (section == "settings") {
            if (key == "verbose") verbose = parse_bool(value);
            else if (key == "debug") debug = parse_bool(value);
        }
        else if (section == "paths") {
            if (key == "log_dir") log_dir = value;
            else if (key == "progress_file") progress_file = value;
        }
    }

    void parse_list(const std::string& section, const std::string& key, const std::vector<std::string>& items) {
        if (section == "dictionary" && key == "candidates") {
            dictionary_candidates = items;
        }
    }

    static std::string trim(const std::string& s) {
        size_t begin = 0;
        size_t end = s.size();
        while (begin < end && (s[begin] == ' ' || s[begin] == '\t')) begin++;
        while (end > begin && (s[end - 1] == ' ' || s[end - 1] == '\t')) end--;
        return s.substr(begin, end - begin);
    }

    // Drop a trailing "# comment" that is not inside quotes
    static std::string strip_comment(const std::string& s) {
        char quote = 0;
        for (size_t i = 0; i < s.size(); i++) {
            char c = s[i];
            if (quote) {
                if (c == quote) quote = 0;
            } else if (c == '"' || c == '\'') {
                quote = c;
            } else if (c == '#' && (i == 0 || s[i - 1] == ' ' || s[i - 1] == '\t')) {
                return s.substr(0, i);
            }
        }
        return s;
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
        if (lower == "true" || lower == "yes" || lower == "1" || lower == "on") return true;
        if (lower == "false" || lower == "no" || lower == "0" || lower == "off") return false;
        throw std::invalid_argument("not a boolean: " + value);
    }

    // [a, "b, c", 'd'] -> {a, "b, c", d}
    static std::vector<std::string> parse_flow_list(const std::string& value) {
        std::vector<std::string> result;

        std::string clean = value;
        if (clean.front() == '[') clean.erase(0, 1);
        if (clean.empty() || clean.back() != ']') {
            throw std::invalid_argument("unterminated list");
        }
        clean.pop_back();
        if (trim(clean).empty()) return result;

        std::string item;
        char quote = 0;
        for (char c : clean) {
            if (quote) {
                item += c;
                if (c == quote) quote = 0;
            } else if (c == '"' || c == '\'') {
                quote = c;
                item += c;
            } else if (c == ',') {
                result.push_back(unquote(trim(item)));
                item.clear();
            } else {
                item += c;
            }
        }
        if (quote) {
            throw std::invalid_argument("unterminated quote in list");
        }
        result.push_back(unquote(trim(item)));
        return result;
    }
};

/**
 * Apply config file settings to Arguments struct.
 * Only applies settings where command-line wasn't explicitly set.
 */
template<typename Arguments>
void apply_config_to_args(Arguments& args, const AppConfig& config) {
    if (!args.seed && config.seed != 0) {
        args.seed = config.seed;
    }
    if (config.verbose) args.verbose = true;
    if (config.debug) args.debug = true;
    if (args.progress_file.empty() && !config.progress_file.empty()) {
        args.progress_file = config.progress_file;
    }
}

}  // namespace cryptex
