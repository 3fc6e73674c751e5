/**
 * Solve Progress Persistence
 *
 * Records which catalog puzzles have been solved, and with what answer, so
 * the CLI can show status and recommend the next puzzle across runs.
 * Stored in ~/.cryptex/progress.state unless a path is configured.
 *
 * SAFETY FEATURES:
 * - Atomic saves: Write to temp file, then rename (survives Ctrl+C)
 * - Checksum validation: A corrupted file loads as empty progress
 */

#pragma once

#include "codec.hpp"
#include "logger.hpp"

#include <string>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <map>
#include <set>
#include <cstdio>
#include <utility>

#include <unistd.h>

namespace cryptex {

/**
 * Solved puzzles: id -> solution text.
 */
struct ProgressState {
    std::map<int, std::string> solutions;
    std::string timestamp;              // Last save timestamp
    bool valid = false;                 // Loaded from an intact file?

    std::set<int> solved_ids() const {
        std::set<int> ids;
        for (const auto& [id, solution] : solutions) ids.insert(id);
        return ids;
    }

    bool is_solved(int id) const { return solutions.count(id) > 0; }
};

class ProgressStore {
public:
    // Empty path selects the default location
    explicit ProgressStore(std::string path = "")
        : path_(path.empty() ? default_path() : std::move(path)) {}

    static std::string default_path() {
        const char* home_env = std::getenv("HOME");
        std::string home = home_env ? home_env : ".";
        return home + "/.cryptex/progress.state";
    }

    const std::string& path() const { return path_; }

    /**
     * FNV-1a over ids and solution bytes, in id order.
     */
    static uint32_t compute_checksum(const ProgressState& state) {
        uint32_t hash = 2166136261u;
        auto mix_byte = [&hash](uint8_t b) {
            hash ^= b;
            hash *= 16777619u;
        };
        for (const auto& [id, solution] : state.solutions) {
            uint32_t uid = static_cast<uint32_t>(id);
            for (int i = 0; i < 4; i++) mix_byte(static_cast<uint8_t>(uid >> (i * 8)));
            for (char c : solution) mix_byte(static_cast<uint8_t>(c));
            mix_byte(0);
        }
        return hash;
    }

    /**
     * Save with atomic write.
     *
     * Solutions are hex-encoded so empty answers and arbitrary bytes survive
     * the line format.
     */
    bool save(const ProgressState& state) const {
        std::filesystem::path target(path_);
        std::error_code ec;
        if (target.has_parent_path()) {
            std::filesystem::create_directories(target.parent_path(), ec);
            if (ec) {
                LOG_ERROR("Failed to create progress directory: " + ec.message());
                return false;
            }
        }

        std::string temp_path = path_ + ".tmp";
        {
            std::ofstream file(temp_path, std::ios::out | std::ios::trunc);
            if (!file.is_open()) {
                LOG_ERROR("Failed to create temp progress file: " + temp_path);
                return false;
            }

            file << "# Cryptex Solve Progress v1\n";
            file << "# Do not modify manually - checksum protected\n\n";
            for (const auto& [id, solution] : state.solutions) {
                file << "puzzle." << id << "=" << codec::hex_encode(solution) << "\n";
            }
            file << "timestamp=" << timestamp() << "\n";
            file << "checksum=" << compute_checksum(state) << "\n";
            file.flush();
            if (!file) {
                LOG_ERROR("Failed to write progress file: " + temp_path);
                return false;
            }
        }

        {
            FILE* f = fopen(temp_path.c_str(), "r");
            if (f) {
                fsync(fileno(f));
                fclose(f);
            }
        }

        std::filesystem::rename(temp_path, path_, ec);
        if (ec) {
            LOG_ERROR("Failed to save progress file: " + ec.message());
            std::filesystem::remove(temp_path, ec);
            return false;
        }
        return true;
    }

    /**
     * Load and verify. Missing, unreadable or corrupted files give an
     * empty state with valid == false.
     */
    ProgressState load() const {
        ProgressState state;

        std::ifstream file(path_);
        if (!file.is_open()) {
            return state;
        }

        uint32_t loaded_checksum = 0;
        bool has_checksum = false;

        std::string line;
        while (std::getline(file, line)) {
            if (line.empty() || line[0] == '#') continue;

            auto pos = line.find('=');
            if (pos == std::string::npos) continue;

            std::string key = line.substr(0, pos);
            std::string value = line.substr(pos + 1);

            try {
                if (key.rfind("puzzle.", 0) == 0) {
                    int id = std::stoi(key.substr(7));
                    state.solutions[id] = codec::hex_decode(value);
                } else if (key == "timestamp") {
                    state.timestamp = value;
                } else if (key == "checksum") {
                    loaded_checksum = static_cast<uint32_t>(std::stoul(value));
                    has_checksum = true;
                }
            } catch (const std::exception& e) {
                LOG_WARN("Progress file parse error: " + std::string(e.what()));
                return ProgressState();
            }
        }

        if (!has_checksum || compute_checksum(state) != loaded_checksum) {
            LOG_WARN("Progress file checksum mismatch - ignoring " + path_);
            return ProgressState();
        }

        state.valid = true;
        return state;
    }

    // Load, add, save
    bool record(int id, const std::string& solution) const {
        ProgressState state = load();
        state.solutions[id] = solution;
        return save(state);
    }

    void clear() const {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        std::filesystem::remove(path_ + ".tmp", ec);
    }

    bool exists() const {
        std::error_code ec;
        return std::filesystem::exists(path_, ec);
    }

private:
    static std::string timestamp() {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        std::tm tm_buf{};
        localtime_r(&time, &tm_buf);
        std::ostringstream ss;
        ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }

    std::string path_;
};

}  // namespace cryptex
