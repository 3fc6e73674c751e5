/**
 * Cryptex Logger
 *
 * File-based logging for solve sessions.
 * Logs to ~/.cryptex/cryptex.log with timestamps and rotation.
 */

#pragma once

#include "types.hpp"

#include <string>
#include <fstream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <mutex>
#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <ctime>

namespace cryptex {

class Logger {
public:
    enum class Level {
        DEBUG,
        INFO,
        WARN,
        ERR     // Named ERR to avoid Windows ERROR macro conflict
    };

    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    bool init(const std::string& log_dir = "", Level min_level = Level::INFO) {
        std::lock_guard<std::mutex> lock(mutex_);

        std::string dir = log_dir;
        if (dir.empty()) {
            const char* home = std::getenv("HOME");
            dir = home ? std::string(home) + "/.cryptex" : ".";
        }

        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            return false;
        }

        log_path_ = dir + "/cryptex.log";

        // Rotate log if too large (> 10MB); a failed rotation keeps appending
        if (std::filesystem::exists(log_path_, ec) &&
            std::filesystem::file_size(log_path_, ec) > 10 * 1024 * 1024 && !ec) {
            std::string backup = log_path_ + ".old";
            std::filesystem::remove(backup, ec);
            std::filesystem::rename(log_path_, backup, ec);
        }

        if (log_file_.is_open()) {
            log_file_.close();
        }
        log_file_.open(log_path_, std::ios::app);
        if (!log_file_.is_open()) {
            return false;
        }

        min_level_ = min_level;
        initialized_ = true;

        // Write directly: we already hold the mutex
        log_file_ << timestamp() << " [INFO ] === Cryptex Logger Started ===\n";
        log_file_.flush();

        return true;
    }

    void log(Level level, const std::string& message) {
        if (!initialized_) return;

        std::lock_guard<std::mutex> lock(mutex_);
        if (level < min_level_) return;

        log_file_ << timestamp() << " [" << level_str(level) << "] " << message << "\n";
        log_file_.flush();
    }

    void log_solve_start(const PuzzleDescriptor& puzzle) {
        std::stringstream ss;
        ss << "SOLVE: Category=" << puzzle.category
           << ", ChallengeBytes=" << puzzle.challenge.size();
        if (puzzle.bit_width) {
            ss << ", Bits=" << *puzzle.bit_width;
        }
        ss << ", KnownSolution=" << (puzzle.known_solution ? "yes" : "no");
        log(Level::DEBUG, ss.str());
    }

    void log_outcome(const PuzzleDescriptor& puzzle, const SolveOutcome& outcome) {
        std::stringstream ss;
        ss << (outcome.succeeded() ? "SOLVED" : "UNSOLVED")
           << ": Category=" << puzzle.category
           << ", Method=\"" << outcome.strategy_name() << "\""
           << ", Attempts=" << outcome.attempts().to_decimal()
           << ", ElapsedMs=" << std::fixed << std::setprecision(3) << outcome.elapsed_ms();
        if (outcome.error()) {
            ss << ", Error=" << to_string(*outcome.error());
        }
        log(Level::INFO, ss.str());
    }

    void log_error(const std::string& error_msg) {
        log(Level::ERR, "ERROR: " + error_msg);
    }

    std::string get_log_path() const { return log_path_; }

    ~Logger() {
        if (initialized_) {
            log(Level::INFO, "=== Cryptex Logger Stopped ===");
            log_file_.close();
        }
    }

private:
    Logger() : initialized_(false), min_level_(Level::INFO) {}

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    static std::string timestamp() {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm local{};
        localtime_r(&time_t, &local);
        std::stringstream ss;
        ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
           << "." << std::setfill('0') << std::setw(3) << ms.count();
        return ss.str();
    }

    static const char* level_str(Level level) {
        switch (level) {
            case Level::DEBUG: return "DEBUG";
            case Level::INFO:  return "INFO ";
            case Level::WARN:  return "WARN ";
            case Level::ERR:   return "ERROR";
        }
        return "?????";
    }

    std::atomic<bool> initialized_;
    Level min_level_;
    std::string log_path_;
    std::ofstream log_file_;
    std::mutex mutex_;
};

// Convenience macros
#define LOG_INFO(msg)  cryptex::Logger::instance().log(cryptex::Logger::Level::INFO, msg)
#define LOG_WARN(msg)  cryptex::Logger::instance().log(cryptex::Logger::Level::WARN, msg)
#define LOG_ERROR(msg) cryptex::Logger::instance().log(cryptex::Logger::Level::ERR, msg)
#define LOG_DEBUG(msg) cryptex::Logger::instance().log(cryptex::Logger::Level::DEBUG, msg)

}  // namespace cryptex
