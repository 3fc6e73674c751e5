/**
 * Cryptex Core Types
 *
 * Puzzle descriptors, solve outcomes and the error taxonomy shared by the
 * codec library, the strategies and the dispatcher.
 */

#pragma once

#include "uint256.hpp"

#include <cstdint>
#include <chrono>
#include <string>
#include <string_view>
#include <optional>
#include <stdexcept>
#include <utility>

namespace cryptex {

// -----------------------------------------------------------------------------
// Categories
// -----------------------------------------------------------------------------

/**
 * Puzzle category. Closed set: every switch over it is exhaustive.
 */
enum class PuzzleCategory : uint8_t {
    BITCOIN_ADDRESS = 0,       // Keyspace search for an address key
    HASH_PREIMAGE = 1,         // Dictionary search for a hash input
    CIPHER_DECODE = 2,         // Decode cascade over common encodings
    PATTERN_ANALYSIS = 3,      // Numeric / binary sequence inference
    PRIVATE_KEY_RECOVERY = 4,  // Keyspace search with partial key knowledge
};

constexpr PuzzleCategory ALL_CATEGORIES[] = {
    PuzzleCategory::BITCOIN_ADDRESS,
    PuzzleCategory::HASH_PREIMAGE,
    PuzzleCategory::CIPHER_DECODE,
    PuzzleCategory::PATTERN_ANALYSIS,
    PuzzleCategory::PRIVATE_KEY_RECOVERY,
};

inline const char* to_string(PuzzleCategory category) {
    switch (category) {
        case PuzzleCategory::BITCOIN_ADDRESS:      return "bitcoin-address";
        case PuzzleCategory::HASH_PREIMAGE:        return "hash-preimage";
        case PuzzleCategory::CIPHER_DECODE:        return "cipher-decode";
        case PuzzleCategory::PATTERN_ANALYSIS:     return "pattern-analysis";
        case PuzzleCategory::PRIVATE_KEY_RECOVERY: return "private-key-recovery";
    }
    return "?";
}

inline std::optional<PuzzleCategory> parse_category(std::string_view tag) {
    for (PuzzleCategory category : ALL_CATEGORIES) {
        if (tag == to_string(category)) return category;
    }
    return std::nullopt;
}

// -----------------------------------------------------------------------------
// Errors
// -----------------------------------------------------------------------------

enum class ErrorKind : uint8_t {
    MALFORMED_INPUT,        // Codec could not parse its input (recoverable)
    INVALID_CONFIGURATION,  // Strategy misconfigured (fails that strategy)
    INFEASIBLE,             // Keyspace too large to search (modeled outcome)
    UNRECOGNIZED_CATEGORY,  // Descriptor carries an unknown category tag
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MALFORMED_INPUT:       return "MalformedInput";
        case ErrorKind::INVALID_CONFIGURATION: return "InvalidConfiguration";
        case ErrorKind::INFEASIBLE:            return "Infeasible";
        case ErrorKind::UNRECOGNIZED_CATEGORY: return "UnrecognizedCategory";
    }
    return "?";
}

/**
 * Raised by codecs. Strategies catch it and turn it into an outcome.
 */
class DecodeError : public std::runtime_error {
public:
    DecodeError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// -----------------------------------------------------------------------------
// Descriptor / Outcome
// -----------------------------------------------------------------------------

/**
 * What the caller asks the engine to solve.
 */
struct PuzzleDescriptor {
    std::string category;                       // Category tag, e.g. "cipher-decode"
    std::string challenge;                      // Opaque encoded payload
    std::optional<uint32_t> bit_width;          // Keyspace categories only
    std::optional<std::string> known_solution;  // Reference answer, if the caller has one
};

/**
 * Result of one solve call. Only constructible through solved()/unsolved(),
 * so a solution is present exactly when the solve succeeded.
 */
class SolveOutcome {
public:
    static SolveOutcome solved(std::string solution, UInt256 attempts,
                               std::string strategy_name, double elapsed_ms) {
        return SolveOutcome(true, std::move(solution), attempts,
                            std::move(strategy_name), elapsed_ms, std::nullopt);
    }

    static SolveOutcome unsolved(UInt256 attempts, std::string strategy_name, double elapsed_ms,
                                 std::optional<ErrorKind> error = std::nullopt) {
        return SolveOutcome(false, std::nullopt, attempts,
                            std::move(strategy_name), elapsed_ms, error);
    }

    bool succeeded() const { return succeeded_; }
    const std::optional<std::string>& solution() const { return solution_; }
    const UInt256& attempts() const { return attempts_; }
    const std::string& strategy_name() const { return strategy_name_; }
    double elapsed_ms() const { return elapsed_ms_; }
    std::optional<ErrorKind> error() const { return error_; }

private:
    SolveOutcome(bool succeeded, std::optional<std::string> solution, UInt256 attempts,
                 std::string strategy_name, double elapsed_ms, std::optional<ErrorKind> error)
        : succeeded_(succeeded),
          solution_(std::move(solution)),
          attempts_(attempts),
          strategy_name_(std::move(strategy_name)),
          elapsed_ms_(elapsed_ms < 0.0 ? 0.0 : elapsed_ms),
          error_(error) {}

    bool succeeded_;
    std::optional<std::string> solution_;
    UInt256 attempts_;
    std::string strategy_name_;
    double elapsed_ms_;
    std::optional<ErrorKind> error_;
};

/**
 * Monotonic timer for elapsed_ms.
 */
class Stopwatch {
public:
    Stopwatch() : start_(std::chrono::steady_clock::now()) {}

    double elapsed_ms() const {
        auto delta = std::chrono::steady_clock::now() - start_;
        return std::chrono::duration<double, std::milli>(delta).count();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// -----------------------------------------------------------------------------
// Solver Options
// -----------------------------------------------------------------------------

/**
 * Engine tuning. Filled from AppConfig by the caller.
 */
struct SolverOptions {
    static constexpr uint32_t DEFAULT_FEASIBILITY_THRESHOLD = 20;
    static constexpr uint32_t DEFAULT_SUCCESS_THRESHOLD = 15;

    uint32_t feasibility_threshold = DEFAULT_FEASIBILITY_THRESHOLD;
    uint32_t success_threshold = DEFAULT_SUCCESS_THRESHOLD;
    std::string xor_key = "KEY";
    std::optional<uint64_t> seed;  // nullopt = nondeterministic attempt counters
    bool strict_tokens = true;     // Malformed sequence tokens disable numeric patterns
};

}  // namespace cryptex
