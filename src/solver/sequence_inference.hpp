// sequence_inference.hpp - Next-term inference for pattern-analysis puzzles
// cryptex - puzzle-solving engine

#pragma once

#include "strategy.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace cryptex {
namespace solver {

/**
 * Parsed form of a comma-separated numeric challenge.
 */
struct ParsedSequence {
    std::vector<int64_t> terms;
    size_t malformed_tokens = 0;  // Tokens that were neither integers nor '?' placeholders
};

/**
 * Sequence Inference
 *
 * Classification order:
 *   1. Fibonacci-style recurrence (each term is the sum of the previous two)
 *   2. Consecutive primes
 *   3. Raw text of 0/1/whitespace decoded as binary octets
 * Anything else is reported as unrecognized.
 */
class SequenceInference : public Strategy {
public:
    static constexpr const char* FIBONACCI = "Fibonacci sequence detection";
    static constexpr const char* PRIMES = "Prime number sequence detection";
    static constexpr const char* BINARY = "Binary to ASCII conversion";
    static constexpr const char* UNRECOGNIZED = "No recognized pattern";

    explicit SequenceInference(bool strict_tokens = true) : strict_tokens_(strict_tokens) {}

    SolveOutcome solve(const PuzzleDescriptor& puzzle) const override {
        return run(puzzle.challenge);
    }

    std::string get_strategy_type() const override { return "sequence-inference"; }

    SolveOutcome run(std::string_view challenge) const;

    // With leading_integers, a token such as "21?" or "3.5" contributes its
    // leading integer; only tokens with no leading digits are malformed.
    static ParsedSequence parse(std::string_view text, bool leading_integers = false);

    static bool is_fibonacci_like(const std::vector<int64_t>& terms);
    static bool is_consecutive_primes(const std::vector<int64_t>& terms);
    static bool is_binary_text(std::string_view text);

    // Deterministic Miller-Rabin, exact for all 64-bit inputs
    static bool is_prime(uint64_t n);

    // Smallest prime strictly greater than n. Throws std::overflow_error past 2^64.
    static uint64_t next_prime(uint64_t n);

private:
    bool strict_tokens_;
};

} // namespace solver
} // namespace cryptex
