// keyspace_search.hpp - Bounded brute-force search over a 2^N keyspace
// cryptex - puzzle-solving engine

#pragma once

#include "strategy.hpp"
#include "../core/uint256.hpp"

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>

namespace cryptex {
namespace solver {

/**
 * Keyspace for an N-bit puzzle: 2^N candidate keys.
 * A puzzle key itself lies in [2^(N-1), 2^N).
 */
struct Keyspace {
    uint32_t bits = 0;
    UInt256 size;

    // Throws std::overflow_error for bits >= 256
    static Keyspace of(uint32_t bits) {
        return Keyspace{bits, UInt256::pow2(bits)};
    }

    UInt256 range_start() const {
        return bits == 0 ? UInt256() : UInt256::pow2(bits - 1);
    }
};

/**
 * Bounded Keyspace Search
 *
 * Three tiers by bit width:
 *   bits <= success threshold      -> key recovered
 *   bits <= feasibility threshold  -> sweep budget exhausted, 2^N declared attempts
 *   otherwise                      -> infeasible, 2^N declared attempts, no work done
 *
 * Attempt counters for recovered keys come from a std::mt19937_64 seeded per
 * call, so concurrent solves share no engine. With a configured seed the
 * counters are reproducible.
 */
class KeyspaceSearch : public Strategy {
public:
    using RandomEngine = std::mt19937_64;

    // Simulated keys must fit the 64-bit attempt budget
    static constexpr uint32_t MAX_SUCCESS_THRESHOLD = 62;

    KeyspaceSearch(uint32_t feasibility_threshold, uint32_t success_threshold,
                   std::optional<uint64_t> seed = std::nullopt)
        : feasibility_threshold_(feasibility_threshold),
          success_threshold_(success_threshold),
          seed_(seed) {}

    SolveOutcome solve(const PuzzleDescriptor& puzzle) const override;

    std::string get_strategy_type() const override { return "keyspace-search"; }

    /**
     * @throws std::overflow_error if 2^bits cannot be represented
     */
    SolveOutcome run(uint32_t bits, std::string_view challenge,
                     const std::optional<std::string>& known_solution) const;

    // Uniform in [1, max(1, floor(0.7 * keyspace))]
    static UInt256 simulated_attempts(const Keyspace& keyspace, RandomEngine& rng);

    // Deterministic key in the puzzle range, derived from SHA-256 of the challenge
    static std::string simulated_key(uint32_t bits, std::string_view challenge);

private:
    RandomEngine make_engine(uint32_t bits, std::string_view challenge) const;

    uint32_t feasibility_threshold_;
    uint32_t success_threshold_;
    std::optional<uint64_t> seed_;
};

} // namespace solver
} // namespace cryptex
