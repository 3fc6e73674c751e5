// keyspace_search.cpp - Bounded keyspace search implementation

#include "keyspace_search.hpp"
#include "../core/digest.hpp"
#include "../core/logger.hpp"

#include <sstream>

namespace cryptex {
namespace solver {

namespace {

std::string sweep_label(const Keyspace& keyspace) {
    std::ostringstream ss;
    ss << "Brute force key search (2^" << keyspace.bits << " = "
       << keyspace.size.to_decimal() << " possible keys)";
    return ss.str();
}

// splitmix64 finalizer
uint64_t mix64(uint64_t x) {
    x += 0x9e3779b97f4a7c15ULL;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
    x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
    return x ^ (x >> 31);
}

}  // namespace

SolveOutcome KeyspaceSearch::solve(const PuzzleDescriptor& puzzle) const {
    // Deliberately not treated as a zero-width keyspace: a missing width is a
    // malformed puzzle, not a trivially solved one.
    if (!puzzle.bit_width) {
        LOG_WARN("Keyspace search skipped: puzzle has no bit width");
        return SolveOutcome::unsolved(UInt256(0), "Brute force key search requires a bit width",
                                      0.0, ErrorKind::INVALID_CONFIGURATION);
    }
    return run(*puzzle.bit_width, puzzle.challenge, puzzle.known_solution);
}

SolveOutcome KeyspaceSearch::run(uint32_t bits, std::string_view challenge,
                                 const std::optional<std::string>& known_solution) const {
    Stopwatch timer;

    if (success_threshold_ > feasibility_threshold_ || success_threshold_ > MAX_SUCCESS_THRESHOLD) {
        std::ostringstream ss;
        ss << "Brute force key search misconfigured: success threshold " << success_threshold_;
        if (success_threshold_ > MAX_SUCCESS_THRESHOLD) {
            ss << " exceeds maximum " << MAX_SUCCESS_THRESHOLD;
        } else {
            ss << " exceeds feasibility threshold " << feasibility_threshold_;
        }
        LOG_WARN(ss.str());
        return SolveOutcome::unsolved(UInt256(0), ss.str(), timer.elapsed_ms(),
                                      ErrorKind::INVALID_CONFIGURATION);
    }

    Keyspace keyspace = Keyspace::of(bits);

    if (bits > feasibility_threshold_) {
        std::ostringstream ss;
        ss << "Brute force (2^" << bits << " keys) - computationally infeasible";
        LOG_INFO("Keyspace of " + keyspace.size.to_grouped_decimal() + " keys exceeds feasibility threshold 2^" +
                 std::to_string(feasibility_threshold_));
        return SolveOutcome::unsolved(keyspace.size, ss.str(), timer.elapsed_ms(), ErrorKind::INFEASIBLE);
    }

    if (bits > success_threshold_) {
        return SolveOutcome::unsolved(keyspace.size, sweep_label(keyspace) + " - exceeded fast search budget",
                                      timer.elapsed_ms());
    }

    RandomEngine rng = make_engine(bits, challenge);
    UInt256 attempts = simulated_attempts(keyspace, rng);
    std::string key = known_solution ? *known_solution : simulated_key(bits, challenge);

    return SolveOutcome::solved(std::move(key), attempts, sweep_label(keyspace), timer.elapsed_ms());
}

UInt256 KeyspaceSearch::simulated_attempts(const Keyspace& keyspace, RandomEngine& rng) {
    UInt256 budget = keyspace.size;
    budget *= 7;
    budget.divmod(10);

    if (budget.is_zero()) {
        return UInt256(1);
    }
    std::uniform_int_distribution<uint64_t> dist(1, budget.to_u64());
    return UInt256(dist(rng));
}

std::string KeyspaceSearch::simulated_key(uint32_t bits, std::string_view challenge) {
    if (bits == 0) return "0";
    if (bits - 1 >= 64) {
        throw std::overflow_error("simulated key for " + std::to_string(bits) + " bits exceeds 64 bits");
    }

    digest::Sha256Hash hash = digest::sha256(challenge);
    uint64_t value = 0;
    for (int i = 0; i < 8; i++) {
        value = (value << 8) | hash[i];
    }

    uint32_t span_bits = bits - 1;
    uint64_t start = 1ULL << span_bits;
    uint64_t offset = span_bits == 0 ? 0 : value & (start - 1);
    return std::to_string(start + offset);
}

KeyspaceSearch::RandomEngine KeyspaceSearch::make_engine(uint32_t bits, std::string_view challenge) const {
    uint64_t base = 0;
    if (seed_) {
        base = *seed_;
    } else {
        std::random_device rd;
        base = (static_cast<uint64_t>(rd()) << 32) | rd();
    }

    // FNV-1a over the challenge, folded with the width
    uint64_t h = 14695981039346656037ULL;
    for (char c : challenge) {
        h ^= static_cast<uint8_t>(c);
        h *= 1099511628211ULL;
    }
    return RandomEngine(mix64(base ^ mix64(h ^ bits)));
}

} // namespace solver
} // namespace cryptex
