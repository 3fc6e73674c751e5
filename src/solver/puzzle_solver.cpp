// puzzle_solver.cpp - Dispatcher implementation

#include "puzzle_solver.hpp"
#include "../core/logger.hpp"

#include <stdexcept>
#include <thread>
#include <utility>

namespace cryptex {
namespace solver {

PuzzleSolver::PuzzleSolver(const SolverOptions& options)
    : PuzzleSolver(options, DictionarySearch::default_candidates()) {}

PuzzleSolver::PuzzleSolver(const SolverOptions& options, std::vector<std::string> candidates)
    : options_(options),
      cascade_(options.xor_key),
      sequence_(options.strict_tokens),
      dictionary_(std::move(candidates)),
      keyspace_(options.feasibility_threshold, options.success_threshold, options.seed) {}

SolveOutcome PuzzleSolver::solve(const PuzzleDescriptor& puzzle) const {
    Logger::instance().log_solve_start(puzzle);

    std::optional<PuzzleCategory> category = parse_category(puzzle.category);
    if (!category) {
        LOG_WARN("Unrecognized puzzle category '" + puzzle.category + "'");
        SolveOutcome outcome = SolveOutcome::unsolved(UInt256(0), UNRECOGNIZED_CATEGORY, 0.0,
                                                      ErrorKind::UNRECOGNIZED_CATEGORY);
        Logger::instance().log_outcome(puzzle, outcome);
        return outcome;
    }

    const Strategy& strategy = strategy_for(*category);
    LOG_DEBUG("Routing " + puzzle.category + " to " + strategy.get_strategy_type());

    SolveOutcome outcome = strategy.solve(puzzle);
    Logger::instance().log_outcome(puzzle, outcome);
    return outcome;
}

std::future<SolveOutcome> PuzzleSolver::solve_async(PuzzleDescriptor puzzle,
                                                    std::chrono::milliseconds latency) const {
    return std::async(std::launch::async, [this, puzzle = std::move(puzzle), latency]() {
        if (latency.count() > 0) {
            std::this_thread::sleep_for(latency);
        }
        return solve(puzzle);
    });
}

const Strategy& PuzzleSolver::strategy_for(PuzzleCategory category) const {
    switch (category) {
        case PuzzleCategory::CIPHER_DECODE:        return cascade_;
        case PuzzleCategory::PATTERN_ANALYSIS:     return sequence_;
        case PuzzleCategory::HASH_PREIMAGE:        return dictionary_;
        case PuzzleCategory::BITCOIN_ADDRESS:      return keyspace_;
        case PuzzleCategory::PRIVATE_KEY_RECOVERY: return keyspace_;
    }
    throw std::invalid_argument("invalid puzzle category");
}

const char* PuzzleSolver::strategy_description(PuzzleCategory category) {
    switch (category) {
        case PuzzleCategory::BITCOIN_ADDRESS:
            return "Brute force key generation with elliptic curve cryptography";
        case PuzzleCategory::HASH_PREIMAGE:
            return "Dictionary attacks, rainbow tables, and pattern matching";
        case PuzzleCategory::CIPHER_DECODE:
            return "Multi-method decoding: Base64, Hex, ROT13, XOR analysis";
        case PuzzleCategory::PATTERN_ANALYSIS:
            return "Numeric pattern recognition and sequence prediction";
        case PuzzleCategory::PRIVATE_KEY_RECOVERY:
            return "Partial information exploitation with optimized search";
    }
    return "Generic analysis";
}

} // namespace solver
} // namespace cryptex
