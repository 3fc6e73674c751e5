// puzzle_solver.hpp - Category dispatcher over the solve strategies
// cryptex - puzzle-solving engine

#pragma once

#include "strategy.hpp"
#include "decode_cascade.hpp"
#include "sequence_inference.hpp"
#include "dictionary_search.hpp"
#include "keyspace_search.hpp"

#include <chrono>
#include <future>
#include <string>
#include <vector>

namespace cryptex {
namespace solver {

/**
 * Puzzle Solver
 *
 * Routes a descriptor to the strategy for its category:
 *
 *   cipher-decode         -> DecodeCascade
 *   pattern-analysis      -> SequenceInference
 *   hash-preimage         -> DictionarySearch
 *   bitcoin-address       -> KeyspaceSearch
 *   private-key-recovery  -> KeyspaceSearch
 *
 * No retries and no caching. The solver is immutable after construction and
 * may be shared across threads.
 */
class PuzzleSolver {
public:
    static constexpr const char* UNRECOGNIZED_CATEGORY = "unrecognized category";

    explicit PuzzleSolver(const SolverOptions& options = SolverOptions());
    PuzzleSolver(const SolverOptions& options, std::vector<std::string> candidates);

    /**
     * Solve one puzzle on the calling thread.
     *
     * @throws std::overflow_error for keyspace widths of 256 bits or more
     */
    SolveOutcome solve(const PuzzleDescriptor& puzzle) const;

    /**
     * Solve on a worker after waiting `latency`. The descriptor is copied,
     * the solver must outlive the returned future.
     */
    std::future<SolveOutcome> solve_async(PuzzleDescriptor puzzle,
                                          std::chrono::milliseconds latency) const;

    const Strategy& strategy_for(PuzzleCategory category) const;

    // Human-readable approach for a category
    static const char* strategy_description(PuzzleCategory category);

    const SolverOptions& options() const { return options_; }

private:
    SolverOptions options_;
    DecodeCascade cascade_;
    SequenceInference sequence_;
    DictionarySearch dictionary_;
    KeyspaceSearch keyspace_;
};

} // namespace solver
} // namespace cryptex
