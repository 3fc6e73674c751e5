// dictionary_search.cpp - Dictionary search implementation

#include "dictionary_search.hpp"
#include "../core/digest.hpp"
#include "../core/logger.hpp"

#include <algorithm>
#include <cctype>

namespace cryptex {
namespace solver {

const std::vector<std::string>& DictionarySearch::default_candidates() {
    static const std::vector<std::string> candidates = {
        "", "foo", "bar", "test", "password", "1", "2", "3",
        "bitcoin", "satoshi", "hello", "world"
    };
    return candidates;
}

SolveOutcome DictionarySearch::solve(const PuzzleDescriptor& puzzle) const {
    if (puzzle.known_solution) {
        return run(*puzzle.known_solution);
    }
    if (digest::is_sha256_hex(puzzle.challenge)) {
        return run_digest(puzzle.challenge);
    }
    LOG_WARN("Dictionary search skipped: no reference answer and challenge is not a SHA-256 digest");
    return SolveOutcome::unsolved(UInt256(0), NO_TARGET, 0.0, ErrorKind::INVALID_CONFIGURATION);
}

SolveOutcome DictionarySearch::run(std::string_view target) const {
    Stopwatch timer;
    uint64_t attempts = 0;

    for (const auto& candidate : candidates_) {
        attempts++;
        if (candidate == target) {
            return SolveOutcome::solved(candidate, UInt256(attempts), MATCHED, timer.elapsed_ms());
        }
    }
    return SolveOutcome::unsolved(UInt256(attempts), EXHAUSTED, timer.elapsed_ms());
}

SolveOutcome DictionarySearch::run_digest(std::string_view digest_hex) const {
    Stopwatch timer;

    std::string target(digest_hex);
    std::transform(target.begin(), target.end(), target.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    uint64_t attempts = 0;
    for (const auto& candidate : candidates_) {
        attempts++;
        if (digest::to_hex(digest::sha256(candidate)) == target) {
            return SolveOutcome::solved(candidate, UInt256(attempts), MATCHED_SHA256, timer.elapsed_ms());
        }
        if (digest::to_hex(digest::sha256d(candidate)) == target) {
            return SolveOutcome::solved(candidate, UInt256(attempts), MATCHED_SHA256D, timer.elapsed_ms());
        }
    }
    return SolveOutcome::unsolved(UInt256(attempts), EXHAUSTED, timer.elapsed_ms());
}

} // namespace solver
} // namespace cryptex
