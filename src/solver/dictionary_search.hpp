// dictionary_search.hpp - Candidate-list preimage search for hash puzzles
// cryptex - puzzle-solving engine

#pragma once

#include "strategy.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cryptex {
namespace solver {

/**
 * Dictionary Search
 *
 * Walks an ordered candidate list and stops at the first candidate equal to
 * the target. The target is the puzzle's reference answer: this models a
 * dictionary/rainbow-table attack, it does not invert a hash by itself.
 *
 * When the puzzle carries no reference answer but its challenge is a SHA-256
 * digest, candidates are hashed (single and double SHA-256) and compared to
 * the digest instead.
 */
class DictionarySearch : public Strategy {
public:
    static constexpr const char* MATCHED = "Dictionary attack with common inputs";
    static constexpr const char* EXHAUSTED = "Dictionary attack attempted";
    static constexpr const char* MATCHED_SHA256 = "Dictionary attack against SHA-256 digest";
    static constexpr const char* MATCHED_SHA256D = "Dictionary attack against double SHA-256 digest";
    static constexpr const char* NO_TARGET = "Dictionary attack needs a reference answer or a SHA-256 digest";

    static const std::vector<std::string>& default_candidates();

    DictionarySearch() : candidates_(default_candidates()) {}
    explicit DictionarySearch(std::vector<std::string> candidates) : candidates_(std::move(candidates)) {}

    SolveOutcome solve(const PuzzleDescriptor& puzzle) const override;

    std::string get_strategy_type() const override { return "dictionary-search"; }

    // Exact, case-sensitive match of target against the candidate list
    SolveOutcome run(std::string_view target) const;

    // SHA-256 / double SHA-256 match against a 64-digit hex digest
    SolveOutcome run_digest(std::string_view digest_hex) const;

    const std::vector<std::string>& candidates() const { return candidates_; }

private:
    std::vector<std::string> candidates_;
};

} // namespace solver
} // namespace cryptex
