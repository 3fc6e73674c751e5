/**
 * Puzzle Utilities
 *
 * Catalog statistics, progression helpers, display formatting and the
 * post-run solving report.
 */

#pragma once

#include "puzzle_catalog.hpp"
#include "uint256.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace cryptex {

struct PuzzleStatistics {
    size_t total = 0;
    std::map<PuzzleCategory, size_t> by_category;
    std::map<Difficulty, size_t> by_difficulty;
    size_t solved = 0;
    size_t unsolved = 0;
};

/**
 * One solve attempt as recorded by a batch run.
 */
struct PuzzleResult {
    int puzzle_id = 0;
    bool solved = false;
    std::optional<std::string> solution;
    UInt256 attempts;
    double time_ms = 0.0;
    std::chrono::system_clock::time_point timestamp;
};

// Every category and difficulty is present in the maps, with zero counts if unused.
// Solved ids that are not in the catalog are ignored.
PuzzleStatistics compute_statistics(const PuzzleCatalog& catalog, const std::set<int>& solved_ids);

// Easiest unsolved, not-impossible puzzle; lowest id breaks ties. nullptr when none remain.
const PuzzleEntry* recommend_next(const PuzzleCatalog& catalog, const std::set<int>& solved_ids);

// Trimmed, case-insensitive comparison. False if the puzzle has no reference answer.
bool validate_solution(const PuzzleEntry& puzzle, const std::string& proposed);

const char* difficulty_description(Difficulty difficulty);
const char* category_description(PuzzleCategory category);

// 999 -> "999", 1500 -> "1.5K", 1048576 -> "1.0M" ... up to "T"
std::string format_large_number(double value);
std::string format_large_number(const UInt256& value);

// 2^bits; throws std::overflow_error for bits >= 256
UInt256 expected_attempts(uint32_t bits);

bool is_solvable_with_current_tech(const PuzzleEntry& puzzle);

std::vector<std::string> additional_hints(const PuzzleEntry& puzzle);

std::string estimate_solve_time(const PuzzleEntry& puzzle);

// JSON string-body escaping: quotes, backslashes and control characters
std::string json_escape(const std::string& str);

/**
 * Public fields of a puzzle as pretty-printed JSON (two-space indent):
 * id, type, name, description, difficulty, challenge, hint.
 * The solution is never included.
 */
std::string export_puzzle_data(const PuzzleEntry& puzzle);

// Empty string when the id is not in the catalog
std::string export_puzzle_data(const PuzzleCatalog& catalog, int puzzle_id);

std::string generate_solving_report(const std::vector<PuzzleResult>& results, const PuzzleCatalog& catalog);

}  // namespace cryptex
