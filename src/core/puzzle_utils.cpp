/**
 * Puzzle utilities implementation.
 */

#include "puzzle_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace cryptex {

namespace {

std::string normalize(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) begin++;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;

    std::string out = s.substr(begin, end - begin);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string fixed(double value, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

}  // namespace

PuzzleStatistics compute_statistics(const PuzzleCatalog& catalog, const std::set<int>& solved_ids) {
    PuzzleStatistics stats;
    stats.total = catalog.size();

    for (PuzzleCategory category : ALL_CATEGORIES) stats.by_category[category] = 0;
    for (Difficulty difficulty : ALL_DIFFICULTIES) stats.by_difficulty[difficulty] = 0;

    for (const auto& entry : catalog.all()) {
        stats.by_category[entry.category]++;
        stats.by_difficulty[entry.difficulty]++;
        if (solved_ids.count(entry.id)) stats.solved++;
    }
    stats.unsolved = stats.total - stats.solved;
    return stats;
}

const PuzzleEntry* recommend_next(const PuzzleCatalog& catalog, const std::set<int>& solved_ids) {
    const PuzzleEntry* best = nullptr;
    for (const auto& entry : catalog.all()) {
        if (solved_ids.count(entry.id) || entry.difficulty == Difficulty::IMPOSSIBLE) continue;
        if (!best || entry.difficulty < best->difficulty ||
            (entry.difficulty == best->difficulty && entry.id < best->id)) {
            best = &entry;
        }
    }
    return best;
}

bool validate_solution(const PuzzleEntry& puzzle, const std::string& proposed) {
    if (!puzzle.solution) return false;
    return normalize(proposed) == normalize(*puzzle.solution);
}

const char* difficulty_description(Difficulty difficulty) {
    switch (difficulty) {
        case Difficulty::EASY:       return "Solvable in seconds with basic algorithms";
        case Difficulty::MEDIUM:     return "Requires optimized algorithms, solvable in seconds to minutes";
        case Difficulty::HARD:       return "Computationally intensive, may take several minutes";
        case Difficulty::IMPOSSIBLE: return "Beyond current computational capabilities without breakthroughs";
    }
    return "";
}

const char* category_description(PuzzleCategory category) {
    switch (category) {
        case PuzzleCategory::BITCOIN_ADDRESS:      return "Find the private key that generates a specific Bitcoin address";
        case PuzzleCategory::HASH_PREIMAGE:        return "Find the input that produces a specific hash output";
        case PuzzleCategory::CIPHER_DECODE:        return "Decrypt or decode an encrypted message or data";
        case PuzzleCategory::PATTERN_ANALYSIS:     return "Identify and continue mathematical or logical patterns";
        case PuzzleCategory::PRIVATE_KEY_RECOVERY: return "Recover private keys from partial information";
    }
    return "";
}

std::string format_large_number(double value) {
    if (value < 1e3) return std::to_string(static_cast<uint64_t>(value < 0 ? 0 : value));
    if (value < 1e6) return fixed(value / 1e3, 1) + "K";
    if (value < 1e9) return fixed(value / 1e6, 1) + "M";
    if (value < 1e12) return fixed(value / 1e9, 1) + "B";
    return fixed(value / 1e12, 1) + "T";
}

std::string format_large_number(const UInt256& value) {
    if (value < UInt256(1000)) return value.to_decimal();
    return format_large_number(value.to_double());
}

UInt256 expected_attempts(uint32_t bits) {
    return UInt256::pow2(bits);
}

bool is_solvable_with_current_tech(const PuzzleEntry& puzzle) {
    if (puzzle.difficulty == Difficulty::IMPOSSIBLE) return false;
    if (puzzle.category == PuzzleCategory::BITCOIN_ADDRESS && puzzle.bits) {
        return *puzzle.bits <= 30;
    }
    return true;
}

std::vector<std::string> additional_hints(const PuzzleEntry& puzzle) {
    std::vector<std::string> hints;
    switch (puzzle.category) {
        case PuzzleCategory::CIPHER_DECODE:
            hints.push_back("Try different encoding/decoding methods");
            hints.push_back("Look for patterns in the encrypted text");
            break;
        case PuzzleCategory::PATTERN_ANALYSIS:
            hints.push_back("Look for mathematical relationships");
            hints.push_back("Consider well-known sequences");
            break;
        case PuzzleCategory::HASH_PREIMAGE:
            hints.push_back("Try common words and phrases");
            hints.push_back("Consider empty strings or simple inputs");
            break;
        case PuzzleCategory::BITCOIN_ADDRESS:
            if (puzzle.bits && *puzzle.bits <= 5) {
                hints.push_back("The search space is very small");
            } else if (puzzle.bits && *puzzle.bits <= 15) {
                hints.push_back("May require optimized search algorithms");
            }
            break;
        case PuzzleCategory::PRIVATE_KEY_RECOVERY:
            break;
    }
    return hints;
}

std::string estimate_solve_time(const PuzzleEntry& puzzle) {
    switch (puzzle.difficulty) {
        case Difficulty::EASY:       return "Less than 1 second";
        case Difficulty::MEDIUM:     return "1-10 seconds";
        case Difficulty::HARD:       return "10 seconds - 1 minute";
        case Difficulty::IMPOSSIBLE: return "Computationally infeasible";
    }
    return "Unknown";
}

std::string json_escape(const std::string& str) {
    std::string result;
    result.reserve(str.size() * 2);
    for (char c : str) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

std::string export_puzzle_data(const PuzzleEntry& puzzle) {
    auto field = [](const char* name, const std::string& value) {
        return std::string("  \"") + name + "\": \"" + json_escape(value) + "\"";
    };

    std::ostringstream ss;
    ss << "{\n"
       << "  \"id\": " << puzzle.id << ",\n"
       << field("type", to_string(puzzle.category)) << ",\n"
       << field("name", puzzle.name) << ",\n"
       << field("description", puzzle.description) << ",\n"
       << field("difficulty", to_string(puzzle.difficulty)) << ",\n"
       << field("challenge", puzzle.challenge) << ",\n"
       << field("hint", puzzle.hint) << "\n"
       << "}";
    return ss.str();
}

std::string export_puzzle_data(const PuzzleCatalog& catalog, int puzzle_id) {
    const PuzzleEntry* entry = catalog.find(puzzle_id);
    return entry ? export_puzzle_data(*entry) : std::string();
}

std::string generate_solving_report(const std::vector<PuzzleResult>& results, const PuzzleCatalog& catalog) {
    UInt256 total_attempts;
    double total_time_ms = 0.0;
    size_t solved = 0;

    // Ordered by difficulty: (solved, total)
    std::map<Difficulty, std::pair<size_t, size_t>> breakdown;

    for (const auto& result : results) {
        total_attempts += result.attempts;
        total_time_ms += result.time_ms;
        if (result.solved) solved++;

        const PuzzleEntry* entry = catalog.find(result.puzzle_id);
        if (entry) {
            auto& row = breakdown[entry->difficulty];
            row.second++;
            if (result.solved) row.first++;
        }
    }

    double count = static_cast<double>(results.size());
    double percent = results.empty() ? 0.0 : 100.0 * static_cast<double>(solved) / count;
    double average_s = results.empty() ? 0.0 : total_time_ms / count / 1000.0;

    std::ostringstream ss;
    ss << "Puzzle Solving Report\n"
       << "=====================\n"
       << "Total Puzzles Attempted: " << results.size() << "\n"
       << "Successfully Solved: " << solved << " (" << fixed(percent, 1) << "%)\n"
       << "Total Attempts: " << format_large_number(total_attempts) << "\n"
       << "Total Time: " << fixed(total_time_ms / 1000.0, 2) << "s\n"
       << "Average Time per Puzzle: " << fixed(average_s, 2) << "s\n"
       << "\n"
       << "By Difficulty:";
    for (const auto& [difficulty, row] : breakdown) {
        ss << "\n  " << to_string(difficulty) << ": " << row.first << "/" << row.second;
    }
    return ss.str();
}

}  // namespace cryptex
