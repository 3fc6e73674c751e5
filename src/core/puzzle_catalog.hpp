/**
 * Puzzle Catalog
 *
 * Immutable table of the built-in practice puzzles: five keyspace puzzles
 * modeled on the 2015 Bitcoin puzzle transaction, hash preimages, classic
 * ciphers and number sequences, up to the 50- and 66-bit keyspaces that
 * demonstrate where brute force stops being practical.
 *
 * The catalog is plain data. Callers turn an entry into a PuzzleDescriptor
 * and hand it to the solver.
 */

#pragma once

#include "types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cryptex {

enum class Difficulty : uint8_t {
    EASY = 0,
    MEDIUM = 1,
    HARD = 2,
    IMPOSSIBLE = 3,
};

constexpr Difficulty ALL_DIFFICULTIES[] = {
    Difficulty::EASY,
    Difficulty::MEDIUM,
    Difficulty::HARD,
    Difficulty::IMPOSSIBLE,
};

inline const char* to_string(Difficulty difficulty) {
    switch (difficulty) {
        case Difficulty::EASY:       return "easy";
        case Difficulty::MEDIUM:     return "medium";
        case Difficulty::HARD:       return "hard";
        case Difficulty::IMPOSSIBLE: return "impossible";
    }
    return "?";
}

/**
 * One catalog puzzle.
 */
struct PuzzleEntry {
    int id;
    PuzzleCategory category;
    std::string name;
    std::string description;
    Difficulty difficulty;
    std::string challenge;
    std::string hint;
    std::optional<std::string> solution;  // Reference answer, when one is recorded
    std::string solution_method;
    std::optional<uint32_t> bits;         // Keyspace puzzles only
    std::string address;                  // Keyspace puzzles only
    std::string balance;                  // BTC, keyspace puzzles only

    PuzzleDescriptor descriptor() const {
        return PuzzleDescriptor{to_string(category), challenge, bits, solution};
    }
};

class PuzzleCatalog {
public:
    explicit PuzzleCatalog(std::vector<PuzzleEntry> entries) : entries_(std::move(entries)) {}

    // The built-in 22-puzzle table
    static const PuzzleCatalog& builtin();

    const std::vector<PuzzleEntry>& all() const { return entries_; }
    size_t size() const { return entries_.size(); }

    // nullptr if no puzzle has this id
    const PuzzleEntry* find(int id) const {
        for (const auto& entry : entries_) {
            if (entry.id == id) return &entry;
        }
        return nullptr;
    }

    std::vector<const PuzzleEntry*> by_category(PuzzleCategory category) const {
        std::vector<const PuzzleEntry*> result;
        for (const auto& entry : entries_) {
            if (entry.category == category) result.push_back(&entry);
        }
        return result;
    }

    std::vector<const PuzzleEntry*> by_difficulty(Difficulty difficulty) const {
        std::vector<const PuzzleEntry*> result;
        for (const auto& entry : entries_) {
            if (entry.difficulty == difficulty) result.push_back(&entry);
        }
        return result;
    }

private:
    std::vector<PuzzleEntry> entries_;
};

}  // namespace cryptex
