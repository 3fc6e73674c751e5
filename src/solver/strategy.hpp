// strategy.hpp - Abstract solve strategy interface
// cryptex - puzzle-solving engine

#pragma once

#include "../core/types.hpp"

#include <string>

namespace cryptex {
namespace solver {

// One way of attacking a puzzle. Implementations hold only immutable
// configuration, so a single instance may serve concurrent solves.
class Strategy {
public:
    virtual ~Strategy() = default;

    // Never throws for expected failures; those come back as unsolved outcomes
    virtual SolveOutcome solve(const PuzzleDescriptor& puzzle) const = 0;

    // Short identifier, e.g. "decode-cascade"
    virtual std::string get_strategy_type() const = 0;
};

} // namespace solver
} // namespace cryptex
