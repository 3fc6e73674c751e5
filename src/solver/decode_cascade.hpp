// decode_cascade.hpp - Ordered trial of codecs against a cipher challenge
// cryptex - puzzle-solving engine

#pragma once

#include "strategy.hpp"

#include <array>
#include <string>
#include <string_view>
#include <utility>

namespace cryptex {
namespace solver {

/**
 * Decode Cascade
 *
 * Tries each codec in a fixed priority order and accepts the first output
 * that is non-empty printable ASCII:
 *
 *   Base64 -> Hex to ASCII -> ROT13 -> Binary to ASCII -> XOR with key
 *
 * The order decides which codec wins when several produce printable text.
 * It must not be re-sorted.
 */
class DecodeCascade : public Strategy {
public:
    using DecodeFn = std::string (*)(std::string_view input, std::string_view key);

    // One cascade entry: display name and decoder
    struct Codec {
        const char* name;
        DecodeFn decode;
    };

    static constexpr size_t CODEC_COUNT = 5;

    // The trial order
    static const std::array<Codec, CODEC_COUNT>& codecs();

    static constexpr const char* EXHAUSTED = "All decoding methods exhausted";

    explicit DecodeCascade(std::string xor_key = "KEY") : xor_key_(std::move(xor_key)) {}

    SolveOutcome solve(const PuzzleDescriptor& puzzle) const override {
        return run(puzzle.challenge);
    }

    std::string get_strategy_type() const override { return "decode-cascade"; }

    SolveOutcome run(std::string_view challenge) const;

private:
    std::string codec_display_name(const Codec& codec) const;

    std::string xor_key_;
};

} // namespace solver
} // namespace cryptex
