// decode_cascade.cpp - Decode cascade implementation

#include "decode_cascade.hpp"
#include "../core/codec.hpp"
#include "../core/logger.hpp"

#include <optional>

namespace cryptex {
namespace solver {

namespace {

// Adapters giving every codec the same (input, key) signature
std::string try_base64(std::string_view input, std::string_view) { return codec::base64_decode(input); }
std::string try_hex(std::string_view input, std::string_view) { return codec::hex_decode(input); }
std::string try_rot13(std::string_view input, std::string_view) { return codec::rot13(input); }
std::string try_binary(std::string_view input, std::string_view) { return codec::binary_decode(input); }
std::string try_xor(std::string_view input, std::string_view key) { return codec::xor_decode(input, key); }

// Transient record of one codec trial
struct CodecAttempt {
    const DecodeCascade::Codec* codec;
    std::optional<std::string> output;
};

}  // namespace

const std::array<DecodeCascade::Codec, DecodeCascade::CODEC_COUNT>& DecodeCascade::codecs() {
    static const std::array<Codec, CODEC_COUNT> order = {{
        {"Base64", &try_base64},
        {"Hex to ASCII", &try_hex},
        {"ROT13", &try_rot13},
        {"Binary to ASCII", &try_binary},
        {"XOR with key", &try_xor},
    }};
    return order;
}

std::string DecodeCascade::codec_display_name(const Codec& codec) const {
    if (codec.decode == &try_xor) {
        return "XOR with " + xor_key_;
    }
    return codec.name;
}

SolveOutcome DecodeCascade::run(std::string_view challenge) const {
    Stopwatch timer;
    uint64_t attempts = 0;

    for (const Codec& codec : codecs()) {
        attempts++;

        CodecAttempt attempt{&codec, std::nullopt};
        try {
            attempt.output = codec.decode(challenge, xor_key_);
        } catch (const DecodeError& e) {
            if (e.kind() == ErrorKind::INVALID_CONFIGURATION) {
                std::string method = codec_display_name(codec) + " misconfigured: " + e.what();
                LOG_WARN("Decode cascade stopped: " + method);
                return SolveOutcome::unsolved(UInt256(attempts), method, timer.elapsed_ms(),
                                              ErrorKind::INVALID_CONFIGURATION);
            }
            continue;  // Malformed for this codec, try the next one
        }

        if (attempt.output && is_printable(*attempt.output)) {
            return SolveOutcome::solved(std::move(*attempt.output), UInt256(attempts),
                                        codec_display_name(*attempt.codec), timer.elapsed_ms());
        }
    }

    return SolveOutcome::unsolved(UInt256(attempts), EXHAUSTED, timer.elapsed_ms());
}

} // namespace solver
} // namespace cryptex
