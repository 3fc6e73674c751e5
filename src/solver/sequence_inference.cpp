// sequence_inference.cpp - Sequence inference implementation

#include "sequence_inference.hpp"
#include "../core/codec.hpp"
#include "../core/logger.hpp"

#include <charconv>
#include <utility>
#include <stdexcept>

namespace cryptex {
namespace solver {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\n' || s.front() == '\r')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\n' || s.back() == '\r')) {
        s.remove_suffix(1);
    }
    return s;
}

uint64_t mul_mod(uint64_t a, uint64_t b, uint64_t m) {
    return static_cast<uint64_t>(static_cast<unsigned __int128>(a) * b % m);
}

uint64_t pow_mod(uint64_t base, uint64_t exp, uint64_t m) {
    uint64_t result = 1;
    base %= m;
    while (exp > 0) {
        if (exp & 1) result = mul_mod(result, base, m);
        base = mul_mod(base, base, m);
        exp >>= 1;
    }
    return result;
}

}  // namespace

ParsedSequence SequenceInference::parse(std::string_view text, bool leading_integers) {
    ParsedSequence parsed;

    size_t start = 0;
    while (start <= text.size()) {
        size_t comma = text.find(',', start);
        if (comma == std::string_view::npos) comma = text.size();
        std::string_view token = trim(text.substr(start, comma - start));
        start = comma + 1;

        // Empty slots and the "?" placeholder carry no term
        if (token.empty() || token == "?") continue;

        int64_t value = 0;
        auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
        bool consumed_all = ptr == token.data() + token.size();
        if (ec == std::errc() && (consumed_all || leading_integers)) {
            parsed.terms.push_back(value);
        } else {
            parsed.malformed_tokens++;
        }
    }
    return parsed;
}

bool SequenceInference::is_fibonacci_like(const std::vector<int64_t>& terms) {
    if (terms.size() < 3) return false;
    for (size_t i = 2; i < terms.size(); i++) {
        int64_t sum = 0;
        if (__builtin_add_overflow(terms[i - 2], terms[i - 1], &sum) || sum != terms[i]) {
            return false;
        }
    }
    return true;
}

bool SequenceInference::is_prime(uint64_t n) {
    if (n < 2) return false;
    static constexpr uint64_t SMALL[] = {2, 3, 5, 7, 11, 13, 17, 19, 23, 29, 31, 37};
    for (uint64_t p : SMALL) {
        if (n % p == 0) return n == p;
    }

    uint64_t d = n - 1;
    int r = 0;
    while ((d & 1) == 0) {
        d >>= 1;
        r++;
    }

    // These witnesses are sufficient for every n < 2^64
    for (uint64_t a : SMALL) {
        uint64_t x = pow_mod(a, d, n);
        if (x == 1 || x == n - 1) continue;
        bool composite = true;
        for (int i = 1; i < r; i++) {
            x = mul_mod(x, x, n);
            if (x == n - 1) {
                composite = false;
                break;
            }
        }
        if (composite) return false;
    }
    return true;
}

uint64_t SequenceInference::next_prime(uint64_t n) {
    if (n < 2) return 2;
    uint64_t candidate = n + 1;
    while (true) {
        if (candidate == 0) {
            throw std::overflow_error("no 64-bit prime after " + std::to_string(n));
        }
        if (is_prime(candidate)) return candidate;
        candidate++;
    }
}

bool SequenceInference::is_consecutive_primes(const std::vector<int64_t>& terms) {
    if (terms.size() < 2) return false;
    for (size_t i = 0; i < terms.size(); i++) {
        if (terms[i] < 2 || !is_prime(static_cast<uint64_t>(terms[i]))) return false;
        if (i > 0 && next_prime(static_cast<uint64_t>(terms[i - 1])) != static_cast<uint64_t>(terms[i])) {
            return false;
        }
    }
    return true;
}

bool SequenceInference::is_binary_text(std::string_view text) {
    bool has_digit = false;
    for (char c : text) {
        if (c == '0' || c == '1') {
            has_digit = true;
        } else if (c != ' ' && c != '\t' && c != '\n' && c != '\r' && c != '\f' && c != '\v') {
            return false;
        }
    }
    return has_digit;
}

SolveOutcome SequenceInference::run(std::string_view challenge) const {
    Stopwatch timer;
    ParsedSequence parsed = parse(challenge, !strict_tokens_);

    bool numeric_usable = !strict_tokens_ || parsed.malformed_tokens == 0;
    if (!numeric_usable && !parsed.terms.empty()) {
        LOG_DEBUG("Sequence has " + std::to_string(parsed.malformed_tokens) +
                  " malformed token(s); numeric patterns skipped");
    }

    if (numeric_usable && is_fibonacci_like(parsed.terms)) {
        const auto& t = parsed.terms;
        int64_t next = 0;
        if (__builtin_add_overflow(t[t.size() - 2], t[t.size() - 1], &next)) {
            return SolveOutcome::unsolved(UInt256(1), FIBONACCI, timer.elapsed_ms());
        }
        return SolveOutcome::solved(std::to_string(next), UInt256(1), FIBONACCI, timer.elapsed_ms());
    }

    if (numeric_usable && is_consecutive_primes(parsed.terms)) {
        try {
            uint64_t next = next_prime(static_cast<uint64_t>(parsed.terms.back()));
            return SolveOutcome::solved(std::to_string(next), UInt256(1), PRIMES, timer.elapsed_ms());
        } catch (const std::overflow_error& e) {
            LOG_WARN(std::string("Prime extrapolation failed: ") + e.what());
            return SolveOutcome::unsolved(UInt256(1), PRIMES, timer.elapsed_ms());
        }
    }

    if (is_binary_text(challenge)) {
        try {
            std::string text = codec::binary_decode(challenge);
            return SolveOutcome::solved(std::move(text), UInt256(1), BINARY, timer.elapsed_ms());
        } catch (const DecodeError& e) {
            return SolveOutcome::unsolved(UInt256(1), BINARY, timer.elapsed_ms(), e.kind());
        }
    }

    return SolveOutcome::unsolved(UInt256(0), UNRECOGNIZED, timer.elapsed_ms());
}

} // namespace solver
} // namespace cryptex
