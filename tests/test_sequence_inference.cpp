/**
 * Sequence Inference Tests
 *
 * Fibonacci and prime extrapolation, binary fallback, token policy.
 */

#include "../src/solver/sequence_inference.hpp"
#include <iostream>
#include <cassert>
#include <string>
#include <vector>

using namespace cryptex;
using namespace cryptex::solver;

void test_parse() {
    auto parsed = SequenceInference::parse("1, 1, 2, 3, 5, 8, 13, 21, ?");
    assert(parsed.terms.size() == 8);
    assert(parsed.terms.back() == 21);
    assert(parsed.malformed_tokens == 0);

    parsed = SequenceInference::parse("4, x, 7,, -3");
    assert(parsed.terms.size() == 3);
    assert(parsed.terms[2] == -3);
    assert(parsed.malformed_tokens == 1);

    parsed = SequenceInference::parse("");
    assert(parsed.terms.empty());
    assert(parsed.malformed_tokens == 0);

    // Trailing junk makes the whole token malformed
    parsed = SequenceInference::parse("12abc");
    assert(parsed.terms.empty());
    assert(parsed.malformed_tokens == 1);

    std::cout << "[PASS] Parse\n";
}

void test_fibonacci() {
    SequenceInference inference;

    auto outcome = inference.run("1, 1, 2, 3, 5, 8, 13, 21");
    assert(outcome.succeeded());
    assert(*outcome.solution() == "34");
    assert(outcome.attempts() == 1);
    assert(outcome.strategy_name() == SequenceInference::FIBONACCI);

    outcome = inference.run("1, 1, 2, 3, 5, 8, 13, 21, ?");
    assert(outcome.succeeded());
    assert(*outcome.solution() == "34");

    // Any seed pair, not just the classic prefix
    outcome = inference.run("2, 5, 7, 12");
    assert(outcome.succeeded());
    assert(*outcome.solution() == "19");

    assert(!SequenceInference::is_fibonacci_like({1, 1}));
    assert(!SequenceInference::is_fibonacci_like({1, 2, 4}));

    std::cout << "[PASS] Fibonacci\n";
}

void test_primes() {
    SequenceInference inference;

    auto outcome = inference.run("2, 3, 5, 7, 11, 13, 17, 19");
    assert(outcome.succeeded());
    assert(*outcome.solution() == "23");
    assert(outcome.attempts() == 1);
    assert(outcome.strategy_name() == SequenceInference::PRIMES);

    outcome = inference.run("89, 97");
    assert(outcome.succeeded());
    assert(*outcome.solution() == "101");

    // Primes with a gap are not consecutive
    assert(!SequenceInference::is_consecutive_primes({2, 3, 7}));
    assert(!SequenceInference::is_consecutive_primes({4, 5}));
    assert(!SequenceInference::is_consecutive_primes({7}));

    std::cout << "[PASS] Primes\n";
}

void test_fibonacci_checked_before_primes() {
    SequenceInference inference;

    // 2, 3, 5 is both consecutive primes and a Fibonacci run
    auto outcome = inference.run("2, 3, 5");
    assert(outcome.succeeded());
    assert(outcome.strategy_name() == SequenceInference::FIBONACCI);
    assert(*outcome.solution() == "8");

    std::cout << "[PASS] Fibonacci checked before primes\n";
}

void test_primality() {
    assert(!SequenceInference::is_prime(0));
    assert(!SequenceInference::is_prime(1));
    assert(SequenceInference::is_prime(2));
    assert(SequenceInference::is_prime(97));
    assert(!SequenceInference::is_prime(561));                     // Carmichael
    assert(SequenceInference::is_prime(1000000007ULL));
    assert(!SequenceInference::is_prime(3215031751ULL));           // Strong pseudoprime to 2,3,5,7
    assert(SequenceInference::is_prime(18446744073709551557ULL));  // Largest 64-bit prime

    assert(SequenceInference::next_prime(0) == 2);
    assert(SequenceInference::next_prime(19) == 23);
    assert(SequenceInference::next_prime(23) == 29);

    bool threw = false;
    try {
        SequenceInference::next_prime(18446744073709551557ULL);
    } catch (const std::overflow_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "[PASS] Primality\n";
}

void test_binary_fallback() {
    SequenceInference inference;

    auto outcome = inference.run("01000010 01010100 01000011");
    assert(outcome.succeeded());
    assert(*outcome.solution() == "BTC");
    assert(outcome.attempts() == 1);
    assert(outcome.strategy_name() == SequenceInference::BINARY);

    // Binary-looking but not in 8-bit groups
    outcome = inference.run("0101 1100");
    assert(!outcome.succeeded());
    assert(outcome.attempts() == 1);
    assert(outcome.strategy_name() == SequenceInference::BINARY);
    assert(outcome.error() && *outcome.error() == ErrorKind::MALFORMED_INPUT);

    std::cout << "[PASS] Binary fallback\n";
}

void test_unrecognized() {
    SequenceInference inference;

    auto outcome = inference.run("1, 4, 9, 16");
    assert(!outcome.succeeded());
    assert(!outcome.solution());
    assert(outcome.attempts() == 0);
    assert(outcome.strategy_name() == SequenceInference::UNRECOGNIZED);

    outcome = inference.run("");
    assert(!outcome.succeeded());
    assert(outcome.attempts() == 0);

    std::cout << "[PASS] Unrecognized\n";
}

void test_token_policy() {
    SequenceInference strict(true);
    SequenceInference lenient(false);

    // A stray word blocks numeric patterns only under the strict policy
    auto outcome = strict.run("1, 1, 2, three, 3, 5");
    assert(!outcome.succeeded());
    assert(outcome.strategy_name() == SequenceInference::UNRECOGNIZED);

    outcome = lenient.run("1, 1, 2, three, 3, 5");
    assert(outcome.succeeded());
    assert(*outcome.solution() == "8");

    // Lenient tokens keep their leading integer
    outcome = lenient.run("1, 1, 2, 3, 5, 8, 13, 21?");
    assert(outcome.succeeded());
    assert(*outcome.solution() == "34");

    outcome = strict.run("1, 1, 2, 3, 5, 8, 13, 21?");
    assert(!outcome.succeeded());

    auto parsed = SequenceInference::parse("2, 3.5, 5x, abc", true);
    assert((parsed.terms == std::vector<int64_t>{2, 3, 5}));
    assert(parsed.malformed_tokens == 1);

    std::cout << "[PASS] Token policy\n";
}

void test_overflow_is_failure() {
    SequenceInference inference;

    // Next Fibonacci term would overflow int64
    auto outcome = inference.run("4660046610375530309, 7540113804746346429, 12200160415121876738");
    assert(!outcome.succeeded());

    outcome = inference.run("2880067194370816120, 4660046610375530309, 7540113804746346429");
    assert(!outcome.succeeded());
    assert(outcome.strategy_name() == SequenceInference::FIBONACCI);
    assert(outcome.attempts() == 1);

    std::cout << "[PASS] Overflow is failure\n";
}

int main() {
    std::cout << "=== Sequence Inference Tests ===\n\n";

    test_parse();
    test_fibonacci();
    test_primes();
    test_fibonacci_checked_before_primes();
    test_primality();
    test_binary_fallback();
    test_unrecognized();
    test_token_policy();
    test_overflow_is_failure();

    std::cout << "\n=== All Tests Passed ===\n";
    return 0;
}
