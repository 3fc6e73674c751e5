/**
 * Decode Cascade Tests
 *
 * Trial order, first-printable-wins acceptance and exhaustion reporting.
 */

#include "../src/solver/decode_cascade.hpp"
#include "../src/core/codec.hpp"
#include <iostream>
#include <cassert>
#include <string>

using namespace cryptex;
using namespace cryptex::solver;

void test_codec_order() {
    const auto& codecs = DecodeCascade::codecs();
    assert(codecs.size() == 5);
    assert(std::string(codecs[0].name) == "Base64");
    assert(std::string(codecs[1].name) == "Hex to ASCII");
    assert(std::string(codecs[2].name) == "ROT13");
    assert(std::string(codecs[3].name) == "Binary to ASCII");
    assert(std::string(codecs[4].name) == "XOR with key");

    std::cout << "[PASS] Codec order\n";
}

void test_base64_wins_first() {
    DecodeCascade cascade;

    auto outcome = cascade.run("UHJpdmF0ZUtleUZyYWdtZW50");
    assert(outcome.succeeded());
    assert(*outcome.solution() == "PrivateKeyFragment");
    assert(outcome.attempts() == 1);
    assert(outcome.strategy_name() == "Base64");
    assert(!outcome.error());

    outcome = cascade.run("SGVsbG8=");
    assert(outcome.succeeded());
    assert(*outcome.solution() == "Hello");
    assert(outcome.attempts() == 1);

    std::cout << "[PASS] Base64 wins first\n";
}

void test_hex_second() {
    DecodeCascade cascade;

    // Also valid Base64, but it decodes to unprintable bytes
    auto outcome = cascade.run("48656c6c6f20426974636f696e");
    assert(outcome.succeeded());
    assert(*outcome.solution() == "Hello Bitcoin");
    assert(outcome.attempts() == 2);
    assert(outcome.strategy_name() == "Hex to ASCII");

    std::cout << "[PASS] Hex second\n";
}

void test_rot13_third() {
    DecodeCascade cascade;

    auto outcome = cascade.run("GUVF VF N FRPERG ZRFFNTR");
    assert(outcome.succeeded());
    assert(*outcome.solution() == "THIS IS A SECRET MESSAGE");
    assert(outcome.attempts() == 3);
    assert(outcome.strategy_name() == "ROT13");

    outcome = cascade.run("Uryyb");
    assert(outcome.succeeded());
    assert(*outcome.solution() == "Hello");
    assert(outcome.attempts() == 3);

    std::cout << "[PASS] ROT13 third\n";
}

void test_rot13_shadows_later_codecs() {
    DecodeCascade cascade;

    // Printable input always survives ROT13, so binary and XOR never get a turn
    auto outcome = cascade.run("01000010 01010100 01000011");
    assert(outcome.succeeded());
    assert(*outcome.solution() == "01000010 01010100 01000011");
    assert(outcome.strategy_name() == "ROT13");
    assert(outcome.attempts() == 3);

    outcome = cascade.run("0a1e1b1f4b0a1e1b1f");
    assert(outcome.succeeded());
    assert(*outcome.solution() == "0n1r1o1s4o0n1r1o1s");
    assert(outcome.strategy_name() == "ROT13");

    std::cout << "[PASS] ROT13 shadows later codecs\n";
}

void test_binary_fourth() {
    DecodeCascade cascade;

    // A tab is not printable, so ROT13 output is rejected and binary gets its turn
    auto outcome = cascade.run("01000010\t01010100\t01000011");
    assert(outcome.succeeded());
    assert(*outcome.solution() == "BTC");
    assert(outcome.attempts() == 4);
    assert(outcome.strategy_name() == "Binary to ASCII");

    std::cout << "[PASS] Binary fourth\n";
}

void test_xor_fifth() {
    DecodeCascade cascade;

    std::string hex = codec::xor_encode("BITCOIN", "KEY");
    assert(hex == "090c0d080a1005");

    // Split by a newline so every earlier codec fails or yields unprintable text
    auto outcome = cascade.run(hex.substr(0, 2) + "\n" + hex.substr(2));
    assert(outcome.succeeded());
    assert(*outcome.solution() == "BITCOIN");
    assert(outcome.attempts() == 5);
    assert(outcome.strategy_name() == "XOR with KEY");

    std::cout << "[PASS] XOR fifth\n";
}

void test_exhausted() {
    DecodeCascade cascade;

    auto outcome = cascade.run("");
    assert(!outcome.succeeded());
    assert(!outcome.solution());
    assert(outcome.attempts() == 5);
    assert(outcome.strategy_name() == DecodeCascade::EXHAUSTED);

    outcome = cascade.run(std::string("\x01\x02", 2));
    assert(!outcome.succeeded());
    assert(outcome.attempts() == 5);
    assert(outcome.strategy_name() == "All decoding methods exhausted");
    assert(!outcome.error());

    std::cout << "[PASS] Exhausted\n";
}

void test_empty_xor_key() {
    DecodeCascade cascade("");

    // Reaches the XOR codec, which rejects the key
    auto outcome = cascade.run(std::string("\x01\x02", 2));
    assert(!outcome.succeeded());
    assert(outcome.attempts() == 5);
    assert(outcome.error() && *outcome.error() == ErrorKind::INVALID_CONFIGURATION);
    assert(outcome.strategy_name().find("misconfigured") != std::string::npos);

    // Earlier codecs are unaffected
    outcome = cascade.run("SGVsbG8=");
    assert(outcome.succeeded());

    std::cout << "[PASS] Empty XOR key\n";
}

void test_deterministic() {
    DecodeCascade cascade;
    const char* challenges[] = {"UHJpdmF0ZUtleUZyYWdtZW50", "48656c6c6f20426974636f696e",
                                "GUVF VF N FRPERG ZRFFNTR", ""};
    for (const char* challenge : challenges) {
        auto a = cascade.run(challenge);
        auto b = cascade.run(challenge);
        assert(a.succeeded() == b.succeeded());
        assert(a.solution() == b.solution());
        assert(a.strategy_name() == b.strategy_name());
        assert(a.attempts() == b.attempts());
    }

    std::cout << "[PASS] Deterministic\n";
}

int main() {
    std::cout << "=== Decode Cascade Tests ===\n\n";

    test_codec_order();
    test_base64_wins_first();
    test_hex_second();
    test_rot13_third();
    test_rot13_shadows_later_codecs();
    test_binary_fourth();
    test_xor_fifth();
    test_exhausted();
    test_empty_xor_key();
    test_deterministic();

    std::cout << "\n=== All Tests Passed ===\n";
    return 0;
}
