/**
 * Built-in puzzle table.
 */

#include "puzzle_catalog.hpp"

namespace cryptex {

namespace {

using C = PuzzleCategory;
using D = Difficulty;

std::vector<PuzzleEntry> builtin_entries() {
    return {
        // Keyspace puzzles: key k satisfies 2^(N-1) <= k < 2^N
        {1, C::BITCOIN_ADDRESS, "Puzzle #1 - 1 bit", "Find the private key for a 1-bit Bitcoin address",
         D::EASY, "1BgGZ9tcN4rm9KBzDn7KprQz87SZ26SAMH", "Only 2 possible private keys to try",
         "1", "Brute force: 2^1 = 2 possible keys", 1, "1BgGZ9tcN4rm9KBzDn7KprQz87SZ26SAMH", "0.001"},
        {2, C::BITCOIN_ADDRESS, "Puzzle #2 - 2 bits", "Find the private key for a 2-bit Bitcoin address",
         D::EASY, "1CUNEBjYrCn2y1SdiUMohaKUi4wpP326Lb", "Search space: 0-3",
         "3", "Brute force: 2^2 = 4 possible keys", 2, "1CUNEBjYrCn2y1SdiUMohaKUi4wpP326Lb", "0.002"},
        {3, C::BITCOIN_ADDRESS, "Puzzle #3 - 3 bits", "Find the private key for a 3-bit Bitcoin address",
         D::EASY, "19ZewH8Kk1PDbSNdJ97FP4EiCjTRaZMZQA", "Maximum value for 3 bits",
         "7", "Brute force: 2^3 = 8 possible keys", 3, "19ZewH8Kk1PDbSNdJ97FP4EiCjTRaZMZQA", "0.003"},
        {4, C::BITCOIN_ADDRESS, "Puzzle #4 - 4 bits", "Find the private key for a 4-bit Bitcoin address",
         D::EASY, "1EhqbyUMvvs7BfL8goY6qcPbD6YKfPqb7e", "Middle of the search space",
         "8", "Brute force: 2^4 = 16 possible keys", 4, "1EhqbyUMvvs7BfL8goY6qcPbD6YKfPqb7e", "0.004"},
        {5, C::BITCOIN_ADDRESS, "Puzzle #5 - 5 bits", "Find the private key for a 5-bit Bitcoin address",
         D::EASY, "1E6NuFjCi27W5zoXg8TRdcSRq84zJeBW3k", "Around 2/3 of the maximum",
         "21", "Brute force: 2^5 = 32 possible keys", 5, "1E6NuFjCi27W5zoXg8TRdcSRq84zJeBW3k", "0.005"},

        // Hash preimages
        {6, C::HASH_PREIMAGE, "SHA-256 Simple Preimage", "Find the input that produces this SHA-256 hash",
         D::EASY, "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
         "Sometimes the simplest answer is the right one",
         "", "Hash of empty string", std::nullopt, "", ""},
        {7, C::HASH_PREIMAGE, "SHA-256 Common Word", "Find the common English word that produces this hash",
         D::EASY, "2c26b46b68ffc68ff99b453c1d30413413422d706483bfa0f98a5e886266e7ae",
         "Three letter word, often used in programming examples",
         "foo", "Dictionary attack with common words", std::nullopt, "", ""},
        {8, C::HASH_PREIMAGE, "SHA-256 Numeric Pattern", "Find the numeric string that hashes to this value",
         D::MEDIUM, "6b86b273ff34fce19d6b804eff5a3f5747ada4eaa22f1d49c01e52ddb7875b4b",
         "Single digit number",
         "1", "Brute force numeric strings", std::nullopt, "", ""},

        // Ciphers
        {9, C::CIPHER_DECODE, "Caesar Cipher - ROT13", "Decode this ROT13 encrypted Bitcoin private key hint",
         D::EASY, "GUVF VF N FRPERG ZRFFNTR", "Classic rotation cipher",
         "THIS IS A SECRET MESSAGE", "Apply ROT13 transformation (shift by 13)", std::nullopt, "", ""},
        {10, C::CIPHER_DECODE, "Base64 Encoded Key", "Decode this Base64 encoded private key fragment",
         D::EASY, "UHJpdmF0ZUtleUZyYWdtZW50", "Standard encoding for binary-to-text",
         "PrivateKeyFragment", "Base64 decoding", std::nullopt, "", ""},
        {11, C::CIPHER_DECODE, "Hex to ASCII", "Convert this hexadecimal string to reveal the key",
         D::EASY, "48656c6c6f20426974636f696e", "Common encoding for binary data",
         "Hello Bitcoin", "Hexadecimal to ASCII conversion", std::nullopt, "", ""},
        {12, C::CIPHER_DECODE, "XOR Cipher", "Decode this XOR encrypted message (key: 'KEY')",
         D::MEDIUM, "0a1e1b1f4b0a1e1b1f", "XOR each byte with cycling key bytes",
         "BITCOIN", "XOR decryption with known key", std::nullopt, "", ""},

        // Sequences
        {13, C::PATTERN_ANALYSIS, "Fibonacci Sequence", "Find the next number in the sequence to unlock the key",
         D::MEDIUM, "1, 1, 2, 3, 5, 8, 13, 21, ?", "Each number is the sum of the previous two",
         "34", "Fibonacci sequence: sum of previous two numbers", std::nullopt, "", ""},
        {14, C::PATTERN_ANALYSIS, "Prime Number Pattern", "Identify the pattern in these prime numbers",
         D::MEDIUM, "2, 3, 5, 7, 11, 13, 17, 19, ?", "These are consecutive prime numbers",
         "23", "Sequence of prime numbers", std::nullopt, "", ""},
        {15, C::PATTERN_ANALYSIS, "Binary Pattern", "Decode the binary pattern to find the key value",
         D::MEDIUM, "01000010 01010100 01000011", "8 bits per character",
         "BTC", "Binary to ASCII conversion", std::nullopt, "", ""},

        // Larger keyspaces
        {16, C::BITCOIN_ADDRESS, "Puzzle #10 - 10 bits", "Find the private key for a 10-bit Bitcoin address",
         D::MEDIUM, "16JrGhLx5bcBSA34kew9V6Mufa4aXhFe9X", "Feasible with modern computing",
         std::nullopt, "Brute force: 2^10 = 1,024 possible keys", 10, "16JrGhLx5bcBSA34kew9V6Mufa4aXhFe9X", "0.01"},
        {17, C::BITCOIN_ADDRESS, "Puzzle #15 - 15 bits", "Find the private key for a 15-bit Bitcoin address",
         D::MEDIUM, "13zb1hQbWVsc2S7ZTZnP2G4undNNpdh5so", "Requires optimized algorithms",
         std::nullopt, "Brute force: 2^15 = 32,768 possible keys", 15, "13zb1hQbWVsc2S7ZTZnP2G4undNNpdh5so", "0.015"},
        {18, C::BITCOIN_ADDRESS, "Puzzle #20 - 20 bits", "Find the private key for a 20-bit Bitcoin address",
         D::HARD, "1BY8GQbnueYofwSuFAT3USAhGjPrkxDdW9", "Requires parallel processing",
         std::nullopt, "Brute force: 2^20 = 1,048,576 possible keys", 20, "1BY8GQbnueYofwSuFAT3USAhGjPrkxDdW9", "0.02"},

        {19, C::HASH_PREIMAGE, "Double SHA-256 Challenge", "Find input for double SHA-256 hash (Bitcoin style)",
         D::HARD, "4f8b42c22dd3729b519ba6f68d2da7cc5b2d606d05daed5ad5128cc03e6c6358",
         "Bitcoin uses double SHA-256 for security",
         std::nullopt, "Double hashing: SHA256(SHA256(input))", std::nullopt, "", ""},
        {20, C::PRIVATE_KEY_RECOVERY, "Partial Key Recovery", "Recover private key from partial information",
         D::HARD, "First 64 bits known: 0x0000000000000000...", "Reduce search space using known information",
         std::nullopt, "Brute force remaining bits with known prefix", std::nullopt, "", ""},

        // Demonstrations of the feasibility limit
        {21, C::BITCOIN_ADDRESS, "Puzzle #50 - 50 bits", "Theoretical demonstration of computational limits",
         D::IMPOSSIBLE, "14oFNXucftsHiUMY8uctg6N487riuyXs4h", "Would take years even with GPUs",
         std::nullopt, "Brute force: 2^50 = 1.1 quadrillion attempts", 50, "14oFNXucftsHiUMY8uctg6N487riuyXs4h", "0.05"},
        {22, C::BITCOIN_ADDRESS, "Puzzle #66 - Real Bitcoin Challenge", "Part of the famous Bitcoin puzzle transaction",
         D::IMPOSSIBLE, "1BY8GQbnueYofwSuFAT3USAhGjPrkxDdW9", "Requires breakthrough in quantum computing or algorithms",
         std::nullopt, "Beyond current computational feasibility", 66, "1BY8GQbnueYofwSuFAT3USAhGjPrkxDdW9", "6.6"},
    };
}

}  // namespace

const PuzzleCatalog& PuzzleCatalog::builtin() {
    static const PuzzleCatalog catalog(builtin_entries());
    return catalog;
}

}  // namespace cryptex
