/**
 * SHA-256 Digests
 *
 * Thin wrappers over OpenSSL's EVP interface for the hash-preimage dictionary
 * and for deriving simulated keys from a challenge.
 */

#pragma once

#include <cstdint>
#include <array>
#include <string>
#include <string_view>

namespace cryptex {
namespace digest {

constexpr size_t SHA256_SIZE = 32;
using Sha256Hash = std::array<uint8_t, SHA256_SIZE>;

/**
 * SHA-256 of data.
 * @throws std::runtime_error if the OpenSSL digest context fails
 */
Sha256Hash sha256(std::string_view data);

// SHA256(SHA256(data)), the Bitcoin-style double hash
Sha256Hash sha256d(std::string_view data);

std::string to_hex(const Sha256Hash& hash);

/**
 * True iff text is exactly 64 hex digits (either case).
 */
bool is_sha256_hex(std::string_view text);

}  // namespace digest
}  // namespace cryptex
