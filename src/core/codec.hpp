/**
 * Codec Library
 *
 * Pure text/byte transforms tried by the decode cascade. Byte strings are
 * carried in std::string. Decoders throw DecodeError on malformed input.
 */

#pragma once

#include "types.hpp"

#include <string>
#include <string_view>

namespace cryptex {
namespace codec {

/**
 * Hex -> bytes. Whitespace is ignored.
 * @throws DecodeError(MALFORMED_INPUT) on odd length or a non-hex digit
 */
std::string hex_decode(std::string_view input);

// Lowercase hex, two digits per byte
std::string hex_encode(std::string_view bytes);

/**
 * Base64 (standard alphabet) -> bytes.
 *
 * Whitespace is removed first. When the length is a multiple of four, up to
 * two trailing '=' are accepted as padding; unpadded input is accepted as
 * long as its length is not 1 mod 4.
 * @throws DecodeError(MALFORMED_INPUT) on bad alphabet or padding
 */
std::string base64_decode(std::string_view input);

std::string base64_encode(std::string_view bytes);

// Rotate ASCII letters by 13. Never fails.
std::string rot13(std::string_view input);

/**
 * Whitespace-separated groups of eight binary digits -> bytes.
 * @throws DecodeError(MALFORMED_INPUT) if a group is not exactly 8 bits
 */
std::string binary_decode(std::string_view input);

std::string binary_encode(std::string_view bytes);

/**
 * Hex-encoded ciphertext XORed with a repeating key.
 * @throws DecodeError(MALFORMED_INPUT) on bad hex
 * @throws DecodeError(INVALID_CONFIGURATION) on an empty key
 */
std::string xor_decode(std::string_view hex_input, std::string_view key);

// Inverse of xor_decode: XOR with the key, then hex-encode
std::string xor_encode(std::string_view bytes, std::string_view key);

}  // namespace codec

/**
 * True iff text is non-empty and every byte is printable ASCII (0x20-0x7E).
 */
inline bool is_printable(std::string_view text) {
    if (text.empty()) return false;
    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc > 0x7E) return false;
    }
    return true;
}

}  // namespace cryptex
