/**
 * Codec Library Implementation
 */

#include "codec.hpp"

#include <cstdint>

namespace cryptex {
namespace codec {

namespace {

constexpr const char* BASE64_ALPHABET =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr const char* HEX_DIGITS = "0123456789abcdef";

// ASCII whitespace as the Base64 and hex decoders understand it
bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

int base64_value(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

std::string strip_whitespace(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    for (char c : input) {
        if (!is_space(c)) out += c;
    }
    return out;
}

}  // namespace

std::string hex_decode(std::string_view input) {
    std::string clean = strip_whitespace(input);
    if (clean.size() % 2 != 0) {
        throw DecodeError(ErrorKind::MALFORMED_INPUT,
                          "hex input has odd length " + std::to_string(clean.size()));
    }

    std::string bytes;
    bytes.reserve(clean.size() / 2);
    for (size_t i = 0; i < clean.size(); i += 2) {
        int hi = hex_value(clean[i]);
        int lo = hex_value(clean[i + 1]);
        if (hi < 0 || lo < 0) {
            throw DecodeError(ErrorKind::MALFORMED_INPUT,
                              "invalid hex pair at offset " + std::to_string(i));
        }
        bytes += static_cast<char>((hi << 4) | lo);
    }
    return bytes;
}

std::string hex_encode(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (char c : bytes) {
        uint8_t b = static_cast<uint8_t>(c);
        out += HEX_DIGITS[b >> 4];
        out += HEX_DIGITS[b & 0x0F];
    }
    return out;
}

std::string base64_decode(std::string_view input) {
    std::string clean = strip_whitespace(input);

    // Padding is only recognized on a complete final quantum
    if (clean.size() % 4 == 0 && !clean.empty()) {
        if (clean.back() == '=') clean.pop_back();
        if (clean.back() == '=') clean.pop_back();
    }
    if (clean.size() % 4 == 1) {
        throw DecodeError(ErrorKind::MALFORMED_INPUT, "base64 input has invalid length");
    }

    std::string bytes;
    bytes.reserve(clean.size() * 3 / 4);
    uint32_t buffer = 0;
    int bits = 0;
    for (size_t i = 0; i < clean.size(); i++) {
        int value = base64_value(clean[i]);
        if (value < 0) {
            throw DecodeError(ErrorKind::MALFORMED_INPUT,
                              "invalid base64 character at offset " + std::to_string(i));
        }
        buffer = (buffer << 6) | static_cast<uint32_t>(value);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            bytes += static_cast<char>((buffer >> bits) & 0xFF);
        }
    }
    return bytes;
}

std::string base64_encode(std::string_view bytes) {
    std::string out;
    out.reserve((bytes.size() + 2) / 3 * 4);

    size_t i = 0;
    for (; i + 2 < bytes.size(); i += 3) {
        uint32_t n = (static_cast<uint8_t>(bytes[i]) << 16) |
                     (static_cast<uint8_t>(bytes[i + 1]) << 8) |
                     static_cast<uint8_t>(bytes[i + 2]);
        out += BASE64_ALPHABET[(n >> 18) & 0x3F];
        out += BASE64_ALPHABET[(n >> 12) & 0x3F];
        out += BASE64_ALPHABET[(n >> 6) & 0x3F];
        out += BASE64_ALPHABET[n & 0x3F];
    }

    size_t rest = bytes.size() - i;
    if (rest == 1) {
        uint32_t n = static_cast<uint8_t>(bytes[i]) << 16;
        out += BASE64_ALPHABET[(n >> 18) & 0x3F];
        out += BASE64_ALPHABET[(n >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (static_cast<uint8_t>(bytes[i]) << 16) |
                     (static_cast<uint8_t>(bytes[i + 1]) << 8);
        out += BASE64_ALPHABET[(n >> 18) & 0x3F];
        out += BASE64_ALPHABET[(n >> 12) & 0x3F];
        out += BASE64_ALPHABET[(n >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

std::string rot13(std::string_view input) {
    std::string out(input);
    for (char& c : out) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>('A' + (c - 'A' + 13) % 26);
        } else if (c >= 'a' && c <= 'z') {
            c = static_cast<char>('a' + (c - 'a' + 13) % 26);
        }
    }
    return out;
}

std::string binary_decode(std::string_view input) {
    std::string bytes;
    size_t i = 0;
    size_t groups = 0;

    while (i < input.size()) {
        while (i < input.size() && is_space(input[i])) i++;
        if (i >= input.size()) break;

        size_t start = i;
        while (i < input.size() && !is_space(input[i])) i++;
        std::string_view group = input.substr(start, i - start);
        groups++;

        if (group.size() != 8) {
            throw DecodeError(ErrorKind::MALFORMED_INPUT,
                              "binary group " + std::to_string(groups) + " is not 8 bits");
        }
        unsigned value = 0;
        for (char c : group) {
            if (c != '0' && c != '1') {
                throw DecodeError(ErrorKind::MALFORMED_INPUT,
                                  "binary group " + std::to_string(groups) +
                                  " contains a non-binary digit");
            }
            value = (value << 1) | static_cast<unsigned>(c - '0');
        }
        bytes += static_cast<char>(value);
    }

    if (groups == 0) {
        throw DecodeError(ErrorKind::MALFORMED_INPUT, "binary input is empty");
    }
    return bytes;
}

std::string binary_encode(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size() * 9);
    for (size_t i = 0; i < bytes.size(); i++) {
        if (i > 0) out += ' ';
        uint8_t b = static_cast<uint8_t>(bytes[i]);
        for (int bit = 7; bit >= 0; bit--) {
            out += ((b >> bit) & 1) ? '1' : '0';
        }
    }
    return out;
}

std::string xor_decode(std::string_view hex_input, std::string_view key) {
    if (key.empty()) {
        throw DecodeError(ErrorKind::INVALID_CONFIGURATION, "XOR key must not be empty");
    }
    std::string bytes = hex_decode(hex_input);
    for (size_t i = 0; i < bytes.size(); i++) {
        bytes[i] = static_cast<char>(bytes[i] ^ key[i % key.size()]);
    }
    return bytes;
}

std::string xor_encode(std::string_view bytes, std::string_view key) {
    if (key.empty()) {
        throw DecodeError(ErrorKind::INVALID_CONFIGURATION, "XOR key must not be empty");
    }
    std::string mixed(bytes);
    for (size_t i = 0; i < mixed.size(); i++) {
        mixed[i] = static_cast<char>(mixed[i] ^ key[i % key.size()]);
    }
    return hex_encode(mixed);
}

}  // namespace codec
}  // namespace cryptex
