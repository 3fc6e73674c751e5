/**
 * 256-bit Unsigned Integer
 *
 * Exact keyspace sizes and declared attempt counts. A puzzle of N bits has a
 * keyspace of 2^N, which outgrows uint64_t from N = 64 on.
 * Uses GCC/Clang builtins and unsigned __int128.
 */

#pragma once

#include <cstdint>
#include <string>
#include <algorithm>
#include <stdexcept>

namespace cryptex {

struct UInt256 {
    static constexpr int BITS = 256;

    uint64_t parts[4] = {0, 0, 0, 0};  // Little-endian: parts[0] is lowest

    UInt256() = default;

    explicit UInt256(uint64_t val) {
        parts[0] = val;
    }

    /**
     * 2^n. Throws std::overflow_error for n >= 256.
     */
    static UInt256 pow2(unsigned n) {
        if (n >= BITS) {
            throw std::overflow_error("2^" + std::to_string(n) + " does not fit in 256 bits");
        }
        UInt256 result;
        result.parts[n / 64] = 1ULL << (n % 64);
        return result;
    }

    bool is_zero() const {
        return (parts[0] | parts[1] | parts[2] | parts[3]) == 0;
    }

    bool fits_u64() const {
        return (parts[1] | parts[2] | parts[3]) == 0;
    }

    uint64_t to_u64() const {
        if (!fits_u64()) {
            throw std::overflow_error("value exceeds 64 bits: " + to_decimal());
        }
        return parts[0];
    }

    // Get the bit length (position of highest set bit)
    int bit_length() const {
        for (int i = 3; i >= 0; i--) {
            if (parts[i] != 0) {
                int lz = __builtin_clzll(parts[i]);
                return (i + 1) * 64 - lz;
            }
        }
        return 0;
    }

    UInt256& operator+=(uint64_t val) {
        uint64_t carry = val;
        for (int i = 0; i < 4 && carry; i++) {
            uint64_t sum = parts[i] + carry;
            carry = (sum < parts[i]) ? 1 : 0;
            parts[i] = sum;
        }
        if (carry) {
            throw std::overflow_error("UInt256 addition overflow");
        }
        return *this;
    }

    UInt256 operator+(uint64_t val) const {
        UInt256 result = *this;
        result += val;
        return result;
    }

    UInt256& operator+=(const UInt256& other) {
        uint64_t carry = 0;
        for (int i = 0; i < 4; i++) {
            uint64_t sum = parts[i] + other.parts[i];
            uint64_t c1 = (sum < parts[i]) ? 1 : 0;
            uint64_t total = sum + carry;
            uint64_t c2 = (total < sum) ? 1 : 0;
            parts[i] = total;
            carry = c1 | c2;
        }
        if (carry) {
            throw std::overflow_error("UInt256 addition overflow");
        }
        return *this;
    }

    UInt256 operator+(const UInt256& other) const {
        UInt256 result = *this;
        result += other;
        return result;
    }

    // Multiply by a small factor (used for fractional budgets such as 7/10)
    UInt256& operator*=(uint32_t factor) {
        uint64_t carry = 0;
        for (int i = 0; i < 4; i++) {
            unsigned __int128 prod = static_cast<unsigned __int128>(parts[i]) * factor + carry;
            parts[i] = static_cast<uint64_t>(prod);
            carry = static_cast<uint64_t>(prod >> 64);
        }
        if (carry) {
            throw std::overflow_error("UInt256 multiplication overflow");
        }
        return *this;
    }

    /**
     * Divide in place by a small divisor, returning the remainder.
     */
    uint32_t divmod(uint32_t divisor) {
        if (divisor == 0) {
            throw std::domain_error("UInt256 division by zero");
        }
        unsigned __int128 rem = 0;
        for (int i = 3; i >= 0; i--) {
            unsigned __int128 cur = (rem << 64) | parts[i];
            parts[i] = static_cast<uint64_t>(cur / divisor);
            rem = cur % divisor;
        }
        return static_cast<uint32_t>(rem);
    }

    // Comparison
    bool operator<(const UInt256& other) const {
        for (int i = 3; i >= 0; i--) {
            if (parts[i] < other.parts[i]) return true;
            if (parts[i] > other.parts[i]) return false;
        }
        return false;
    }

    bool operator>(const UInt256& other) const { return other < *this; }
    bool operator<=(const UInt256& other) const { return !(other < *this); }
    bool operator>=(const UInt256& other) const { return !(*this < other); }

    bool operator==(const UInt256& other) const {
        return parts[0] == other.parts[0] && parts[1] == other.parts[1] &&
               parts[2] == other.parts[2] && parts[3] == other.parts[3];
    }

    bool operator!=(const UInt256& other) const { return !(*this == other); }

    bool operator==(uint64_t val) const { return fits_u64() && parts[0] == val; }
    bool operator!=(uint64_t val) const { return !(*this == val); }

    std::string to_decimal() const {
        if (is_zero()) return "0";
        UInt256 tmp = *this;
        std::string digits;
        while (!tmp.is_zero()) {
            digits += static_cast<char>('0' + tmp.divmod(10));
        }
        std::reverse(digits.begin(), digits.end());
        return digits;
    }

    // 1048576 -> "1,048,576"
    std::string to_grouped_decimal() const {
        std::string plain = to_decimal();
        std::string result;
        int count = 0;
        for (auto it = plain.rbegin(); it != plain.rend(); ++it) {
            if (count > 0 && count % 3 == 0) result += ',';
            result += *it;
            count++;
        }
        std::reverse(result.begin(), result.end());
        return result;
    }

    /**
     * Approximate value as a double (for display formatting only).
     */
    double to_double() const {
        double result = 0.0;
        for (int i = 3; i >= 0; i--) {
            result = result * 18446744073709551616.0 + static_cast<double>(parts[i]);
        }
        return result;
    }
};

}  // namespace cryptex
