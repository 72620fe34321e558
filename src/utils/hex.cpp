/**
 * @file hex.cpp
 * @brief Hexadecimal rendering and parsing of raw buffers.
 *
 * The $R blob travels as hex text whenever it leaves the database through
 * SQL*Plus, so both directions are needed: rendering for output and logs,
 * parsing for hex dumps and command-line records.
 */

#include "hex.hpp"

static const char HEX_DIGITS[] = "0123456789ABCDEF";

std::string to_hex(const void* ptr, size_t size) {
    const uint8_t* p = static_cast<const uint8_t*>(ptr);
    std::string result(size * 2, '0');
    for (size_t i = 0; i < size; i++) {
        result[i*2]     = HEX_DIGITS[p[i] >> 4];
        result[i*2 + 1] = HEX_DIGITS[p[i] & 0x0f];
    }
    return result;
}

std::string to_hex(const buf_t& buf) {
    return to_hex(buf.data(), buf.size());
}

int hex2nib(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

/**
 * @brief Parses a string of hex digits into bytes.
 *
 * @param hex Hex text, an even number of digits.
 * @param[out] out Parsed bytes, replaced on success.
 * @param[out] bad_pos Position of the first bad digit (or hex.size() on odd length), if not null.
 * @return True on success, false on odd length or a non-hex digit.
 */
bool from_hex(std::string_view hex, buf_t& out, size_t* bad_pos) {
    if (hex.size() % 2) {
        if (bad_pos) *bad_pos = hex.size();
        return false;
    }

    buf_t result(hex.size() / 2);
    for (size_t i = 0; i < result.size(); i++) {
        int hi = hex2nib(hex[i*2]);
        int lo = hex2nib(hex[i*2 + 1]);
        if (hi < 0 || lo < 0) {
            if (bad_pos) *bad_pos = hi < 0 ? i*2 : i*2 + 1;
            return false;
        }
        result[i] = (uint8_t)((hi << 4) | lo);
    }
    out = std::move(result);
    return true;
}
