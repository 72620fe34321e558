/**
 * @file Rowid.cpp
 * @brief Codec for the packed ROWID records of the Oracle Text $R table.
 *
 * A record is 14 bytes. The first 12 bytes are four 3-byte groups, each one
 * rendered as 4 characters of the base64 alphabet; the last 2 bytes are
 * copied into the rowid as they are. Decoding gives the familiar 18-char
 * rowid text, encoding goes back to the 14 raw bytes.
 */

#include "Rowid.hpp"
#include "utils/hex.hpp"

namespace Oracle::Rowid {

static constexpr std::array<int8_t, 256> make_index() {
    std::array<int8_t, 256> index{};
    index.fill(-1);
    for (int i = 0; i < 64; i++) {
        index[(uint8_t)ALPHABET[i]] = (int8_t)i;
    }
    return index;
}

static constexpr std::array<int8_t, 256> INDEX = make_index();

int8_t char2index(char c) {
    return INDEX[(uint8_t)c];
}

/**
 * @brief Decodes one packed record into its textual rowid.
 *
 * Every 3 bytes (6 nibbles) of the base64 part give 4 characters:
 *   c1 = n1:n2[3:2]  c2 = n2[1:0]:n3  c3 = n4:n5[3:2]  c4 = n5[1:0]:n6
 * which is plain base64 packing of 24 bits. The last 2 bytes are appended
 * as literal characters and may be unprintable.
 *
 * @param raw Pointer to the record bytes.
 * @param size Record size, must be RAW_SIZE.
 * @return 18-character rowid.
 * @throws InvalidLength If size != RAW_SIZE.
 */
std::string decode(const void* raw, size_t size) {
    if (size != RAW_SIZE) {
        throw InvalidLength("rowid decode", RAW_SIZE, size);
    }

    const uint8_t* p = static_cast<const uint8_t*>(raw);
    std::string result(ENCODED_SIZE, '\0');

    for (size_t i = 0; i < B64_GROUPS; i++) {
        uint32_t v = (p[i*3] << 16) | (p[i*3 + 1] << 8) | p[i*3 + 2];
        result[i*4]     = ALPHABET[(v >> 18) & 0x3f];
        result[i*4 + 1] = ALPHABET[(v >> 12) & 0x3f];
        result[i*4 + 2] = ALPHABET[(v >>  6) & 0x3f];
        result[i*4 + 3] = ALPHABET[v & 0x3f];
    }

    result[B64_TEXT_SIZE]     = (char)p[B64_RAW_SIZE];
    result[B64_TEXT_SIZE + 1] = (char)p[B64_RAW_SIZE + 1];
    return result;
}

std::string decode(const raw_t& raw) {
    return decode(raw.data(), raw.size());
}

/**
 * @brief Encodes a textual rowid back into its packed record.
 *
 * @param rowid 18-character rowid; the first 16 characters must be in ALPHABET.
 * @return 14 raw bytes.
 * @throws InvalidLength If rowid is not 18 characters long.
 * @throws InvalidAlphabetCharacter On a non-alphabet character in the base64 part.
 */
raw_t encode(std::string_view rowid) {
    if (rowid.size() != ENCODED_SIZE) {
        throw InvalidLength("rowid encode", ENCODED_SIZE, rowid.size(), "chars");
    }

    raw_t result{};
    for (size_t i = 0; i < B64_GROUPS; i++) {
        uint32_t v = 0;
        for (size_t j = 0; j < 4; j++) {
            const size_t pos = i*4 + j;
            int8_t code = char2index(rowid[pos]);
            if (code < 0) {
                throw InvalidAlphabetCharacter(pos, rowid[pos]);
            }
            v = (v << 6) | (uint32_t)code;
        }
        result[i*3]     = (uint8_t)(v >> 16);
        result[i*3 + 1] = (uint8_t)(v >> 8);
        result[i*3 + 2] = (uint8_t)v;
    }

    result[B64_RAW_SIZE]     = (uint8_t)rowid[B64_TEXT_SIZE];
    result[B64_RAW_SIZE + 1] = (uint8_t)rowid[B64_TEXT_SIZE + 1];
    return result;
}

std::string decode_hex(std::string_view hex) {
    if (hex.size() != HEX_SIZE) {
        throw InvalidLength("rowid hex decode", HEX_SIZE, hex.size(), "hex digits");
    }

    buf_t raw;
    size_t bad_pos = 0;
    if (!from_hex(hex, raw, &bad_pos)) {
        throw MalformedRecord(0, fmt::format("non-hex digit '{}' at position {}", hex[bad_pos], bad_pos));
    }
    return decode(raw.data(), raw.size());
}

}
