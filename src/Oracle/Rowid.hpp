#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include "core/errors.hpp"

// ROWIDs as they are packed into the DR$<index>$R table of Oracle Text
namespace Oracle::Rowid {

constexpr size_t RAW_SIZE     = 14;           // one packed record
constexpr size_t HEX_SIZE     = RAW_SIZE * 2; // 28 hex digits
constexpr size_t ENCODED_SIZE = 18;           // textual rowid

constexpr size_t B64_GROUPS    = 4;
constexpr size_t B64_RAW_SIZE  = B64_GROUPS * 3; // 12 bytes ..
constexpr size_t B64_TEXT_SIZE = B64_GROUPS * 4; // .. are 16 chars, the rest is stored literally

constexpr char ALPHABET[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
static_assert(sizeof(ALPHABET) == 64 + 1);

using raw_t = std::array<uint8_t, RAW_SIZE>;

// 6-bit index of an alphabet character, -1 if not in the alphabet
int8_t char2index(char c);

// raw record => 18-char rowid
// throws InvalidLength if size != RAW_SIZE
std::string decode(const void* raw, size_t size);
std::string decode(const raw_t& raw);

// 18-char rowid => raw record
// throws InvalidLength, InvalidAlphabetCharacter
raw_t encode(std::string_view rowid);

// 28 hex digits => 18-char rowid
// throws InvalidLength, MalformedRecord
std::string decode_hex(std::string_view hex);

}
