#pragma once
#include <cstdint>
#include <string>
#include <string_view>

#include "core/buf_t.hpp"

// uppercase, two digits per byte (same as oracle's rawtohex)
std::string to_hex(const void* ptr, size_t size);
std::string to_hex(const buf_t& buf);

// -1 if not a hex digit
int hex2nib(char c);

// parses hex digits of either case, no separators
// returns false on odd length or a non-hex digit, bad_pos is set to the offending position
bool from_hex(std::string_view hex, buf_t& out, size_t* bad_pos = nullptr);
