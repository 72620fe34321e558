/**
 * @file units.cpp
 * @brief Conversions between sizes/durations and their human-readable forms.
 *
 * Used for the --chunk-size option and for the progress line. Besides the
 * usual binary units, sizes may be given in $R records ("100r" = 1400 bytes).
 */

#include "units.hpp"
#include "Oracle/Rowid.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>
#include <utility>

/**
 * @brief Converts bytes to a string with the largest unit keeping the number below 4096.
 *
 * @param size Size in bytes.
 * @param default_unit Suffix used when no unit applies (e.g. " bytes").
 * @param min_unit Smallest unit to use: 1, 1024, 1024*1024, ...
 * @return E.g. "3072Kb", "4Gb", "100".
 */
std::string bytes2human(uint64_t size, const char* default_unit, uint64_t min_unit){
    static const std::array<const char*, 5> units { "", "Kb", "Mb", "Gb", "Tb" };

    size_t i = 0;
    for( ; min_unit > 1 && i < units.size()-1; min_unit /= 1024, i++ ){
        size /= 1024;
    }
    for( ; size >= 4096 && i < units.size()-1; i++ ){
        size /= 1024;
    }
    return std::to_string(size) + (i == 0 ? default_unit : units[i]);
}

/**
 * @brief Parses a size: decimal or "0x" hex number, optionally followed by
 *        k/m/g/t[b] (binary units) or r/rec (records of 14 bytes), case-insensitive.
 *
 * @param size Size string.
 * @return Size in bytes.
 * @throws std::invalid_argument On a malformed number or unknown unit.
 * @throws std::out_of_range On overflow.
 */
uint64_t human2bytes(const std::string& size) {
    if (size.length() > 2 && size[0] == '0' && (size[1]|0x20) == 'x') {
        size_t pos = 0;
        uint64_t result = std::stoull(size.substr(2), &pos, 16);
        if (pos != size.length() - 2) {
            throw std::invalid_argument("Invalid hex size: " + size);
        }
        return result;
    }

    size_t i = 0;
    while (i < size.length() && isdigit((unsigned char)size[i])) {
        i++;
    }
    if (i == 0) {
        throw std::invalid_argument("Invalid size: " + size);
    }

    const uint64_t number = std::stoull(size.substr(0, i));
    std::string unit = size.substr(i);
    std::transform(unit.begin(), unit.end(), unit.begin(), [](unsigned char c){ return std::tolower(c); });

    uint64_t multiplier = 0;
    if (unit.empty()) {
        multiplier = 1;
    } else if (unit == "r" || unit == "rec") {
        multiplier = Oracle::Rowid::RAW_SIZE;
    } else {
        static const std::array<std::pair<char, uint64_t>, 4> units {{
            {'k', 1ULL << 10}, {'m', 1ULL << 20}, {'g', 1ULL << 30}, {'t', 1ULL << 40}
        }};
        if (unit.size() <= 2 && (unit.size() == 1 || unit[1] == 'b')) {
            for (const auto& [c, mul] : units) {
                if (unit[0] == c) {
                    multiplier = mul;
                }
            }
        }
        if (multiplier == 0) {
            throw std::invalid_argument("Unsupported unit: " + unit);
        }
    }

    if (number > UINT64_MAX / multiplier) {
        throw std::out_of_range("Size out of range: " + size);
    }
    return number * multiplier;
}

/**
 * @brief Formats a duration using at most maxUnits of d/h/m/s, e.g. "2d5h", "3m20s".
 * @param seconds Duration in seconds.
 * @param maxUnits Maximum number of units shown.
 * @return Duration string, "0s" for zero.
 */
std::string seconds2human(uint64_t seconds, size_t maxUnits) {
    static const std::array<std::pair<uint64_t, char>, 4> units {{
        {86400, 'd'}, {3600, 'h'}, {60, 'm'}, {1, 's'}
    }};

    std::string result;
    size_t nunits = 0;
    for (const auto& [len, suffix] : units) {
        if (nunits >= maxUnits) {
            break;
        }
        if (seconds >= len || nunits > 0) { // once started, lower units are shown even if zero
            result += std::to_string(seconds / len) + suffix;
            seconds %= len;
            nunits++;
        }
    }

    return result.empty() ? "0s" : result;
}
