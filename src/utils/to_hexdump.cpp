/**
 * @file to_hexdump.cpp
 * @brief Hex dumps of raw records and chunks for the debug log.
 *
 * The default width is the record size (14 bytes), so a dump of a chunk
 * shows exactly one $R record per line. Repeated lines are collapsed into
 * a single "*".
 */

#include "to_hexdump.hpp"
#include "Oracle/Rowid.hpp"

#include <cctype>
#include <cstdio>
#include <cstring>

extern int g_hexdump_width;

Hexdump::operator std::string() const {
    return to_string(g_hexdump_width > 0 ? g_hexdump_width : Oracle::Rowid::RAW_SIZE);
}

/**
 * @brief Formats the dump with the given number of bytes per line.
 *
 * Each line is "<offset>: <hex bytes> <ascii>"; unprintable bytes are shown as '.'.
 *
 * @param width Bytes per line.
 * @return Formatted dump, prefixed with m_prefix.
 */
std::string Hexdump::to_string(size_t width) const {
    char tmp[0x20];
    const uint8_t *buf = static_cast<const uint8_t*>(m_ptr);
    const uint8_t *last_line = nullptr;
    bool in_repeat = false;

    std::string output = m_prefix;

    for (size_t i = 0; i < m_size; i += width) {
        const size_t line_size = std::min(width, m_size - i);

        if (last_line && line_size == width && memcmp(buf + i, last_line, width) == 0) {
            if (!in_repeat) {
                snprintf(tmp, sizeof(tmp), "%*s*\n", m_indent, "");
                output += tmp;
                in_repeat = true;
            }
            continue;
        }

        snprintf(tmp, sizeof(tmp), "%*s%08zx:", m_indent, "", i);
        output += tmp;

        for (size_t j = 0; j < width; j++) {
            if (j < line_size) {
                snprintf(tmp, sizeof(tmp), " %02x", buf[i + j]);
                output += tmp;
            } else {
                output += "   ";
            }
        }

        output += "  ";
        for (size_t j = 0; j < line_size; j++) {
            output += isprint(buf[i + j]) ? (char)buf[i + j] : '.';
        }
        output += "\n";

        last_line = buf + i;
        in_repeat = false;
    }

    return output;
}
