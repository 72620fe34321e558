#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <sys/types.h>

#include <spdlog/fmt/fmt.h>

// wrong-sized input to Rowid::encode() / Rowid::decode()
class InvalidLength : public std::invalid_argument {
    public:
    // unit: "bytes", "chars" or "hex digits"
    InvalidLength(const char* what, size_t expected, size_t actual, const char* unit = "bytes")
        : std::invalid_argument(fmt::format("{}: expected {} {}, got {}", what, expected, unit, actual)),
          m_expected(expected), m_actual(actual) {}

    size_t expected() const { return m_expected; }
    size_t actual() const { return m_actual; }

    private:
    size_t m_expected, m_actual;
};

// character outside of the 64-entry alphabet in the base64 part of a rowid
class InvalidAlphabetCharacter : public std::invalid_argument {
    public:
    InvalidAlphabetCharacter(size_t pos, char c)
        : std::invalid_argument(fmt::format("invalid rowid character {:#04x} at position {}", (uint8_t)c, pos)),
          m_pos(pos), m_char(c) {}

    size_t pos() const { return m_pos; }
    char character() const { return m_char; }

    private:
    size_t m_pos;
    char m_char;
};

// short or non-hex record
class MalformedRecord : public std::runtime_error {
    public:
    MalformedRecord(off_t offset, const std::string& msg)
        : std::runtime_error(fmt::format("malformed record at {:#x}: {}", offset, msg)), m_offset(offset) {}

    off_t offset() const { return m_offset; }

    private:
    off_t m_offset;
};

// blob is unreadable or truncated
class SourceReadFailure : public std::runtime_error {
    public:
    SourceReadFailure(off_t offset, const std::string& msg)
        : std::runtime_error(fmt::format("read failure at {:#x}: {}", offset, msg)), m_offset(offset) {}

    off_t offset() const { return m_offset; }

    private:
    off_t m_offset;
};
