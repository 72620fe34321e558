#pragma once
#include <algorithm>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

#include "core/buf_t.hpp"

class Hexdump {
    public:
    Hexdump(const void *ptr, size_t buflen) : m_ptr(ptr), m_size(buflen) {}
    Hexdump indent(int level){ m_indent = level; return *this; }
    Hexdump prefix(const std::string& prefix){ m_prefix = prefix; return *this; }

    std::string to_string(size_t width) const;
    operator std::string() const;

    private:
    const void *m_ptr;
    size_t m_size;
    int m_indent = 0;
    std::string m_prefix;
};

inline Hexdump to_hexdump(const void *ptr, size_t buflen){
    return Hexdump(ptr, buflen);
}

inline Hexdump to_hexdump(const buf_t& buf){
    return to_hexdump(buf.data(), buf.size());
}

inline Hexdump to_hexdump(const std::string& str, size_t max_size=0){
    max_size = max_size ? std::min(max_size, str.size()) : str.size();
    return to_hexdump(str.data(), max_size);
}

// lets spdlog print a Hexdump on its own lines, below the message
template <>
struct fmt::formatter<Hexdump> : fmt::formatter<std::string> {
    template <typename FormatContext>
    auto format(const Hexdump& hd, FormatContext& ctx) const {
        return fmt::formatter<std::string>::format(static_cast<std::string>(Hexdump(hd).prefix("\n").indent(4)), ctx);
    }
};
