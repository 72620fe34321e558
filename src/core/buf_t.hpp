#pragma once
#include <vector>
#include <cstdint>
#include <string>

class buf_t : public std::vector<uint8_t> {
    public:
    buf_t() = default;
    buf_t(size_t size) : std::vector<uint8_t>(size) {}
    buf_t(const void* data, size_t size)
        : std::vector<uint8_t>(static_cast<const uint8_t*>(data), static_cast<const uint8_t*>(data) + size) {}
    buf_t(const std::string& str) : buf_t(str.data(), str.size()) {}

    std::string to_string() const {
        return std::string(reinterpret_cast<const char*>(data()), size());
    }
};
