#pragma once
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <sys/types.h>

#include "core/buf_t.hpp"

// read-only random access to a blob
class BlobSource {
    public:
    virtual ~BlobSource() {}

    class ReadError : public std::runtime_error {
        public:
        explicit ReadError(const std::string& msg) : std::runtime_error(msg) {}
    };

    // total size in bytes
    virtual size_t size() const = 0;

    // returns less than count only at the end of the blob, 0 at or past the end
    virtual size_t read_at(off_t offset, void* buf, size_t count) = 0;

    size_t read_at(off_t offset, buf_t& buf) {
        return read_at(offset, buf.data(), buf.size());
    }
};

class MemoryBlobSource : public BlobSource {
    public:
    MemoryBlobSource() = default;
    explicit MemoryBlobSource(buf_t data) : m_data(std::move(data)) {}

    size_t size() const override { return m_data.size(); }

    size_t read_at(off_t offset, void* buf, size_t count) override {
        if( offset < 0 ){
            throw std::invalid_argument("offset < 0");
        }
        if( (size_t)offset >= m_data.size() ){
            return 0;
        }
        count = std::min(count, m_data.size() - offset);
        memcpy(buf, m_data.data() + offset, count);
        return count;
    }

    const buf_t& data() const { return m_data; }

    private:
    buf_t m_data;
};
