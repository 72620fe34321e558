#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

#include "BlobSource.hpp"

// a blob exported to a regular file, or a raw device (/dev/sdX)
class FileBlobSource : public BlobSource {
    public:
    explicit FileBlobSource(const std::filesystem::path& fname);
    ~FileBlobSource() override;

    FileBlobSource(const FileBlobSource&) = delete;
    FileBlobSource& operator=(const FileBlobSource&) = delete;

    // either succeeds or throws ReadError
    size_t read_at(off_t offset, void* buf, size_t count) override;
    using BlobSource::read_at;

    size_t size() const override { return m_size; }

    const std::filesystem::path& fname() const { return m_fname; }

    // get size of a regular file or a block device
    static size_t get_size(const std::filesystem::path& fname);

    private:
    std::filesystem::path m_fname;
    int m_fd = -1;
    size_t m_size = 0;
};
