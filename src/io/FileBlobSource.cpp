/**
 * @file FileBlobSource.cpp
 * @brief Blob source backed by a file or a block device.
 *
 * The $R blob is usually exported to a file, but it may also be carved out
 * of a raw device, so sizes of block devices are detected via ioctl.
 * Reads are positioned (pread) and never move a shared file offset.
 */

#include "FileBlobSource.hpp"
#include "core/errors.hpp"
#include "utils/common.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#ifdef __linux__
#include <sys/ioctl.h>
#include <linux/fs.h>
#elif __APPLE__
#include <sys/ioctl.h>
#include <sys/disk.h>
#endif

/**
 * @brief Returns the size of a regular file or a block device.
 * @param fname Path to the file or device.
 * @return Size in bytes, 0 for other kinds of files.
 * @throws SourceReadFailure If the file cannot be stat'ed or the device size cannot be queried.
 */
size_t FileBlobSource::get_size(const std::filesystem::path& fname) {
    size_t size = 0;
    struct stat st;
    if( stat(fname.c_str(), &st) == -1 ) {
        throw SourceReadFailure(0, fmt::format("stat(\"{}\"): {}", fname, strerror(errno)));
    }

    if (S_ISREG(st.st_mode)) {
        size = st.st_size;
    } else if (S_ISBLK(st.st_mode)) {
        int fd = open(fname.c_str(), O_RDONLY);
        if (fd == -1) {
            throw SourceReadFailure(0, fmt::format("open(\"{}\"): {}", fname, strerror(errno)));
        }
#ifdef __linux__
        if (ioctl(fd, BLKGETSIZE64, &size) == -1) {
            close(fd);
            throw SourceReadFailure(0, fmt::format("ioctl({}, BLKGETSIZE64): {}", fd, strerror(errno)));
        }
#elif __APPLE__
        uint32_t block_size = 0;
        uint64_t block_count = 0;
        if (ioctl(fd, DKIOCGETBLOCKSIZE, &block_size) == -1 || ioctl(fd, DKIOCGETBLOCKCOUNT, &block_count) == -1) {
            close(fd);
            throw SourceReadFailure(0, fmt::format("ioctl({}, DKIOCGETBLOCK*): {}", fd, strerror(errno)));
        }
        size = (size_t)block_size * block_count;
#endif
        close(fd);
    }
    return size;
}

/**
 * @brief Opens a file or device read-only and determines its size.
 * @param fname Path to the file or device.
 * @throws SourceReadFailure If the file cannot be opened or its size cannot be determined.
 */
FileBlobSource::FileBlobSource(const std::filesystem::path& fname) : m_fname(fname) {
    m_fd = open(fname.c_str(), O_RDONLY);
    if( m_fd == -1 ) {
        throw SourceReadFailure(0, fmt::format("open(\"{}\"): {}", fname, strerror(errno)));
    }
    try {
        m_size = get_size(fname);
    } catch (const SourceReadFailure&) {
        close(m_fd);
        throw;
    }
    logger->debug("{}: opened, size {:#x}", fname, m_size);
}

FileBlobSource::~FileBlobSource() {
    if( m_fd != -1 ) {
        close(m_fd);
    }
}

/**
 * @brief Positioned read, retried until count bytes are read or EOF is hit.
 *
 * @param offset Blob offset to read from.
 * @param buf Buffer to read into.
 * @param count Number of bytes to read.
 * @return Number of bytes read, less than count only at the end of the file.
 * @throws std::invalid_argument If offset is negative.
 * @throws ReadError On read error.
 */
size_t FileBlobSource::read_at(off_t offset, void* buf, size_t count) {
    if( offset < 0 ){
        throw std::invalid_argument(fmt::format("offset < 0: {:#x}", offset));
    }
    if( (size_t)offset >= m_size ) {
        return 0;
    }

    char* out = static_cast<char*>(buf);
    size_t total_read = 0;
    while (total_read < count) {
        ssize_t nread = ::pread(m_fd, out + total_read, count - total_read, offset + total_read);
        if (nread == -1) {
            if (errno == EINTR) continue;
            throw ReadError(fmt::format("pread(fd {}, offset {:#x}, count {:#x}): {}", m_fd, offset + total_read, count - total_read, strerror(errno)));
        }
        if (nread == 0) {
            break; // EOF
        }
        total_read += (size_t)nread;
    }
    return total_read;
}
