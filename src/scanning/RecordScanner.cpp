/**
 * @file RecordScanner.cpp
 * @brief Chunked walk over a $R blob.
 *
 * The blob is read in chunks of a fixed size (1400 bytes, i.e. 100 records,
 * by default), every chunk is cut into 14-byte records and each record is
 * decoded into a rowid and numbered with the next docid. The blob offset
 * advances by the number of bytes actually read, so the final short chunk
 * is handled like any other.
 */

#include "RecordScanner.hpp"
#include "core/errors.hpp"
#include "utils/common.hpp"

#include <algorithm>
#include <cstring>

/**
 * @brief Sets up a scan, nothing is read until the first next().
 *
 * @param src Blob to scan, must outlive the scanner.
 * @param base_docid Docid of the first record at @p start.
 * @param chunk_size Bytes per read, a non-zero multiple of RECORD_SIZE.
 * @param start Blob offset to start at, a multiple of RECORD_SIZE.
 * @throws std::invalid_argument If chunk_size or start is not aligned to the record size.
 */
RecordScanner::RecordScanner(BlobSource& src, uint64_t base_docid, size_t chunk_size, off_t start)
    : m_src(src), m_chunk_size(chunk_size), m_chunk_offset(start), m_docid(base_docid) {
    if( chunk_size == 0 || chunk_size % RECORD_SIZE ){
        throw std::invalid_argument(fmt::format("chunk size {} is not a multiple of the record size {}", chunk_size, RECORD_SIZE));
    }
    if( start < 0 || start % RECORD_SIZE ){
        throw std::invalid_argument(fmt::format("start offset {:#x} is not a multiple of the record size {}", start, RECORD_SIZE));
    }
    m_chunk.reserve(m_chunk_size);
}

/**
 * @brief Reads the chunk following the current one.
 *
 * @return False if the end of the blob is reached.
 * @throws SourceReadFailure On a read error, or if the source returns less than
 *         requested before the end of the blob.
 * @throws MalformedRecord If the source rejects the data (hex text sources).
 * Any exception from the source is passed on and ends the scan.
 */
bool RecordScanner::read_chunk() {
    const off_t pos = m_chunk_offset + (off_t)m_chunk.size();
    const size_t blob_size = m_src.size();
    if( (size_t)pos >= blob_size ){
        return false;
    }

    const size_t want = std::min(m_chunk_size, blob_size - (size_t)pos);
    m_chunk.resize(want);

    size_t nread = 0;
    try {
        nread = m_src.read_at(pos, m_chunk.data(), want);
    } catch (const BlobSource::ReadError& e) {
        m_done = true;
        throw SourceReadFailure(pos, e.what());
    } catch (...) {
        m_done = true; // whatever the error, the scan is over
        throw;
    }

    if( nread == 0 ){
        m_done = true;
        throw SourceReadFailure(pos, fmt::format("unexpected EOF, blob size is {:#x}", blob_size));
    }
    if( nread < want ){
        m_done = true;
        throw SourceReadFailure(pos, fmt::format("short read: {:#x} of {:#x} bytes", nread, want));
    }

    m_chunk_offset = pos;
    m_pos = 0;
    logger->trace("{:#x}: read {:#x} bytes", pos, nread);
    return true;
}

/**
 * @brief Decodes the next record of the blob.
 *
 * @param[out] rec Filled with the record on success.
 * @return True if a record was produced, false at the end of the blob.
 * @throws SourceReadFailure, MalformedRecord The scan is over after either one.
 */
bool RecordScanner::next(Record& rec) {
    if( m_done ){
        return false;
    }

    if( m_pos >= m_chunk.size() && !read_chunk() ){
        m_done = true;
        return false;
    }

    const size_t remain = m_chunk.size() - m_pos;
    if( remain < RECORD_SIZE ){
        m_done = true;
        logger->debug("{:#x}: trailing bytes: {}", offset(), to_hexdump(m_chunk.data() + m_pos, remain));
        throw MalformedRecord(offset(), fmt::format("short record: {} of {} bytes", remain, RECORD_SIZE));
    }

    rec.docid = m_docid++;
    rec.offset = offset();
    memcpy(rec.raw.data(), m_chunk.data() + m_pos, RECORD_SIZE);
    rec.rowid = Oracle::Rowid::decode(rec.raw);
    m_pos += RECORD_SIZE;
    return true;
}

size_t RecordScanner::scan(const std::function<bool(const Record&)>& func) {
    size_t count = 0;
    Record rec;
    while( next(rec) ){
        count++;
        if( !func(rec) ){
            break;
        }
    }
    return count;
}
