#pragma once
#include <cstdint>
#include <functional>
#include <sys/types.h>

#include "core/buf_t.hpp"
#include "core/Record.hpp"
#include "io/BlobSource.hpp"
#include "Oracle/RTable.hpp"

// walks a $R blob chunk by chunk, yielding (docid, rowid) pairs in blob order
//
// chunk_size and start must be multiples of the record size, so a record never straddles two chunks.
// single pass: once next() returned false or threw, the scanner is done.
class RecordScanner {
    public:
    static constexpr size_t RECORD_SIZE = Oracle::Rowid::RAW_SIZE;

    RecordScanner(BlobSource& src, uint64_t base_docid, size_t chunk_size = Oracle::RTable::CHUNK_SIZE, off_t start = 0);

    // false at the end of the blob
    // throws SourceReadFailure, MalformedRecord
    bool next(Record& rec);

    // calls func for each record until it returns false, returns number of records passed to func
    size_t scan(const std::function<bool(const Record&)>& func);

    uint64_t next_docid() const { return m_docid; }
    off_t offset() const { return m_chunk_offset + (off_t)m_pos; }
    size_t chunk_size() const { return m_chunk_size; }
    bool done() const { return m_done; }

    private:
    bool read_chunk();

    BlobSource& m_src;
    const size_t m_chunk_size;
    buf_t m_chunk;
    off_t m_chunk_offset;   // blob offset of m_chunk[0]
    size_t m_pos = 0;       // in m_chunk
    uint64_t m_docid;
    bool m_done = false;
};
