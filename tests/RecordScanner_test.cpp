#include "test_utils.hpp"
#include "scanning/RecordScanner.hpp"
#include "core/errors.hpp"

#include <new>

// serves the first m_fail_at bytes, then fails the way the test asks for
class FaultySource : public MemoryBlobSource {
    public:
    enum class Fault { READ_ERROR, SHORT_READ, ZERO_READ, BAD_ALLOC };

    FaultySource(buf_t data, off_t fail_at, Fault fault) : MemoryBlobSource(std::move(data)), m_fail_at(fail_at), m_fault(fault) {}

    size_t read_at(off_t offset, void* buf, size_t count) override {
        m_nreads++;
        if( offset + (off_t)count <= m_fail_at ){
            return MemoryBlobSource::read_at(offset, buf, count);
        }
        switch( m_fault ){
            case Fault::READ_ERROR:
                throw ReadError("EIO");
            case Fault::SHORT_READ:
                return MemoryBlobSource::read_at(offset, buf, count / 2);
            case Fault::ZERO_READ:
                return 0;
            case Fault::BAD_ALLOC:
                throw std::bad_alloc();
        }
        return 0;
    }

    int nreads() const { return m_nreads; }

    private:
    off_t m_fail_at;
    Fault m_fault;
    int m_nreads = 0;
};

static std::vector<Record> scan_all(RecordScanner& scanner) {
    std::vector<Record> records;
    scanner.scan([&](const Record& rec) {
        records.push_back(rec);
        return true;
    });
    return records;
}

TEST(RecordScanner, three_records) {
    MemoryBlobSource src(make_blob(3));
    RecordScanner scanner(src, 100);
    auto records = scan_all(scanner);

    ASSERT_EQ(3, records.size());
    for (size_t i = 0; i < records.size(); i++) {
        EXPECT_EQ(100 + i, records[i].docid);
        EXPECT_EQ((off_t)(i * 14), records[i].offset);
        EXPECT_EQ(make_rowid(i), records[i].rowid);
    }
    EXPECT_EQ("AAAR3sAAEAAAACXAAA", records[0].rowid);
    EXPECT_EQ("AAAR3sAAEAAAACXAAB", records[1].rowid);
    EXPECT_EQ(103, scanner.next_docid());
    EXPECT_TRUE(scanner.done());
}

TEST(RecordScanner, empty_blob) {
    MemoryBlobSource src;
    RecordScanner scanner(src, 1);
    Record rec;
    EXPECT_FALSE(scanner.next(rec));
    EXPECT_EQ(1, scanner.next_docid());
    EXPECT_TRUE(scanner.done());
}

TEST(RecordScanner, next_after_end) {
    MemoryBlobSource src(make_blob(1));
    RecordScanner scanner(src, 1);
    Record rec;
    EXPECT_TRUE(scanner.next(rec));
    EXPECT_FALSE(scanner.next(rec));
    EXPECT_FALSE(scanner.next(rec));
}

TEST(RecordScanner, chunk_size_does_not_change_output) {
    MemoryBlobSource src(make_blob(28));

    RecordScanner small(src, 1, 14);
    RecordScanner big(src, 1, 1400);
    RecordScanner odd(src, 1, 3 * 14);
    auto r1 = scan_all(small);
    auto r2 = scan_all(big);
    auto r3 = scan_all(odd);

    ASSERT_EQ(28, r1.size());
    ASSERT_EQ(r1.size(), r2.size());
    ASSERT_EQ(r1.size(), r3.size());
    for (size_t i = 0; i < r1.size(); i++) {
        EXPECT_EQ(r1[i].docid, r2[i].docid);
        EXPECT_EQ(r1[i].rowid, r2[i].rowid);
        EXPECT_EQ(r1[i].docid, r3[i].docid);
        EXPECT_EQ(r1[i].rowid, r3[i].rowid);
    }
}

TEST(RecordScanner, chunk_count) {
    FaultySource src(make_blob(250), 250 * 14, FaultySource::Fault::READ_ERROR);
    RecordScanner scanner(src, 1);
    EXPECT_EQ(250, scan_all(scanner).size());
    EXPECT_EQ(3, src.nreads()); // 100 + 100 + 50 records
}

TEST(RecordScanner, raw_matches_blob) {
    buf_t blob = make_blob(2);
    MemoryBlobSource src(blob);
    RecordScanner scanner(src, 1);
    auto records = scan_all(scanner);
    ASSERT_EQ(2, records.size());
    EXPECT_EQ(0, memcmp(records[1].raw.data(), blob.data() + 14, 14));
}

TEST(RecordScanner, trailing_partial_record) {
    buf_t blob = make_blob(3);
    blob.resize(blob.size() + 5, 0xaa);
    MemoryBlobSource src(blob);
    RecordScanner scanner(src, 1);

    std::vector<Record> records;
    try {
        scanner.scan([&](const Record& rec) {
            records.push_back(rec);
            return true;
        });
        FAIL() << "no exception";
    } catch (const MalformedRecord& e) {
        EXPECT_EQ(42, e.offset());
        EXPECT_THAT(e.what(), HasSubstr("5 of 14"));
    }
    EXPECT_EQ(3, records.size());
    EXPECT_TRUE(scanner.done());

    Record rec;
    EXPECT_FALSE(scanner.next(rec));
}

TEST(RecordScanner, partial_record_only) {
    MemoryBlobSource src(buf_t(13));
    RecordScanner scanner(src, 1);
    Record rec;
    EXPECT_THROW(scanner.next(rec), MalformedRecord);
}

TEST(RecordScanner, read_error) {
    FaultySource src(make_blob(200), 1400, FaultySource::Fault::READ_ERROR);
    RecordScanner scanner(src, 1);

    size_t n = 0;
    try {
        scanner.scan([&](const Record&) { n++; return true; });
        FAIL() << "no exception";
    } catch (const SourceReadFailure& e) {
        EXPECT_EQ(1400, e.offset());
        EXPECT_THAT(e.what(), HasSubstr("EIO"));
    }
    EXPECT_EQ(100, n);
    EXPECT_TRUE(scanner.done());
}

TEST(RecordScanner, short_read_before_eof) {
    FaultySource src(make_blob(200), 1400, FaultySource::Fault::SHORT_READ);
    RecordScanner scanner(src, 1);
    EXPECT_THROW(scan_all(scanner), SourceReadFailure);
}

TEST(RecordScanner, zero_read_before_eof) {
    FaultySource src(make_blob(200), 0, FaultySource::Fault::ZERO_READ);
    RecordScanner scanner(src, 1);
    Record rec;
    EXPECT_THROW(scanner.next(rec), SourceReadFailure);
    EXPECT_FALSE(scanner.next(rec));
}

TEST(RecordScanner, other_source_error_ends_scan) {
    FaultySource src(make_blob(200), 1400, FaultySource::Fault::BAD_ALLOC);
    RecordScanner scanner(src, 1);

    Record rec;
    size_t n = 0;
    try {
        while (scanner.next(rec)) {
            n++;
        }
        FAIL() << "no exception";
    } catch (const std::bad_alloc&) {
    }
    EXPECT_EQ(100, n);
    EXPECT_TRUE(scanner.done());
    EXPECT_FALSE(scanner.next(rec));
    EXPECT_EQ(2, src.nreads());
}

TEST(RecordScanner, bad_chunk_size) {
    MemoryBlobSource src(make_blob(1));
    EXPECT_THROW(RecordScanner(src, 1, 0), std::invalid_argument);
    EXPECT_THROW(RecordScanner(src, 1, 1000), std::invalid_argument);
    EXPECT_THROW(RecordScanner(src, 1, 15), std::invalid_argument);
    EXPECT_NO_THROW(RecordScanner(src, 1, 14));
}

TEST(RecordScanner, bad_start) {
    MemoryBlobSource src(make_blob(2));
    EXPECT_THROW(RecordScanner(src, 1, 1400, 1), std::invalid_argument);
    EXPECT_THROW(RecordScanner(src, 1, 1400, -14), std::invalid_argument);
}

TEST(RecordScanner, start_offset) {
    MemoryBlobSource src(make_blob(5));
    RecordScanner scanner(src, 43, 28, 3 * 14);
    auto records = scan_all(scanner);

    ASSERT_EQ(2, records.size());
    EXPECT_EQ(43, records[0].docid);
    EXPECT_EQ(42, records[0].offset);
    EXPECT_EQ(make_rowid(3), records[0].rowid);
    EXPECT_EQ(make_rowid(4), records[1].rowid);
}

TEST(RecordScanner, start_at_end) {
    MemoryBlobSource src(make_blob(2));
    RecordScanner scanner(src, 1, 1400, 28);
    EXPECT_TRUE(scan_all(scanner).empty());
}

TEST(RecordScanner, callback_stops_scan) {
    MemoryBlobSource src(make_blob(10));
    RecordScanner scanner(src, 1);
    size_t n = scanner.scan([](const Record& rec) { return rec.docid < 4; });
    EXPECT_EQ(4, n);
    EXPECT_EQ(5, scanner.next_docid());

    // scan resumes where it stopped
    Record rec;
    ASSERT_TRUE(scanner.next(rec));
    EXPECT_EQ(5, rec.docid);
}

TEST(RecordScanner, docids_across_rows) {
    MemoryBlobSource src(make_blob(2));
    RecordScanner scanner(src, Oracle::RTable::first_docid(1));
    auto records = scan_all(scanner);
    ASSERT_EQ(2, records.size());
    EXPECT_EQ(35001, records[0].docid);
    EXPECT_EQ(35002, records[1].docid);
}
