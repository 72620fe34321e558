#pragma once
#include <memory>
#include <ostream>
#include <string>

#include "core/Record.hpp"

class RecordWriter {
    public:
    explicit RecordWriter(std::ostream& out) : m_out(out) {}
    virtual ~RecordWriter() {}

    virtual void begin() {}
    virtual void write(const Record& rec) = 0;
    void flush() { m_out.flush(); }

    protected:
    std::ostream& m_out;
};

// "d:<docid> r:<rowid>"
class TextRecordWriter : public RecordWriter {
    public:
    using RecordWriter::RecordWriter;
    void write(const Record& rec) override;
};

class CsvRecordWriter : public RecordWriter {
    public:
    using RecordWriter::RecordWriter;
    void begin() override;
    void write(const Record& rec) override;
};

// one json object per line: docid, offset, raw (hex), rowid
// a literal tail that is not valid UTF-8 is written as U+FFFD in "rowid", "raw" keeps the exact bytes
class JsonRecordWriter : public RecordWriter {
    public:
    using RecordWriter::RecordWriter;
    void write(const Record& rec) override;
};

// format: "text", "csv" or "json"; throws std::invalid_argument on anything else
std::unique_ptr<RecordWriter> make_writer(const std::string& format, std::ostream& out);
