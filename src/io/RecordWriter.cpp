/**
 * @file RecordWriter.cpp
 * @brief Output formats for decoded $R records.
 *
 * The text format is the one the dump script always printed. CSV and JSON
 * lines carry the blob offset and the raw record too, for further
 * processing.
 */

#include "RecordWriter.hpp"
#include "utils/hex.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ostr.h>

void TextRecordWriter::write(const Record& rec) {
    fmt::print(m_out, "d:{} r:{}\n", rec.docid, rec.rowid);
}

// the literal tail of a rowid may contain anything
static std::string csv_quote(const std::string& str) {
    if (str.find_first_of(",\"\r\n") == std::string::npos) {
        return str;
    }
    std::string result = "\"";
    for (char c : str) {
        if (c == '"')
            result += '"';
        result += c;
    }
    result += '"';
    return result;
}

void CsvRecordWriter::begin() {
    m_out << "docid,offset,raw,rowid\n";
}

void CsvRecordWriter::write(const Record& rec) {
    fmt::print(m_out, "{},{:#x},{},{}\n", rec.docid, rec.offset, to_hex(rec.raw.data(), rec.raw.size()), csv_quote(rec.rowid));
}

void JsonRecordWriter::write(const Record& rec) {
    nlohmann::json j;
    j["docid"] = rec.docid;
    j["offset"] = rec.offset;
    j["raw"] = to_hex(rec.raw.data(), rec.raw.size());
    j["rowid"] = rec.rowid;
    m_out << j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n"; // lossy rowid, see header
}

std::unique_ptr<RecordWriter> make_writer(const std::string& format, std::ostream& out) {
    if (format == "text") {
        return std::make_unique<TextRecordWriter>(out);
    } else if (format == "csv") {
        return std::make_unique<CsvRecordWriter>(out);
    } else if (format == "json") {
        return std::make_unique<JsonRecordWriter>(out);
    }
    throw std::invalid_argument("unknown output format: " + format);
}
