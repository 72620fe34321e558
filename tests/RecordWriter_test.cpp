#include "test_utils.hpp"
#include "io/RecordWriter.hpp"
#include "Oracle/Rowid.hpp"

#include <nlohmann/json.hpp>
#include <sstream>

static Record make_record(uint64_t docid, off_t offset, const std::string& rowid) {
    Record rec;
    rec.docid = docid;
    rec.offset = offset;
    rec.raw = Oracle::Rowid::encode(rowid);
    rec.rowid = rowid;
    return rec;
}

TEST(RecordWriter, text) {
    std::ostringstream ss;
    TextRecordWriter writer(ss);
    writer.begin();
    writer.write(make_record(1, 0, "AAAR3sAAEAAAACXAAA"));
    writer.write(make_record(2, 14, "AAAR3sAAEAAAACXAAB"));
    EXPECT_EQ("d:1 r:AAAR3sAAEAAAACXAAA\nd:2 r:AAAR3sAAEAAAACXAAB\n", ss.str());
}

TEST(RecordWriter, csv) {
    std::ostringstream ss;
    CsvRecordWriter writer(ss);
    writer.begin();
    writer.write(make_record(35001, 0x1c, "AAAR3sAAEAAAACXAAA"));
    EXPECT_EQ("docid,offset,raw,rowid\n35001,0x1c,000011DEC0001000000025C04141,AAAR3sAAEAAAACXAAA\n", ss.str());
}

TEST(RecordWriter, csv_quotes_literal_tail) {
    std::ostringstream ss;
    CsvRecordWriter writer(ss);
    writer.write(make_record(1, 0, "AAAR3sAAEAAAACXA,\""));
    EXPECT_EQ("1,0x0,000011DEC0001000000025C02C22,\"AAAR3sAAEAAAACXA,\"\"\"\n", ss.str());
}

TEST(RecordWriter, json) {
    std::ostringstream ss;
    JsonRecordWriter writer(ss);
    writer.write(make_record(7, 0x54, "AAAR3sAAEAAAACXAAA"));
    writer.write(make_record(8, 0x62, "AAAR3sAAEAAAACXAAB"));

    auto lines = split(ss.str(), '\n');
    ASSERT_EQ(2, lines.size());
    auto j = nlohmann::json::parse(lines[0]);
    EXPECT_EQ(7, j["docid"]);
    EXPECT_EQ(0x54, j["offset"]);
    EXPECT_EQ("000011DEC0001000000025C04141", j["raw"]);
    EXPECT_EQ("AAAR3sAAEAAAACXAAA", j["rowid"]);
    EXPECT_EQ("AAAR3sAAEAAAACXAAB", nlohmann::json::parse(lines[1])["rowid"]);
}

TEST(RecordWriter, json_non_utf8_tail) {
    Oracle::Rowid::raw_t raw;
    raw.fill(0xff);
    Record rec;
    rec.docid = 1;
    rec.offset = 0;
    rec.raw = raw;
    rec.rowid = Oracle::Rowid::decode(raw);

    std::ostringstream ss;
    JsonRecordWriter writer(ss);
    EXPECT_NO_THROW(writer.write(rec));
    auto j = nlohmann::json::parse(ss.str());
    EXPECT_EQ("FFFFFFFFFFFFFFFFFFFFFFFFFFFF", j["raw"]);

    // invalid tail bytes become U+FFFD, the base64 part is intact
    const std::string rowid = j["rowid"];
    EXPECT_EQ(std::string(16, '/'), rowid.substr(0, 16));
    EXPECT_THAT(rowid.substr(16), HasSubstr("\xEF\xBF\xBD"));
    EXPECT_NE(rec.rowid, rowid);
}

TEST(RecordWriter, make_writer) {
    std::ostringstream ss;
    EXPECT_NE(nullptr, dynamic_cast<TextRecordWriter*>(make_writer("text", ss).get()));
    EXPECT_NE(nullptr, dynamic_cast<CsvRecordWriter*>(make_writer("csv", ss).get()));
    EXPECT_NE(nullptr, dynamic_cast<JsonRecordWriter*>(make_writer("json", ss).get()));
    EXPECT_THROW(make_writer("xml", ss), std::invalid_argument);
}
