/**
 * @file ScanCommand.cpp
 * @brief Implementation of the ScanCommand: dump a $R blob as (docid, rowid) pairs.
 *
 * Records already written stay in the output if the scan stops on a
 * malformed record or a read failure; the exit code is 1 in that case.
 */

#include "ScanCommand.hpp"
#include "core/errors.hpp"
#include "io/RecordWriter.hpp"
#include "scanning/RecordScanner.hpp"
#include "utils/Progress.hpp"

#include <cstring>
#include <fstream>
#include <iostream>
#include <optional>

REGISTER_COMMAND(ScanCommand);

/**
 * @brief Constructs a ScanCommand with the specified registration status.
 * @param reg Boolean indicating whether to register this command with the command registry.
 */
ScanCommand::ScanCommand(bool reg) : BlobCommand(reg, "scan", "decode all rowids of a $R blob") {
    m_parser.add_argument("-s", "--start").help("start offset (hex), a multiple of 14").scan<'x', uint64_t>().default_value(uint64_t{0});
    m_parser.add_argument("-F", "--format").help("output format: text, csv, json").default_value(std::string("text")).choices("text", "csv", "json");
    m_parser.add_argument("-o", "--output").help("output file [default: stdout]");
}

/**
 * @brief Decodes every record from --start to the end of the blob.
 *
 * The docid of the first record is base + start/14, so a partial scan gets
 * the same docids as a full one.
 *
 * @return 0 on success, 1 if the scan stopped early or the output could not be written.
 */
int ScanCommand::run() {
    auto src = open_source();
    const off_t start = m_parser.get<uint64_t>("--start");
    const size_t blob_size = src->size();

    const uint64_t base = base_docid();
    RecordScanner scanner(*src, base + start / RecordScanner::RECORD_SIZE, chunk_size(), start);

    logger->info("{}: {:#x} bytes = {} records, first docid {}", m_parser.get("blob"), blob_size, blob_size / RecordScanner::RECORD_SIZE, base);
    if( blob_size % RecordScanner::RECORD_SIZE ){
        logger->warn("blob size {:#x} is not a multiple of {}, the last record is incomplete", blob_size, RecordScanner::RECORD_SIZE);
    }
    if( m_parser.is_used("--row") && blob_size > Oracle::RTable::MAX_ROW_BLOB ){
        logger->warn("blob holds more than {} records, docids overlap with the next $R row", Oracle::RTable::DOCIDS_PER_ROW);
    }

    std::ofstream ofs;
    std::ostream* out = &std::cout;
    std::optional<Progress> progress;
    if( auto out_fname = m_parser.present("--output") ){
        ofs.open(*out_fname, std::ios::out | std::ios::binary | std::ios::trunc);
        if( !ofs ){
            logger->critical("cannot create {}: {}", *out_fname, strerror(errno));
            return 1;
        }
        out = &ofs;
        if( verbosity >= 0 ){
            progress.emplace(blob_size, start);
        }
    }

    auto writer = make_writer(m_parser.get("--format"), *out);
    writer->begin();

    int rc = 0;
    size_t nrecords = 0;
    try {
        scanner.scan([&](const Record& rec) {
            writer->write(rec);
            nrecords++;
            if( progress ){
                progress->found();
                progress->update(scanner.offset());
            }
            return !out->fail(); // stop on a dead output
        });
    } catch (const MalformedRecord& e) {
        logger->error("{}", e.what());
        rc = 1;
    } catch (const SourceReadFailure& e) {
        logger->error("{}", e.what());
        rc = 1;
    }
    writer->flush();
    if( out->fail() ){
        logger->error("write failed: {}", strerror(errno));
        rc = 1;
    }
    if( progress ){
        progress->finish(scanner.offset());
    }

    if( nrecords ){
        logger->info("{} records, docids {}..{}{}", nrecords, scanner.next_docid() - nrecords, scanner.next_docid() - 1, rc ? " (incomplete)" : "");
    } else {
        logger->info("no records{}", rc ? " (incomplete)" : "");
    }
    return rc;
}
