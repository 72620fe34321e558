/**
 * @file FindCommand.cpp
 * @brief Implementation of the FindCommand: look up the docids of given rowids in a $R blob.
 */

#include "FindCommand.hpp"
#include "core/errors.hpp"
#include "io/RecordWriter.hpp"
#include "scanning/RecordScanner.hpp"

#include <iostream>
#include <map>

REGISTER_COMMAND(FindCommand);

FindCommand::FindCommand(bool reg) : BlobCommand(reg, "find", "find docids of rowids in a $R blob") {
    m_parser.add_argument("rowid").help("18-char rowid(s) to look for").nargs(argparse::nargs_pattern::at_least_one);
}

/**
 * @brief Scans the whole blob once, printing every record that matches one of the rowids.
 *
 * A rowid may occur more than once, every occurrence is printed.
 *
 * If the scan stops on a bad record or a read error, the matches found so
 * far are still printed.
 *
 * @return 0 if every rowid was found in a complete scan, 1 otherwise.
 */
int FindCommand::run() {
    std::map<Oracle::Rowid::raw_t, std::string> wanted; // raw => rowid as given
    for( const auto& rowid : m_parser.get<std::vector<std::string>>("rowid") ){
        wanted[Oracle::Rowid::encode(rowid)] = rowid;
    }

    auto src = open_source();
    RecordScanner scanner(*src, base_docid(), chunk_size());
    TextRecordWriter writer(std::cout);

    bool complete = true;
    std::map<Oracle::Rowid::raw_t, size_t> nfound;
    try {
        scanner.scan([&](const Record& rec) {
            if( wanted.count(rec.raw) ){
                writer.write(rec);
                if( nfound[rec.raw]++ == 1 ){
                    logger->warn("{}: rowid occurs more than once", rec.rowid);
                }
            }
            return true;
        });
    } catch (const MalformedRecord& e) {
        logger->error("{}", e.what());
        complete = false;
    } catch (const SourceReadFailure& e) {
        logger->error("{}", e.what());
        complete = false;
    }
    writer.flush();

    int rc = complete ? 0 : 1;
    for( const auto& [raw, rowid] : wanted ){
        if( !nfound.count(raw) ){
            logger->warn("{}: not found{}", rowid, complete ? "" : " (scan incomplete)");
            rc = 1;
        }
    }
    logger->info("found {} of {} rowids{}", nfound.size(), wanted.size(), complete ? "" : ", scan incomplete");
    return rc;
}
