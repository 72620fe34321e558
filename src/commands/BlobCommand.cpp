/**
 * @file BlobCommand.cpp
 * @brief Options shared by the commands that read a $R blob.
 */

#include "BlobCommand.hpp"
#include "io/FileBlobSource.hpp"
#include "io/HexTextBlobSource.hpp"
#include "Oracle/RTable.hpp"

BlobCommand::BlobCommand(bool reg, const char* name, const char* description) : Command(reg, name, description) {
    m_parser.add_argument("blob").help("$R blob: raw bytes, or hex text with --hex");
    m_parser.add_argument("--hex").help("blob is hex text (e.g. spooled from SQL*Plus)").default_value(false).implicit_value(true);

    auto &group = m_parser.add_mutually_exclusive_group();
    group.add_argument("-r", "--row").help("$R row number, first docid is 35000*row+1").scan<'u', uint64_t>();
    group.add_argument("-b", "--base").help("docid of the first record [default: 1]").scan<'u', uint64_t>();

    m_parser.add_argument("-c", "--chunk-size")
        .help("read size, a multiple of 14 bytes (e.g. 1400, 14Kb, 0x578, 100r)")
        .default_value(std::to_string(Oracle::RTable::CHUNK_SIZE));
}

std::unique_ptr<BlobSource> BlobCommand::open_source() {
    const std::string fname = m_parser.get("blob");
    if( m_parser.get<bool>("--hex") ){
        return std::make_unique<HexTextBlobSource>(fname);
    }
    return std::make_unique<FileBlobSource>(fname);
}

uint64_t BlobCommand::base_docid() {
    if( auto row = m_parser.present<uint64_t>("--row") ){
        return Oracle::RTable::first_docid(*row);
    }
    return m_parser.present<uint64_t>("--base").value_or(1);
}

size_t BlobCommand::chunk_size() {
    return human2bytes(m_parser.get("--chunk-size"));
}
