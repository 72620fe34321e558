/**
 * @file DecodeCommand.cpp
 * @brief Decodes hex records (as returned by rawtohex) into rowids, one per line.
 */

#include "DecodeCommand.hpp"
#include "Oracle/Rowid.hpp"
#include "utils/hex.hpp"

#include <iostream>

REGISTER_COMMAND(DecodeCommand);

DecodeCommand::DecodeCommand(bool reg) : Command(reg, "decode", "decode 28-digit hex record(s) into rowids") {
    m_parser.add_argument("hex").help("hex record(s)").nargs(argparse::nargs_pattern::at_least_one);
}

/**
 * @brief Prints one rowid per argument; bad arguments are logged and skipped.
 * @return 0 if all arguments were decoded, 1 otherwise.
 */
int DecodeCommand::run() {
    int rc = 0;
    for( const auto& hex : m_parser.get<std::vector<std::string>>("hex") ){
        try {
            const std::string rowid = Oracle::Rowid::decode_hex(hex);
            logger->debug("{}: {}", hex, to_hexdump(rowid));
            std::cout << rowid << "\n";
        } catch (const InvalidLength& e) {
            logger->error("{}: {}", filter_unprintable(hex), e.what());
            rc = 1;
        } catch (const MalformedRecord& e) {
            logger->error("{}: {}", filter_unprintable(hex), e.what());
            rc = 1;
        }
    }
    std::cout.flush();
    return rc;
}
