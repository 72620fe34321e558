/**
 * @file EncodeCommand.cpp
 * @brief Encodes rowids into the 28-digit hex form they have in a $R blob.
 */

#include "EncodeCommand.hpp"
#include "Oracle/Rowid.hpp"
#include "utils/hex.hpp"

#include <iostream>

REGISTER_COMMAND(EncodeCommand);

EncodeCommand::EncodeCommand(bool reg) : Command(reg, "encode", "encode rowid(s) into hex records") {
    m_parser.add_argument("rowid").help("18-char rowid(s)").nargs(argparse::nargs_pattern::at_least_one);
}

int EncodeCommand::run() {
    int rc = 0;
    for( const auto& rowid : m_parser.get<std::vector<std::string>>("rowid") ){
        try {
            const auto raw = Oracle::Rowid::encode(rowid);
            std::cout << to_hex(raw.data(), raw.size()) << "\n";
        } catch (const std::invalid_argument& e) { // InvalidLength, InvalidAlphabetCharacter
            logger->error("{}: {}", filter_unprintable(rowid), e.what());
            rc = 1;
        }
    }
    std::cout.flush();
    return rc;
}
