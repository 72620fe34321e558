/**
 * @file TestCommand.cpp
 * @brief Implementation of the TestCommand for system self-testing.
 *
 * Runs implicitly before any other command. Checks the type sizes the blob
 * offsets rely on and a known rowid/record pair, so a broken build fails
 * before it prints wrong docids.
 */

#include "TestCommand.hpp"
#include "Oracle/Rowid.hpp"
#include "Oracle/RTable.hpp"
#include "utils/hex.hpp"

REGISTER_COMMAND(TestCommand);

static const char* const KNOWN_ROWID = "AAAR3sAAEAAAACXAAA";
static const char* const KNOWN_HEX   = "000011DEC0001000000025C04141";

/**
 * @brief Constructs a TestCommand with the specified registration status.
 * @param reg Boolean indicating whether to register this command with the command registry.
 */
TestCommand::TestCommand(bool reg) : Command(reg, TEST_CMD_NAME, "self-test") {
}

/**
 * @brief Executes the self-tests.
 *
 * - off_t and size_t are 8 bytes (blobs larger than 4Gb)
 * - the record size divides the default chunk size
 * - the known record decodes to the known rowid and back
 *
 * @return 0 if all tests pass, 1 if any test fails.
 */
int TestCommand::run() {
    logger->trace("selftest: sizeof(off_t)     = {}", sizeof(off_t));
    logger->trace("selftest: sizeof(size_t)    = {}", sizeof(size_t));
    logger->trace("selftest: sizeof(raw_t)     = {}", sizeof(Oracle::Rowid::raw_t));

    if( sizeof(off_t) != 8 ){
        logger->critical("selftest: sizeof(off_t) != 8");
        return 1;
    }

    if( sizeof(size_t) != 8 ){
        logger->critical("selftest: sizeof(size_t) != 8");
        return 1;
    }

    if( sizeof(Oracle::Rowid::raw_t) != Oracle::Rowid::RAW_SIZE ){
        logger->critical("selftest: sizeof(raw_t) != {}", Oracle::Rowid::RAW_SIZE);
        return 1;
    }

    if( Oracle::RTable::CHUNK_SIZE % Oracle::Rowid::RAW_SIZE ){
        logger->critical("selftest: chunk size {} is not a multiple of {}", Oracle::RTable::CHUNK_SIZE, Oracle::Rowid::RAW_SIZE);
        return 1;
    }

    const std::string rowid = Oracle::Rowid::decode_hex(KNOWN_HEX);
    if( rowid != KNOWN_ROWID ){
        logger->critical("selftest: decode({}) = \"{}\", expected \"{}\"", KNOWN_HEX, filter_unprintable(rowid), KNOWN_ROWID);
        return 1;
    }

    const auto raw = Oracle::Rowid::encode(KNOWN_ROWID);
    const std::string hex = to_hex(raw.data(), raw.size());
    if( hex != KNOWN_HEX ){
        logger->critical("selftest: encode({}) = {}, expected {}", KNOWN_ROWID, hex, KNOWN_HEX);
        return 1;
    }

    logger->trace("selftest: OK");
    return 0;
}
