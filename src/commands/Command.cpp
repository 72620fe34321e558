/**
 * @file Command.cpp
 * @brief Command registration and the common error policy of all commands.
 */

#include "Command.hpp"
#include "core/errors.hpp"

Command::Command(bool reg, const char* name, const char* description)
    : m_parser(name, "", argparse::default_arguments::help), m_name(name) {
    m_parser.add_description(description);
    register_common_args(m_parser);
    if( reg ){
        if( registry().find(name) != registry().end() ){
            throw std::runtime_error("Command already registered: " + std::string(name));
        }
        registry()[name] = this;
    }
}

/**
 * @brief Runs the command; every error a command can't handle itself ends up here.
 *
 * Bad input (codec errors, misaligned options) and unusable blobs are
 * logged as critical, nothing is retried.
 *
 * @return Exit code of run(), or 1 on an exception.
 */
int Command::execute() {
    try {
        return run();
    } catch (const MalformedRecord& e) {
        logger->critical("{}: {}", m_name, e.what());
    } catch (const SourceReadFailure& e) {
        logger->critical("{}: {}", m_name, e.what());
    } catch (const std::invalid_argument& e) { // InvalidLength, InvalidAlphabetCharacter, bad options
        logger->critical("{}: {}", m_name, e.what());
    } catch (const std::out_of_range& e) {
        logger->critical("{}: {}", m_name, e.what());
    }
    return 1;
}
