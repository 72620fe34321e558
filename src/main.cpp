/**
 * @file main.cpp
 * @brief Main entry point for RidScan application.
 *
 * This file contains the main function that handles command-line parsing,
 * command registration, logging initialization, and command execution.
 * Every command except "test" itself is preceded by a silent self-test.
 */

#include <argparse/argparse.hpp>

#include "utils/common.hpp"
#include "version.h"

#include "commands/TestCommand.hpp"

#include <chrono>
#include <iostream>

extern argparse::ArgumentParser program;
extern int verbosity;

/**
 * @brief Main entry point for RidScan application.
 *
 * Handles:
 * - Signal handler registration for crash dumps
 * - Command-line argument parsing
 * - Logging initialization and configuration
 * - Automatic self-testing before command execution
 * - Command execution
 *
 * Global options may be given before or after the command name.
 *
 * @param argc Argument count.
 * @param argv Argument vector.
 * @return Exit code of the command, 1 on a usage error.
 */
int main(int argc, char*argv[]) {
    signal(SIGSEGV, signal_handler);
    signal(SIGABRT, signal_handler);

    register_program_args(program);

    for (const auto& [name, cmd] : Command::registry()) {
        program.add_subparser(cmd->parser());
    }

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        std::exit(1);
    }

    logger->set_arguments(argc, argv);
    logger->set_banner(APP_NAME " " APP_VERSION);
    logger->set_verbosity(verbosity); // should be before logger->add_file() call

    auto& selfTestCmd = Command::registry()[TEST_CMD_NAME];
    for (const auto& [name, cmd] : Command::registry()) {
        if (!program.is_subcommand_used(name)) {
            continue;
        }

        auto& parser = cmd->parser();
        logger->set_dedup_limit(parser.is_used("--log-dedup-limit") ? parser.get<int>("--log-dedup-limit") : program.get<int>("--log-dedup-limit"));
        if( parser.is_used("--log") ){
            init_log(parser.get<std::string>("--log"));
        } else if( program.is_used("--log") ){
            init_log(program.get<std::string>("--log"));
        } else {
            init_log();
        }

        if( name == TEST_CMD_NAME ){
            // explicit self-test, make it visible
            logger->set_verbosity(9);
        } else {
            // implicit self-test, make it silent
            if( selfTestCmd->execute() != 0 ){
                logger->critical("self-test failed, exiting");
                exit(1);
            }
        }

        // warning: only use if all your loggers are thread-safe ("_mt" loggers)
        spdlog::flush_every(std::chrono::seconds(5));

        const int rc = cmd->execute();
        logger->flush();
        return rc;
    }

    std::cout << program;
    return 0;
}
