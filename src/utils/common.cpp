/**
 * @file common.cpp
 * @brief Globals, command-line options shared by all commands, log setup
 *        and crash handling.
 */

#include "common.hpp"
#include "version.h"

#include <spdlog/sinks/stdout_color_sinks.h>

int verbosity = 0;
int g_hexdump_width = 0; // 0 = record size

// stdout is for records only
std::shared_ptr<Logger> logger = std::make_shared<Logger>(spdlog::stderr_color_mt(APP_NAME));
argparse::ArgumentParser program(APP_NAME, APP_VERSION, argparse::default_arguments::help);

// begin stack trace generation on error
#include <backtrace.h>

static void backtrace_error_cb(void *, const char *msg, int errnum) {
    logger->critical("Error: {} (Error number: {})", msg, errnum);
}

static int backtrace_full_cb(void *, uintptr_t pc, const char *filename, int lineno, const char *function) {
    logger->critical("     {} {}:{} ({})", (void *)pc, filename ? filename : "?", lineno, function ? function : "?");
    return 0;  // Continue processing the backtrace
}

void signal_handler(int sig) {
    logger->critical("Signal {} received, printing backtrace...", sig);

    backtrace_state *state = backtrace_create_state(NULL, 0, backtrace_error_cb, NULL);
    backtrace_full(state, 0, backtrace_full_cb, backtrace_error_cb, NULL);
    logger->flush();

    exit(1);
}
// end stack trace generation on error

std::string filter_unprintable(const std::string& str){
    std::string result;
    for( char c : str ){
        if( c >= 0x20 && c <= 0x7e ){
            result += c;
        } else {
            result += '.';
        }
    }
    return result;
}

/**
 * @brief Adds the log file (if any) and logs the session banner, once per process.
 *
 * @param log_fname Log pathname, empty for console only.
 * @note An explicitly requested log that cannot be opened is fatal.
 */
void init_log(const std::string& log_fname){
    static bool inited = false;
    if( inited ){
        return;
    }
    inited = true;

    if( !log_fname.empty() && !logger->add_file(log_fname) ){
        logger->critical("explicit log pathname is set, refusing to continue without log");
        exit(1);
    }
    logger->start();
}

void register_common_args(argparse::ArgumentParser &parser) {
    parser.add_argument("-v", "--verbose")
        .help("increase verbosity")
        .action([&](const auto &) { ++verbosity; })
        .append()
        .implicit_value(true)
        .nargs(0);

    parser.add_argument("-q", "--quiet")
        .help("decrease verbosity")
        .action([&](const auto &) { --verbosity; })
        .append()
        .implicit_value(true)
        .nargs(0);

    parser.add_argument("-H", "--hexdump-width")
        .help("set hexdump width [default: record size]")
        .store_into(g_hexdump_width);

    parser.add_argument("-L", "--log")
        .help("log pathname [default: console only]");
    parser.add_argument("--log-dedup-limit")
        .default_value(100)
        .scan<'i', int>()
        .help("limit duplicate log messages, 0 = no limit");
}

void register_program_args(argparse::ArgumentParser &parser) {
    register_common_args(parser);

    parser.add_argument("--version")
        .action([&](const auto & /*unused*/) {
            fmt::print("{}\n", APP_VERSION);
            exit(0);
        })
        .default_value(false)
        .help("print version information and exit")
        .implicit_value(true)
        .nargs(0);
}
