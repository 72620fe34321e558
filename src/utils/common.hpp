#pragma once
#include "io/Logger.hpp"
#include "units.hpp"
#include "to_hexdump.hpp"
#include "core/buf_t.hpp"

#include <string>
#include <filesystem>
#include <memory>
#include <signal.h>

namespace fs = std::filesystem;

#include <argparse/argparse.hpp>

#define APP_NAME "RidScan"

#define ANSI_CLEAR_EOL     "\x1b[0K"

extern std::shared_ptr<Logger> logger;
extern int verbosity;
extern int g_hexdump_width;

void init_log(const std::string& log_fname = "");
void register_program_args(argparse::ArgumentParser &parser);
void register_common_args(argparse::ArgumentParser &parser);
void signal_handler(int sig);

// replaces everything outside of 0x20..0x7e with '.'
std::string filter_unprintable(const std::string& str);
