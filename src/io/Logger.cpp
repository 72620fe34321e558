/**
 * @file Logger.cpp
 * @brief Logger wrapper around spdlog: verbosity, file sink, session banner.
 *
 * The console sink is always the first one. A log file added with
 * add_file() gets at least DEBUG level, whatever the console shows.
 */

#include "Logger.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/fmt/ranges.h> // for fmt::join()
#include <algorithm>
#include <fstream>
#include <iterator>

/**
 * @brief Maps -q/-v counts to spdlog levels.
 *
 * -4 or less: off, -3: critical, -2: error, -1: warn, 0: info, 1: debug, 2+: trace
 *
 * @param verbosity Number of -v minus number of -q.
 */
void Logger::set_verbosity(int verbosity){
    static const level levels[] = {
        level::off, level::critical, level::err, level::warn, level::info, level::debug, level::trace
    };
    const int idx = std::clamp(verbosity + 4, 0, (int)std::size(levels) - 1);
    m_logger->set_level(levels[idx]);
}

void Logger::set_arguments(int argc, char* argv[]){
    m_arguments.assign(argv, argv + argc);
}

void Logger::set_arguments(const std::vector<std::string>& args){
    m_arguments = args;
}

// not a complete shell escape, just enough to copy-paste a command line from the log
static std::string quote_if_needed(const std::string& arg) {
    if (arg.empty() || arg.find_first_of(" \t'\"") != std::string::npos) {
        return "\"" + arg + "\"";
    }
    return arg;
}

/**
 * @brief Adds an appending file sink.
 *
 * If the console level is less verbose than DEBUG, the logger itself is
 * switched to DEBUG and the old level is moved to the console sink only.
 *
 * @param fname Path to the log file.
 * @return False if a file was already added or the file cannot be opened.
 */
bool Logger::add_file(const std::filesystem::path& fname) {
    if( !m_fname.empty() ){
        return false;
    }

    std::ofstream file(fname, std::ios::app);
    if( !file.is_open() ){
        m_logger->error("Failed to open log file {}, no log will be saved!", fname);
        return false;
    }
    if( file.tellp() != 0 ){
        file.write("\n\n", 2); // visual sessions separator
    }
    file.close();

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(fname.string());
    if( m_logger->level() > level::debug ){
        file_sink->set_level(level::debug);
        set_console_level(m_logger->level());
        m_logger->set_level(level::debug);
    }

    m_logger->sinks().push_back(file_sink);
    m_fname = fname;
    return true;
}

void Logger::start(){
    if( !m_banner.empty() ){
        m_logger->info("{}", m_banner);
    }
    std::vector<std::string> quoted;
    for (const auto& arg : m_arguments) {
        quoted.push_back(quote_if_needed(arg));
    }
    m_logger->debug("started as {}", fmt::join(quoted, " "));
    m_logger->debug("logging to {}", m_fname.empty() ? std::string("console only") : m_fname.string());
}

void Logger::set_console_level(level lvl) {
    m_logger->sinks().front()->set_level(lvl);
}

Logger::level Logger::console_level() const {
    return m_logger->sinks().front()->level();
}
