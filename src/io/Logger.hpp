#pragma once
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include "utils/to_hexdump.hpp" // includes <spdlog/spdlog.h>

// spdlog logger with verbosity levels, optional log file, session banner
// and suppression of warnings/errors repeated too many times
class Logger {
public:
    using level = spdlog::level::level_enum;

    explicit Logger(std::shared_ptr<spdlog::logger> logger)
        : m_logger(std::move(logger)) {}

    void set_verbosity(int verbosity);
    void set_banner(const std::string& banner){ m_banner = banner; }
    void set_arguments(int argc, char* argv[]);
    void set_arguments(const std::vector<std::string>&);
    void set_dedup_limit(int limit){ m_dedup_limit = limit; }

    template <typename... Args>
    inline void trace(fmt::format_string<Args...> format, Args&&... args) {
        m_logger->trace(format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void debug(fmt::format_string<Args...> format, Args&&... args) {
        m_logger->debug(format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void info(fmt::format_string<Args...> format, Args&&... args) {
        m_logger->info(format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void warn(fmt::format_string<Args...> format, Args&&... args) {
        if (!suppressed(level::warn, format, args...)) {
            m_logger->warn(format, std::forward<Args>(args)...);
        }
    }

    template <typename... Args>
    inline void error(fmt::format_string<Args...> format, Args&&... args) {
        if (!suppressed(level::err, format, args...)) {
            m_logger->error(format, std::forward<Args>(args)...);
        }
    }

    template <typename... Args>
    inline void critical(fmt::format_string<Args...> format, Args&&... args) {
        m_logger->critical(format, std::forward<Args>(args)...);
    }

    // add a second output stream to the logger
    bool add_file(const std::filesystem::path& fname);

    // show the banner and arguments
    void start();

    // console sink level, independent from the file sink
    level console_level() const;
    void set_console_level(level lvl);

    void flush() { m_logger->flush(); }

private:
    // counts messages by their format string, not by the arguments
    // the message which hits the limit is logged once more with a note, later ones are dropped
    template <typename... Args>
    bool suppressed(level lvl, fmt::format_string<Args...> format, const Args&... args) {
        if (m_dedup_limit <= 0) {
            return false;
        }

        std::lock_guard<std::mutex> lock(m_mtx);
        const auto sv = format.get();
        int n = m_logged_messages[std::string_view(sv.data(), sv.size())]++;
        if (n < m_dedup_limit) {
            return false;
        }
        if (n == m_dedup_limit) {
            m_logger->log(lvl, "{} [repeated {} times. suppressing]", fmt::vformat(format.get(), fmt::make_format_args(args...)), m_dedup_limit);
        }
        return true;
    }

    std::shared_ptr<spdlog::logger> m_logger;
    std::unordered_map<std::string_view, int> m_logged_messages;
    mutable std::mutex m_mtx;
    std::string m_banner;
    std::filesystem::path m_fname;
    std::vector<std::string> m_arguments;
    int m_dedup_limit = 0;
};

// spdlog can't format std::filesystem::path by default
template <>
struct fmt::formatter<std::filesystem::path> : fmt::formatter<std::string> {
    template <typename FormatContext>
    auto format(const std::filesystem::path& path, FormatContext& ctx) const {
        return fmt::formatter<std::string>::format(path.string(), ctx);
    }
};
