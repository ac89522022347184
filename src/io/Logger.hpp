#pragma once
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

// hash for fmt::string_view, used as a dedup key
namespace std {
template <>
    struct hash<fmt::basic_string_view<char>> {
        size_t operator()(const fmt::basic_string_view<char>& s) const noexcept {
            return std::hash<std::string_view>{}(std::string_view(s.data(), s.size()));
        }
    };
}

// spdlog wrapper: verbosity mapping, optional file sink, repeated warning/error suppression
class Logger {
public:
    using level = spdlog::level::level_enum;

    // temporarily changes the console sink level, restores it on scope exit
    class ConsoleLevelGuard {
        Logger& m_logger;
        level m_prev;

        public:
        ConsoleLevelGuard(Logger& logger, level new_level)
            : m_logger(logger), m_prev(logger.console_level()) {
                m_logger.set_console_level(new_level);
            }

        ~ConsoleLevelGuard() {
            m_logger.set_console_level(m_prev);
        }
    };

    explicit Logger(std::shared_ptr<spdlog::logger> logger)
        : m_logger(std::move(logger)) {}

    // -4 and below: off, 0: info, 2 and above: trace
    void set_verbosity(int verbosity);
    void set_banner(const std::string& banner){ m_banner = banner; }
    void set_arguments(int argc, char* argv[]);
    void set_arguments(const std::vector<std::string>&);

    // 0 = no limit
    void set_dedup_limit(int limit){ m_dedup_limit = limit; }
    int dedup_limit() const { return m_dedup_limit; }

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
        log_dedup(level::warn, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void error(fmt::format_string<Args...> format, Args&&... args) {
        log_dedup(level::err, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void critical(fmt::format_string<Args...> format, Args&&... args) {
        m_logger->critical(format, std::forward<Args>(args)...);
    }

    // adds a file sink, at most one
    bool add_file(const std::filesystem::path& fname);
    const std::filesystem::path& file() const { return m_fname; }

    // logs the banner and the command line
    void start();

    level console_level() const;
    void set_console_level(level lvl);

private:
    // same format string logged more than m_dedup_limit times is suppressed, arguments are not compared
    template <typename... Args>
    void log_dedup(level lvl, fmt::format_string<Args...> format, Args&&... args) {
        if (m_dedup_limit > 0) {
            std::lock_guard<std::mutex> lock(m_mtx);

            int n = m_logged_messages[format.get()]++;
            if (n >= m_dedup_limit) {
                if (n == m_dedup_limit) {
                    std::string message = fmt::format(format, std::forward<Args>(args)...);
                    m_logger->log(lvl, "{} [repeated {} times. suppressing]", message, m_dedup_limit);
                }
                return;
            }
        }
        m_logger->log(lvl, format, std::forward<Args>(args)...);
    }

    std::shared_ptr<spdlog::logger> m_logger;
    std::unordered_map<fmt::string_view, int> m_logged_messages;
    mutable std::mutex m_mtx;
    std::string m_banner;
    std::filesystem::path m_fname;
    std::vector<std::string> m_arguments;
    int m_dedup_limit = 0;
};

// spdlog has no formatter for std::filesystem::path
template <>
struct fmt::formatter<std::filesystem::path> : fmt::formatter<std::string> {
    template <typename FormatContext>
    auto format(const std::filesystem::path& path, FormatContext& ctx) const {
        return fmt::formatter<std::string>::format(path.string(), ctx);
    }
};
