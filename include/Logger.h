#ifndef LOGGER_H
#define LOGGER_H

#include <fmt/format.h>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error,
};

const char* to_string(LogLevel level);

/**
 * @class Logger
 * @brief Process-wide session log.
 *
 * Every line goes to the session log file. Standard error receives every
 * line except DEBUG, which is echoed only when debug output is enabled.
 */
class Logger {
public:
    static Logger& instance();

    /**
     * @brief Opens (truncating) the session log file.
     * @param log_path File to write; empty keeps logging on stderr only.
     * @param debug Echo DEBUG lines to stderr as well.
     * @return false if the log file could not be opened.
     */
    bool init(const std::string& log_path, bool debug);

    void log(LogLevel level, const std::string& message);

    void set_stderr_enabled(bool enabled) { stderr_enabled_ = enabled; }
    const std::string& log_path() const { return log_path_; }

    // Standard location of the log for the process with the given id.
    static std::string default_log_path(int pid);

private:
    Logger() = default;

    bool debug_ = false;
    bool stderr_enabled_ = true;
    std::string log_path_;
    std::unique_ptr<std::ofstream> log_file_;
    std::mutex mutex_;
};

#define CHROOT_LOG_DEBUG(...) Logger::instance().log(LogLevel::Debug, fmt::format(__VA_ARGS__))
#define CHROOT_LOG_INFO(...) Logger::instance().log(LogLevel::Info, fmt::format(__VA_ARGS__))
#define CHROOT_LOG_WARN(...) Logger::instance().log(LogLevel::Warn, fmt::format(__VA_ARGS__))
#define CHROOT_LOG_ERROR(...) Logger::instance().log(LogLevel::Error, fmt::format(__VA_ARGS__))

#endif // LOGGER_H
