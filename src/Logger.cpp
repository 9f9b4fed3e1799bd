#include "Logger.h"
#include <ctime>
#include <iostream>

const char* to_string(LogLevel level) {
    switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

std::string Logger::default_log_path(int pid) {
    return fmt::format("/tmp/chroot-tool-{}.log", pid);
}

bool Logger::init(const std::string& log_path, bool debug) {
    std::lock_guard<std::mutex> lock(mutex_);
    debug_ = debug;
    log_path_ = log_path;
    log_file_.reset();

    if (log_path.empty()) {
        return true;
    }

    log_file_ = std::make_unique<std::ofstream>(log_path, std::ios::trunc);
    if (!log_file_->is_open()) {
        log_file_.reset();
        std::cerr << "Warning: Could not open log file " << log_path << std::endl;
        return false;
    }
    return true;
}

void Logger::log(LogLevel level, const std::string& message) {
    std::time_t now = std::time(nullptr);
    std::tm local_tm{};
    localtime_r(&now, &local_tm);
    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%d %H:%M:%S", &local_tm);

    const std::string line = fmt::format("[{}] [{}] {}\n", time_buf, to_string(level), message);

    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_) {
        *log_file_ << line;
        log_file_->flush();
    }
    if (stderr_enabled_ && (level != LogLevel::Debug || debug_)) {
        std::cerr << line;
    }
}
