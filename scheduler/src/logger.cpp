#include "prsync/logger.hpp"

#include "prsync/errors.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace prsync {

Logger::Logger(std::ostream &out) : out_(out) {}

void Logger::open_file(const std::string &path) {
    std::lock_guard<std::mutex> lock(mutex_);
    file_.open(path, std::ios::out | std::ios::app);
    if (!file_.is_open()) {
        throw ConfigurationError("failed to open log file: " + path);
    }
}

void Logger::log(LogLevel level, const std::string &message) {
    std::ostringstream line;
    line << '[' << timestamp() << "] [" << level_name(level) << "] " << message << '\n';
    const std::string text = line.str();

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << text;
    out_.flush();
    if (file_.is_open()) {
        file_ << text;
        file_.flush();
    }
}

void Logger::info(const std::string &message) { log(LogLevel::Info, message); }

void Logger::warn(const std::string &message) { log(LogLevel::Warn, message); }

void Logger::error(const std::string &message) { log(LogLevel::Error, message); }

std::string Logger::timestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t time = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&time, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

const char *Logger::level_name(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "UNKNOWN";
}

} // namespace prsync
