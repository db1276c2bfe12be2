#pragma once

#include <fstream>
#include <mutex>
#include <ostream>
#include <string>

namespace prsync {

enum class LogLevel { Info, Warn, Error };

class Logger {
  public:
    explicit Logger(std::ostream &out);

    // Appends every line to `path` as well. Throws ConfigurationError if the file cannot be opened.
    void open_file(const std::string &path);

    void log(LogLevel level, const std::string &message);
    void info(const std::string &message);
    void warn(const std::string &message);
    void error(const std::string &message);

  private:
    static std::string timestamp();
    static const char *level_name(LogLevel level) noexcept;

    std::ostream &out_;
    std::ofstream file_;
    std::mutex mutex_;
};

} // namespace prsync
