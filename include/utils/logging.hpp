#pragma once

#include <string>

namespace convo {
namespace utils {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

class Logger {
public:
    static void initialize(LogLevel level = LogLevel::INFO);
    static void setLevel(LogLevel level);
    static LogLevel getLevel();

    // Accepts DEBUG/INFO/WARN/WARNING/ERROR in any case; falls back to INFO.
    static LogLevel parseLevel(const std::string& name);
    static std::string levelName(LogLevel level);

    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);
    static void debug(const std::string& message);

private:
    static bool initialized_;
    static LogLevel level_;

    static bool enabled(LogLevel level);
};

} // namespace utils
} // namespace convo
