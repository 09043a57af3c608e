
#pragma once
#include <cstdio>
#include <cstdarg>
#include <mutex>
#include <string>

namespace swarmcast {

enum class LogLevel { TRACE=0, DEBUG, INFO, WARN, ERROR };

class Logger {
public:
    static Logger& instance();
    void set_level(LogLevel lvl);
    LogLevel level() const { return level_; }
    bool enabled(LogLevel lvl) const { return lvl >= level_; }
    void set_output(std::FILE* out);
    void log(LogLevel lvl, const char* fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;
private:
    Logger() = default;
    std::mutex mtx_;
    LogLevel level_ = LogLevel::INFO;
    std::FILE* out_ = stderr;
    const char* level_str(LogLevel lvl);
};

// Accepts trace/debug/info/warn/error, case-sensitive.
bool parse_log_level(const std::string& s, LogLevel& out);

} // namespace swarmcast
