#pragma once

#include <cstdarg>
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

namespace sigindex {

// printf-style logger writing "<tag>: [LEVEL] message" lines to stderr.
// Each line is emitted with a single fprintf, so concurrent callers never
// interleave within a line.
class Logger {
public:
    enum Level { kError = 0, kWarn = 1, kInfo = 2, kDebug = 3 };

    explicit Logger(Level level = kInfo, std::string tag = "sigindex")
        : level_(level), tag_(std::move(tag)) {}

    // Logger that only reports errors; for library callers and tests.
    static Logger quiet() { return Logger(kError); }

    // Parse "error", "warn", "info" or "debug".
    static bool parse_level(const std::string& str, Level& out) {
        if (str == "error") out = kError;
        else if (str == "warn") out = kWarn;
        else if (str == "info") out = kInfo;
        else if (str == "debug") out = kDebug;
        else return false;
        return true;
    }

    void set_level(Level level) { level_ = level; }
    Level level() const { return level_; }
    bool enabled(Level level) const { return level_ >= level; }
    bool verbose() const { return enabled(kDebug); }
    const std::string& tag() const { return tag_; }

    void error(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        log_impl(kError, fmt, ap);
        va_end(ap);
    }

    void warn(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        log_impl(kWarn, fmt, ap);
        va_end(ap);
    }

    void info(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        log_impl(kInfo, fmt, ap);
        va_end(ap);
    }

    void debug(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        log_impl(kDebug, fmt, ap);
        va_end(ap);
    }

private:
    static const char* level_name(Level level) {
        switch (level) {
            case kError: return "ERROR";
            case kWarn:  return "WARN";
            case kInfo:  return "INFO";
            case kDebug: return "DEBUG";
        }
        return "?";
    }

    void log_impl(Level level, const char* fmt, va_list ap) const {
        if (!enabled(level)) return;
        va_list ap2;
        va_copy(ap2, ap);
        int len = std::vsnprintf(nullptr, 0, fmt, ap2);
        va_end(ap2);
        if (len < 0) return;
        std::vector<char> msg(static_cast<size_t>(len) + 1);
        std::vsnprintf(msg.data(), msg.size(), fmt, ap);
        std::fprintf(stderr, "%s: [%s] %s\n", tag_.c_str(), level_name(level), msg.data());
    }

    Level level_;
    std::string tag_;
};

} // namespace sigindex
