#ifndef NSLOG_LEVEL_HPP
#define NSLOG_LEVEL_HPP

#include <string>
#include <cctype>
#include <cstddef>

namespace nslog {
    /// Severities in increasing order of importance. SILENT is above every
    /// emitting level and is only used as a threshold.
    enum class LogLevel {
        TRACE = 10,
        DEBUG = 20,
        INFO = 30,
        WARN = 40,
        ERROR = 50,
        FATAL = 60,
        SILENT = 100
    };

    inline const char *getLevelString(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE: return "TRACE";
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARN: return "WARN";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::FATAL: return "FATAL";
            case LogLevel::SILENT: return "SILENT";
            default: return "UNKNOWN";
        }
    }

    /// Lower-case name as used in configuration ("info", "warn", ...).
    inline const char *getLevelName(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE: return "trace";
            case LogLevel::DEBUG: return "debug";
            case LogLevel::INFO: return "info";
            case LogLevel::WARN: return "warn";
            case LogLevel::ERROR: return "error";
            case LogLevel::FATAL: return "fatal";
            case LogLevel::SILENT: return "silent";
            default: return "info";
        }
    }

    inline int levelValue(LogLevel level) {
        return static_cast<int>(level);
    }

    namespace detail {
        inline std::string toLower(const std::string& s) {
            std::string result;
            result.reserve(s.size());
            for (size_t i = 0; i < s.size(); ++i) {
                result += static_cast<char>(std::tolower(static_cast<unsigned char>(s[i])));
            }
            return result;
        }
    } // namespace detail

    /// Parse a level name case-insensitively. Returns false for unknown
    /// names and leaves @p out untouched.
    inline bool tryParseLevel(const std::string& name, LogLevel& out) {
        std::string s = detail::toLower(name);
        if (s == "trace") { out = LogLevel::TRACE; return true; }
        if (s == "debug") { out = LogLevel::DEBUG; return true; }
        if (s == "info")  { out = LogLevel::INFO;  return true; }
        if (s == "warn" || s == "warning") { out = LogLevel::WARN; return true; }
        if (s == "error") { out = LogLevel::ERROR; return true; }
        if (s == "fatal") { out = LogLevel::FATAL; return true; }
        if (s == "silent") { out = LogLevel::SILENT; return true; }
        return false;
    }

    /// Unknown or empty names degrade to INFO.
    inline LogLevel parseLevel(const std::string& name) {
        LogLevel level = LogLevel::INFO;
        tryParseLevel(name, level);
        return level;
    }

    /// Level of a configured transport: exactly one of trace, debug, info,
    /// warn, error or fatal. Anything else, including "silent", is INFO.
    inline LogLevel parseSeverityLevel(const std::string& name) {
        static const char* const kSeverities[] = {"trace", "debug", "info", "warn", "error", "fatal"};
        static const LogLevel kLevels[] = {LogLevel::TRACE, LogLevel::DEBUG, LogLevel::INFO,
                                           LogLevel::WARN, LogLevel::ERROR, LogLevel::FATAL};
        std::string s = detail::toLower(name);
        for (size_t i = 0; i < 6; ++i) {
            if (s == kSeverities[i]) return kLevels[i];
        }
        return LogLevel::INFO;
    }
} // namespace nslog

#endif // NSLOG_LEVEL_HPP
