#ifndef NSLOG_COMMON_HPP
#define NSLOG_COMMON_HPP

#include <string>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <vector>
#include <memory>
#include <utility>

#include <unistd.h>

namespace nslog {
namespace detail {
#if __cplusplus < 201402L
    template<typename T, typename... Args>
    std::unique_ptr<T> make_unique(Args&&... args) {
        return std::unique_ptr<T>(new T(std::forward<Args>(args)...));
    }
#else
    using std::make_unique;
#endif

    inline std::tm toUtc(std::time_t t) {
        std::tm tmBuf;
        gmtime_r(&t, &tmBuf);
        return tmBuf;
    }

    inline std::tm toLocal(std::time_t t) {
        std::tm tmBuf;
        localtime_r(&t, &tmBuf);
        return tmBuf;
    }

    inline std::string strftimeString(const std::tm& tmBuf, const char* format) {
        char buf[64];
        size_t n = std::strftime(buf, sizeof(buf), format, &tmBuf);
        return std::string(buf, n);
    }

    inline long long epochMillis(const std::chrono::system_clock::time_point& time) {
        return static_cast<long long>(std::chrono::duration_cast<std::chrono::milliseconds>(
            time.time_since_epoch()).count());
    }

    /// ISO-8601 UTC with milliseconds, e.g. 2024-01-01T12:00:00.000Z
    inline std::string isoTimestamp(const std::chrono::system_clock::time_point& time) {
        std::time_t t = std::chrono::system_clock::to_time_t(time);
        long long ms = epochMillis(time) % 1000;
        if (ms < 0) ms += 1000;
        char msBuf[8];
        std::snprintf(msBuf, sizeof(msBuf), ".%03lld", ms);
        return strftimeString(toUtc(t), "%Y-%m-%dT%H:%M:%S") + msBuf + "Z";
    }

    /// Local "yyyy-mm-dd HH:MM:ss.l +zzzz", the SYS:standard layout.
    inline std::string formatTimestamp(const std::chrono::system_clock::time_point& time) {
        std::time_t t = std::chrono::system_clock::to_time_t(time);
        long long ms = epochMillis(time) % 1000;
        if (ms < 0) ms += 1000;
        std::tm local = toLocal(t);
        char msBuf[8];
        std::snprintf(msBuf, sizeof(msBuf), ".%03lld", ms);
        return strftimeString(local, "%Y-%m-%d %H:%M:%S") + msBuf + " " +
               strftimeString(local, "%z");
    }

    inline std::string trim(const std::string& s) {
        size_t start = 0;
        while (start < s.size() && (s[start] == ' ' || s[start] == '\t' ||
                                    s[start] == '\n' || s[start] == '\r')) ++start;
        size_t end = s.size();
        while (end > start && (s[end - 1] == ' ' || s[end - 1] == '\t' ||
                               s[end - 1] == '\n' || s[end - 1] == '\r')) --end;
        return s.substr(start, end - start);
    }

    /// Split on a delimiter, trim every piece and drop the empty ones.
    inline std::vector<std::string> splitList(const std::string& s, char delim = ',') {
        std::vector<std::string> parts;
        size_t start = 0;
        while (start <= s.size()) {
            size_t pos = s.find(delim, start);
            if (pos == std::string::npos) pos = s.size();
            std::string piece = trim(s.substr(start, pos - start));
            if (!piece.empty()) parts.push_back(piece);
            start = pos + 1;
        }
        return parts;
    }

    inline bool startsWith(const std::string& s, const std::string& prefix) {
        return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
    }

    inline bool endsWith(const std::string& s, const std::string& suffix) {
        return s.size() >= suffix.size() &&
               s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    inline std::string hostName() {
        char buf[256];
        if (gethostname(buf, sizeof(buf)) != 0) return "localhost";
        buf[sizeof(buf) - 1] = '\0';
        return std::string(buf);
    }

    inline long processId() {
        return static_cast<long>(getpid());
    }

} // namespace detail
} // namespace nslog

#endif // NSLOG_COMMON_HPP
