#ifndef NSLOG_LOG_RECORD_HPP
#define NSLOG_LOG_RECORD_HPP

#include "log_level.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <string>

namespace nslog {
    /// One emitted record, ready for a formatter. `fields` holds the bound
    /// fields of the emitting logger followed by the merge object of the call.
    struct LogRecord {
        LogLevel level;
        std::chrono::system_clock::time_point timestamp;
        bool hasMessage;
        std::string message;
        nlohmann::ordered_json fields;

        LogRecord()
            : level(LogLevel::INFO)
            , timestamp(std::chrono::system_clock::now())
            , hasMessage(false)
            , fields(nlohmann::ordered_json::object()) {}
    };
} // namespace nslog

#endif // NSLOG_LOG_RECORD_HPP
