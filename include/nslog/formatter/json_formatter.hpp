#ifndef NSLOG_JSON_FORMATTER_HPP
#define NSLOG_JSON_FORMATTER_HPP

#include "formatter_interface.hpp"
#include "../core/errors.hpp"
#include "../core/log_common.hpp"
#include <nlohmann/json.hpp>

namespace nslog {
    /// JSON lines: level, time, pid, hostname, record fields, msg.
    class JsonFormatter : public IFormatter {
    public:
        JsonFormatter()
            : m_pid(detail::processId())
            , m_hostname(detail::hostName()) {}

        /// Throws LoggerError(LOG_FORMAT_FAILED) when the record cannot be
        /// serialized, e.g. a string that is not valid UTF-8.
        std::string format(const LogRecord &record) const override {
            nlohmann::ordered_json j;
            j["level"] = levelValue(record.level);
            j["time"] = detail::epochMillis(record.timestamp);
            j["pid"] = m_pid;
            j["hostname"] = m_hostname;
            for (auto it = record.fields.begin(); it != record.fields.end(); ++it) {
                j[it.key()] = it.value();
            }
            if (record.hasMessage) {
                j["msg"] = record.message;
            }
            try {
                return j.dump();
            } catch (const nlohmann::json::type_error &e) {
                throw createFormatError(e.what(), &e);
            }
        }

    private:
        long m_pid;
        std::string m_hostname;
    };
} // namespace nslog

#endif // NSLOG_JSON_FORMATTER_HPP
