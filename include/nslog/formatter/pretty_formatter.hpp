#ifndef NSLOG_PRETTY_FORMATTER_HPP
#define NSLOG_PRETTY_FORMATTER_HPP

#include "formatter_interface.hpp"
#include "../core/errors.hpp"
#include "../core/log_common.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <sstream>
#include <string>
#include <vector>

namespace nslog {

    struct PrettyOptions {
        bool colors;
        std::string translateTime; // "SYS:..." local time, other non-empty values UTC ISO, empty epoch ms
        std::vector<std::string> ignore;
        bool singleLine;
        std::vector<std::string> hideObjectKeys;
        bool showMetadata;

        PrettyOptions()
            : colors(false)
            , translateTime("SYS:standard")
            , singleLine(false)
            , showMetadata(false) {
            ignore.push_back("pid");
            ignore.push_back("hostname");
        }
    };

    /// Human-readable console layout:
    ///
    ///   [2024-01-01 12:00:00.000 +0000] INFO (api:users): message
    ///       userId: 42
    ///
    /// With singleLine the extra fields follow the message as one JSON
    /// object. `namespace` is shown in the header, never as a field.
    class PrettyFormatter : public IFormatter {
    public:
        PrettyFormatter()
            : m_pid(detail::processId())
            , m_hostname(detail::hostName()) {}

        explicit PrettyFormatter(PrettyOptions options)
            : m_options(std::move(options))
            , m_pid(detail::processId())
            , m_hostname(detail::hostName()) {}

        const PrettyOptions& options() const { return m_options; }

        std::string format(const LogRecord &record) const override {
            try {
                return formatRecord(record);
            } catch (const nlohmann::json::type_error &e) {
                throw createFormatError(e.what(), &e);
            }
        }

        /// ANSI escape code for a level.
        static const char* getColorCode(LogLevel level) {
            switch (level) {
                case LogLevel::TRACE: return "\033[90m";     // gray
                case LogLevel::DEBUG: return "\033[34m";     // blue
                case LogLevel::INFO:  return "\033[32m";     // green
                case LogLevel::WARN:  return "\033[33m";     // yellow
                case LogLevel::ERROR: return "\033[31m";     // red
                case LogLevel::FATAL: return "\033[41m";     // red background
                default: return "";
            }
        }

    private:
        std::string formatRecord(const LogRecord &record) const {
            std::ostringstream oss;
            oss << "[" << formatTime(record) << "] ";

            if (m_options.colors) {
                oss << getColorCode(record.level) << getLevelString(record.level) << "\033[0m";
            } else {
                oss << getLevelString(record.level);
            }

            bool showPid = m_options.showMetadata || !isIgnored("pid");
            bool showHost = m_options.showMetadata || !isIgnored("hostname");
            if (showPid || showHost) {
                oss << " (";
                if (showPid) oss << m_pid;
                if (showPid && showHost) oss << " on ";
                if (showHost) oss << m_hostname;
                oss << ")";
            }

            auto ns = record.fields.find("namespace");
            if (ns != record.fields.end() && ns->is_string() && !isIgnored("namespace")) {
                oss << " (" << ns->get<std::string>() << ")";
            }

            oss << ":";
            if (record.hasMessage) {
                oss << " ";
                if (m_options.colors) {
                    oss << "\033[36m" << record.message << "\033[0m";
                } else {
                    oss << record.message;
                }
            }

            nlohmann::ordered_json extra = nlohmann::ordered_json::object();
            for (auto it = record.fields.begin(); it != record.fields.end(); ++it) {
                if (it.key() == "namespace" || isIgnored(it.key())) continue;
                extra[it.key()] = isHidden(it.key()) ? nlohmann::ordered_json("[hidden]") : it.value();
            }

            if (!extra.empty()) {
                if (m_options.singleLine) {
                    oss << " " << extra.dump();
                } else {
                    for (auto it = extra.begin(); it != extra.end(); ++it) {
                        oss << "\n    " << it.key() << ": ";
                        if (it.key() == "err" && it->is_object() && it->contains("stack") &&
                            (*it)["stack"].is_string()) {
                            oss << indent((*it)["stack"].get<std::string>());
                        } else if (it->is_structured()) {
                            oss << indent(it->dump(4));
                        } else if (it->is_string()) {
                            oss << it->get<std::string>();
                        } else {
                            oss << it->dump();
                        }
                    }
                }
            }
            return oss.str();
        }

        std::string formatTime(const LogRecord &record) const {
            if (m_options.translateTime.empty()) {
                return std::to_string(detail::epochMillis(record.timestamp));
            }
            if (detail::startsWith(m_options.translateTime, "SYS:")) {
                return detail::formatTimestamp(record.timestamp);
            }
            return detail::isoTimestamp(record.timestamp);
        }

        bool isIgnored(const std::string& key) const {
            return std::find(m_options.ignore.begin(), m_options.ignore.end(), key) !=
                   m_options.ignore.end();
        }

        bool isHidden(const std::string& key) const {
            return std::find(m_options.hideObjectKeys.begin(), m_options.hideObjectKeys.end(), key) !=
                   m_options.hideObjectKeys.end();
        }

        static std::string indent(const std::string& text) {
            std::string result;
            result.reserve(text.size());
            for (size_t i = 0; i < text.size(); ++i) {
                result += text[i];
                if (text[i] == '\n') result += "    ";
            }
            return result;
        }

        PrettyOptions m_options;
        long m_pid;
        std::string m_hostname;
    };

} // namespace nslog

#endif // NSLOG_PRETTY_FORMATTER_HPP
