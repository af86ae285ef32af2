#ifndef NSLOG_SINK_LOGGER_HPP
#define NSLOG_SINK_LOGGER_HPP

#include "core/errors.hpp"
#include "core/log_level.hpp"
#include "core/log_record.hpp"
#include "core/message_format.hpp"
#include "core/value.hpp"
#include "sink/sink_interface.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace nslog {

    /// Leveled emitter bound to a shared destination.
    ///
    /// Children share the destination, copy the parent's level at creation
    /// and extend its bound fields. Every record carries the bound fields
    /// before the fields of the call.
    class SinkLogger {
    public:
        SinkLogger(std::shared_ptr<ISink> destination, LogLevel level = LogLevel::INFO)
            : m_destination(std::move(destination))
            , m_level(level)
            , m_bindings(nlohmann::ordered_json::object()) {
            if (!m_destination) {
                throw std::invalid_argument("nslog::SinkLogger requires a destination");
            }
        }

        LogLevel level() const { return m_level; }
        void setLevel(LogLevel level) { m_level = level; }

        bool isLevelEnabled(LogLevel level) const {
            return level != LogLevel::SILENT && m_level != LogLevel::SILENT && level >= m_level;
        }

        const nlohmann::ordered_json& bindings() const { return m_bindings; }

        /// Later bindings replace earlier ones with the same key.
        std::shared_ptr<SinkLogger> child(const nlohmann::ordered_json& bindings) const {
            auto result = std::make_shared<SinkLogger>(m_destination, m_level);
            result->m_bindings = m_bindings;
            if (bindings.is_object()) {
                for (auto it = bindings.begin(); it != bindings.end(); ++it) {
                    result->m_bindings[it.key()] = it.value();
                }
            }
            return result;
        }

        /// Interpolate @p format with @p args, assemble the record and hand
        /// it to the destination. Throws LoggerError(LOG_FORMAT_FAILED) when
        /// the payload cannot be serialized.
        void emit(LogLevel level, const nlohmann::ordered_json& mergeObject, bool hasMessage,
                  const std::string& format, const std::vector<Value>& args) {
            if (!isLevelEnabled(level)) return;

            LogRecord record;
            record.level = level;
            record.timestamp = std::chrono::system_clock::now();
            record.fields = m_bindings;
            if (mergeObject.is_object()) {
                for (auto it = mergeObject.begin(); it != mergeObject.end(); ++it) {
                    record.fields[it.key()] = it.value();
                }
            }
            if (hasMessage) {
                record.hasMessage = true;
                try {
                    record.message = formatMessage(format, args);
                } catch (const nlohmann::json::type_error& e) {
                    throw createFormatError(e.what(), &e);
                }
            }
            m_destination->write(record);
        }

        void flush() { m_destination->flush(); }

        const std::shared_ptr<ISink>& destination() const { return m_destination; }

    private:
        std::shared_ptr<ISink> m_destination;
        LogLevel m_level;
        nlohmann::ordered_json m_bindings;
    };

} // namespace nslog

#endif // NSLOG_SINK_LOGGER_HPP
