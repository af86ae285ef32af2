#ifndef NSLOG_LOGGER_HPP
#define NSLOG_LOGGER_HPP

#include "core/log_level.hpp"
#include "core/message_format.hpp"
#include "core/namespace_filter.hpp"
#include "core/runtime_config.hpp"
#include "core/sanitizer.hpp"
#include "core/value.hpp"
#include "sink_logger.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace nslog {

    namespace detail {
        inline void appendValues(std::vector<Value>&) {}

        template<typename T, typename... Rest>
        void appendValues(std::vector<Value>& out, const T& first, const Rest&... rest) {
            out.push_back(Value(first));
            appendValues(out, rest...);
        }
    } // namespace detail

    /// Namespaced logger handle.
    ///
    /// Each severity method accepts the call shapes
    /// @code
    ///   log.info("message");
    ///   log.info("user %s logged in", name);
    ///   log.info(Fields{{"userId", 42}});
    ///   log.info(Fields{{"userId", 42}}, "login from %s", ip);
    ///   log.error(exception);
    /// @endcode
    /// A call is dropped unless the namespace is enabled by the current
    /// DEBUG expression and the handle's level admits the severity.
    /// Payloads are sanitized with the current LOG_MAX_* settings.
    class Logger {
    public:
        enum class ArgumentKind {
            Empty,
            ErrorValue,
            ContextObject,
            MessageString
        };

        Logger(std::shared_ptr<SinkLogger> sink, std::string ns,
               std::shared_ptr<const RuntimeConfig> config)
            : m_sink(std::move(sink))
            , m_namespace(std::move(ns))
            , m_config(std::move(config)) {
            if (!m_sink) throw std::invalid_argument("nslog::Logger requires a sink logger");
            if (!m_config) throw std::invalid_argument("nslog::Logger requires a configuration");
        }

        template<typename... Args>
        void trace(const Args&... args) { log(LogLevel::TRACE, args...); }

        template<typename... Args>
        void debug(const Args&... args) { log(LogLevel::DEBUG, args...); }

        template<typename... Args>
        void info(const Args&... args) { log(LogLevel::INFO, args...); }

        template<typename... Args>
        void warn(const Args&... args) { log(LogLevel::WARN, args...); }

        template<typename... Args>
        void error(const Args&... args) { log(LogLevel::ERROR, args...); }

        template<typename... Args>
        void fatal(const Args&... args) { log(LogLevel::FATAL, args...); }

        template<typename... Args>
        void log(LogLevel level, const Args&... args) {
            if (sizeof...(Args) == 0) return;
            if (!m_sink->isLevelEnabled(level) || !namespaceEnabled()) return;
            std::vector<Value> values;
            values.reserve(sizeof...(Args));
            detail::appendValues(values, args...);
            dispatch(level, values);
        }

        /// Normalize one call and hand it to the sink logger.
        void dispatch(LogLevel level, const std::vector<Value>& args) {
            if (args.empty()) return;
            if (!m_sink->isLevelEnabled(level) || !namespaceEnabled()) return;

            SanitizationContext ctx = m_config->sanitization();
            nlohmann::ordered_json merge = nlohmann::ordered_json::object();
            size_t messageStart = 0;

            switch (classifyFirstArgument(args)) {
                case ArgumentKind::Empty:
                    return;
                case ArgumentKind::ErrorValue:
                    // Anything after a leading error is dropped.
                    merge["err"] = Value::errorToJson(args[0].errorInfo());
                    m_sink->emit(level, merge, false, std::string(), std::vector<Value>());
                    return;
                case ArgumentKind::ContextObject:
                    merge = contextToJson(sanitize(args[0], ctx));
                    messageStart = 1;
                    break;
                case ArgumentKind::MessageString:
                    break;
            }

            if (messageStart >= args.size()) {
                m_sink->emit(level, merge, false, std::string(), std::vector<Value>());
                return;
            }

            const Value& first = args[messageStart];
            bool hasInterpolation = args.size() - messageStart > 1;
            std::string format;
            if (hasInterpolation && first.isString()) {
                format = first.asString();
            } else {
                format = detail::toDisplayString(sanitize(first, ctx));
            }

            std::vector<Value> interpolation;
            for (size_t i = messageStart + 1; i < args.size(); ++i) {
                interpolation.push_back(sanitize(args[i], ctx));
            }
            m_sink->emit(level, merge, true, format, interpolation);
        }

        static ArgumentKind classifyFirstArgument(const std::vector<Value>& args) {
            if (args.empty()) return ArgumentKind::Empty;
            const Value& first = args[0];
            if (first.isError()) return ArgumentKind::ErrorValue;
            if (first.isRecord() || first.isKeyedContainer()) return ArgumentKind::ContextObject;
            return ArgumentKind::MessageString;
        }

        /// New handle with extra bound fields; namespace, configuration and
        /// current level are inherited.
        Logger child(const Fields& bindings) const {
            nlohmann::ordered_json extra = nlohmann::ordered_json::object();
            for (size_t i = 0; i < bindings.size(); ++i) {
                extra[bindings[i].first] = bindings[i].second.toJson();
            }
            return Logger(m_sink->child(extra), m_namespace, m_config);
        }

        /// Accumulated bound fields, `namespace` included.
        const nlohmann::ordered_json& bindings() const { return m_sink->bindings(); }

        /// Empty for the unnamespaced logger.
        const std::string& getNamespace() const { return m_namespace; }

        LogLevel level() const { return m_sink->level(); }
        const char* levelName() const { return getLevelName(m_sink->level()); }

        void setLevel(LogLevel level) { m_sink->setLevel(level); }

        /// Unknown names degrade to info.
        void setLevel(const std::string& name) { m_sink->setLevel(parseLevel(name)); }

        bool isLevelEnabled(LogLevel level) const {
            return m_sink->isLevelEnabled(level) && namespaceEnabled();
        }

        /// False for unknown level names.
        bool isLevelEnabled(const std::string& name) const {
            LogLevel level = LogLevel::INFO;
            if (!tryParseLevel(name, level)) return false;
            return isLevelEnabled(level);
        }

        void silent() { m_sink->setLevel(LogLevel::SILENT); }

        void flush() { m_sink->flush(); }

        const std::shared_ptr<SinkLogger>& sinkLogger() const { return m_sink; }

    private:
        bool namespaceEnabled() const {
            return NamespaceFilter::isEnabled(m_namespace, m_config->debugExpression());
        }

        /// Record fields of a sanitized context object; an `err` field holding
        /// an error is normalized and moved to the end.
        static nlohmann::ordered_json contextToJson(const Value& context) {
            nlohmann::ordered_json merge = nlohmann::ordered_json::object();
            const Value* err = nullptr;
            for (size_t i = 0; i < context.fields().size(); ++i) {
                const std::pair<std::string, Value>& field = context.fields()[i];
                if (field.first == "err" && field.second.isError()) {
                    err = &field.second;
                    continue;
                }
                merge[field.first] = field.second.toJson();
            }
            if (err) merge["err"] = Value::errorToJson(err->errorInfo());
            return merge;
        }

        std::shared_ptr<SinkLogger> m_sink;
        std::string m_namespace;
        std::shared_ptr<const RuntimeConfig> m_config;
    };

} // namespace nslog

#endif // NSLOG_LOGGER_HPP
