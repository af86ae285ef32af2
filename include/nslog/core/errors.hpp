#ifndef NSLOG_ERRORS_HPP
#define NSLOG_ERRORS_HPP

#include "exception_info.hpp"
#include "log_level.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace nslog {

    enum class ErrorCode {
        ConfigLoadFailed,
        InvalidLogLevel,
        LogDirCreateFailed,
        LogFileWriteFailed,
        RotateFailed,
        CleanupFailed,
        FormatFailed,
        TransportInitFailed
    };

    struct ErrorDefinition {
        const char* code;
        const char* messageTemplate;
        bool recoverable;
    };

    inline const ErrorDefinition& errorDefinition(ErrorCode code) {
        static const ErrorDefinition kDefinitions[] = {
            {"LOG_CONFIG_LOAD_FAILED", "Failed to load logger configuration: {reason}", true},
            {"LOG_INVALID_LEVEL", "Invalid log level: {level}", true},
            {"LOG_DIR_CREATE_FAILED", "Failed to create log directory {path}: {reason}", false},
            {"LOG_FILE_WRITE_FAILED", "Failed to write to log file {path}: {reason}", true},
            {"LOG_ROTATE_FAILED", "Failed to rotate log file {path}: {reason}", true},
            {"LOG_CLEANUP_FAILED", "Failed to cleanup old log archives: {reason}", true},
            {"LOG_FORMAT_FAILED", "Failed to format log message: {reason}", true},
            {"LOG_TRANSPORT_INIT_FAILED", "Failed to initialize log transport: {reason}", false}
        };
        return kDefinitions[static_cast<int>(code)];
    }

    /// The inner failure an error was raised because of. Plain data so the
    /// chain survives independently of the original exception object.
    struct ErrorCause {
        std::string type;
        std::string message;
        std::string code;
        nlohmann::ordered_json context;
        std::shared_ptr<const ErrorCause> cause;
    };

    namespace detail {
        inline std::string renderErrorMessage(const char* messageTemplate,
                                              const nlohmann::ordered_json& context) {
            std::string result;
            const std::string tpl(messageTemplate);
            size_t i = 0;
            while (i < tpl.size()) {
                if (tpl[i] == '{') {
                    size_t end = tpl.find('}', i);
                    if (end != std::string::npos) {
                        std::string key = tpl.substr(i + 1, end - i - 1);
                        auto it = context.find(key);
                        if (it != context.end()) {
                            result += it->is_string() ? it->get<std::string>() : it->dump();
                            i = end + 1;
                            continue;
                        }
                    }
                }
                result += tpl[i];
                ++i;
            }
            return result;
        }
    } // namespace detail

    /// Coded logger failure with context and an explicit "caused by" link.
    class LoggerError : public std::runtime_error {
    public:
        LoggerError(ErrorCode code, nlohmann::ordered_json context,
                    std::shared_ptr<const ErrorCause> cause = nullptr)
            : std::runtime_error(detail::renderErrorMessage(
                  errorDefinition(code).messageTemplate, context))
            , m_code(code)
            , m_context(std::move(context))
            , m_cause(std::move(cause)) {}

        ErrorCode code() const { return m_code; }
        const char* codeString() const { return errorDefinition(m_code).code; }
        bool recoverable() const { return errorDefinition(m_code).recoverable; }
        const nlohmann::ordered_json& context() const { return m_context; }

        /// Null when the error has no inner failure.
        const ErrorCause* cause() const { return m_cause.get(); }
        std::shared_ptr<const ErrorCause> causePtr() const { return m_cause; }

    private:
        ErrorCode m_code;
        nlohmann::ordered_json m_context;
        std::shared_ptr<const ErrorCause> m_cause;
    };

    /// Snapshot an exception (and its own cause chain, when it is a
    /// LoggerError) as an ErrorCause.
    inline std::shared_ptr<const ErrorCause> makeCause(const std::exception& ex) {
        auto cause = std::make_shared<ErrorCause>();
        cause->type = detail::getExceptionTypeName(ex);
        cause->message = detail::safeWhat(ex);
        const LoggerError* le = dynamic_cast<const LoggerError*>(&ex);
        if (le) {
            cause->code = le->codeString();
            cause->context = le->context();
            cause->cause = le->causePtr();
        } else {
            const std::system_error* se = dynamic_cast<const std::system_error*>(&ex);
            if (se) cause->code = std::to_string(se->code().value());
        }
        return cause;
    }

    // --- Factories ---

    inline LoggerError createInvalidLogLevelError(const std::string& level) {
        nlohmann::ordered_json ctx;
        ctx["level"] = level;
        return LoggerError(ErrorCode::InvalidLogLevel, ctx);
    }

    /// Like parseLevel(), but unknown names throw
    /// LoggerError(LOG_INVALID_LEVEL).
    inline LogLevel parseLevelStrict(const std::string& name) {
        LogLevel level = LogLevel::INFO;
        if (!tryParseLevel(name, level)) throw createInvalidLogLevelError(name);
        return level;
    }

    inline LoggerError createConfigLoadError(const std::string& reason,
                                             const std::exception* original = nullptr) {
        nlohmann::ordered_json ctx;
        ctx["reason"] = reason;
        return LoggerError(ErrorCode::ConfigLoadFailed, ctx,
                           original ? makeCause(*original) : nullptr);
    }

    inline LoggerError createLogDirError(const std::string& path, const std::string& reason,
                                         const std::exception* original = nullptr) {
        nlohmann::ordered_json ctx;
        ctx["path"] = path;
        ctx["reason"] = reason;
        return LoggerError(ErrorCode::LogDirCreateFailed, ctx,
                           original ? makeCause(*original) : nullptr);
    }

    inline LoggerError createLogWriteError(const std::string& path, const std::string& reason,
                                           const std::exception* original = nullptr) {
        nlohmann::ordered_json ctx;
        ctx["path"] = path;
        ctx["reason"] = reason;
        return LoggerError(ErrorCode::LogFileWriteFailed, ctx,
                           original ? makeCause(*original) : nullptr);
    }

    inline LoggerError createRotateError(const std::string& path, const std::string& reason,
                                         const std::exception* original = nullptr) {
        nlohmann::ordered_json ctx;
        ctx["path"] = path;
        ctx["reason"] = reason;
        return LoggerError(ErrorCode::RotateFailed, ctx,
                           original ? makeCause(*original) : nullptr);
    }

    inline LoggerError createCleanupError(const std::string& reason,
                                          const std::exception* original = nullptr) {
        nlohmann::ordered_json ctx;
        ctx["reason"] = reason;
        return LoggerError(ErrorCode::CleanupFailed, ctx,
                           original ? makeCause(*original) : nullptr);
    }

    inline LoggerError createFormatError(const std::string& reason,
                                         const std::exception* original = nullptr) {
        nlohmann::ordered_json ctx;
        ctx["reason"] = reason;
        return LoggerError(ErrorCode::FormatFailed, ctx,
                           original ? makeCause(*original) : nullptr);
    }

    inline LoggerError createTransportError(const std::string& reason,
                                            const std::exception* original = nullptr) {
        nlohmann::ordered_json ctx;
        ctx["reason"] = reason;
        return LoggerError(ErrorCode::TransportInitFailed, ctx,
                           original ? makeCause(*original) : nullptr);
    }

    /// Normalized error record: what lands in a record's `err` field.
    struct ErrorInfo {
        std::string type;
        std::string message;
        std::string stack;
        nlohmann::ordered_json code; // null when the error carries no code
    };

    namespace detail {
        inline void appendCauseChain(const ErrorCause* cause, std::string& stack, int depth) {
            while (cause && depth < kMaxNestedExceptionDepth) {
                stack += "\n    caused by ";
                if (!cause->code.empty()) {
                    stack += cause->code;
                    stack += ' ';
                }
                stack += cause->type;
                stack += ": ";
                stack += cause->message;
                cause = cause->cause.get();
                ++depth;
            }
        }
    } // namespace detail

    /// C++ exceptions carry no call stack; `stack` is the "type: message"
    /// head followed by the nested-exception and cause chains.
    inline ErrorInfo extractErrorInfo(const std::exception& ex) {
        ErrorInfo info;
        info.type = detail::getExceptionTypeName(ex);
        info.message = detail::safeWhat(ex);
        info.stack = info.type + ": " + info.message;
        std::vector<detail::NestedFailure> nested = detail::nestedFailures(ex);
        for (size_t i = 0; i < nested.size(); ++i) {
            info.stack += "\n    nested " + nested[i].type;
            if (!nested[i].message.empty()) info.stack += ": " + nested[i].message;
        }

        const LoggerError* le = dynamic_cast<const LoggerError*>(&ex);
        if (le) {
            info.code = le->codeString();
            detail::appendCauseChain(le->cause(), info.stack, 0);
        } else {
            const std::system_error* se = dynamic_cast<const std::system_error*>(&ex);
            if (se) info.code = se->code().value();
        }
        return info;
    }

} // namespace nslog

#endif // NSLOG_ERRORS_HPP
