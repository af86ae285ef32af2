#ifndef NSLOG_TRANSPORT_CONFIG_HPP
#define NSLOG_TRANSPORT_CONFIG_HPP

#include "transport_descriptor.hpp"
#include "../core/app_info.hpp"
#include "../core/environment.hpp"
#include "../core/errors.hpp"
#include "../core/log_common.hpp"
#include "../fs/file_system.hpp"
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <string>
#include <system_error>
#include <vector>

namespace nslog {

    /// Legacy single-mode settings (LOG_* keys).
    struct LegacyConfig {
        std::string logLevel;
        bool colorize;
        bool fileOutput;
        bool consoleOutput;
        std::string logFolder;
        bool sync;
        bool pretty;
    };

    inline LegacyConfig loadConfig(const Environment& env) {
        LegacyConfig config;
        config.logLevel = env.get("LOG_LEVEL", "info");
        config.colorize = env.isNotFalse("LOG_COLORIZE");
        config.fileOutput = env.isNotFalse("LOG_FILE_OUTPUT");
        config.consoleOutput = env.isNotFalse("LOG_CONSOLE_OUTPUT");
        config.logFolder = env.get("LOG_FOLDER", "logs");
        config.sync = env.isTrue("LOG_SYNC");
        config.pretty = env.isTrue("LOG_PRETTY");
        return config;
    }

    namespace detail {
        inline void replaceAll(std::string& s, const std::string& from, const std::string& to) {
            size_t pos = 0;
            while ((pos = s.find(from, pos)) != std::string::npos) {
                s.replace(pos, from.size(), to);
                pos += to.size();
            }
        }
    } // namespace detail

    /// Expand {date}, {time}, {datetime}, {app_name}, {app_version}, {pid}
    /// and {hostname}. Dates are UTC. An empty template yields "app.log".
    inline std::string processFilenameTemplate(const std::string& tpl, const AppInfo& app,
                                               const std::chrono::system_clock::time_point& now) {
        if (tpl.empty()) return "app.log";

        std::tm utc = detail::toUtc(std::chrono::system_clock::to_time_t(now));
        std::string result = tpl;
        detail::replaceAll(result, "{datetime}", detail::strftimeString(utc, "%Y-%m-%d_%H-%M-%S"));
        detail::replaceAll(result, "{date}", detail::strftimeString(utc, "%Y-%m-%d"));
        detail::replaceAll(result, "{time}", detail::strftimeString(utc, "%H-%M-%S"));
        detail::replaceAll(result, "{app_name}", app.name);
        detail::replaceAll(result, "{app_version}", app.version);
        detail::replaceAll(result, "{pid}", std::to_string(detail::processId()));
        if (result.find("{hostname}") != std::string::npos) {
            detail::replaceAll(result, "{hostname}", detail::hostName());
        }
        return result;
    }

    /// True when any indexed transport key (TRANSPORT{N} or TRANSPORT{N}_*)
    /// is set, which selects multi-transport mode.
    inline bool hasIndexedTransportKeys(const Environment& env) {
        static const std::string kPrefix = "TRANSPORT";
        std::vector<std::string> keys = env.keys();
        for (size_t i = 0; i < keys.size(); ++i) {
            const std::string& key = keys[i];
            if (key.compare(0, kPrefix.size(), kPrefix) != 0) continue;
            size_t pos = kPrefix.size();
            size_t digits = pos;
            while (digits < key.size() && std::isdigit(static_cast<unsigned char>(key[digits]))) ++digits;
            if (digits == pos) continue;
            if (digits == key.size() || key[digits] == '_') return true;
        }
        return false;
    }

    /// Parse TRANSPORT1..N. Stops at the first index without a TRANSPORT{N}
    /// key; unknown kinds are reported and skipped.
    inline std::vector<TransportDescriptor> parseTransportDescriptors(const Environment& env) {
        std::vector<TransportDescriptor> descriptors;
        for (int n = 1; ; ++n) {
            const std::string prefix = "TRANSPORT" + std::to_string(n);
            std::string kindName;
            if (!env.lookup(prefix, kindName)) break;
            kindName = detail::toLower(detail::trim(kindName));

            TransportDescriptor d;
            if (kindName == "console") {
                d.kind = TransportKind::Console;
            } else if (kindName == "file") {
                d.kind = TransportKind::File;
            } else {
                std::fprintf(stderr,
                             "[NSLOG WARNING] Unknown transport type \"%s\" for %s. The transport will be skipped.\n",
                             kindName.c_str(), prefix.c_str());
                continue;
            }

            d.index = n;
            d.level = parseSeverityLevel(env.get(prefix + "_LEVEL", "info"));
            d.enabled = env.isNotFalse(prefix + "_ENABLED");
            d.sync = env.isTrue(prefix + "_SYNC");

            if (d.isConsole()) {
                d.colors = env.isNotFalse(prefix + "_COLORS");
                std::string translateTime = env.get(prefix + "_TRANSLATE_TIME", "SYS:standard");
                d.translateTime = translateTime == "false" ? std::string() : translateTime;
                d.ignore = detail::splitList(env.get(prefix + "_IGNORE", "pid,hostname"));
                d.singleLine = env.isTrue(prefix + "_SINGLE_LINE");
                d.hideObjectKeys = detail::splitList(env.get(prefix + "_HIDE_OBJECT_KEYS"));
                d.showMetadata = env.isTrue(prefix + "_SHOW_METADATA");
            } else {
                d.folder = env.get(prefix + "_FOLDER", "logs");
                d.filename = env.get(prefix + "_FILENAME", "{app_name}.log");
                d.destination = env.get(prefix + "_DESTINATION");
                d.mkdir = env.isNotFalse(prefix + "_MKDIR");
                d.append = env.isNotFalse(prefix + "_APPEND");
                d.prettyPrint = env.isTrue(prefix + "_PRETTY_PRINT");
                d.rotation.enabled = env.isTrue(prefix + "_ROTATE");
                long maxSize = env.getInt(prefix + "_ROTATE_MAX_SIZE", 10485760);
                d.rotation.maxSize = maxSize > 0 ? static_cast<std::uint64_t>(maxSize) : 10485760;
                long maxFiles = env.getInt(prefix + "_ROTATE_MAX_FILES", 5);
                d.rotation.maxFiles = maxFiles > 0 ? static_cast<int>(maxFiles) : 5;
                d.rotation.compress = env.isTrue(prefix + "_ROTATE_COMPRESS");
            }
            descriptors.push_back(d);
        }
        return descriptors;
    }

    /// Descriptors for legacy single-mode configuration: a file transport
    /// and/or a console transport, or one console transport when both are
    /// switched off.
    inline std::vector<TransportDescriptor> legacyTransportDescriptors(const LegacyConfig& config) {
        LogLevel level = parseSeverityLevel(config.logLevel);
        std::vector<TransportDescriptor> descriptors;

        if (config.fileOutput) {
            TransportDescriptor file = TransportDescriptor::file(level);
            file.folder = config.logFolder;
            file.filename = "{app_name}.log";
            file.sync = true;
            descriptors.push_back(file);
        }

        if (config.consoleOutput || descriptors.empty()) {
            TransportDescriptor console = TransportDescriptor::console(level);
            console.colors = config.colorize;
            console.sync = config.sync;
            console.singleLine = !config.pretty;
            descriptors.push_back(console);
        }
        return descriptors;
    }

    struct DroppedTransport {
        TransportDescriptor descriptor;
        ErrorCode code;
        std::string reason;
    };

    /// Validated transports. Never empty once produced by the resolver.
    struct ResolvedTransportSet {
        std::vector<TransportDescriptor> transports;
        LogLevel level;
        bool legacyMode;
        bool usedFallback;
        std::vector<DroppedTransport> dropped;

        ResolvedTransportSet()
            : level(LogLevel::INFO)
            , legacyMode(false)
            , usedFallback(false) {}
    };

    namespace detail {
        inline std::string describeFailure(const std::exception& e) {
            const std::system_error* se = dynamic_cast<const std::system_error*>(&e);
            if (se) return se->code().message();
            return safeWhat(e);
        }
    } // namespace detail

    /// Turns environment configuration into a validated, never-empty set
    /// of transport descriptors. Per-transport failures are reported on
    /// stderr and the transport is dropped.
    class TransportConfigResolver {
    public:
        TransportConfigResolver(IFileSystem& fs, AppInfo app)
            : m_fs(fs)
            , m_app(std::move(app))
            , m_fixedTime(false) {}

        /// Pin the time used for filename templates.
        void setTime(const std::chrono::system_clock::time_point& now) {
            m_now = now;
            m_fixedTime = true;
        }

        const AppInfo& appInfo() const { return m_app; }

        ResolvedTransportSet resolve(const Environment& env) const {
            ResolvedTransportSet result;
            std::vector<TransportDescriptor> descriptors;

            if (hasIndexedTransportKeys(env)) {
                descriptors = parseTransportDescriptors(env);
            } else {
                result.legacyMode = true;
                descriptors = legacyTransportDescriptors(loadConfig(env));
            }

            std::chrono::system_clock::time_point now =
                m_fixedTime ? m_now : std::chrono::system_clock::now();

            for (size_t i = 0; i < descriptors.size(); ++i) {
                TransportDescriptor& d = descriptors[i];
                if (!d.enabled) continue;

                if (d.isFile()) {
                    if (d.isStdioDestination()) {
                        d.path.clear();
                    } else if (!d.destination.empty()) {
                        d.path = d.destination;
                    } else {
                        d.path = detail::joinPath(d.folder,
                                                  processFilenameTemplate(d.filename, m_app, now));
                    }

                    std::string reason;
                    if (!validateDirectory(d, reason)) {
                        DroppedTransport dropped;
                        dropped.descriptor = d;
                        dropped.code = ErrorCode::LogDirCreateFailed;
                        dropped.reason = reason;
                        result.dropped.push_back(dropped);
                        continue;
                    }
                }
                result.transports.push_back(d);
            }

            if (result.transports.empty()) {
                std::fprintf(stderr,
                             "[NSLOG WARNING] All configured transports failed to initialize. "
                             "Falling back to console output.\n");
                result.transports.push_back(TransportDescriptor::console(LogLevel::INFO));
                result.usedFallback = true;
            }

            result.level = result.transports[0].level;
            for (size_t i = 1; i < result.transports.size(); ++i) {
                if (result.transports[i].level < result.level) {
                    result.level = result.transports[i].level;
                }
            }
            return result;
        }

    private:
        bool validateDirectory(const TransportDescriptor& d, std::string& reason) const {
            const std::string dir = d.directory();
            if (dir.empty()) return true;

            try {
                if (!m_fs.exists(dir)) {
                    if (!d.mkdir) {
                        throw detail::systemError(ENOENT, "directory does not exist: " + dir);
                    }
                    m_fs.createDirectories(dir);
                } else if (!m_fs.isDirectory(dir)) {
                    throw detail::systemError(ENOTDIR, "not a directory: " + dir);
                }
                m_fs.checkWritable(dir);
                return true;
            } catch (const std::exception& e) {
                reason = detail::describeFailure(e);
                std::fprintf(stderr,
                             "[NSLOG FATAL] Failed to access or create log directory \"%s\": %s. "
                             "The file transport for this directory will be disabled.\n",
                             dir.c_str(), reason.c_str());
                return false;
            }
        }

        IFileSystem& m_fs;
        AppInfo m_app;
        bool m_fixedTime;
        std::chrono::system_clock::time_point m_now;
    };

} // namespace nslog

#endif // NSLOG_TRANSPORT_CONFIG_HPP
