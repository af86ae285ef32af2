#ifndef NSLOG_GLOBAL_HPP
#define NSLOG_GLOBAL_HPP

#include "config/transport_config.hpp"
#include "core/app_info.hpp"
#include "core/environment.hpp"
#include "core/errors.hpp"
#include "core/runtime_config.hpp"
#include "fs/file_system.hpp"
#include "logger.hpp"
#include "sink_logger.hpp"
#include "transport_factory.hpp"
#include <cstdio>
#include <memory>
#include <mutex>
#include <string>

namespace nslog {

    /// Process-wide logger facade.
    ///
    /// Usage:
    /// @code
    ///   nslog::Logger log = nslog::Log::createLogger("api:users");
    ///   log.info(nslog::Fields{{"userId", 42}}, "user %s logged in", name);
    /// @endcode
    ///
    /// The base sink logger (and with it every transport) is built lazily by
    /// the first createLogger() call from the current environment and shared
    /// by all handles. setEnvironment() and reset() discard it; handles that
    /// still hold it keep writing to the old destination until released.
    class Log {
    public:
        Log() = delete;

        /// Unnamespaced logger.
        static Logger createLogger() {
            return createLogger(std::string());
        }

        /// Logger bound to @p ns (empty = no namespace).
        /// Throws LoggerError(LOG_TRANSPORT_INIT_FAILED) when no destination
        /// can be built at all.
        static Logger createLogger(const std::string& ns) {
            try {
                std::shared_ptr<SinkLogger> base = baseLogger();
                nlohmann::ordered_json bindings = nlohmann::ordered_json::object();
                if (!ns.empty()) bindings["namespace"] = ns;
                return Logger(base->child(bindings), ns, config());
            } catch (const std::exception& e) {
                std::fprintf(stderr, "[NSLOG FATAL ERROR] Logger creation failed for namespace \"%s\": %s\n",
                             ns.c_str(), detail::safeWhat(e));
                throw;
            }
        }

        /// The shared base sink logger, built on first use.
        static std::shared_ptr<SinkLogger> baseLogger() {
            std::lock_guard<std::mutex> lock(mutex());
            State& s = state();
            if (!s.base) {
                s.base = buildBaseLogger(s);
            }
            return s.base;
        }

        /// Replace the configuration and discard the base logger so the next
        /// createLogger() rebuilds transports. Existing handles observe the
        /// new DEBUG and LOG_MAX_* values immediately.
        static void setEnvironment(Environment env) {
            std::shared_ptr<SinkLogger> old;
            {
                std::lock_guard<std::mutex> lock(mutex());
                state().config->setEnvironment(std::move(env));
                old = std::move(state().base);
                state().base.reset();
                state().resolved.reset();
            }
        }

        static std::shared_ptr<const Environment> environment() {
            return config()->environment();
        }

        static void setFileSystem(std::shared_ptr<IFileSystem> fs) {
            std::lock_guard<std::mutex> lock(mutex());
            state().fs = fs ? std::move(fs) : std::make_shared<PosixFileSystem>();
        }

        /// Override the application metadata otherwise read from the
        /// manifest named by LOG_APP_MANIFEST.
        static void setAppInfo(const AppInfo& app) {
            std::lock_guard<std::mutex> lock(mutex());
            state().app = std::make_shared<AppInfo>(app);
        }

        /// Use @p base instead of building one from the environment.
        static void setBaseLogger(std::shared_ptr<SinkLogger> base) {
            std::shared_ptr<SinkLogger> old;
            {
                std::lock_guard<std::mutex> lock(mutex());
                old = std::move(state().base);
                state().base = std::move(base);
                state().resolved.reset();
            }
        }

        /// Transport set the current base logger was built from; null when
        /// the base logger was injected or not built yet.
        static std::shared_ptr<const ResolvedTransportSet> resolvedTransports() {
            std::lock_guard<std::mutex> lock(mutex());
            return state().resolved;
        }

        /// Discard the base logger; the next createLogger() rebuilds it.
        static void reset() {
            std::shared_ptr<SinkLogger> old;
            {
                std::lock_guard<std::mutex> lock(mutex());
                old = std::move(state().base);
                state().base.reset();
                state().resolved.reset();
            }
        }

        /// Restore process environment, POSIX file system and manifest
        /// metadata, and discard the base logger.
        static void resetAll() {
            std::shared_ptr<SinkLogger> old;
            {
                std::lock_guard<std::mutex> lock(mutex());
                State& s = state();
                old = std::move(s.base);
                s.base.reset();
                s.resolved.reset();
                s.config->setEnvironment(Environment::process());
                s.fs = std::make_shared<PosixFileSystem>();
                s.app.reset();
            }
        }

        static void flush() {
            std::shared_ptr<SinkLogger> base;
            {
                std::lock_guard<std::mutex> lock(mutex());
                base = state().base;
            }
            if (base) base->flush();
        }

        static std::shared_ptr<const RuntimeConfig> config() {
            std::lock_guard<std::mutex> lock(mutex());
            return state().config;
        }

    private:
        struct State {
            std::shared_ptr<RuntimeConfig> config;
            std::shared_ptr<IFileSystem> fs;
            std::shared_ptr<AppInfo> app;
            std::shared_ptr<SinkLogger> base;
            std::shared_ptr<const ResolvedTransportSet> resolved;

            State()
                : config(std::make_shared<RuntimeConfig>())
                , fs(std::make_shared<PosixFileSystem>()) {}
        };

        static std::shared_ptr<SinkLogger> buildBaseLogger(State& s) {
            std::shared_ptr<const Environment> env = s.config->environment();
            AppInfo app = s.app ? *s.app : AppInfo::fromEnvironment(*env);

            TransportConfigResolver resolver(*s.fs, app);
            auto resolved = std::make_shared<ResolvedTransportSet>(resolver.resolve(*env));

            std::unique_ptr<MultiSink> destination = TransportFactory::build(*resolved, s.fs, *env);
            LogLevel level = destination->minLevel();
            if (resolved->level > level) level = resolved->level;
            s.resolved = resolved;
            return std::make_shared<SinkLogger>(std::shared_ptr<ISink>(std::move(destination)),
                                                level);
        }

        static State& state() {
            static State s_state;
            return s_state;
        }

        static std::mutex& mutex() {
            static std::mutex s_mutex;
            return s_mutex;
        }
    };

} // namespace nslog

#endif // NSLOG_GLOBAL_HPP
