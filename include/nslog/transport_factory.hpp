#ifndef NSLOG_TRANSPORT_FACTORY_HPP
#define NSLOG_TRANSPORT_FACTORY_HPP

#include "config/transport_config.hpp"
#include "core/environment.hpp"
#include "core/errors.hpp"
#include "core/log_common.hpp"
#include "formatter/json_formatter.hpp"
#include "formatter/pretty_formatter.hpp"
#include "fs/file_system.hpp"
#include "sink/multi_sink.hpp"
#include "sink/rolling_file_sink.hpp"
#include "sink/stream_sink.hpp"
#include "transport/file_transport.hpp"
#include "transport/stdout_transport.hpp"
#include <cstdio>
#include <memory>

namespace nslog {

    /// Builds the composite destination for a resolved transport set.
    class TransportFactory {
    public:
        /// One sink per descriptor. Sinks that cannot be constructed are
        /// dropped with a diagnostic; when none remain a default console
        /// sink is used. Throws LoggerError(LOG_TRANSPORT_INIT_FAILED) if
        /// even that fails.
        static std::unique_ptr<MultiSink> build(const ResolvedTransportSet& set,
                                                std::shared_ptr<IFileSystem> fs,
                                                const Environment& env) {
            auto multi = detail::make_unique<MultiSink>();
            for (size_t i = 0; i < set.transports.size(); ++i) {
                const TransportDescriptor& d = set.transports[i];
                try {
                    multi->addSink(createSink(d, fs, env));
                } catch (const std::exception& e) {
                    std::fprintf(stderr,
                                 "[NSLOG ERROR] Failed to initialize %s transport%s: %s. "
                                 "The transport will be disabled.\n",
                                 getTransportKindName(d.kind),
                                 d.isFile() && !d.path.empty() ? (" \"" + d.path + "\"").c_str() : "",
                                 detail::safeWhat(e));
                }
            }

            if (multi->empty()) {
                std::fprintf(stderr,
                             "[NSLOG WARNING] All configured transports failed to initialize. "
                             "Falling back to console output.\n");
                try {
                    multi->addSink(createSink(TransportDescriptor::console(LogLevel::INFO), fs, env));
                } catch (const std::exception& e) {
                    throw createTransportError(detail::safeWhat(e), &e);
                }
            }
            return multi;
        }

        static std::unique_ptr<ISink> createSink(const TransportDescriptor& d,
                                                 std::shared_ptr<IFileSystem> fs,
                                                 const Environment& env) {
            std::unique_ptr<ISink> sink;
            if (d.isConsole()) {
                sink = detail::make_unique<StreamSink>(
                    detail::make_unique<PrettyFormatter>(prettyOptions(d, env)),
                    detail::make_unique<StdoutTransport>(d.sync));
            } else if (d.isStdioDestination()) {
                std::unique_ptr<ITransport> transport;
                if (d.destination == "2") {
                    transport = detail::make_unique<StderrTransport>(d.sync);
                } else {
                    transport = detail::make_unique<StdoutTransport>(d.sync);
                }
                sink = detail::make_unique<StreamSink>(fileFormatter(d, env), std::move(transport));
            } else if (d.rotation.enabled) {
                RotateConfig config(d.directory(), d.rotation.maxSize, d.rotation.maxFiles,
                                    d.rotation.compress);
                auto rolling = detail::make_unique<RollingFileSink>(d.path, config, fs, d.append, d.sync);
                rolling->setFormatter(fileFormatter(d, env));
                sink = std::move(rolling);
            } else {
                sink = detail::make_unique<StreamSink>(
                    fileFormatter(d, env),
                    detail::make_unique<FileTransport>(d.path, d.append, d.sync));
            }
            sink->setLevel(d.level);
            return sink;
        }

    private:
        static PrettyOptions prettyOptions(const TransportDescriptor& d, const Environment& env) {
            PrettyOptions options;
            options.colors = d.colors && !env.has("NO_COLOR");
            options.translateTime = d.translateTime;
            options.ignore = d.ignore;
            options.singleLine = d.singleLine;
            options.hideObjectKeys = d.hideObjectKeys;
            options.showMetadata = d.showMetadata;
            return options;
        }

        /// JSON lines unless pretty printing was requested. Pretty output
        /// written to a file is never colored.
        static std::unique_ptr<IFormatter> fileFormatter(const TransportDescriptor& d,
                                                         const Environment& env) {
            if (!d.prettyPrint) return detail::make_unique<JsonFormatter>();
            PrettyOptions options = prettyOptions(d, env);
            if (!d.isStdioDestination()) options.colors = false;
            return detail::make_unique<PrettyFormatter>(options);
        }
    };

} // namespace nslog

#endif // NSLOG_TRANSPORT_FACTORY_HPP
