#ifndef NSLOG_ROLLING_FILE_SINK_HPP
#define NSLOG_ROLLING_FILE_SINK_HPP

#include "sink_interface.hpp"
#include "../core/log_common.hpp"
#include "../formatter/json_formatter.hpp"
#include "../fs/file_system.hpp"
#include "../rotate/rotate.hpp"
#include "../transport/file_transport.hpp"
#include <cstdio>
#include <memory>
#include <string>

namespace nslog {

    /// File sink that rotates its file once it reaches the configured size.
    /// Rotation failures are reported on stderr and logging continues into
    /// the current file.
    class RollingFileSink : public ISink {
    public:
        /// Throws LoggerError(LOG_FILE_WRITE_FAILED) when the file cannot be
        /// opened.
        RollingFileSink(const std::string& path, const RotateConfig& config,
                        std::shared_ptr<IFileSystem> fs, bool append = true, bool sync = false)
            : m_config(config)
            , m_fs(fs ? std::move(fs) : std::make_shared<PosixFileSystem>()) {
            auto transport = detail::make_unique<FileTransport>(path, append, sync);
            m_file = transport.get();
            setTransport(std::move(transport));
            setFormatter(detail::make_unique<JsonFormatter>());
            if (m_config.folder.empty()) m_config.folder = detail::parentPath(path);
        }

        const RotateConfig& config() const { return m_config; }
        const std::string& path() const { return m_file->path(); }

        void write(const LogRecord& record) override {
            IFormatter* fmt = formatter();
            if (!fmt) return;
            m_file->write(fmt->format(record));
            if (m_config.maxSize > 0 && m_file->size() >= m_config.maxSize) {
                rotate();
            }
        }

    private:
        void rotate() {
            m_file->flush();
            try {
                if (checkAndRotate(m_file->path(), m_config, *m_fs)) {
                    m_file->reopen();
                }
            } catch (const LoggerError& e) {
                std::fprintf(stderr, "[NSLOG ERROR] %s (%s)\n", e.what(), e.codeString());
            }
        }

        RotateConfig m_config;
        std::shared_ptr<IFileSystem> m_fs;
        FileTransport* m_file;
    };

} // namespace nslog

#endif // NSLOG_ROLLING_FILE_SINK_HPP
