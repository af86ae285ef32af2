#ifndef NSLOG_FILE_TRANSPORT_HPP
#define NSLOG_FILE_TRANSPORT_HPP

#include "transport_interface.hpp"
#include "../core/errors.hpp"
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <mutex>
#include <string>
#include <sys/stat.h>

namespace nslog {
    /// Line-oriented file writer. With sync every line is flushed to the
    /// file immediately; otherwise lines are buffered until flush() or
    /// destruction.
    class FileTransport : public ITransport {
    public:
        /// Throws LoggerError(LOG_FILE_WRITE_FAILED) when the file cannot be
        /// opened.
        FileTransport(const std::string &path, bool append = true, bool sync = false)
            : m_path(path)
            , m_sync(sync)
            , m_size(0)
            , m_writeFailed(false) {
            open(append);
        }

        ~FileTransport() {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_file.is_open()) {
                m_file.flush();
                m_file.close();
            }
        }

        void write(const std::string &formattedEntry) override {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_file.is_open()) return;
            m_file << formattedEntry << '\n';
            if (m_sync) m_file.flush();
            m_size += formattedEntry.size() + 1;
            if (!m_file) {
                // Report once per failure streak.
                if (!m_writeFailed) {
                    std::fprintf(stderr, "[NSLOG ERROR] %s\n",
                                 createLogWriteError(m_path, std::strerror(errno ? errno : EIO)).what());
                }
                m_writeFailed = true;
                m_file.clear();
            } else {
                m_writeFailed = false;
            }
        }

        void flush() override {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_file.is_open()) m_file.flush();
        }

        /// Close and reopen in append mode, e.g. after the file was renamed
        /// away by rotation.
        void reopen() {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_file.is_open()) {
                m_file.flush();
                m_file.close();
            }
            open(true);
        }

        const std::string& path() const { return m_path; }

        /// Bytes currently in the file, including buffered output.
        std::uint64_t size() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_size;
        }

        bool isSync() const { return m_sync; }

    private:
        void open(bool append) {
            m_file.open(m_path.c_str(),
                        std::ios::out | std::ios::binary | (append ? std::ios::app : std::ios::trunc));
            if (!m_file.is_open()) {
                throw createLogWriteError(m_path, std::strerror(errno ? errno : EIO));
            }
            struct stat st;
            m_size = stat(m_path.c_str(), &st) == 0 ? static_cast<std::uint64_t>(st.st_size) : 0;
        }

        std::string m_path;
        bool m_sync;
        std::uint64_t m_size;
        bool m_writeFailed;
        std::ofstream m_file;
        mutable std::mutex m_mutex;
    };
} // namespace nslog

#endif // NSLOG_FILE_TRANSPORT_HPP
