#ifndef NSLOG_STDOUT_TRANSPORT_HPP
#define NSLOG_STDOUT_TRANSPORT_HPP

#include "transport_interface.hpp"
#include <iostream>
#include <mutex>

namespace nslog {
    /// @note All StdoutTransport instances share a single mutex so that
    ///       concurrent writes to stdout are serialized. StderrTransport
    ///       has its own independent mutex.
    class StdoutTransport : public ITransport {
    public:
        explicit StdoutTransport(bool sync = true) : m_sync(sync) {}

        void write(const std::string &formattedEntry) override {
            std::lock_guard<std::mutex> lock(sharedMutex());
            std::cout << formattedEntry << '\n';
            if (m_sync) std::cout.flush();
        }

        void flush() override {
            std::lock_guard<std::mutex> lock(sharedMutex());
            std::cout.flush();
        }

    private:
        static std::mutex& sharedMutex() {
            static std::mutex s_mutex;
            return s_mutex;
        }

        bool m_sync;
    };

    /// @note All StderrTransport instances share a single mutex so that
    ///       concurrent writes to stderr are serialized.
    class StderrTransport : public ITransport {
    public:
        explicit StderrTransport(bool sync = true) : m_sync(sync) {}

        void write(const std::string &formattedEntry) override {
            std::lock_guard<std::mutex> lock(sharedMutex());
            std::cerr << formattedEntry << '\n';
            if (m_sync) std::cerr.flush();
        }

        void flush() override {
            std::lock_guard<std::mutex> lock(sharedMutex());
            std::cerr.flush();
        }

    private:
        static std::mutex& sharedMutex() {
            static std::mutex s_mutex;
            return s_mutex;
        }

        bool m_sync;
    };
} // namespace nslog

#endif // NSLOG_STDOUT_TRANSPORT_HPP
