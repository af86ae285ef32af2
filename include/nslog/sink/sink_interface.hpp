#ifndef NSLOG_SINK_INTERFACE_HPP
#define NSLOG_SINK_INTERFACE_HPP

#include "../core/log_record.hpp"
#include "../formatter/formatter_interface.hpp"
#include "../transport/transport_interface.hpp"
#include <memory>

namespace nslog {
    /// Output target with its own minimum level.
    class ISink {
    public:
        ISink() : m_level(LogLevel::TRACE) {}

        virtual ~ISink() = default;

        virtual void write(const LogRecord &record) = 0;

        virtual void flush() {
            if (m_transport) m_transport->flush();
        }

        void setLevel(LogLevel level) { m_level = level; }
        LogLevel level() const { return m_level; }

        bool accepts(LogLevel level) const {
            return level != LogLevel::SILENT && level >= m_level;
        }

        void setFormatter(std::unique_ptr<IFormatter> formatter) {
            m_formatter = std::move(formatter);
        }

        void setTransport(std::unique_ptr<ITransport> transport) {
            m_transport = std::move(transport);
        }

        IFormatter* formatter() const { return m_formatter.get(); }
        ITransport* transport() const { return m_transport.get(); }

    protected:
        LogLevel m_level;
        std::unique_ptr<IFormatter> m_formatter;
        std::unique_ptr<ITransport> m_transport;
    };
} // namespace nslog

#endif // NSLOG_SINK_INTERFACE_HPP
