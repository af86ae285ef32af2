#ifndef NSLOG_STREAM_SINK_HPP
#define NSLOG_STREAM_SINK_HPP

#include "sink_interface.hpp"
#include "../core/log_common.hpp"

namespace nslog {
    /// Formatter + transport pair: console, stdio and plain file targets.
    class StreamSink : public ISink {
    public:
        StreamSink(std::unique_ptr<IFormatter> formatter, std::unique_ptr<ITransport> transport,
                   LogLevel level = LogLevel::TRACE) {
            setFormatter(std::move(formatter));
            setTransport(std::move(transport));
            setLevel(level);
        }

        void write(const LogRecord &record) override {
            if (m_formatter && m_transport) {
                m_transport->write(m_formatter->format(record));
            }
        }
    };
} // namespace nslog

#endif // NSLOG_STREAM_SINK_HPP
