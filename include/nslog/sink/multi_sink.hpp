#ifndef NSLOG_MULTI_SINK_HPP
#define NSLOG_MULTI_SINK_HPP

#include "sink_interface.hpp"
#include <exception>
#include <memory>
#include <vector>

namespace nslog {
    /// Fans a record out to every child sink whose level admits it.
    ///
    /// A child that throws does not stop delivery to the others; the first
    /// exception is rethrown once every child has been offered the record.
    class MultiSink : public ISink {
    public:
        void addSink(std::unique_ptr<ISink> sink) {
            if (sink) m_sinks.push_back(std::move(sink));
        }

        size_t size() const { return m_sinks.size(); }
        bool empty() const { return m_sinks.empty(); }

        ISink* sinkAt(size_t index) const {
            return index < m_sinks.size() ? m_sinks[index].get() : nullptr;
        }

        /// Lowest level admitted by any child; SILENT when there are none.
        LogLevel minLevel() const {
            LogLevel level = LogLevel::SILENT;
            for (size_t i = 0; i < m_sinks.size(); ++i) {
                if (m_sinks[i]->level() < level) level = m_sinks[i]->level();
            }
            return level;
        }

        void write(const LogRecord &record) override {
            std::exception_ptr firstError;
            for (size_t i = 0; i < m_sinks.size(); ++i) {
                if (!m_sinks[i]->accepts(record.level)) continue;
                try {
                    m_sinks[i]->write(record);
                } catch (const std::exception&) {
                    if (!firstError) firstError = std::current_exception();
                }
            }
            if (firstError) std::rethrow_exception(firstError);
        }

        void flush() override {
            for (size_t i = 0; i < m_sinks.size(); ++i) {
                m_sinks[i]->flush();
            }
        }

    private:
        std::vector<std::unique_ptr<ISink> > m_sinks;
    };
} // namespace nslog

#endif // NSLOG_MULTI_SINK_HPP
