#ifndef NSLOG_FORMATTER_INTERFACE_HPP
#define NSLOG_FORMATTER_INTERFACE_HPP

#include "../core/log_record.hpp"
#include <string>

namespace nslog {
    class IFormatter {
    public:
        virtual ~IFormatter() = default;

        /// One output line (or block) without the trailing newline.
        virtual std::string format(const LogRecord &record) const = 0;
    };
} // namespace nslog

#endif // NSLOG_FORMATTER_INTERFACE_HPP
