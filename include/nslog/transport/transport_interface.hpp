#ifndef NSLOG_TRANSPORT_INTERFACE_HPP
#define NSLOG_TRANSPORT_INTERFACE_HPP

#include <string>

namespace nslog {

    class ITransport {
    public:
        virtual ~ITransport() = default;
        virtual void write(const std::string& formattedEntry) = 0;
        virtual void flush() {}
    };

} // namespace nslog

#endif // NSLOG_TRANSPORT_INTERFACE_HPP
