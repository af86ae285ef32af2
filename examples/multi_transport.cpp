// multi_transport.cpp
//
// Configures two transports through the environment: a pretty console at
// debug level and a rotating JSON file for warnings and above.

#include "nslog.hpp"
#include <iostream>

int main() {
    nslog::Log::setEnvironment(nslog::Environment{
        {"DEBUG", "billing:*"},
        {"TRANSPORT1", "console"},
        {"TRANSPORT1_LEVEL", "debug"},
        {"TRANSPORT1_HIDE_OBJECT_KEYS", "cardNumber"},
        {"TRANSPORT2", "file"},
        {"TRANSPORT2_LEVEL", "warn"},
        {"TRANSPORT2_FOLDER", "logs"},
        {"TRANSPORT2_FILENAME", "{app_name}-{date}.log"},
        {"TRANSPORT2_ROTATE", "true"},
        {"TRANSPORT2_ROTATE_MAX_SIZE", "65536"},
        {"TRANSPORT2_ROTATE_MAX_FILES", "3"},
        {"LOG_MAX_STRING_LENGTH", "200"}});

    nslog::AppInfo app;
    app.name = "billing";
    app.version = "1.0.0";
    nslog::Log::setAppInfo(app);

    nslog::Logger invoices = nslog::Log::createLogger("billing:invoices");

    invoices.debug("console only");
    invoices.info(nslog::Fields{{"invoice", "INV-1001"}, {"cardNumber", "4111111111111111"}},
                  "invoice issued");
    invoices.warn(nslog::Fields{{"invoice", "INV-1002"}}, "payment overdue by %d days", 14);

    std::shared_ptr<const nslog::ResolvedTransportSet> set = nslog::Log::resolvedTransports();
    if (set) {
        for (size_t i = 0; i < set->transports.size(); ++i) {
            const nslog::TransportDescriptor& d = set->transports[i];
            std::cout << "transport " << d.index << ": " << nslog::getTransportKindName(d.kind)
                      << " (" << nslog::getLevelName(d.level) << ")";
            if (d.isFile()) std::cout << " -> " << d.path;
            std::cout << std::endl;
        }
    }

    nslog::Log::flush();
    return 0;
}
