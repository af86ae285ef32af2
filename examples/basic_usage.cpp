// basic_usage.cpp
//
// Namespaced loggers, call shapes and child loggers. Run with e.g.
//
//   DEBUG='app:*,-app:noisy' ./nslog_basic_usage
//
// Without DEBUG only the unnamespaced logger writes.

#include "nslog.hpp"
#include <map>
#include <stdexcept>
#include <string>

int main() {
    nslog::Logger root = nslog::Log::createLogger();
    nslog::Logger http = nslog::Log::createLogger("app:http");
    nslog::Logger noisy = nslog::Log::createLogger("app:noisy");

    root.info("process started");

    // Message with interpolated values
    http.info("listening on %s:%d", "0.0.0.0", 8080);

    // Context object, then message
    http.info(nslog::Fields{{"method", "GET"}, {"path", "/orders"}, {"status", 200}},
              "request served in %dms", 12);

    // Context object only
    http.debug(nslog::Fields{{"cacheHit", true}});

    // Error first
    try {
        throw std::runtime_error("upstream timed out");
    } catch (const std::exception& e) {
        http.error(e);
        http.error(nslog::Fields{{"err", nslog::Value(e)}, {"retry", 3}}, "giving up");
    }

    // Explicit maps are depth limited by LOG_MAX_DEPTH
    std::map<std::string, std::map<std::string, int> > stats{{"orders", {{"open", 3}, {"closed", 12}}}};
    http.info(nslog::Fields{{"stats", stats}}, "stats snapshot");

    // Children inherit namespace and level and add bound fields
    nslog::Logger request = http.child(nslog::Fields{{"requestId", "req-42"}});
    request.warn("slow query");

    noisy.trace("filtered by the DEBUG expression above");

    request.setLevel("error");
    request.warn("dropped: below the handle's level");

    nslog::Log::flush();
    return 0;
}
