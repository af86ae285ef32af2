#ifndef NSLOG_RUNTIME_CONFIG_HPP
#define NSLOG_RUNTIME_CONFIG_HPP

#include "environment.hpp"
#include "sanitizer.hpp"
#include <memory>
#include <mutex>
#include <string>

namespace nslog {

    /// Shared, swappable configuration read by every logger handle at call
    /// time, so DEBUG and LOG_MAX_* changes reach handles created earlier.
    class RuntimeConfig {
    public:
        RuntimeConfig() : m_env(std::make_shared<Environment>(Environment::process())) {}

        explicit RuntimeConfig(Environment env)
            : m_env(std::make_shared<Environment>(std::move(env))) {}

        std::shared_ptr<const Environment> environment() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_env;
        }

        void setEnvironment(Environment env) {
            std::shared_ptr<const Environment> next = std::make_shared<Environment>(std::move(env));
            std::lock_guard<std::mutex> lock(m_mutex);
            m_env = next;
        }

        std::string debugExpression() const {
            return environment()->get("DEBUG");
        }

        SanitizationContext sanitization() const {
            return SanitizationContext::fromEnvironment(*environment());
        }

    private:
        mutable std::mutex m_mutex;
        std::shared_ptr<const Environment> m_env;
    };

} // namespace nslog

#endif // NSLOG_RUNTIME_CONFIG_HPP
