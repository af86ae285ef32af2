#ifndef NSLOG_ENVIRONMENT_HPP
#define NSLOG_ENVIRONMENT_HPP

#include <cerrno>
#include <cstdlib>
#include <initializer_list>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

extern char** environ;

namespace nslog {

    /// Environment-style configuration accessor.
    ///
    /// A live environment reads the process environment on every lookup, so
    /// changes made with setenv() are picked up immediately. A snapshot
    /// environment holds its own key/value map (tests, embedders).
    ///
    /// Empty values count as unset everywhere, matching the usual shell
    /// `VAR=` idiom.
    class Environment {
    public:
        Environment() : m_live(false) {}

        Environment(std::initializer_list<std::pair<const std::string, std::string> > vars)
            : m_live(false), m_vars(vars) {}

        explicit Environment(std::map<std::string, std::string> vars)
            : m_live(false), m_vars(std::move(vars)) {}

        static Environment process() {
            Environment env;
            env.m_live = true;
            return env;
        }

        bool isLive() const { return m_live; }

        bool lookup(const std::string& key, std::string& out) const {
            if (m_live) {
                const char* value = std::getenv(key.c_str());
                if (!value || !*value) return false;
                out = value;
                return true;
            }
            std::map<std::string, std::string>::const_iterator it = m_vars.find(key);
            if (it == m_vars.end() || it->second.empty()) return false;
            out = it->second;
            return true;
        }

        bool has(const std::string& key) const {
            std::string ignored;
            return lookup(key, ignored);
        }

        /// Names of every key with a non-empty value.
        std::vector<std::string> keys() const {
            std::vector<std::string> names;
            if (m_live) {
                for (char** entry = environ; entry && *entry; ++entry) {
                    std::string pair(*entry);
                    std::string::size_type eq = pair.find('=');
                    if (eq == std::string::npos || eq == 0 || eq + 1 == pair.size()) continue;
                    names.push_back(pair.substr(0, eq));
                }
                return names;
            }
            for (std::map<std::string, std::string>::const_iterator it = m_vars.begin();
                 it != m_vars.end(); ++it) {
                if (!it->second.empty()) names.push_back(it->first);
            }
            return names;
        }

        std::string get(const std::string& key, const std::string& defaultValue = std::string()) const {
            std::string value;
            return lookup(key, value) ? value : defaultValue;
        }

        /// Leading-integer parse ("10MB" -> 10). Unset or non-numeric values
        /// yield the default.
        long getInt(const std::string& key, long defaultValue) const {
            std::string value;
            if (!lookup(key, value)) return defaultValue;
            const char* begin = value.c_str();
            char* end = nullptr;
            errno = 0;
            long parsed = std::strtol(begin, &end, 10);
            if (end == begin || errno == ERANGE) return defaultValue;
            return parsed;
        }

        /// "Default true unless explicitly false" convention for safe behaviors.
        bool isNotFalse(const std::string& key) const {
            return get(key) != "false";
        }

        /// "Default false unless explicitly true" convention for destructive
        /// or expensive behaviors.
        bool isTrue(const std::string& key) const {
            return get(key) == "true";
        }

        /// Snapshot environments only; a live environment ignores writes.
        Environment& set(const std::string& key, const std::string& value) {
            if (!m_live) m_vars[key] = value;
            return *this;
        }

        Environment& unset(const std::string& key) {
            if (!m_live) m_vars.erase(key);
            return *this;
        }

        bool operator==(const Environment& other) const {
            return m_live == other.m_live && m_vars == other.m_vars;
        }

        bool operator!=(const Environment& other) const { return !(*this == other); }

    private:
        bool m_live;
        std::map<std::string, std::string> m_vars;
    };

} // namespace nslog

#endif // NSLOG_ENVIRONMENT_HPP
