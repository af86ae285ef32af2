#ifndef NSLOG_NAMESPACE_FILTER_HPP
#define NSLOG_NAMESPACE_FILTER_HPP

#include "log_common.hpp"
#include <cstdio>
#include <map>
#include <memory>
#include <mutex>
#include <regex>
#include <string>
#include <vector>

namespace nslog {

    /// One token of a DEBUG-style filter expression.
    ///
    /// Supported syntax:
    ///   *          every namespace
    ///   prefix*    every namespace starting with prefix
    ///   name       exactly that namespace
    ///   -<token>   negation of any of the above
    ///
    /// A trailing `\*` is not a wildcard: the token matches its own text,
    /// backslash included.
    class NamespacePattern {
    public:
        enum class Kind { Universal, Prefix, Exact };

        static NamespacePattern parse(const std::string& token) {
            NamespacePattern p;
            std::string body = token;
            if (!body.empty() && body[0] == '-') {
                p.m_negated = true;
                body = body.substr(1);
            }
            p.m_source = body;

            if (body == "*") {
                p.m_kind = Kind::Universal;
                p.m_valid = true;
                return p;
            }

            std::string regexText;
            if (body.size() > 1 && detail::endsWith(body, "*") && !detail::endsWith(body, "\\*")) {
                p.m_kind = Kind::Prefix;
                regexText = "^" + escape(body.substr(0, body.size() - 1)) + ".*";
            } else {
                p.m_kind = Kind::Exact;
                regexText = "^" + escape(body) + "$";
            }

            try {
                p.m_regex = std::make_shared<std::regex>(regexText);
                p.m_valid = true;
            } catch (const std::regex_error& e) {
                std::fprintf(stderr,
                             "[NSLOG WARNING] Invalid DEBUG pattern converted to regex: \"%s\". Error: %s\n",
                             body.c_str(), e.what());
                p.m_valid = false;
            }
            return p;
        }

        bool negated() const { return m_negated; }
        bool isUniversal() const { return m_kind == Kind::Universal; }
        Kind kind() const { return m_kind; }
        const std::string& source() const { return m_source; }

        /// A pattern that failed to compile never matches.
        bool matches(const std::string& ns) const {
            if (!m_valid) return false;
            if (m_kind == Kind::Universal) return true;
            return std::regex_search(ns, *m_regex);
        }

    private:
        NamespacePattern() : m_kind(Kind::Exact), m_negated(false), m_valid(false) {}

        static std::string escape(const std::string& literal) {
            static const std::string kSpecial = "\\^$.*+?()[]{}|:";
            std::string out;
            out.reserve(literal.size() * 2);
            for (size_t i = 0; i < literal.size(); ++i) {
                if (kSpecial.find(literal[i]) != std::string::npos) out += '\\';
                out += literal[i];
            }
            return out;
        }

        Kind m_kind;
        bool m_negated;
        bool m_valid;
        std::string m_source;
        std::shared_ptr<std::regex> m_regex;
    };

    /// Compiled comma-separated filter expression.
    class FilterExpression {
    public:
        static FilterExpression compile(const std::string& expression) {
            FilterExpression expr;
            std::vector<std::string> tokens = detail::splitList(expression, ',');
            for (size_t i = 0; i < tokens.size(); ++i) {
                NamespacePattern p = NamespacePattern::parse(tokens[i]);
                if (p.isUniversal()) {
                    if (p.negated()) expr.m_universalNegative = true;
                    else expr.m_universalPositive = true;
                } else {
                    expr.m_specific.push_back(p);
                }
            }
            expr.m_empty = tokens.empty();
            return expr;
        }

        bool empty() const { return m_empty; }

        /// Empty @p ns means "no namespace".
        bool isEnabled(const std::string& ns) const {
            if (m_empty) return ns.empty();
            if (ns.empty()) return m_universalPositive && !m_universalNegative;

            // Specific patterns beat the catch-alls; among themselves the
            // last match in textual order decides.
            const NamespacePattern* decisive = nullptr;
            for (size_t i = 0; i < m_specific.size(); ++i) {
                if (m_specific[i].matches(ns)) decisive = &m_specific[i];
            }
            if (decisive) return !decisive->negated();
            if (m_universalNegative) return false;
            return m_universalPositive;
        }

        const std::vector<NamespacePattern>& specificPatterns() const { return m_specific; }

    private:
        FilterExpression()
            : m_empty(true)
            , m_universalPositive(false)
            , m_universalNegative(false) {}

        bool m_empty;
        bool m_universalPositive;
        bool m_universalNegative;
        std::vector<NamespacePattern> m_specific;
    };

    /// Evaluates DEBUG-style expressions, caching each distinct expression
    /// string after its first compilation.
    class NamespaceFilter {
    public:
        static bool isEnabled(const std::string& ns, const std::string& expression) {
            std::string trimmed = detail::trim(expression);
            if (trimmed.empty()) return ns.empty();
            return compiled(trimmed)->isEnabled(ns);
        }

        static std::shared_ptr<const FilterExpression> compiled(const std::string& expression) {
            std::lock_guard<std::mutex> lock(mutex());
            std::map<std::string, std::shared_ptr<const FilterExpression> >& c = cache();
            std::map<std::string, std::shared_ptr<const FilterExpression> >::iterator it =
                c.find(expression);
            if (it != c.end()) return it->second;
            if (c.size() >= kMaxCachedExpressions) c.clear();
            std::shared_ptr<const FilterExpression> expr =
                std::make_shared<FilterExpression>(FilterExpression::compile(expression));
            c[expression] = expr;
            return expr;
        }

        static size_t cacheSize() {
            std::lock_guard<std::mutex> lock(mutex());
            return cache().size();
        }

        static void clearCache() {
            std::lock_guard<std::mutex> lock(mutex());
            cache().clear();
        }

    private:
        static const size_t kMaxCachedExpressions = 64;

        static std::map<std::string, std::shared_ptr<const FilterExpression> >& cache() {
            static std::map<std::string, std::shared_ptr<const FilterExpression> > s_cache;
            return s_cache;
        }

        static std::mutex& mutex() {
            static std::mutex s_mutex;
            return s_mutex;
        }
    };

} // namespace nslog

#endif // NSLOG_NAMESPACE_FILTER_HPP
