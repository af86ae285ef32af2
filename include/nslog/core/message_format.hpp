#ifndef NSLOG_MESSAGE_FORMAT_HPP
#define NSLOG_MESSAGE_FORMAT_HPP

#include "value.hpp"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <string>
#include <vector>

namespace nslog {
namespace detail {

    inline std::string formatNumber(double d) {
        if (std::isnan(d)) return "NaN";
        if (std::isinf(d)) return d > 0 ? "Infinity" : "-Infinity";
        if (d == std::floor(d) && std::fabs(d) < 9007199254740992.0) {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(d));
            return buf;
        }
        return nlohmann::ordered_json(d).dump();
    }

    /// Numeric reading used by %d / %i / %f. Non-numeric values are NaN.
    inline double toNumber(const Value& v) {
        if (v.isNumber()) return v.scalar().get<double>();
        if (v.isScalar() && v.scalar().is_boolean()) return v.scalar().get<bool>() ? 1.0 : 0.0;
        if (v.isNull()) return 0.0;
        if (v.isString()) {
            std::string s = trim(v.asString());
            if (s.empty()) return 0.0;
            char* end = nullptr;
            double d = std::strtod(s.c_str(), &end);
            if (end && *end == '\0') return d;
        }
        return std::numeric_limits<double>::quiet_NaN();
    }

    /// String form used by %s and for non-string messages.
    inline std::string toDisplayString(const Value& v) {
        if (v.isString()) return v.asString();
        if (v.isNumber()) return formatNumber(v.scalar().get<double>());
        if (v.isError()) return v.errorInfo().type + ": " + v.errorInfo().message;
        return v.toJson().dump();
    }

    /// JSON form used by %j / %o / %O. Strings are single-quoted.
    inline std::string toInspectString(const Value& v) {
        if (v.isString()) return "'" + v.asString() + "'";
        if (v.isNumber()) return formatNumber(v.scalar().get<double>());
        return v.toJson().dump();
    }

} // namespace detail

    /// printf-style interpolation.
    ///
    ///   %s          string form
    ///   %d  %i      integer (floored) number
    ///   %f          floating point number
    ///   %j %o %O    JSON
    ///   %%          literal percent (only when arguments follow)
    ///
    /// A placeholder without a value stays literal; surplus values are
    /// ignored. Throws nlohmann::json::type_error for strings that are not
    /// valid UTF-8.
    inline std::string formatMessage(const std::string& format, const std::vector<Value>& args) {
        if (args.empty()) return format;

        std::string result;
        result.reserve(format.size() + 16 * args.size());
        size_t argIndex = 0;

        for (size_t i = 0; i < format.size(); ++i) {
            char c = format[i];
            if (c != '%' || i + 1 >= format.size()) {
                result += c;
                continue;
            }

            char spec = format[i + 1];
            if (spec == '%') {
                result += '%';
                ++i;
                continue;
            }

            bool known = spec == 's' || spec == 'd' || spec == 'i' || spec == 'f' ||
                         spec == 'j' || spec == 'o' || spec == 'O';
            if (!known || argIndex >= args.size()) {
                result += c;
                continue;
            }

            const Value& arg = args[argIndex++];
            switch (spec) {
                case 's':
                    result += detail::toDisplayString(arg);
                    break;
                case 'd':
                case 'i':
                    result += detail::formatNumber(std::floor(detail::toNumber(arg)));
                    break;
                case 'f':
                    result += detail::formatNumber(detail::toNumber(arg));
                    break;
                default:
                    result += detail::toInspectString(arg);
                    break;
            }
            ++i;
        }
        return result;
    }

} // namespace nslog

#endif // NSLOG_MESSAGE_FORMAT_HPP
