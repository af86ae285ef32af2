#ifndef NSLOG_SANITIZER_HPP
#define NSLOG_SANITIZER_HPP

#include "value.hpp"
#include "environment.hpp"
#include <string>

namespace nslog {

    static const char* const kMaxMapDepthReached = "[Max Map Depth Reached]";

    /// Limits applied to every argument of one log call.
    struct SanitizationContext {
        int maxDepth;
        size_t maxStringLength; // 0 = unlimited
        std::string truncationMarker;

        SanitizationContext()
            : maxDepth(8)
            , maxStringLength(0)
            , truncationMarker("...") {}

        SanitizationContext(int depth, size_t maxLength, std::string marker)
            : maxDepth(depth)
            , maxStringLength(maxLength)
            , truncationMarker(std::move(marker)) {}

        /// LOG_MAX_DEPTH (non-positive or invalid -> 8), LOG_MAX_STRING_LENGTH
        /// (invalid -> 0), LOG_TRUNCATION_MARKER (empty -> "...").
        static SanitizationContext fromEnvironment(const Environment& env) {
            SanitizationContext ctx;
            long depth = env.getInt("LOG_MAX_DEPTH", 0);
            ctx.maxDepth = depth > 0 ? static_cast<int>(depth) : 8;
            long maxLength = env.getInt("LOG_MAX_STRING_LENGTH", 0);
            ctx.maxStringLength = maxLength > 0 ? static_cast<size_t>(maxLength) : 0;
            std::string marker = env.get("LOG_TRUNCATION_MARKER");
            ctx.truncationMarker = marker.empty() ? std::string("...") : marker;
            return ctx;
        }
    };

    /// Truncate to maxLength characters and append the marker. A string of
    /// exactly maxLength characters is left alone.
    inline std::string truncateString(const std::string& s, size_t maxLength,
                                      const std::string& marker) {
        if (maxLength == 0 || s.size() <= maxLength) return s;
        return s.substr(0, maxLength) + marker;
    }

    inline Value sanitize(const Value& value, int depth, size_t maxStringLength,
                          const std::string& marker) {
        switch (value.kind()) {
            case Value::Kind::Scalar:
                if (value.isString() && maxStringLength > 0 &&
                    value.asString().size() > maxStringLength) {
                    return Value(truncateString(value.asString(), maxStringLength, marker));
                }
                return value;

            case Value::Kind::KeyedContainer: {
                if (depth <= 0) return Value(kMaxMapDepthReached);
                Value::Fields fields;
                fields.reserve(value.entries().size());
                for (size_t i = 0; i < value.entries().size(); ++i) {
                    const std::pair<Value, Value>& entry = value.entries()[i];
                    fields.push_back(std::make_pair(
                        entry.first.toKeyString(),
                        sanitize(entry.second, depth - 1, maxStringLength, marker)));
                }
                return Value::record(std::move(fields));
            }

            // Sequences and plain records never consume depth; only keyed
            // containers do.
            case Value::Kind::Sequence: {
                Value::Items items;
                items.reserve(value.items().size());
                for (size_t i = 0; i < value.items().size(); ++i) {
                    items.push_back(sanitize(value.items()[i], depth, maxStringLength, marker));
                }
                return Value::sequence(std::move(items));
            }

            case Value::Kind::PlainRecord: {
                Value::Fields fields;
                fields.reserve(value.fields().size());
                for (size_t i = 0; i < value.fields().size(); ++i) {
                    fields.push_back(std::make_pair(
                        value.fields()[i].first,
                        sanitize(value.fields()[i].second, depth, maxStringLength, marker)));
                }
                return Value::record(std::move(fields));
            }

            case Value::Kind::Error:
                return value;
        }
        return value;
    }

    inline Value sanitize(const Value& value, const SanitizationContext& ctx) {
        return sanitize(value, ctx.maxDepth, ctx.maxStringLength, ctx.truncationMarker);
    }

} // namespace nslog

#endif // NSLOG_SANITIZER_HPP
