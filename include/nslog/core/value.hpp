#ifndef NSLOG_VALUE_HPP
#define NSLOG_VALUE_HPP

#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <exception>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace nslog {

    /// Log payload value.
    ///
    /// The kinds mirror what the sanitizer has to tell apart:
    ///   - Scalar:         null, bool, number or string
    ///   - Sequence:       ordered list
    ///   - KeyedContainer: explicit map with arbitrary keys; the only kind
    ///                     whose traversal consumes depth budget
    ///   - PlainRecord:    ordinary string-keyed record ("data")
    ///   - Error:          a normalized exception
    ///
    /// std::map / std::unordered_map convert to KeyedContainer, std::vector
    /// to Sequence, Value::Fields to PlainRecord and anything derived from
    /// std::exception to Error.
    class Value {
    public:
        enum class Kind {
            Scalar,
            Sequence,
            KeyedContainer,
            PlainRecord,
            Error
        };

        typedef std::vector<Value> Items;
        typedef std::vector<std::pair<Value, Value> > MapEntries;
        typedef std::vector<std::pair<std::string, Value> > Fields;

        Value() : m_kind(Kind::Scalar) {}

        Value(std::nullptr_t) : m_kind(Kind::Scalar) {}

        Value(bool b) : m_kind(Kind::Scalar), m_scalar(b) {}

        template<typename T, typename std::enable_if<
            std::is_arithmetic<T>::value && !std::is_same<T, bool>::value, int>::type = 0>
        Value(T number) : m_kind(Kind::Scalar), m_scalar(number) {}

        Value(const char* s) : m_kind(Kind::Scalar) {
            if (s) m_scalar = std::string(s);
        }

        Value(const std::string& s) : m_kind(Kind::Scalar), m_scalar(s) {}

        Value(const Fields& fields) : m_kind(Kind::PlainRecord), m_fields(fields) {}

        template<typename E, typename std::enable_if<
            std::is_base_of<std::exception, E>::value, int>::type = 0>
        Value(const E& ex) : m_kind(Kind::Error),
                             m_error(std::make_shared<ErrorInfo>(extractErrorInfo(ex))) {}

        template<typename T, typename A>
        Value(const std::vector<T, A>& items) : m_kind(Kind::Sequence) {
            m_items.reserve(items.size());
            for (typename std::vector<T, A>::const_iterator it = items.begin(); it != items.end(); ++it) {
                m_items.push_back(Value(*it));
            }
        }

        template<typename K, typename V, typename C, typename A>
        Value(const std::map<K, V, C, A>& map) : m_kind(Kind::KeyedContainer) {
            for (typename std::map<K, V, C, A>::const_iterator it = map.begin(); it != map.end(); ++it) {
                m_entries.push_back(std::make_pair(Value(it->first), Value(it->second)));
            }
        }

        template<typename K, typename V, typename H, typename E, typename A>
        Value(const std::unordered_map<K, V, H, E, A>& map) : m_kind(Kind::KeyedContainer) {
            for (typename std::unordered_map<K, V, H, E, A>::const_iterator it = map.begin();
                 it != map.end(); ++it) {
                m_entries.push_back(std::make_pair(Value(it->first), Value(it->second)));
            }
        }

        // --- Named constructors ---

        static Value record(Fields fields) {
            Value v;
            v.m_kind = Kind::PlainRecord;
            v.m_fields = std::move(fields);
            return v;
        }

        /// Insertion-ordered keyed container.
        static Value map(MapEntries entries) {
            Value v;
            v.m_kind = Kind::KeyedContainer;
            v.m_entries = std::move(entries);
            return v;
        }

        static Value sequence(Items items) {
            Value v;
            v.m_kind = Kind::Sequence;
            v.m_items = std::move(items);
            return v;
        }

        static Value error(const std::exception& ex) {
            return error(extractErrorInfo(ex));
        }

        static Value error(ErrorInfo info) {
            Value v;
            v.m_kind = Kind::Error;
            v.m_error = std::make_shared<ErrorInfo>(std::move(info));
            return v;
        }

        /// JSON objects become PlainRecords, arrays Sequences.
        static Value fromJson(const nlohmann::ordered_json& j) {
            if (j.is_object()) {
                Fields fields;
                for (auto it = j.begin(); it != j.end(); ++it) {
                    fields.push_back(std::make_pair(it.key(), fromJson(it.value())));
                }
                return record(std::move(fields));
            }
            if (j.is_array()) {
                Items items;
                for (auto it = j.begin(); it != j.end(); ++it) {
                    items.push_back(fromJson(*it));
                }
                return sequence(std::move(items));
            }
            Value v;
            v.m_scalar = j;
            return v;
        }

        // --- Inspection ---

        Kind kind() const { return m_kind; }
        bool isScalar() const { return m_kind == Kind::Scalar; }
        bool isNull() const { return m_kind == Kind::Scalar && m_scalar.is_null(); }
        bool isString() const { return m_kind == Kind::Scalar && m_scalar.is_string(); }
        bool isNumber() const { return m_kind == Kind::Scalar && m_scalar.is_number(); }
        bool isSequence() const { return m_kind == Kind::Sequence; }
        bool isKeyedContainer() const { return m_kind == Kind::KeyedContainer; }
        bool isRecord() const { return m_kind == Kind::PlainRecord; }
        bool isError() const { return m_kind == Kind::Error; }

        const nlohmann::ordered_json& scalar() const { return m_scalar; }

        const std::string& asString() const {
            if (!isString()) throw std::logic_error("nslog::Value is not a string");
            return m_scalar.get_ref<const std::string&>();
        }

        const Items& items() const { return m_items; }
        const MapEntries& entries() const { return m_entries; }
        const Fields& fields() const { return m_fields; }

        const ErrorInfo& errorInfo() const {
            if (!m_error) throw std::logic_error("nslog::Value is not an error");
            return *m_error;
        }

        /// Field lookup on a PlainRecord; null when absent or not a record.
        const Value* find(const std::string& key) const {
            if (m_kind != Kind::PlainRecord) return nullptr;
            for (size_t i = 0; i < m_fields.size(); ++i) {
                if (m_fields[i].first == key) return &m_fields[i].second;
            }
            return nullptr;
        }

        /// String form used when a value becomes an object key.
        std::string toKeyString() const {
            if (isString()) return m_scalar.get_ref<const std::string&>();
            if (m_kind == Kind::Error) return m_error->type + ": " + m_error->message;
            if (m_kind == Kind::Scalar) return m_scalar.dump();
            return toJson().dump();
        }

        nlohmann::ordered_json toJson() const {
            switch (m_kind) {
                case Kind::Scalar:
                    return m_scalar;
                case Kind::Sequence: {
                    nlohmann::ordered_json arr = nlohmann::ordered_json::array();
                    for (size_t i = 0; i < m_items.size(); ++i) {
                        arr.push_back(m_items[i].toJson());
                    }
                    return arr;
                }
                case Kind::KeyedContainer: {
                    nlohmann::ordered_json obj = nlohmann::ordered_json::object();
                    for (size_t i = 0; i < m_entries.size(); ++i) {
                        obj[m_entries[i].first.toKeyString()] = m_entries[i].second.toJson();
                    }
                    return obj;
                }
                case Kind::PlainRecord: {
                    nlohmann::ordered_json obj = nlohmann::ordered_json::object();
                    for (size_t i = 0; i < m_fields.size(); ++i) {
                        obj[m_fields[i].first] = m_fields[i].second.toJson();
                    }
                    return obj;
                }
                case Kind::Error:
                    return errorToJson(*m_error);
            }
            return nlohmann::ordered_json();
        }

        static nlohmann::ordered_json errorToJson(const ErrorInfo& info) {
            nlohmann::ordered_json obj = nlohmann::ordered_json::object();
            obj["type"] = info.type;
            obj["message"] = info.message;
            obj["stack"] = info.stack;
            if (!info.code.is_null()) obj["code"] = info.code;
            return obj;
        }

        bool operator==(const Value& other) const {
            if (m_kind != other.m_kind) return false;
            switch (m_kind) {
                case Kind::Scalar: return m_scalar == other.m_scalar;
                case Kind::Sequence: return m_items == other.m_items;
                case Kind::KeyedContainer: return m_entries == other.m_entries;
                case Kind::PlainRecord: return m_fields == other.m_fields;
                case Kind::Error:
                    return m_error->type == other.m_error->type &&
                           m_error->message == other.m_error->message &&
                           m_error->stack == other.m_error->stack &&
                           m_error->code == other.m_error->code;
            }
            return false;
        }

        bool operator!=(const Value& other) const { return !(*this == other); }

    private:
        Kind m_kind;
        nlohmann::ordered_json m_scalar;
        Items m_items;
        MapEntries m_entries;
        Fields m_fields;
        std::shared_ptr<const ErrorInfo> m_error;
    };

    /// Shorthand for context objects: `Fields{{"userId", 42}, {"op", "login"}}`.
    typedef Value::Fields Fields;

} // namespace nslog

#endif // NSLOG_VALUE_HPP
