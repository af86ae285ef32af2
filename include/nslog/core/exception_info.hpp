#ifndef NSLOG_EXCEPTION_INFO_HPP
#define NSLOG_EXCEPTION_INFO_HPP

#include <cstdlib>
#include <exception>
#include <string>
#include <typeinfo>
#include <vector>

#if defined(__GNUC__) || defined(__clang__)
#include <cxxabi.h>
#endif

namespace nslog {
namespace detail {

    /// Readable type name, e.g. "std::runtime_error". Only called when an
    /// error is being normalized.
    inline std::string typeName(const std::type_info& type) {
        const char* raw = type.name();
        if (!raw) return "unknown";
#if defined(__GNUC__) || defined(__clang__)
        int status = 0;
        char* readable = abi::__cxa_demangle(raw, nullptr, nullptr, &status);
        std::string result = (status == 0 && readable) ? std::string(readable) : std::string(raw);
        std::free(readable);
        return result;
#else
        return std::string(raw);
#endif
    }

    inline std::string getExceptionTypeName(const std::exception& ex) {
        return typeName(typeid(ex));
    }

    inline const char* safeWhat(const std::exception& ex) {
        const char* msg = ex.what();
        return msg ? msg : "(no message)";
    }

    // Bound for nested-exception and cause chains.
    static const int kMaxNestedExceptionDepth = 20;

    /// One level of a std::nested_exception chain.
    struct NestedFailure {
        std::string type;
        std::string message;
    };

    /// The exceptions nested inside @p ex (std::throw_with_nested), outermost
    /// first. A nested object that is not a std::exception ends the chain
    /// with type "unknown exception" and an empty message.
    inline std::vector<NestedFailure> nestedFailures(const std::exception& ex) {
        std::vector<NestedFailure> chain;
        std::exception_ptr next;
        const std::nested_exception* holder = dynamic_cast<const std::nested_exception*>(&ex);
        if (holder) next = holder->nested_ptr();

        while (next && static_cast<int>(chain.size()) < kMaxNestedExceptionDepth) {
            NestedFailure failure;
            std::exception_ptr current = next;
            next = nullptr;
            try {
                std::rethrow_exception(current);
            } catch (const std::exception& inner) {
                failure.type = getExceptionTypeName(inner);
                failure.message = safeWhat(inner);
                const std::nested_exception* innerHolder =
                    dynamic_cast<const std::nested_exception*>(&inner);
                if (innerHolder) next = innerHolder->nested_ptr();
            } catch (...) {
                failure.type = "unknown exception";
            }
            chain.push_back(failure);
        }
        return chain;
    }

} // namespace detail
} // namespace nslog

#endif // NSLOG_EXCEPTION_INFO_HPP
