#ifndef NSLOG_TRANSPORT_DESCRIPTOR_HPP
#define NSLOG_TRANSPORT_DESCRIPTOR_HPP

#include "../core/log_level.hpp"
#include "../core/log_common.hpp"
#include "../fs/file_system.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace nslog {

    enum class TransportKind {
        Console,
        File
    };

    inline const char* getTransportKindName(TransportKind kind) {
        return kind == TransportKind::File ? "file" : "console";
    }

    struct RotationConfig {
        bool enabled;
        std::uint64_t maxSize;
        int maxFiles;
        bool compress;

        RotationConfig()
            : enabled(false)
            , maxSize(10485760)
            , maxFiles(5)
            , compress(false) {}
    };

    /// One configured output destination. Console fields are ignored for
    /// file descriptors and vice versa.
    struct TransportDescriptor {
        TransportKind kind;
        int index; // TRANSPORT{index}; 0 for legacy descriptors
        LogLevel level;
        bool enabled;
        bool sync;

        // console
        bool colors;
        std::string translateTime; // empty = raw epoch time
        std::vector<std::string> ignore;
        bool singleLine;
        std::vector<std::string> hideObjectKeys;
        bool showMetadata;

        // file
        std::string folder;
        std::string filename;    // template, see processFilenameTemplate()
        std::string destination; // explicit path, or "1"/"2" for stdout/stderr
        std::string path;        // resolved target path, filled by the resolver
        bool mkdir;
        bool append;
        bool prettyPrint;
        RotationConfig rotation;

        TransportDescriptor()
            : kind(TransportKind::Console)
            , index(0)
            , level(LogLevel::INFO)
            , enabled(true)
            , sync(false)
            , colors(true)
            , translateTime("SYS:standard")
            , singleLine(false)
            , showMetadata(false)
            , folder("logs")
            , filename("{app_name}.log")
            , mkdir(true)
            , append(true)
            , prettyPrint(false) {
            ignore.push_back("pid");
            ignore.push_back("hostname");
        }

        static TransportDescriptor console(LogLevel level = LogLevel::INFO) {
            TransportDescriptor d;
            d.kind = TransportKind::Console;
            d.level = level;
            return d;
        }

        static TransportDescriptor file(LogLevel level = LogLevel::INFO) {
            TransportDescriptor d;
            d.kind = TransportKind::File;
            d.level = level;
            return d;
        }

        bool isFile() const { return kind == TransportKind::File; }
        bool isConsole() const { return kind == TransportKind::Console; }

        /// Destination "1" (stdout) or "2" (stderr).
        bool isStdioDestination() const {
            return destination == "1" || destination == "2";
        }

        /// Directory that must exist and be writable for this descriptor.
        /// Empty for console and stdio destinations.
        std::string directory() const {
            if (!isFile() || isStdioDestination()) return std::string();
            if (!destination.empty()) return detail::parentPath(destination);
            return folder;
        }
    };

} // namespace nslog

#endif // NSLOG_TRANSPORT_DESCRIPTOR_HPP
