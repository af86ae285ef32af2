#ifndef NSLOG_ROTATE_HPP
#define NSLOG_ROTATE_HPP

#include "../core/errors.hpp"
#include "../core/log_common.hpp"
#include "../fs/file_system.hpp"
#include <zlib.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <regex>
#include <string>
#include <system_error>
#include <vector>

namespace nslog {

    struct RotateConfig {
        std::string folder;
        std::uint64_t maxSize;
        int maxFiles;
        bool compress;

        RotateConfig()
            : maxSize(10485760)
            , maxFiles(5)
            , compress(false) {}

        RotateConfig(std::string logFolder, std::uint64_t maxBytes, int files, bool gzip)
            : folder(std::move(logFolder))
            , maxSize(maxBytes)
            , maxFiles(files)
            , compress(gzip) {}
    };

    namespace detail {
        /// ISO-8601 UTC with ':' and '.' replaced by '-', e.g.
        /// 2024-01-01T12-00-00-000Z.
        inline std::string archiveTimestamp(const std::chrono::system_clock::time_point& now) {
            std::string ts = isoTimestamp(now);
            std::replace(ts.begin(), ts.end(), ':', '-');
            std::replace(ts.begin(), ts.end(), '.', '-');
            return ts;
        }

        /// Timestamp part of an archive name, empty when @p name is not an
        /// archive.
        inline std::string archiveTimestampOf(const std::string& name) {
            static const std::regex kArchivePattern(
                "\\.(\\d{4}-\\d{2}-\\d{2}T\\d{2}-\\d{2}-\\d{2}.*Z)(\\.gz)?$");
            std::smatch match;
            if (!std::regex_search(name, match, kArchivePattern)) return std::string();
            return match[1].str();
        }

        /// gzip @p source into @p target with zlib.
        inline void gzipFile(const std::string& source, const std::string& target) {
            std::FILE* in = std::fopen(source.c_str(), "rb");
            if (!in) throw systemError(errno, "open " + source);

            gzFile out = gzopen(target.c_str(), "wb");
            if (!out) {
                int err = errno ? errno : EIO;
                std::fclose(in);
                throw systemError(err, "gzopen " + target);
            }

            char buf[16384];
            size_t n;
            bool failed = false;
            while ((n = std::fread(buf, 1, sizeof(buf), in)) > 0) {
                if (gzwrite(out, buf, static_cast<unsigned>(n)) != static_cast<int>(n)) {
                    failed = true;
                    break;
                }
            }
            if (std::ferror(in)) failed = true;
            std::fclose(in);
            if (gzclose(out) != Z_OK) failed = true;
            if (failed) {
                std::remove(target.c_str());
                throw systemError(EIO, "gzip " + source);
            }
        }
    } // namespace detail

    /// Delete archives in @p folder beyond config.maxFiles, newest kept.
    /// Returns the deleted paths. Throws LoggerError(LOG_CLEANUP_FAILED).
    inline std::vector<std::string> cleanupOldArchives(const std::string& folder,
                                                       const RotateConfig& config,
                                                       IFileSystem& fs) {
        try {
            std::vector<std::string> names = fs.listDirectory(folder);

            std::vector<std::pair<std::string, std::string> > archives; // (timestamp, name)
            for (size_t i = 0; i < names.size(); ++i) {
                std::string ts = detail::archiveTimestampOf(names[i]);
                if (!ts.empty()) archives.push_back(std::make_pair(ts, names[i]));
            }
            std::sort(archives.begin(), archives.end(),
                      [](const std::pair<std::string, std::string>& a,
                         const std::pair<std::string, std::string>& b) {
                          return a > b;
                      });

            std::vector<std::string> deleted;
            size_t keep = config.maxFiles > 0 ? static_cast<size_t>(config.maxFiles) : 0;
            for (size_t i = keep; i < archives.size(); ++i) {
                std::string path = detail::joinPath(folder, archives[i].second);
                fs.remove(path);
                deleted.push_back(path);
            }
            return deleted;
        } catch (const std::exception& e) {
            throw createCleanupError(detail::safeWhat(e), &e);
        }
    }

    /// Rotate @p path when it has reached config.maxSize: rename it to
    /// `<path>.<timestamp>`, start an empty file, optionally gzip the
    /// archive, then prune old archives.
    /// Returns false when the file is missing or still small enough.
    /// Throws LoggerError(LOG_ROTATE_FAILED).
    inline bool checkAndRotate(const std::string& path, const RotateConfig& config, IFileSystem& fs,
                               const std::chrono::system_clock::time_point& now =
                                   std::chrono::system_clock::now()) {
        try {
            if (!fs.exists(path)) return false;
            if (fs.fileSize(path) < config.maxSize) return false;

            std::string archivePath = path + "." + detail::archiveTimestamp(now);
            fs.rename(path, archivePath);
            fs.writeFile(path, std::string());

            if (config.compress) {
                detail::gzipFile(archivePath, archivePath + ".gz");
                fs.remove(archivePath);
            }

            std::string folder = config.folder.empty() ? detail::parentPath(path) : config.folder;
            cleanupOldArchives(folder, config, fs);
            return true;
        } catch (const std::exception& e) {
            throw createRotateError(path, detail::safeWhat(e), &e);
        }
    }

    /// Append the content of @p source to @p archive under a run separator,
    /// then rotate the archive (five archives kept). Missing or blank source
    /// files are ignored. Throws LoggerError(LOG_ROTATE_FAILED).
    inline void archiveLogFile(const std::string& source, const std::string& archive, IFileSystem& fs,
                               std::uint64_t maxSize = 10485760,
                               const std::chrono::system_clock::time_point& now =
                                   std::chrono::system_clock::now()) {
        if (!fs.exists(source)) return;

        std::string content;
        try {
            content = fs.readFile(source);
        } catch (const std::exception& e) {
            throw createRotateError(source, detail::safeWhat(e), &e);
        }
        if (detail::trim(content).empty()) return;

        try {
            std::string separator = "\n\n========== Run: " + detail::isoTimestamp(now) + " ==========\n\n";
            fs.appendFile(archive, separator + content);
            checkAndRotate(archive, RotateConfig(detail::parentPath(archive), maxSize, 5, false), fs, now);
        } catch (const std::exception& e) {
            throw createRotateError(archive, detail::safeWhat(e), &e);
        }
    }

} // namespace nslog

#endif // NSLOG_ROTATE_HPP
