#ifndef NSLOG_FILE_SYSTEM_HPP
#define NSLOG_FILE_SYSTEM_HPP

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include <sys/stat.h>
#include <dirent.h>
#include <unistd.h>

namespace nslog {

    /// File system access used by transport validation and rotation.
    /// Failures throw std::system_error carrying the errno value.
    class IFileSystem {
    public:
        virtual ~IFileSystem() = default;

        virtual bool exists(const std::string& path) const = 0;
        virtual bool isDirectory(const std::string& path) const = 0;

        /// mkdir -p.
        virtual void createDirectories(const std::string& path) = 0;

        /// Throws when the current process cannot create files in @p dir.
        virtual void checkWritable(const std::string& dir) const = 0;

        virtual std::uint64_t fileSize(const std::string& path) const = 0;

        /// Entry names (not paths), without "." and "..".
        virtual std::vector<std::string> listDirectory(const std::string& dir) const = 0;

        virtual void rename(const std::string& from, const std::string& to) = 0;
        virtual void remove(const std::string& path) = 0;

        virtual std::string readFile(const std::string& path) const = 0;
        virtual void appendFile(const std::string& path, const std::string& content) = 0;
        virtual void writeFile(const std::string& path, const std::string& content) = 0;
    };

    namespace detail {
        inline std::system_error systemError(int err, const std::string& what) {
            return std::system_error(err, std::generic_category(), what);
        }

        /// Parent directory of a path, "." when it has none.
        inline std::string parentPath(const std::string& path) {
            size_t slashPos = path.find_last_of('/');
            if (slashPos == std::string::npos) return ".";
            if (slashPos == 0) return "/";
            return path.substr(0, slashPos);
        }

        inline std::string joinPath(const std::string& dir, const std::string& name) {
            if (dir.empty() || dir == ".") return name;
            if (dir[dir.size() - 1] == '/') return dir + name;
            return dir + "/" + name;
        }

        inline std::string baseName(const std::string& path) {
            size_t slashPos = path.find_last_of('/');
            return slashPos == std::string::npos ? path : path.substr(slashPos + 1);
        }
    } // namespace detail

    class PosixFileSystem : public IFileSystem {
    public:
        bool exists(const std::string& path) const override {
            struct stat st;
            return stat(path.c_str(), &st) == 0;
        }

        bool isDirectory(const std::string& path) const override {
            struct stat st;
            return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
        }

        void createDirectories(const std::string& path) override {
            if (path.empty()) return;
            struct stat st;
            if (stat(path.c_str(), &st) == 0) {
                if (!S_ISDIR(st.st_mode)) {
                    throw detail::systemError(ENOTDIR, "not a directory: " + path);
                }
                return;
            }

            size_t slashPos = path.find_last_of('/');
            if (slashPos != std::string::npos && slashPos > 0) {
                createDirectories(path.substr(0, slashPos));
            }
            if (mkdir(path.c_str(), 0755) != 0 && errno != EEXIST) {
                throw detail::systemError(errno, "mkdir " + path);
            }
        }

        void checkWritable(const std::string& dir) const override {
            if (access(dir.c_str(), W_OK | X_OK) != 0) {
                throw detail::systemError(errno, "access " + dir);
            }
        }

        std::uint64_t fileSize(const std::string& path) const override {
            struct stat st;
            if (stat(path.c_str(), &st) != 0) {
                throw detail::systemError(errno, "stat " + path);
            }
            return static_cast<std::uint64_t>(st.st_size);
        }

        std::vector<std::string> listDirectory(const std::string& dir) const override {
            std::vector<std::string> entries;
            DIR* d = opendir(dir.c_str());
            if (!d) throw detail::systemError(errno, "opendir " + dir);
            struct dirent* ent;
            while ((ent = readdir(d)) != nullptr) {
                std::string name = ent->d_name;
                if (name != "." && name != "..") {
                    entries.push_back(name);
                }
            }
            closedir(d);
            return entries;
        }

        void rename(const std::string& from, const std::string& to) override {
            if (std::rename(from.c_str(), to.c_str()) != 0) {
                throw detail::systemError(errno, "rename " + from + " -> " + to);
            }
        }

        void remove(const std::string& path) override {
            if (std::remove(path.c_str()) != 0) {
                throw detail::systemError(errno, "remove " + path);
            }
        }

        std::string readFile(const std::string& path) const override {
            std::ifstream in(path.c_str(), std::ios::binary);
            if (!in.is_open()) throw detail::systemError(errno ? errno : ENOENT, "open " + path);
            std::ostringstream oss;
            oss << in.rdbuf();
            return oss.str();
        }

        void appendFile(const std::string& path, const std::string& content) override {
            writeWithMode(path, content, std::ios::app | std::ios::binary);
        }

        void writeFile(const std::string& path, const std::string& content) override {
            writeWithMode(path, content, std::ios::trunc | std::ios::binary);
        }

    private:
        static void writeWithMode(const std::string& path, const std::string& content,
                                  std::ios::openmode mode) {
            std::ofstream out(path.c_str(), std::ios::out | mode);
            if (!out.is_open()) throw detail::systemError(errno ? errno : EIO, "open " + path);
            out << content;
            out.flush();
            if (!out) throw detail::systemError(errno ? errno : EIO, "write " + path);
        }
    };

} // namespace nslog

#endif // NSLOG_FILE_SYSTEM_HPP
