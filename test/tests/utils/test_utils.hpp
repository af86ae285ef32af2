#pragma once

#include "nslog.hpp"
#include <memory>
#include <set>
#include <string>
#include <vector>
#include <cstdint>

class TestUtils {
public:
    static std::string readLogFile(const std::string &filename);
    static std::vector<std::string> readLines(const std::string &filename);
    static void writeFile(const std::string &filename, const std::string &content);

    /// Fresh directory under the working directory; removed by removeTree().
    static std::string makeTempDir(const std::string &prefix);
    static void removeTree(const std::string &path);

    static bool fileExists(const std::string &filename);
    static std::uintmax_t getFileSize(const std::string &filename);
    static std::vector<std::string> listDirectory(const std::string &dir);
};

/// Collects every record it receives.
class RecordingSink : public nslog::ISink {
public:
    void write(const nslog::LogRecord &record) override {
        records.push_back(record);
    }

    void flush() override { ++flushCount; }

    std::vector<nslog::LogRecord> records;
    int flushCount = 0;
};

/// Shared-destination sink logger over a RecordingSink, for driving Logger
/// handles without touching real transports.
struct RecordingFixture {
    std::shared_ptr<RecordingSink> sink;
    std::shared_ptr<nslog::SinkLogger> base;

    explicit RecordingFixture(nslog::LogLevel level = nslog::LogLevel::TRACE)
        : sink(std::make_shared<RecordingSink>())
        , base(std::make_shared<nslog::SinkLogger>(sink, level)) {}
};

/// POSIX file system that refuses access to selected directories.
class DenyingFileSystem : public nslog::PosixFileSystem {
public:
    void deny(const std::string &dir) { m_denied.insert(dir); }

    void createDirectories(const std::string &path) override {
        if (m_denied.count(path)) {
            throw nslog::detail::systemError(EACCES, "mkdir " + path);
        }
        nslog::PosixFileSystem::createDirectories(path);
    }

    void checkWritable(const std::string &dir) const override {
        if (m_denied.count(dir)) {
            throw nslog::detail::systemError(EACCES, "access " + dir);
        }
        nslog::PosixFileSystem::checkWritable(dir);
    }

private:
    std::set<std::string> m_denied;
};
