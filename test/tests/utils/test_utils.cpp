#include "test_utils.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <cstdio>
#include <cstdlib>

#include <sys/stat.h>
#include <unistd.h>
#include <dirent.h>

std::string TestUtils::readLogFile(const std::string &filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + filename);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::vector<std::string> TestUtils::readLines(const std::string &filename) {
    std::vector<std::string> lines;
    std::istringstream in(readLogFile(filename));
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}

void TestUtils::writeFile(const std::string &filename, const std::string &content) {
    std::ofstream out(filename, std::ios::trunc | std::ios::binary);
    if (!out.is_open()) {
        throw std::runtime_error("Failed to create file: " + filename);
    }
    out << content;
}

std::string TestUtils::makeTempDir(const std::string &prefix) {
    std::string pattern = prefix + "_XXXXXX";
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');
    if (!mkdtemp(buf.data())) {
        throw std::runtime_error("mkdtemp failed for " + prefix);
    }
    return std::string(buf.data());
}

void TestUtils::removeTree(const std::string &path) {
    struct stat st;
    if (lstat(path.c_str(), &st) != 0) return;
    if (S_ISDIR(st.st_mode)) {
        std::vector<std::string> entries = listDirectory(path);
        for (size_t i = 0; i < entries.size(); ++i) {
            removeTree(path + "/" + entries[i]);
        }
        rmdir(path.c_str());
    } else {
        std::remove(path.c_str());
    }
}

bool TestUtils::fileExists(const std::string &filename) {
    struct stat buffer;
    return stat(filename.c_str(), &buffer) == 0;
}

std::uintmax_t TestUtils::getFileSize(const std::string &filename) {
    struct stat buffer;
    if (stat(filename.c_str(), &buffer) != 0) {
        return 0;
    }
    return buffer.st_size;
}

std::vector<std::string> TestUtils::listDirectory(const std::string &dir) {
    std::vector<std::string> entries;
    DIR* d = opendir(dir.c_str());
    if (!d) return entries;
    struct dirent* ent;
    while ((ent = readdir(d)) != nullptr) {
        std::string name = ent->d_name;
        if (name != "." && name != "..") entries.push_back(name);
    }
    closedir(d);
    return entries;
}
