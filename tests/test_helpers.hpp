#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>
#include "filevault/logger.hpp"
#include "filevault/name_generator.hpp"

namespace filevault {
namespace test {

// Unique scratch directory removed on destruction.
class TempDir {
public:
    TempDir() {
        path_ = std::filesystem::temp_directory_path() /
            ("filevault_test_" +
             std::to_string(std::chrono::system_clock::now().time_since_epoch().count()) + "_" +
             NameGenerator::randomToken(4));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::string str() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

// Console only, FATAL and above.
inline void quietLogs() {
    Logger::getInstance().initialize("", LogLevel::FATAL);
}

// Every entry in dir, hidden ones included.
inline std::vector<std::string> allEntries(const std::filesystem::path& dir) {
    std::vector<std::string> names;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        names.push_back(entry.path().filename().string());
    }
    return names;
}

inline void writeFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

inline std::string binaryPayload(size_t size) {
    std::string data(size, '\0');
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<char>((i * 131 + 7) % 256);
    }
    // Keep clear of executable magic numbers
    if (size > 0) {
        data[0] = '%';
    }
    return data;
}

} // namespace test
} // namespace filevault
