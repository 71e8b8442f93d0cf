#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <nlohmann/json.hpp>

namespace filevault {

/**
 * @struct ServerConfig
 * @brief Immutable settings resolved once at startup and handed to each component
 */
struct ServerConfig {
    std::string host = "0.0.0.0";
    unsigned short port = 8008;
    size_t threads = 4;
    // Connections allowed to wait for a worker before new ones get 503
    size_t maxPendingConnections = 256;
    std::string baseUrl = "http://localhost:8008";
    // Access-Control-Allow-Origin value; empty turns CORS off
    std::string corsAllowOrigin = "*";

    // Empty means no secret is configured; every authenticated call fails.
    std::string uploadPassword;

    std::string storageDir = "data/file-server";
    uint64_t maxFileSize = 500ULL * 1024 * 1024;
    size_t maxNameLength = 255;
    std::set<std::string> allowedExtensions;
    std::set<std::string> blockedExtensions;
    bool blockExecutableContent = true;
    bool publicRead = true;

    std::string logLevel = "INFO";
    std::string logFile = "logs/server.log";
    uint64_t logMaxFileSize = 10ULL * 1024 * 1024;
};

std::set<std::string> defaultBlockedExtensions();

// Lowercases, trims and strips a leading '.' from each comma-separated entry.
std::set<std::string> parseExtensionList(const std::string& commaSeparated);

/**
 * @class ConfigLoader
 * @brief Collects settings from a JSON file and the environment.
 *
 * Keys are dotted paths into the JSON document ("server.port" reads
 * {"server": {"port": ...}}). Environment variables override file values.
 */
class ConfigLoader {
public:
    ConfigLoader() = default;

    bool loadFromFile(const std::string& configPath);

    bool loadFromString(const std::string& jsonText);

    // Copies recognised environment variables (PORT, UPLOAD_PASSWORD, ...)
    // over the values loaded so far.
    void applyEnvironment();

    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    int64_t getInt(const std::string& key, int64_t defaultValue = 0) const;

    bool getBool(const std::string& key, bool defaultValue = false) const;

    std::set<std::string> getExtensionSet(const std::string& key, const std::set<std::string>& defaultValue) const;

    template <typename T>
    void setValue(const std::string& key, const T& value) {
        config_[toPointer(key)] = value;
    }

    ServerConfig build() const;

private:
    static nlohmann::json::json_pointer toPointer(const std::string& key);

    const nlohmann::json* find(const std::string& key) const;

    nlohmann::json config_ = nlohmann::json::object();
};

} // namespace filevault
