#include "filevault/config.hpp"
#include "filevault/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <sstream>

namespace filevault {

namespace {

    enum class EnvType { STRING, INT, BOOL, LIST };

    struct EnvBinding {
        const char* variable;
        const char* key;
        EnvType type;
    };

    const EnvBinding kEnvBindings[] = {
        {"HOST",                     "server.host",                      EnvType::STRING},
        {"PORT",                     "server.port",                      EnvType::INT},
        {"SERVER_THREADS",           "server.threads",                   EnvType::INT},
        {"MAX_PENDING_CONNECTIONS",  "server.max_pending_connections",   EnvType::INT},
        {"BASE_URL",                 "server.base_url",                  EnvType::STRING},
        {"CORS_ALLOW_ORIGIN",        "server.cors_allow_origin",         EnvType::STRING},
        {"UPLOAD_PASSWORD",          "auth.upload_password",             EnvType::STRING},
        {"STORAGE_DIR",              "storage.dir",                      EnvType::STRING},
        {"MAX_FILE_SIZE",            "storage.max_file_size",            EnvType::INT},
        {"MAX_NAME_LENGTH",          "storage.max_name_length",          EnvType::INT},
        {"ALLOWED_EXTENSIONS",       "storage.allowed_extensions",       EnvType::LIST},
        {"BLOCKED_EXTENSIONS",       "storage.blocked_extensions",       EnvType::LIST},
        {"BLOCK_EXECUTABLE_CONTENT", "storage.block_executable_content", EnvType::BOOL},
        {"PUBLIC_READ",              "storage.public_read",              EnvType::BOOL},
        {"LOG_LEVEL",                "logging.level",                    EnvType::STRING},
        {"LOG_FILE",                 "logging.file",                     EnvType::STRING},
        {"LOG_MAX_FILE_SIZE",        "logging.max_file_size",            EnvType::INT},
    };

    std::string trim(const std::string& value) {
        auto begin = std::find_if(value.begin(), value.end(), [](unsigned char ch) {
            return !std::isspace(ch);
        });
        auto end = std::find_if(value.rbegin(), value.rend(), [](unsigned char ch) {
            return !std::isspace(ch);
        }).base();
        return begin < end ? std::string(begin, end) : std::string();
    }

    std::string toLower(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return value;
    }

    bool parseBool(const std::string& text, bool& out) {
        std::string lowered = toLower(trim(text));
        if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on") {
            out = true;
            return true;
        }
        if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off") {
            out = false;
            return true;
        }
        return false;
    }

    std::string normalizeExtension(const std::string& raw) {
        std::string ext = toLower(trim(raw));
        if (!ext.empty() && ext.front() == '.') {
            ext.erase(0, 1);
        }
        return ext;
    }

} // namespace

std::set<std::string> defaultBlockedExtensions() {
    return {"exe", "dll", "bat", "cmd", "sh", "ps1", "msi", "scr",
            "com", "vbs", "vbe", "wsf", "jar", "war", "ear"};
}

std::set<std::string> parseExtensionList(const std::string& commaSeparated) {
    std::set<std::string> result;
    std::istringstream stream(commaSeparated);
    std::string item;

    while (std::getline(stream, item, ',')) {
        std::string ext = normalizeExtension(item);
        if (!ext.empty()) {
            result.insert(ext);
        }
    }

    return result;
}

bool ConfigLoader::loadFromFile(const std::string& configPath) {
    std::ifstream configFile(configPath);
    if (!configFile.is_open()) {
        FV_LOG_ERROR("Could not open config file: " + configPath);
        return false;
    }

    try {
        nlohmann::json parsed;
        configFile >> parsed;
        if (!parsed.is_object()) {
            FV_LOG_ERROR("Config file must contain a JSON object: " + configPath);
            return false;
        }
        config_.merge_patch(parsed);
        return true;
    } catch (const nlohmann::json::exception& e) {
        FV_LOG_ERROR("Failed to parse config JSON: " + std::string(e.what()));
        return false;
    }
}

bool ConfigLoader::loadFromString(const std::string& jsonText) {
    try {
        nlohmann::json parsed = nlohmann::json::parse(jsonText);
        if (!parsed.is_object()) {
            return false;
        }
        config_.merge_patch(parsed);
        return true;
    } catch (const nlohmann::json::exception& e) {
        FV_LOG_ERROR("Failed to parse config JSON: " + std::string(e.what()));
        return false;
    }
}

void ConfigLoader::applyEnvironment() {
    for (const auto& binding : kEnvBindings) {
        const char* raw = std::getenv(binding.variable);
        if (raw == nullptr) {
            continue;
        }

        std::string value(raw);
        switch (binding.type) {
            case EnvType::STRING:
                setValue(binding.key, value);
                break;
            case EnvType::INT:
                try {
                    std::string digits = trim(value);
                    size_t consumed = 0;
                    long long parsed = std::stoll(digits, &consumed);
                    if (consumed != digits.size()) {
                        throw std::invalid_argument(value);
                    }
                    setValue(binding.key, static_cast<int64_t>(parsed));
                } catch (const std::exception&) {
                    FV_LOG_WARNING(std::string("Ignoring non-numeric ") + binding.variable + "=" + value);
                }
                break;
            case EnvType::BOOL: {
                bool flag = false;
                if (parseBool(value, flag)) {
                    setValue(binding.key, flag);
                } else {
                    FV_LOG_WARNING(std::string("Ignoring non-boolean ") + binding.variable + "=" + value);
                }
                break;
            }
            case EnvType::LIST: {
                nlohmann::json list = nlohmann::json::array();
                for (const auto& ext : parseExtensionList(value)) {
                    list.push_back(ext);
                }
                setValue(binding.key, list);
                break;
            }
        }
    }
}

nlohmann::json::json_pointer ConfigLoader::toPointer(const std::string& key) {
    std::string pointer = "/" + key;
    std::replace(pointer.begin(), pointer.end(), '.', '/');
    return nlohmann::json::json_pointer(pointer);
}

const nlohmann::json* ConfigLoader::find(const std::string& key) const {
    auto pointer = toPointer(key);
    if (!config_.contains(pointer)) {
        return nullptr;
    }
    return &config_.at(pointer);
}

std::string ConfigLoader::getString(const std::string& key, const std::string& defaultValue) const {
    const nlohmann::json* value = find(key);
    if (value && value->is_string()) {
        return value->get<std::string>();
    }
    return defaultValue;
}

int64_t ConfigLoader::getInt(const std::string& key, int64_t defaultValue) const {
    const nlohmann::json* value = find(key);
    if (value && value->is_number_integer()) {
        return value->get<int64_t>();
    }
    return defaultValue;
}

bool ConfigLoader::getBool(const std::string& key, bool defaultValue) const {
    const nlohmann::json* value = find(key);
    if (!value) {
        return defaultValue;
    }
    if (value->is_boolean()) {
        return value->get<bool>();
    }
    bool flag = defaultValue;
    if (value->is_string() && parseBool(value->get<std::string>(), flag)) {
        return flag;
    }
    return defaultValue;
}

std::set<std::string> ConfigLoader::getExtensionSet(const std::string& key,
                                                    const std::set<std::string>& defaultValue) const {
    const nlohmann::json* value = find(key);
    if (!value) {
        return defaultValue;
    }
    if (value->is_string()) {
        return parseExtensionList(value->get<std::string>());
    }
    if (!value->is_array()) {
        return defaultValue;
    }

    std::set<std::string> result;
    for (const auto& item : *value) {
        if (item.is_string()) {
            std::string ext = normalizeExtension(item.get<std::string>());
            if (!ext.empty()) {
                result.insert(ext);
            }
        }
    }
    return result;
}

ServerConfig ConfigLoader::build() const {
    ServerConfig config;

    config.host = getString("server.host", config.host);

    int64_t port = getInt("server.port", config.port);
    if (port <= 0 || port > 65535) {
        FV_LOG_WARNING("Invalid server.port " + std::to_string(port) + ", using " + std::to_string(config.port));
    } else {
        config.port = static_cast<unsigned short>(port);
    }

    int64_t threads = getInt("server.threads", static_cast<int64_t>(config.threads));
    config.threads = threads > 0 ? static_cast<size_t>(threads) : 1;

    int64_t pending = getInt("server.max_pending_connections", static_cast<int64_t>(config.maxPendingConnections));
    config.maxPendingConnections = pending > 0 ? static_cast<size_t>(pending) : 0;

    config.baseUrl = getString("server.base_url", config.baseUrl);
    while (!config.baseUrl.empty() && config.baseUrl.back() == '/') {
        config.baseUrl.pop_back();
    }

    config.corsAllowOrigin = getString("server.cors_allow_origin", config.corsAllowOrigin);

    config.uploadPassword = getString("auth.upload_password", "");

    config.storageDir = getString("storage.dir", config.storageDir);

    int64_t maxFileSize = getInt("storage.max_file_size", static_cast<int64_t>(config.maxFileSize));
    if (maxFileSize <= 0) {
        FV_LOG_WARNING("Invalid storage.max_file_size, using default");
    } else {
        config.maxFileSize = static_cast<uint64_t>(maxFileSize);
    }

    int64_t maxNameLength = getInt("storage.max_name_length", static_cast<int64_t>(config.maxNameLength));
    if (maxNameLength > 0 && maxNameLength <= 255) {
        config.maxNameLength = static_cast<size_t>(maxNameLength);
    } else {
        FV_LOG_WARNING("storage.max_name_length must be within 1..255, using default");
    }

    config.allowedExtensions = getExtensionSet("storage.allowed_extensions", {});
    config.blockedExtensions = getExtensionSet("storage.blocked_extensions", defaultBlockedExtensions());
    config.blockExecutableContent = getBool("storage.block_executable_content", config.blockExecutableContent);
    config.publicRead = getBool("storage.public_read", config.publicRead);

    config.logLevel = getString("logging.level", config.logLevel);
    config.logFile = getString("logging.file", config.logFile);

    int64_t logMax = getInt("logging.max_file_size", static_cast<int64_t>(config.logMaxFileSize));
    config.logMaxFileSize = logMax > 0 ? static_cast<uint64_t>(logMax) : 0;

    return config;
}

} // namespace filevault
