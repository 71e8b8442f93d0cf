#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include "filevault/api_routes.hpp"
#include "filevault/authenticator.hpp"
#include "filevault/config.hpp"
#include "filevault/file_service.hpp"
#include "filevault/http_server.hpp"
#include "filevault/logger.hpp"
#include "filevault/name_generator.hpp"
#include "filevault/path_sanitizer.hpp"
#include "filevault/storage_engine.hpp"
#include "filevault/storage_root.hpp"

namespace fs = std::filesystem;

namespace {

std::atomic<bool> g_shutdownRequested{false};

void signalHandler(int) {
    g_shutdownRequested = true;
}

std::string configPathFromArgs(int argc, char* argv[]) {
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            return argv[i + 1];
        }
    }
    return "config/server_config.json";
}

bool setupLogging(const filevault::ServerConfig& config) {
    filevault::LogLevel level = filevault::parseLogLevel(config.logLevel);

    if (!config.logFile.empty()) {
        fs::path logDir = fs::path(config.logFile).parent_path();
        std::error_code ec;
        if (!logDir.empty()) {
            fs::create_directories(logDir, ec);
        }
    }

    filevault::Logger& logger = filevault::Logger::getInstance();
    bool masked = logger.addRedaction(config.uploadPassword);
    logger.setMaxFileBytes(config.logMaxFileSize);
    if (!logger.initialize(config.logFile, level)) {
        return false;
    }

    if (!masked && !config.uploadPassword.empty()) {
        FV_LOG_WARNING("Upload password is shorter than " +
                       std::to_string(filevault::Logger::kMinRedactionLength) +
                       " characters and is not masked in log output");
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        filevault::ConfigLoader loader;
        std::string configPath = configPathFromArgs(argc, argv);

        bool configLoaded = false;
        if (fs::exists(configPath)) {
            configLoaded = loader.loadFromFile(configPath);
        }
        loader.applyEnvironment();
        const filevault::ServerConfig config = loader.build();

        if (!setupLogging(config)) {
            std::cerr << "Falling back to console logging" << std::endl;
            filevault::Logger::getInstance().initialize("", filevault::parseLogLevel(config.logLevel));
        }

        FV_LOG_INFO(std::string("Starting File Server v") + filevault::kVersion);
        if (configLoaded) {
            FV_LOG_INFO("Configuration loaded from " + configPath);
        } else {
            FV_LOG_WARNING("Configuration file not found or unreadable, using defaults and environment");
        }

        filevault::StorageRoot root(config.storageDir);
        FV_LOG_INFO("Storage directory: " + root.path().string());

        filevault::StorageLimits limits;
        limits.maxFileSize = config.maxFileSize;
        limits.maxNameLength = config.maxNameLength;
        limits.allowedExtensions = config.allowedExtensions;
        limits.blockedExtensions = config.blockedExtensions;
        limits.blockExecutableContent = config.blockExecutableContent;

        filevault::StorageEngine storage(root, limits);
        storage.purgeTemporaryFiles();

        filevault::Authenticator authenticator(config.uploadPassword);
        filevault::PathSanitizer sanitizer(root, config.maxNameLength);
        filevault::NameGenerator nameGenerator;
        filevault::FileService service(authenticator, sanitizer, nameGenerator, storage,
                                       config.baseUrl, config.publicRead);

        // Multipart framing adds headers and boundaries around the file itself
        const uint64_t maxBodyBytes = config.maxFileSize + 64 * 1024;
        filevault::HttpServer server(config.host, config.port, config.threads, maxBodyBytes,
                                     config.maxPendingConnections);
        filevault::registerRoutes(server, service, config);

        if (!server.start()) {
            FV_LOG_FATAL("Failed to start server");
            return 1;
        }

        FV_LOG_INFO("Public base URL: " + config.baseUrl + ", public reads " +
                    (config.publicRead ? "enabled" : "disabled"));

        while (server.isRunning() && !g_shutdownRequested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        FV_LOG_INFO("Shutting down File Server");
        server.stop();
        return 0;
    } catch (const std::exception& e) {
        FV_LOG_FATAL("Unhandled exception: " + std::string(e.what()));
        return 1;
    }
}
