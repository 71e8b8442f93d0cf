#pragma once

#include <atomic>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace filevault {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    FATAL
};

const char* toString(LogLevel level);

// Accepts the level names case-insensitively ("warn" is an alias for WARNING).
// Unknown names yield fallback.
LogLevel parseLogLevel(const std::string& name, LogLevel fallback = LogLevel::INFO);

/**
 * @class Logger
 * @brief Process-wide log sink shared by every component.
 *
 * Lines look like "2024-01-02 03:04:05.006 [INFO] message". The optional
 * log file is appended to and rolled over to "<file>.1" once it grows past
 * the configured size. Registered secrets are masked before a line is
 * written anywhere.
 */
class Logger {
public:
    static Logger& getInstance();

    // An empty logFilePath logs to the console only.
    bool initialize(const std::string& logFilePath, LogLevel minLevel = LogLevel::INFO, bool consoleOutput = true);

    void log(LogLevel level, const std::string& message);
    void debug(const std::string& message) { log(LogLevel::DEBUG, message); }
    void info(const std::string& message) { log(LogLevel::INFO, message); }
    void warning(const std::string& message) { log(LogLevel::WARNING, message); }
    void error(const std::string& message) { log(LogLevel::ERROR, message); }
    void fatal(const std::string& message) { log(LogLevel::FATAL, message); }

    // 0 disables rotation.
    void setMaxFileBytes(uint64_t maxBytes);

    static constexpr size_t kMinRedactionLength = 8;

    // Every later occurrence of secret is written as "***". Returns false,
    // registering nothing, for secrets shorter than kMinRedactionLength.
    bool addRedaction(const std::string& secret);

    void close();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string redact(std::string line) const;
    void rotateIfNeeded();
    static std::string currentTimestamp();

    std::mutex logMutex_;
    std::atomic<LogLevel> minLevel_{LogLevel::INFO};
    std::ofstream logFile_;
    std::string logFilePath_;
    uint64_t fileBytes_ = 0;
    uint64_t maxFileBytes_ = 0;
    bool consoleOutput_ = true;
    std::vector<std::string> redactions_;
};

#define FV_LOG_DEBUG(message) filevault::Logger::getInstance().debug(message)
#define FV_LOG_INFO(message) filevault::Logger::getInstance().info(message)
#define FV_LOG_WARNING(message) filevault::Logger::getInstance().warning(message)
#define FV_LOG_ERROR(message) filevault::Logger::getInstance().error(message)
#define FV_LOG_FATAL(message) filevault::Logger::getInstance().fatal(message)

} // namespace filevault
