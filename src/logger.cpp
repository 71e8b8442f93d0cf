#include "filevault/logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace filevault {

const char* toString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
        case LogLevel::FATAL:   return "FATAL";
    }
    return "UNKNOWN";
}

LogLevel parseLogLevel(const std::string& name, LogLevel fallback) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });

    if (upper == "WARN") {
        return LogLevel::WARNING;
    }
    if (upper == "CRITICAL") {
        return LogLevel::FATAL;
    }
    for (LogLevel level : {LogLevel::DEBUG, LogLevel::INFO, LogLevel::WARNING, LogLevel::ERROR, LogLevel::FATAL}) {
        if (upper == toString(level)) {
            return level;
        }
    }
    return fallback;
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    close();
}

bool Logger::initialize(const std::string& logFilePath, LogLevel minLevel, bool consoleOutput) {
    {
        std::lock_guard<std::mutex> lock(logMutex_);

        if (logFile_.is_open()) {
            logFile_.close();
        }
        logFilePath_.clear();
        fileBytes_ = 0;
        minLevel_ = minLevel;
        consoleOutput_ = consoleOutput;

        if (!logFilePath.empty()) {
            logFile_.open(logFilePath, std::ios::out | std::ios::app);
            if (!logFile_.is_open()) {
                std::cerr << "Logger Error: Failed to open log file: " << logFilePath << std::endl;
                return false;
            }
            logFilePath_ = logFilePath;
            logFile_.seekp(0, std::ios::end);
            std::streamoff existing = logFile_.tellp();
            fileBytes_ = existing > 0 ? static_cast<uint64_t>(existing) : 0;
        }
    }

    log(LogLevel::DEBUG, std::string("Logger initialized, level ") + toString(minLevel));
    return true;
}

void Logger::log(LogLevel level, const std::string& message) {
    if (level < minLevel_.load()) {
        return;
    }

    std::string line = currentTimestamp() + " [" + toString(level) + "] " + message;

    std::lock_guard<std::mutex> lock(logMutex_);
    line = redact(std::move(line));

    if (logFile_.is_open()) {
        logFile_ << line << '\n';
        logFile_.flush();
        fileBytes_ += line.size() + 1;
        rotateIfNeeded();
    }

    if (consoleOutput_) {
        std::ostream& out = level >= LogLevel::ERROR ? std::cerr : std::cout;
        out << line << std::endl;
    }
}

void Logger::setMaxFileBytes(uint64_t maxBytes) {
    std::lock_guard<std::mutex> lock(logMutex_);
    maxFileBytes_ = maxBytes;
}

bool Logger::addRedaction(const std::string& secret) {
    if (secret.size() < kMinRedactionLength) {
        return false;
    }
    std::lock_guard<std::mutex> lock(logMutex_);
    if (std::find(redactions_.begin(), redactions_.end(), secret) == redactions_.end()) {
        redactions_.push_back(secret);
    }
    return true;
}

void Logger::close() {
    std::lock_guard<std::mutex> lock(logMutex_);
    if (logFile_.is_open()) {
        logFile_.close();
    }
    logFilePath_.clear();
}

std::string Logger::redact(std::string line) const {
    for (const auto& secret : redactions_) {
        size_t pos = 0;
        while ((pos = line.find(secret, pos)) != std::string::npos) {
            line.replace(pos, secret.size(), "***");
            pos += 3;
        }
    }
    return line;
}

// Caller holds logMutex_.
void Logger::rotateIfNeeded() {
    if (maxFileBytes_ == 0 || fileBytes_ < maxFileBytes_ || logFilePath_.empty()) {
        return;
    }

    logFile_.close();
    std::string rolled = logFilePath_ + ".1";
    std::remove(rolled.c_str());
    if (std::rename(logFilePath_.c_str(), rolled.c_str()) != 0) {
        std::cerr << "Logger Error: Failed to rotate log file: " << logFilePath_ << std::endl;
    }

    logFile_.open(logFilePath_, std::ios::out | std::ios::app);
    if (!logFile_.is_open()) {
        std::cerr << "Logger Error: Failed to reopen log file: " << logFilePath_ << std::endl;
    }
    fileBytes_ = 0;
}

std::string Logger::currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
       << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

} // namespace filevault
