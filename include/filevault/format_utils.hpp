#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace filevault {

// "512 B", "1.5 KB", "2.0 MB", "1.2 GB"
std::string formatFileSize(uint64_t sizeBytes);

// Local time as ISO-8601 without zone, e.g. 2024-05-01T13:45:10
std::string formatIsoTime(std::chrono::system_clock::time_point timePoint);

// UTC as ISO-8601 with a trailing Z
std::string formatIsoTimeUtc(std::chrono::system_clock::time_point timePoint);

} // namespace filevault
