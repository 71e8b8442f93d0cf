#include "filevault/format_utils.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace filevault {

std::string formatFileSize(uint64_t sizeBytes) {
    const double kb = 1024.0;

    std::stringstream ss;
    ss << std::fixed << std::setprecision(1);

    if (sizeBytes < 1024) {
        return std::to_string(sizeBytes) + " B";
    } else if (sizeBytes < 1024ULL * 1024) {
        ss << sizeBytes / kb << " KB";
    } else if (sizeBytes < 1024ULL * 1024 * 1024) {
        ss << sizeBytes / (kb * kb) << " MB";
    } else {
        ss << sizeBytes / (kb * kb * kb) << " GB";
    }

    return ss.str();
}

std::string formatIsoTime(std::chrono::system_clock::time_point timePoint) {
    auto time_t_value = std::chrono::system_clock::to_time_t(timePoint);

    std::tm tm_buf;
    localtime_r(&time_t_value, &tm_buf);

    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    return ss.str();
}

std::string formatIsoTimeUtc(std::chrono::system_clock::time_point timePoint) {
    auto time_t_value = std::chrono::system_clock::to_time_t(timePoint);

    std::tm tm_buf;
    gmtime_r(&time_t_value, &tm_buf);

    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

} // namespace filevault
