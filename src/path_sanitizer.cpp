#include "filevault/path_sanitizer.hpp"
#include "filevault/errors.hpp"
#include "filevault/logger.hpp"

namespace fs = std::filesystem;

namespace filevault {

PathSanitizer::PathSanitizer(const StorageRoot& root, size_t maxLength)
    : root_(root), maxLength_(maxLength) {}

std::string PathSanitizer::sanitize(const std::string& candidateName) const {
    if (candidateName.empty()) {
        throw InvalidNameError("Filename cannot be empty");
    }

    if (candidateName.size() > maxLength_) {
        throw InvalidNameError("Filename too long");
    }

    for (char c : candidateName) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (c == '/' || c == '\\' || uc < 0x20 || uc == 0x7f) {
            FV_LOG_WARNING("Rejected file name with separator or control character");
            throw InvalidNameError("Invalid filename");
        }
    }

    if (candidateName == "." || candidateName == "..") {
        FV_LOG_WARNING("Path traversal attempt: " + candidateName);
        throw InvalidNameError("Invalid filename");
    }

    if (candidateName.front() == '.') {
        throw InvalidNameError("Hidden files are not allowed");
    }

    fs::path joined = root_.path() / candidateName;
    fs::path normalized = joined.lexically_normal();
    if (normalized.parent_path() != root_.path() || !root_.contains(joined)) {
        FV_LOG_WARNING("Path traversal attempt: " + candidateName);
        throw InvalidNameError("Invalid file path");
    }

    return candidateName;
}

bool PathSanitizer::isSafe(const std::string& candidateName) const {
    try {
        sanitize(candidateName);
        return true;
    } catch (const InvalidNameError&) {
        return false;
    }
}

fs::path PathSanitizer::resolve(const std::string& candidateName) const {
    return root_.path() / sanitize(candidateName);
}

} // namespace filevault
