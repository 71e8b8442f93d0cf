#include "filevault/storage_root.hpp"
#include "filevault/errors.hpp"
#include "filevault/logger.hpp"

#include <algorithm>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace filevault {

StorageRoot::StorageRoot(const std::string& directory) {
    if (directory.empty()) {
        throw StorageError("Storage directory is not configured");
    }

    std::error_code ec;
    if (!fs::exists(directory, ec)) {
        FV_LOG_INFO("Storage directory not found, creating: " + directory);
        fs::create_directories(directory, ec);
        if (ec) {
            FV_LOG_ERROR("Failed to create storage directory " + directory + ": " + ec.message());
            throw StorageError("Storage directory unavailable");
        }
    } else if (!fs::is_directory(directory, ec)) {
        FV_LOG_ERROR("Storage path exists but is not a directory: " + directory);
        throw StorageError("Storage directory unavailable");
    }

    path_ = fs::canonical(directory, ec);
    if (ec) {
        FV_LOG_ERROR("Failed to resolve storage directory " + directory + ": " + ec.message());
        throw StorageError("Storage directory unavailable");
    }
}

bool StorageRoot::contains(const fs::path& candidate) const {
    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(candidate, ec);
    if (ec) {
        return false;
    }
    resolved = resolved.lexically_normal();

    auto rootBegin = path_.begin();
    auto rootEnd = path_.end();
    auto candidateIt = resolved.begin();

    // Canonical paths may keep a trailing empty element for "dir/"
    if (rootBegin != rootEnd && std::prev(rootEnd)->empty()) {
        --rootEnd;
    }

    auto mismatch = std::mismatch(rootBegin, rootEnd, candidateIt, resolved.end());
    if (mismatch.first != rootEnd) {
        return false;
    }

    // Must name something below the root, not the root itself
    for (auto it = mismatch.second; it != resolved.end(); ++it) {
        if (!it->empty()) {
            return true;
        }
    }
    return false;
}

} // namespace filevault
