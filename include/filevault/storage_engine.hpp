#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <set>
#include <string>
#include <vector>
#include "path_sanitizer.hpp"
#include "storage_root.hpp"

namespace filevault {

struct StoredFile {
    std::string storedName;
    std::string originalName;
    uint64_t sizeBytes = 0;
    std::chrono::system_clock::time_point createdAt;

    std::string url(const std::string& baseUrl) const {
        return baseUrl + "/files/" + storedName;
    }
};

struct StorageLimits {
    uint64_t maxFileSize = 500ULL * 1024 * 1024;
    size_t maxNameLength = PathSanitizer::kDefaultMaxLength;
    // Empty allows any extension that is not blocked
    std::set<std::string> allowedExtensions;
    std::set<std::string> blockedExtensions;
    bool blockExecutableContent = true;
};

/**
 * @class StorageEngine
 * @brief Sole owner of the flat directory behind a StorageRoot.
 *
 * Files are streamed into a hidden ".part" file and published with a
 * hard link, which is atomic and refuses to replace an existing entry.
 * Listing metadata comes from lstat, so no sidecar files exist.
 */
class StorageEngine {
public:
    StorageEngine(const StorageRoot& root, StorageLimits limits);

    /**
     * @brief Persist a stream under storedName
     * @param storedName Generated name, must satisfy the stored-name character class
     * @param data Source of the file bytes
     * @param declaredSize Byte count announced by the client
     * @return Metadata of the published file
     * @throws ValidationError when the size or type is not permitted, or the
     *         stream ends before declaredSize bytes arrived
     * @throws StorageError when the directory cannot be written
     */
    StoredFile write(const std::string& storedName, std::istream& data, uint64_t declaredSize);

    std::string read(const std::string& storedName) const;

    std::vector<StoredFile> list() const;

    void remove(const std::string& storedName);

    // Drops ".part" leftovers of an earlier crashed process.
    size_t purgeTemporaryFiles();

    void checkDeclaredSize(uint64_t declaredSize) const;

    void checkExtension(const std::string& name) const;

    const StorageLimits& limits() const { return limits_; }

    const StorageRoot& root() const { return root_; }

private:
    // MZ and ELF headers always count; a "#!" line only for extensions
    // outside the plain-text and source set.
    static bool looksExecutable(const char* data, size_t size, const std::string& extension);

    static bool isTemporaryName(const std::string& name);

    std::filesystem::path temporaryPathFor(const std::string& storedName) const;

    const StorageRoot& root_;
    PathSanitizer sanitizer_;
    StorageLimits limits_;
};

} // namespace filevault
