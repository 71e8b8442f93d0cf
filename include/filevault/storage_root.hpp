#pragma once

#include <filesystem>
#include <string>

namespace filevault {

/**
 * @class StorageRoot
 * @brief Handle on the directory that holds every stored file.
 *
 * The directory is created if missing and kept as a canonical absolute
 * path, so later lookups never depend on the working directory.
 */
class StorageRoot {
public:
    explicit StorageRoot(const std::string& directory);

    const std::filesystem::path& path() const { return path_; }

    // True when candidate, after resolving symlinks and "..", is a strict
    // descendant of the root.
    bool contains(const std::filesystem::path& candidate) const;

private:
    std::filesystem::path path_;
};

} // namespace filevault
