#pragma once

#include <filesystem>
#include <string>
#include "storage_root.hpp"

namespace filevault {

/**
 * @class PathSanitizer
 * @brief Gatekeeper for every client-supplied name that touches the storage root
 */
class PathSanitizer {
public:
    static constexpr size_t kDefaultMaxLength = 255;

    PathSanitizer(const StorageRoot& root, size_t maxLength = kDefaultMaxLength);

    /**
     * @brief Validate a candidate file name
     * @param candidateName Name as received from the client
     * @return The same name when it is safe to join with the storage root
     * @throws InvalidNameError for empty, overlong, hidden, separator or
     *         control-character names, and for names that would resolve
     *         outside the root
     */
    std::string sanitize(const std::string& candidateName) const;

    bool isSafe(const std::string& candidateName) const;

    /**
     * @brief Sanitize and join with the storage root
     * @return Absolute path of the entry inside the root
     */
    std::filesystem::path resolve(const std::string& candidateName) const;

private:
    const StorageRoot& root_;
    size_t maxLength_;
};

} // namespace filevault
