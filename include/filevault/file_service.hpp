#pragma once

#include <chrono>
#include <cstdint>
#include <istream>
#include <string>
#include <vector>
#include "authenticator.hpp"
#include "name_generator.hpp"
#include "path_sanitizer.hpp"
#include "storage_engine.hpp"

namespace filevault {

struct UploadRequest {
    std::string secret;
    std::string originalName;
    std::istream* stream = nullptr;
    uint64_t declaredSize = 0;
};

struct UploadResult {
    std::string storedName;
    uint64_t sizeBytes = 0;
    std::string url;
};

struct FileEntry {
    std::string storedName;
    uint64_t sizeBytes = 0;
    std::chrono::system_clock::time_point createdAt;
    std::string url;
};

struct ReadResult {
    std::string storedName;
    std::string contentType;
    std::string content;
};

/**
 * @class FileService
 * @brief Runs upload, list, delete and read through authentication,
 *        validation and storage.
 *
 * Every failure surfaces as a FileServiceError subclass whose stage()
 * names the step that rejected the request.
 */
class FileService {
public:
    FileService(const Authenticator& authenticator,
                const PathSanitizer& sanitizer,
                const NameGenerator& nameGenerator,
                StorageEngine& storage,
                std::string baseUrl,
                bool publicRead);

    // Authenticates first; a null stream is then reported as "No file provided".
    UploadResult upload(const UploadRequest& request);

    // The authentication step of upload() on its own, for requests that fail
    // to parse before an UploadRequest can be built.
    void authorizeUpload(const std::string& secret) const;

    std::vector<FileEntry> list(const std::string& secret) const;

    void remove(const std::string& secret, const std::string& targetName);

    // secret is only checked when reads are not public.
    ReadResult read(const std::string& secret, const std::string& targetName) const;

    bool publicRead() const { return publicRead_; }

    const std::string& baseUrl() const { return baseUrl_; }

    static std::string contentTypeFor(const std::string& name);

    // Emoji shown next to a file in listings, by extension.
    static std::string iconFor(const std::string& name);

private:
    void authenticate(const std::string& secret, const char* operation) const;

    const Authenticator& authenticator_;
    const PathSanitizer& sanitizer_;
    const NameGenerator& nameGenerator_;
    StorageEngine& storage_;
    std::string baseUrl_;
    bool publicRead_;
};

} // namespace filevault
