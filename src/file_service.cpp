#include "filevault/file_service.hpp"
#include "filevault/errors.hpp"
#include "filevault/format_utils.hpp"
#include "filevault/logger.hpp"

#include <unordered_map>

namespace filevault {

FileService::FileService(const Authenticator& authenticator,
                         const PathSanitizer& sanitizer,
                         const NameGenerator& nameGenerator,
                         StorageEngine& storage,
                         std::string baseUrl,
                         bool publicRead)
    : authenticator_(authenticator),
      sanitizer_(sanitizer),
      nameGenerator_(nameGenerator),
      storage_(storage),
      baseUrl_(std::move(baseUrl)),
      publicRead_(publicRead) {}

void FileService::authenticate(const std::string& secret, const char* operation) const {
    if (!authenticator_.verify(secret)) {
        FV_LOG_WARNING(std::string(operation) + " attempt with wrong password");
        throw AuthError();
    }
}

void FileService::authorizeUpload(const std::string& secret) const {
    authenticate(secret, "Upload");
}

UploadResult FileService::upload(const UploadRequest& request) {
    authenticate(request.secret, "Upload");

    if (request.stream == nullptr) {
        throw ValidationError("No file provided");
    }
    if (request.originalName.empty()) {
        throw ValidationError("Filename cannot be empty");
    }
    if (!sanitizer_.isSafe(request.originalName)) {
        // Only the extension and a filtered fragment are kept, so this is informational
        FV_LOG_DEBUG("Original file name failed sanitization, deriving stored name only");
    }

    storage_.checkDeclaredSize(request.declaredSize);
    storage_.checkExtension(request.originalName);

    // Fresh name per upload; identical original names never overwrite each other
    std::string storedName = nameGenerator_.generate(request.originalName);

    StoredFile stored = storage_.write(storedName, *request.stream, request.declaredSize);
    stored.originalName = request.originalName;

    FV_LOG_INFO("File uploaded: " + stored.storedName + " (" + formatFileSize(stored.sizeBytes) + ")");

    UploadResult result;
    result.storedName = stored.storedName;
    result.sizeBytes = stored.sizeBytes;
    result.url = stored.url(baseUrl_);
    return result;
}

std::vector<FileEntry> FileService::list(const std::string& secret) const {
    authenticate(secret, "List");

    std::vector<FileEntry> entries;
    for (const auto& stored : storage_.list()) {
        FileEntry entry;
        entry.storedName = stored.storedName;
        entry.sizeBytes = stored.sizeBytes;
        entry.createdAt = stored.createdAt;
        entry.url = stored.url(baseUrl_);
        entries.push_back(std::move(entry));
    }

    return entries;
}

void FileService::remove(const std::string& secret, const std::string& targetName) {
    authenticate(secret, "Delete");

    std::string safeName = sanitizer_.sanitize(targetName);
    storage_.remove(safeName);

    FV_LOG_INFO("File deleted: " + safeName);
}

ReadResult FileService::read(const std::string& secret, const std::string& targetName) const {
    if (!publicRead_) {
        authenticate(secret, "Read");
    }

    std::string safeName = sanitizer_.sanitize(targetName);

    ReadResult result;
    result.storedName = safeName;
    result.contentType = contentTypeFor(safeName);
    result.content = storage_.read(safeName);
    return result;
}

std::string FileService::contentTypeFor(const std::string& name) {
    static const std::unordered_map<std::string, std::string> types = {
        {"jpg", "image/jpeg"}, {"jpeg", "image/jpeg"}, {"png", "image/png"},
        {"gif", "image/gif"}, {"webp", "image/webp"}, {"svg", "image/svg+xml"},
        {"bmp", "image/bmp"}, {"ico", "image/x-icon"},
        {"mp4", "video/mp4"}, {"webm", "video/webm"}, {"mov", "video/quicktime"},
        {"mkv", "video/x-matroska"}, {"avi", "video/x-msvideo"},
        {"mp3", "audio/mpeg"}, {"wav", "audio/wav"}, {"ogg", "audio/ogg"},
        {"flac", "audio/flac"}, {"m4a", "audio/mp4"},
        {"pdf", "application/pdf"}, {"txt", "text/plain; charset=utf-8"},
        {"md", "text/markdown; charset=utf-8"}, {"csv", "text/csv"},
        {"json", "application/json"}, {"xml", "application/xml"},
        {"zip", "application/zip"}, {"gz", "application/gzip"}, {"tar", "application/x-tar"},
        {"7z", "application/x-7z-compressed"},
    };

    auto it = types.find(NameGenerator::extractExtension(name));
    if (it != types.end()) {
        return it->second;
    }
    return "application/octet-stream";
}

std::string FileService::iconFor(const std::string& name) {
    static const std::unordered_map<std::string, std::string> icons = {
        {"jpg", "🖼️"}, {"jpeg", "🖼️"}, {"png", "🖼️"}, {"gif", "🖼️"},
        {"webp", "🖼️"}, {"svg", "🖼️"}, {"bmp", "🖼️"}, {"ico", "🖼️"},
        {"mp4", "🎬"}, {"webm", "🎬"}, {"avi", "🎬"}, {"mov", "🎬"},
        {"mkv", "🎬"}, {"flv", "🎬"}, {"wmv", "🎬"},
        {"mp3", "🎵"}, {"wav", "🎵"}, {"ogg", "🎵"}, {"flac", "🎵"},
        {"aac", "🎵"}, {"m4a", "🎵"},
        {"pdf", "📄"}, {"doc", "📄"}, {"docx", "📄"}, {"txt", "📄"},
        {"md", "📄"}, {"rtf", "📄"},
        {"xls", "📊"}, {"xlsx", "📊"}, {"csv", "📊"}, {"ods", "📊"},
        {"ppt", "📽️"}, {"pptx", "📽️"}, {"odp", "📽️"},
        {"zip", "📦"}, {"tar", "📦"}, {"gz", "📦"}, {"bz2", "📦"},
        {"rar", "📦"}, {"7z", "📦"},
        {"html", "🌐"}, {"css", "🎨"}, {"js", "⚡"}, {"ts", "⚡"},
        {"py", "🐍"}, {"java", "☕"}, {"go", "🐹"}, {"rs", "🦀"},
        {"cpp", "🔧"}, {"c", "🔧"}, {"h", "🔧"},
        {"json", "📋"}, {"xml", "📋"}, {"yaml", "📋"}, {"yml", "📋"},
    };

    auto it = icons.find(NameGenerator::extractExtension(name));
    if (it != icons.end()) {
        return it->second;
    }
    return "📎";
}

} // namespace filevault
