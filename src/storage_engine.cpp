#include "filevault/storage_engine.hpp"
#include "filevault/errors.hpp"
#include "filevault/format_utils.hpp"
#include "filevault/logger.hpp"
#include "filevault/name_generator.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <set>
#include <system_error>
#include <vector>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace filevault {

namespace {

    constexpr size_t kChunkSize = 64 * 1024;
    const std::string kTemporarySuffix = ".part";

    // Stored under these, a shebang line is content rather than a launcher
    const std::set<std::string> kShebangTextExtensions = {
        "txt", "text", "md", "rst", "log", "csv", "conf", "cfg", "ini", "toml", "yaml", "yml", "json",
        "py", "rb", "pl", "js", "ts", "lua", "php", "r", "awk", "sed", "tcl",
    };

    // Removes the temporary name on every exit path. After publication the
    // data stays reachable through the final hard link.
    class TemporaryFileGuard {
    public:
        explicit TemporaryFileGuard(fs::path path) : path_(std::move(path)) {}

        ~TemporaryFileGuard() {
            std::error_code ec;
            fs::remove(path_, ec);
            if (ec) {
                FV_LOG_ERROR("Failed to clean up temporary file " + path_.string() + ": " + ec.message());
            }
        }

        TemporaryFileGuard(const TemporaryFileGuard&) = delete;
        TemporaryFileGuard& operator=(const TemporaryFileGuard&) = delete;

    private:
        fs::path path_;
    };

    // lstat so that symlinks are never followed; only regular files count.
    bool statRegularFile(const fs::path& path, const std::string& name, StoredFile& out) {
        struct stat st;
        if (::lstat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
            return false;
        }

        out.storedName = name;
        out.sizeBytes = static_cast<uint64_t>(st.st_size);
        out.createdAt = std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::seconds(st.st_mtim.tv_sec) + std::chrono::nanoseconds(st.st_mtim.tv_nsec)));
        return true;
    }

} // namespace

StorageEngine::StorageEngine(const StorageRoot& root, StorageLimits limits)
    : root_(root), sanitizer_(root, limits.maxNameLength), limits_(std::move(limits)) {
    FV_LOG_INFO("Storage engine ready at " + root_.path().string() +
                ", max file size " + formatFileSize(limits_.maxFileSize));
}

void StorageEngine::checkDeclaredSize(uint64_t declaredSize) const {
    if (declaredSize > limits_.maxFileSize) {
        throw ValidationError("File too large. Maximum size: " + formatFileSize(limits_.maxFileSize), true);
    }
}

void StorageEngine::checkExtension(const std::string& name) const {
    std::string extension = NameGenerator::extractExtension(name);

    if (!extension.empty() && limits_.blockedExtensions.count(extension) > 0) {
        FV_LOG_WARNING("Blocked file type upload: ." + extension);
        throw ValidationError("File type not allowed: ." + extension);
    }

    if (!limits_.allowedExtensions.empty() && limits_.allowedExtensions.count(extension) == 0) {
        FV_LOG_WARNING("File type outside allow list: '" + extension + "'");
        throw ValidationError(extension.empty() ? "File type not allowed"
                                                : "File type not allowed: ." + extension);
    }
}

StoredFile StorageEngine::write(const std::string& storedName, std::istream& data, uint64_t declaredSize) {
    if (!NameGenerator::isValidStoredName(storedName)) {
        throw InvalidNameError("Invalid filename");
    }
    fs::path finalPath = sanitizer_.resolve(storedName);

    checkDeclaredSize(declaredSize);
    checkExtension(storedName);

    fs::path tempPath = temporaryPathFor(storedName);
    TemporaryFileGuard guard(tempPath);

    std::ofstream outFile(tempPath, std::ios::binary | std::ios::trunc);
    if (!outFile.is_open()) {
        FV_LOG_ERROR("Failed to open temporary file for writing: " + tempPath.string() +
                     ": " + std::strerror(errno));
        throw StorageError("Failed to save file");
    }

    std::vector<char> buffer(kChunkSize);
    uint64_t written = 0;
    bool firstChunk = true;

    while (data) {
        data.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        size_t count = static_cast<size_t>(data.gcount());
        if (count == 0) {
            break;
        }

        if (firstChunk) {
            firstChunk = false;
            if (limits_.blockExecutableContent &&
                looksExecutable(buffer.data(), count, NameGenerator::extractExtension(storedName))) {
                FV_LOG_WARNING("Rejected executable content for " + storedName);
                throw ValidationError("File type not allowed: executable content");
            }
        }

        written += count;
        if (written > limits_.maxFileSize) {
            throw ValidationError("File too large. Maximum size: " + formatFileSize(limits_.maxFileSize), true);
        }
        if (written > declaredSize) {
            throw ValidationError("Upload larger than declared size");
        }

        outFile.write(buffer.data(), static_cast<std::streamsize>(count));
        if (!outFile) {
            FV_LOG_ERROR("Failed to write data to " + tempPath.string() + ": " + std::strerror(errno));
            throw StorageError("Failed to save file");
        }
    }

    if (data.bad() || written < declaredSize) {
        FV_LOG_WARNING("Upload of " + storedName + " interrupted after " + std::to_string(written) +
                       " of " + std::to_string(declaredSize) + " bytes");
        throw ValidationError("Upload incomplete");
    }

    outFile.flush();
    outFile.close();
    if (outFile.fail()) {
        FV_LOG_ERROR("Failed to finish writing " + tempPath.string() + ": " + std::strerror(errno));
        throw StorageError("Failed to save file");
    }

    std::error_code ec;
    fs::create_hard_link(tempPath, finalPath, ec);
    if (ec) {
        if (ec == std::errc::file_exists) {
            FV_LOG_ERROR("Refusing to overwrite existing entry " + storedName);
            throw StorageError("Stored name already in use");
        }
        FV_LOG_ERROR("Failed to publish " + storedName + ": " + ec.message());
        throw StorageError("Failed to save file");
    }

    StoredFile stored;
    if (!statRegularFile(finalPath, storedName, stored)) {
        FV_LOG_ERROR("Published file vanished before it could be inspected: " + storedName);
        throw StorageError("Failed to save file");
    }

    FV_LOG_DEBUG("Published " + storedName + " (" + std::to_string(stored.sizeBytes) + " bytes)");
    return stored;
}

std::string StorageEngine::read(const std::string& storedName) const {
    fs::path filePath = sanitizer_.resolve(storedName);

    StoredFile info;
    if (!statRegularFile(filePath, storedName, info)) {
        throw NotFoundError(Stage::READING);
    }

    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open()) {
        // Deleted between lstat and open
        throw NotFoundError(Stage::READING);
    }

    std::string content;
    content.reserve(static_cast<size_t>(info.sizeBytes));
    content.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());

    if (file.bad()) {
        FV_LOG_ERROR("I/O error while reading " + filePath.string());
        throw StorageError("Failed to read file", Stage::READING);
    }

    return content;
}

std::vector<StoredFile> StorageEngine::list() const {
    std::vector<StoredFile> files;

    std::error_code ec;
    fs::directory_iterator it(root_.path(), ec);
    if (ec) {
        FV_LOG_ERROR("Failed to read directory " + root_.path().string() + ": " + ec.message());
        throw StorageError("Failed to read file list", Stage::LISTING);
    }

    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (name.empty() || name.front() == '.') {
            continue;
        }

        StoredFile info;
        if (statRegularFile(it->path(), name, info)) {
            files.push_back(std::move(info));
        }
    }

    if (ec) {
        FV_LOG_ERROR("Directory iteration failed in " + root_.path().string() + ": " + ec.message());
        throw StorageError("Failed to read file list", Stage::LISTING);
    }

    std::sort(files.begin(), files.end(), [](const StoredFile& a, const StoredFile& b) {
        if (a.createdAt != b.createdAt) {
            return a.createdAt > b.createdAt;
        }
        return a.storedName > b.storedName;
    });

    return files;
}

void StorageEngine::remove(const std::string& storedName) {
    fs::path filePath = sanitizer_.resolve(storedName);

    StoredFile info;
    if (!statRegularFile(filePath, storedName, info)) {
        throw NotFoundError(Stage::DELETION);
    }

    std::error_code ec;
    bool removed = fs::remove(filePath, ec);
    if (ec) {
        FV_LOG_ERROR("Failed to delete " + filePath.string() + ": " + ec.message());
        throw StorageError("Failed to delete file", Stage::DELETION);
    }
    if (!removed) {
        // Lost a race with a concurrent delete
        throw NotFoundError(Stage::DELETION);
    }
}

size_t StorageEngine::purgeTemporaryFiles() {
    size_t purged = 0;

    std::error_code ec;
    fs::directory_iterator it(root_.path(), ec);
    if (ec) {
        FV_LOG_WARNING("Cannot scan storage for temporary files: " + ec.message());
        return 0;
    }

    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (!isTemporaryName(name)) {
            continue;
        }

        std::error_code removeEc;
        if (fs::remove(it->path(), removeEc)) {
            ++purged;
        } else if (removeEc) {
            FV_LOG_WARNING("Failed to remove stale temporary file " + name + ": " + removeEc.message());
        }
    }

    if (purged > 0) {
        FV_LOG_INFO("Removed " + std::to_string(purged) + " stale temporary files");
    }
    return purged;
}

bool StorageEngine::looksExecutable(const char* data, size_t size, const std::string& extension) {
    if (size >= 2 && data[0] == 'M' && data[1] == 'Z') {
        return true;
    }
    if (size >= 4 && std::memcmp(data, "\x7f" "ELF", 4) == 0) {
        return true;
    }
    if (size >= 2 && data[0] == '#' && data[1] == '!') {
        return kShebangTextExtensions.count(extension) == 0;
    }
    return false;
}

bool StorageEngine::isTemporaryName(const std::string& name) {
    return name.size() > kTemporarySuffix.size() + 1 && name.front() == '.' &&
           name.compare(name.size() - kTemporarySuffix.size(), kTemporarySuffix.size(), kTemporarySuffix) == 0;
}

fs::path StorageEngine::temporaryPathFor(const std::string& storedName) const {
    return root_.path() / ("." + storedName + "." + NameGenerator::randomToken(4) + kTemporarySuffix);
}

} // namespace filevault
