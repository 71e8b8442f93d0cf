#pragma once

#include <stdexcept>
#include <string>

namespace filevault {

enum class ErrorKind {
    AUTH,
    VALIDATION,
    INVALID_NAME,
    NOT_FOUND,
    STORAGE
};

/**
 * @enum Stage
 * @brief Request stage at which a FileService operation failed
 */
enum class Stage {
    AUTHENTICATION,
    VALIDATION,
    PERSISTENCE,
    LISTING,
    DELETION,
    READING
};

const char* toString(ErrorKind kind);
const char* toString(Stage stage);

/**
 * @class FileServiceError
 * @brief Base of every error the core reports to the transport.
 *
 * what() is safe to show to clients: it never carries absolute paths or
 * system error text. Those go to the log.
 */
class FileServiceError : public std::runtime_error {
public:
    FileServiceError(ErrorKind kind, Stage stage, const std::string& message)
        : std::runtime_error(message), kind_(kind), stage_(stage) {}

    ErrorKind kind() const { return kind_; }
    Stage stage() const { return stage_; }

    void setStage(Stage stage) { stage_ = stage; }

private:
    ErrorKind kind_;
    Stage stage_;
};

class AuthError : public FileServiceError {
public:
    AuthError() : FileServiceError(ErrorKind::AUTH, Stage::AUTHENTICATION, "Invalid password") {}
};

class ValidationError : public FileServiceError {
public:
    explicit ValidationError(const std::string& message, bool sizeExceeded = false)
        : FileServiceError(ErrorKind::VALIDATION, Stage::VALIDATION, message),
          sizeExceeded_(sizeExceeded) {}

    bool sizeExceeded() const { return sizeExceeded_; }

protected:
    ValidationError(ErrorKind kind, const std::string& message)
        : FileServiceError(kind, Stage::VALIDATION, message), sizeExceeded_(false) {}

private:
    bool sizeExceeded_;
};

class InvalidNameError : public ValidationError {
public:
    explicit InvalidNameError(const std::string& message)
        : ValidationError(ErrorKind::INVALID_NAME, message) {}
};

class NotFoundError : public FileServiceError {
public:
    explicit NotFoundError(Stage stage = Stage::READING)
        : FileServiceError(ErrorKind::NOT_FOUND, stage, "File not found") {}
};

class StorageError : public FileServiceError {
public:
    explicit StorageError(const std::string& message, Stage stage = Stage::PERSISTENCE)
        : FileServiceError(ErrorKind::STORAGE, stage, message) {}
};

} // namespace filevault
