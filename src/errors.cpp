#include "filevault/errors.hpp"

namespace filevault {

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::AUTH:         return "auth_error";
        case ErrorKind::VALIDATION:   return "validation_error";
        case ErrorKind::INVALID_NAME: return "invalid_name";
        case ErrorKind::NOT_FOUND:    return "not_found";
        case ErrorKind::STORAGE:      return "storage_error";
        default:                      return "unknown";
    }
}

const char* toString(Stage stage) {
    switch (stage) {
        case Stage::AUTHENTICATION: return "authentication";
        case Stage::VALIDATION:     return "validation";
        case Stage::PERSISTENCE:    return "persistence";
        case Stage::LISTING:        return "listing";
        case Stage::DELETION:       return "deletion";
        case Stage::READING:        return "reading";
        default:                    return "unknown";
    }
}

} // namespace filevault
