#pragma once

#include <string>
#include "config.hpp"
#include "errors.hpp"
#include "file_service.hpp"
#include "http_server.hpp"

namespace filevault {

constexpr const char* kVersion = "1.0.0";

// Maps a core error to its stable status code and JSON body.
HttpResponse errorResponse(const FileServiceError& error);

int statusCodeFor(const FileServiceError& error);

// Password from the "password" query parameter or the X-Upload-Password header.
std::string requestCredential(const HttpRequest& request);

/**
 * @brief Register the public HTTP surface
 *
 * GET /health, GET /api, POST /upload, GET /list,
 * DELETE /delete/{filename}, GET /files/{filename}
 */
void registerRoutes(HttpServer& server, FileService& service, const ServerConfig& config);

} // namespace filevault
