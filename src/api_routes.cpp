#include "filevault/api_routes.hpp"
#include "filevault/format_utils.hpp"
#include "filevault/logger.hpp"
#include "filevault/multipart.hpp"

#include <chrono>
#include <exception>
#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/stream.hpp>

using json = nlohmann::json;

namespace filevault {

namespace {

    // Converts core errors into responses; anything else is left to HttpServer's 500 path.
    template <typename Handler>
    HttpServer::RequestHandler guarded(Handler handler) {
        return [handler](const HttpRequest& req, HttpResponse& res) {
            try {
                handler(req, res);
            } catch (const FileServiceError& e) {
                res = errorResponse(e);
            }
        };
    }

    using ByteStream = boost::iostreams::stream<boost::iostreams::array_source>;

    // The file bytes are read in place from req.body; FileService authenticates
    // before it looks at anything else, so a missing file part is left to it.
    void handleUpload(FileService& service, const HttpRequest& req, HttpResponse& res) {
        UploadRequest upload;
        ByteStream stream;

        std::string boundary = extractBoundary(req.header("Content-Type"));
        if (!boundary.empty()) {
            std::vector<MultipartPart> parts;
            std::exception_ptr malformed;
            try {
                parts = parseMultipart(req.body, boundary);
            } catch (const ValidationError&) {
                malformed = std::current_exception();
            }

            const MultipartPart* password = findPart(parts, "password");
            upload.secret = password ? std::string(password->data) : requestCredential(req);

            if (malformed) {
                service.authorizeUpload(upload.secret);
                std::rethrow_exception(malformed);
            }

            const MultipartPart* file = findPart(parts, "file");
            if (file != nullptr && file->hasFilename) {
                upload.originalName = file->filename;
                upload.declaredSize = file->data.size();
                stream.open(boost::iostreams::array_source(file->data.data(), file->data.size()));
                upload.stream = &stream;
            }
        } else {
            upload.secret = requestCredential(req);
            upload.originalName = req.header("X-Filename");
            if (upload.originalName.empty()) {
                upload.originalName = req.query("filename");
            }
            upload.declaredSize = req.body.size();
            stream.open(boost::iostreams::array_source(req.body.data(), req.body.size()));
            upload.stream = &stream;
        }

        UploadResult result = service.upload(upload);

        res.setJson({
            {"url", result.url},
            {"filename", result.storedName},
            {"size", result.sizeBytes},
            {"message", "Upload successful"}
        });
    }

    void handleList(FileService& service, const HttpRequest& req, HttpResponse& res) {
        std::vector<FileEntry> entries = service.list(requestCredential(req));

        json files = json::array();
        for (const auto& entry : entries) {
            files.push_back({
                {"name", entry.storedName},
                {"url", entry.url},
                {"size", entry.sizeBytes},
                {"size_formatted", formatFileSize(entry.sizeBytes)},
                {"icon", FileService::iconFor(entry.storedName)},
                {"created", formatIsoTime(entry.createdAt)}
            });
        }

        res.setJson({{"files", files}, {"total", entries.size()}});
    }

    void handleDelete(FileService& service, const HttpRequest& req, HttpResponse& res) {
        auto it = req.pathParams.find("filename");
        std::string filename = it != req.pathParams.end() ? it->second : std::string();

        service.remove(requestCredential(req), filename);
        res.setJson({{"message", "Deleted: " + filename}});
    }

    void handleRead(FileService& service, const HttpRequest& req, HttpResponse& res) {
        auto it = req.pathParams.find("filename");
        std::string filename = it != req.pathParams.end() ? it->second : std::string();

        ReadResult result = service.read(requestCredential(req), filename);

        res.body = std::move(result.content);
        res.headers["Content-Type"] = result.contentType;
        res.headers["X-Content-Type-Options"] = "nosniff";
    }

} // namespace

int statusCodeFor(const FileServiceError& error) {
    switch (error.kind()) {
        case ErrorKind::AUTH:
            return 401;
        case ErrorKind::VALIDATION: {
            auto* validation = dynamic_cast<const ValidationError*>(&error);
            return validation && validation->sizeExceeded() ? 413 : 400;
        }
        case ErrorKind::INVALID_NAME:
            return 400;
        case ErrorKind::NOT_FOUND:
            return 404;
        case ErrorKind::STORAGE:
        default:
            return 500;
    }
}

HttpResponse errorResponse(const FileServiceError& error) {
    HttpResponse response;
    response.setStatus(statusCodeFor(error));
    response.setJson({
        {"error", error.what()},
        {"category", toString(error.kind())},
        {"stage", toString(error.stage())}
    });
    return response;
}

std::string requestCredential(const HttpRequest& request) {
    auto it = request.queryParams.find("password");
    if (it != request.queryParams.end()) {
        return it->second;
    }
    return request.header("X-Upload-Password");
}

void registerRoutes(HttpServer& server, FileService& service, const ServerConfig& config) {
    server.setAllowedOrigin(config.corsAllowOrigin);

    server.addRoute("GET", "/health", [](const HttpRequest&, HttpResponse& res) {
        res.setJson({
            {"status", "healthy"},
            {"version", kVersion},
            {"timestamp", formatIsoTimeUtc(std::chrono::system_clock::now())}
        });
    });

    json info = {
        {"name", "File Server API"},
        {"version", kVersion},
        {"endpoints", {
            {"upload", {{"method", "POST"}, {"path", "/upload"}, {"auth", "password"}}},
            {"list", {{"method", "GET"}, {"path", "/list"}, {"auth", "password"}}},
            {"delete", {{"method", "DELETE"}, {"path", "/delete/{filename}"}, {"auth", "password"}}},
            {"files", {{"method", "GET"}, {"path", "/files/{filename}"},
                       {"auth", config.publicRead ? "none" : "password"}}},
            {"health", {{"method", "GET"}, {"path", "/health"}, {"auth", "none"}}}
        }},
        {"limits", {
            {"max_file_size", config.maxFileSize},
            {"max_file_size_formatted", formatFileSize(config.maxFileSize)}
        }}
    };
    server.addRoute("GET", "/api", [info](const HttpRequest&, HttpResponse& res) {
        res.setJson(info);
    });

    server.addRoute("POST", "/upload", guarded([&service](const HttpRequest& req, HttpResponse& res) {
        handleUpload(service, req, res);
    }));

    server.addRoute("GET", "/list", guarded([&service](const HttpRequest& req, HttpResponse& res) {
        handleList(service, req, res);
    }));

    server.addRoute("DELETE", "/delete/{filename}", guarded([&service](const HttpRequest& req, HttpResponse& res) {
        handleDelete(service, req, res);
    }));

    server.addRoute("GET", "/files/{filename}", guarded([&service](const HttpRequest& req, HttpResponse& res) {
        handleRead(service, req, res);
    }));
}

} // namespace filevault
