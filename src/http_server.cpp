#include "filevault/http_server.hpp"
#include "filevault/logger.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace filevault {

using boost::asio::ip::tcp;

namespace {

    std::string toLower(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return value;
    }

    std::string trim(std::string_view value) {
        size_t begin = 0;
        size_t end = value.size();
        while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) {
            ++begin;
        }
        while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
            --end;
        }
        return std::string(value.substr(begin, end - begin));
    }

    int hexValue(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    HttpResponse errorResponse(int statusCode, const std::string& message) {
        HttpResponse response;
        response.setStatus(statusCode);
        response.setJson({{"error", message}});
        return response;
    }

} // namespace

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(toLower(name));
    return it != headers.end() ? it->second : std::string();
}

std::string HttpRequest::query(const std::string& name) const {
    auto it = queryParams.find(name);
    return it != queryParams.end() ? it->second : std::string();
}

const char* statusTextFor(int statusCode) {
    switch (statusCode) {
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 411: return "Length Required";
        case 413: return "Payload Too Large";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 503: return "Service Unavailable";
        default:  return "Unknown";
    }
}

void HttpResponse::setStatus(int code) {
    statusCode = code;
    statusText = statusTextFor(code);
}

HttpServer::HttpServer(const std::string& host, unsigned short port, size_t threads, uint64_t maxBodyBytes,
                       size_t maxPending)
    : host_(host), port_(port), maxBodyBytes_(maxBodyBytes), threadCount_(threads), maxPending_(maxPending) {
    ioService_ = std::make_unique<boost::asio::io_service>();
}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start() {
    if (running_) {
        FV_LOG_WARNING("Server is already running");
        return false;
    }

    try {
        tcp::endpoint endpoint(boost::asio::ip::make_address(host_), port_);
        acceptor_ = std::make_unique<tcp::acceptor>(*ioService_);
        acceptor_->open(endpoint.protocol());
        acceptor_->set_option(tcp::acceptor::reuse_address(true));
        acceptor_->bind(endpoint);
        acceptor_->listen();

        port_ = acceptor_->local_endpoint().port();
        workers_ = std::make_unique<ThreadPool>(threadCount_, maxPending_);
        running_ = true;

        serverThread_ = std::make_unique<std::thread>([this]() {
            FV_LOG_INFO("Server listening on " + host_ + ":" + std::to_string(port_) + " with " +
                        std::to_string(workers_->getThreadCount()) + " workers");

            try {
                while (running_) {
                    acceptConnection();
                }
            } catch (const std::exception& e) {
                if (running_) { // Only log if not stopping deliberately
                    FV_LOG_ERROR("Server thread exception: " + std::string(e.what()));
                    running_ = false;
                }
            }

            FV_LOG_INFO("Server thread stopped");
        });

        return true;
    } catch (const std::exception& e) {
        FV_LOG_ERROR("Failed to start server on " + host_ + ":" + std::to_string(port_) + ": " + e.what());
        running_ = false;
        return false;
    }
}

void HttpServer::stop() {
    if (!serverThread_) {
        return;
    }

    FV_LOG_INFO("Stopping server");
    running_ = false;

    if (acceptor_ && acceptor_->is_open()) {
        boost::system::error_code ec;

        // A blocking accept() is not woken by close() on Linux; connect once to release it
        tcp::endpoint local = acceptor_->local_endpoint(ec);
        if (!ec) {
            if (local.address().is_unspecified()) {
                local.address(local.address().is_v6()
                                  ? boost::asio::ip::address(boost::asio::ip::address_v6::loopback())
                                  : boost::asio::ip::address(boost::asio::ip::address_v4::loopback()));
            }
            tcp::socket wake(*ioService_);
            wake.connect(local, ec);
            wake.close(ec);
        }

        acceptor_->close(ec);
    }

    if (ioService_) {
        ioService_->stop();
    }

    if (serverThread_->joinable()) {
        serverThread_->join();
    }
    serverThread_.reset();

    // Lets in-flight requests finish
    if (workers_) {
        workers_->shutdown();
        workers_.reset();
    }

    FV_LOG_INFO("Server stopped");
}

void HttpServer::addRoute(const std::string& method, const std::string& path, RequestHandler handler) {
    if (path.find('{') != std::string::npos) {
        patternRoutes_[method].push_back(PatternRoute{splitPath(path), std::move(handler)});
    } else {
        routes_[method][path] = std::move(handler);
    }
    FV_LOG_DEBUG("Added route: " + method + " " + path);
}

bool HttpServer::isRunning() const {
    return running_;
}

void HttpServer::acceptConnection() {
    auto socket = std::make_shared<tcp::socket>(*ioService_);
    acceptor_->accept(*socket);

    bool queued = workers_->tryPost([this, socket]() {
        handleClient(*socket);
        boost::system::error_code ec;
        socket->shutdown(tcp::socket::shutdown_both, ec);
        socket->close(ec);
    });

    if (!queued) {
        FV_LOG_WARNING("All workers busy (" + std::to_string(workers_->getActiveThreadCount()) + " active, " +
                       std::to_string(workers_->getQueueSize()) + "/" + std::to_string(workers_->getMaxQueued()) +
                       " queued), refusing connection");
        reject(*socket, 503, "Server busy");
        boost::system::error_code ec;
        socket->shutdown(tcp::socket::shutdown_both, ec);
        socket->close(ec);
    }
}

void HttpServer::handleClient(tcp::socket& socket) {
    try {
        boost::asio::streambuf buffer(kMaxHeaderBytes);
        boost::system::error_code error;

        boost::asio::read_until(socket, buffer, "\r\n\r\n", error);

        if (error == boost::asio::error::not_found) {
            reject(socket, 431, "Request headers too large");
            return;
        }
        if (error) {
            FV_LOG_DEBUG("Error reading request: " + error.message());
            return;
        }

        std::string requestStr(
            boost::asio::buffers_begin(buffer.data()),
            boost::asio::buffers_begin(buffer.data()) + buffer.size()
        );

        HttpRequest request = parseRequest(requestStr);
        if (request.method.empty() || request.path.empty()) {
            reject(socket, 400, "Malformed request");
            return;
        }

        // Bodies are framed by Content-Length only
        if (!request.header("Transfer-Encoding").empty()) {
            FV_LOG_WARNING("Refused " + request.method + " " + request.path + " with Transfer-Encoding: " +
                           request.header("Transfer-Encoding"));
            reject(socket, 501, "Transfer-Encoding is not supported, send Content-Length");
            return;
        }

        std::string contentLengthHeader = request.header("Content-Length");
        if (contentLengthHeader.empty() && (request.method == "POST" || request.method == "PUT")) {
            reject(socket, 411, "Content-Length required");
            return;
        }
        if (!contentLengthHeader.empty()) {
            uint64_t contentLength = 0;
            try {
                size_t consumed = 0;
                contentLength = std::stoull(contentLengthHeader, &consumed);
                if (consumed != contentLengthHeader.size()) {
                    throw std::invalid_argument(contentLengthHeader);
                }
            } catch (const std::exception&) {
                reject(socket, 400, "Invalid Content-Length");
                return;
            }

            if (contentLength > maxBodyBytes_) {
                FV_LOG_WARNING("Rejected request body of " + std::to_string(contentLength) + " bytes");
                reject(socket, 413, "File too large");
                return;
            }

            size_t headerSize = requestStr.find("\r\n\r\n") + 4;
            request.body = requestStr.substr(headerSize);

            if (request.body.size() > contentLength) {
                request.body.resize(static_cast<size_t>(contentLength));
            } else if (request.body.size() < contentLength) {
                size_t alreadyRead = request.body.size();
                size_t remaining = static_cast<size_t>(contentLength) - alreadyRead;
                request.body.resize(static_cast<size_t>(contentLength));

                size_t bytesRead = boost::asio::read(
                    socket,
                    boost::asio::buffer(&request.body[alreadyRead], remaining),
                    boost::asio::transfer_exactly(remaining),
                    error
                );

                if (bytesRead < remaining) {
                    // Client went away mid-body; nothing reaches the handlers
                    FV_LOG_WARNING("Client disconnected after " + std::to_string(alreadyRead + bytesRead) +
                                   " of " + std::to_string(contentLength) + " body bytes: " + error.message());
                    return;
                }
            }
        }

        HttpResponse response = handleRequest(std::move(request));
        sendResponse(socket, response);
    } catch (const std::exception& e) {
        FV_LOG_ERROR("Exception handling client: " + std::string(e.what()));
    }
}

HttpResponse HttpServer::handleRequest(HttpRequest request) const {
    if (request.method == "OPTIONS" && !allowedOrigin_.empty()) {
        return preflightResponse(request);
    }

    RequestHandler handler = findHandler(request.method, request.path, request.pathParams);

    HttpResponse response;
    if (handler) {
        try {
            handler(request, response);
        } catch (const std::exception& e) {
            FV_LOG_ERROR("Exception in request handler for " + request.method + " " + request.path +
                         ": " + e.what());
            response = errorResponse(500, "Internal server error");
        }
    } else {
        response = errorResponse(404, "Resource not found");
    }

    applyCors(response);
    FV_LOG_DEBUG(request.method + " " + request.path + " -> " + std::to_string(response.statusCode));
    return response;
}

void HttpServer::applyCors(HttpResponse& response) const {
    if (allowedOrigin_.empty()) {
        return;
    }
    response.headers["Access-Control-Allow-Origin"] = allowedOrigin_;
    if (allowedOrigin_ != "*") {
        response.headers["Vary"] = "Origin";
    }
}

HttpResponse HttpServer::preflightResponse(const HttpRequest& request) const {
    HttpResponse response;
    response.setStatus(204);
    applyCors(response);

    response.headers["Access-Control-Allow-Methods"] = "GET, POST, DELETE, OPTIONS";
    std::string requested = request.header("Access-Control-Request-Headers");
    response.headers["Access-Control-Allow-Headers"] =
        requested.empty() ? "Content-Type, X-Upload-Password, X-Filename" : requested;
    response.headers["Access-Control-Max-Age"] = "600";

    FV_LOG_DEBUG("Preflight for " + request.path);
    return response;
}

void HttpServer::reject(tcp::socket& socket, int statusCode, const std::string& message) {
    HttpResponse response = errorResponse(statusCode, message);
    applyCors(response);
    sendResponse(socket, response);
}

HttpRequest HttpServer::parseRequest(const std::string& requestStr) {
    HttpRequest request;

    size_t headEnd = requestStr.find("\r\n\r\n");
    std::string_view head(requestStr.data(), headEnd == std::string::npos ? requestStr.size() : headEnd);

    size_t lineStart = 0;
    bool requestLine = true;
    while (lineStart <= head.size()) {
        size_t lineEnd = head.find('\n', lineStart);
        std::string_view line = head.substr(lineStart, lineEnd == std::string_view::npos ? std::string_view::npos
                                                                                         : lineEnd - lineStart);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        if (requestLine) {
            // METHOD SP target SP version
            std::istringstream fields{std::string(line)};
            fields >> request.method >> request.path >> request.version;
            requestLine = false;
        } else if (!line.empty()) {
            size_t colon = line.find(':');
            if (colon != std::string_view::npos) {
                std::string name = toLower(trim(line.substr(0, colon)));
                if (!name.empty()) {
                    request.headers[name] = trim(line.substr(colon + 1));
                }
            }
        }

        if (lineEnd == std::string_view::npos) {
            break;
        }
        lineStart = lineEnd + 1;
    }

    size_t queryStart = request.path.find('?');
    if (queryStart != std::string::npos) {
        request.queryParams = parseQueryParams(request.path.substr(queryStart + 1));
        request.path.erase(queryStart);
    }

    return request;
}

std::unordered_map<std::string, std::string> HttpServer::parseQueryParams(const std::string& queryString) {
    std::unordered_map<std::string, std::string> params;

    size_t pos = 0;
    while (pos <= queryString.size()) {
        size_t amp = queryString.find('&', pos);
        std::string pair = queryString.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);

        if (!pair.empty()) {
            size_t equals = pair.find('=');
            std::string key = urlDecode(pair.substr(0, equals));
            std::string value = equals == std::string::npos ? std::string() : urlDecode(pair.substr(equals + 1));
            // First occurrence wins
            params.emplace(std::move(key), std::move(value));
        }

        if (amp == std::string::npos) {
            break;
        }
        pos = amp + 1;
    }

    return params;
}

std::string HttpServer::urlDecode(const std::string& value, bool plusAsSpace) {
    std::string decoded;
    decoded.reserve(value.size());

    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '%' && i + 2 < value.size()) {
            int high = hexValue(value[i + 1]);
            int low = hexValue(value[i + 2]);
            if (high >= 0 && low >= 0) {
                decoded += static_cast<char>((high << 4) | low);
                i += 2;
                continue;
            }
        }
        if (c == '+' && plusAsSpace) {
            decoded += ' ';
        } else {
            decoded += c;
        }
    }

    return decoded;
}

void HttpServer::sendResponse(tcp::socket& socket, const HttpResponse& response) {
    std::stringstream ss;

    ss << "HTTP/1.1 " << response.statusCode << " " << response.statusText << "\r\n";
    ss << "Content-Length: " << response.body.size() << "\r\n";
    ss << "Connection: close\r\n";

    for (const auto& header : response.headers) {
        ss << header.first << ": " << header.second << "\r\n";
    }

    ss << "\r\n";

    std::string head = ss.str();
    std::vector<boost::asio::const_buffer> buffers{
        boost::asio::buffer(head),
        boost::asio::buffer(response.body)
    };

    boost::system::error_code ec;
    boost::asio::write(socket, buffers, ec);
    if (ec) {
        FV_LOG_DEBUG("Failed to send response: " + ec.message());
    }
}

HttpServer::RequestHandler HttpServer::findHandler(const std::string& method, const std::string& path,
                                                   std::unordered_map<std::string, std::string>& pathParams) const {
    auto methodIt = routes_.find(method);
    if (methodIt != routes_.end()) {
        auto pathIt = methodIt->second.find(path);
        if (pathIt != methodIt->second.end()) {
            return pathIt->second;
        }
    }

    auto patternIt = patternRoutes_.find(method);
    if (patternIt == patternRoutes_.end()) {
        return nullptr;
    }

    std::vector<std::string> segments = splitPath(path);
    for (const auto& route : patternIt->second) {
        if (route.segments.size() != segments.size()) {
            continue;
        }

        std::unordered_map<std::string, std::string> captured;
        bool matched = true;
        for (size_t i = 0; i < segments.size(); ++i) {
            const std::string& expected = route.segments[i];
            if (expected.size() > 2 && expected.front() == '{' && expected.back() == '}') {
                captured[expected.substr(1, expected.size() - 2)] = urlDecode(segments[i], false);
            } else if (expected != segments[i]) {
                matched = false;
                break;
            }
        }

        if (matched) {
            pathParams = std::move(captured);
            return route.handler;
        }
    }

    return nullptr;
}

std::vector<std::string> HttpServer::splitPath(const std::string& path) {
    std::vector<std::string> segments;
    std::istringstream stream(path);
    std::string segment;

    while (std::getline(stream, segment, '/')) {
        if (!segment.empty()) {
            segments.push_back(segment);
        }
    }

    return segments;
}

} // namespace filevault
