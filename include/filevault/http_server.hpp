#pragma once

#include <atomic>
#include <string>
#include <memory>
#include <functional>
#include <thread>
#include <unordered_map>
#include <vector>
#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include "thread_pool.hpp"

namespace filevault {

struct HttpRequest {
    std::string method;
    std::string path;
    std::string version;
    // Header names are stored lowercased
    std::unordered_map<std::string, std::string> headers;
    std::string body;

    std::unordered_map<std::string, std::string> queryParams;
    std::unordered_map<std::string, std::string> pathParams;

    std::string header(const std::string& name) const;

    std::string query(const std::string& name) const;
};

struct HttpResponse {
    int statusCode = 200;
    std::string statusText = "OK";
    std::unordered_map<std::string, std::string> headers;
    std::string body;

    void setStatus(int code);

    void setJson(const nlohmann::json& jsonObj) {
        body = jsonObj.dump();
        headers["Content-Type"] = "application/json";
    }
};

const char* statusTextFor(int statusCode);

class HttpServer {
public:
    using RequestHandler = std::function<void(const HttpRequest&, HttpResponse&)>;

    static constexpr size_t kMaxHeaderBytes = 64 * 1024;

    // maxPending bounds the connections waiting for a worker; 0 means unbounded.
    HttpServer(const std::string& host, unsigned short port, size_t threads, uint64_t maxBodyBytes,
               size_t maxPending = 0);

    ~HttpServer();

    bool start();

    void stop();

    /**
     * @brief Register a handler
     * @param method HTTP method, e.g. "GET"
     * @param path Literal path or a pattern with "{name}" segments such as
     *             "/files/{filename}"; matched segments land in pathParams
     */
    void addRoute(const std::string& method, const std::string& path, RequestHandler handler);

    bool isRunning() const;

    // Value sent as Access-Control-Allow-Origin; empty disables CORS and OPTIONS preflight handling.
    void setAllowedOrigin(const std::string& origin) { allowedOrigin_ = origin; }

    const std::string& allowedOrigin() const { return allowedOrigin_; }

    unsigned short port() const { return port_; }

    // Routes an already parsed request; exposed so routing can be driven without a socket.
    HttpResponse handleRequest(HttpRequest request) const;

    static HttpRequest parseRequest(const std::string& requestStr);

    static std::unordered_map<std::string, std::string> parseQueryParams(const std::string& queryString);

    static std::string urlDecode(const std::string& value, bool plusAsSpace = true);

private:
    struct PatternRoute {
        std::vector<std::string> segments;
        RequestHandler handler;
    };

    void acceptConnection();

    void handleClient(boost::asio::ip::tcp::socket& socket);

    void sendResponse(boost::asio::ip::tcp::socket& socket, const HttpResponse& response);

    void reject(boost::asio::ip::tcp::socket& socket, int statusCode, const std::string& message);

    void applyCors(HttpResponse& response) const;

    HttpResponse preflightResponse(const HttpRequest& request) const;

    RequestHandler findHandler(const std::string& method, const std::string& path,
                               std::unordered_map<std::string, std::string>& pathParams) const;

    static std::vector<std::string> splitPath(const std::string& path);

private:
    std::string host_;
    unsigned short port_;
    uint64_t maxBodyBytes_;
    std::unique_ptr<boost::asio::io_service> ioService_;
    std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
    std::unique_ptr<ThreadPool> workers_;
    size_t threadCount_;
    size_t maxPending_;
    std::string allowedOrigin_;

    std::unordered_map<std::string, std::unordered_map<std::string, RequestHandler>> routes_;
    std::unordered_map<std::string, std::vector<PatternRoute>> patternRoutes_;

    std::atomic<bool> running_{false};
    std::unique_ptr<std::thread> serverThread_;
};

} // namespace filevault
