#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "server/auth_middleware.h"

namespace chronodb {

class RocksDBWrapper;
class SeriesStore;
class DatabaseRegistry;
class ContinuousQueryManager;

namespace query {
class QueryEngine;
}

namespace server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

/**
 * @brief Async HTTP/REST API server for ChronoDB
 *
 * - Boost.Beast sessions on a shared io_context run by a thread pool
 * - JSON request/response bodies, SSE for streamed queries
 * - Admin token / database key authorization through AuthMiddleware
 */
class HttpServer {
public:
    struct Config {
        std::string host = "0.0.0.0";
        uint16_t port = 8086;
        size_t num_threads = std::thread::hardware_concurrency();
        size_t max_request_size_mb = 10;

        // SSE limits for /series/stream
        int sse_default_duration_s = 10;
        int sse_max_duration_s = 60;
        int sse_default_interval_ms = 1000;

        Config() = default;
        Config(std::string h, uint16_t p, size_t threads = 0)
            : host(std::move(h)), port(p) {
            if (threads > 0) num_threads = threads;
        }
    };

    HttpServer(
        const Config& config,
        std::shared_ptr<SeriesStore> store,
        std::shared_ptr<DatabaseRegistry> registry,
        std::shared_ptr<query::QueryEngine> engine,
        std::shared_ptr<ContinuousQueryManager> continuous,
        std::shared_ptr<AuthMiddleware> auth
    );

    ~HttpServer();

    /// Start listening and spawn worker threads (non-blocking)
    void start();

    /// Stop accepting, stop the io_context and join the workers
    void stop();

    bool isRunning() const { return running_; }

    /// Route kind plus path parameters of a request target
    struct RouteMatch;

    /// Route a request without a socket (used by sessions)
    http::response<http::string_body> routeRequest(const http::request<http::string_body>& req);

    /// Percent-decode a URL component. '+' is a space only in query strings;
    /// path segments pass plus_as_space = false.
    static std::string urlDecode(const std::string& in, bool plus_as_space = true);

    /// Decoded query parameters of a request target
    static std::unordered_map<std::string, std::string> parseQuery(const std::string& target);

private:
    class Session : public std::enable_shared_from_this<Session> {
    public:
        Session(tcp::socket socket, HttpServer* server);
        void start();

    private:
        void doRead();
        void onRead(beast::error_code ec, std::size_t bytes_transferred);
        void processRequest();
        void doWrite();
        void onWrite(bool close, beast::error_code ec, std::size_t bytes_transferred);

        tcp::socket socket_;
        HttpServer* server_;
        beast::flat_buffer buffer_;
        std::optional<http::request_parser<http::string_body>> parser_;
        http::request<http::string_body> request_;
        http::response<http::string_body> response_;
    };

    void doAccept();
    void onAccept(beast::error_code ec, tcp::socket socket);

    // Endpoint handlers
    http::response<http::string_body> handleHealthCheck(const http::request<http::string_body>& req);
    http::response<http::string_body> handleListDatabases(const http::request<http::string_body>& req);
    http::response<http::string_body> handleCreateDatabase(const http::request<http::string_body>& req);
    http::response<http::string_body> handleDeleteDatabase(const http::request<http::string_body>& req, const RouteMatch& m);
    http::response<http::string_body> handleListKeys(const http::request<http::string_body>& req, const RouteMatch& m);
    http::response<http::string_body> handleCreateKey(const http::request<http::string_body>& req, const RouteMatch& m);
    http::response<http::string_body> handleDeleteKey(const http::request<http::string_body>& req, const RouteMatch& m);
    http::response<http::string_body> handleWritePoints(const http::request<http::string_body>& req, const RouteMatch& m);
    http::response<http::string_body> handleQuerySeries(const http::request<http::string_body>& req, const RouteMatch& m);
    http::response<http::string_body> handleDeleteSeries(const http::request<http::string_body>& req, const RouteMatch& m);
    http::response<http::string_body> handleSeriesStreamSse(const http::request<http::string_body>& req, const RouteMatch& m);
    http::response<http::string_body> handleListContinuousQueries(const http::request<http::string_body>& req, const RouteMatch& m);
    http::response<http::string_body> handleDeleteContinuousQuery(const http::request<http::string_body>& req, const RouteMatch& m);
    http::response<http::string_body> handleSchema(const http::request<http::string_body>& req, const RouteMatch& m);

    /// nullopt when the request may proceed, otherwise the 401/403 response
    std::optional<http::response<http::string_body>> requireAccess(
        const http::request<http::string_body>& req,
        AuthMiddleware::Access access,
        const std::string& db
    );

    /// 404 response if the database does not exist
    std::optional<http::response<http::string_body>> requireDatabase(
        const http::request<http::string_body>& req,
        const std::string& db
    );

    // Helper functions
    http::response<http::string_body> makeResponse(
        http::status status,
        const std::string& body,
        const http::request<http::string_body>& req
    );

    http::response<http::string_body> makeErrorResponse(
        http::status status,
        const std::string& message,
        const http::request<http::string_body>& req
    );

    Config config_;
    std::shared_ptr<SeriesStore> store_;
    std::shared_ptr<DatabaseRegistry> registry_;
    std::shared_ptr<query::QueryEngine> engine_;
    std::shared_ptr<ContinuousQueryManager> continuous_;
    std::shared_ptr<AuthMiddleware> auth_;

    // Networking
    net::io_context ioc_;
    tcp::acceptor acceptor_;

    // Thread pool
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};

    // Metrics
    std::atomic<uint64_t> request_count_{0};
    std::atomic<uint64_t> error_count_{0};
    std::chrono::steady_clock::time_point start_time_;

    size_t max_body_bytes_{10 * 1024 * 1024};
};

} // namespace server
} // namespace chronodb
