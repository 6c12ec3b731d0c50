#include "server/http_server.h"
#include "meta/database_registry.h"
#include "query/query_engine.h"
#include "query/query_parser.h"
#include "storage/key_schema.h"
#include "timeseries/continuous_query.h"
#include "timeseries/series_store.h"
#include "timeseries/write_request.h"
#include "utils/logger.h"
#include "utils/time_utils.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <nlohmann/json.hpp>

namespace chronodb {
namespace server {

using json = nlohmann::json;

namespace {
    enum class Route {
        Health,
        DatabasesGet,
        DatabasesPost,
        DatabaseDelete,
        KeysGet,
        KeysPost,
        KeyDelete,
        PointsPost,
        SeriesGet,
        SeriesDelete,
        SeriesStreamGet,
        ContinuousQueriesGet,
        ContinuousQueryDelete,
        SchemaGet,
        NotFound
    };

    std::vector<std::string> splitPath(const std::string& path) {
        std::vector<std::string> parts;
        std::string cur;
        for (char c : path) {
            if (c == '/') {
                if (!cur.empty()) parts.push_back(HttpServer::urlDecode(cur, false));
                cur.clear();
            } else {
                cur.push_back(c);
            }
        }
        if (!cur.empty()) parts.push_back(HttpServer::urlDecode(cur, false));
        return parts;
    }

    std::string pathOnly(const http::request<http::string_body>& req) {
        std::string target(req.target());
        auto qpos = target.find('?');
        return qpos == std::string::npos ? target : target.substr(0, qpos);
    }

    http::status registryStatus(DatabaseRegistry::Status::Code code) {
        switch (code) {
            case DatabaseRegistry::Status::Code::Ok: return http::status::ok;
            case DatabaseRegistry::Status::Code::NotFound: return http::status::not_found;
            case DatabaseRegistry::Status::Code::AlreadyExists: return http::status::conflict;
            case DatabaseRegistry::Status::Code::InvalidArgument: return http::status::bad_request;
            case DatabaseRegistry::Status::Code::Internal: return http::status::internal_server_error;
        }
        return http::status::internal_server_error;
    }

    http::status queryStatus(query::QueryEngine::Status::Code code) {
        return code == query::QueryEngine::Status::Code::NotFound ? http::status::not_found
                                                                  : http::status::bad_request;
    }

    utils::TimePrecision requestPrecision(const std::unordered_map<std::string, std::string>& params,
                                          std::string& error) {
        auto it = params.find("time_precision");
        if (it == params.end()) return utils::TimePrecision::Seconds;
        auto p = utils::precisionFromString(it->second);
        if (!p) {
            error = "Invalid time_precision: " + it->second;
            return utils::TimePrecision::Seconds;
        }
        return *p;
    }

    json resultsToJson(const std::vector<query::SeriesResult>& results) {
        json out = json::array();
        for (const auto& r : results) out.push_back(r.toJSON());
        return out;
    }
}

struct HttpServer::RouteMatch {
    Route route = Route::NotFound;
    std::string db;
    std::string item;
};

namespace {
    HttpServer::RouteMatch classifyRoute(const http::request<http::string_body>& req);
}

HttpServer::HttpServer(
    const Config& config,
    std::shared_ptr<SeriesStore> store,
    std::shared_ptr<DatabaseRegistry> registry,
    std::shared_ptr<query::QueryEngine> engine,
    std::shared_ptr<ContinuousQueryManager> continuous,
    std::shared_ptr<AuthMiddleware> auth
)
    : config_(config)
    , store_(std::move(store))
    , registry_(std::move(registry))
    , engine_(std::move(engine))
    , continuous_(std::move(continuous))
    , auth_(std::move(auth))
    , ioc_(static_cast<int>(std::max<size_t>(config.num_threads, 1)))
    , acceptor_(ioc_)
    , start_time_(std::chrono::steady_clock::now())
    , max_body_bytes_(config.max_request_size_mb * 1024 * 1024)
{
    if (config_.num_threads == 0) {
        config_.num_threads = 1;
    }
    if (!auth_) {
        auth_ = std::make_shared<AuthMiddleware>(registry_.get());
    }
    CHRONODB_INFO("HTTP server configured: {} worker threads, max body {} MB, auth {}",
                  config_.num_threads, config_.max_request_size_mb,
                  auth_->isEnabled() ? "enabled" : "disabled");
}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::start() {
    if (running_) {
        CHRONODB_WARN("Server already running");
        return;
    }

    tcp::endpoint endpoint{net::ip::make_address(config_.host), config_.port};
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(net::socket_base::max_listen_connections);

    CHRONODB_INFO("HTTP Server listening on {}:{}", config_.host, config_.port);

    running_ = true;
    doAccept();

    threads_.reserve(config_.num_threads);
    for (size_t i = 0; i < config_.num_threads; ++i) {
        threads_.emplace_back([this, i] {
            CHRONODB_DEBUG("Worker thread {} started", i);
            ioc_.run();
            CHRONODB_DEBUG("Worker thread {} stopped", i);
        });
    }
}

void HttpServer::stop() {
    if (!running_) {
        return;
    }

    CHRONODB_INFO("Stopping HTTP Server...");
    running_ = false;

    beast::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        CHRONODB_WARN("Closing acceptor: {}", ec.message());
    }

    ioc_.stop();
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    CHRONODB_INFO("HTTP Server stopped ({} requests, {} errors)",
                  request_count_.load(), error_count_.load());
}

void HttpServer::doAccept() {
    acceptor_.async_accept(
        net::make_strand(ioc_),
        beast::bind_front_handler(&HttpServer::onAccept, this)
    );
}

void HttpServer::onAccept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
        if (running_) {
            CHRONODB_ERROR("Accept error: {}", ec.message());
        }
    } else {
        std::make_shared<Session>(std::move(socket), this)->start();
    }

    if (running_) {
        doAccept();
    }
}

// ----------------------------------------------------------------------------
// Routing
// ----------------------------------------------------------------------------

namespace {
    HttpServer::RouteMatch classifyRoute(const http::request<http::string_body>& req) {
        HttpServer::RouteMatch m;
        const auto method = req.method();
        const auto parts = splitPath(pathOnly(req));

        if (parts.size() == 1 && parts[0] == "health" && method == http::verb::get) {
            m.route = Route::Health;
            return m;
        }
        if (parts.empty() || parts[0] != "db") return m;

        if (parts.size() == 1) {
            if (method == http::verb::get) m.route = Route::DatabasesGet;
            else if (method == http::verb::post) m.route = Route::DatabasesPost;
            return m;
        }

        m.db = parts[1];
        if (parts.size() == 2) {
            if (method == http::verb::delete_) m.route = Route::DatabaseDelete;
            return m;
        }

        const std::string& section = parts[2];
        if (section == "keys") {
            if (parts.size() == 3) {
                if (method == http::verb::get) m.route = Route::KeysGet;
                else if (method == http::verb::post) m.route = Route::KeysPost;
            } else if (parts.size() == 4 && method == http::verb::delete_) {
                m.item = parts[3];
                m.route = Route::KeyDelete;
            }
        } else if (section == "points") {
            if (parts.size() == 3 && method == http::verb::post) m.route = Route::PointsPost;
        } else if (section == "series") {
            if (parts.size() == 3) {
                if (method == http::verb::get) m.route = Route::SeriesGet;
                else if (method == http::verb::delete_) m.route = Route::SeriesDelete;
            } else if (parts.size() == 4 && parts[3] == "stream" && method == http::verb::get) {
                m.route = Route::SeriesStreamGet;
            }
        } else if (section == "continuous_queries") {
            if (parts.size() == 3 && method == http::verb::get) {
                m.route = Route::ContinuousQueriesGet;
            } else if (parts.size() == 4 && method == http::verb::delete_) {
                m.item = parts[3];
                m.route = Route::ContinuousQueryDelete;
            }
        } else if (section == "schema") {
            if (parts.size() == 3 && method == http::verb::get) m.route = Route::SchemaGet;
        }
        return m;
    }
}

http::response<http::string_body> HttpServer::routeRequest(
    const http::request<http::string_body>& req
) {
    auto start = std::chrono::steady_clock::now();
    CHRONODB_DEBUG("Request: {} {}", std::string(http::to_string(req.method())), std::string(req.target()));
    request_count_.fetch_add(1, std::memory_order_relaxed);

    http::response<http::string_body> response;
    try {
        const auto m = classifyRoute(req);
        switch (m.route) {
            case Route::Health:
                response = handleHealthCheck(req);
                break;
            case Route::DatabasesGet:
                response = handleListDatabases(req);
                break;
            case Route::DatabasesPost:
                response = handleCreateDatabase(req);
                break;
            case Route::DatabaseDelete:
                response = handleDeleteDatabase(req, m);
                break;
            case Route::KeysGet:
                response = handleListKeys(req, m);
                break;
            case Route::KeysPost:
                response = handleCreateKey(req, m);
                break;
            case Route::KeyDelete:
                response = handleDeleteKey(req, m);
                break;
            case Route::PointsPost:
                response = handleWritePoints(req, m);
                break;
            case Route::SeriesGet:
                response = handleQuerySeries(req, m);
                break;
            case Route::SeriesDelete:
                response = handleDeleteSeries(req, m);
                break;
            case Route::SeriesStreamGet:
                response = handleSeriesStreamSse(req, m);
                break;
            case Route::ContinuousQueriesGet:
                response = handleListContinuousQueries(req, m);
                break;
            case Route::ContinuousQueryDelete:
                response = handleDeleteContinuousQuery(req, m);
                break;
            case Route::SchemaGet:
                response = handleSchema(req, m);
                break;
            case Route::NotFound:
            default:
                response = makeErrorResponse(http::status::not_found, "Endpoint not found", req);
                break;
        }
    } catch (const json::exception& e) {
        response = makeErrorResponse(http::status::bad_request, std::string("JSON error: ") + e.what(), req);
    } catch (const std::exception& e) {
        CHRONODB_ERROR("Unhandled error for {}: {}", std::string(req.target()), e.what());
        response = makeErrorResponse(http::status::internal_server_error, e.what(), req);
    }

    auto dur = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);
    CHRONODB_DEBUG("Response: {} in {}us", response.result_int(), dur.count());
    return response;
}

std::string HttpServer::urlDecode(const std::string& in, bool plus_as_space) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        char c = in[i];
        if (c == '+' && plus_as_space) {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < in.size()) {
            auto hex = in.substr(i + 1, 2);
            if (std::isxdigit(static_cast<unsigned char>(hex[0])) && std::isxdigit(static_cast<unsigned char>(hex[1]))) {
                out.push_back(static_cast<char>(std::stoi(hex, nullptr, 16)));
                i += 2;
            } else {
                out.push_back(c);
            }
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::unordered_map<std::string, std::string> HttpServer::parseQuery(const std::string& target) {
    std::unordered_map<std::string, std::string> out;
    auto qpos = target.find('?');
    if (qpos == std::string::npos) return out;
    std::istringstream iss(target.substr(qpos + 1));
    std::string kv;
    while (std::getline(iss, kv, '&')) {
        if (kv.empty()) continue;
        auto eq = kv.find('=');
        std::string k = (eq == std::string::npos) ? kv : kv.substr(0, eq);
        std::string v = (eq == std::string::npos) ? std::string() : kv.substr(eq + 1);
        out[urlDecode(k)] = urlDecode(v);
    }
    return out;
}

std::optional<http::response<http::string_body>> HttpServer::requireAccess(
    const http::request<http::string_body>& req,
    AuthMiddleware::Access access,
    const std::string& db
) {
    if (!auth_->isEnabled()) return std::nullopt;

    std::optional<std::string> token;
    auto it = req.find(http::field::authorization);
    if (it != req.end()) {
        token = AuthMiddleware::extractBearerToken(std::string_view(it->value().data(), it->value().size()));
    }
    if (!token) {
        auto params = parseQuery(std::string(req.target()));
        auto key = params.find("api_key");
        if (key != params.end()) token = key->second;
    }

    auto result = auth_->authorize(token, access, db);
    if (result.authorized) return std::nullopt;

    CHRONODB_DEBUG("Access denied for {}: {}", pathOnly(req), result.reason);
    auto res = makeErrorResponse(static_cast<http::status>(result.status), result.reason, req);
    if (result.status == 401) {
        res.set(http::field::www_authenticate, "Bearer realm=\"chronodb\"");
    }
    return res;
}

std::optional<http::response<http::string_body>> HttpServer::requireDatabase(
    const http::request<http::string_body>& req,
    const std::string& db
) {
    if (registry_->exists(db)) return std::nullopt;
    return makeErrorResponse(http::status::not_found, "Database not found: " + db, req);
}

// ----------------------------------------------------------------------------
// Handlers
// ----------------------------------------------------------------------------

http::response<http::string_body> HttpServer::handleHealthCheck(
    const http::request<http::string_body>& req
) {
    auto uptime_seconds = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - start_time_
    ).count();

    json response = {
        {"status", "ok"},
        {"database", "chronodb"},
        {"uptime_seconds", uptime_seconds}
    };
    return makeResponse(http::status::ok, response.dump(), req);
}

http::response<http::string_body> HttpServer::handleListDatabases(
    const http::request<http::string_body>& req
) {
    if (auto resp = requireAccess(req, AuthMiddleware::Access::Admin, "")) return *resp;

    json out = json::array();
    for (const auto& info : registry_->listDatabases()) {
        out.push_back(info.toJson());
    }
    return makeResponse(http::status::ok, out.dump(), req);
}

http::response<http::string_body> HttpServer::handleCreateDatabase(
    const http::request<http::string_body>& req
) {
    if (auto resp = requireAccess(req, AuthMiddleware::Access::Admin, "")) return *resp;
    if (req.body().empty()) {
        return makeErrorResponse(http::status::bad_request, "Missing JSON body", req);
    }

    json body = json::parse(req.body());
    if (!body.is_object() || !body.contains("name") || !body["name"].is_string()) {
        return makeErrorResponse(http::status::bad_request, "Field 'name' (string) is required", req);
    }
    const std::string name = body["name"].get<std::string>();

    auto st = registry_->createDatabase(name);
    if (!st.ok) {
        return makeErrorResponse(registryStatus(st.code), st.message, req);
    }
    return makeResponse(http::status::created, json{{"name", name}}.dump(), req);
}

http::response<http::string_body> HttpServer::handleDeleteDatabase(
    const http::request<http::string_body>& req,
    const RouteMatch& m
) {
    if (auto resp = requireAccess(req, AuthMiddleware::Access::Admin, m.db)) return *resp;

    auto st = registry_->deleteDatabase(m.db);
    if (!st.ok) {
        return makeErrorResponse(registryStatus(st.code), st.message, req);
    }
    return makeResponse(http::status::ok, json{{"deleted", m.db}}.dump(), req);
}

http::response<http::string_body> HttpServer::handleListKeys(
    const http::request<http::string_body>& req,
    const RouteMatch& m
) {
    if (auto resp = requireAccess(req, AuthMiddleware::Access::Admin, m.db)) return *resp;

    auto [st, keys] = registry_->listKeys(m.db);
    if (!st.ok) {
        return makeErrorResponse(registryStatus(st.code), st.message, req);
    }
    json out = json::array();
    for (const auto& k : keys) out.push_back(k.toJson());
    return makeResponse(http::status::ok, out.dump(), req);
}

http::response<http::string_body> HttpServer::handleCreateKey(
    const http::request<http::string_body>& req,
    const RouteMatch& m
) {
    if (auto resp = requireAccess(req, AuthMiddleware::Access::Admin, m.db)) return *resp;

    json body = req.body().empty() ? json::object() : json::parse(req.body());
    if (!body.is_object()) {
        return makeErrorResponse(http::status::bad_request, "Body must be a JSON object", req);
    }
    const std::string perm_str = body.value("permission", std::string("readwrite"));
    auto perm = DatabaseRegistry::permissionFromString(perm_str);
    if (!perm) {
        return makeErrorResponse(http::status::bad_request, "Invalid permission: " + perm_str, req);
    }
    std::optional<std::string> key;
    if (body.contains("key")) {
        if (!body["key"].is_string()) {
            return makeErrorResponse(http::status::bad_request, "Field 'key' must be a string", req);
        }
        key = body["key"].get<std::string>();
    }

    auto [st, created] = registry_->addKey(m.db, *perm, key);
    if (!st.ok) {
        return makeErrorResponse(registryStatus(st.code), st.message, req);
    }
    return makeResponse(http::status::created, created.toJson().dump(), req);
}

http::response<http::string_body> HttpServer::handleDeleteKey(
    const http::request<http::string_body>& req,
    const RouteMatch& m
) {
    if (auto resp = requireAccess(req, AuthMiddleware::Access::Admin, m.db)) return *resp;

    auto st = registry_->removeKey(m.db, m.item);
    if (!st.ok) {
        return makeErrorResponse(registryStatus(st.code), st.message, req);
    }
    return makeResponse(http::status::ok, json{{"deleted", m.item}}.dump(), req);
}

http::response<http::string_body> HttpServer::handleWritePoints(
    const http::request<http::string_body>& req,
    const RouteMatch& m
) {
    if (auto resp = requireAccess(req, AuthMiddleware::Access::Write, m.db)) return *resp;
    if (auto resp = requireDatabase(req, m.db)) return *resp;

    std::string error;
    auto precision = requestPrecision(parseQuery(std::string(req.target())), error);
    if (!error.empty()) {
        return makeErrorResponse(http::status::bad_request, error, req);
    }
    if (req.body().empty()) {
        return makeErrorResponse(http::status::bad_request, "Missing JSON body", req);
    }

    json body = json::parse(req.body());
    auto parsed = WriteRequest::fromJson(body, precision, utils::nowMillis());
    if (!parsed.ok) {
        return makeErrorResponse(http::status::bad_request, parsed.message, req);
    }

    const size_t count = parsed.points.size();
    auto st = store_->writePoints(m.db, std::move(parsed.points));
    if (!st.ok && st.code == SeriesStore::Status::Code::NotFound) {
        // Database dropped after requireDatabase
        return makeErrorResponse(http::status::not_found, st.message, req);
    }
    if (!st.ok) {
        CHRONODB_ERROR("Write to {} failed: {}", m.db, st.message);
        return makeErrorResponse(http::status::internal_server_error, st.message, req);
    }
    CHRONODB_DEBUG("Wrote {} points to {}", count, m.db);
    return makeResponse(http::status::ok, json{{"written", count}}.dump(), req);
}

http::response<http::string_body> HttpServer::handleQuerySeries(
    const http::request<http::string_body>& req,
    const RouteMatch& m
) {
    if (auto resp = requireAccess(req, AuthMiddleware::Access::Read, m.db)) return *resp;
    if (auto resp = requireDatabase(req, m.db)) return *resp;

    auto params = parseQuery(std::string(req.target()));
    auto q = params.find("q");
    if (q == params.end() || q->second.empty()) {
        return makeErrorResponse(http::status::bad_request, "Missing query parameter 'q'", req);
    }
    std::string error;
    auto precision = requestPrecision(params, error);
    if (!error.empty()) {
        return makeErrorResponse(http::status::bad_request, error, req);
    }

    query::QueryParser parser;
    auto parsed = parser.parse(q->second);
    if (!parsed.success) {
        return makeErrorResponse(http::status::bad_request, parsed.error.toString(), req);
    }
    const auto& stmt = *parsed.statement;

    if (stmt.type == query::StatementType::Delete) {
        return makeErrorResponse(http::status::bad_request, "Delete queries must use the DELETE method", req);
    }

    if (stmt.type == query::StatementType::Select && stmt.into) {
        if (auto resp = requireAccess(req, AuthMiddleware::Access::Write, m.db)) return *resp;
        auto [st, def] = continuous_->registerQuery(m.db, q->second);
        if (!st.ok) {
            return makeErrorResponse(st.code == ContinuousQueryManager::Status::Code::Internal
                                         ? http::status::internal_server_error
                                         : http::status::bad_request,
                                     st.message, req);
        }
        return makeResponse(http::status::ok, def.toJson().dump(), req);
    }

    query::QueryEngine::ExecOptions opts;
    opts.precision = precision;
    auto [st, results] = engine_->execute(m.db, stmt, opts);
    if (!st.ok) {
        return makeErrorResponse(queryStatus(st.code), st.message, req);
    }
    return makeResponse(http::status::ok, resultsToJson(results).dump(), req);
}

http::response<http::string_body> HttpServer::handleDeleteSeries(
    const http::request<http::string_body>& req,
    const RouteMatch& m
) {
    if (auto resp = requireAccess(req, AuthMiddleware::Access::Write, m.db)) return *resp;
    if (auto resp = requireDatabase(req, m.db)) return *resp;

    auto params = parseQuery(std::string(req.target()));
    auto q = params.find("q");
    if (q == params.end() || q->second.empty()) {
        return makeErrorResponse(http::status::bad_request, "Missing query parameter 'q'", req);
    }
    std::string error;
    auto precision = requestPrecision(params, error);
    if (!error.empty()) {
        return makeErrorResponse(http::status::bad_request, error, req);
    }

    query::QueryParser parser;
    auto parsed = parser.parse(q->second);
    if (!parsed.success) {
        return makeErrorResponse(http::status::bad_request, parsed.error.toString(), req);
    }
    if (parsed.statement->type != query::StatementType::Delete) {
        return makeErrorResponse(http::status::bad_request, "Only delete queries are accepted here", req);
    }

    query::QueryEngine::ExecOptions opts;
    opts.precision = precision;
    auto [st, results] = engine_->execute(m.db, *parsed.statement, opts);
    if (!st.ok) {
        return makeErrorResponse(queryStatus(st.code), st.message, req);
    }
    return makeResponse(http::status::ok, resultsToJson(results).dump(), req);
}

http::response<http::string_body> HttpServer::handleSeriesStreamSse(
    const http::request<http::string_body>& req,
    const RouteMatch& m
) {
    if (auto resp = requireAccess(req, AuthMiddleware::Access::Read, m.db)) return *resp;
    if (auto resp = requireDatabase(req, m.db)) return *resp;

    auto params = parseQuery(std::string(req.target()));
    auto q = params.find("q");
    if (q == params.end() || q->second.empty()) {
        return makeErrorResponse(http::status::bad_request, "Missing query parameter 'q'", req);
    }
    std::string error;
    auto precision = requestPrecision(params, error);
    if (!error.empty()) {
        return makeErrorResponse(http::status::bad_request, error, req);
    }

    int duration_s = config_.sse_default_duration_s;
    int interval_ms = config_.sse_default_interval_ms;
    try {
        if (auto it = params.find("duration_s"); it != params.end()) duration_s = std::stoi(it->second);
        if (auto it = params.find("interval_ms"); it != params.end()) interval_ms = std::stoi(it->second);
    } catch (const std::exception&) {
        return makeErrorResponse(http::status::bad_request, "duration_s and interval_ms must be integers", req);
    }
    duration_s = std::clamp(duration_s, 1, config_.sse_max_duration_s);
    interval_ms = std::clamp(interval_ms, 100, 60000);

    // Batch streaming: events are collected for the whole duration and sent
    // as one text/event-stream body.
    std::ostringstream body;
    body << "retry: 3000\n\n";
    size_t events = 0;
    auto st = continuous_->stream(
        m.db, q->second,
        std::chrono::seconds(duration_s), std::chrono::milliseconds(interval_ms),
        [&](const std::vector<query::SeriesResult>& results) {
            body << "id: " << ++events << "\n";
            body << "data: " << resultsToJson(results).dump() << "\n\n";
            return true;
        },
        precision);
    if (!st.ok) {
        return makeErrorResponse(st.code == ContinuousQueryManager::Status::Code::NotFound
                                     ? http::status::not_found
                                     : http::status::bad_request,
                                 st.message, req);
    }

    http::response<http::string_body> res{http::status::ok, req.version()};
    res.set(http::field::server, "ChronoDB");
    res.set(http::field::content_type, "text/event-stream");
    res.set(http::field::cache_control, "no-cache, no-transform");
    res.keep_alive(req.keep_alive());
    res.body() = body.str();
    res.prepare_payload();
    CHRONODB_DEBUG("SSE stream on {} sent {} events", m.db, events);
    return res;
}

http::response<http::string_body> HttpServer::handleListContinuousQueries(
    const http::request<http::string_body>& req,
    const RouteMatch& m
) {
    if (auto resp = requireAccess(req, AuthMiddleware::Access::Read, m.db)) return *resp;
    if (auto resp = requireDatabase(req, m.db)) return *resp;

    json out = json::array();
    for (const auto& def : continuous_->list(m.db)) {
        out.push_back(def.toJson());
    }
    return makeResponse(http::status::ok, out.dump(), req);
}

http::response<http::string_body> HttpServer::handleDeleteContinuousQuery(
    const http::request<http::string_body>& req,
    const RouteMatch& m
) {
    if (auto resp = requireAccess(req, AuthMiddleware::Access::Write, m.db)) return *resp;
    if (auto resp = requireDatabase(req, m.db)) return *resp;

    uint64_t id = 0;
    if (m.item.empty() || !std::all_of(m.item.begin(), m.item.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return makeErrorResponse(http::status::bad_request, "Invalid continuous query id: " + m.item, req);
    }
    try {
        id = std::stoull(m.item);
    } catch (const std::out_of_range&) {
        return makeErrorResponse(http::status::bad_request, "Invalid continuous query id: " + m.item, req);
    }

    auto st = continuous_->remove(m.db, id);
    if (!st.ok) {
        auto code = st.code == ContinuousQueryManager::Status::Code::NotFound
            ? http::status::not_found : http::status::internal_server_error;
        return makeErrorResponse(code, st.message, req);
    }
    return makeResponse(http::status::ok, json{{"deleted", id}}.dump(), req);
}

http::response<http::string_body> HttpServer::handleSchema(
    const http::request<http::string_body>& req,
    const RouteMatch& m
) {
    if (auto resp = requireAccess(req, AuthMiddleware::Access::Read, m.db)) return *resp;
    if (auto resp = requireDatabase(req, m.db)) return *resp;

    json out = json::object();
    for (const auto& series : store_->listSeries(m.db)) {
        out[series] = store_->columns(m.db, series);
    }
    return makeResponse(http::status::ok, out.dump(), req);
}

// ----------------------------------------------------------------------------
// Response helpers
// ----------------------------------------------------------------------------

http::response<http::string_body> HttpServer::makeResponse(
    http::status status,
    const std::string& body,
    const http::request<http::string_body>& req
) {
    http::response<http::string_body> res{status, req.version()};
    res.set(http::field::server, "ChronoDB");
    res.set(http::field::content_type, "application/json");
    res.keep_alive(req.keep_alive());
    res.body() = body;
    res.prepare_payload();
    return res;
}

http::response<http::string_body> HttpServer::makeErrorResponse(
    http::status status,
    const std::string& message,
    const http::request<http::string_body>& req
) {
    error_count_.fetch_add(1, std::memory_order_relaxed);

    json error_body = {
        {"error", true},
        {"message", message},
        {"status_code", static_cast<int>(status)}
    };
    return makeResponse(status, error_body.dump(), req);
}

// ============================================================================
// Session Implementation
// ============================================================================

HttpServer::Session::Session(tcp::socket socket, HttpServer* server)
    : socket_(std::move(socket))
    , server_(server)
{
}

void HttpServer::Session::start() {
    doRead();
}

void HttpServer::Session::doRead() {
    parser_.emplace();
    parser_->body_limit(server_->max_body_bytes_);

    http::async_read(
        socket_,
        buffer_,
        *parser_,
        beast::bind_front_handler(&Session::onRead, shared_from_this())
    );
}

void HttpServer::Session::onRead(
    beast::error_code ec,
    std::size_t bytes_transferred
) {
    boost::ignore_unused(bytes_transferred);

    if (ec == http::error::end_of_stream) {
        socket_.shutdown(tcp::socket::shutdown_send, ec);
        return;
    }

    if (ec == http::error::body_limit) {
        http::request<http::string_body> head;
        head.version(11);
        head.keep_alive(false);
        response_ = server_->makeErrorResponse(http::status::payload_too_large, "Request body too large", head);
        response_.keep_alive(false);
        doWrite();
        return;
    }

    if (ec) {
        CHRONODB_DEBUG("Read error: {}", ec.message());
        return;
    }

    request_ = parser_->release();
    processRequest();
}

void HttpServer::Session::processRequest() {
    response_ = server_->routeRequest(request_);
    doWrite();
}

void HttpServer::Session::doWrite() {
    bool close = response_.need_eof();
    http::async_write(
        socket_,
        response_,
        beast::bind_front_handler(
            &Session::onWrite,
            shared_from_this(),
            close
        )
    );
}

void HttpServer::Session::onWrite(
    bool close,
    beast::error_code ec,
    std::size_t bytes_transferred
) {
    boost::ignore_unused(bytes_transferred);

    if (ec) {
        CHRONODB_DEBUG("Write error: {}", ec.message());
        return;
    }

    if (close) {
        socket_.shutdown(tcp::socket::shutdown_send, ec);
        return;
    }

    doRead();
}

} // namespace server
} // namespace chronodb
