#include "utils/logger.h"
#include "utils/config_loader.h"
#include "storage/rocksdb_wrapper.h"
#include "timeseries/series_store.h"
#include "timeseries/continuous_query.h"
#include "meta/database_registry.h"
#include "query/query_engine.h"
#include "server/auth_middleware.h"
#include "server/http_server.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>

using namespace chronodb;
using json = nlohmann::json;

namespace {
std::atomic<bool> g_shutdown{false};

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown = true;
    }
}
}

int main(int argc, char* argv[]) {
    utils::Logger::init();

    CHRONODB_INFO("=== ChronoDB Time-Series Server ===");

    try {
        std::optional<std::string> db_path;
        std::optional<std::string> host;
        std::optional<uint16_t> port;
        std::optional<size_t> num_threads;
        std::optional<std::string> config_path;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--db" && i + 1 < argc) {
                db_path = argv[++i];
            } else if (arg == "--host" && i + 1 < argc) {
                host = argv[++i];
            } else if (arg == "--port" && i + 1 < argc) {
                port = static_cast<uint16_t>(std::stoi(argv[++i]));
            } else if (arg == "--threads" && i + 1 < argc) {
                num_threads = std::stoul(argv[++i]);
            } else if (arg == "--config" && i + 1 < argc) {
                config_path = argv[++i];
            } else if (arg == "--help" || arg == "-h") {
                std::cout << "Usage: " << argv[0] << " [options]\n"
                          << "Options:\n"
                          << "  --db PATH       Database path (default: ./data/chronodb)\n"
                          << "  --host HOST     Server host (default: 0.0.0.0)\n"
                          << "  --port PORT     Server port (default: 8086)\n"
                          << "  --threads N     Number of worker threads (default: auto)\n"
                          << "  --config FILE   Load configuration from a JSON or YAML file\n"
                          << "  --help, -h      Show this help message\n";
                return 0;
            } else {
                std::cerr << "Unknown argument: " << arg << " (see --help)\n";
                return 1;
            }
        }

        utils::ServerOptions options;
        std::optional<json> cfg;
        if (config_path) {
            cfg = utils::ConfigLoader::loadFile(*config_path);
            if (!cfg) {
                CHRONODB_ERROR("Failed to read config file: {}", *config_path);
                return 1;
            }
            CHRONODB_INFO("Loaded config from {}", *config_path);
        } else if (auto found = utils::ConfigLoader::loadDefault()) {
            CHRONODB_INFO("Loaded config from {}", found->first);
            cfg = std::move(found->second);
        }
        if (cfg) {
            if (auto err = utils::ConfigLoader::apply(*cfg, options)) {
                CHRONODB_ERROR("Invalid configuration: {}", *err);
                return 1;
            }
        }

        // Command line wins over the file
        if (db_path) options.storage.db_path = *db_path;
        if (host) options.host = *host;
        if (port) options.port = *port;
        if (num_threads) options.worker_threads = *num_threads;

        utils::Logger::Options log_options;
        log_options.level = utils::Logger::parseLevel(options.log_level).value_or(utils::Logger::Level::INFO);
        log_options.file = options.log_file;
        utils::Logger::reconfigure(log_options);

        CHRONODB_INFO("Database path: {}", options.storage.db_path);
        CHRONODB_INFO("Server: {}:{}", options.host, options.port);

        auto db = std::make_shared<RocksDBWrapper>(options.storage);
        if (!db->open()) {
            CHRONODB_ERROR("Failed to open database!");
            return 1;
        }

        auto store = std::make_shared<SeriesStore>(*db);
        auto registry = std::make_shared<DatabaseRegistry>(*db, *store);

        query::QueryEngine::Config qcfg;
        qcfg.default_limit = options.default_limit;
        qcfg.default_window_ms = options.default_window_ms;
        auto engine = std::make_shared<query::QueryEngine>(*store, qcfg);

        auto continuous = std::make_shared<ContinuousQueryManager>(*db, *store, *engine);
        registry->addDropListener([continuous](const std::string& name) { continuous->removeAll(name); });

        auto auth = std::make_shared<AuthMiddleware>(registry.get());
        for (const auto& token : options.admin_tokens) {
            auth->addToken({token, "config-admin"});
        }
        auth->loadFromEnvironment();
        if (!auth->isEnabled()) {
            CHRONODB_WARN("No admin token configured: authentication is disabled");
        }

        server::HttpServer::Config server_config(options.host, options.port, options.worker_threads);
        server_config.max_request_size_mb = options.max_request_size_mb;
        auto http = std::make_shared<server::HttpServer>(server_config, store, registry, engine, continuous, auth);

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        if (options.continuous_queries_enabled) {
            continuous->start(std::chrono::milliseconds(options.continuous_query_interval_ms));
        } else {
            CHRONODB_INFO("Continuous query worker disabled");
        }

        http->start();

        CHRONODB_INFO("=================================================");
        CHRONODB_INFO("  ChronoDB is running on http://{}:{}", options.host, options.port);
        CHRONODB_INFO("  Press Ctrl+C to stop");
        CHRONODB_INFO("=================================================");

        while (!g_shutdown) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        CHRONODB_INFO("Initiating graceful shutdown...");

        CHRONODB_INFO("[1/3] Stopping HTTP server...");
        http->stop();

        CHRONODB_INFO("[2/3] Stopping continuous query worker...");
        continuous->stop();

        CHRONODB_INFO("[3/3] Closing database...");
        http.reset();
        continuous.reset();
        engine.reset();
        registry.reset();
        store.reset();
        db->close();

        CHRONODB_INFO("Shutdown complete.");
    } catch (const std::exception& e) {
        CHRONODB_ERROR("Fatal error: {}", e.what());
        utils::Logger::shutdown();
        return 1;
    }

    utils::Logger::shutdown();
    return 0;
}
