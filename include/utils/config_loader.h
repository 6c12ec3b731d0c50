#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "storage/rocksdb_wrapper.h"

namespace YAML { class Node; }

namespace chronodb {
namespace utils {

/// Everything main() needs to bring the server up
struct ServerOptions {
    // server
    std::string host = "0.0.0.0";
    uint16_t port = 8086;
    size_t worker_threads = 0;           // 0 = hardware concurrency
    size_t max_request_size_mb = 10;

    // storage
    RocksDBWrapper::Config storage;

    // query
    size_t default_limit = 1000;
    int64_t default_window_ms = 3600LL * 1000;

    // continuous queries
    bool continuous_queries_enabled = true;
    int64_t continuous_query_interval_ms = 10000;

    // auth
    std::vector<std::string> admin_tokens;

    // logging
    std::string log_level = "info";
    std::string log_file = "chronodb.log";
};

class ConfigLoader {
public:
    /// Load a YAML (.yaml/.yml) or JSON file. Returns nullopt if it cannot be read or parsed.
    static std::optional<nlohmann::json> loadFile(const std::string& path);

    /// First readable file among the default locations
    static std::optional<std::pair<std::string, nlohmann::json>> loadDefault();

    static const std::vector<std::string>& defaultPaths();

    /// Recursive YAML -> JSON conversion (scalars become bool, int, double or string)
    static nlohmann::json yamlToJson(const YAML::Node& node);

    /**
     * @brief Apply a parsed configuration document on top of options.
     * @return Error message for invalid values, nullopt on success
     */
    static std::optional<std::string> apply(const nlohmann::json& cfg, ServerOptions& options);
};

} // namespace utils
} // namespace chronodb
