#include "utils/config_loader.h"
#include "utils/logger.h"
#include "utils/time_utils.h"

#include <fstream>
#include <yaml-cpp/yaml.h>

namespace chronodb {
namespace utils {

using json = nlohmann::json;

namespace {

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

const std::vector<std::string>& ConfigLoader::defaultPaths() {
    static const std::vector<std::string> paths = {
        "./config.yaml", "./config.yml", "./config.json",
        "./config/config.yaml", "./config/config.yml", "./config/config.json"
    };
    return paths;
}

json ConfigLoader::yamlToJson(const YAML::Node& n) {
    if (!n) return nullptr;
    if (n.IsScalar()) {
        bool b;
        if (YAML::convert<bool>::decode(n, b)) return b;
        long long i;
        if (YAML::convert<long long>::decode(n, i)) return i;
        double d;
        if (YAML::convert<double>::decode(n, d)) return d;
        return n.as<std::string>("");
    }
    if (n.IsSequence()) {
        json arr = json::array();
        for (const auto& it : n) arr.push_back(yamlToJson(it));
        return arr;
    }
    if (n.IsMap()) {
        json obj = json::object();
        for (auto it = n.begin(); it != n.end(); ++it) {
            obj[it->first.as<std::string>()] = yamlToJson(it->second);
        }
        return obj;
    }
    return nullptr;
}

std::optional<json> ConfigLoader::loadFile(const std::string& path) {
    try {
        if (endsWith(path, ".yaml") || endsWith(path, ".yml")) {
            return yamlToJson(YAML::LoadFile(path));
        }
        std::ifstream f(path);
        if (!f.is_open()) return std::nullopt;
        json j;
        f >> j;
        return j;
    } catch (const YAML::Exception& e) {
        CHRONODB_DEBUG("Cannot load YAML config {}: {}", path, e.what());
    } catch (const json::exception& e) {
        CHRONODB_DEBUG("Cannot load JSON config {}: {}", path, e.what());
    }
    return std::nullopt;
}

std::optional<std::pair<std::string, json>> ConfigLoader::loadDefault() {
    for (const auto& p : defaultPaths()) {
        if (auto cfg = loadFile(p)) {
            return std::make_pair(p, std::move(*cfg));
        }
    }
    return std::nullopt;
}

std::optional<std::string> ConfigLoader::apply(const json& cfg, ServerOptions& o) {
    if (!cfg.is_object()) {
        return std::string("Configuration root must be a mapping");
    }
    try {
        if (cfg.contains("server")) {
            const auto& sv = cfg["server"];
            if (sv.contains("host")) o.host = sv["host"].get<std::string>();
            if (sv.contains("port")) {
                int port = sv["port"].get<int>();
                if (port <= 0 || port > 65535) return "Invalid server.port: " + std::to_string(port);
                o.port = static_cast<uint16_t>(port);
            }
            if (sv.contains("worker_threads")) o.worker_threads = sv["worker_threads"].get<size_t>();
            if (sv.contains("max_request_size_mb")) o.max_request_size_mb = sv["max_request_size_mb"].get<size_t>();
        }
        if (cfg.contains("storage")) {
            const auto& s = cfg["storage"];
            if (s.contains("rocksdb_path")) o.storage.db_path = s["rocksdb_path"].get<std::string>();
            if (s.contains("memtable_size_mb")) o.storage.memtable_size_mb = s["memtable_size_mb"].get<size_t>();
            if (s.contains("block_cache_size_mb")) o.storage.block_cache_size_mb = s["block_cache_size_mb"].get<size_t>();
            if (s.contains("compression")) {
                const auto& c = s["compression"];
                if (c.contains("default")) o.storage.compression_default = c["default"].get<std::string>();
                if (c.contains("bottommost")) o.storage.compression_bottommost = c["bottommost"].get<std::string>();
            }
        }
        if (cfg.contains("query")) {
            const auto& q = cfg["query"];
            if (q.contains("default_limit")) o.default_limit = q["default_limit"].get<size_t>();
            if (q.contains("default_window")) {
                const auto& w = q["default_window"];
                if (w.is_string()) {
                    auto ms = parseDurationMillis(w.get<std::string>());
                    if (!ms || *ms <= 0) return "Invalid query.default_window: " + w.get<std::string>();
                    o.default_window_ms = *ms;
                } else {
                    // Plain numbers are seconds
                    o.default_window_ms = w.get<int64_t>() * 1000;
                }
            }
        }
        if (cfg.contains("continuous_queries")) {
            const auto& c = cfg["continuous_queries"];
            if (c.contains("enabled")) o.continuous_queries_enabled = c["enabled"].get<bool>();
            if (c.contains("interval_ms")) {
                o.continuous_query_interval_ms = c["interval_ms"].get<int64_t>();
                if (o.continuous_query_interval_ms <= 0) return std::string("continuous_queries.interval_ms must be positive");
            }
        }
        if (cfg.contains("auth")) {
            const auto& a = cfg["auth"];
            if (a.contains("admin_tokens")) {
                o.admin_tokens.clear();
                for (const auto& t : a["admin_tokens"]) {
                    o.admin_tokens.push_back(t.is_string() ? t.get<std::string>() : t.dump());
                }
            }
        }
        if (cfg.contains("logging")) {
            const auto& l = cfg["logging"];
            if (l.contains("level")) {
                o.log_level = l["level"].get<std::string>();
                if (!Logger::parseLevel(o.log_level)) {
                    return "Invalid logging.level: " + o.log_level;
                }
            }
            if (l.contains("file")) o.log_file = l["file"].is_null() ? std::string() : l["file"].get<std::string>();
        }
    } catch (const json::exception& e) {
        return std::string("Invalid configuration value: ") + e.what();
    }
    return std::nullopt;
}

} // namespace utils
} // namespace chronodb
