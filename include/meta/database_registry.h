#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace chronodb {

class RocksDBWrapper;
class SeriesStore;

/// Databases and their access keys.
class DatabaseRegistry {
public:
    enum class Permission { Read, Write, ReadWrite };

    struct Status {
        enum class Code { Ok, NotFound, AlreadyExists, InvalidArgument, Internal };
        bool ok = true;
        Code code = Code::Ok;
        std::string message;
        static Status OK() { return {}; }
        static Status Error(Code code, std::string msg) { return Status{false, code, std::move(msg)}; }
    };

    struct DatabaseInfo {
        std::string name;
        int64_t created_ms = 0;
        nlohmann::json toJson() const;
    };

    struct AccessKey {
        std::string db;
        std::string key;
        Permission permission = Permission::Read;
        int64_t created_ms = 0;
        nlohmann::json toJson() const;
        static std::optional<AccessKey> fromJson(const nlohmann::json& j);
    };

    /// Invoked after a database was removed (e.g. to stop its continuous queries)
    using DropListener = std::function<void(const std::string& db)>;

    DatabaseRegistry(RocksDBWrapper& db, SeriesStore& store);

    Status createDatabase(const std::string& name);
    Status deleteDatabase(const std::string& name);
    std::vector<DatabaseInfo> listDatabases() const;
    bool exists(const std::string& name) const;

    /// Create a key; a random 32 hex char key is generated when key is not given
    std::pair<Status, AccessKey> addKey(const std::string& db, Permission permission,
                                        std::optional<std::string> key = std::nullopt);
    std::pair<Status, std::vector<AccessKey>> listKeys(const std::string& db) const;
    Status removeKey(const std::string& db, const std::string& key);

    /// True if the key exists for db and its permission covers needed
    bool checkKey(const std::string& db, const std::string& key, Permission needed) const;

    void addDropListener(DropListener listener);

    static std::optional<Permission> permissionFromString(const std::string& s);
    static const char* permissionToString(Permission p);
    static bool covers(Permission granted, Permission needed);

private:
    RocksDBWrapper& db_;
    SeriesStore& store_;
    mutable std::mutex mutex_;
    std::vector<DropListener> drop_listeners_;

    static std::string generateKey();
};

} // namespace chronodb
