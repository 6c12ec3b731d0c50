#include "meta/database_registry.h"
#include "storage/key_schema.h"
#include "storage/rocksdb_wrapper.h"
#include "timeseries/series_store.h"
#include "utils/logger.h"
#include "utils/time_utils.h"

#include <openssl/rand.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace chronodb {

nlohmann::json DatabaseRegistry::DatabaseInfo::toJson() const {
    return nlohmann::json{{"name", name}, {"created_at", created_ms / 1000}};
}

nlohmann::json DatabaseRegistry::AccessKey::toJson() const {
    return nlohmann::json{
        {"db", db},
        {"key", key},
        {"permission", permissionToString(permission)},
        {"created_at", created_ms / 1000}
    };
}

std::optional<DatabaseRegistry::AccessKey> DatabaseRegistry::AccessKey::fromJson(const nlohmann::json& j) {
    try {
        AccessKey k;
        k.db = j.at("db").get<std::string>();
        k.key = j.at("key").get<std::string>();
        auto perm = permissionFromString(j.at("permission").get<std::string>());
        if (!perm) return std::nullopt;
        k.permission = *perm;
        k.created_ms = j.value("created_ms", int64_t(0));
        return k;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

DatabaseRegistry::DatabaseRegistry(RocksDBWrapper& db, SeriesStore& store)
    : db_(db), store_(store) {
    store_.setRequireDatabase(true);
}

std::optional<DatabaseRegistry::Permission> DatabaseRegistry::permissionFromString(const std::string& s) {
    if (s == "read" || s == "r") return Permission::Read;
    if (s == "write" || s == "w") return Permission::Write;
    if (s == "readwrite" || s == "rw" || s == "read_write") return Permission::ReadWrite;
    return std::nullopt;
}

const char* DatabaseRegistry::permissionToString(Permission p) {
    switch (p) {
        case Permission::Read: return "read";
        case Permission::Write: return "write";
        case Permission::ReadWrite: return "readwrite";
    }
    return "read";
}

bool DatabaseRegistry::covers(Permission granted, Permission needed) {
    if (granted == Permission::ReadWrite) return true;
    return granted == needed;
}

std::string DatabaseRegistry::generateKey() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw std::runtime_error("Failed to generate random access key");
    }
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned char b : bytes) {
        oss << std::setw(2) << static_cast<int>(b);
    }
    return oss.str();
}

DatabaseRegistry::Status DatabaseRegistry::createDatabase(const std::string& name) {
    if (auto err = KeySchema::validateDatabaseName(name)) {
        return Status::Error(Status::Code::InvalidArgument, *err);
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string key = KeySchema::makeDatabaseKey(name);
    if (db_.get(key)) {
        return Status::Error(Status::Code::AlreadyExists, "Database '" + name + "' already exists");
    }
    
    nlohmann::json record{{"name", name}, {"created_ms", utils::nowMillis()}};
    if (!db_.put(key, record.dump())) {
        return Status::Error(Status::Code::Internal, "Failed to persist database '" + name + "'");
    }
    
    CHRONODB_INFO("Created database '{}'", name);
    return Status::OK();
}

DatabaseRegistry::Status DatabaseRegistry::deleteDatabase(const std::string& name) {
    std::vector<DropListener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const std::string key = KeySchema::makeDatabaseKey(name);
        if (!db_.get(key)) {
            return Status::Error(Status::Code::NotFound, "Database '" + name + "' not found");
        }
        
        // The record goes first: writes racing with the drop fail from here on
        auto batch = db_.createWriteBatch();
        const std::string keys_prefix = KeySchema::accessKeyPrefix(name);
        batch->deleteRange(keys_prefix, RocksDBWrapper::prefixUpperBound(keys_prefix));
        batch->del(key);
        if (!batch->commit()) {
            return Status::Error(Status::Code::Internal, "Failed to delete database '" + name + "'");
        }
        
        auto st = store_.dropDatabase(name);
        if (!st.ok) {
            CHRONODB_ERROR("Database '{}' removed but its series were not dropped: {}", name, st.message);
            return Status::Error(Status::Code::Internal, st.message);
        }
        listeners = drop_listeners_;
    }
    
    for (const auto& l : listeners) {
        l(name);
    }
    CHRONODB_INFO("Deleted database '{}'", name);
    return Status::OK();
}

std::vector<DatabaseRegistry::DatabaseInfo> DatabaseRegistry::listDatabases() const {
    std::vector<DatabaseInfo> out;
    db_.scanPrefix(KeySchema::databasePrefix(), [&](std::string_view, std::string_view value) {
        try {
            auto j = nlohmann::json::parse(value);
            DatabaseInfo info;
            info.name = j.at("name").get<std::string>();
            info.created_ms = j.value("created_ms", int64_t(0));
            out.push_back(std::move(info));
        } catch (const nlohmann::json::exception& e) {
            CHRONODB_WARN("Skipping corrupt database record: {}", e.what());
        }
        return true;
    });
    return out;
}

bool DatabaseRegistry::exists(const std::string& name) const {
    return db_.get(KeySchema::makeDatabaseKey(name)).has_value();
}

std::pair<DatabaseRegistry::Status, DatabaseRegistry::AccessKey>
DatabaseRegistry::addKey(const std::string& db, Permission permission, std::optional<std::string> key) {
    AccessKey ak;
    if (key) {
        if (key->empty() || key->size() > 256) {
            return {Status::Error(Status::Code::InvalidArgument, "Key must be 1-256 characters"), ak};
        }
        for (char c : *key) {
            if (c == KeySchema::SEPARATOR || static_cast<unsigned char>(c) <= 0x20) {
                return {Status::Error(Status::Code::InvalidArgument, "Key contains invalid characters"), ak};
            }
        }
        ak.key = *key;
    } else {
        try {
            ak.key = generateKey();
        } catch (const std::exception& e) {
            CHRONODB_ERROR("Key generation failed: {}", e.what());
            return {Status::Error(Status::Code::Internal, e.what()), ak};
        }
    }
    ak.db = db;
    ak.permission = permission;
    ak.created_ms = utils::nowMillis();
    
    nlohmann::json record = ak.toJson();
    record["created_ms"] = ak.created_ms;
    
    std::lock_guard<std::mutex> lock(mutex_);
    if (!exists(db)) {
        return {Status::Error(Status::Code::NotFound, "Database '" + db + "' not found"), ak};
    }
    const std::string storage_key = KeySchema::makeAccessKeyKey(db, ak.key);
    if (db_.get(storage_key)) {
        return {Status::Error(Status::Code::AlreadyExists, "Key already exists"), ak};
    }
    if (!db_.put(storage_key, record.dump())) {
        return {Status::Error(Status::Code::Internal, "Failed to persist key"), ak};
    }
    
    CHRONODB_INFO("Added {} key to database '{}'", permissionToString(permission), db);
    return {Status::OK(), ak};
}

std::pair<DatabaseRegistry::Status, std::vector<DatabaseRegistry::AccessKey>>
DatabaseRegistry::listKeys(const std::string& db) const {
    std::vector<AccessKey> keys;
    if (!exists(db)) {
        return {Status::Error(Status::Code::NotFound, "Database '" + db + "' not found"), keys};
    }
    db_.scanPrefix(KeySchema::accessKeyPrefix(db), [&](std::string_view, std::string_view value) {
        try {
            if (auto k = AccessKey::fromJson(nlohmann::json::parse(value))) {
                keys.push_back(std::move(*k));
            }
        } catch (const nlohmann::json::exception& e) {
            CHRONODB_WARN("Skipping corrupt key record in '{}': {}", db, e.what());
        }
        return true;
    });
    return {Status::OK(), keys};
}

DatabaseRegistry::Status DatabaseRegistry::removeKey(const std::string& db, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string storage_key = KeySchema::makeAccessKeyKey(db, key);
    if (!db_.get(storage_key)) {
        return Status::Error(Status::Code::NotFound, "Key not found");
    }
    if (!db_.del(storage_key)) {
        return Status::Error(Status::Code::Internal, "Failed to delete key");
    }
    CHRONODB_INFO("Removed key from database '{}'", db);
    return Status::OK();
}

bool DatabaseRegistry::checkKey(const std::string& db, const std::string& key, Permission needed) const {
    if (key.empty()) return false;
    auto raw = db_.get(KeySchema::makeAccessKeyKey(db, key));
    if (!raw) return false;
    try {
        auto ak = AccessKey::fromJson(nlohmann::json::parse(*raw));
        return ak && covers(ak->permission, needed);
    } catch (const nlohmann::json::exception& e) {
        CHRONODB_WARN("Corrupt key record in '{}': {}", db, e.what());
        return false;
    }
}

void DatabaseRegistry::addDropListener(DropListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    drop_listeners_.push_back(std::move(listener));
}

} // namespace chronodb
