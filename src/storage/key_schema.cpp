#include "storage/key_schema.h"

#include <cctype>
#include <charconv>
#include <cstdio>

namespace chronodb {

std::string KeySchema::pad20(uint64_t v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%020llu", static_cast<unsigned long long>(v));
    return std::string(buf);
}

std::string KeySchema::makeDatabaseKey(std::string_view db) {
    return databasePrefix() + std::string(db);
}

std::string KeySchema::databasePrefix() {
    return "db:";
}

std::string KeySchema::makeAccessKeyKey(std::string_view db, std::string_view key) {
    return accessKeyPrefix(db) + std::string(key);
}

std::string KeySchema::accessKeyPrefix(std::string_view db) {
    std::string k = "ak:";
    k.append(db);
    k.push_back(SEPARATOR);
    return k;
}

std::string KeySchema::makeSchemaKey(std::string_view db, std::string_view series) {
    return schemaPrefix(db) + std::string(series);
}

std::string KeySchema::schemaPrefix(std::string_view db) {
    std::string k = "sc:";
    k.append(db);
    k.push_back(SEPARATOR);
    return k;
}

std::string KeySchema::pointDatabasePrefix(std::string_view db) {
    std::string k = "pt:";
    k.append(db);
    k.push_back(SEPARATOR);
    return k;
}

std::string KeySchema::pointSeriesPrefix(std::string_view db, std::string_view series) {
    std::string k = pointDatabasePrefix(db);
    k.append(series);
    k.push_back(SEPARATOR);
    return k;
}

std::string KeySchema::pointTimeLowerBound(std::string_view db, std::string_view series, int64_t timestamp_ms) {
    std::string k = pointSeriesPrefix(db, series);
    k += pad20(static_cast<uint64_t>(timestamp_ms < 0 ? 0 : timestamp_ms));
    k.push_back(SEPARATOR);
    return k;
}

std::string KeySchema::makePointKey(std::string_view db, std::string_view series,
                                    int64_t timestamp_ms, uint64_t seq) {
    return pointTimeLowerBound(db, series, timestamp_ms) + pad20(seq);
}

std::string KeySchema::makeContinuousQueryKey(std::string_view db, uint64_t id) {
    return continuousQueryPrefix(db) + pad20(id);
}

std::string KeySchema::continuousQueryPrefix(std::string_view db) {
    std::string k = continuousQueryPrefixAll();
    k.append(db);
    k.push_back(SEPARATOR);
    return k;
}

std::string KeySchema::continuousQueryPrefixAll() {
    return "cq:";
}

std::string KeySchema::makeMetaKey(std::string_view name) {
    return "meta:" + std::string(name);
}

KeySchema::KeyType KeySchema::parseKeyType(std::string_view key) {
    if (key.starts_with("pt:")) return KeyType::POINT;
    if (key.starts_with("db:")) return KeyType::DATABASE;
    if (key.starts_with("ak:")) return KeyType::ACCESS_KEY;
    if (key.starts_with("sc:")) return KeyType::SCHEMA;
    if (key.starts_with("cq:")) return KeyType::CONTINUOUS_QUERY;
    if (key.starts_with("meta:")) return KeyType::META;
    return KeyType::UNKNOWN;
}

std::optional<KeySchema::PointKey> KeySchema::parsePointKey(std::string_view key) {
    if (!key.starts_with("pt:")) return std::nullopt;
    key.remove_prefix(3);

    // db has no separator; series has none either (validated on write),
    // so the layout is db:series:ts:seq
    auto p1 = key.find(SEPARATOR);
    if (p1 == std::string_view::npos) return std::nullopt;
    auto p3 = key.rfind(SEPARATOR);
    if (p3 == std::string_view::npos || p3 <= p1) return std::nullopt;
    auto p2 = key.rfind(SEPARATOR, p3 - 1);
    if (p2 == std::string_view::npos || p2 <= p1) return std::nullopt;

    PointKey out;
    out.db = std::string(key.substr(0, p1));
    out.series = std::string(key.substr(p1 + 1, p2 - p1 - 1));

    auto ts_part = key.substr(p2 + 1, p3 - p2 - 1);
    auto seq_part = key.substr(p3 + 1);
    uint64_t ts = 0;
    auto r1 = std::from_chars(ts_part.data(), ts_part.data() + ts_part.size(), ts);
    if (r1.ec != std::errc() || r1.ptr != ts_part.data() + ts_part.size()) return std::nullopt;
    auto r2 = std::from_chars(seq_part.data(), seq_part.data() + seq_part.size(), out.seq);
    if (r2.ec != std::errc() || r2.ptr != seq_part.data() + seq_part.size()) return std::nullopt;
    out.timestamp_ms = static_cast<int64_t>(ts);
    return out;
}

std::string KeySchema::extractLastComponent(std::string_view key) {
    auto last_sep = key.rfind(SEPARATOR);
    if (last_sep != std::string_view::npos) {
        return std::string(key.substr(last_sep + 1));
    }
    return std::string(key);
}

std::optional<std::string> KeySchema::validateDatabaseName(std::string_view name) {
    if (name.empty()) return std::string("database name must not be empty");
    if (name.size() > 128) return std::string("database name exceeds 128 characters");
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!(std::isalnum(uc) || c == '_' || c == '-' || c == '.')) {
            return std::string("database name may only contain [A-Za-z0-9_.-]");
        }
    }
    return std::nullopt;
}

std::optional<std::string> KeySchema::validateSeriesName(std::string_view name) {
    if (name.empty()) return std::string("series name must not be empty");
    if (name.size() > 256) return std::string("series name exceeds 256 characters");
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (c == SEPARATOR) return std::string("series name must not contain ':'");
        if (std::isspace(uc) || uc < 0x20 || uc == 0x7F) {
            return std::string("series name must not contain whitespace or control characters");
        }
    }
    return std::nullopt;
}

} // namespace chronodb
