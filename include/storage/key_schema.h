#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace chronodb {

/// Key layout of the single RocksDB keyspace.
///
///   db:{db}                          database record
///   ak:{db}:{key}                    access key
///   sc:{db}:{series}                 series schema (ordered column list)
///   pt:{db}:{series}:{ts20}:{seq20}  datapoint, value = JSON object of columns
///   cq:{db}:{id20}                   continuous query definition
///   meta:{name}                      server counters
///
/// Timestamps and sequence numbers are zero-padded to 20 digits so that
/// lexicographic order equals numeric order.
class KeySchema {
public:
    enum class KeyType : uint8_t {
        DATABASE,
        ACCESS_KEY,
        SCHEMA,
        POINT,
        CONTINUOUS_QUERY,
        META,
        UNKNOWN
    };

    struct PointKey {
        std::string db;
        std::string series;
        int64_t timestamp_ms = 0;
        uint64_t seq = 0;
    };

    static std::string makeDatabaseKey(std::string_view db);
    static std::string databasePrefix();

    static std::string makeAccessKeyKey(std::string_view db, std::string_view key);
    static std::string accessKeyPrefix(std::string_view db);

    static std::string makeSchemaKey(std::string_view db, std::string_view series);
    static std::string schemaPrefix(std::string_view db);

    static std::string makePointKey(std::string_view db, std::string_view series,
                                    int64_t timestamp_ms, uint64_t seq);
    /// Prefix of all points in one series
    static std::string pointSeriesPrefix(std::string_view db, std::string_view series);
    /// Prefix of all points in one database
    static std::string pointDatabasePrefix(std::string_view db);
    /// Lowest key for the given timestamp (seq 0)
    static std::string pointTimeLowerBound(std::string_view db, std::string_view series, int64_t timestamp_ms);

    static std::string makeContinuousQueryKey(std::string_view db, uint64_t id);
    static std::string continuousQueryPrefix(std::string_view db);
    static std::string continuousQueryPrefixAll();

    static std::string makeMetaKey(std::string_view name);

    static KeyType parseKeyType(std::string_view key);
    static std::optional<PointKey> parsePointKey(std::string_view key);

    /// Last ':'-separated component of a key
    static std::string extractLastComponent(std::string_view key);

    /// Zero-padded decimal used for timestamps, sequence numbers and ids
    static std::string pad20(uint64_t v);

    /// Validation of user-supplied names; nullopt when valid, else the reason
    static std::optional<std::string> validateDatabaseName(std::string_view name);
    static std::optional<std::string> validateSeriesName(std::string_view name);

    static constexpr char SEPARATOR = ':';
};

} // namespace chronodb
