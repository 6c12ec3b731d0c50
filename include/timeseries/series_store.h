#ifndef CHRONODB_SERIES_STORE_H
#define CHRONODB_SERIES_STORE_H

#include <cstdint>
#include <functional>
#include <limits>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace chronodb {

class RocksDBWrapper;

/// A stored datapoint. values is a JSON object column -> scalar.
struct Point {
    std::string series;
    int64_t timestamp_ms = 0;
    uint64_t seq = 0;
    nlohmann::json values = nlohmann::json::object();
};

/**
 * @brief Point storage for all series of all databases.
 *
 * Key Schema: "pt:{db}:{series}:{ts20}:{seq20}" (see KeySchema)
 * Value: JSON object with one entry per column.
 *
 * Every series also keeps its ordered column list under "sc:{db}:{series}".
 * New columns are appended when a write carries them.
 *
 * Sequence numbers are server-assigned and unique across the store, so two
 * points with the same timestamp never overwrite each other.
 */
class SeriesStore {
public:
    struct Status {
        enum class Code { Ok, NotFound, Failed };
        bool ok = true;
        Code code = Code::Ok;
        std::string message;
        static Status OK() { return {}; }
        static Status Error(std::string msg) { return Status{false, Code::Failed, std::move(msg)}; }
        static Status Error(Code code, std::string msg) { return Status{false, code, std::move(msg)}; }
    };
    
    struct ScanOptions {
        int64_t from_ms = 0;                                    // inclusive
        int64_t to_ms = std::numeric_limits<int64_t>::max();    // inclusive
        bool descending = true;                                 // newest first
        size_t limit = 0;                                       // 0 = unlimited
        std::function<bool(const Point&)> predicate;            // optional filter
    };
    
    /**
     * @param db Open RocksDB wrapper (not owned)
     */
    explicit SeriesStore(RocksDBWrapper& db);
    
    /**
     * @brief Write a batch of points, assigning fresh sequence numbers.
     *
     * All points and schema updates are committed in a single RocksDB batch.
     * Points must have a valid series name and a non-negative timestamp.
     */
    Status writePoints(const std::string& db, std::vector<Point> points);
    
    /**
     * @brief Write points keeping the caller's sequence numbers.
     *
     * Writing the same (series, timestamp, seq) again replaces the stored point.
     */
    Status writePointsWithSequence(const std::string& db, const std::vector<Point>& points);
    
    /// Range scan of one series
    std::pair<Status, std::vector<Point>> scan(const std::string& db,
                                               const std::string& series,
                                               const ScanOptions& options) const;
    
    /// Names of all series in a database, sorted
    std::vector<std::string> listSeries(const std::string& db) const;
    
    /// Ordered column list of a series (empty if unknown)
    std::vector<std::string> columns(const std::string& db, const std::string& series) const;
    
    bool seriesExists(const std::string& db, const std::string& series) const;
    
    /// Delete points with from_ms <= time <= to_ms. Returns the number removed.
    std::pair<Status, size_t> deleteRange(const std::string& db, const std::string& series,
                                          int64_t from_ms, int64_t to_ms);
    
    /// Delete all points and the schema of a series
    Status dropSeries(const std::string& db, const std::string& series);
    
    /// Delete every point and schema of a database
    Status dropDatabase(const std::string& db);
    
    /**
     * @brief Reject writes to databases without a "db:{db}" record.
     *
     * The record is checked under the write lock, so a write either commits
     * before a concurrent dropDatabase or fails with Code::NotFound.
     * Call before the store is shared between threads.
     */
    void setRequireDatabase(bool require) { require_database_ = require; }

private:
    RocksDBWrapper& db_;
    // Guards sequence allocation and schema merges
    mutable std::mutex write_mutex_;
    uint64_t next_seq_ = 1;
    bool require_database_ = false;
    
    Status writeLocked(const std::string& db, const std::vector<Point>& points);
    std::vector<std::string> loadSchema(const std::string& db, const std::string& series) const;
};

} // namespace chronodb

#endif // CHRONODB_SERIES_STORE_H
