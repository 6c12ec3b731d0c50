#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <optional>
#include <vector>
#include <functional>
#include <cstdint>

namespace rocksdb {
    class DB;
    class WriteBatch;
    class Options;
    class ReadOptions;
    class WriteOptions;
}

namespace chronodb {

/// Thin owner of a rocksdb::DB with the LSM tuning knobs exposed through Config.
/// All ChronoDB state (databases, keys, schemas, points, continuous queries)
/// lives in a single keyspace laid out by KeySchema.
class RocksDBWrapper {
public:
    struct Config {
        std::string db_path = "./data/chronodb";
        std::string wal_dir; // empty -> default under db_path

        size_t memtable_size_mb = 64;
        size_t block_cache_size_mb = 256;
        bool cache_index_and_filter_blocks = true;
        int bloom_bits_per_key = 10;
        bool sync_wal = false;
        int max_background_jobs = 4;

        // Write buffer tuning
        int max_write_buffer_number = 3;

        // Compression (best-effort; depends on RocksDB build)
        // Values: "none", "lz4", "zstd", "snappy", "zlib", "bzip2", "lz4hc"
        std::string compression_default = "lz4";
        std::string compression_bottommost = "zstd";
    };
    
    explicit RocksDBWrapper(const Config& config);
    ~RocksDBWrapper();
    
    RocksDBWrapper(const RocksDBWrapper&) = delete;
    RocksDBWrapper& operator=(const RocksDBWrapper&) = delete;
    
    /// Open the database (creates directories as needed)
    bool open();
    
    /// Close the database
    void close();
    
    // ===== CRUD Operations =====
    
    std::optional<std::string> get(std::string_view key);
    bool put(std::string_view key, std::string_view value);
    bool del(std::string_view key);
    
    // ===== Atomic Batch Operations =====
    
    class WriteBatchWrapper {
    public:
        explicit WriteBatchWrapper(RocksDBWrapper* db);
        ~WriteBatchWrapper();
        
        void put(std::string_view key, std::string_view value);
        void del(std::string_view key);
        /// Remove every key in [begin, end)
        void deleteRange(std::string_view begin, std::string_view end);
        
        /// Commit the batch atomically
        bool commit();
        
    private:
        RocksDBWrapper* db_;
        std::unique_ptr<rocksdb::WriteBatch> batch_;
        size_t ops_ = 0;
    };
    
    std::unique_ptr<WriteBatchWrapper> createWriteBatch();
    
    // ===== Iteration / Scanning =====
    
    /// Callback returns false to stop the scan
    using ScanCallback = std::function<bool(std::string_view key, std::string_view value)>;
    
    /// Ascending scan over all keys starting with prefix
    void scanPrefix(std::string_view prefix, ScanCallback callback);
    
    /// Ascending scan over [start_key, end_key)
    void scanRange(std::string_view start_key, std::string_view end_key, ScanCallback callback);
    
    /// Descending scan over [start_key, end_key)
    void scanRangeReverse(std::string_view start_key, std::string_view end_key, ScanCallback callback);
    
    // ===== Maintenance =====
    
    /// Compact [start_key, end_key), e.g. after dropping a database
    void compactRange(std::string_view start_key, std::string_view end_key);

    /// Smallest key greater than every key starting with prefix ("" if none)
    static std::string prefixUpperBound(std::string_view prefix);

private:
    Config config_;
    std::unique_ptr<rocksdb::DB> db_;
    std::unique_ptr<rocksdb::Options> options_;
    std::unique_ptr<rocksdb::ReadOptions> read_options_;
    std::unique_ptr<rocksdb::WriteOptions> write_options_;
    
    void configureOptions();
    bool commitBatch(rocksdb::WriteBatch* batch);
};

} // namespace chronodb
