#include "storage/rocksdb_wrapper.h"
#include "utils/logger.h"
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/write_batch.h>
#include <rocksdb/iterator.h>
#include <rocksdb/table.h>
#include <rocksdb/cache.h>
#include <rocksdb/filter_policy.h>
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace chronodb {

namespace {

// Smallest key strictly greater than every key starting with prefix.
// Empty result means "no upper bound" (prefix was all 0xFF).
std::string prefixUpperBoundImpl(std::string_view prefix) {
    std::string upper(prefix);
    while (!upper.empty()) {
        unsigned char last = static_cast<unsigned char>(upper.back());
        if (last != 0xFF) {
            upper.back() = static_cast<char>(last + 1);
            return upper;
        }
        upper.pop_back();
    }
    return upper;
}

rocksdb::CompressionType toCompression(const std::string& s) {
    std::string v = s;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c){ return std::tolower(c); });
    if (v == "lz4") return rocksdb::kLZ4Compression;
    if (v == "lz4hc") return rocksdb::kLZ4HCCompression;
    if (v == "zstd") return rocksdb::kZSTD;
    if (v == "snappy") return rocksdb::kSnappyCompression;
    if (v == "zlib") return rocksdb::kZlibCompression;
    if (v == "bzip2" || v == "bz2") return rocksdb::kBZip2Compression;
    return rocksdb::kNoCompression;
}

} // namespace

std::string RocksDBWrapper::prefixUpperBound(std::string_view prefix) {
    return prefixUpperBoundImpl(prefix);
}

RocksDBWrapper::RocksDBWrapper(const Config& config) : config_(config) {
    options_ = std::make_unique<rocksdb::Options>();
    read_options_ = std::make_unique<rocksdb::ReadOptions>();
    write_options_ = std::make_unique<rocksdb::WriteOptions>();
    configureOptions();
}

RocksDBWrapper::~RocksDBWrapper() {
    close();
}

void RocksDBWrapper::configureOptions() {
    options_->create_if_missing = true;
    // Memtable (write buffer) configuration
    options_->write_buffer_size = config_.memtable_size_mb * 1024 * 1024;
    options_->max_write_buffer_number = config_.max_write_buffer_number;
    
    // Block cache + bloom filter
    rocksdb::BlockBasedTableOptions table_options;
    table_options.block_cache = rocksdb::NewLRUCache(config_.block_cache_size_mb * 1024 * 1024);
    table_options.cache_index_and_filter_blocks = config_.cache_index_and_filter_blocks;
    table_options.filter_policy.reset(rocksdb::NewBloomFilterPolicy(config_.bloom_bits_per_key, false));
    options_->table_factory.reset(rocksdb::NewBlockBasedTableFactory(table_options));
    
    options_->max_background_jobs = config_.max_background_jobs;
    options_->level_compaction_dynamic_level_bytes = true;
    
    options_->compression = toCompression(config_.compression_default);
    options_->bottommost_compression = toCompression(config_.compression_bottommost);
    
    write_options_->sync = config_.sync_wal;
    if (!config_.wal_dir.empty()) {
        options_->wal_dir = config_.wal_dir;
    }
}

bool RocksDBWrapper::open() {
    try {
        std::error_code ec;
        std::filesystem::path dbp(config_.db_path);
        std::filesystem::create_directories(dbp, ec);
        if (ec) {
            CHRONODB_ERROR("Failed to create DB directory '{}': {}", dbp.string(), ec.message());
            return false;
        }
        if (!config_.wal_dir.empty()) {
            ec.clear();
            std::filesystem::create_directories(config_.wal_dir, ec);
            if (ec) {
                CHRONODB_ERROR("Failed to create WAL directory '{}': {}", config_.wal_dir, ec.message());
                return false;
            }
        }
    } catch (const std::exception& e) {
        CHRONODB_ERROR("Exception while ensuring DB directories: {}", e.what());
        return false;
    }

    rocksdb::DB* raw = nullptr;
    rocksdb::Status status = rocksdb::DB::Open(*options_, config_.db_path, &raw);
    if (!status.ok()) {
        CHRONODB_ERROR("Failed to open RocksDB at {}: {}", config_.db_path, status.ToString());
        return false;
    }
    
    db_.reset(raw);
    CHRONODB_INFO("Opened RocksDB at: {}", config_.db_path);
    return true;
}

void RocksDBWrapper::close() {
    if (db_) {
        CHRONODB_INFO("Closing RocksDB");
        db_.reset();
    }
}

std::optional<std::string> RocksDBWrapper::get(std::string_view key) {
    if (!db_) return std::nullopt;
    
    std::string value;
    rocksdb::Status status = db_->Get(*read_options_, rocksdb::Slice(key.data(), key.size()), &value);
    if (status.ok()) {
        return value;
    }
    if (!status.IsNotFound()) {
        CHRONODB_ERROR("RocksDB get failed: {}", status.ToString());
    }
    return std::nullopt;
}

bool RocksDBWrapper::put(std::string_view key, std::string_view value) {
    if (!db_) return false;
    
    rocksdb::Status status = db_->Put(
        *write_options_,
        rocksdb::Slice(key.data(), key.size()),
        rocksdb::Slice(value.data(), value.size())
    );
    if (!status.ok()) {
        CHRONODB_ERROR("RocksDB put failed: {}", status.ToString());
    }
    return status.ok();
}

bool RocksDBWrapper::del(std::string_view key) {
    if (!db_) return false;
    
    rocksdb::Status status = db_->Delete(*write_options_, rocksdb::Slice(key.data(), key.size()));
    if (!status.ok()) {
        CHRONODB_ERROR("RocksDB delete failed: {}", status.ToString());
    }
    return status.ok();
}

// WriteBatchWrapper implementation

RocksDBWrapper::WriteBatchWrapper::WriteBatchWrapper(RocksDBWrapper* db)
    : db_(db), batch_(std::make_unique<rocksdb::WriteBatch>()) {}

RocksDBWrapper::WriteBatchWrapper::~WriteBatchWrapper() = default;

void RocksDBWrapper::WriteBatchWrapper::put(std::string_view key, std::string_view value) {
    batch_->Put(
        rocksdb::Slice(key.data(), key.size()),
        rocksdb::Slice(value.data(), value.size())
    );
    ++ops_;
}

void RocksDBWrapper::WriteBatchWrapper::del(std::string_view key) {
    batch_->Delete(rocksdb::Slice(key.data(), key.size()));
    ++ops_;
}

void RocksDBWrapper::WriteBatchWrapper::deleteRange(std::string_view begin, std::string_view end) {
    batch_->DeleteRange(
        rocksdb::Slice(begin.data(), begin.size()),
        rocksdb::Slice(end.data(), end.size())
    );
    ++ops_;
}

bool RocksDBWrapper::WriteBatchWrapper::commit() {
    if (ops_ == 0) return true;
    bool ok = db_->commitBatch(batch_.get());
    if (ok) {
        batch_->Clear();
        ops_ = 0;
    }
    return ok;
}

std::unique_ptr<RocksDBWrapper::WriteBatchWrapper> RocksDBWrapper::createWriteBatch() {
    return std::make_unique<WriteBatchWrapper>(this);
}

bool RocksDBWrapper::commitBatch(rocksdb::WriteBatch* batch) {
    if (!db_) return false;
    
    rocksdb::Status status = db_->Write(*write_options_, batch);
    if (!status.ok()) {
        CHRONODB_ERROR("RocksDB batch commit failed: {}", status.ToString());
    }
    return status.ok();
}

void RocksDBWrapper::scanPrefix(std::string_view prefix, ScanCallback callback) {
    if (!db_) return;
    
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(*read_options_));
    rocksdb::Slice prefix_slice(prefix.data(), prefix.size());
    
    for (it->Seek(prefix_slice); it->Valid() && it->key().starts_with(prefix_slice); it->Next()) {
        std::string_view key(it->key().data(), it->key().size());
        std::string_view value(it->value().data(), it->value().size());
        if (!callback(key, value)) {
            break;
        }
    }
}

void RocksDBWrapper::scanRange(std::string_view start_key, std::string_view end_key, ScanCallback callback) {
    if (!db_) return;
    
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(*read_options_));
    rocksdb::Slice start_slice(start_key.data(), start_key.size());
    rocksdb::Slice end_slice(end_key.data(), end_key.size());
    
    for (it->Seek(start_slice); it->Valid() && it->key().compare(end_slice) < 0; it->Next()) {
        std::string_view key(it->key().data(), it->key().size());
        std::string_view value(it->value().data(), it->value().size());
        if (!callback(key, value)) {
            break;
        }
    }
}

void RocksDBWrapper::scanRangeReverse(std::string_view start_key, std::string_view end_key, ScanCallback callback) {
    if (!db_) return;
    
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(*read_options_));
    rocksdb::Slice start_slice(start_key.data(), start_key.size());
    rocksdb::Slice end_slice(end_key.data(), end_key.size());
    
    // SeekForPrev lands on the last key <= end_key; end is exclusive
    it->SeekForPrev(end_slice);
    if (it->Valid() && it->key().compare(end_slice) == 0) {
        it->Prev();
    }
    for (; it->Valid() && it->key().compare(start_slice) >= 0; it->Prev()) {
        std::string_view key(it->key().data(), it->key().size());
        std::string_view value(it->value().data(), it->value().size());
        if (!callback(key, value)) {
            break;
        }
    }
}

void RocksDBWrapper::compactRange(std::string_view start_key, std::string_view end_key) {
    if (!db_) return;
    
    rocksdb::Slice start(start_key.data(), start_key.size());
    rocksdb::Slice end(end_key.data(), end_key.size());
    rocksdb::CompactRangeOptions options;
    // An empty end key means "up to the last key"
    rocksdb::Status st = db_->CompactRange(options, &start, end_key.empty() ? nullptr : &end);
    if (!st.ok()) {
        CHRONODB_WARN("CompactRange failed: {}", st.ToString());
    }
}

} // namespace chronodb
