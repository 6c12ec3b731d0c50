#include "timeseries/series_store.h"
#include "storage/key_schema.h"
#include "storage/rocksdb_wrapper.h"
#include "utils/logger.h"

#include <algorithm>
#include <map>
#include <set>

namespace chronodb {

namespace {

const char* const kSeqMetaName = "next_seq";

} // namespace

SeriesStore::SeriesStore(RocksDBWrapper& db) : db_(db) {
    auto stored = db_.get(KeySchema::makeMetaKey(kSeqMetaName));
    if (stored) {
        try {
            next_seq_ = std::stoull(*stored);
        } catch (const std::exception& e) {
            CHRONODB_WARN("Ignoring corrupt sequence counter '{}': {}", *stored, e.what());
        }
    }
    CHRONODB_DEBUG("SeriesStore ready, next sequence {}", next_seq_);
}

std::vector<std::string> SeriesStore::loadSchema(const std::string& db, const std::string& series) const {
    std::vector<std::string> cols;
    auto raw = db_.get(KeySchema::makeSchemaKey(db, series));
    if (!raw) return cols;
    try {
        auto j = nlohmann::json::parse(*raw);
        for (const auto& c : j) {
            if (c.is_string()) cols.push_back(c.get<std::string>());
        }
    } catch (const nlohmann::json::exception& e) {
        CHRONODB_ERROR("Corrupt schema for {}/{}: {}", db, series, e.what());
    }
    return cols;
}

SeriesStore::Status SeriesStore::writeLocked(const std::string& db, const std::vector<Point>& points) {
    if (require_database_ && !db_.get(KeySchema::makeDatabaseKey(db))) {
        return Status::Error(Status::Code::NotFound, "Database '" + db + "' not found");
    }
    auto batch = db_.createWriteBatch();
    
    // Merge schemas once per series
    std::map<std::string, std::vector<std::string>> schemas;
    std::set<std::string> dirty;
    
    for (const auto& p : points) {
        if (auto err = KeySchema::validateSeriesName(p.series)) {
            return Status::Error(*err);
        }
        if (p.timestamp_ms < 0) {
            return Status::Error("Timestamp must not be negative in series '" + p.series + "'");
        }
        if (!p.values.is_object()) {
            return Status::Error("Point values must be an object");
        }
        
        auto it = schemas.find(p.series);
        if (it == schemas.end()) {
            it = schemas.emplace(p.series, loadSchema(db, p.series)).first;
            if (it->second.empty()) dirty.insert(p.series);
        }
        auto& cols = it->second;
        for (auto v = p.values.begin(); v != p.values.end(); ++v) {
            if (std::find(cols.begin(), cols.end(), v.key()) == cols.end()) {
                cols.push_back(v.key());
                dirty.insert(p.series);
            }
        }
        
        batch->put(KeySchema::makePointKey(db, p.series, p.timestamp_ms, p.seq), p.values.dump());
    }
    
    for (const auto& series : dirty) {
        batch->put(KeySchema::makeSchemaKey(db, series), nlohmann::json(schemas[series]).dump());
    }
    
    if (!batch->commit()) {
        CHRONODB_ERROR("Failed to write {} points to database {}", points.size(), db);
        return Status::Error("Failed to write points");
    }
    
    CHRONODB_DEBUG("Wrote {} points to database {} ({} series)", points.size(), db, schemas.size());
    return Status::OK();
}

SeriesStore::Status SeriesStore::writePoints(const std::string& db, std::vector<Point> points) {
    if (points.empty()) {
        return Status::OK();
    }
    
    std::lock_guard<std::mutex> lock(write_mutex_);
    const uint64_t first = next_seq_;
    for (auto& p : points) {
        p.seq = next_seq_++;
    }
    
    // Persist the counter before the points so a crash never reuses a sequence
    if (!db_.put(KeySchema::makeMetaKey(kSeqMetaName), std::to_string(next_seq_))) {
        next_seq_ = first;
        return Status::Error("Failed to persist sequence counter");
    }
    
    auto st = writeLocked(db, points);
    if (!st.ok) {
        // Sequence numbers are not reused; gaps are harmless
        CHRONODB_WARN("Write to {} rejected: {}", db, st.message);
    }
    return st;
}

SeriesStore::Status SeriesStore::writePointsWithSequence(const std::string& db, const std::vector<Point>& points) {
    if (points.empty()) {
        return Status::OK();
    }
    std::lock_guard<std::mutex> lock(write_mutex_);
    return writeLocked(db, points);
}

std::pair<SeriesStore::Status, std::vector<Point>>
SeriesStore::scan(const std::string& db, const std::string& series, const ScanOptions& options) const {
    std::vector<Point> results;
    
    if (series.empty()) {
        return {Status::Error("Series name is required"), results};
    }
    if (options.from_ms > options.to_ms) {
        return {Status::OK(), results};
    }
    
    const std::string start_key = KeySchema::pointTimeLowerBound(db, series, options.from_ms);
    std::string end_key;
    if (options.to_ms == std::numeric_limits<int64_t>::max()) {
        end_key = RocksDBWrapper::prefixUpperBound(KeySchema::pointSeriesPrefix(db, series));
    } else {
        end_key = KeySchema::pointTimeLowerBound(db, series, options.to_ms + 1);
    }
    
    auto visit = [&](std::string_view key, std::string_view value) {
        auto parsed = KeySchema::parsePointKey(key);
        if (!parsed || parsed->series != series) {
            return true;
        }
        Point p;
        p.series = series;
        p.timestamp_ms = parsed->timestamp_ms;
        p.seq = parsed->seq;
        try {
            p.values = nlohmann::json::parse(value);
        } catch (const nlohmann::json::exception& e) {
            CHRONODB_WARN("Skipping corrupt point {}: {}", std::string(key), e.what());
            return true;
        }
        if (options.predicate && !options.predicate(p)) {
            return true;
        }
        results.push_back(std::move(p));
        return options.limit == 0 || results.size() < options.limit;
    };
    
    if (options.descending) {
        db_.scanRangeReverse(start_key, end_key, visit);
    } else {
        db_.scanRange(start_key, end_key, visit);
    }
    
    CHRONODB_DEBUG("Scan {}/{} [{}, {}] returned {} points", db, series, options.from_ms, options.to_ms, results.size());
    return {Status::OK(), results};
}

std::vector<std::string> SeriesStore::listSeries(const std::string& db) const {
    std::vector<std::string> names;
    const std::string prefix = KeySchema::schemaPrefix(db);
    db_.scanPrefix(prefix, [&](std::string_view key, std::string_view) {
        names.emplace_back(key.substr(prefix.size()));
        return true;
    });
    return names;
}

std::vector<std::string> SeriesStore::columns(const std::string& db, const std::string& series) const {
    return loadSchema(db, series);
}

bool SeriesStore::seriesExists(const std::string& db, const std::string& series) const {
    return db_.get(KeySchema::makeSchemaKey(db, series)).has_value();
}

std::pair<SeriesStore::Status, size_t>
SeriesStore::deleteRange(const std::string& db, const std::string& series, int64_t from_ms, int64_t to_ms) {
    size_t deleted = 0;
    if (from_ms > to_ms) {
        return {Status::OK(), deleted};
    }
    
    const std::string start_key = KeySchema::pointTimeLowerBound(db, series, from_ms);
    std::string end_key;
    if (to_ms == std::numeric_limits<int64_t>::max()) {
        end_key = RocksDBWrapper::prefixUpperBound(KeySchema::pointSeriesPrefix(db, series));
    } else {
        end_key = KeySchema::pointTimeLowerBound(db, series, to_ms + 1);
    }
    
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto batch = db_.createWriteBatch();
    db_.scanRange(start_key, end_key, [&](std::string_view key, std::string_view) {
        batch->del(key);
        ++deleted;
        return true;
    });
    
    if (!batch->commit()) {
        CHRONODB_ERROR("Failed to delete range of {}/{}", db, series);
        return {Status::Error("Failed to delete points"), 0};
    }
    
    CHRONODB_INFO("Deleted {} points from {}/{} in [{}, {}]", deleted, db, series, from_ms, to_ms);
    return {Status::OK(), deleted};
}

SeriesStore::Status SeriesStore::dropSeries(const std::string& db, const std::string& series) {
    const std::string prefix = KeySchema::pointSeriesPrefix(db, series);
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto batch = db_.createWriteBatch();
    batch->deleteRange(prefix, RocksDBWrapper::prefixUpperBound(prefix));
    batch->del(KeySchema::makeSchemaKey(db, series));
    if (!batch->commit()) {
        return Status::Error("Failed to drop series " + series);
    }
    CHRONODB_INFO("Dropped series {}/{}", db, series);
    return Status::OK();
}

SeriesStore::Status SeriesStore::dropDatabase(const std::string& db) {
    const std::string points = KeySchema::pointDatabasePrefix(db);
    const std::string schemas = KeySchema::schemaPrefix(db);
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto batch = db_.createWriteBatch();
    batch->deleteRange(points, RocksDBWrapper::prefixUpperBound(points));
    batch->deleteRange(schemas, RocksDBWrapper::prefixUpperBound(schemas));
    if (!batch->commit()) {
        return Status::Error("Failed to drop data of database " + db);
    }
    // Reclaim the space of the range tombstones right away
    db_.compactRange(points, RocksDBWrapper::prefixUpperBound(points));
    CHRONODB_INFO("Dropped all series of database {}", db);
    return Status::OK();
}

} // namespace chronodb
