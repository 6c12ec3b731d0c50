#include "timeseries/continuous_query.h"
#include "query/query_parser.h"
#include "storage/key_schema.h"
#include "storage/rocksdb_wrapper.h"
#include "timeseries/series_store.h"
#include "utils/logger.h"
#include "utils/time_utils.h"

#include <algorithm>
#include <unordered_map>

namespace chronodb {

namespace {

const std::string kSeriesPlaceholder = ":series_name";
const char* const kNextIdMeta = "next_cq_id";

uint64_t fnv1a(const std::string& data, uint64_t hash = 1469598103934665603ULL) {
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

bool hasAggregate(const query::Statement& stmt) {
    for (const auto& f : stmt.fields) {
        if (query::QueryEngine::containsAggregate(f)) return true;
    }
    return false;
}

// Keeps a query from reading the series it writes
std::function<bool(const std::string&)> excludeTargets(const std::string& into) {
    auto pos = into.find(kSeriesPlaceholder);
    if (pos == std::string::npos) {
        return [into](const std::string& s) { return s != into; };
    }
    std::string prefix = into.substr(0, pos);
    std::string suffix = into.substr(pos + kSeriesPlaceholder.size());
    if (prefix.empty() && suffix.empty()) {
        return {};
    }
    return [prefix, suffix](const std::string& s) {
        if (s.size() < prefix.size() + suffix.size()) return true;
        return !(s.compare(0, prefix.size(), prefix) == 0 &&
                 s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0);
    };
}

} // namespace

nlohmann::json ContinuousQueryManager::Definition::toJson() const {
    return nlohmann::json{
        {"id", id},
        {"db", db},
        {"query", query},
        {"created_ms", created_ms},
        {"watermark_ms", watermark_ms}
    };
}

std::optional<ContinuousQueryManager::Definition>
ContinuousQueryManager::Definition::fromJson(const nlohmann::json& j) {
    try {
        Definition d;
        d.id = j.at("id").get<uint64_t>();
        d.db = j.at("db").get<std::string>();
        d.query = j.at("query").get<std::string>();
        d.created_ms = j.value("created_ms", int64_t(0));
        d.watermark_ms = j.value("watermark_ms", int64_t(0));
        return d;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

ContinuousQueryManager::ContinuousQueryManager(RocksDBWrapper& db, SeriesStore& store,
                                               const query::QueryEngine& engine)
    : db_(db), store_(store), engine_(engine) {
    load();
}

ContinuousQueryManager::~ContinuousQueryManager() {
    shutting_down_ = true;
    stop();
}

std::string ContinuousQueryManager::targetName(const std::string& into, const std::string& series) {
    std::string out = into;
    size_t pos = 0;
    while ((pos = out.find(kSeriesPlaceholder, pos)) != std::string::npos) {
        out.replace(pos, kSeriesPlaceholder.size(), series);
        pos += series.size();
    }
    return out;
}

void ContinuousQueryManager::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    queries_.clear();

    db_.scanPrefix(KeySchema::continuousQueryPrefixAll(), [this](std::string_view key, std::string_view value) {
        try {
            auto def = Definition::fromJson(nlohmann::json::parse(value));
            if (!def) {
                CHRONODB_WARN("Skipping malformed continuous query at {}", std::string(key));
                return true;
            }
            next_id_ = std::max(next_id_, def->id + 1);
            queries_.push_back(std::move(*def));
        } catch (const nlohmann::json::exception& e) {
            CHRONODB_WARN("Skipping unreadable continuous query at {}: {}", std::string(key), e.what());
        }
        return true;
    });

    if (auto stored = db_.get(KeySchema::makeMetaKey(kNextIdMeta))) {
        try {
            next_id_ = std::max<uint64_t>(next_id_, std::stoull(*stored));
        } catch (const std::exception& e) {
            CHRONODB_WARN("Invalid continuous query id counter '{}': {}", *stored, e.what());
        }
    }

    std::sort(queries_.begin(), queries_.end(),
              [](const Definition& a, const Definition& b) { return a.id < b.id; });
    if (!queries_.empty()) {
        CHRONODB_INFO("Loaded {} continuous queries", queries_.size());
    }
}

bool ContinuousQueryManager::persist(const Definition& def) {
    return db_.put(KeySchema::makeContinuousQueryKey(def.db, def.id), def.toJson().dump());
}

std::pair<ContinuousQueryManager::Status, ContinuousQueryManager::Definition>
ContinuousQueryManager::registerQuery(const std::string& db, const std::string& query_text) {
    query::QueryParser parser;
    auto parsed = parser.parse(query_text);
    if (!parsed.success) {
        return {Status::Error(Status::Code::InvalidArgument, parsed.error.toString()), {}};
    }
    const auto& stmt = *parsed.statement;
    if (stmt.type != query::StatementType::Select || !stmt.into) {
        return {Status::Error(Status::Code::InvalidArgument,
                              "Continuous queries must be select statements with an into clause"), {}};
    }
    if (hasAggregate(stmt) && !stmt.group_by.bucket_ms) {
        return {Status::Error(Status::Code::InvalidArgument,
                              "Continuous queries with aggregates need group_by time(...)"), {}};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Definition def;
    def.id = next_id_++;
    def.db = db;
    def.query = query_text;
    def.created_ms = utils::nowMillis();

    if (!db_.put(KeySchema::makeMetaKey(kNextIdMeta), std::to_string(next_id_)) || !persist(def)) {
        CHRONODB_ERROR("Failed to persist continuous query {} for {}", def.id, db);
        return {Status::Error(Status::Code::Internal, "Failed to persist continuous query"), {}};
    }
    queries_.push_back(def);
    CHRONODB_INFO("Registered continuous query {} on {}: {}", def.id, db, query_text);
    return {Status::OK(), def};
}

std::vector<ContinuousQueryManager::Definition> ContinuousQueryManager::list(const std::string& db) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Definition> out;
    for (const auto& q : queries_) {
        if (q.db == db) out.push_back(q);
    }
    return out;
}

ContinuousQueryManager::Status ContinuousQueryManager::remove(const std::string& db, uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(queries_.begin(), queries_.end(),
                           [&](const Definition& d) { return d.db == db && d.id == id; });
    if (it == queries_.end()) {
        return Status::Error(Status::Code::NotFound, "Continuous query not found: " + std::to_string(id));
    }
    if (!db_.del(KeySchema::makeContinuousQueryKey(db, id))) {
        return Status::Error(Status::Code::Internal, "Failed to delete continuous query");
    }
    queries_.erase(it);
    CHRONODB_INFO("Removed continuous query {} from {}", id, db);
    return Status::OK();
}

void ContinuousQueryManager::removeAll(const std::string& db) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = queries_.begin(); it != queries_.end();) {
        if (it->db != db) {
            ++it;
            continue;
        }
        if (!db_.del(KeySchema::makeContinuousQueryKey(db, it->id))) {
            CHRONODB_ERROR("Failed to delete continuous query {} of {}", it->id, db);
        }
        it = queries_.erase(it);
        ++removed;
    }
    if (removed > 0) {
        CHRONODB_INFO("Removed {} continuous queries of dropped database {}", removed, db);
    }
}

size_t ContinuousQueryManager::runQuery(Definition& def, int64_t now_ms) {
    query::QueryParser parser;
    auto parsed = parser.parse(def.query);
    if (!parsed.success) {
        CHRONODB_WARN("Continuous query {} no longer parses: {}", def.id, parsed.error.toString());
        return 0;
    }
    const auto& stmt = *parsed.statement;
    const bool aggregate = hasAggregate(stmt);

    query::QueryEngine::ExecOptions opts;
    opts.precision = utils::TimePrecision::Milliseconds;
    opts.now_ms = now_ms;
    opts.min_from_ms = def.watermark_ms;
    opts.backfill = true;
    opts.unlimited = true;
    opts.series_filter = excludeTargets(*stmt.into);

    auto [st, results] = engine_.execute(def.db, stmt, opts);
    if (!st.ok && st.code == query::QueryEngine::Status::Code::NotFound) {
        // Source not written yet
        CHRONODB_DEBUG("Continuous query {} on {} skipped: {}", def.id, def.db, st.message);
        return 0;
    }
    if (!st.ok) {
        CHRONODB_WARN("Continuous query {} on {} failed: {}", def.id, def.db, st.message);
        return 0;
    }

    size_t written = 0;
    int64_t newest = def.watermark_ms;
    for (const auto& res : results) {
        auto time_it = std::find(res.columns.begin(), res.columns.end(), "time");
        if (time_it == res.columns.end()) continue;
        const size_t time_idx = static_cast<size_t>(time_it - res.columns.begin());
        const std::string target = targetName(*stmt.into, res.name);

        std::vector<Point> points;
        // Identical raw rows are numbered so duplicate source points stay distinct
        std::unordered_map<std::string, size_t> occurrences;
        for (const auto& row : res.datapoints) {
            if (!row.is_array() || row.size() != res.columns.size() || !row[time_idx].is_number_integer()) {
                continue;
            }
            Point p;
            p.series = target;
            p.timestamp_ms = row[time_idx].get<int64_t>();

            std::string identity = std::to_string(p.timestamp_ms);
            for (size_t i = 0; i < row.size(); ++i) {
                if (i == time_idx) continue;
                const auto& v = row[i];
                // Aggregate rows are identified by bucket and group values only
                if (!aggregate || i > time_idx) identity += "|" + v.dump();
                if (v.is_null()) continue;
                p.values[res.columns[i]] = (v.is_array() || v.is_object()) ? nlohmann::json(v.dump()) : v;
            }
            if (p.values.empty()) continue;
            if (!aggregate) identity += "#" + std::to_string(occurrences[identity]++);
            p.seq = fnv1a(identity) | (1ULL << 63);
            newest = std::max(newest, p.timestamp_ms);
            points.push_back(std::move(p));
        }
        if (points.empty()) continue;

        auto wst = store_.writePointsWithSequence(def.db, points);
        if (!wst.ok) {
            CHRONODB_ERROR("Continuous query {} could not write {}: {}", def.id, target, wst.message);
            return written;
        }
        written += points.size();
    }
    def.watermark_ms = newest;
    return written;
}

size_t ContinuousQueryManager::runOnce(int64_t now_ms) {
    if (now_ms <= 0) now_ms = utils::nowMillis();

    std::vector<Definition> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot = queries_;
    }

    size_t total = 0;
    for (auto& def : snapshot) {
        const int64_t before = def.watermark_ms;
        total += runQuery(def, now_ms);
        if (def.watermark_ms == before) continue;

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(queries_.begin(), queries_.end(),
                               [&](const Definition& d) { return d.db == def.db && d.id == def.id; });
        // Removed while running
        if (it == queries_.end()) continue;
        it->watermark_ms = std::max(it->watermark_ms, def.watermark_ms);
        if (!persist(*it)) {
            CHRONODB_ERROR("Failed to persist watermark of continuous query {}", it->id);
        }
    }
    if (total > 0) {
        CHRONODB_DEBUG("Continuous queries wrote {} points", total);
    }
    return total;
}

void ContinuousQueryManager::start(std::chrono::milliseconds interval) {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    if (running_) {
        CHRONODB_WARN("Continuous query worker already running");
        return;
    }
    running_ = true;
    worker_ = std::make_unique<std::thread>(&ContinuousQueryManager::workerLoop, this, interval);
    CHRONODB_INFO("Continuous query worker started (interval: {}ms)", interval.count());
}

void ContinuousQueryManager::stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        if (!running_) {
            wake_cv_.notify_all();
            return;
        }
        running_ = false;
    }
    wake_cv_.notify_all();
    if (worker_ && worker_->joinable()) {
        worker_->join();
    }
    worker_.reset();
    CHRONODB_INFO("Continuous query worker stopped");
}

void ContinuousQueryManager::workerLoop(std::chrono::milliseconds interval) {
    while (running_) {
        {
            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_cv_.wait_for(lock, interval, [this] { return !running_; });
        }
        if (!running_) break;
        try {
            runOnce();
        } catch (const std::exception& e) {
            CHRONODB_ERROR("Continuous query run failed: {}", e.what());
        }
    }
}

ContinuousQueryManager::Status ContinuousQueryManager::stream(const std::string& db,
                                                              const std::string& query_text,
                                                              std::chrono::milliseconds duration,
                                                              std::chrono::milliseconds interval,
                                                              const StreamSink& sink,
                                                              utils::TimePrecision precision) {
    query::QueryParser parser;
    auto parsed = parser.parse(query_text);
    if (!parsed.success) {
        return Status::Error(Status::Code::InvalidArgument, parsed.error.toString());
    }
    const auto& stmt = *parsed.statement;
    if (stmt.type != query::StatementType::Select || stmt.into) {
        return Status::Error(Status::Code::InvalidArgument, "Only select statements without into can be streamed");
    }
    if (interval.count() <= 0) {
        interval = std::chrono::milliseconds(1000);
    }

    query::QueryEngine::ExecOptions opts;
    opts.precision = precision;

    const auto deadline = std::chrono::steady_clock::now() + duration;
    size_t ticks = 0;
    while (!shutting_down_) {
        auto [st, results] = engine_.execute(db, stmt, opts);
        if (!st.ok) {
            const auto code = st.code == query::QueryEngine::Status::Code::NotFound ? Status::Code::NotFound
                                                                                  : Status::Code::InvalidArgument;
            return Status::Error(code, st.message);
        }
        ++ticks;
        if (!sink(results)) break;
        if (std::chrono::steady_clock::now() + interval > deadline) break;

        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_cv_.wait_for(lock, interval, [this] { return shutting_down_.load(); });
    }
    CHRONODB_DEBUG("Stream on {} finished after {} ticks", db, ticks);
    return Status::OK();
}

} // namespace chronodb
