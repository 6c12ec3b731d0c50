#ifndef CHRONODB_CONTINUOUS_QUERY_H
#define CHRONODB_CONTINUOUS_QUERY_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

#include "query/query_engine.h"

namespace chronodb {

class RocksDBWrapper;
class SeriesStore;

/**
 * @brief Registered "select ... into ..." queries and their background runner.
 *
 * Definitions are persisted under "cq:{db}:{id}" and reloaded on construction.
 * Each run evaluates a query over [watermark, now] and writes its rows into the
 * target series with deterministic sequence numbers, so re-running a bucket
 * replaces the previous result instead of appending to it.
 *
 * Thread-Safety: all public methods are thread-safe.
 */
class ContinuousQueryManager {
public:
    struct Status {
        enum class Code { Ok, NotFound, InvalidArgument, Internal };
        bool ok = true;
        Code code = Code::Ok;
        std::string message;
        static Status OK() { return {}; }
        static Status Error(Code code, std::string msg) { return Status{false, code, std::move(msg)}; }
    };

    struct Definition {
        uint64_t id = 0;
        std::string db;
        std::string query;
        int64_t created_ms = 0;
        int64_t watermark_ms = 0;

        nlohmann::json toJson() const;
        static std::optional<Definition> fromJson(const nlohmann::json& j);
    };

    /// Receives one result set per stream tick. Returning false ends the stream.
    using StreamSink = std::function<bool(const std::vector<query::SeriesResult>&)>;

    ContinuousQueryManager(RocksDBWrapper& db, SeriesStore& store, const query::QueryEngine& engine);
    ~ContinuousQueryManager();

    ContinuousQueryManager(const ContinuousQueryManager&) = delete;
    ContinuousQueryManager& operator=(const ContinuousQueryManager&) = delete;

    std::pair<Status, Definition> registerQuery(const std::string& db, const std::string& query_text);

    std::vector<Definition> list(const std::string& db) const;

    Status remove(const std::string& db, uint64_t id);

    /// Drop every query of a database
    void removeAll(const std::string& db);

    /**
     * @brief Evaluate all registered queries once.
     * @param now_ms Evaluation time, 0 = wall clock
     * @return Number of points written
     */
    size_t runOnce(int64_t now_ms = 0);

    void start(std::chrono::milliseconds interval);
    void stop();
    bool isRunning() const { return running_; }

    /**
     * @brief Re-run an ordinary select every interval until duration elapses.
     *
     * Blocks the calling thread. Ends early when the sink returns false or the
     * manager is stopped.
     */
    Status stream(const std::string& db, const std::string& query_text,
                  std::chrono::milliseconds duration, std::chrono::milliseconds interval,
                  const StreamSink& sink,
                  utils::TimePrecision precision = utils::TimePrecision::Seconds);

    /// Expand ":series_name" in an into target
    static std::string targetName(const std::string& into, const std::string& series);

private:
    RocksDBWrapper& db_;
    SeriesStore& store_;
    const query::QueryEngine& engine_;

    mutable std::mutex mutex_;
    std::vector<Definition> queries_;
    uint64_t next_id_ = 1;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutting_down_{false};
    std::unique_ptr<std::thread> worker_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;

    void load();
    bool persist(const Definition& def);
    size_t runQuery(Definition& def, int64_t now_ms);
    void workerLoop(std::chrono::milliseconds interval);
};

} // namespace chronodb

#endif // CHRONODB_CONTINUOUS_QUERY_H
