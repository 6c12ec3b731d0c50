#include <gtest/gtest.h>
#include <filesystem>
#include <nlohmann/json.hpp>

#include "query/query_engine.h"
#include "storage/rocksdb_wrapper.h"
#include "timeseries/continuous_query.h"
#include "timeseries/series_store.h"
#include "utils/time_utils.h"

using json = nlohmann::json;
using namespace chronodb;
using Code = ContinuousQueryManager::Status::Code;

namespace {
constexpr int64_t kHourStart = 1311836400000LL;
constexpr int64_t kHour = 3600 * 1000LL;
}

class ContinuousQueryTest : public ::testing::Test {
protected:
    const std::string db_path_ = "./data/chronodb_continuous_query_test";
    std::unique_ptr<RocksDBWrapper> db_;
    std::unique_ptr<SeriesStore> store_;
    std::unique_ptr<query::QueryEngine> engine_;
    std::unique_ptr<ContinuousQueryManager> cq_;

    void SetUp() override {
        std::filesystem::remove_all(db_path_);
        RocksDBWrapper::Config cfg;
        cfg.db_path = db_path_;
        db_ = std::make_unique<RocksDBWrapper>(cfg);
        ASSERT_TRUE(db_->open());
        store_ = std::make_unique<SeriesStore>(*db_);
        engine_ = std::make_unique<query::QueryEngine>(*store_);
        cq_ = std::make_unique<ContinuousQueryManager>(*db_, *store_, *engine_);
    }

    void TearDown() override {
        cq_.reset();
        engine_.reset();
        store_.reset();
        db_->close();
        std::filesystem::remove_all(db_path_);
    }

    void write(const std::string& series, int64_t ts_ms, json values) {
        Point p;
        p.series = series;
        p.timestamp_ms = ts_ms;
        p.values = std::move(values);
        ASSERT_TRUE(store_->writePoints("metrics", {p}).ok);
    }

    std::vector<Point> scanAsc(const std::string& series) {
        SeriesStore::ScanOptions opts;
        opts.descending = false;
        auto [st, pts] = store_->scan("metrics", series, opts);
        EXPECT_TRUE(st.ok);
        return pts;
    }
};

TEST_F(ContinuousQueryTest, RegisterValidatesQuery) {
    auto [st1, d1] = cq_->registerQuery("metrics", "select count(*) from events group_by time(1h)");
    EXPECT_EQ(st1.code, Code::InvalidArgument);

    auto [st2, d2] = cq_->registerQuery("metrics", "select count(*) from events into events.total");
    EXPECT_EQ(st2.code, Code::InvalidArgument);

    auto [st3, d3] = cq_->registerQuery("metrics", "select from");
    EXPECT_EQ(st3.code, Code::InvalidArgument);

    auto [st4, d4] = cq_->registerQuery("metrics", "select count(*) from events group_by time(1h) into events.count.1h");
    ASSERT_TRUE(st4.ok) << st4.message;
    EXPECT_EQ(d4.id, 1u);
    EXPECT_EQ(d4.db, "metrics");

    auto [st5, d5] = cq_->registerQuery("metrics", "select value from cpu into cpu.copy");
    ASSERT_TRUE(st5.ok) << st5.message;
    EXPECT_EQ(d5.id, 2u);

    EXPECT_EQ(cq_->list("metrics").size(), 2u);
    EXPECT_TRUE(cq_->list("other").empty());
}

TEST_F(ContinuousQueryTest, DownsamplesIntoTargetSeries) {
    write("events", kHourStart + 1000, {{"value", 1}});
    write("events", kHourStart + 2000, {{"value", 1}});
    write("events", kHourStart + kHour + 5000, {{"value", 1}});

    auto [st, def] = cq_->registerQuery("metrics", "select count(*) from events group_by time(1h) into events.count.1h");
    ASSERT_TRUE(st.ok) << st.message;

    EXPECT_EQ(cq_->runOnce(kHourStart + 2 * kHour), 2u);
    auto pts = scanAsc("events.count.1h");
    ASSERT_EQ(pts.size(), 2u);
    EXPECT_EQ(pts[0].timestamp_ms, kHourStart);
    EXPECT_EQ(pts[0].values["count"], 2);
    EXPECT_EQ(pts[1].timestamp_ms, kHourStart + kHour);
    EXPECT_EQ(pts[1].values["count"], 1);

    // A late point in the open bucket replaces that bucket's row
    write("events", kHourStart + kHour + 9000, {{"value", 1}});
    cq_->runOnce(kHourStart + 2 * kHour + 1000);
    pts = scanAsc("events.count.1h");
    ASSERT_EQ(pts.size(), 2u);
    EXPECT_EQ(pts[0].values["count"], 2);
    EXPECT_EQ(pts[1].values["count"], 2);

    auto defs = cq_->list("metrics");
    ASSERT_EQ(defs.size(), 1u);
    EXPECT_EQ(defs[0].watermark_ms, kHourStart + kHour);
}

TEST_F(ContinuousQueryTest, SeriesNamePlaceholder) {
    write("cpu.idle", kHourStart + 1000, {{"value", 10}});
    write("cpu.idle", kHourStart + 2000, {{"value", 20}});
    write("cpu.user", kHourStart + 1000, {{"value", 4}});

    auto [st, def] = cq_->registerQuery("metrics",
        "select mean(value) from /cpu\\..*/ group_by time(1m) into :series_name.1m");
    ASSERT_TRUE(st.ok) << st.message;

    EXPECT_EQ(cq_->runOnce(kHourStart + kHour), 2u);
    auto idle = scanAsc("cpu.idle.1m");
    ASSERT_EQ(idle.size(), 1u);
    EXPECT_DOUBLE_EQ(idle[0].values["mean"].get<double>(), 15.0);
    auto user = scanAsc("cpu.user.1m");
    ASSERT_EQ(user.size(), 1u);

    // Outputs are not fed back into the query
    cq_->runOnce(kHourStart + kHour + 1000);
    EXPECT_FALSE(store_->seriesExists("metrics", "cpu.idle.1m.1m"));
}

TEST_F(ContinuousQueryTest, RawCopyKeepsDuplicatePoints) {
    write("cpu", kHourStart + 1000, {{"value", 7}});
    write("cpu", kHourStart + 1000, {{"value", 7}});
    write("cpu", kHourStart + 2000, {{"value", 8}});

    auto [st, def] = cq_->registerQuery("metrics", "select value from cpu into cpu.copy");
    ASSERT_TRUE(st.ok) << st.message;
    EXPECT_EQ(cq_->runOnce(kHourStart + kHour), 3u);
    EXPECT_EQ(scanAsc("cpu.copy").size(), 3u);

    // Rerunning from the watermark rewrites the same keys
    cq_->runOnce(kHourStart + kHour + 1000);
    EXPECT_EQ(scanAsc("cpu.copy").size(), 3u);

    // A third identical point at the watermark adds exactly one row
    write("cpu", kHourStart + 2000, {{"value", 8}});
    cq_->runOnce(kHourStart + kHour + 2000);
    auto pts = scanAsc("cpu.copy");
    ASSERT_EQ(pts.size(), 4u);
    EXPECT_EQ(pts[3].timestamp_ms, kHourStart + 2000);
}

TEST_F(ContinuousQueryTest, MissingSourceIsSkipped) {
    auto [st, def] = cq_->registerQuery("metrics", "select value from later into later.copy");
    ASSERT_TRUE(st.ok) << st.message;
    EXPECT_EQ(cq_->runOnce(kHourStart + kHour), 0u);
    EXPECT_FALSE(store_->seriesExists("metrics", "later.copy"));

    write("later", kHourStart + kHour + 500, {{"value", 1}});
    EXPECT_EQ(cq_->runOnce(kHourStart + 2 * kHour), 1u);
    EXPECT_EQ(scanAsc("later.copy").size(), 1u);

    auto missing = cq_->stream("metrics", "select value from nosuch", std::chrono::milliseconds(0),
                               std::chrono::milliseconds(100),
                               [](const std::vector<query::SeriesResult>&) { return true; });
    EXPECT_EQ(missing.code, Code::NotFound);
}

TEST_F(ContinuousQueryTest, TargetName) {
    EXPECT_EQ(ContinuousQueryManager::targetName(":series_name.1h", "cpu.idle"), "cpu.idle.1h");
    EXPECT_EQ(ContinuousQueryManager::targetName("rollup.:series_name", "a"), "rollup.a");
    EXPECT_EQ(ContinuousQueryManager::targetName("fixed", "a"), "fixed");
}

TEST_F(ContinuousQueryTest, RemoveAndPersistence) {
    auto [st1, a] = cq_->registerQuery("metrics", "select value from a into a.copy");
    auto [st2, b] = cq_->registerQuery("metrics", "select value from b into b.copy");
    auto [st3, c] = cq_->registerQuery("events", "select value from c into c.copy");
    ASSERT_TRUE(st1.ok && st2.ok && st3.ok);

    EXPECT_TRUE(cq_->remove("metrics", a.id).ok);
    EXPECT_EQ(cq_->remove("metrics", a.id).code, Code::NotFound);
    EXPECT_EQ(cq_->remove("metrics", c.id).code, Code::NotFound);

    cq_ = std::make_unique<ContinuousQueryManager>(*db_, *store_, *engine_);
    auto defs = cq_->list("metrics");
    ASSERT_EQ(defs.size(), 1u);
    EXPECT_EQ(defs[0].id, b.id);
    EXPECT_EQ(defs[0].query, "select value from b into b.copy");

    // Ids are never reused
    auto [st4, d] = cq_->registerQuery("metrics", "select value from d into d.copy");
    ASSERT_TRUE(st4.ok);
    EXPECT_GT(d.id, c.id);

    cq_->removeAll("events");
    EXPECT_TRUE(cq_->list("events").empty());
    EXPECT_EQ(cq_->list("metrics").size(), 2u);
}

TEST_F(ContinuousQueryTest, StartStop) {
    EXPECT_FALSE(cq_->isRunning());
    cq_->start(std::chrono::milliseconds(50));
    EXPECT_TRUE(cq_->isRunning());
    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    cq_->stop();
    EXPECT_FALSE(cq_->isRunning());
}

TEST_F(ContinuousQueryTest, StreamRunsSelectPeriodically) {
    write("cpu", utils::nowMillis() - 1000, {{"value", 1}});

    size_t calls = 0;
    auto st = cq_->stream("metrics", "select value from cpu", std::chrono::milliseconds(0),
                          std::chrono::milliseconds(100),
                          [&](const std::vector<query::SeriesResult>& results) {
                              ++calls;
                              EXPECT_EQ(results.size(), 1u);
                              if (!results.empty()) EXPECT_EQ(results[0].datapoints.size(), 1u);
                              return true;
                          });
    ASSERT_TRUE(st.ok) << st.message;
    EXPECT_EQ(calls, 1u);

    calls = 0;
    st = cq_->stream("metrics", "select value from cpu", std::chrono::milliseconds(5000),
                     std::chrono::milliseconds(10),
                     [&](const std::vector<query::SeriesResult>&) { return ++calls < 3; });
    ASSERT_TRUE(st.ok);
    EXPECT_EQ(calls, 3u);

    auto bad = cq_->stream("metrics", "select value from cpu into x", std::chrono::milliseconds(100),
                           std::chrono::milliseconds(10),
                           [](const std::vector<query::SeriesResult>&) { return true; });
    EXPECT_EQ(bad.code, Code::InvalidArgument);
}
