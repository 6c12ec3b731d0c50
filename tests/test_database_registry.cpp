#include <gtest/gtest.h>
#include <atomic>
#include <filesystem>
#include <thread>

#include "meta/database_registry.h"
#include "storage/rocksdb_wrapper.h"
#include "timeseries/series_store.h"

using namespace chronodb;
using Permission = DatabaseRegistry::Permission;
using Code = DatabaseRegistry::Status::Code;

class DatabaseRegistryTest : public ::testing::Test {
protected:
    const std::string db_path_ = "./data/chronodb_registry_test";
    std::unique_ptr<RocksDBWrapper> db_;
    std::unique_ptr<SeriesStore> store_;
    std::unique_ptr<DatabaseRegistry> registry_;

    void SetUp() override {
        std::filesystem::remove_all(db_path_);
        RocksDBWrapper::Config cfg;
        cfg.db_path = db_path_;
        db_ = std::make_unique<RocksDBWrapper>(cfg);
        ASSERT_TRUE(db_->open());
        store_ = std::make_unique<SeriesStore>(*db_);
        registry_ = std::make_unique<DatabaseRegistry>(*db_, *store_);
    }

    void TearDown() override {
        registry_.reset();
        store_.reset();
        db_->close();
        std::filesystem::remove_all(db_path_);
    }
};

TEST_F(DatabaseRegistryTest, CreateListDelete) {
    ASSERT_TRUE(registry_->createDatabase("metrics").ok);
    ASSERT_TRUE(registry_->createDatabase("events").ok);

    auto dup = registry_->createDatabase("metrics");
    EXPECT_FALSE(dup.ok);
    EXPECT_EQ(dup.code, Code::AlreadyExists);

    auto bad = registry_->createDatabase("no spaces");
    EXPECT_EQ(bad.code, Code::InvalidArgument);

    auto dbs = registry_->listDatabases();
    ASSERT_EQ(dbs.size(), 2u);
    EXPECT_EQ(dbs[0].name, "events");
    EXPECT_EQ(dbs[1].name, "metrics");
    EXPECT_GT(dbs[0].created_ms, 0);

    ASSERT_TRUE(registry_->deleteDatabase("events").ok);
    EXPECT_FALSE(registry_->exists("events"));
    EXPECT_EQ(registry_->deleteDatabase("events").code, Code::NotFound);
}

TEST_F(DatabaseRegistryTest, DeleteRemovesDataAndNotifies) {
    ASSERT_TRUE(registry_->createDatabase("metrics").ok);
    Point p;
    p.series = "cpu";
    p.timestamp_ms = 1000;
    p.values = {{"value", 1}};
    ASSERT_TRUE(store_->writePoints("metrics", {p}).ok);
    auto [kst, key] = registry_->addKey("metrics", Permission::Read);
    ASSERT_TRUE(kst.ok);

    std::string dropped;
    registry_->addDropListener([&](const std::string& name) { dropped = name; });

    ASSERT_TRUE(registry_->deleteDatabase("metrics").ok);
    EXPECT_EQ(dropped, "metrics");
    EXPECT_TRUE(store_->listSeries("metrics").empty());
    EXPECT_FALSE(registry_->checkKey("metrics", key.key, Permission::Read));

    // Recreated database starts empty
    ASSERT_TRUE(registry_->createDatabase("metrics").ok);
    auto [st, keys] = registry_->listKeys("metrics");
    ASSERT_TRUE(st.ok);
    EXPECT_TRUE(keys.empty());
}

TEST_F(DatabaseRegistryTest, GeneratedKeysAndPermissions) {
    ASSERT_TRUE(registry_->createDatabase("metrics").ok);

    auto [st1, reader] = registry_->addKey("metrics", Permission::Read);
    ASSERT_TRUE(st1.ok);
    EXPECT_EQ(reader.key.size(), 32u);

    auto [st2, writer] = registry_->addKey("metrics", Permission::Write, std::string("writer-key"));
    ASSERT_TRUE(st2.ok);
    EXPECT_EQ(writer.key, "writer-key");

    auto [st3, both] = registry_->addKey("metrics", Permission::ReadWrite);
    ASSERT_TRUE(st3.ok);

    EXPECT_TRUE(registry_->checkKey("metrics", reader.key, Permission::Read));
    EXPECT_FALSE(registry_->checkKey("metrics", reader.key, Permission::Write));
    EXPECT_TRUE(registry_->checkKey("metrics", writer.key, Permission::Write));
    EXPECT_FALSE(registry_->checkKey("metrics", writer.key, Permission::Read));
    EXPECT_TRUE(registry_->checkKey("metrics", both.key, Permission::Read));
    EXPECT_TRUE(registry_->checkKey("metrics", both.key, Permission::Write));
    EXPECT_FALSE(registry_->checkKey("metrics", "nope", Permission::Read));
    EXPECT_FALSE(registry_->checkKey("other", reader.key, Permission::Read));

    auto [lst, keys] = registry_->listKeys("metrics");
    ASSERT_TRUE(lst.ok);
    EXPECT_EQ(keys.size(), 3u);

    auto [dupst, dupkey] = registry_->addKey("metrics", Permission::Read, std::string("writer-key"));
    EXPECT_EQ(dupst.code, Code::AlreadyExists);

    ASSERT_TRUE(registry_->removeKey("metrics", "writer-key").ok);
    EXPECT_FALSE(registry_->checkKey("metrics", "writer-key", Permission::Write));
    EXPECT_EQ(registry_->removeKey("metrics", "writer-key").code, Code::NotFound);
}

TEST_F(DatabaseRegistryTest, KeysRequireDatabase) {
    auto [st, key] = registry_->addKey("missing", Permission::Read);
    EXPECT_EQ(st.code, Code::NotFound);
    auto [lst, keys] = registry_->listKeys("missing");
    EXPECT_EQ(lst.code, Code::NotFound);
}

TEST_F(DatabaseRegistryTest, WritesRequireExistingDatabase) {
    Point p;
    p.series = "cpu";
    p.timestamp_ms = 1000;
    p.values = {{"value", 1}};
    auto missing = store_->writePoints("missing", {p});
    EXPECT_FALSE(missing.ok);
    EXPECT_EQ(missing.code, SeriesStore::Status::Code::NotFound);
    EXPECT_TRUE(store_->listSeries("missing").empty());

    ASSERT_TRUE(registry_->createDatabase("metrics").ok);
    ASSERT_TRUE(store_->writePoints("metrics", {p}).ok);
    ASSERT_TRUE(registry_->deleteDatabase("metrics").ok);

    EXPECT_EQ(store_->writePoints("metrics", {p}).code, SeriesStore::Status::Code::NotFound);
    EXPECT_EQ(store_->writePointsWithSequence("metrics", {p}).code, SeriesStore::Status::Code::NotFound);
    EXPECT_EQ(registry_->addKey("metrics", Permission::Read).first.code, Code::NotFound);

    ASSERT_TRUE(registry_->createDatabase("metrics").ok);
    EXPECT_TRUE(store_->listSeries("metrics").empty());
}

TEST_F(DatabaseRegistryTest, ConcurrentWritesDuringDeleteLeaveNothingBehind) {
    ASSERT_TRUE(registry_->createDatabase("metrics").ok);

    std::atomic<int> written{0};
    std::atomic<int> keys_added{0};
    std::thread writer([&] {
        for (int64_t ts = 1;; ++ts) {
            Point p;
            p.series = "cpu";
            p.timestamp_ms = ts;
            p.values = {{"value", ts}};
            if (!store_->writePoints("metrics", {p}).ok) break;
            ++written;
        }
    });
    std::thread key_adder([&] {
        while (registry_->addKey("metrics", Permission::Read).first.ok) ++keys_added;
    });

    while (written.load() < 10 || keys_added.load() < 10) std::this_thread::yield();
    ASSERT_TRUE(registry_->deleteDatabase("metrics").ok);
    writer.join();
    key_adder.join();

    EXPECT_TRUE(store_->listSeries("metrics").empty());
    ASSERT_TRUE(registry_->createDatabase("metrics").ok);
    auto [st, keys] = registry_->listKeys("metrics");
    ASSERT_TRUE(st.ok);
    EXPECT_TRUE(keys.empty());
    SeriesStore::ScanOptions all;
    auto [sst, pts] = store_->scan("metrics", "cpu", all);
    ASSERT_TRUE(sst.ok);
    EXPECT_TRUE(pts.empty());
}

TEST_F(DatabaseRegistryTest, PermissionStrings) {
    EXPECT_EQ(DatabaseRegistry::permissionFromString("read"), Permission::Read);
    EXPECT_EQ(DatabaseRegistry::permissionFromString("w"), Permission::Write);
    EXPECT_EQ(DatabaseRegistry::permissionFromString("readwrite"), Permission::ReadWrite);
    EXPECT_FALSE(DatabaseRegistry::permissionFromString("admin").has_value());
    EXPECT_STREQ(DatabaseRegistry::permissionToString(Permission::ReadWrite), "readwrite");
}
