#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <yaml-cpp/yaml.h>

#include "utils/config_loader.h"
#include "utils/logger.h"

using json = nlohmann::json;
using namespace chronodb::utils;

class ConfigLoaderTest : public ::testing::Test {
protected:
    const std::string dir_ = "./data/chronodb_config_test";

    void SetUp() override {
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    std::string writeFile(const std::string& name, const std::string& content) {
        const std::string path = dir_ + "/" + name;
        std::ofstream out(path);
        out << content;
        return path;
    }
};

TEST_F(ConfigLoaderTest, YamlScalarsKeepTheirTypes) {
    auto node = YAML::Load("a: true\nb: 42\nc: 2.5\nd: 127.0.0.1\ne: [1, x]\n");
    auto j = ConfigLoader::yamlToJson(node);
    EXPECT_EQ(j["a"], true);
    EXPECT_EQ(j["b"], 42);
    EXPECT_DOUBLE_EQ(j["c"].get<double>(), 2.5);
    EXPECT_EQ(j["d"], "127.0.0.1");
    EXPECT_EQ(j["e"], json::parse(R"([1, "x"])"));
}

TEST_F(ConfigLoaderTest, LoadsYamlFile) {
    auto path = writeFile("config.yaml",
        "server:\n"
        "  host: 127.0.0.1\n"
        "  port: 9099\n"
        "  worker_threads: 4\n"
        "storage:\n"
        "  rocksdb_path: ./data/custom\n"
        "  compression:\n"
        "    default: none\n"
        "query:\n"
        "  default_limit: 50\n"
        "  default_window: 15m\n"
        "continuous_queries:\n"
        "  enabled: false\n"
        "  interval_ms: 2500\n"
        "auth:\n"
        "  admin_tokens: [secret-1, secret-2]\n"
        "logging:\n"
        "  level: debug\n"
        "  file: server.log\n");

    auto cfg = ConfigLoader::loadFile(path);
    ASSERT_TRUE(cfg.has_value());

    ServerOptions opts;
    auto err = ConfigLoader::apply(*cfg, opts);
    ASSERT_FALSE(err.has_value()) << *err;
    EXPECT_EQ(opts.host, "127.0.0.1");
    EXPECT_EQ(opts.port, 9099);
    EXPECT_EQ(opts.worker_threads, 4u);
    EXPECT_EQ(opts.storage.db_path, "./data/custom");
    EXPECT_EQ(opts.storage.compression_default, "none");
    EXPECT_EQ(opts.storage.compression_bottommost, "zstd");
    EXPECT_EQ(opts.default_limit, 50u);
    EXPECT_EQ(opts.default_window_ms, 15 * 60 * 1000);
    EXPECT_FALSE(opts.continuous_queries_enabled);
    EXPECT_EQ(opts.continuous_query_interval_ms, 2500);
    ASSERT_EQ(opts.admin_tokens.size(), 2u);
    EXPECT_EQ(opts.admin_tokens[1], "secret-2");
    EXPECT_EQ(opts.log_level, "debug");
    EXPECT_EQ(opts.log_file, "server.log");
}

TEST_F(ConfigLoaderTest, LoadsJsonFileWithNumericWindow) {
    auto path = writeFile("config.json", R"({"query": {"default_window": 120}, "server": {"port": 8087}})");
    auto cfg = ConfigLoader::loadFile(path);
    ASSERT_TRUE(cfg.has_value());

    ServerOptions opts;
    ASSERT_FALSE(ConfigLoader::apply(*cfg, opts).has_value());
    EXPECT_EQ(opts.default_window_ms, 120000);
    EXPECT_EQ(opts.port, 8087);
    // Untouched sections keep defaults
    EXPECT_EQ(opts.host, "0.0.0.0");
    EXPECT_EQ(opts.default_limit, 1000u);
    EXPECT_TRUE(opts.continuous_queries_enabled);
}

TEST_F(ConfigLoaderTest, UnreadableFiles) {
    EXPECT_FALSE(ConfigLoader::loadFile(dir_ + "/missing.json").has_value());
    EXPECT_FALSE(ConfigLoader::loadFile(dir_ + "/missing.yaml").has_value());
    EXPECT_FALSE(ConfigLoader::loadFile(writeFile("broken.json", "{not json")).has_value());
    EXPECT_FALSE(ConfigLoader::loadFile(writeFile("broken.yaml", "a: [1, 2\n")).has_value());
}

TEST_F(ConfigLoaderTest, RejectsInvalidValues) {
    ServerOptions opts;
    EXPECT_TRUE(ConfigLoader::apply(json::array(), opts).has_value());
    EXPECT_TRUE(ConfigLoader::apply(json::parse(R"({"server": {"port": 70000}})"), opts).has_value());
    EXPECT_TRUE(ConfigLoader::apply(json::parse(R"({"server": {"port": "http"}})"), opts).has_value());
    EXPECT_TRUE(ConfigLoader::apply(json::parse(R"({"query": {"default_window": "10y"}})"), opts).has_value());
    EXPECT_TRUE(ConfigLoader::apply(json::parse(R"({"continuous_queries": {"interval_ms": 0}})"), opts).has_value());
    EXPECT_TRUE(ConfigLoader::apply(json::parse(R"({"logging": {"level": "loud"}})"), opts).has_value());
}

TEST(LoggerLevels, ParseAndFormat) {
    using chronodb::utils::Logger;
    EXPECT_EQ(Logger::parseLevel("DEBUG"), Logger::Level::DEBUG);
    EXPECT_EQ(Logger::parseLevel("warning"), Logger::Level::WARN);
    EXPECT_EQ(Logger::parseLevel("err"), Logger::Level::ERROR);
    EXPECT_FALSE(Logger::parseLevel("verbose").has_value());
    EXPECT_STREQ(Logger::levelToString(Logger::Level::CRITICAL), "critical");
}

TEST(ConfigLoaderPaths, DefaultSearchOrder) {
    const auto& paths = ConfigLoader::defaultPaths();
    ASSERT_FALSE(paths.empty());
    EXPECT_EQ(paths.front(), "./config.yaml");
    EXPECT_EQ(paths.back(), "./config/config.json");
}
