#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <chrono>
#include <filesystem>
#include <thread>

#include "meta/database_registry.h"
#include "query/query_engine.h"
#include "server/auth_middleware.h"
#include "server/http_server.h"
#include "storage/rocksdb_wrapper.h"
#include "timeseries/continuous_query.h"
#include "timeseries/series_store.h"
#include "utils/time_utils.h"

using json = nlohmann::json;
namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {
constexpr uint16_t kPort = 18091;

std::string urlEncode(const std::string& in) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : in) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0xF]);
        }
    }
    return out;
}
}

class HttpSeriesTest : public ::testing::Test {
protected:
    const std::string db_path_ = "./data/chronodb_http_series_test";

    std::shared_ptr<chronodb::RocksDBWrapper> storage_;
    std::shared_ptr<chronodb::SeriesStore> store_;
    std::shared_ptr<chronodb::DatabaseRegistry> registry_;
    std::shared_ptr<chronodb::query::QueryEngine> engine_;
    std::shared_ptr<chronodb::ContinuousQueryManager> continuous_;
    std::unique_ptr<chronodb::server::HttpServer> server_;

    void SetUp() override {
        std::filesystem::remove_all(db_path_);

        chronodb::RocksDBWrapper::Config cfg;
        cfg.db_path = db_path_;
        storage_ = std::make_shared<chronodb::RocksDBWrapper>(cfg);
        ASSERT_TRUE(storage_->open());

        store_ = std::make_shared<chronodb::SeriesStore>(*storage_);
        registry_ = std::make_shared<chronodb::DatabaseRegistry>(*storage_, *store_);
        engine_ = std::make_shared<chronodb::query::QueryEngine>(*store_);
        continuous_ = std::make_shared<chronodb::ContinuousQueryManager>(*storage_, *store_, *engine_);
        auto auth = std::make_shared<chronodb::AuthMiddleware>(registry_.get());

        chronodb::server::HttpServer::Config scfg;
        scfg.host = "127.0.0.1";
        scfg.port = kPort;
        scfg.num_threads = 2;
        server_ = std::make_unique<chronodb::server::HttpServer>(scfg, store_, registry_, engine_, continuous_, auth);
        server_->start();
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        ASSERT_TRUE(registry_->createDatabase("metrics").ok);
    }

    void TearDown() override {
        if (server_) server_->stop();
        server_.reset();
        continuous_.reset();
        engine_.reset();
        registry_.reset();
        store_.reset();
        storage_->close();
        std::filesystem::remove_all(db_path_);
    }

    http::response<http::string_body> send(http::verb verb, const std::string& target, const std::string& body = "") {
        net::io_context ioc;
        tcp::resolver resolver(ioc);
        beast::tcp_stream stream(ioc);

        auto const results = resolver.resolve("127.0.0.1", std::to_string(kPort));
        stream.connect(results);

        http::request<http::string_body> req{verb, target, 11};
        req.set(http::field::host, "127.0.0.1");
        if (!body.empty()) {
            req.set(http::field::content_type, "application/json");
            req.body() = body;
        }
        req.prepare_payload();

        http::write(stream, req);

        beast::flat_buffer buffer;
        http::response<http::string_body> res;
        http::read(stream, buffer, res);

        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        return res;
    }

    http::response<http::string_body> query(const std::string& q, const std::string& extra = "") {
        return send(http::verb::get, "/db/metrics/series?q=" + urlEncode(q) + extra);
    }

    void writeCpu() {
        json body = json::array({
            {{"series", "cpu.idle"}, {"extra_columns", {"value"}},
             {"points", {{1311836008, 1.0}, {1311836009, 2.0}, {1311836010, 3.0},
                         {1311836011, 5.0}, {1311836012, 6.0}}}}
        });
        auto res = send(http::verb::post, "/db/metrics/points", body.dump());
        ASSERT_EQ(res.result_int(), 200u) << res.body();
        EXPECT_EQ(json::parse(res.body())["written"], 5);
    }
};

TEST_F(HttpSeriesTest, Health) {
    auto res = send(http::verb::get, "/health");
    EXPECT_EQ(res.result_int(), 200u);
    auto body = json::parse(res.body());
    EXPECT_EQ(body["status"], "ok");
}

TEST_F(HttpSeriesTest, WriteAndQueryRoundTrip) {
    writeCpu();
    auto res = query("select value from cpu.idle where time > 1311836000 and time < 1311836100");
    ASSERT_EQ(res.result_int(), 200u) << res.body();
    auto body = json::parse(res.body());
    auto expected = json::parse(R"([{"series":"cpu.idle","columns":["value","time"],
        "datapoints":[[6.0,1311836012],[5.0,1311836011],[3.0,1311836010],[2.0,1311836009],[1.0,1311836008]]}])");
    EXPECT_EQ(body, expected);
}

TEST_F(HttpSeriesTest, MillisecondPrecision) {
    json body = json::array({{{"series", "s"}, {"points", {{1311836008123LL, 7}}}}});
    auto res = send(http::verb::post, "/db/metrics/points?time_precision=ms", body.dump());
    ASSERT_EQ(res.result_int(), 200u) << res.body();

    auto q = query("select value from s where time > 1311836008000 and time < 1311836009000", "&time_precision=ms");
    ASSERT_EQ(q.result_int(), 200u) << q.body();
    auto out = json::parse(q.body());
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0]["datapoints"][0][1], 1311836008123LL);

    auto bad = query("select value from s", "&time_precision=ns");
    EXPECT_EQ(bad.result_int(), 400u);
}

TEST_F(HttpSeriesTest, WriteErrors) {
    auto res = send(http::verb::post, "/db/metrics/points", "{not json");
    EXPECT_EQ(res.result_int(), 400u);
    auto body = json::parse(res.body());
    EXPECT_TRUE(body["error"].get<bool>());
    EXPECT_EQ(body["status_code"], 400);

    res = send(http::verb::post, "/db/metrics/points", R"([{"series": "s", "points": [[1]]}])");
    EXPECT_EQ(res.result_int(), 400u);

    res = send(http::verb::post, "/db/missing/points", R"([{"series": "s", "points": [[1, 2]]}])");
    EXPECT_EQ(res.result_int(), 404u);
}

TEST_F(HttpSeriesTest, QueryErrors) {
    auto missing = send(http::verb::get, "/db/metrics/series");
    EXPECT_EQ(missing.result_int(), 400u);

    auto bad = query("select value form cpu");
    EXPECT_EQ(bad.result_int(), 400u);
    EXPECT_NE(json::parse(bad.body())["message"].get<std::string>().find("Parse error"), std::string::npos);

    auto del = query("delete from cpu.idle");
    EXPECT_EQ(del.result_int(), 400u);

    auto unknown = send(http::verb::get, "/db/nosuchdb/series?q=list%20series");
    EXPECT_EQ(unknown.result_int(), 404u);

    auto route = send(http::verb::get, "/nothing/here");
    EXPECT_EQ(route.result_int(), 404u);
}

TEST_F(HttpSeriesTest, UnknownSeriesReturns404) {
    writeCpu();
    auto select = query("select value from nosuch where time > 1311836000");
    EXPECT_EQ(select.result_int(), 404u) << select.body();
    EXPECT_NE(json::parse(select.body())["message"].get<std::string>().find("nosuch"), std::string::npos);

    auto merge = query("select * from merge(cpu.idle, nosuch) where time > 1311836000");
    EXPECT_EQ(merge.result_int(), 404u);

    auto join = query("select t1.value from inner_join(cpu.idle, t1, nosuch, t2) where time > 1311836000");
    EXPECT_EQ(join.result_int(), 404u);

    auto del = send(http::verb::delete_, "/db/metrics/series?q=" + urlEncode("delete from nosuch where time < 1311836010"));
    EXPECT_EQ(del.result_int(), 404u);

    auto stream = send(http::verb::get, "/db/metrics/series/stream?q=" + urlEncode("select value from nosuch") +
                                        "&duration_s=1&interval_ms=100");
    EXPECT_EQ(stream.result_int(), 404u);

    auto regex = query("select * from /nosuch.*/ where time > 1311836000");
    ASSERT_EQ(regex.result_int(), 200u) << regex.body();
    EXPECT_EQ(json::parse(regex.body()), json::array());
}

TEST_F(HttpSeriesTest, DeleteSeriesPoints) {
    writeCpu();
    auto res = send(http::verb::delete_, "/db/metrics/series?q=" + urlEncode("delete from cpu.idle where time < 1311836010"));
    ASSERT_EQ(res.result_int(), 200u) << res.body();
    auto body = json::parse(res.body());
    EXPECT_EQ(body[0]["datapoints"][0][0], 2);

    auto select = send(http::verb::delete_, "/db/metrics/series?q=" + urlEncode("select * from cpu.idle"));
    EXPECT_EQ(select.result_int(), 400u);
}

TEST_F(HttpSeriesTest, ListSeriesAndSchema) {
    writeCpu();
    json body = json::array({{{"series", "users.events"}, {"extra_columns", {"email", "state"}},
                              {"points", {{1311836008, "a@b.c", "ny"}}}}});
    ASSERT_EQ(send(http::verb::post, "/db/metrics/points", body.dump()).result_int(), 200u);

    auto list = query("list series");
    ASSERT_EQ(list.result_int(), 200u) << list.body();
    EXPECT_EQ(json::parse(list.body())[0]["datapoints"], json::parse(R"([["cpu.idle"], ["users.events"]])"));

    auto schema = send(http::verb::get, "/db/metrics/schema");
    ASSERT_EQ(schema.result_int(), 200u);
    auto s = json::parse(schema.body());
    EXPECT_EQ(s["cpu.idle"], json::parse(R"(["value"])"));
    EXPECT_EQ(s["users.events"], json::parse(R"(["email", "state"])"));
}

TEST_F(HttpSeriesTest, ContinuousQueryLifecycle) {
    auto res = query("select count(*) from events group_by time(1h) into events.count.1h");
    ASSERT_EQ(res.result_int(), 200u) << res.body();
    auto def = json::parse(res.body());
    const uint64_t id = def["id"].get<uint64_t>();

    auto list = send(http::verb::get, "/db/metrics/continuous_queries");
    ASSERT_EQ(list.result_int(), 200u);
    auto defs = json::parse(list.body());
    ASSERT_EQ(defs.size(), 1u);
    EXPECT_EQ(defs[0]["query"], "select count(*) from events group_by time(1h) into events.count.1h");

    auto invalid = query("select count(*) from events into events.total");
    EXPECT_EQ(invalid.result_int(), 400u);

    auto bad_id = send(http::verb::delete_, "/db/metrics/continuous_queries/abc");
    EXPECT_EQ(bad_id.result_int(), 400u);

    auto del = send(http::verb::delete_, "/db/metrics/continuous_queries/" + std::to_string(id));
    EXPECT_EQ(del.result_int(), 200u);
    auto again = send(http::verb::delete_, "/db/metrics/continuous_queries/" + std::to_string(id));
    EXPECT_EQ(again.result_int(), 404u);
}

TEST_F(HttpSeriesTest, StreamSendsServerSentEvents) {
    const int64_t now_s = chronodb::utils::nowMillis() / 1000;
    json body = json::array({{{"series", "live"}, {"points", {{now_s - 1, 42}}}}});
    ASSERT_EQ(send(http::verb::post, "/db/metrics/points", body.dump()).result_int(), 200u);

    auto res = send(http::verb::get, "/db/metrics/series/stream?q=" + urlEncode("select value from live") +
                                     "&duration_s=1&interval_ms=200");
    ASSERT_EQ(res.result_int(), 200u) << res.body();
    EXPECT_EQ(res[http::field::content_type], "text/event-stream");
    const std::string& text = res.body();
    EXPECT_EQ(text.rfind("retry: 3000\n\n", 0), 0u);
    EXPECT_NE(text.find("id: 1\n"), std::string::npos);
    EXPECT_NE(text.find("id: 2\n"), std::string::npos);

    auto data = text.find("data: ");
    ASSERT_NE(data, std::string::npos);
    auto end = text.find('\n', data);
    auto first = json::parse(text.substr(data + 6, end - data - 6));
    EXPECT_EQ(first[0]["series"], "live");
    EXPECT_EQ(first[0]["datapoints"][0][0], 42);

    auto into = send(http::verb::get, "/db/metrics/series/stream?q=" + urlEncode("select value from live into x"));
    EXPECT_EQ(into.result_int(), 400u);
}

TEST(HttpServerHelpers, QueryParsing) {
    using chronodb::server::HttpServer;
    EXPECT_EQ(HttpServer::urlDecode("a%20b+c"), "a b c");
    EXPECT_EQ(HttpServer::urlDecode("100%"), "100%");
    EXPECT_EQ(HttpServer::urlDecode("a+b%2Bc", false), "a+b+c");
    EXPECT_EQ(HttpServer::Config{}.sse_max_duration_s, 60);
    auto params = HttpServer::parseQuery("/db/x/series?q=select%20*%20from%20a&time_precision=ms&flag");
    EXPECT_EQ(params["q"], "select * from a");
    EXPECT_EQ(params["time_precision"], "ms");
    EXPECT_EQ(params.count("flag"), 1u);
    EXPECT_TRUE(HttpServer::parseQuery("/health").empty());
}
