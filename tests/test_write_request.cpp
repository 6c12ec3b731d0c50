#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "timeseries/write_request.h"

using json = nlohmann::json;
using namespace chronodb;
using chronodb::utils::TimePrecision;

TEST(WriteRequestTest, ExtraColumnsForm) {
    auto body = json::parse(R"([
        {"series": "users.events", "extra_columns": ["email", "state"],
         "points": [[1311836008, "a@b.c", "ny"], [1311836009, "d@e.f", "ca"]]}
    ])");
    auto r = WriteRequest::fromJson(body, TimePrecision::Seconds, 0);
    ASSERT_TRUE(r.ok) << r.message;
    ASSERT_EQ(r.points.size(), 2u);
    EXPECT_EQ(r.points[0].series, "users.events");
    EXPECT_EQ(r.points[0].timestamp_ms, 1311836008000LL);
    EXPECT_EQ(r.points[0].values["email"], "a@b.c");
    EXPECT_EQ(r.points[1].values["state"], "ca");
}

TEST(WriteRequestTest, ShortFormUsesValueColumns) {
    auto body = json::parse(R"([{"series": "cpu.idle", "points": [[1000, 95.5, 3]]}])");
    auto r = WriteRequest::fromJson(body, TimePrecision::Milliseconds, 0);
    ASSERT_TRUE(r.ok) << r.message;
    ASSERT_EQ(r.points.size(), 1u);
    EXPECT_EQ(r.points[0].timestamp_ms, 1000);
    EXPECT_DOUBLE_EQ(r.points[0].values["value"].get<double>(), 95.5);
    EXPECT_EQ(r.points[0].values["value_1"], 3);
}

TEST(WriteRequestTest, ColumnsWithoutTimeUseNow) {
    auto body = json::parse(R"([{"series": "s", "columns": ["a", "b"], "points": [[1, 2]]}])");
    auto r = WriteRequest::fromJson(body, TimePrecision::Seconds, 777000);
    ASSERT_TRUE(r.ok) << r.message;
    ASSERT_EQ(r.points.size(), 1u);
    EXPECT_EQ(r.points[0].timestamp_ms, 777000);
    EXPECT_EQ(r.points[0].values.size(), 2u);
}

TEST(WriteRequestTest, ColumnsWithTimeAnywhere) {
    auto body = json::parse(R"([{"series": "s", "columns": ["a", "time"], "points": [[1, 5]]}])");
    auto r = WriteRequest::fromJson(body, TimePrecision::Seconds, 0);
    ASSERT_TRUE(r.ok) << r.message;
    EXPECT_EQ(r.points[0].timestamp_ms, 5000);
    EXPECT_FALSE(r.points[0].values.contains("time"));
}

TEST(WriteRequestTest, RejectsMalformedInput) {
    EXPECT_FALSE(WriteRequest::fromJson(json::object(), TimePrecision::Seconds, 0).ok);
    EXPECT_FALSE(WriteRequest::fromJson(json::parse(R"([{"points": []}])"), TimePrecision::Seconds, 0).ok);
    EXPECT_FALSE(WriteRequest::fromJson(json::parse(R"([{"series": "a:b", "points": []}])"), TimePrecision::Seconds, 0).ok);
    EXPECT_FALSE(WriteRequest::fromJson(json::parse(R"([{"series": "s", "points": [[1]]}])"), TimePrecision::Seconds, 0).ok);
    EXPECT_FALSE(WriteRequest::fromJson(json::parse(R"([{"series": "s", "points": [[-1, 2]]}])"), TimePrecision::Seconds, 0).ok);
    EXPECT_FALSE(WriteRequest::fromJson(json::parse(R"([{"series": "s", "points": [["x", 2]]}])"), TimePrecision::Seconds, 0).ok);
    EXPECT_FALSE(WriteRequest::fromJson(json::parse(R"([{"series": "s", "points": [[1, {"a": 1}]]}])"), TimePrecision::Seconds, 0).ok);

    auto wrong_width = json::parse(R"([{"series": "s", "extra_columns": ["a", "b"], "points": [[1, 2]]}])");
    auto r = WriteRequest::fromJson(wrong_width, TimePrecision::Seconds, 0);
    EXPECT_FALSE(r.ok);
    EXPECT_NE(r.message.find("point 0"), std::string::npos);

    auto dup = json::parse(R"([{"series": "s", "extra_columns": ["a", "a"], "points": []}])");
    EXPECT_FALSE(WriteRequest::fromJson(dup, TimePrecision::Seconds, 0).ok);

    auto reserved = json::parse(R"([{"series": "s", "extra_columns": ["time"], "points": []}])");
    EXPECT_FALSE(WriteRequest::fromJson(reserved, TimePrecision::Seconds, 0).ok);
}

TEST(WriteRequestTest, RejectsTimestampsOutsideRange) {
    auto r = WriteRequest::fromJson(json::parse(R"([{"series": "s", "points": [[100000000000000000, 1.0]]}])"),
                                    TimePrecision::Seconds, 0);
    EXPECT_FALSE(r.ok);
    EXPECT_NE(r.message.find("timestamp out of range"), std::string::npos) << r.message;

    r = WriteRequest::fromJson(json::parse(R"([{"series": "s", "points": [[18446744073709551615, 1.0]]}])"),
                               TimePrecision::Milliseconds, 0);
    EXPECT_FALSE(r.ok);
    EXPECT_NE(r.message.find("timestamp out of range"), std::string::npos) << r.message;

    r = WriteRequest::fromJson(json::parse(R"([{"series": "s", "points": [[1e300, 1.0]]}])"),
                               TimePrecision::Seconds, 0);
    EXPECT_FALSE(r.ok);

    // Microseconds divide down and stay in range
    r = WriteRequest::fromJson(json::parse(R"([{"series": "s", "points": [[9223372036854775807, 1.0]]}])"),
                               TimePrecision::Microseconds, 0);
    ASSERT_TRUE(r.ok) << r.message;
    EXPECT_EQ(r.points[0].timestamp_ms, 9223372036854775LL);
}

TEST(WriteRequestTest, EmptyArrayIsValid) {
    auto r = WriteRequest::fromJson(json::array(), TimePrecision::Seconds, 0);
    EXPECT_TRUE(r.ok);
    EXPECT_TRUE(r.points.empty());
}
