#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

#include "query/query_ast.h"
#include "utils/time_utils.h"

namespace chronodb {

class SeriesStore;

namespace query {

/// One named series in a query response
struct SeriesResult {
    std::string name;
    std::vector<std::string> columns;
    nlohmann::json datapoints = nlohmann::json::array();

    nlohmann::json toJSON() const {
        return {{"series", name}, {"columns", columns}, {"datapoints", datapoints}};
    }
};

/// Raised while evaluating a statement (unknown function, bad argument, ...)
class QueryError : public std::runtime_error {
public:
    explicit QueryError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Evaluates parsed statements against a SeriesStore.
 *
 * Defaults applied to SELECT:
 *  - no lower time bound  -> now() - default_window
 *  - no upper time bound  -> now()
 *  - no LIMIT             -> default_limit rows per result series
 *  - no ORDER             -> newest first
 */
class QueryEngine {
public:
    struct Config {
        size_t default_limit = 1000;
        int64_t default_window_ms = 3600LL * 1000;
    };

    struct Status {
        enum class Code { Ok, NotFound, InvalidArgument };
        bool ok = true;
        Code code = Code::Ok;
        std::string message;
        static Status OK() { return {}; }
        static Status Error(std::string msg) { return Status{false, Code::InvalidArgument, std::move(msg)}; }
        static Status Error(Code code, std::string msg) { return Status{false, code, std::move(msg)}; }
    };

    struct ExecOptions {
        utils::TimePrecision precision = utils::TimePrecision::Seconds;
        int64_t now_ms = 0;                     // 0 = wall clock
        std::optional<int64_t> min_from_ms;     // raise the lower bound (continuous queries)
        bool backfill = false;                  // missing lower bound means 0, not the default window
        bool unlimited = false;                 // ignore default and explicit LIMIT
        std::function<bool(const std::string&)> series_filter;  // skip series when false
    };

    struct TimeRange {
        int64_t from_ms = 0;
        int64_t to_ms = 0;
        bool has_lower = false;
        bool has_upper = false;
    };

    using Result = std::pair<Status, std::vector<SeriesResult>>;

    explicit QueryEngine(SeriesStore& store);
    QueryEngine(SeriesStore& store, Config config);

    Result execute(const std::string& db, const Statement& stmt, const ExecOptions& options) const;

    /// Parse and execute
    Result execute(const std::string& db, const std::string& query_text, const ExecOptions& options) const;

    /**
     * @brief Split a WHERE expression into time bounds and the remaining predicate.
     *
     * Only top-level AND-ed comparisons on "time" contribute bounds; any other
     * reference to time is an error.
     */
    static Status extractTimeRange(const ExprPtr& where, utils::TimePrecision precision,
                                   int64_t now_ms, TimeRange& range, ExprPtr& residual);

    /// Series of db named by a source (plain name, regex or merge members)
    std::vector<std::string> resolveSeries(const std::string& db, const SeriesSource& source) const;

    /// True if the expression contains an aggregate function
    static bool containsAggregate(const ExprPtr& expr);

    const Config& config() const { return config_; }

private:
    SeriesStore& store_;
    Config config_;

    Result executeSelect(const std::string& db, const Statement& stmt, const ExecOptions& options, int64_t now_ms) const;
    Result executeDelete(const std::string& db, const Statement& stmt, const ExecOptions& options, int64_t now_ms) const;
    Result executeList(const std::string& db, const Statement& stmt) const;
    /// NotFound unless every series a name, merge or join source names exists
    Status requireSeries(const std::string& db, const SeriesSource& source) const;
};

} // namespace query
} // namespace chronodb
