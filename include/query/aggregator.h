#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace chronodb {
namespace query {

/**
 * @brief Aggregate functions of the query language.
 *
 * Every function takes the column values of one group (oldest point first)
 * and returns a JSON scalar, or null when the group has no usable input.
 * Non-numeric values are skipped by the numeric functions.
 */
class Aggregator {
public:
    enum class Function {
        Count,
        Distinct,
        Sum,
        Mean,
        Min,
        Max,
        First,
        Last,
        Median,
        Percentile,
        StdDev
    };

    /// Lookup by query-language name ("avg" maps to Mean). nullopt if unknown.
    static std::optional<Function> fromName(const std::string& name);
    static bool isAggregateName(const std::string& name);

    /// Number of non-null values
    static nlohmann::json count(const std::vector<nlohmann::json>& values);
    /// Number of distinct non-null values
    static nlohmann::json countDistinct(const std::vector<nlohmann::json>& values);
    /// Array of distinct non-null values in first-seen order
    static nlohmann::json distinct(const std::vector<nlohmann::json>& values);

    /// Integer sum when every input is an integer, else floating point
    static nlohmann::json sum(const std::vector<nlohmann::json>& values);
    static nlohmann::json mean(const std::vector<nlohmann::json>& values);
    static nlohmann::json min(const std::vector<nlohmann::json>& values);
    static nlohmann::json max(const std::vector<nlohmann::json>& values);

    /// First / last non-null value in input order (any type)
    static nlohmann::json first(const std::vector<nlohmann::json>& values);
    static nlohmann::json last(const std::vector<nlohmann::json>& values);

    /// Linear interpolation between closest ranks: rank = p/100 * (N-1)
    static nlohmann::json percentile(std::vector<double> values, double p);
    static nlohmann::json median(std::vector<double> values);

    /// Sample standard deviation; null for fewer than two values
    static nlohmann::json stddev(const std::vector<double>& values);

    static std::vector<double> numericValues(const std::vector<nlohmann::json>& values);
};

} // namespace query
} // namespace chronodb
