#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "timeseries/series_store.h"
#include "utils/time_utils.h"

namespace chronodb {

/// Parsed body of POST /db/{db}/points
class WriteRequest {
public:
    struct Result {
        bool ok = true;
        std::string message;
        std::vector<Point> points;
    };

    /**
     * @brief Parse the ingest payload.
     *
     * Accepted element shapes:
     *   {"series": s, "extra_columns": [c1, c2], "points": [[t, v1, v2], ...]}
     *   {"series": s, "points": [[t, v], ...]}            -> column "value"
     *   {"series": s, "columns": ["time", c1], "points": [[t, v1], ...]}
     *
     * The whole request is rejected on the first malformed element.
     * @param now_ms Timestamp used for points without a time column
     */
    static Result fromJson(const nlohmann::json& body, utils::TimePrecision precision, int64_t now_ms);

    /// Default column name for the i-th value when no names are supplied
    static std::string defaultColumnName(size_t index);
};

} // namespace chronodb
