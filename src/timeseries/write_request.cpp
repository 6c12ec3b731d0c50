#include "timeseries/write_request.h"
#include "storage/key_schema.h"

#include <algorithm>
#include <limits>

namespace chronodb {

namespace {

bool isScalar(const nlohmann::json& v) {
    return v.is_number() || v.is_string() || v.is_boolean() || v.is_null();
}

enum class TimestampError { None, NotNumber, OutOfRange };

TimestampError readTimestamp(const nlohmann::json& v, utils::TimePrecision precision, int64_t& out) {
    std::optional<int64_t> ms;
    if (v.is_number_unsigned()) {
        if (v.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return TimestampError::OutOfRange;
        }
        ms = utils::toMillis(v.get<int64_t>(), precision);
    } else if (v.is_number_integer()) {
        ms = utils::toMillis(v.get<int64_t>(), precision);
    } else if (v.is_number_float()) {
        ms = utils::toMillis(v.get<double>(), precision);
    } else {
        return TimestampError::NotNumber;
    }
    if (!ms) return TimestampError::OutOfRange;
    out = *ms;
    return out >= 0 ? TimestampError::None : TimestampError::NotNumber;
}

WriteRequest::Result fail(std::string message) {
    WriteRequest::Result r;
    r.ok = false;
    r.message = std::move(message);
    return r;
}

} // namespace

std::string WriteRequest::defaultColumnName(size_t index) {
    if (index == 0) return "value";
    return "value_" + std::to_string(index);
}

WriteRequest::Result WriteRequest::fromJson(const nlohmann::json& body,
                                            utils::TimePrecision precision,
                                            int64_t now_ms) {
    Result result;
    
    if (!body.is_array()) {
        return fail("Request body must be a JSON array of series");
    }
    
    for (size_t si = 0; si < body.size(); ++si) {
        const auto& entry = body[si];
        const std::string where = "element " + std::to_string(si);
        if (!entry.is_object()) {
            return fail(where + ": expected an object");
        }
        if (!entry.contains("series") || !entry["series"].is_string()) {
            return fail(where + ": missing string field 'series'");
        }
        const std::string series = entry["series"].get<std::string>();
        if (auto err = KeySchema::validateSeriesName(series)) {
            return fail(where + ": " + *err);
        }
        if (!entry.contains("points") || !entry["points"].is_array()) {
            return fail(where + ": missing array field 'points'");
        }
        
        // Column layout of each point row
        bool has_time_column = true;
        size_t time_index = 0;
        std::vector<std::string> names;
        bool explicit_names = false;
        
        if (entry.contains("extra_columns")) {
            if (!entry["extra_columns"].is_array()) {
                return fail(where + ": 'extra_columns' must be an array");
            }
            names.emplace_back("time");
            for (const auto& c : entry["extra_columns"]) {
                if (!c.is_string()) return fail(where + ": column names must be strings");
                names.push_back(c.get<std::string>());
            }
            explicit_names = true;
        } else if (entry.contains("columns")) {
            if (!entry["columns"].is_array()) {
                return fail(where + ": 'columns' must be an array");
            }
            has_time_column = false;
            for (const auto& c : entry["columns"]) {
                if (!c.is_string()) return fail(where + ": column names must be strings");
                if (c.get<std::string>() == "time") {
                    has_time_column = true;
                    time_index = names.size();
                }
                names.push_back(c.get<std::string>());
            }
            explicit_names = true;
        }
        
        if (explicit_names) {
            for (size_t i = 0; i < names.size(); ++i) {
                if (names[i].empty()) return fail(where + ": column names must not be empty");
                if (i != time_index && names[i] == "time") {
                    return fail(where + ": 'time' is reserved");
                }
                if (std::count(names.begin(), names.end(), names[i]) > 1) {
                    return fail(where + ": duplicate column '" + names[i] + "'");
                }
            }
        }
        
        const auto& rows = entry["points"];
        for (size_t pi = 0; pi < rows.size(); ++pi) {
            const auto& row = rows[pi];
            const std::string pwhere = where + ", point " + std::to_string(pi);
            if (!row.is_array() || row.empty()) {
                return fail(pwhere + ": expected a non-empty array");
            }
            if (explicit_names && row.size() != names.size()) {
                return fail(pwhere + ": expected " + std::to_string(names.size()) +
                            " values, got " + std::to_string(row.size()));
            }
            if (!explicit_names && row.size() < 2) {
                return fail(pwhere + ": expected [time, value, ...]");
            }
            
            Point p;
            p.series = series;
            p.timestamp_ms = now_ms;
            for (size_t i = 0; i < row.size(); ++i) {
                if (has_time_column && i == time_index) {
                    switch (readTimestamp(row[i], precision, p.timestamp_ms)) {
                        case TimestampError::None: break;
                        case TimestampError::NotNumber:
                            return fail(pwhere + ": time must be a non-negative number");
                        case TimestampError::OutOfRange:
                            return fail(pwhere + ": timestamp out of range");
                    }
                    continue;
                }
                if (!isScalar(row[i])) {
                    return fail(pwhere + ": values must be numbers, strings, booleans or null");
                }
                const std::string name = explicit_names ? names[i] : defaultColumnName(i - 1);
                p.values[name] = row[i];
            }
            result.points.push_back(std::move(p));
        }
    }
    
    return result;
}

} // namespace chronodb
