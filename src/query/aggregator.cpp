#include "query/aggregator.h"

#include <algorithm>
#include <cmath>
#include <set>

namespace chronodb {
namespace query {

std::optional<Aggregator::Function> Aggregator::fromName(const std::string& name) {
    if (name == "count") return Function::Count;
    if (name == "distinct") return Function::Distinct;
    if (name == "sum") return Function::Sum;
    if (name == "mean" || name == "avg") return Function::Mean;
    if (name == "min") return Function::Min;
    if (name == "max") return Function::Max;
    if (name == "first") return Function::First;
    if (name == "last") return Function::Last;
    if (name == "median") return Function::Median;
    if (name == "percentile") return Function::Percentile;
    if (name == "stddev") return Function::StdDev;
    return std::nullopt;
}

bool Aggregator::isAggregateName(const std::string& name) {
    return fromName(name).has_value();
}

std::vector<double> Aggregator::numericValues(const std::vector<nlohmann::json>& values) {
    std::vector<double> out;
    out.reserve(values.size());
    for (const auto& v : values) {
        if (v.is_number()) out.push_back(v.get<double>());
    }
    return out;
}

nlohmann::json Aggregator::count(const std::vector<nlohmann::json>& values) {
    int64_t n = 0;
    for (const auto& v : values) {
        if (!v.is_null()) ++n;
    }
    return n;
}

nlohmann::json Aggregator::countDistinct(const std::vector<nlohmann::json>& values) {
    std::set<std::string> seen;
    for (const auto& v : values) {
        if (!v.is_null()) seen.insert(v.dump());
    }
    return static_cast<int64_t>(seen.size());
}

nlohmann::json Aggregator::distinct(const std::vector<nlohmann::json>& values) {
    std::set<std::string> seen;
    nlohmann::json out = nlohmann::json::array();
    for (const auto& v : values) {
        if (v.is_null()) continue;
        if (seen.insert(v.dump()).second) out.push_back(v);
    }
    return out;
}

nlohmann::json Aggregator::sum(const std::vector<nlohmann::json>& values) {
    bool any = false;
    bool all_int = true;
    int64_t isum = 0;
    double dsum = 0.0;
    for (const auto& v : values) {
        if (!v.is_number()) continue;
        any = true;
        if (v.is_number_integer()) {
            isum += v.get<int64_t>();
        } else {
            all_int = false;
        }
        dsum += v.get<double>();
    }
    if (!any) return nullptr;
    if (all_int) return isum;
    return dsum;
}

nlohmann::json Aggregator::mean(const std::vector<nlohmann::json>& values) {
    auto nums = numericValues(values);
    if (nums.empty()) return nullptr;
    double s = 0.0;
    for (double d : nums) s += d;
    return s / static_cast<double>(nums.size());
}

nlohmann::json Aggregator::min(const std::vector<nlohmann::json>& values) {
    nlohmann::json best;
    for (const auto& v : values) {
        if (!v.is_number()) continue;
        if (best.is_null() || v.get<double>() < best.get<double>()) best = v;
    }
    return best;
}

nlohmann::json Aggregator::max(const std::vector<nlohmann::json>& values) {
    nlohmann::json best;
    for (const auto& v : values) {
        if (!v.is_number()) continue;
        if (best.is_null() || v.get<double>() > best.get<double>()) best = v;
    }
    return best;
}

nlohmann::json Aggregator::first(const std::vector<nlohmann::json>& values) {
    for (const auto& v : values) {
        if (!v.is_null()) return v;
    }
    return nullptr;
}

nlohmann::json Aggregator::last(const std::vector<nlohmann::json>& values) {
    for (auto it = values.rbegin(); it != values.rend(); ++it) {
        if (!it->is_null()) return *it;
    }
    return nullptr;
}

nlohmann::json Aggregator::percentile(std::vector<double> values, double p) {
    if (values.empty()) {
        return nullptr;
    }
    if (p < 0.0 || p > 100.0) {
        return nullptr;
    }
    
    std::sort(values.begin(), values.end());
    if (values.size() == 1) {
        return values[0];
    }
    
    double rank = (p / 100.0) * static_cast<double>(values.size() - 1);
    size_t lower = static_cast<size_t>(std::floor(rank));
    size_t upper = static_cast<size_t>(std::ceil(rank));
    if (lower == upper) {
        return values[lower];
    }
    
    double weight = rank - static_cast<double>(lower);
    return values[lower] * (1.0 - weight) + values[upper] * weight;
}

nlohmann::json Aggregator::median(std::vector<double> values) {
    return percentile(std::move(values), 50.0);
}

nlohmann::json Aggregator::stddev(const std::vector<double>& values) {
    if (values.size() < 2) {
        return nullptr;
    }
    double mean = 0.0;
    for (double v : values) mean += v;
    mean /= static_cast<double>(values.size());
    
    // Sample variance: sum((x - mean)^2) / (n - 1)
    double sq = 0.0;
    for (double v : values) {
        double d = v - mean;
        sq += d * d;
    }
    return std::sqrt(sq / static_cast<double>(values.size() - 1));
}

} // namespace query
} // namespace chronodb
