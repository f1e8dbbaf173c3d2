#pragma once

#include <string>
#include <vector>

namespace specsel {

enum class DistanceMetric {
    EUCLIDEAN,
    MANHATTAN
};

/// Distance between two equal-length feature rows.
/// Throws InvariantError on a length mismatch.
double distance(DistanceMetric metric,
                const std::vector<double>& a,
                const std::vector<double>& b);

const char* distanceMetricName(DistanceMetric metric);

/// "euclidean" or "manhattan". Throws InvariantError otherwise.
DistanceMetric parseDistanceMetric(const std::string& name);

} // namespace specsel
