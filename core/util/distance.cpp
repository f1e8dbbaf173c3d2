#include "util/distance.hpp"
#include "errors/errors.hpp"

#include <cmath>

namespace specsel {

double distance(DistanceMetric metric,
                const std::vector<double>& a,
                const std::vector<double>& b) {
    if (a.size() != b.size()) {
        throw InvariantError("distance between rows of length " + std::to_string(a.size()) +
                             " and " + std::to_string(b.size()));
    }
    double acc = 0.0;
    switch (metric) {
        case DistanceMetric::EUCLIDEAN:
            for (size_t i = 0; i < a.size(); i++) {
                double d = a[i] - b[i];
                acc += d * d;
            }
            return std::sqrt(acc);
        case DistanceMetric::MANHATTAN:
            for (size_t i = 0; i < a.size(); i++) {
                acc += std::fabs(a[i] - b[i]);
            }
            return acc;
    }
    return acc;
}

const char* distanceMetricName(DistanceMetric metric) {
    switch (metric) {
        case DistanceMetric::EUCLIDEAN: return "euclidean";
        case DistanceMetric::MANHATTAN: return "manhattan";
    }
    return "unknown";
}

DistanceMetric parseDistanceMetric(const std::string& name) {
    if (name == "euclidean") return DistanceMetric::EUCLIDEAN;
    if (name == "manhattan") return DistanceMetric::MANHATTAN;
    throw InvariantError("unknown distance metric: " + name);
}

} // namespace specsel
