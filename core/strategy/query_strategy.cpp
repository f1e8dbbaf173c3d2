#include "strategy/query_strategy.hpp"
#include "errors/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace specsel {

static bool allFinite(const std::vector<double>& row) {
    return std::all_of(row.begin(), row.end(), [](double s) { return std::isfinite(s); });
}

double scoreMargin(const std::vector<double>& row) {
    if (row.empty()) return 0.0;
    if (!allFinite(row)) return std::numeric_limits<double>::quiet_NaN();
    if (row.size() == 1) return std::fabs(row[0]);

    double first = row[0], second = row[1];
    if (second > first) std::swap(first, second);
    for (size_t c = 2; c < row.size(); c++) {
        if (row[c] > first) {
            second = first;
            first = row[c];
        } else if (row[c] > second) {
            second = row[c];
        }
    }
    return first - second;
}

double scoreEntropy(const std::vector<double>& row) {
    if (row.empty()) return 0.0;
    if (!allFinite(row)) return std::numeric_limits<double>::quiet_NaN();

    double total = 0.0;
    for (double s : row) total += std::max(s, 0.0);
    if (total <= 0.0) return std::log(static_cast<double>(row.size()));

    double h = 0.0;
    for (double s : row) {
        double p = std::max(s, 0.0) / total;
        if (p > 0.0) h -= p * std::log(p);
    }
    return h;
}

void validateQueryContext(const QueryContext& context, bool needs_features,
                          bool needs_scores) {
    const size_t n = context.pool_ids.size();
    if (needs_features && context.pool_features.size() != n) {
        throw InvariantError("query context has " + std::to_string(n) + " ids but " +
                             std::to_string(context.pool_features.size()) + " feature rows");
    }
    if (needs_scores && context.pool_scores.size() != n) {
        throw InvariantError("query context has " + std::to_string(n) + " ids but " +
                             std::to_string(context.pool_scores.size()) + " score rows");
    }
}

void validateScoreSamples(const QueryContext& context) {
    const size_t n = context.pool_ids.size();
    if (context.pool_score_samples.empty()) {
        throw InvariantError("query context has no posterior score samples");
    }
    const size_t classes = context.pool_score_samples.front().empty()
                               ? 0 : context.pool_score_samples.front().front().size();
    for (size_t d = 0; d < context.pool_score_samples.size(); d++) {
        const ScoreMatrix& draw = context.pool_score_samples[d];
        if (draw.size() != n) {
            throw InvariantError("score sample " + std::to_string(d) + " has " +
                                 std::to_string(draw.size()) + " rows for " +
                                 std::to_string(n) + " ids");
        }
        for (const auto& row : draw) {
            if (row.size() != classes || classes == 0) {
                throw InvariantError("score sample " + std::to_string(d) +
                                     " has ragged or empty rows");
            }
        }
    }
}

std::vector<size_t> rankByKey(const std::vector<CandidateId>& ids,
                              const std::vector<double>& keys,
                              bool ascending) {
    // Non-finite keys rank last in either direction.
    const double worst = ascending ? std::numeric_limits<double>::infinity()
                                   : -std::numeric_limits<double>::infinity();
    std::vector<double> k(keys.size());
    for (size_t i = 0; i < keys.size(); i++) {
        k[i] = std::isfinite(keys[i]) ? keys[i] : worst;
    }

    std::vector<size_t> order(ids.size());
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        if (k[a] != k[b]) {
            return ascending ? k[a] < k[b] : k[a] > k[b];
        }
        return ids[a] < ids[b];
    });
    return order;
}

} // namespace specsel
