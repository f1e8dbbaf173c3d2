#include "strategy/diversity_sampling.hpp"
#include "strategy/uncertainty_sampling.hpp"
#include "errors/errors.hpp"

#include <algorithm>
#include <limits>

namespace specsel {

DiversitySampling::DiversitySampling(size_t shortlist_size, DistanceMetric metric)
    : shortlist_size_(shortlist_size), metric_(metric) {
    if (shortlist_size_ == 0) {
        throw InvariantError("diversity: shortlist size must be positive");
    }
}

std::vector<CandidateId> DiversitySampling::select(const QueryContext& context,
                                                   size_t k) const {
    validateQueryContext(context, true, true);

    std::vector<size_t> shortlist = rankByMargin(context);
    const size_t m = std::min(std::max(k, shortlist_size_), shortlist.size());
    shortlist.resize(m);

    const size_t n = std::min(k, m);
    std::vector<CandidateId> batch;
    if (n == 0) return batch;
    batch.reserve(n);

    std::vector<bool> taken(m, false);
    std::vector<double> min_dist(m, std::numeric_limits<double>::infinity());

    size_t current = 0;  // most uncertain shortlisted item
    for (size_t step = 0; step < n; step++) {
        taken[current] = true;
        batch.push_back(context.pool_ids[shortlist[current]]);
        if (step + 1 == n) break;

        const FeatureVector& chosen = context.pool_features[shortlist[current]];
        size_t next = m;
        for (size_t j = 0; j < m; j++) {
            if (taken[j]) continue;
            double d = distance(metric_, context.pool_features[shortlist[j]], chosen);
            min_dist[j] = std::min(min_dist[j], d);
            if (next == m || min_dist[j] > min_dist[next]) next = j;
        }
        current = next;
    }
    return batch;
}

} // namespace specsel
