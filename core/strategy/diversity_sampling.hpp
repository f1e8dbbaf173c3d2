#pragma once

#include "strategy/query_strategy.hpp"
#include "util/distance.hpp"

namespace specsel {

// ─── Diversity-Augmented Sampling ──────────────────────────────
// Two stages:
//   1. shortlist the m most uncertain Pool candidates by margin,
//      m = max(k, shortlist_size)
//   2. farthest-first traversal over the shortlist: start from the most
//      uncertain item, then repeatedly add the item whose minimum
//      distance to the batch so far is largest
// Stage 2 keeps one batch from collapsing onto near-duplicate light
// curves. Distance ties keep shortlist (uncertainty) order.

class DiversitySampling : public QueryStrategy {
public:
    explicit DiversitySampling(size_t shortlist_size = 20,
                               DistanceMetric metric = DistanceMetric::EUCLIDEAN);

    std::string name() const override { return "diversity"; }

    std::vector<CandidateId> select(const QueryContext& context, size_t k) const override;

    size_t shortlistSize() const { return shortlist_size_; }
    DistanceMetric metric() const { return metric_; }

private:
    size_t shortlist_size_;
    DistanceMetric metric_;
};

} // namespace specsel
