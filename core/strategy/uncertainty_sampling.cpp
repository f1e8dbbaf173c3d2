#include "strategy/uncertainty_sampling.hpp"

#include <algorithm>

namespace specsel {

static std::vector<CandidateId> takeFirst(const QueryContext& context,
                                          const std::vector<size_t>& order,
                                          size_t k) {
    const size_t n = std::min(k, order.size());
    std::vector<CandidateId> batch;
    batch.reserve(n);
    for (size_t i = 0; i < n; i++) {
        batch.push_back(context.pool_ids[order[i]]);
    }
    return batch;
}

std::vector<size_t> rankByMargin(const QueryContext& context) {
    std::vector<double> margins;
    margins.reserve(context.pool_scores.size());
    for (const auto& row : context.pool_scores) {
        margins.push_back(scoreMargin(row));
    }
    return rankByKey(context.pool_ids, margins, true);
}

std::vector<CandidateId> MarginUncertaintySampling::select(const QueryContext& context,
                                                           size_t k) const {
    validateQueryContext(context, false, true);
    return takeFirst(context, rankByMargin(context), k);
}

std::vector<CandidateId> EntropyUncertaintySampling::select(const QueryContext& context,
                                                            size_t k) const {
    validateQueryContext(context, false, true);

    std::vector<double> entropies;
    entropies.reserve(context.pool_scores.size());
    for (const auto& row : context.pool_scores) {
        entropies.push_back(scoreEntropy(row));
    }
    return takeFirst(context, rankByKey(context.pool_ids, entropies, false), k);
}

} // namespace specsel
