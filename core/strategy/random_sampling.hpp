#pragma once

#include "strategy/query_strategy.hpp"

namespace specsel {

/// Baseline: uniform sample without replacement. The generator is
/// seeded from (context.seed, context.iteration) on every call.
class RandomSampling : public QueryStrategy {
public:
    std::string name() const override { return "random"; }
    bool needsScores() const override { return false; }

    std::vector<CandidateId> select(const QueryContext& context, size_t k) const override;
};

} // namespace specsel
