#pragma once

#include "strategy/query_strategy.hpp"

namespace specsel {

// ─── Batch BALD ────────────────────────────────────────────────
// Greedy batch-mode Bayesian active learning by disagreement. Reads K
// posterior score draws per Pool candidate and grows the batch one id
// at a time, each step adding the candidate that maximizes
//
//   H(y_batch, y_n) - sum over batch ∪ {n} of E_k[H(y_i | draw k)]
//
// i.e. the mutual information between the batch's joint label and the
// model posterior. The joint entropy is exact while the number of label
// configurations stays within max_exact_configs; past that it is an
// importance-weighted estimate from joint_samples sampled configurations.
// Score rows are clamped to >= 0 and normalized; an all-zero row is
// uniform. Ties go to the smaller candidate id.

class BatchBaldSampling : public QueryStrategy {
public:
    explicit BatchBaldSampling(size_t max_exact_configs = 1024, size_t joint_samples = 200);

    std::string name() const override { return "batch-bald"; }

    bool needsScores() const override { return false; }
    bool needsScoreSamples() const override { return true; }

    std::vector<CandidateId> select(const QueryContext& context, size_t k) const override;

    size_t maxExactConfigs() const { return max_exact_configs_; }
    size_t jointSamples() const { return joint_samples_; }

private:
    size_t max_exact_configs_;
    size_t joint_samples_;
};

} // namespace specsel
