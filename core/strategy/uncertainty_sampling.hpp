#pragma once

#include "strategy/query_strategy.hpp"

namespace specsel {

// ─── Uncertainty Sampling ──────────────────────────────────────
// Query the candidates the current classifier is least sure about.
// Ties are broken by ascending candidate id.

/// Smallest margin between the top two class scores first.
class MarginUncertaintySampling : public QueryStrategy {
public:
    std::string name() const override { return "uncertainty-margin"; }

    std::vector<CandidateId> select(const QueryContext& context, size_t k) const override;
};

/// Highest entropy of the normalized score row first.
class EntropyUncertaintySampling : public QueryStrategy {
public:
    std::string name() const override { return "uncertainty-entropy"; }

    std::vector<CandidateId> select(const QueryContext& context, size_t k) const override;
};

/// Pool row indices ordered most-uncertain first by margin. Shared with
/// the diversity strategy's shortlist.
std::vector<size_t> rankByMargin(const QueryContext& context);

} // namespace specsel
