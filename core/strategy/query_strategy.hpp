#pragma once

#include "classifier/classifier.hpp"
#include "data/candidate.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace specsel {

// ─── Query Context ─────────────────────────────────────────────
// Everything a strategy may look at. pool_features and pool_scores are
// row-aligned with pool_ids.

struct QueryContext {
    std::vector<CandidateId> pool_ids;
    std::vector<FeatureVector> pool_features;
    ScoreMatrix pool_scores;
    std::vector<ScoreMatrix> pool_score_samples;  // posterior draws, each aligned like pool_scores
    int iteration = 0;
    uint64_t seed = 0;
};

// ─── Query Strategy ────────────────────────────────────────────
// Ranks Pool candidates by the value of querying them and returns the
// next batch.
//
// Contract for every strategy:
// - select() is a pure function of (context, k): no hidden state, so
//   the same inputs give the same batch.
// - the result holds min(k, pool size) distinct ids taken from
//   context.pool_ids, ordered best first.
// - misaligned context vectors raise InvariantError.

class QueryStrategy {
public:
    virtual ~QueryStrategy() = default;

    /// Configuration name, e.g. "uncertainty-margin".
    virtual std::string name() const = 0;

    /// Whether select() reads pool_scores (the random baseline doesn't).
    virtual bool needsScores() const { return true; }

    /// Whether select() reads pool_score_samples.
    virtual bool needsScoreSamples() const { return false; }

    virtual std::vector<CandidateId> select(const QueryContext& context, size_t k) const = 0;
};

// ─── Scoring helpers ───────────────────────────────────────────

/// Difference between the two highest scores of a row (binary case:
/// |s1 - s2|). A single-column row has margin |s0|. NaN if any score is
/// not finite.
double scoreMargin(const std::vector<double>& row);

/// Shannon entropy (nats) of the row after clamping negatives to 0 and
/// normalizing. An all-zero row is treated as uniform. NaN if any score
/// is not finite.
double scoreEntropy(const std::vector<double>& row);

/// Throws InvariantError if features/scores are not aligned with ids.
/// Features or scores may be empty when the strategy does not use them.
void validateQueryContext(const QueryContext& context, bool needs_features,
                          bool needs_scores);

/// Throws InvariantError unless there is at least one draw and every
/// draw has one row per pool id, all with the same column count.
void validateScoreSamples(const QueryContext& context);

/// Row indices of `keys` sorted by key (ascending or descending), with
/// ties broken by ascending candidate id. NaN and infinite keys always
/// rank last.
std::vector<size_t> rankByKey(const std::vector<CandidateId>& ids,
                              const std::vector<double>& keys,
                              bool ascending);

} // namespace specsel
