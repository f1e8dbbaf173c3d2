#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace specsel {

using CandidateId = uint64_t;
using FeatureVector = std::vector<double>;

// ─── Candidate ─────────────────────────────────────────────────
// One observed transient. `label` is the true class, known only to the
// simulation oracle until the candidate is queried.

struct Candidate {
    CandidateId id = 0;
    FeatureVector features;
    int label = 0;
    double cost = 1.0;  // spectroscopic cost of one query

    Candidate() = default;
    Candidate(CandidateId id, FeatureVector features, int label, double cost = 1.0)
        : id(id), features(std::move(features)), label(label), cost(cost) {}
};

// ─── Candidate Table ───────────────────────────────────────────
// The full candidate set of one experiment. Immutable once built, so a
// single instance can be shared read-only between concurrent runs.

class CandidateTable {
public:
    /// Throws InvariantError on an empty set, duplicate ids, ragged
    /// feature vectors or non-positive costs.
    explicit CandidateTable(std::vector<Candidate> candidates);

    size_t size() const { return candidates_.size(); }
    size_t featureDim() const { return feature_dim_; }

    bool contains(CandidateId id) const { return index_.count(id) > 0; }

    /// Throws InvariantError for an unknown id.
    const Candidate& get(CandidateId id) const;

    /// All ids in insertion order.
    std::vector<CandidateId> ids() const;

    /// Sorted distinct true labels across the whole table.
    std::vector<int> classes() const;

    /// Gather rows / labels / costs for the given ids, in the given order.
    std::vector<FeatureVector> features(const std::vector<CandidateId>& ids) const;
    std::vector<int> labels(const std::vector<CandidateId>& ids) const;
    double totalCost(const std::vector<CandidateId>& ids) const;

private:
    std::vector<Candidate> candidates_;
    std::unordered_map<CandidateId, size_t> index_;
    size_t feature_dim_ = 0;
};

using CandidateTablePtr = std::shared_ptr<const CandidateTable>;

/// Convenience for building the shared, immutable table.
CandidateTablePtr makeCandidateTable(std::vector<Candidate> candidates);

} // namespace specsel
