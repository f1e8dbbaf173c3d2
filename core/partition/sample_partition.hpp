#pragma once

#include "data/candidate.hpp"

#include <unordered_map>
#include <vector>

namespace specsel {

enum class Membership {
    LABELED,
    POOL,
    VALIDATION
};

const char* membershipName(Membership m);

// ─── Sample Partition ──────────────────────────────────────────
// Splits a fixed candidate set into Labeled, Pool and Validation.
//
// Invariant after every operation: each id belongs to exactly one set
// and the three sets together cover the full candidate set. The only
// mutation is moving ids from Pool to Labeled; Validation never changes
// after initialize().
//
// Accessors return copies in insertion order so a caller can never
// mutate the sets behind the partition's back.

class SamplePartition {
public:
    SamplePartition() = default;

    /// Pool receives every id of `all_ids` that is neither labeled nor
    /// validation, in `all_ids` order. Throws InvariantError on duplicate
    /// ids, overlap between the two given sets, or ids outside `all_ids`.
    /// Replaces any previous contents.
    void initialize(const std::vector<CandidateId>& all_ids,
                    const std::vector<CandidateId>& initial_labeled_ids,
                    const std::vector<CandidateId>& validation_ids);

    /// Move ids from Pool to Labeled, appended in the given order.
    /// All-or-nothing: throws NotInPoolError before touching anything if
    /// an id is not in Pool or appears twice in `ids`.
    void moveToLabeled(const std::vector<CandidateId>& ids);

    std::vector<CandidateId> labeledIds() const { return labeled_; }
    std::vector<CandidateId> poolIds() const { return pool_; }
    std::vector<CandidateId> validationIds() const { return validation_; }

    size_t labeledSize() const { return labeled_.size(); }
    size_t poolSize() const { return pool_.size(); }
    size_t validationSize() const { return validation_.size(); }
    size_t totalSize() const { return membership_.size(); }

    bool contains(CandidateId id) const { return membership_.count(id) > 0; }
    bool inPool(CandidateId id) const { return is(id, Membership::POOL); }
    bool isLabeled(CandidateId id) const { return is(id, Membership::LABELED); }
    bool isValidation(CandidateId id) const { return is(id, Membership::VALIDATION); }

    /// Throws InvariantError for an id outside the candidate set.
    Membership membershipOf(CandidateId id) const;

    /// Re-verify disjointness and coverage from scratch.
    /// Throws InvariantError describing the first violation found.
    void checkInvariants() const;

private:
    std::vector<CandidateId> labeled_;
    std::vector<CandidateId> pool_;
    std::vector<CandidateId> validation_;
    std::unordered_map<CandidateId, Membership> membership_;

    bool is(CandidateId id, Membership m) const {
        auto it = membership_.find(id);
        return it != membership_.end() && it->second == m;
    }
};

} // namespace specsel
