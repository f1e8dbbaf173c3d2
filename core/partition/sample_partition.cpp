#include "partition/sample_partition.hpp"
#include "errors/errors.hpp"

#include <algorithm>
#include <unordered_set>

namespace specsel {

const char* membershipName(Membership m) {
    switch (m) {
        case Membership::LABELED:    return "labeled";
        case Membership::POOL:       return "pool";
        case Membership::VALIDATION: return "validation";
    }
    return "unknown";
}

void SamplePartition::initialize(const std::vector<CandidateId>& all_ids,
                                 const std::vector<CandidateId>& initial_labeled_ids,
                                 const std::vector<CandidateId>& validation_ids) {
    std::unordered_set<CandidateId> universe;
    universe.reserve(all_ids.size());
    for (CandidateId id : all_ids) {
        if (!universe.insert(id).second) {
            throw InvariantError("duplicate id in candidate set: " + std::to_string(id));
        }
    }

    // Build into locals so a failed initialize() leaves *this untouched
    std::unordered_map<CandidateId, Membership> membership;
    membership.reserve(all_ids.size());

    auto assign = [&](const std::vector<CandidateId>& ids, Membership m) {
        for (CandidateId id : ids) {
            if (!universe.count(id)) {
                throw InvariantError(std::string(membershipName(m)) + " id " +
                                     std::to_string(id) + " is not in the candidate set");
            }
            auto [it, inserted] = membership.emplace(id, m);
            if (!inserted) {
                throw InvariantError("id " + std::to_string(id) + " assigned to both " +
                                     membershipName(it->second) + " and " +
                                     membershipName(m));
            }
        }
    };
    assign(initial_labeled_ids, Membership::LABELED);
    assign(validation_ids, Membership::VALIDATION);

    std::vector<CandidateId> pool;
    for (CandidateId id : all_ids) {
        if (membership.emplace(id, Membership::POOL).second) {
            pool.push_back(id);
        }
    }

    labeled_ = initial_labeled_ids;
    validation_ = validation_ids;
    pool_ = std::move(pool);
    membership_ = std::move(membership);
}

void SamplePartition::moveToLabeled(const std::vector<CandidateId>& ids) {
    std::unordered_set<CandidateId> batch;
    batch.reserve(ids.size());
    for (CandidateId id : ids) {
        if (!inPool(id)) {
            auto it = membership_.find(id);
            std::string where = it == membership_.end()
                ? "not in the candidate set"
                : std::string("in ") + membershipName(it->second);
            throw NotInPoolError("id " + std::to_string(id) + " is " + where);
        }
        if (!batch.insert(id).second) {
            throw NotInPoolError("id " + std::to_string(id) + " repeated in one batch");
        }
    }

    pool_.erase(std::remove_if(pool_.begin(), pool_.end(),
                               [&](CandidateId id) { return batch.count(id) > 0; }),
                pool_.end());
    for (CandidateId id : ids) {
        membership_[id] = Membership::LABELED;
        labeled_.push_back(id);
    }
}

Membership SamplePartition::membershipOf(CandidateId id) const {
    auto it = membership_.find(id);
    if (it == membership_.end()) {
        throw InvariantError("id " + std::to_string(id) + " is not in the candidate set");
    }
    return it->second;
}

void SamplePartition::checkInvariants() const {
    std::unordered_set<CandidateId> seen;
    auto check = [&](const std::vector<CandidateId>& ids, Membership m) {
        for (CandidateId id : ids) {
            if (!seen.insert(id).second) {
                throw InvariantError("id " + std::to_string(id) +
                                     " appears in more than one set");
            }
            if (!is(id, m)) {
                throw InvariantError("id " + std::to_string(id) + " listed in " +
                                     membershipName(m) + " but recorded elsewhere");
            }
        }
    };
    check(labeled_, Membership::LABELED);
    check(pool_, Membership::POOL);
    check(validation_, Membership::VALIDATION);

    if (seen.size() != membership_.size()) {
        throw InvariantError("partition covers " + std::to_string(seen.size()) +
                             " of " + std::to_string(membership_.size()) + " candidates");
    }
}

} // namespace specsel
