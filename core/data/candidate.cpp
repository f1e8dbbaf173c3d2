#include "data/candidate.hpp"
#include "errors/errors.hpp"

#include <algorithm>
#include <set>

namespace specsel {

CandidateTable::CandidateTable(std::vector<Candidate> candidates)
    : candidates_(std::move(candidates)) {
    if (candidates_.empty()) {
        throw InvariantError("candidate table is empty");
    }
    feature_dim_ = candidates_.front().features.size();

    index_.reserve(candidates_.size());
    for (size_t i = 0; i < candidates_.size(); i++) {
        const Candidate& c = candidates_[i];
        if (c.features.size() != feature_dim_) {
            throw InvariantError("candidate " + std::to_string(c.id) + " has " +
                                 std::to_string(c.features.size()) + " features, expected " +
                                 std::to_string(feature_dim_));
        }
        if (!(c.cost > 0.0)) {
            throw InvariantError("candidate " + std::to_string(c.id) +
                                 " has non-positive cost");
        }
        if (!index_.emplace(c.id, i).second) {
            throw InvariantError("duplicate candidate id: " + std::to_string(c.id));
        }
    }
}

const Candidate& CandidateTable::get(CandidateId id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        throw InvariantError("unknown candidate id: " + std::to_string(id));
    }
    return candidates_[it->second];
}

std::vector<CandidateId> CandidateTable::ids() const {
    std::vector<CandidateId> result;
    result.reserve(candidates_.size());
    for (const auto& c : candidates_) result.push_back(c.id);
    return result;
}

std::vector<int> CandidateTable::classes() const {
    std::set<int> distinct;
    for (const auto& c : candidates_) distinct.insert(c.label);
    return std::vector<int>(distinct.begin(), distinct.end());
}

std::vector<FeatureVector> CandidateTable::features(
    const std::vector<CandidateId>& ids) const {
    std::vector<FeatureVector> rows;
    rows.reserve(ids.size());
    for (CandidateId id : ids) rows.push_back(get(id).features);
    return rows;
}

std::vector<int> CandidateTable::labels(const std::vector<CandidateId>& ids) const {
    std::vector<int> result;
    result.reserve(ids.size());
    for (CandidateId id : ids) result.push_back(get(id).label);
    return result;
}

double CandidateTable::totalCost(const std::vector<CandidateId>& ids) const {
    double total = 0.0;
    for (CandidateId id : ids) total += get(id).cost;
    return total;
}

CandidateTablePtr makeCandidateTable(std::vector<Candidate> candidates) {
    return std::make_shared<CandidateTable>(std::move(candidates));
}

} // namespace specsel
