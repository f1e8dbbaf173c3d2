#pragma once

#include "strategy/query_strategy.hpp"
#include "util/distance.hpp"

#include <memory>
#include <string>
#include <vector>

namespace specsel {

enum class StrategyKind {
    RANDOM,
    UNCERTAINTY_MARGIN,
    UNCERTAINTY_ENTROPY,
    DIVERSITY,
    BATCH_BALD
};

/// "random", "uncertainty-margin", "uncertainty-entropy", "diversity",
/// "batch-bald".
const char* strategyKindName(StrategyKind kind);

/// Inverse of strategyKindName(). Throws InvariantError on an unknown name.
StrategyKind parseStrategyKind(const std::string& name);

/// Every configuration name, in declaration order.
std::vector<std::string> strategyNames();

/// `shortlist_size` and `metric` are only read by DIVERSITY,
/// `joint_samples` only by BATCH_BALD.
std::unique_ptr<QueryStrategy> makeQueryStrategy(
    StrategyKind kind,
    size_t shortlist_size = 20,
    DistanceMetric metric = DistanceMetric::EUCLIDEAN,
    size_t joint_samples = 200);

} // namespace specsel
