#include "strategy/strategy_factory.hpp"
#include "strategy/random_sampling.hpp"
#include "strategy/uncertainty_sampling.hpp"
#include "strategy/diversity_sampling.hpp"
#include "strategy/batch_bald_sampling.hpp"
#include "errors/errors.hpp"

namespace specsel {

const char* strategyKindName(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::RANDOM:              return "random";
        case StrategyKind::UNCERTAINTY_MARGIN:  return "uncertainty-margin";
        case StrategyKind::UNCERTAINTY_ENTROPY: return "uncertainty-entropy";
        case StrategyKind::DIVERSITY:           return "diversity";
        case StrategyKind::BATCH_BALD:          return "batch-bald";
    }
    return "unknown";
}

StrategyKind parseStrategyKind(const std::string& name) {
    for (StrategyKind kind : {StrategyKind::RANDOM,
                              StrategyKind::UNCERTAINTY_MARGIN,
                              StrategyKind::UNCERTAINTY_ENTROPY,
                              StrategyKind::DIVERSITY,
                              StrategyKind::BATCH_BALD}) {
        if (name == strategyKindName(kind)) return kind;
    }
    throw InvariantError("unknown query strategy: " + name);
}

std::vector<std::string> strategyNames() {
    return {strategyKindName(StrategyKind::RANDOM),
            strategyKindName(StrategyKind::UNCERTAINTY_MARGIN),
            strategyKindName(StrategyKind::UNCERTAINTY_ENTROPY),
            strategyKindName(StrategyKind::DIVERSITY),
            strategyKindName(StrategyKind::BATCH_BALD)};
}

std::unique_ptr<QueryStrategy> makeQueryStrategy(StrategyKind kind,
                                                 size_t shortlist_size,
                                                 DistanceMetric metric,
                                                 size_t joint_samples) {
    switch (kind) {
        case StrategyKind::RANDOM:
            return std::make_unique<RandomSampling>();
        case StrategyKind::UNCERTAINTY_MARGIN:
            return std::make_unique<MarginUncertaintySampling>();
        case StrategyKind::UNCERTAINTY_ENTROPY:
            return std::make_unique<EntropyUncertaintySampling>();
        case StrategyKind::DIVERSITY:
            return std::make_unique<DiversitySampling>(shortlist_size, metric);
        case StrategyKind::BATCH_BALD:
            return std::make_unique<BatchBaldSampling>(1024, joint_samples);
    }
    throw InvariantError("unhandled query strategy kind");
}

} // namespace specsel
