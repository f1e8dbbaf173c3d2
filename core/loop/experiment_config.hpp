#pragma once

#include "strategy/strategy_factory.hpp"
#include "util/distance.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace specsel {

/// Experiment configuration, passed by value into each loop. There is
/// no process-wide configuration state, so runs stay independent.
struct ExperimentConfig {
    StrategyKind query_strategy = StrategyKind::UNCERTAINTY_MARGIN;
    int batch_size = 1;                     // queries per iteration
    std::optional<int> max_iterations;      // empty = until pool empty
    uint64_t random_seed = 42;
    int diversity_shortlist_size = 20;      // diversity strategy only
    DistanceMetric distance_metric = DistanceMetric::EUCLIDEAN;
    std::optional<double> label_budget;     // total query cost; empty = unlimited
    int target_class = 1;                   // class tracked by efficiency/purity/fom
    double fom_penalty = 3.0;               // weight of false targets in fom
    int posterior_samples = 10;             // batch-bald: posterior draws per iteration
    int joint_samples = 200;                // batch-bald: sampled joint configurations

    /// Throws InvariantError on a non-positive batch size, iteration
    /// limit, shortlist size, sample count or budget, or a negative fom
    /// penalty.
    void validate() const;

    /// One-line "key=value ..." summary for logs.
    std::string describe() const;

    std::string strategyName() const { return strategyKindName(query_strategy); }
};

/// Parse "key = value" lines. Blank lines and text after '#' are
/// ignored. Recognized keys: query_strategy, batch_size, max_iterations
/// (integer or "until-pool-empty"), random_seed,
/// diversity_shortlist_size, distance_metric, label_budget (number or
/// "unlimited"), target_class, fom_penalty, posterior_samples,
/// joint_samples.
/// Unknown keys, malformed lines, bad values and integers outside the
/// field's range throw InvariantError.
/// The result is validated.
ExperimentConfig parseConfig(const std::string& text);

/// parseConfig() on a file's contents. Throws Error("IOError") if the
/// file cannot be read.
ExperimentConfig loadConfigFile(const std::string& path);

} // namespace specsel
