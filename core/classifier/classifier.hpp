#pragma once

#include "data/candidate.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace specsel {

/// One row per input sample, one column per class in classes() order.
using ScoreMatrix = std::vector<std::vector<double>>;

// ─── Classifier ────────────────────────────────────────────────
// Black-box photometric classifier seen by the loop. Any statistical
// model plugs in by implementing fit() and predictScore(); the loop
// never looks inside.
//
// Scores are real-valued and not necessarily probabilities, but higher
// always means "more likely this class".

class Classifier {
public:
    virtual ~Classifier() = default;

    virtual std::string name() const = 0;

    /// Rebuild internal state from the labeled set.
    /// Throws InsufficientLabelsError with fewer than 2 distinct labels,
    /// InvariantError on mismatched or ragged input.
    virtual void fit(const std::vector<FeatureVector>& features,
                     const std::vector<int>& labels) = 0;

    /// Per-class scores for each row. Requires a prior fit().
    virtual ScoreMatrix predictScore(const std::vector<FeatureVector>& features) const = 0;

    /// Sorted class labels seen at the last fit().
    virtual std::vector<int> classes() const = 0;

    /// Argmax of predictScore(); ties go to the lowest class label.
    virtual std::vector<int> predict(const std::vector<FeatureVector>& features) const;

    /// The loop refits from scratch unless an adapter opts in here.
    virtual bool supportsIncrementalFit() const { return false; }

    /// Whether predictScoreSamples() yields posterior draws. Required by
    /// the batch-bald strategy.
    virtual bool supportsScoreSamples() const { return false; }

    /// `num_samples` posterior draws of predictScore(), each one row per
    /// input and one column per class in classes() order. Draws depend
    /// only on (training set, features, num_samples, seed).
    /// The default throws InvariantError.
    virtual std::vector<ScoreMatrix> predictScoreSamples(
        const std::vector<FeatureVector>& features,
        size_t num_samples, uint64_t seed) const;
};

using ClassifierFactory = std::function<std::unique_ptr<Classifier>()>;

/// Posterior draws by refitting `make()` models on stratified bootstrap
/// resamples of the training set. Every class keeps at least one member
/// in every resample, so the columns of all draws line up.
std::vector<ScoreMatrix> bootstrapScoreSamples(
    const std::vector<FeatureVector>& train_features,
    const std::vector<int>& train_labels,
    const std::vector<FeatureVector>& features,
    size_t num_samples, uint64_t seed,
    const ClassifierFactory& make);

/// Shared input checks for fit(): non-empty, matching lengths, uniform
/// feature width. Returns the sorted distinct labels; throws
/// InsufficientLabelsError if there are fewer than two.
std::vector<int> validateTrainingSet(const std::vector<FeatureVector>& features,
                                     const std::vector<int>& labels);

} // namespace specsel
