#pragma once

#include "classifier/classifier.hpp"
#include "util/distance.hpp"

namespace specsel {

// ─── k-Nearest Neighbours ──────────────────────────────────────
// score(c) = fraction of the k nearest training rows with label c.
// Equal distances keep training order, so results are deterministic.
// k is clamped to the training-set size.

class KNearestNeighborsClassifier : public Classifier {
public:
    explicit KNearestNeighborsClassifier(size_t k = 5,
                                         DistanceMetric metric = DistanceMetric::EUCLIDEAN);

    std::string name() const override { return "knn"; }

    void fit(const std::vector<FeatureVector>& features,
             const std::vector<int>& labels) override;

    ScoreMatrix predictScore(const std::vector<FeatureVector>& features) const override;

    std::vector<int> classes() const override { return classes_; }

    /// Bootstrap draws over the last training set.
    bool supportsScoreSamples() const override { return true; }
    std::vector<ScoreMatrix> predictScoreSamples(const std::vector<FeatureVector>& features,
                                                 size_t num_samples,
                                                 uint64_t seed) const override;

    size_t k() const { return k_; }

private:
    size_t k_;
    DistanceMetric metric_;
    std::vector<int> classes_;
    std::vector<FeatureVector> train_features_;
    std::vector<size_t> train_class_index_;  // index into classes_
    std::vector<int> train_labels_;
};

} // namespace specsel
