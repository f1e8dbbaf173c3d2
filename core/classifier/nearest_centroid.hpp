#pragma once

#include "classifier/classifier.hpp"

namespace specsel {

// ─── Nearest Centroid ──────────────────────────────────────────
// One centroid per class; score(c) = softmax over classes of
// -distance(x, centroid_c). Rows sum to 1.

class NearestCentroidClassifier : public Classifier {
public:
    std::string name() const override { return "nearest_centroid"; }

    void fit(const std::vector<FeatureVector>& features,
             const std::vector<int>& labels) override;

    ScoreMatrix predictScore(const std::vector<FeatureVector>& features) const override;

    std::vector<int> classes() const override { return classes_; }

    /// Bootstrap draws over the last training set.
    bool supportsScoreSamples() const override { return true; }
    std::vector<ScoreMatrix> predictScoreSamples(const std::vector<FeatureVector>& features,
                                                 size_t num_samples,
                                                 uint64_t seed) const override;

    const std::vector<FeatureVector>& centroids() const { return centroids_; }

private:
    std::vector<int> classes_;
    std::vector<FeatureVector> centroids_;  // parallel to classes_
    std::vector<FeatureVector> train_features_;
    std::vector<int> train_labels_;
};

} // namespace specsel
