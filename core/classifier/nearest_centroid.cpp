#include "classifier/nearest_centroid.hpp"
#include "errors/errors.hpp"
#include "util/distance.hpp"

#include <algorithm>
#include <cmath>

namespace specsel {

void NearestCentroidClassifier::fit(const std::vector<FeatureVector>& features,
                                    const std::vector<int>& labels) {
    std::vector<int> cls = validateTrainingSet(features, labels);
    const size_t dim = features.front().size();

    std::vector<FeatureVector> sums(cls.size(), FeatureVector(dim, 0.0));
    std::vector<size_t> counts(cls.size(), 0);

    for (size_t i = 0; i < features.size(); i++) {
        size_t c = std::lower_bound(cls.begin(), cls.end(), labels[i]) - cls.begin();
        for (size_t d = 0; d < dim; d++) sums[c][d] += features[i][d];
        counts[c]++;
    }
    for (size_t c = 0; c < cls.size(); c++) {
        for (size_t d = 0; d < dim; d++) sums[c][d] /= static_cast<double>(counts[c]);
    }

    classes_ = std::move(cls);
    centroids_ = std::move(sums);
    train_features_ = features;
    train_labels_ = labels;
}

std::vector<ScoreMatrix> NearestCentroidClassifier::predictScoreSamples(
    const std::vector<FeatureVector>& features, size_t num_samples, uint64_t seed) const {
    if (classes_.empty()) {
        throw InvariantError("nearest_centroid: predictScoreSamples() before fit()");
    }
    return bootstrapScoreSamples(train_features_, train_labels_, features, num_samples, seed,
                                 [] { return std::make_unique<NearestCentroidClassifier>(); });
}

ScoreMatrix NearestCentroidClassifier::predictScore(
    const std::vector<FeatureVector>& features) const {
    if (classes_.empty()) {
        throw InvariantError("nearest_centroid: predictScore() before fit()");
    }

    ScoreMatrix scores;
    scores.reserve(features.size());
    for (const auto& row : features) {
        std::vector<double> logits(centroids_.size());
        for (size_t c = 0; c < centroids_.size(); c++) {
            logits[c] = -distance(DistanceMetric::EUCLIDEAN, row, centroids_[c]);
        }
        // Shift by the max logit for a stable softmax
        double max_logit = *std::max_element(logits.begin(), logits.end());
        double total = 0.0;
        for (double& l : logits) {
            l = std::exp(l - max_logit);
            total += l;
        }
        for (double& l : logits) l /= total;
        scores.push_back(std::move(logits));
    }
    return scores;
}

} // namespace specsel
