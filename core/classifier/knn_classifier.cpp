#include "classifier/knn_classifier.hpp"
#include "errors/errors.hpp"

#include <algorithm>
#include <numeric>

namespace specsel {

KNearestNeighborsClassifier::KNearestNeighborsClassifier(size_t k, DistanceMetric metric)
    : k_(k), metric_(metric) {
    if (k_ == 0) {
        throw InvariantError("knn: k must be positive");
    }
}

void KNearestNeighborsClassifier::fit(const std::vector<FeatureVector>& features,
                                      const std::vector<int>& labels) {
    std::vector<int> cls = validateTrainingSet(features, labels);

    std::vector<size_t> class_index;
    class_index.reserve(labels.size());
    for (int label : labels) {
        class_index.push_back(std::lower_bound(cls.begin(), cls.end(), label) - cls.begin());
    }

    classes_ = std::move(cls);
    train_features_ = features;
    train_class_index_ = std::move(class_index);
    train_labels_ = labels;
}

std::vector<ScoreMatrix> KNearestNeighborsClassifier::predictScoreSamples(
    const std::vector<FeatureVector>& features, size_t num_samples, uint64_t seed) const {
    if (classes_.empty()) {
        throw InvariantError("knn: predictScoreSamples() before fit()");
    }
    const size_t k = k_;
    const DistanceMetric metric = metric_;
    return bootstrapScoreSamples(train_features_, train_labels_, features, num_samples, seed,
                                 [k, metric] {
                                     return std::make_unique<KNearestNeighborsClassifier>(k, metric);
                                 });
}

ScoreMatrix KNearestNeighborsClassifier::predictScore(
    const std::vector<FeatureVector>& features) const {
    if (classes_.empty()) {
        throw InvariantError("knn: predictScore() before fit()");
    }

    const size_t k = std::min(k_, train_features_.size());
    ScoreMatrix scores;
    scores.reserve(features.size());

    std::vector<double> dist(train_features_.size());
    std::vector<size_t> order(train_features_.size());

    for (const auto& row : features) {
        for (size_t i = 0; i < train_features_.size(); i++) {
            dist[i] = distance(metric_, row, train_features_[i]);
        }
        std::iota(order.begin(), order.end(), 0);
        std::partial_sort(order.begin(), order.begin() + k, order.end(),
            [&](size_t a, size_t b) {
                if (dist[a] != dist[b]) return dist[a] < dist[b];
                return a < b;
            });

        std::vector<double> votes(classes_.size(), 0.0);
        for (size_t n = 0; n < k; n++) {
            votes[train_class_index_[order[n]]] += 1.0;
        }
        for (double& v : votes) v /= static_cast<double>(k);
        scores.push_back(std::move(votes));
    }
    return scores;
}

} // namespace specsel
