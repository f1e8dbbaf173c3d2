#include "classifier/classifier.hpp"
#include "errors/errors.hpp"

#include <map>
#include <random>
#include <set>

namespace specsel {

std::vector<int> Classifier::predict(const std::vector<FeatureVector>& features) const {
    ScoreMatrix scores = predictScore(features);
    std::vector<int> cls = classes();

    std::vector<int> predictions;
    predictions.reserve(scores.size());
    for (const auto& row : scores) {
        size_t best = 0;
        for (size_t c = 1; c < row.size(); c++) {
            if (row[c] > row[best]) best = c;
        }
        predictions.push_back(cls.at(best));
    }
    return predictions;
}

std::vector<ScoreMatrix> Classifier::predictScoreSamples(
    const std::vector<FeatureVector>&, size_t, uint64_t) const {
    throw InvariantError(name() + " does not provide posterior score samples");
}

std::vector<ScoreMatrix> bootstrapScoreSamples(
    const std::vector<FeatureVector>& train_features,
    const std::vector<int>& train_labels,
    const std::vector<FeatureVector>& features,
    size_t num_samples, uint64_t seed,
    const ClassifierFactory& make) {
    if (num_samples == 0) {
        throw InvariantError("posterior sample count must be positive");
    }
    if (train_features.empty() || train_features.size() != train_labels.size()) {
        throw InvariantError("score samples need a fitted training set");
    }

    std::map<int, std::vector<size_t>> by_class;
    for (size_t i = 0; i < train_labels.size(); i++) {
        by_class[train_labels[i]].push_back(i);
    }

    std::seed_seq seq{static_cast<uint32_t>(seed & 0xffffffffu),
                      static_cast<uint32_t>(seed >> 32)};
    std::mt19937_64 rng(seq);

    std::vector<ScoreMatrix> draws;
    draws.reserve(num_samples);
    std::vector<FeatureVector> x;
    std::vector<int> y;
    for (size_t s = 0; s < num_samples; s++) {
        x.clear();
        y.clear();
        for (const auto& [label, members] : by_class) {
            std::uniform_int_distribution<size_t> pick(0, members.size() - 1);
            for (size_t n = 0; n < members.size(); n++) {
                x.push_back(train_features[members[pick(rng)]]);
                y.push_back(label);
            }
        }
        std::unique_ptr<Classifier> model = make();
        model->fit(x, y);
        draws.push_back(model->predictScore(features));
    }
    return draws;
}

std::vector<int> validateTrainingSet(const std::vector<FeatureVector>& features,
                                     const std::vector<int>& labels) {
    if (features.size() != labels.size()) {
        throw InvariantError("training set has " + std::to_string(features.size()) +
                             " rows but " + std::to_string(labels.size()) + " labels");
    }

    // An empty labeled set has zero classes and lands here too
    std::set<int> distinct(labels.begin(), labels.end());
    if (distinct.size() < 2) {
        throw InsufficientLabelsError(
            "labeled set holds " + std::to_string(distinct.size()) +
            " distinct class(es), at least 2 are required to fit");
    }

    const size_t dim = features.front().size();
    for (const auto& row : features) {
        if (row.size() != dim) {
            throw InvariantError("ragged feature rows in training set");
        }
    }
    return std::vector<int>(distinct.begin(), distinct.end());
}

} // namespace specsel
