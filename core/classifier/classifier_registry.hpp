#pragma once

#include "classifier/classifier.hpp"

#include <memory>
#include <string>
#include <vector>

namespace specsel {

/// Built-in classifiers by name: "nearest_centroid", "knn".
/// `knn_k` is only read by "knn". Throws InvariantError on an unknown name.
std::unique_ptr<Classifier> makeClassifier(const std::string& name, size_t knn_k = 5);

/// Factory that builds a fresh built-in classifier on every call.
ClassifierFactory classifierFactory(const std::string& name, size_t knn_k = 5);

std::vector<std::string> classifierNames();

} // namespace specsel
