#include "classifier/classifier_registry.hpp"
#include "classifier/knn_classifier.hpp"
#include "classifier/nearest_centroid.hpp"
#include "errors/errors.hpp"

namespace specsel {

std::unique_ptr<Classifier> makeClassifier(const std::string& name, size_t knn_k) {
    if (name == "nearest_centroid") {
        return std::make_unique<NearestCentroidClassifier>();
    }
    if (name == "knn") {
        return std::make_unique<KNearestNeighborsClassifier>(knn_k);
    }
    throw InvariantError("unknown classifier: " + name);
}

ClassifierFactory classifierFactory(const std::string& name, size_t knn_k) {
    // Fail on a bad name now rather than inside a worker thread
    makeClassifier(name, knn_k);
    return [name, knn_k]() { return makeClassifier(name, knn_k); };
}

std::vector<std::string> classifierNames() {
    return {"nearest_centroid", "knn"};
}

} // namespace specsel
