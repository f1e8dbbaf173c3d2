#include "metrics/classification_metrics.hpp"
#include "errors/errors.hpp"

#include <set>

namespace specsel {

namespace {

struct TargetCounts {
    int correct_target = 0;    // predicted target, truly target
    int wrong_target = 0;      // misclassified non-target
    int total_target = 0;      // truly target
};

void requireSameLength(const std::vector<int>& predicted, const std::vector<int>& truth) {
    if (predicted.size() != truth.size()) {
        throw InvariantError("metric inputs differ in length: " +
                             std::to_string(predicted.size()) + " predictions, " +
                             std::to_string(truth.size()) + " labels");
    }
}

TargetCounts countTarget(const std::vector<int>& predicted, const std::vector<int>& truth,
                         int target_class) {
    requireSameLength(predicted, truth);
    TargetCounts counts;
    for (size_t i = 0; i < truth.size(); i++) {
        if (truth[i] == target_class) {
            counts.total_target++;
            if (predicted[i] == target_class) counts.correct_target++;
        } else if (predicted[i] != truth[i]) {
            counts.wrong_target++;
        }
    }
    return counts;
}

double ratio(double num, double den) {
    return den > 0.0 ? num / den : 0.0;
}

} // namespace

double accuracy(const std::vector<int>& predicted, const std::vector<int>& truth) {
    requireSameLength(predicted, truth);
    int correct = 0;
    for (size_t i = 0; i < truth.size(); i++) {
        if (predicted[i] == truth[i]) correct++;
    }
    return ratio(correct, static_cast<double>(truth.size()));
}

double efficiency(const std::vector<int>& predicted, const std::vector<int>& truth,
                  int target_class) {
    TargetCounts c = countTarget(predicted, truth, target_class);
    return ratio(c.correct_target, c.total_target);
}

double purity(const std::vector<int>& predicted, const std::vector<int>& truth,
              int target_class) {
    TargetCounts c = countTarget(predicted, truth, target_class);
    return ratio(c.correct_target, c.correct_target + c.wrong_target);
}

double figureOfMerit(const std::vector<int>& predicted, const std::vector<int>& truth,
                     int target_class, double penalty) {
    TargetCounts c = countTarget(predicted, truth, target_class);
    double pseudo_purity = ratio(c.correct_target, c.correct_target + penalty * c.wrong_target);
    return pseudo_purity * ratio(c.correct_target, c.total_target);
}

ClassificationReport evaluateClassification(const std::vector<int>& predicted,
                                            const std::vector<int>& truth,
                                            const std::vector<int>& classes,
                                            int target_class,
                                            double penalty) {
    requireSameLength(predicted, truth);

    ClassificationReport report;
    report.accuracy = accuracy(predicted, truth);
    report.efficiency = efficiency(predicted, truth, target_class);
    report.purity = purity(predicted, truth, target_class);
    report.figure_of_merit = figureOfMerit(predicted, truth, target_class, penalty);

    std::set<int> all(classes.begin(), classes.end());
    all.insert(predicted.begin(), predicted.end());
    all.insert(truth.begin(), truth.end());

    for (int cls : all) {
        int tp = 0, predicted_count = 0, actual_count = 0;
        for (size_t i = 0; i < truth.size(); i++) {
            if (predicted[i] == cls) predicted_count++;
            if (truth[i] == cls) actual_count++;
            if (predicted[i] == cls && truth[i] == cls) tp++;
        }
        ClassScores& s = report.per_class[cls];
        s.precision = ratio(tp, predicted_count);
        s.recall = ratio(tp, actual_count);
        s.support = actual_count;
    }
    return report;
}

} // namespace specsel
