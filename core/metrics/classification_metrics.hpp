#pragma once

#include <map>
#include <vector>

namespace specsel {

// ─── Classification Metrics ────────────────────────────────────
// SNPCC-style metrics. The "target" class is the one whose sample we
// want pure and complete (SN Ia, flag 1 by default).
//
//   accuracy    = correct / total
//   efficiency  = correctly classified targets / true targets
//   purity      = cc / (cc + wr)
//   fom         = efficiency * cc / (cc + penalty * wr)
//
// cc counts correctly classified targets, wr misclassified non-targets.
// With two classes wr is exactly the false targets, so purity is the
// usual fraction of predicted targets that are real.
//
// Undefined ratios (zero denominators) are reported as 0.

constexpr int DEFAULT_TARGET_CLASS = 1;
constexpr double DEFAULT_FOM_PENALTY = 3.0;

double accuracy(const std::vector<int>& predicted, const std::vector<int>& truth);
double efficiency(const std::vector<int>& predicted, const std::vector<int>& truth,
                  int target_class = DEFAULT_TARGET_CLASS);
double purity(const std::vector<int>& predicted, const std::vector<int>& truth,
              int target_class = DEFAULT_TARGET_CLASS);
double figureOfMerit(const std::vector<int>& predicted, const std::vector<int>& truth,
                     int target_class = DEFAULT_TARGET_CLASS,
                     double penalty = DEFAULT_FOM_PENALTY);

struct ClassScores {
    double precision = 0.0;
    double recall = 0.0;
    int support = 0;  // true members of the class
};

struct ClassificationReport {
    double accuracy = 0.0;
    double efficiency = 0.0;
    double purity = 0.0;
    double figure_of_merit = 0.0;
    std::map<int, ClassScores> per_class;
};

/// Full report. Per-class entries cover `classes` plus every label seen
/// in either vector. Throws InvariantError on a length mismatch.
ClassificationReport evaluateClassification(const std::vector<int>& predicted,
                                            const std::vector<int>& truth,
                                            const std::vector<int>& classes = {},
                                            int target_class = DEFAULT_TARGET_CLASS,
                                            double penalty = DEFAULT_FOM_PENALTY);

} // namespace specsel
