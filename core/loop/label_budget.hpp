#pragma once

#include <optional>

namespace specsel {

/// Tracks the labeling budget of one run: iterations completed and
/// query cost spent. Either limit may be absent.
class LabelBudget {
public:
    LabelBudget(std::optional<int> max_iterations, std::optional<double> max_cost)
        : max_iterations_(max_iterations), max_cost_(max_cost) {}

    void recordIteration() { iterations_++; }
    void recordCost(double cost) { spent_ += cost; }

    bool canContinue() const {
        return !isIterationExhausted() && !isCostExhausted();
    }

    /// Whether `cost` more fits within the cost limit.
    bool canAfford(double cost) const {
        return !max_cost_ || spent_ + cost <= *max_cost_;
    }

    int iterations() const { return iterations_; }
    double spent() const { return spent_; }

    bool isIterationExhausted() const {
        return max_iterations_ && iterations_ >= *max_iterations_;
    }
    bool isCostExhausted() const {
        return max_cost_ && spent_ >= *max_cost_;
    }

private:
    std::optional<int> max_iterations_;
    std::optional<double> max_cost_;
    int iterations_ = 0;
    double spent_ = 0.0;
};

} // namespace specsel
