#pragma once

#include "data/candidate.hpp"
#include "metrics/classification_metrics.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace specsel {

// ─── Metrics Snapshot ──────────────────────────────────────────
// One loop iteration's evaluation on the Validation set. Scores come
// from the classifier trained at the start of the iteration; sizes
// are taken after the queried batch moved to Labeled.

struct MetricsSnapshot {
    int iteration = 0;                  // 1-based, strictly increasing
    size_t labeled_size = 0;
    size_t pool_size = 0;
    std::vector<CandidateId> queried_ids;
    double cumulative_cost = 0.0;       // spent on queries so far
    std::string strategy;
    double accuracy = 0.0;
    double efficiency = 0.0;
    double purity = 0.0;
    double figure_of_merit = 0.0;
    std::map<int, double> precision;    // per class
    std::map<int, double> recall;       // per class
};

/// Flat record handed to reporting: field name → scalar.
using MetricValue = std::variant<int64_t, double, std::string>;
using MetricRecord = std::map<std::string, MetricValue>;

// ─── Metrics Recorder ──────────────────────────────────────────
// Append-only trace of snapshots for one run. Owned by exactly one
// loop; the trace survives a failed run for partial inspection.

class MetricsRecorder {
public:
    MetricsRecorder() = default;

    /// Append a snapshot. Throws InvariantError unless its iteration is
    /// greater than the last recorded one.
    void record(MetricsSnapshot snapshot);

    const std::vector<MetricsSnapshot>& snapshots() const { return snapshots_; }
    size_t count() const { return snapshots_.size(); }
    bool empty() const { return snapshots_.empty(); }

    /// Throws InvariantError when nothing has been recorded.
    const MetricsSnapshot& latest() const;

    /// Flattened snapshots. Per-class fields are named "precision_<c>"
    /// and "recall_<c>"; queried ids become "queried_count".
    std::vector<MetricRecord> toRecords() const;

    /// Write the trace as CSV (header + one row per snapshot). Queried
    /// ids are space-separated in a single column.
    void exportToFile(const std::string& path) const;

private:
    std::vector<MetricsSnapshot> snapshots_;
};

/// Build a snapshot from a validation report.
MetricsSnapshot makeSnapshot(int iteration, size_t labeled_size, size_t pool_size,
                             std::vector<CandidateId> queried_ids,
                             double cumulative_cost,
                             const std::string& strategy,
                             const ClassificationReport& report);

} // namespace specsel
