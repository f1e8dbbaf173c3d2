#include "metrics/metrics_recorder.hpp"
#include "errors/errors.hpp"

#include <fstream>
#include <set>

namespace specsel {

void MetricsRecorder::record(MetricsSnapshot snapshot) {
    if (!snapshots_.empty() && snapshot.iteration <= snapshots_.back().iteration) {
        throw InvariantError("snapshot iteration " + std::to_string(snapshot.iteration) +
                             " does not follow " +
                             std::to_string(snapshots_.back().iteration));
    }
    snapshots_.push_back(std::move(snapshot));
}

const MetricsSnapshot& MetricsRecorder::latest() const {
    if (snapshots_.empty()) {
        throw InvariantError("no metrics snapshot recorded yet");
    }
    return snapshots_.back();
}

std::vector<MetricRecord> MetricsRecorder::toRecords() const {
    std::vector<MetricRecord> records;
    records.reserve(snapshots_.size());
    for (const auto& s : snapshots_) {
        MetricRecord r;
        r["iteration"] = static_cast<int64_t>(s.iteration);
        r["labeled_size"] = static_cast<int64_t>(s.labeled_size);
        r["pool_size"] = static_cast<int64_t>(s.pool_size);
        r["queried_count"] = static_cast<int64_t>(s.queried_ids.size());
        r["cumulative_cost"] = s.cumulative_cost;
        r["strategy"] = s.strategy;
        r["accuracy"] = s.accuracy;
        r["efficiency"] = s.efficiency;
        r["purity"] = s.purity;
        r["fom"] = s.figure_of_merit;
        for (const auto& [cls, value] : s.precision) {
            r["precision_" + std::to_string(cls)] = value;
        }
        for (const auto& [cls, value] : s.recall) {
            r["recall_" + std::to_string(cls)] = value;
        }
        records.push_back(std::move(r));
    }
    return records;
}

void MetricsRecorder::exportToFile(const std::string& path) const {
    std::ofstream out(path);
    if (!out) {
        throw Error("IOError", "cannot open metrics file for writing: " + path);
    }

    // Union of classes so every row has the same columns
    std::set<int> classes;
    for (const auto& s : snapshots_) {
        for (const auto& kv : s.precision) classes.insert(kv.first);
        for (const auto& kv : s.recall) classes.insert(kv.first);
    }

    out << "iteration,labeled_size,pool_size,strategy,accuracy,efficiency,purity,fom,"
           "cumulative_cost,queried_ids";
    for (int c : classes) out << ",precision_" << c << ",recall_" << c;
    out << "\n";

    for (const auto& s : snapshots_) {
        out << s.iteration << ","
            << s.labeled_size << ","
            << s.pool_size << ","
            << s.strategy << ","
            << s.accuracy << ","
            << s.efficiency << ","
            << s.purity << ","
            << s.figure_of_merit << ","
            << s.cumulative_cost << ",";
        for (size_t i = 0; i < s.queried_ids.size(); i++) {
            if (i) out << " ";
            out << s.queried_ids[i];
        }
        for (int c : classes) {
            auto p = s.precision.find(c);
            auto r = s.recall.find(c);
            out << "," << (p != s.precision.end() ? p->second : 0.0)
                << "," << (r != s.recall.end() ? r->second : 0.0);
        }
        out << "\n";
    }

    if (!out) {
        throw Error("IOError", "failed while writing metrics file: " + path);
    }
}

MetricsSnapshot makeSnapshot(int iteration, size_t labeled_size, size_t pool_size,
                             std::vector<CandidateId> queried_ids,
                             double cumulative_cost,
                             const std::string& strategy,
                             const ClassificationReport& report) {
    MetricsSnapshot s;
    s.iteration = iteration;
    s.labeled_size = labeled_size;
    s.pool_size = pool_size;
    s.queried_ids = std::move(queried_ids);
    s.cumulative_cost = cumulative_cost;
    s.strategy = strategy;
    s.accuracy = report.accuracy;
    s.efficiency = report.efficiency;
    s.purity = report.purity;
    s.figure_of_merit = report.figure_of_merit;
    for (const auto& [cls, scores] : report.per_class) {
        s.precision[cls] = scores.precision;
        s.recall[cls] = scores.recall;
    }
    return s;
}

} // namespace specsel
