#pragma once

#include "classifier/classifier.hpp"
#include "data/candidate.hpp"
#include "loop/experiment_config.hpp"
#include "loop/learning_loop.hpp"
#include "metrics/metrics_recorder.hpp"

#include <string>
#include <vector>

namespace specsel {

// ─── Run Outcome ───────────────────────────────────────────────
// What one experiment produced. A failed run still carries every
// snapshot recorded before the failure.

struct RunOutcome {
    ExperimentConfig config;
    std::vector<MetricsSnapshot> snapshots;
    StopReason stop_reason = StopReason::NONE;
    bool completed = false;         // stopped without a fatal error
    std::string error_kind;         // e.g. "InsufficientLabelsError"
    std::string error;              // what() of the failure
    int failed_iteration = -1;      // -1 unless the failure happened in a run
};

// ─── Experiment Runner ─────────────────────────────────────────
// Runs independent experiments side by side (e.g. one per query
// strategy) over the same candidate set. Workers share only the
// immutable CandidateTable; each run gets its own partition, its own
// classifier from the factory and its own metrics recorder. The factory
// is called from worker threads and must be safe to call concurrently.

class ExperimentRunner {
public:
    /// max_threads = 0 uses std::thread::hardware_concurrency().
    ExperimentRunner(CandidateTablePtr table,
                     ClassifierFactory factory,
                     std::vector<CandidateId> initial_labeled_ids,
                     std::vector<CandidateId> validation_ids,
                     size_t max_threads = 0);

    /// One outcome per config, in the order given. Run failures are
    /// reported in the outcome, never thrown.
    std::vector<RunOutcome> run(const std::vector<ExperimentConfig>& configs) const;

    /// Run a single experiment on the calling thread.
    RunOutcome runOne(const ExperimentConfig& config) const;

    size_t maxThreads() const { return max_threads_; }

private:
    CandidateTablePtr table_;
    ClassifierFactory factory_;
    std::vector<CandidateId> initial_labeled_ids_;
    std::vector<CandidateId> validation_ids_;
    size_t max_threads_;
};

} // namespace specsel
