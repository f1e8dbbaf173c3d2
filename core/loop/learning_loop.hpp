#pragma once

#include "classifier/classifier.hpp"
#include "data/candidate.hpp"
#include "errors/errors.hpp"
#include "loop/experiment_config.hpp"
#include "loop/label_budget.hpp"
#include "metrics/metrics_recorder.hpp"
#include "partition/sample_partition.hpp"
#include "strategy/query_strategy.hpp"

#include <memory>
#include <string>
#include <vector>

namespace specsel {

enum class LoopState {
    READY,
    TRAINING,
    SCORING,
    SELECTING,
    UPDATING,
    EVALUATING,
    STOPPED
};

enum class StopReason {
    NONE,               // still running
    POOL_EMPTY,
    MAX_ITERATIONS,
    BUDGET_EXHAUSTED,
    FAILED              // a fatal error was raised; see lastError()
};

const char* loopStateName(LoopState state);
const char* stopReasonName(StopReason reason);

// ─── Learning Loop ─────────────────────────────────────────────
// One active-learning experiment as a strict sequential state machine:
//
//   READY → TRAINING → SCORING → SELECTING → UPDATING → EVALUATING
//             ↑                                            │
//             └────────────────────────────────────────────┤
//                                                          ↓
//                                                       STOPPED
//
// Each advance() performs exactly one state's work. A fatal error moves
// the loop to STOPPED and is then rethrown with the iteration index and
// partition sizes attached; snapshots recorded before the failure stay
// available through metrics(). STOPPED is terminal: one loop instance
// is one run, with no restart and no state shared across runs.

class LearningLoop {
public:
    /// Builds the partition from the table's ids. Throws InvariantError
    /// for an invalid config, a null table/classifier or a bad split.
    LearningLoop(CandidateTablePtr table,
                 std::unique_ptr<Classifier> classifier,
                 ExperimentConfig config,
                 const std::vector<CandidateId>& initial_labeled_ids,
                 const std::vector<CandidateId>& validation_ids);

    /// Perform the current state's work and transition. No-op when
    /// STOPPED. Rethrows fatal errors after stopping.
    void advance();

    /// Advance through one full iteration (until back at TRAINING or
    /// STOPPED). Returns true while the loop can continue.
    bool runIteration();

    /// Advance until STOPPED and return the snapshot trace.
    const std::vector<MetricsSnapshot>& run();

    LoopState state() const { return state_; }
    StopReason stopReason() const { return stop_reason_; }
    bool stopped() const { return state_ == LoopState::STOPPED; }
    int iteration() const { return iteration_; }

    const SamplePartition& partition() const { return partition_; }
    const MetricsRecorder& metrics() const { return recorder_; }
    const LabelBudget& budget() const { return budget_; }
    const ExperimentConfig& config() const { return config_; }
    const Classifier& classifier() const { return *classifier_; }
    const QueryStrategy& strategy() const { return *strategy_; }

    /// Batch chosen in the most recent SELECTING step.
    const std::vector<CandidateId>& lastQuery() const { return batch_; }

    /// what() of the fatal error, empty if none.
    const std::string& lastError() const { return last_error_; }

    /// Current position, as attached to errors.
    ErrorContext context() const;

private:
    CandidateTablePtr table_;
    std::unique_ptr<Classifier> classifier_;
    std::unique_ptr<QueryStrategy> strategy_;
    ExperimentConfig config_;
    SamplePartition partition_;
    MetricsRecorder recorder_;
    LabelBudget budget_;

    LoopState state_ = LoopState::READY;
    StopReason stop_reason_ = StopReason::NONE;
    int iteration_ = 0;
    std::string last_error_;

    // Scratch carried between states of one iteration
    QueryContext query_;
    std::vector<CandidateId> batch_;

    void train();
    void score();
    void select();
    void update();
    void evaluate();

    void stop(StopReason reason);

    /// Stop as FAILED and log; the caller rethrows.
    void markFailed(const std::string& what);

    /// markFailed() then throw a copy of `e` carrying context(), unless
    /// it already carries one. The overload keeps the base class's kind.
    template <typename E>
    [[noreturn]] void failWith(const E& e);
    [[noreturn]] void failWith(const Error& e);
};

} // namespace specsel
