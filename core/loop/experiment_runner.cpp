#include "loop/experiment_runner.hpp"
#include "errors/errors.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <atomic>
#include <memory>
#include <thread>

namespace specsel {

ExperimentRunner::ExperimentRunner(CandidateTablePtr table,
                                   ClassifierFactory factory,
                                   std::vector<CandidateId> initial_labeled_ids,
                                   std::vector<CandidateId> validation_ids,
                                   size_t max_threads)
    : table_(std::move(table)),
      factory_(std::move(factory)),
      initial_labeled_ids_(std::move(initial_labeled_ids)),
      validation_ids_(std::move(validation_ids)),
      max_threads_(max_threads) {
    if (!table_) {
        throw InvariantError("experiment runner needs a candidate table");
    }
    if (!factory_) {
        throw InvariantError("experiment runner needs a classifier factory");
    }
    if (max_threads_ == 0) {
        max_threads_ = std::max(1u, std::thread::hardware_concurrency());
    }
}

RunOutcome ExperimentRunner::runOne(const ExperimentConfig& config) const {
    RunOutcome outcome;
    outcome.config = config;

    std::unique_ptr<LearningLoop> loop;
    try {
        loop = std::make_unique<LearningLoop>(table_, factory_(), config,
                                              initial_labeled_ids_, validation_ids_);
        loop->run();
        outcome.completed = true;
    } catch (const Error& e) {
        outcome.error_kind = e.kind();
        outcome.error = e.what();
        outcome.failed_iteration = e.context().iteration;
    } catch (const std::exception& e) {
        outcome.error_kind = "exception";
        outcome.error = e.what();
    }

    if (loop) {
        outcome.snapshots = loop->metrics().snapshots();
        outcome.stop_reason = loop->stopReason();
        if (!outcome.completed && outcome.failed_iteration < 0) {
            outcome.failed_iteration = loop->iteration();
        }
    } else {
        // Setup failed before the loop existed
        outcome.stop_reason = StopReason::FAILED;
        logError("experiment setup failed (" + config.describe() + "): " + outcome.error);
    }
    return outcome;
}

std::vector<RunOutcome> ExperimentRunner::run(
    const std::vector<ExperimentConfig>& configs) const {
    std::vector<RunOutcome> outcomes(configs.size());
    if (configs.empty()) return outcomes;

    const size_t workers = std::min(max_threads_, configs.size());
    logInfo("running " + std::to_string(configs.size()) + " experiment(s) on " +
            std::to_string(workers) + " thread(s)");

    // Each worker claims the next unstarted config; outcome slots are
    // disjoint, so no lock is needed on the results.
    std::atomic<size_t> next{0};
    auto worker = [&]() {
        for (size_t i = next++; i < configs.size(); i = next++) {
            outcomes[i] = runOne(configs[i]);
        }
    };

    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (size_t t = 0; t < workers; t++) {
        pool.emplace_back(worker);
    }
    for (auto& th : pool) th.join();

    size_t failed = std::count_if(outcomes.begin(), outcomes.end(),
                                  [](const RunOutcome& o) { return !o.completed; });
    if (failed > 0) {
        logWarn(std::to_string(failed) + " of " + std::to_string(outcomes.size()) +
                " experiment(s) failed");
    }
    return outcomes;
}

} // namespace specsel
