#include "loop/learning_loop.hpp"
#include "metrics/classification_metrics.hpp"
#include "strategy/strategy_factory.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <unordered_set>

namespace specsel {

const char* loopStateName(LoopState state) {
    switch (state) {
        case LoopState::READY:      return "Ready";
        case LoopState::TRAINING:   return "Training";
        case LoopState::SCORING:    return "Scoring";
        case LoopState::SELECTING:  return "Selecting";
        case LoopState::UPDATING:   return "Updating";
        case LoopState::EVALUATING: return "Evaluating";
        case LoopState::STOPPED:    return "Stopped";
    }
    return "Unknown";
}

const char* stopReasonName(StopReason reason) {
    switch (reason) {
        case StopReason::NONE:             return "none";
        case StopReason::POOL_EMPTY:       return "pool-empty";
        case StopReason::MAX_ITERATIONS:   return "max-iterations";
        case StopReason::BUDGET_EXHAUSTED: return "budget-exhausted";
        case StopReason::FAILED:           return "failed";
    }
    return "unknown";
}

static ExperimentConfig validated(ExperimentConfig config) {
    config.validate();
    return config;
}

LearningLoop::LearningLoop(CandidateTablePtr table,
                           std::unique_ptr<Classifier> classifier,
                           ExperimentConfig config,
                           const std::vector<CandidateId>& initial_labeled_ids,
                           const std::vector<CandidateId>& validation_ids)
    : table_(std::move(table)),
      classifier_(std::move(classifier)),
      config_(validated(std::move(config))),
      budget_(config_.max_iterations, config_.label_budget) {
    if (!table_) {
        throw InvariantError("learning loop needs a candidate table");
    }
    if (!classifier_) {
        throw InvariantError("learning loop needs a classifier");
    }
    strategy_ = makeQueryStrategy(config_.query_strategy,
                                  static_cast<size_t>(config_.diversity_shortlist_size),
                                  config_.distance_metric,
                                  static_cast<size_t>(config_.joint_samples));
    if (strategy_->needsScoreSamples() && !classifier_->supportsScoreSamples()) {
        throw InvariantError(strategy_->name() + " needs posterior score samples, which " +
                             classifier_->name() + " does not provide");
    }
    partition_.initialize(table_->ids(), initial_labeled_ids, validation_ids);
}

ErrorContext LearningLoop::context() const {
    ErrorContext ctx;
    ctx.iteration = iteration_;
    ctx.labeled = partition_.labeledSize();
    ctx.pool = partition_.poolSize();
    ctx.validation = partition_.validationSize();
    return ctx;
}

// ─── Failure ───────────────────────────────────────────────────

template <typename E>
void LearningLoop::failWith(const E& e) {
    ErrorContext ctx = e.context().inRun() ? e.context() : context();
    E err(e.detail(), ctx);
    markFailed(err.what());
    throw err;
}

void LearningLoop::failWith(const Error& e) {
    ErrorContext ctx = e.context().inRun() ? e.context() : context();
    Error err(e.kind(), e.detail(), ctx);
    markFailed(err.what());
    throw err;
}

// ─── State machine ─────────────────────────────────────────────

void LearningLoop::advance() {
    try {
        switch (state_) {
            case LoopState::READY:
                logInfo("run start: " + config_.describe() +
                        " classifier=" + classifier_->name() +
                        " labeled=" + std::to_string(partition_.labeledSize()) +
                        " pool=" + std::to_string(partition_.poolSize()) +
                        " validation=" + std::to_string(partition_.validationSize()));
                if (partition_.poolSize() == 0) {
                    stop(StopReason::POOL_EMPTY);
                } else {
                    state_ = LoopState::TRAINING;
                }
                break;
            case LoopState::TRAINING:   train();    break;
            case LoopState::SCORING:    score();    break;
            case LoopState::SELECTING:  select();   break;
            case LoopState::UPDATING:   update();   break;
            case LoopState::EVALUATING: evaluate(); break;
            case LoopState::STOPPED:    break;
        }
    } catch (const InsufficientLabelsError& e) {
        failWith(e);
    } catch (const NotInPoolError& e) {
        failWith(e);
    } catch (const InvariantError& e) {
        failWith(e);
    } catch (const Error& e) {
        failWith(e);
    } catch (const std::exception& e) {
        // Foreign classifier errors propagate unchanged
        markFailed(e.what());
        throw;
    }
}

bool LearningLoop::runIteration() {
    if (state_ == LoopState::READY) advance();
    while (state_ != LoopState::STOPPED) {
        advance();
        if (state_ == LoopState::TRAINING) break;
    }
    return !stopped();
}

const std::vector<MetricsSnapshot>& LearningLoop::run() {
    while (!stopped()) {
        advance();
    }
    return recorder_.snapshots();
}

// ─── States ────────────────────────────────────────────────────

void LearningLoop::train() {
    std::vector<CandidateId> labeled = partition_.labeledIds();
    classifier_->fit(table_->features(labeled), table_->labels(labeled));
    state_ = LoopState::SCORING;
}

void LearningLoop::score() {
    query_ = QueryContext{};
    query_.pool_ids = partition_.poolIds();
    query_.pool_features = table_->features(query_.pool_ids);
    query_.iteration = iteration_;
    query_.seed = config_.random_seed;

    query_.pool_scores = classifier_->predictScore(query_.pool_features);
    if (query_.pool_scores.size() != query_.pool_ids.size()) {
        throw InvariantError(classifier_->name() + " returned " +
                             std::to_string(query_.pool_scores.size()) +
                             " score rows for a pool of " +
                             std::to_string(query_.pool_ids.size()));
    }

    if (strategy_->needsScoreSamples()) {
        // Draws differ per iteration but repeat for the same seed
        const uint64_t sample_seed =
            config_.random_seed * 0x9E3779B97F4A7C15ull + static_cast<uint64_t>(iteration_);
        query_.pool_score_samples = classifier_->predictScoreSamples(
            query_.pool_features, static_cast<size_t>(config_.posterior_samples), sample_seed);
        if (query_.pool_score_samples.size() !=
            static_cast<size_t>(config_.posterior_samples)) {
            throw InvariantError(classifier_->name() + " returned " +
                                 std::to_string(query_.pool_score_samples.size()) +
                                 " posterior draws, expected " +
                                 std::to_string(config_.posterior_samples));
        }
        validateScoreSamples(query_);
    }
    state_ = LoopState::SELECTING;
}

void LearningLoop::select() {
    const size_t k = std::min(static_cast<size_t>(config_.batch_size),
                              query_.pool_ids.size());
    batch_ = strategy_->select(query_, k);

    if (batch_.size() > k) {
        throw InvariantError(strategy_->name() + " returned " + std::to_string(batch_.size()) +
                             " ids for a batch of " + std::to_string(k));
    }
    if (batch_.empty() && k > 0) {
        throw InvariantError(strategy_->name() + " returned an empty batch");
    }
    std::unordered_set<CandidateId> seen;
    for (CandidateId id : batch_) {
        if (!partition_.inPool(id)) {
            throw NotInPoolError(strategy_->name() + " selected id " + std::to_string(id) +
                                 " which is not in the pool");
        }
        if (!seen.insert(id).second) {
            throw NotInPoolError(strategy_->name() + " selected id " + std::to_string(id) +
                                 " twice");
        }
    }

    if (config_.label_budget) {
        // Keep the longest prefix of the ranked batch the budget can pay for
        size_t keep = 0;
        double batch_cost = 0.0;
        for (CandidateId id : batch_) {
            double cost = table_->get(id).cost;
            if (!budget_.canAfford(batch_cost + cost)) break;
            batch_cost += cost;
            keep++;
        }
        if (keep < batch_.size()) {
            logDebug("batch trimmed from " + std::to_string(batch_.size()) + " to " +
                     std::to_string(keep) + " by label budget");
            batch_.resize(keep);
        }
        if (batch_.empty()) {
            stop(StopReason::BUDGET_EXHAUSTED);
            return;
        }
    }
    state_ = LoopState::UPDATING;
}

void LearningLoop::update() {
    partition_.moveToLabeled(batch_);
    budget_.recordCost(table_->totalCost(batch_));
    budget_.recordIteration();
    iteration_++;
    state_ = LoopState::EVALUATING;
}

void LearningLoop::evaluate() {
    std::vector<CandidateId> validation = partition_.validationIds();

    ClassificationReport report;
    if (!validation.empty()) {
        std::vector<int> predicted = classifier_->predict(table_->features(validation));
        report = evaluateClassification(predicted, table_->labels(validation),
                                        classifier_->classes(),
                                        config_.target_class, config_.fom_penalty);
    }

    recorder_.record(makeSnapshot(iteration_, partition_.labeledSize(),
                                  partition_.poolSize(), batch_, budget_.spent(),
                                  strategy_->name(), report));

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(4)
       << strategy_->name() << " iteration " << iteration_
       << ": queried=" << batch_.size()
       << " labeled=" << partition_.labeledSize()
       << " pool=" << partition_.poolSize()
       << " accuracy=" << report.accuracy
       << " efficiency=" << report.efficiency
       << " purity=" << report.purity
       << " fom=" << report.figure_of_merit;
    logInfo(ss.str());

    if (partition_.poolSize() == 0) {
        stop(StopReason::POOL_EMPTY);
    } else if (budget_.isIterationExhausted()) {
        stop(StopReason::MAX_ITERATIONS);
    } else if (budget_.isCostExhausted()) {
        stop(StopReason::BUDGET_EXHAUSTED);
    } else {
        state_ = LoopState::TRAINING;
    }
}

// ─── Termination ───────────────────────────────────────────────

void LearningLoop::stop(StopReason reason) {
    state_ = LoopState::STOPPED;
    stop_reason_ = reason;
    if (reason != StopReason::FAILED) {
        logInfo(std::string("run stopped: ") + stopReasonName(reason) +
                " after " + std::to_string(iteration_) + " iteration(s)");
    }
}

void LearningLoop::markFailed(const std::string& what) {
    stop(StopReason::FAILED);
    last_error_ = what;
    logError("run failed after " + std::to_string(iteration_) +
             " iteration(s), " + std::to_string(recorder_.count()) +
             " snapshot(s) kept: " + what);
}

} // namespace specsel
