#include <gtest/gtest.h>
#include "loop/experiment_runner.hpp"
#include "classifier/classifier_registry.hpp"
#include "strategy/strategy_factory.hpp"
#include "classifier/nearest_centroid.hpp"
#include "errors/errors.hpp"

#include <stdexcept>

using namespace specsel;

namespace {

// 40 candidates on two overlapping lines; odd ids are class 1
CandidateTablePtr lineTable() {
    std::vector<Candidate> candidates;
    for (CandidateId id = 1; id <= 40; id++) {
        int label = static_cast<int>(id % 2);
        double x = static_cast<double>(id) * 0.25;
        candidates.emplace_back(id, FeatureVector{x, label == 1 ? x + 1.0 : x - 1.0}, label);
    }
    return makeCandidateTable(std::move(candidates));
}

std::vector<ExperimentConfig> oneConfigPerStrategy(int batch, int max_iterations) {
    std::vector<ExperimentConfig> configs;
    for (const auto& name : strategyNames()) {
        ExperimentConfig c;
        c.query_strategy = parseStrategyKind(name);
        c.batch_size = batch;
        c.max_iterations = max_iterations;
        c.random_seed = 5;
        configs.push_back(c);
    }
    return configs;
}

std::vector<std::vector<CandidateId>> queried(const RunOutcome& o) {
    std::vector<std::vector<CandidateId>> out;
    for (const auto& s : o.snapshots) out.push_back(s.queried_ids);
    return out;
}

// Nearest centroid that throws a plain runtime_error on its third fit
class DivergingClassifier : public NearestCentroidClassifier {
public:
    void fit(const std::vector<FeatureVector>& features,
             const std::vector<int>& labels) override {
        if (++fits_ == 3) throw std::runtime_error("model diverged");
        NearestCentroidClassifier::fit(features, labels);
    }
private:
    int fits_ = 0;
};

} // namespace

TEST(RunnerTest, ParallelRunsKeepSubmissionOrder) {
    ExperimentRunner runner(lineTable(), classifierFactory("knn", 3),
                            {1, 2, 3, 4}, {35, 36, 37, 38, 39, 40}, 4);
    auto configs = oneConfigPerStrategy(3, 4);
    auto outcomes = runner.run(configs);

    ASSERT_EQ(outcomes.size(), configs.size());
    for (size_t i = 0; i < outcomes.size(); i++) {
        const RunOutcome& o = outcomes[i];
        EXPECT_EQ(o.config.query_strategy, configs[i].query_strategy);
        EXPECT_TRUE(o.completed) << o.error;
        EXPECT_EQ(o.stop_reason, StopReason::MAX_ITERATIONS);
        ASSERT_EQ(o.snapshots.size(), 4);
        EXPECT_EQ(o.snapshots.front().strategy, strategyKindName(configs[i].query_strategy));
        EXPECT_EQ(o.snapshots.back().labeled_size, 16u);
        EXPECT_TRUE(o.error.empty());
        EXPECT_EQ(o.failed_iteration, -1);
    }
}

TEST(RunnerTest, ParallelMatchesSequential) {
    ExperimentRunner parallel(lineTable(), classifierFactory("nearest_centroid"),
                              {1, 2}, {39, 40}, 3);
    ExperimentRunner sequential(lineTable(), classifierFactory("nearest_centroid"),
                                {1, 2}, {39, 40}, 1);
    auto configs = oneConfigPerStrategy(5, 3);

    auto a = parallel.run(configs);
    auto b = sequential.run(configs);
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); i++) {
        EXPECT_EQ(queried(a[i]), queried(b[i])) << strategyKindName(configs[i].query_strategy);
        EXPECT_EQ(queried(a[i]), queried(sequential.runOne(configs[i])));
    }
}

TEST(RunnerTest, FailureIsReportedNotThrown) {
    // Ids 1 and 3 are both class 1, so the first fit fails
    ExperimentRunner runner(lineTable(), classifierFactory("knn"), {1, 3}, {40}, 2);
    auto outcomes = runner.run(oneConfigPerStrategy(2, 2));

    for (const auto& o : outcomes) {
        EXPECT_FALSE(o.completed);
        EXPECT_EQ(o.stop_reason, StopReason::FAILED);
        EXPECT_EQ(o.error_kind, "InsufficientLabelsError");
        EXPECT_EQ(o.failed_iteration, 0);
        EXPECT_TRUE(o.snapshots.empty());
    }
}

TEST(RunnerTest, ForeignExceptionRecordsFailedIteration) {
    ExperimentRunner runner(lineTable(), [] { return std::make_unique<DivergingClassifier>(); },
                            {1, 2}, {39, 40}, 1);
    ExperimentConfig config;
    config.batch_size = 2;
    RunOutcome o = runner.runOne(config);

    EXPECT_FALSE(o.completed);
    EXPECT_EQ(o.stop_reason, StopReason::FAILED);
    EXPECT_EQ(o.error_kind, "exception");
    EXPECT_NE(o.error.find("model diverged"), std::string::npos);
    EXPECT_EQ(o.failed_iteration, 2);
    EXPECT_EQ(o.snapshots.size(), 2);
}

TEST(RunnerTest, SetupFailureIsReported) {
    ExperimentRunner runner(lineTable(), classifierFactory("knn"), {1, 2}, {2}, 1);
    RunOutcome o = runner.runOne(ExperimentConfig());

    EXPECT_FALSE(o.completed);
    EXPECT_EQ(o.stop_reason, StopReason::FAILED);
    EXPECT_EQ(o.error_kind, "InvariantError");
    EXPECT_EQ(o.failed_iteration, -1);
}

TEST(RunnerTest, RejectsMissingInputs) {
    EXPECT_THROW(ExperimentRunner(nullptr, classifierFactory("knn"), {1, 2}, {3}),
                 InvariantError);
    EXPECT_THROW(ExperimentRunner(lineTable(), ClassifierFactory(), {1, 2}, {3}),
                 InvariantError);
}

TEST(RunnerTest, EmptyConfigListRunsNothing) {
    ExperimentRunner runner(lineTable(), classifierFactory("knn"), {1, 2}, {3});
    EXPECT_TRUE(runner.run({}).empty());
    EXPECT_GE(runner.maxThreads(), 1u);
}
