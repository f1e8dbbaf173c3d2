#include <gtest/gtest.h>
#include "loop/learning_loop.hpp"
#include "classifier/nearest_centroid.hpp"
#include "classifier/knn_classifier.hpp"
#include "strategy/strategy_factory.hpp"
#include "errors/errors.hpp"

#include <algorithm>
#include <stdexcept>

using namespace specsel;

namespace {

// 30 candidates, ids 1..30. Odd ids are class 1 (near (5, 5)), even ids
// class 0 (near the origin). Ids 1, 2 start labeled; 25..30 validate.
CandidateTablePtr blobTable(double cost = 1.0) {
    std::vector<Candidate> candidates;
    for (CandidateId id = 1; id <= 30; id++) {
        int label = static_cast<int>(id % 2);
        double jitter = 0.05 * static_cast<double>(id);
        double base = label == 1 ? 5.0 : 0.0;
        candidates.emplace_back(id, FeatureVector{base + jitter, base - jitter}, label, cost);
    }
    return makeCandidateTable(std::move(candidates));
}

const std::vector<CandidateId> LABELED = {1, 2};
const std::vector<CandidateId> VALIDATION = {25, 26, 27, 28, 29, 30};

ExperimentConfig configFor(StrategyKind kind, int batch) {
    ExperimentConfig config;
    config.query_strategy = kind;
    config.batch_size = batch;
    config.random_seed = 11;
    return config;
}

LearningLoop makeLoop(const ExperimentConfig& config,
                      std::unique_ptr<Classifier> clf = nullptr) {
    if (!clf) clf = std::make_unique<NearestCentroidClassifier>();
    return LearningLoop(blobTable(), std::move(clf), config, LABELED, VALIDATION);
}

std::vector<std::vector<CandidateId>> queriedTrace(const LearningLoop& loop) {
    std::vector<std::vector<CandidateId>> trace;
    for (const auto& s : loop.metrics().snapshots()) trace.push_back(s.queried_ids);
    return trace;
}

// Throws on the n-th fit (1-based)
class FailingClassifier : public NearestCentroidClassifier {
public:
    explicit FailingClassifier(int fail_on) : fail_on_(fail_on) {}
    void fit(const std::vector<FeatureVector>& features,
             const std::vector<int>& labels) override {
        if (++fits_ == fail_on_) throw std::runtime_error("model diverged");
        NearestCentroidClassifier::fit(features, labels);
    }
private:
    int fail_on_;
    int fits_ = 0;
};

// Drops the last score row
class ShortScoreClassifier : public NearestCentroidClassifier {
public:
    ScoreMatrix predictScore(const std::vector<FeatureVector>& features) const override {
        ScoreMatrix scores = NearestCentroidClassifier::predictScore(features);
        if (!scores.empty()) scores.pop_back();
        return scores;
    }
};

// Scores fine but offers no posterior draws
class PointEstimateClassifier : public NearestCentroidClassifier {
public:
    bool supportsScoreSamples() const override { return false; }
};

// Returns one draw fewer than asked for
class ShortDrawClassifier : public NearestCentroidClassifier {
public:
    std::vector<ScoreMatrix> predictScoreSamples(const std::vector<FeatureVector>& features,
                                                 size_t num_samples,
                                                 uint64_t seed) const override {
        auto draws = NearestCentroidClassifier::predictScoreSamples(features, num_samples, seed);
        draws.pop_back();
        return draws;
    }
};

} // namespace

// ─── Construction ──────────────────────────────────────────────

TEST(LoopTest, ConstructionBuildsPartition) {
    LearningLoop loop = makeLoop(configFor(StrategyKind::RANDOM, 2));
    EXPECT_EQ(loop.state(), LoopState::READY);
    EXPECT_EQ(loop.stopReason(), StopReason::NONE);
    EXPECT_EQ(loop.partition().labeledSize(), 2);
    EXPECT_EQ(loop.partition().poolSize(), 22);
    EXPECT_EQ(loop.partition().validationSize(), 6);
    EXPECT_EQ(loop.strategy().name(), "random");
    EXPECT_EQ(loop.classifier().name(), "nearest_centroid");
}

TEST(LoopTest, ConstructionRejectsBadInput) {
    ExperimentConfig bad;
    bad.batch_size = 0;
    EXPECT_THROW(makeLoop(bad), InvariantError);

    EXPECT_THROW(LearningLoop(blobTable(), nullptr, ExperimentConfig(), LABELED, VALIDATION),
                 InvariantError);
    EXPECT_THROW(LearningLoop(nullptr, std::make_unique<NearestCentroidClassifier>(),
                              ExperimentConfig(), LABELED, VALIDATION),
                 InvariantError);
    EXPECT_THROW(LearningLoop(blobTable(), std::make_unique<NearestCentroidClassifier>(),
                              ExperimentConfig(), {1, 2}, {2, 3}),
                 InvariantError);
}

// ─── State machine ─────────────────────────────────────────────

TEST(LoopTest, StatesFollowFixedOrder) {
    LearningLoop loop = makeLoop(configFor(StrategyKind::UNCERTAINTY_MARGIN, 3));

    const std::vector<LoopState> expected = {
        LoopState::TRAINING, LoopState::SCORING, LoopState::SELECTING,
        LoopState::UPDATING, LoopState::EVALUATING, LoopState::TRAINING,
        LoopState::SCORING};
    for (LoopState state : expected) {
        loop.advance();
        EXPECT_EQ(loop.state(), state) << loopStateName(loop.state());
    }
    EXPECT_EQ(loop.iteration(), 1);
    EXPECT_EQ(loop.metrics().count(), 1);
    EXPECT_EQ(loop.lastQuery().size(), 3);
}

TEST(LoopTest, RunIterationKeepsPartitionInvariants) {
    LearningLoop loop = makeLoop(configFor(StrategyKind::UNCERTAINTY_ENTROPY, 5));
    const auto validation = loop.partition().validationIds();

    size_t labeled = loop.partition().labeledSize();
    size_t pool = loop.partition().poolSize();
    for (;;) {
        bool more = loop.runIteration();
        const auto& snap = loop.metrics().latest();
        size_t expected_batch = std::min<size_t>(5, pool);
        EXPECT_EQ(snap.queried_ids.size(), expected_batch);
        EXPECT_EQ(loop.partition().labeledSize(), labeled + expected_batch);
        EXPECT_EQ(loop.partition().poolSize(), pool - expected_batch);
        EXPECT_EQ(loop.partition().validationIds(), validation);
        EXPECT_NO_THROW(loop.partition().checkInvariants());
        for (CandidateId id : snap.queried_ids) EXPECT_TRUE(loop.partition().isLabeled(id));

        labeled = loop.partition().labeledSize();
        pool = loop.partition().poolSize();
        if (!more) break;
    }

    // 22 pool candidates in batches of 5
    EXPECT_EQ(loop.metrics().count(), 5);
    EXPECT_EQ(loop.stopReason(), StopReason::POOL_EMPTY);
    EXPECT_EQ(loop.partition().poolSize(), 0);
}

TEST(LoopTest, SnapshotsAreOrderedAndLabeledGrows) {
    LearningLoop loop = makeLoop(configFor(StrategyKind::DIVERSITY, 4));
    const auto& snapshots = loop.run();

    ASSERT_FALSE(snapshots.empty());
    for (size_t i = 0; i < snapshots.size(); i++) {
        EXPECT_EQ(snapshots[i].iteration, static_cast<int>(i) + 1);
        EXPECT_EQ(snapshots[i].strategy, "diversity");
        EXPECT_EQ(snapshots[i].labeled_size + snapshots[i].pool_size, 24u);
        if (i > 0) {
            EXPECT_GT(snapshots[i].labeled_size, snapshots[i - 1].labeled_size);
            EXPECT_GT(snapshots[i].cumulative_cost, snapshots[i - 1].cumulative_cost);
        }
    }
    // Well-separated blobs: validation is classified perfectly
    EXPECT_DOUBLE_EQ(snapshots.back().accuracy, 1.0);
    EXPECT_DOUBLE_EQ(snapshots.back().figure_of_merit, 1.0);
}

TEST(LoopTest, StoppedIsTerminal) {
    ExperimentConfig config = configFor(StrategyKind::RANDOM, 2);
    config.max_iterations = 1;
    LearningLoop loop = makeLoop(config);
    loop.run();
    ASSERT_TRUE(loop.stopped());

    auto pool = loop.partition().poolIds();
    loop.advance();
    EXPECT_FALSE(loop.runIteration());
    EXPECT_EQ(loop.partition().poolIds(), pool);
    EXPECT_EQ(loop.metrics().count(), 1);
}

// ─── Termination ───────────────────────────────────────────────

TEST(LoopTest, StopsAtMaxIterations) {
    ExperimentConfig config = configFor(StrategyKind::UNCERTAINTY_MARGIN, 2);
    config.max_iterations = 3;
    LearningLoop loop = makeLoop(config);
    loop.run();

    EXPECT_EQ(loop.stopReason(), StopReason::MAX_ITERATIONS);
    EXPECT_EQ(loop.metrics().count(), 3);
    EXPECT_EQ(loop.partition().poolSize(), 16);
}

TEST(LoopTest, FinalBatchTakesRemainingPool) {
    std::vector<Candidate> candidates = {
        {1, {0.0}, 0}, {2, {5.0}, 1}, {3, {0.2}, 0}, {4, {4.8}, 1},
        {5, {2.5}, 0}, {6, {0.1}, 0}, {7, {5.1}, 1}};
    LearningLoop loop(makeCandidateTable(std::move(candidates)),
                      std::make_unique<NearestCentroidClassifier>(),
                      configFor(StrategyKind::UNCERTAINTY_MARGIN, 5),
                      {1, 2}, {6, 7});
    loop.run();

    ASSERT_EQ(loop.metrics().count(), 1);
    EXPECT_EQ(loop.metrics().latest().queried_ids.size(), 3);
    EXPECT_EQ(loop.stopReason(), StopReason::POOL_EMPTY);
}

TEST(LoopTest, EmptyPoolStopsImmediately) {
    std::vector<Candidate> candidates = {{1, {0.0}, 0}, {2, {1.0}, 1}, {3, {0.5}, 0}};
    LearningLoop loop(makeCandidateTable(std::move(candidates)),
                      std::make_unique<NearestCentroidClassifier>(),
                      ExperimentConfig(), {1, 2}, {3});

    EXPECT_TRUE(loop.run().empty());
    EXPECT_EQ(loop.stopReason(), StopReason::POOL_EMPTY);
    EXPECT_EQ(loop.iteration(), 0);
}

TEST(LoopTest, LabelBudgetTrimsBatchAndStops) {
    ExperimentConfig config = configFor(StrategyKind::UNCERTAINTY_MARGIN, 3);
    config.label_budget = 5.0;
    LearningLoop loop(blobTable(2.0), std::make_unique<NearestCentroidClassifier>(),
                      config, LABELED, VALIDATION);
    loop.run();

    // Batch of 3 costs 6: only two fit, then nothing more is affordable
    ASSERT_EQ(loop.metrics().count(), 1);
    EXPECT_EQ(loop.metrics().latest().queried_ids.size(), 2);
    EXPECT_DOUBLE_EQ(loop.metrics().latest().cumulative_cost, 4.0);
    EXPECT_EQ(loop.stopReason(), StopReason::BUDGET_EXHAUSTED);
    EXPECT_EQ(loop.partition().poolSize(), 20);
}

TEST(LoopTest, ExactBudgetStopsAfterSpending) {
    ExperimentConfig config = configFor(StrategyKind::RANDOM, 2);
    config.label_budget = 4.0;
    LearningLoop loop = makeLoop(config);
    loop.run();

    EXPECT_EQ(loop.metrics().count(), 2);
    EXPECT_DOUBLE_EQ(loop.budget().spent(), 4.0);
    EXPECT_EQ(loop.stopReason(), StopReason::BUDGET_EXHAUSTED);
}

// ─── Determinism ───────────────────────────────────────────────

TEST(LoopTest, SameSeedSameTrace) {
    for (const auto& name : strategyNames()) {
        ExperimentConfig config = configFor(parseStrategyKind(name), 3);
        LearningLoop a = makeLoop(config);
        LearningLoop b = makeLoop(config);
        a.run();
        b.run();

        const auto& sa = a.metrics().snapshots();
        const auto& sb = b.metrics().snapshots();
        ASSERT_EQ(sa.size(), sb.size()) << name;
        ASSERT_FALSE(sa.empty()) << name;
        for (size_t i = 0; i < sa.size(); i++) {
            EXPECT_EQ(sa[i].iteration, sb[i].iteration) << name;
            EXPECT_EQ(sa[i].queried_ids, sb[i].queried_ids) << name;
            EXPECT_EQ(sa[i].labeled_size, sb[i].labeled_size) << name;
            EXPECT_EQ(sa[i].pool_size, sb[i].pool_size) << name;
            EXPECT_EQ(sa[i].accuracy, sb[i].accuracy) << name;
            EXPECT_EQ(sa[i].efficiency, sb[i].efficiency) << name;
            EXPECT_EQ(sa[i].purity, sb[i].purity) << name;
            EXPECT_EQ(sa[i].figure_of_merit, sb[i].figure_of_merit) << name;
            EXPECT_EQ(sa[i].precision, sb[i].precision) << name;
            EXPECT_EQ(sa[i].recall, sb[i].recall) << name;
        }
    }
}

TEST(LoopTest, RandomSeedChangesTrace) {
    ExperimentConfig config = configFor(StrategyKind::RANDOM, 3);
    LearningLoop a = makeLoop(config);
    config.random_seed = 12;
    LearningLoop b = makeLoop(config);
    a.run();
    b.run();
    EXPECT_NE(queriedTrace(a), queriedTrace(b));
}

// ─── Failures ──────────────────────────────────────────────────

TEST(LoopTest, SingleClassLabeledSetFails) {
    // Ids 1 and 3 are both class 1
    LearningLoop loop(blobTable(), std::make_unique<KNearestNeighborsClassifier>(3),
                      ExperimentConfig(), {1, 3}, VALIDATION);
    const auto pool_before = loop.partition().poolIds();

    try {
        loop.run();
        FAIL() << "expected InsufficientLabelsError";
    } catch (const InsufficientLabelsError& e) {
        EXPECT_EQ(e.context().iteration, 0);
        EXPECT_EQ(e.context().labeled, 2u);
        EXPECT_EQ(e.context().pool, 22u);
        EXPECT_NE(std::string(e.what()).find("iteration=0"), std::string::npos);
    }

    EXPECT_TRUE(loop.stopped());
    EXPECT_EQ(loop.stopReason(), StopReason::FAILED);
    EXPECT_FALSE(loop.lastError().empty());
    EXPECT_EQ(loop.partition().poolIds(), pool_before);
    EXPECT_EQ(loop.partition().labeledSize(), 2);
    EXPECT_TRUE(loop.metrics().empty());
}

TEST(LoopTest, FailureKeepsEarlierSnapshots) {
    LearningLoop loop = makeLoop(configFor(StrategyKind::UNCERTAINTY_MARGIN, 2),
                                 std::make_unique<FailingClassifier>(3));

    EXPECT_THROW(loop.run(), std::runtime_error);
    EXPECT_EQ(loop.stopReason(), StopReason::FAILED);
    EXPECT_EQ(loop.metrics().count(), 2);
    EXPECT_EQ(loop.iteration(), 2);
    EXPECT_NE(loop.lastError().find("model diverged"), std::string::npos);
}

TEST(LoopTest, MisalignedScoresAreInvariantErrors) {
    LearningLoop loop = makeLoop(configFor(StrategyKind::UNCERTAINTY_MARGIN, 2),
                                 std::make_unique<ShortScoreClassifier>());
    try {
        loop.run();
        FAIL() << "expected InvariantError";
    } catch (const InvariantError& e) {
        EXPECT_EQ(e.kind(), "InvariantError");
        EXPECT_TRUE(e.context().inRun());
    }
    EXPECT_EQ(loop.stopReason(), StopReason::FAILED);
    EXPECT_EQ(loop.partition().poolSize(), 22);
}

TEST(LoopTest, RandomBaselineStillScoresPool) {
    // Scoring runs for every strategy, so a broken scorer fails before selection
    LearningLoop loop = makeLoop(configFor(StrategyKind::RANDOM, 2),
                                 std::make_unique<ShortScoreClassifier>());
    try {
        loop.run();
        FAIL() << "expected InvariantError";
    } catch (const InvariantError& e) {
        EXPECT_EQ(e.context().iteration, 0);
    }
    EXPECT_EQ(loop.partition().labeledSize(), 2);
    EXPECT_EQ(loop.partition().poolSize(), 22);
    EXPECT_TRUE(loop.metrics().empty());
}

// ─── Batch BALD ────────────────────────────────────────────────

TEST(LoopTest, BatchBaldRunsOnPosteriorDraws) {
    ExperimentConfig config = configFor(StrategyKind::BATCH_BALD, 3);
    config.max_iterations = 3;
    config.posterior_samples = 4;
    LearningLoop loop(blobTable(), std::make_unique<KNearestNeighborsClassifier>(1),
                      config, LABELED, VALIDATION);
    loop.run();

    EXPECT_EQ(loop.stopReason(), StopReason::MAX_ITERATIONS);
    ASSERT_EQ(loop.metrics().count(), 3);
    EXPECT_EQ(loop.metrics().latest().strategy, "batch-bald");
    EXPECT_EQ(loop.partition().labeledSize(), 11);
    for (const auto& s : loop.metrics().snapshots()) {
        EXPECT_EQ(s.queried_ids.size(), 3);
    }
}

TEST(LoopTest, BatchBaldNeedsSamplingClassifier) {
    EXPECT_THROW(makeLoop(configFor(StrategyKind::BATCH_BALD, 2),
                          std::make_unique<PointEstimateClassifier>()),
                 InvariantError);
    EXPECT_NO_THROW(makeLoop(configFor(StrategyKind::UNCERTAINTY_MARGIN, 2),
                             std::make_unique<PointEstimateClassifier>()));
}

TEST(LoopTest, MissingPosteriorDrawsAreInvariantErrors) {
    LearningLoop loop = makeLoop(configFor(StrategyKind::BATCH_BALD, 2),
                                 std::make_unique<ShortDrawClassifier>());
    EXPECT_THROW(loop.run(), InvariantError);
    EXPECT_EQ(loop.stopReason(), StopReason::FAILED);
    EXPECT_EQ(loop.partition().poolSize(), 22);
}

// ─── Names ─────────────────────────────────────────────────────

TEST(LoopTest, StateAndReasonNames) {
    EXPECT_STREQ(loopStateName(LoopState::SELECTING), "Selecting");
    EXPECT_STREQ(loopStateName(LoopState::STOPPED), "Stopped");
    EXPECT_STREQ(stopReasonName(StopReason::POOL_EMPTY), "pool-empty");
    EXPECT_STREQ(stopReasonName(StopReason::BUDGET_EXHAUSTED), "budget-exhausted");
}
