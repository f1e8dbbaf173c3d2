// PyBind11 bindings for the specsel C++ core.
// Exposes candidates, partition, strategies, metrics and the learning
// loop so experiments can be driven from notebooks and scripts.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DSPECSEL_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "errors/errors.hpp"
#include "data/candidate.hpp"
#include "partition/sample_partition.hpp"
#include "classifier/classifier.hpp"
#include "classifier/classifier_registry.hpp"
#include "classifier/knn_classifier.hpp"
#include "classifier/nearest_centroid.hpp"
#include "strategy/query_strategy.hpp"
#include "strategy/strategy_factory.hpp"
#include "metrics/classification_metrics.hpp"
#include "metrics/metrics_recorder.hpp"
#include "loop/experiment_config.hpp"
#include "loop/learning_loop.hpp"
#include "loop/experiment_runner.hpp"
#include "util/logger.hpp"

namespace py = pybind11;

PYBIND11_MODULE(specsel_bindings, m) {
    m.doc() = "specsel C++ Core Bindings";

    // ── Errors ──
    auto& base_error = py::register_exception<specsel::Error>(m, "Error");
    py::register_exception<specsel::InvariantError>(m, "InvariantError", base_error.ptr());
    py::register_exception<specsel::NotInPoolError>(m, "NotInPoolError", base_error.ptr());
    py::register_exception<specsel::InsufficientLabelsError>(
        m, "InsufficientLabelsError", base_error.ptr());

    // ── Enums ──
    py::enum_<specsel::DistanceMetric>(m, "DistanceMetric")
        .value("EUCLIDEAN", specsel::DistanceMetric::EUCLIDEAN)
        .value("MANHATTAN", specsel::DistanceMetric::MANHATTAN);

    py::enum_<specsel::StrategyKind>(m, "StrategyKind")
        .value("RANDOM", specsel::StrategyKind::RANDOM)
        .value("UNCERTAINTY_MARGIN", specsel::StrategyKind::UNCERTAINTY_MARGIN)
        .value("UNCERTAINTY_ENTROPY", specsel::StrategyKind::UNCERTAINTY_ENTROPY)
        .value("DIVERSITY", specsel::StrategyKind::DIVERSITY)
        .value("BATCH_BALD", specsel::StrategyKind::BATCH_BALD);

    py::enum_<specsel::LoopState>(m, "LoopState")
        .value("READY", specsel::LoopState::READY)
        .value("TRAINING", specsel::LoopState::TRAINING)
        .value("SCORING", specsel::LoopState::SCORING)
        .value("SELECTING", specsel::LoopState::SELECTING)
        .value("UPDATING", specsel::LoopState::UPDATING)
        .value("EVALUATING", specsel::LoopState::EVALUATING)
        .value("STOPPED", specsel::LoopState::STOPPED);

    py::enum_<specsel::StopReason>(m, "StopReason")
        .value("NONE", specsel::StopReason::NONE)
        .value("POOL_EMPTY", specsel::StopReason::POOL_EMPTY)
        .value("MAX_ITERATIONS", specsel::StopReason::MAX_ITERATIONS)
        .value("BUDGET_EXHAUSTED", specsel::StopReason::BUDGET_EXHAUSTED)
        .value("FAILED", specsel::StopReason::FAILED);

    // ── Candidate ──
    py::class_<specsel::Candidate>(m, "Candidate")
        .def(py::init<>())
        .def(py::init<specsel::CandidateId, specsel::FeatureVector, int, double>(),
             py::arg("id"), py::arg("features"), py::arg("label"), py::arg("cost") = 1.0)
        .def_readwrite("id", &specsel::Candidate::id)
        .def_readwrite("features", &specsel::Candidate::features)
        .def_readwrite("label", &specsel::Candidate::label)
        .def_readwrite("cost", &specsel::Candidate::cost);

    // ── CandidateTable ──
    py::class_<specsel::CandidateTable, std::shared_ptr<specsel::CandidateTable>>(m, "CandidateTable")
        .def(py::init<std::vector<specsel::Candidate>>())
        .def("size", &specsel::CandidateTable::size)
        .def("feature_dim", &specsel::CandidateTable::featureDim)
        .def("contains", &specsel::CandidateTable::contains)
        .def("get", &specsel::CandidateTable::get, py::return_value_policy::copy)
        .def("ids", &specsel::CandidateTable::ids)
        .def("classes", &specsel::CandidateTable::classes);

    // ── SamplePartition ──
    py::class_<specsel::SamplePartition>(m, "SamplePartition")
        .def(py::init<>())
        .def("initialize", &specsel::SamplePartition::initialize,
             py::arg("all_ids"), py::arg("initial_labeled_ids"), py::arg("validation_ids"))
        .def("move_to_labeled", &specsel::SamplePartition::moveToLabeled)
        .def("labeled_ids", &specsel::SamplePartition::labeledIds)
        .def("pool_ids", &specsel::SamplePartition::poolIds)
        .def("validation_ids", &specsel::SamplePartition::validationIds)
        .def("in_pool", &specsel::SamplePartition::inPool)
        .def("is_labeled", &specsel::SamplePartition::isLabeled)
        .def("is_validation", &specsel::SamplePartition::isValidation)
        .def("check_invariants", &specsel::SamplePartition::checkInvariants);

    // ── Classifiers ──
    py::class_<specsel::Classifier>(m, "Classifier")
        .def("name", &specsel::Classifier::name)
        .def("fit", &specsel::Classifier::fit)
        .def("predict_score", &specsel::Classifier::predictScore)
        .def("predict", &specsel::Classifier::predict)
        .def("classes", &specsel::Classifier::classes)
        .def("supports_score_samples", &specsel::Classifier::supportsScoreSamples)
        .def("predict_score_samples", &specsel::Classifier::predictScoreSamples,
             py::arg("features"), py::arg("num_samples"), py::arg("seed"));

    py::class_<specsel::NearestCentroidClassifier, specsel::Classifier>(m, "NearestCentroidClassifier")
        .def(py::init<>());

    py::class_<specsel::KNearestNeighborsClassifier, specsel::Classifier>(m, "KNearestNeighborsClassifier")
        .def(py::init<size_t, specsel::DistanceMetric>(),
             py::arg("k") = 5, py::arg("metric") = specsel::DistanceMetric::EUCLIDEAN);

    m.def("classifier_names", &specsel::classifierNames);

    // ── Query strategies ──
    py::class_<specsel::QueryContext>(m, "QueryContext")
        .def(py::init<>())
        .def_readwrite("pool_ids", &specsel::QueryContext::pool_ids)
        .def_readwrite("pool_features", &specsel::QueryContext::pool_features)
        .def_readwrite("pool_scores", &specsel::QueryContext::pool_scores)
        .def_readwrite("pool_score_samples", &specsel::QueryContext::pool_score_samples)
        .def_readwrite("iteration", &specsel::QueryContext::iteration)
        .def_readwrite("seed", &specsel::QueryContext::seed);

    m.def("strategy_names", &specsel::strategyNames);

    m.def("select_batch", [](const std::string& strategy, const specsel::QueryContext& context,
                             size_t k, size_t shortlist_size, specsel::DistanceMetric metric,
                             size_t joint_samples) {
        auto s = specsel::makeQueryStrategy(specsel::parseStrategyKind(strategy),
                                            shortlist_size, metric, joint_samples);
        return s->select(context, k);
    }, py::arg("strategy"), py::arg("context"), py::arg("k"),
       py::arg("shortlist_size") = 20,
       py::arg("metric") = specsel::DistanceMetric::EUCLIDEAN,
       py::arg("joint_samples") = 200);

    // ── Metrics ──
    m.def("accuracy", &specsel::accuracy);
    m.def("efficiency", &specsel::efficiency,
          py::arg("predicted"), py::arg("truth"), py::arg("target_class") = 1);
    m.def("purity", &specsel::purity,
          py::arg("predicted"), py::arg("truth"), py::arg("target_class") = 1);
    m.def("figure_of_merit", &specsel::figureOfMerit,
          py::arg("predicted"), py::arg("truth"), py::arg("target_class") = 1,
          py::arg("penalty") = specsel::DEFAULT_FOM_PENALTY);

    py::class_<specsel::MetricsSnapshot>(m, "MetricsSnapshot")
        .def(py::init<>())
        .def_readwrite("iteration", &specsel::MetricsSnapshot::iteration)
        .def_readwrite("labeled_size", &specsel::MetricsSnapshot::labeled_size)
        .def_readwrite("pool_size", &specsel::MetricsSnapshot::pool_size)
        .def_readwrite("queried_ids", &specsel::MetricsSnapshot::queried_ids)
        .def_readwrite("cumulative_cost", &specsel::MetricsSnapshot::cumulative_cost)
        .def_readwrite("strategy", &specsel::MetricsSnapshot::strategy)
        .def_readwrite("accuracy", &specsel::MetricsSnapshot::accuracy)
        .def_readwrite("efficiency", &specsel::MetricsSnapshot::efficiency)
        .def_readwrite("purity", &specsel::MetricsSnapshot::purity)
        .def_readwrite("figure_of_merit", &specsel::MetricsSnapshot::figure_of_merit)
        .def_readwrite("precision", &specsel::MetricsSnapshot::precision)
        .def_readwrite("recall", &specsel::MetricsSnapshot::recall);

    py::class_<specsel::MetricsRecorder>(m, "MetricsRecorder")
        .def("snapshots", &specsel::MetricsRecorder::snapshots)
        .def("count", &specsel::MetricsRecorder::count)
        .def("to_records", &specsel::MetricsRecorder::toRecords)
        .def("export_to_file", &specsel::MetricsRecorder::exportToFile);

    // ── ExperimentConfig ──
    py::class_<specsel::ExperimentConfig>(m, "ExperimentConfig")
        .def(py::init<>())
        .def_readwrite("query_strategy", &specsel::ExperimentConfig::query_strategy)
        .def_readwrite("batch_size", &specsel::ExperimentConfig::batch_size)
        .def_readwrite("max_iterations", &specsel::ExperimentConfig::max_iterations)
        .def_readwrite("random_seed", &specsel::ExperimentConfig::random_seed)
        .def_readwrite("diversity_shortlist_size", &specsel::ExperimentConfig::diversity_shortlist_size)
        .def_readwrite("distance_metric", &specsel::ExperimentConfig::distance_metric)
        .def_readwrite("label_budget", &specsel::ExperimentConfig::label_budget)
        .def_readwrite("target_class", &specsel::ExperimentConfig::target_class)
        .def_readwrite("fom_penalty", &specsel::ExperimentConfig::fom_penalty)
        .def_readwrite("posterior_samples", &specsel::ExperimentConfig::posterior_samples)
        .def_readwrite("joint_samples", &specsel::ExperimentConfig::joint_samples)
        .def("validate", &specsel::ExperimentConfig::validate)
        .def("describe", &specsel::ExperimentConfig::describe);

    m.def("parse_config", &specsel::parseConfig);
    m.def("load_config_file", &specsel::loadConfigFile);

    // ── LearningLoop ──
    py::class_<specsel::LearningLoop>(m, "LearningLoop")
        .def(py::init([](std::shared_ptr<specsel::CandidateTable> table,
                         const std::string& classifier,
                         const specsel::ExperimentConfig& config,
                         const std::vector<specsel::CandidateId>& labeled,
                         const std::vector<specsel::CandidateId>& validation,
                         size_t knn_k) {
                 return std::make_unique<specsel::LearningLoop>(
                     table, specsel::makeClassifier(classifier, knn_k), config,
                     labeled, validation);
             }),
             py::arg("table"), py::arg("classifier"), py::arg("config"),
             py::arg("initial_labeled_ids"), py::arg("validation_ids"),
             py::arg("knn_k") = 5)
        .def("advance", &specsel::LearningLoop::advance)
        .def("run_iteration", &specsel::LearningLoop::runIteration)
        .def("run", &specsel::LearningLoop::run, py::return_value_policy::copy)
        .def("state", &specsel::LearningLoop::state)
        .def("stop_reason", &specsel::LearningLoop::stopReason)
        .def("iteration", &specsel::LearningLoop::iteration)
        .def("last_query", &specsel::LearningLoop::lastQuery)
        .def("last_error", &specsel::LearningLoop::lastError)
        .def("partition", &specsel::LearningLoop::partition,
             py::return_value_policy::reference_internal)
        .def("metrics", &specsel::LearningLoop::metrics,
             py::return_value_policy::reference_internal);

    // ── ExperimentRunner ──
    py::class_<specsel::RunOutcome>(m, "RunOutcome")
        .def_readonly("config", &specsel::RunOutcome::config)
        .def_readonly("snapshots", &specsel::RunOutcome::snapshots)
        .def_readonly("stop_reason", &specsel::RunOutcome::stop_reason)
        .def_readonly("completed", &specsel::RunOutcome::completed)
        .def_readonly("error_kind", &specsel::RunOutcome::error_kind)
        .def_readonly("error", &specsel::RunOutcome::error)
        .def_readonly("failed_iteration", &specsel::RunOutcome::failed_iteration);

    m.def("run_experiments", [](std::shared_ptr<specsel::CandidateTable> table,
                                const std::string& classifier,
                                const std::vector<specsel::ExperimentConfig>& configs,
                                const std::vector<specsel::CandidateId>& labeled,
                                const std::vector<specsel::CandidateId>& validation,
                                size_t max_threads) {
        specsel::ExperimentRunner runner(table, specsel::classifierFactory(classifier),
                                         labeled, validation, max_threads);
        py::gil_scoped_release release;
        return runner.run(configs);
    }, py::arg("table"), py::arg("classifier"), py::arg("configs"),
       py::arg("initial_labeled_ids"), py::arg("validation_ids"),
       py::arg("max_threads") = 0);

    m.def("set_log_level", [](const std::string& level) {
        specsel::LogLevel parsed;
        if (!specsel::parseLogLevel(level, parsed)) {
            throw specsel::InvariantError("unknown log level: " + level);
        }
        specsel::setLogLevel(parsed);
    });
}
