#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "riskscore/api.hpp"
#include "riskscore/artifact.hpp"
#include "riskscore/errors.hpp"
#include "riskscore/feature_schema.hpp"
#include "riskscore/scoring_engine.hpp"
#include "riskscore/training.hpp"

namespace py = pybind11;

namespace {

std::vector<std::string> schema_names() {
    std::vector<std::string> names;
    for (auto feature : riskscore::all_features()) {
        names.push_back(riskscore::feature_name(feature));
    }
    return names;
}

}  // namespace

PYBIND11_MODULE(riskscore_python, m) {
    m.doc() = "Pybind11 bindings for the riskscore training pipeline and scoring engine.";

    py::register_exception<riskscore::SchemaError>(m, "SchemaError");
    py::register_exception<riskscore::ArtifactError>(m, "ArtifactError");
    py::register_exception<riskscore::FeatureError>(m, "FeatureError");
    py::register_exception<riskscore::NoPriorVersionError>(m, "NoPriorVersionError");

    m.def("feature_names", &schema_names);
    m.attr("WEIGHT_SCALE") = riskscore::kWeightScale;

    py::class_<riskscore::ModelMetrics>(m, "ModelMetrics")
        .def(py::init<>())
        .def_readwrite("auc_roc", &riskscore::ModelMetrics::auc_roc)
        .def_readwrite("cv_mean", &riskscore::ModelMetrics::cv_mean)
        .def_readwrite("cv_std", &riskscore::ModelMetrics::cv_std)
        .def_readwrite("precision_at_90_recall", &riskscore::ModelMetrics::precision_at_90_recall)
        .def_readwrite("training_date", &riskscore::ModelMetrics::training_date)
        .def_readwrite("feature_importance", &riskscore::ModelMetrics::feature_importance);

    py::class_<riskscore::ModelArtifact>(m, "ModelArtifact")
        .def(py::init<>())
        .def_readwrite("weights", &riskscore::ModelArtifact::weights)
        .def_readwrite("intercept", &riskscore::ModelArtifact::intercept)
        .def_readwrite("threshold", &riskscore::ModelArtifact::threshold)
        .def_readwrite("version", &riskscore::ModelArtifact::version)
        .def_readwrite("training_timestamp", &riskscore::ModelArtifact::training_timestamp)
        .def_readwrite("metrics", &riskscore::ModelArtifact::metrics)
        .def("to_json", [](const riskscore::ModelArtifact& artifact) {
            return riskscore::to_json_string(riskscore::weights_to_json(artifact));
        });

    m.def("parse_weights_document", &riskscore::parse_weights_document);
    m.def("load_weights_file", &riskscore::load_weights_file);
    m.def("validate_artifact", &riskscore::validate_artifact);

    py::class_<riskscore::ContributingFactor>(m, "ContributingFactor")
        .def_readonly("feature", &riskscore::ContributingFactor::feature)
        .def_readonly("contribution", &riskscore::ContributingFactor::contribution)
        .def_readonly("severity", &riskscore::ContributingFactor::severity);

    py::class_<riskscore::ScoreResult>(m, "ScoreResult")
        .def_readonly("raw", &riskscore::ScoreResult::raw)
        .def_readonly("probability", &riskscore::ScoreResult::probability)
        .def_readonly("score", &riskscore::ScoreResult::score)
        .def_readonly("model_version", &riskscore::ScoreResult::model_version)
        .def_readonly("factors", &riskscore::ScoreResult::factors)
        .def_property_readonly("risk_class",
                               [](const riskscore::ScoreResult& r) { return riskscore::to_string(r.risk_class); })
        .def_property_readonly("risk_level",
                               [](const riskscore::ScoreResult& r) { return riskscore::to_string(r.risk_level); });

    py::class_<riskscore::ScoringEngine, std::shared_ptr<riskscore::ScoringEngine>>(m, "ScoringEngine")
        .def(py::init([](riskscore::ModelArtifact bootstrap) {
            return std::make_shared<riskscore::ScoringEngine>(std::move(bootstrap));
        }))
        .def("score",
             py::overload_cast<const riskscore::FeatureVector&>(&riskscore::ScoringEngine::score, py::const_),
             py::call_guard<py::gil_scoped_release>())
        .def("reload", &riskscore::ScoringEngine::reload)
        .def("reload_document", &riskscore::ScoringEngine::reload_document)
        .def("rollback", &riskscore::ScoringEngine::rollback)
        .def("active", [](const riskscore::ScoringEngine& engine) { return *engine.active(); })
        .def_property_readonly("active_version", &riskscore::ScoringEngine::active_version)
        .def_property_readonly("has_previous", &riskscore::ScoringEngine::has_previous);

    py::class_<riskscore::TrainingConfig>(m, "TrainingConfig")
        .def(py::init<>())
        .def_readwrite("test_fraction", &riskscore::TrainingConfig::test_fraction)
        .def_readwrite("seed", &riskscore::TrainingConfig::seed)
        .def_readwrite("cv_folds", &riskscore::TrainingConfig::cv_folds)
        .def_readwrite("inverse_regularization", &riskscore::TrainingConfig::inverse_regularization)
        .def_readwrite("max_iterations", &riskscore::TrainingConfig::max_iterations)
        .def_readwrite("min_auc", &riskscore::TrainingConfig::min_auc)
        .def_readwrite("target_auc", &riskscore::TrainingConfig::target_auc);

    m.def("train",
          [](const std::string& data_path, const std::string& output_dir, const riskscore::TrainingConfig& config) {
              auto run = riskscore::run_training(data_path, output_dir, config);
              return py::make_tuple(run.artifact, riskscore::format_summary(run.result));
          },
          py::arg("data_path"), py::arg("output_dir"), py::arg("config") = riskscore::TrainingConfig{});
}
