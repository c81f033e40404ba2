#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/stl.h>

#include "modalqc/common.hpp"
#include "modalqc/observation.hpp"
#include "modalqc/reference_shapes.hpp"
#include "modalqc/mac.hpp"
#include "modalqc/candidate_selector.hpp"
#include "modalqc/outlier_methods.hpp"
#include "modalqc/ensemble.hpp"
#include "modalqc/report.hpp"
#include "modalqc/engine.hpp"
#include "modalqc/config.hpp"
#include "modalqc/candidate_io.hpp"
#include "modalqc/synthetic.hpp"

namespace py = pybind11;
using namespace modalqc;

PYBIND11_MODULE(_core, m) {
    m.doc() = "Cross-segment mode matching and outlier screening for operational modal analysis";

    py::register_exception<ShapeMismatchError>(m, "ShapeMismatchError", PyExc_ValueError);
    py::register_exception<DegenerateShapeError>(m, "DegenerateShapeError", PyExc_ValueError);
    py::register_exception<InsufficientDataError>(m, "InsufficientDataError", PyExc_RuntimeError);

    // --- Enums ---
    py::enum_<MethodKind>(m, "MethodKind")
        .value("DeviationScore", MethodKind::DeviationScore)
        .value("TrendFit", MethodKind::TrendFit)
        .value("JointDistance", MethodKind::JointDistance);

    py::enum_<OutlierType>(m, "OutlierType")
        .value("None_", OutlierType::None)
        .value("DeviationScore", OutlierType::DeviationScore)
        .value("TrendFit", OutlierType::TrendFit)
        .value("JointDistance", OutlierType::JointDistance)
        .value("Combined", OutlierType::Combined);

    py::enum_<ScalarField>(m, "ScalarField")
        .value("FREQUENCY", ScalarField::FREQUENCY)
        .value("DAMPING_RATIO", ScalarField::DAMPING_RATIO);

    // --- RawCandidate ---
    py::class_<RawCandidate>(m, "RawCandidate")
        .def(py::init<>())
        .def(py::init([](int segment_id, double frequency, double damping_ratio,
                         const Eigen::VectorXd& mode_shape, double detection_percentage) {
            RawCandidate c;
            c.segment_id = segment_id;
            c.frequency = frequency;
            c.damping_ratio = damping_ratio;
            c.mode_shape = mode_shape;
            c.detection_percentage = detection_percentage;
            return c;
        }), py::arg("segment_id"), py::arg("frequency"), py::arg("damping_ratio"),
            py::arg("mode_shape"), py::arg("detection_percentage") = 1.0)
        .def_readwrite("segment_id", &RawCandidate::segment_id)
        .def_readwrite("frequency", &RawCandidate::frequency, "Frequency (Hz)")
        .def_readwrite("damping_ratio", &RawCandidate::damping_ratio)
        .def_readwrite("mode_shape", &RawCandidate::mode_shape)
        .def_readwrite("detection_percentage", &RawCandidate::detection_percentage)
        .def("__repr__", [](const RawCandidate& c) {
            return "<RawCandidate segment=" + std::to_string(c.segment_id) +
                   " f=" + std::to_string(c.frequency) + ">";
        });

    // --- ModeObservation ---
    py::class_<ModeObservation>(m, "ModeObservation")
        .def(py::init<>())
        .def_readwrite("mode_number", &ModeObservation::mode_number)
        .def_readwrite("segment_id", &ModeObservation::segment_id)
        .def_readwrite("sub_mode_label", &ModeObservation::sub_mode_label)
        .def_readwrite("frequency", &ModeObservation::frequency)
        .def_readwrite("damping_ratio", &ModeObservation::damping_ratio)
        .def_readwrite("mode_shape", &ModeObservation::mode_shape)
        .def_readwrite("mac_value", &ModeObservation::mac_value)
        .def_readwrite("detection_percentage", &ModeObservation::detection_percentage);

    // --- Reference shapes ---
    py::class_<ReferenceModeShape>(m, "ReferenceModeShape")
        .def(py::init<>())
        .def_readonly("mode_number", &ReferenceModeShape::mode_number)
        .def_readonly("label", &ReferenceModeShape::label)
        .def_readonly("shape", &ReferenceModeShape::shape);

    py::class_<ReferenceShapeStore>(m, "ReferenceShapeStore")
        .def(py::init<>())
        .def("add", &ReferenceShapeStore::add,
             py::arg("mode_number"), py::arg("label"), py::arg("shape"),
             "Add a reference shape (stored with unit norm)")
        .def("for_mode", &ReferenceShapeStore::for_mode, py::arg("mode_number"),
             py::return_value_policy::reference_internal)
        .def("mode_numbers", &ReferenceShapeStore::mode_numbers)
        .def("channel_count", &ReferenceShapeStore::channel_count, py::arg("mode_number"))
        .def("cross_mac", &ReferenceShapeStore::cross_mac, py::arg("mode_number"))
        .def("ambiguous_pairs", &ReferenceShapeStore::ambiguous_pairs,
             py::arg("mode_number"), py::arg("threshold") = 0.9)
        .def("__len__", &ReferenceShapeStore::size);

    // --- MAC ---
    m.def("compute_mac", &compute_mac, py::arg("a"), py::arg("b"),
          "Modal Assurance Criterion between two shape vectors");
    m.def("mac_matrix", &mac_matrix, py::arg("A"), py::arg("B"),
          "Pairwise MAC between the columns of A and B");

    // --- Selector ---
    py::class_<SelectionResult>(m, "SelectionResult")
        .def_readonly("observations", &SelectionResult::observations)
        .def_readonly("removed_per_segment", &SelectionResult::removed_per_segment)
        .def_readonly("winner_counts", &SelectionResult::winner_counts)
        .def_readonly("total_removed", &SelectionResult::total_removed);
    m.def("select_best_candidates", &select_best_candidates, py::arg("observations"));

    // --- Methods ---
    py::class_<MethodFlag>(m, "MethodFlag")
        .def_readonly("is_outlier", &MethodFlag::is_outlier)
        .def_readonly("metric_value", &MethodFlag::metric_value);

    py::class_<MethodResult>(m, "MethodResult")
        .def_readonly("method", &MethodResult::method)
        .def_readonly("ran", &MethodResult::ran)
        .def_readonly("failure_reason", &MethodResult::failure_reason)
        .def_readonly("flags", &MethodResult::flags)
        .def_readonly("used_fallback", &MethodResult::used_fallback)
        .def_readonly("warnings", &MethodResult::warnings);

    py::class_<DeviationScoreConfig>(m, "DeviationScoreConfig")
        .def(py::init<>())
        .def_readwrite("threshold", &DeviationScoreConfig::threshold)
        .def_readwrite("field", &DeviationScoreConfig::field);

    py::enum_<TrendFitConfig::Band>(m, "TrendBand")
        .value("LEAVE_ONE_OUT", TrendFitConfig::Band::LEAVE_ONE_OUT)
        .value("PREDICTION", TrendFitConfig::Band::PREDICTION);

    py::class_<TrendFitConfig>(m, "TrendFitConfig")
        .def(py::init<>())
        .def_readwrite("polynomial_degree", &TrendFitConfig::polynomial_degree)
        .def_readwrite("confidence_level", &TrendFitConfig::confidence_level)
        .def_readwrite("band", &TrendFitConfig::band)
        .def_readwrite("field", &TrendFitConfig::field);

    py::class_<JointDistanceConfig>(m, "JointDistanceConfig")
        .def(py::init<>())
        .def_readwrite("distance_threshold", &JointDistanceConfig::distance_threshold)
        .def_readwrite("mac_threshold", &JointDistanceConfig::mac_threshold);

    m.def("deviation_score", [](const std::vector<ModeObservation>& group,
                                const DeviationScoreConfig& cfg) {
        return DeviationScoreMethod(cfg).run(group);
    }, py::arg("group"), py::arg("config") = DeviationScoreConfig());
    m.def("trend_fit", [](const std::vector<ModeObservation>& group,
                          const TrendFitConfig& cfg) {
        return TrendFitMethod(cfg).run(group);
    }, py::arg("group"), py::arg("config") = TrendFitConfig());
    m.def("joint_distance", [](const std::vector<ModeObservation>& group,
                               const JointDistanceConfig& cfg) {
        return JointDistanceMethod(cfg).run(group);
    }, py::arg("group"), py::arg("config") = JointDistanceConfig());

    // --- Ensemble ---
    py::class_<EnsembleResult>(m, "EnsembleResult")
        .def_readonly("segment_id", &EnsembleResult::segment_id)
        .def_readonly("sub_mode_label", &EnsembleResult::sub_mode_label)
        .def_readonly("is_outlier", &EnsembleResult::is_outlier)
        .def_readonly("outlier_type", &EnsembleResult::outlier_type)
        .def_readonly("votes", &EnsembleResult::votes)
        .def_readonly("distance_from_mean", &EnsembleResult::distance_from_mean);
    m.def("combine", &combine, py::arg("group"), py::arg("method_results"));

    // --- Report ---
    py::class_<ReportRecord>(m, "ReportRecord")
        .def_readonly("mode_number", &ReportRecord::mode_number)
        .def_readonly("segment_id", &ReportRecord::segment_id)
        .def_readonly("sub_mode_label", &ReportRecord::sub_mode_label)
        .def_readonly("frequency", &ReportRecord::frequency)
        .def_readonly("damping_ratio", &ReportRecord::damping_ratio)
        .def_readonly("mac_value", &ReportRecord::mac_value)
        .def_readonly("detection_percentage", &ReportRecord::detection_percentage)
        .def_readonly("z_score", &ReportRecord::z_score)
        .def_readonly("trend_deviation", &ReportRecord::trend_deviation)
        .def_readonly("mahalanobis_distance", &ReportRecord::mahalanobis_distance)
        .def_readonly("joint_fallback", &ReportRecord::joint_fallback)
        .def_readonly("is_outlier", &ReportRecord::is_outlier)
        .def_readonly("outlier_type", &ReportRecord::outlier_type)
        .def_readonly("votes", &ReportRecord::votes)
        .def_readonly("distance_from_mean", &ReportRecord::distance_from_mean)
        .def("__repr__", [](const ReportRecord& r) {
            return "<ReportRecord segment=" + std::to_string(r.segment_id) +
                   " " + r.sub_mode_label + " " + outlier_type_name(r.outlier_type) + ">";
        });

    py::class_<ExcludedCandidate>(m, "ExcludedCandidate")
        .def_readonly("segment_id", &ExcludedCandidate::segment_id)
        .def_readonly("reason", &ExcludedCandidate::reason)
        .def_readonly("detail", &ExcludedCandidate::detail);

    py::class_<MethodStatus>(m, "MethodStatus")
        .def_readonly("method", &MethodStatus::method)
        .def_readonly("ran", &MethodStatus::ran)
        .def_readonly("failure_reason", &MethodStatus::failure_reason)
        .def_readonly("used_fallback", &MethodStatus::used_fallback)
        .def_readonly("num_flagged", &MethodStatus::num_flagged);

    py::class_<SelectorStats>(m, "SelectorStats")
        .def_readonly("enabled", &SelectorStats::enabled)
        .def_readonly("total_removed", &SelectorStats::total_removed)
        .def_readonly("removed_per_segment", &SelectorStats::removed_per_segment)
        .def_readonly("winner_counts", &SelectorStats::winner_counts);

    py::class_<SubModeStatistics>(m, "SubModeStatistics")
        .def_readonly("label", &SubModeStatistics::label)
        .def_readonly("count", &SubModeStatistics::count)
        .def_readonly("mean_frequency", &SubModeStatistics::mean_frequency)
        .def_readonly("std_frequency", &SubModeStatistics::std_frequency)
        .def_readonly("mean_damping", &SubModeStatistics::mean_damping)
        .def_readonly("std_damping", &SubModeStatistics::std_damping)
        .def_readonly("mean_mac", &SubModeStatistics::mean_mac)
        .def_readonly("outlier_count", &SubModeStatistics::outlier_count);

    py::class_<RunSummary>(m, "RunSummary")
        .def_readonly("mode_number", &RunSummary::mode_number)
        .def_readonly("num_candidates", &RunSummary::num_candidates)
        .def_readonly("num_matched", &RunSummary::num_matched)
        .def_readonly("num_unmatched", &RunSummary::num_unmatched)
        .def_readonly("num_rejected", &RunSummary::num_rejected)
        .def_readonly("num_analysed", &RunSummary::num_analysed)
        .def_readonly("num_outliers", &RunSummary::num_outliers)
        .def_readonly("excluded", &RunSummary::excluded)
        .def_readonly("methods", &RunSummary::methods)
        .def_readonly("selector", &RunSummary::selector)
        .def_readonly("sub_modes", &RunSummary::sub_modes)
        .def_readonly("warnings", &RunSummary::warnings)
        .def_readonly("error", &RunSummary::error)
        .def("__str__", &format_summary);

    m.def("export_report_csv", &export_report_csv, py::arg("filename"), py::arg("records"));
    m.def("export_summary_csv", &export_summary_csv, py::arg("filename"), py::arg("summaries"));

    // --- Engine ---
    py::class_<ModeConfig>(m, "ModeConfig")
        .def(py::init<>())
        .def_readwrite("min_match_mac", &ModeConfig::min_match_mac)
        .def_readwrite("best_mac_only", &ModeConfig::best_mac_only)
        .def_readwrite("deviation_score", &ModeConfig::deviation_score)
        .def_readwrite("trend_fit", &ModeConfig::trend_fit)
        .def_readwrite("joint_distance", &ModeConfig::joint_distance);

    py::class_<EngineConfig>(m, "EngineConfig")
        .def(py::init<>())
        .def_readwrite("references", &EngineConfig::references)
        .def_readwrite("modes", &EngineConfig::modes)
        .def_readwrite("max_threads", &EngineConfig::max_threads)
        .def_readwrite("parallel_methods", &EngineConfig::parallel_methods)
        .def_readwrite("verbose", &EngineConfig::verbose)
        .def("mode_config", &EngineConfig::mode_config, py::arg("mode_number"))
        .def("validate", &EngineConfig::validate);

    py::class_<ModeAnalysis>(m, "ModeAnalysis")
        .def_readonly("mode_number", &ModeAnalysis::mode_number)
        .def_readonly("records", &ModeAnalysis::records)
        .def_readonly("summary", &ModeAnalysis::summary);

    py::class_<OutlierEngine>(m, "OutlierEngine")
        .def(py::init<EngineConfig>(), py::arg("config"))
        .def("analyze_mode", &OutlierEngine::analyze_mode,
             py::arg("mode_number"), py::arg("candidates"),
             "Match, screen and combine one mode's candidates",
             py::call_guard<py::gil_scoped_release>())
        .def("analyze_modes", &OutlierEngine::analyze_modes,
             py::arg("candidates_by_mode"),
             "Analyse several modes in parallel",
             py::call_guard<py::gil_scoped_release>());

    m.def("load_engine_config", &load_engine_config, py::arg("filename"));
    m.def("load_candidates_csv", &load_candidates_csv, py::arg("filename"));
    m.def("export_candidates_csv", &export_candidates_csv,
          py::arg("filename"), py::arg("candidates_by_mode"));

    // --- Synthetic data ---
    py::class_<SyntheticConfig>(m, "SyntheticConfig")
        .def(py::init<>())
        .def_readwrite("num_segments", &SyntheticConfig::num_segments)
        .def_readwrite("base_frequency", &SyntheticConfig::base_frequency)
        .def_readwrite("sub_mode_spacing", &SyntheticConfig::sub_mode_spacing)
        .def_readwrite("drift_per_segment", &SyntheticConfig::drift_per_segment)
        .def_readwrite("frequency_sigma", &SyntheticConfig::frequency_sigma)
        .def_readwrite("damping_mean", &SyntheticConfig::damping_mean)
        .def_readwrite("damping_sigma", &SyntheticConfig::damping_sigma)
        .def_readwrite("shape_noise_sigma", &SyntheticConfig::shape_noise_sigma)
        .def_readwrite("anomaly_segments", &SyntheticConfig::anomaly_segments)
        .def_readwrite("anomaly_frequency_offset", &SyntheticConfig::anomaly_frequency_offset)
        .def_readwrite("anomaly_shape_noise_sigma", &SyntheticConfig::anomaly_shape_noise_sigma)
        .def_readwrite("seed", &SyntheticConfig::seed);
    m.def("generate_synthetic_candidates", &generate_synthetic_candidates,
          py::arg("config"), py::arg("references"));
}
