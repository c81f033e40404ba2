#include "modalqc/outlier_methods.hpp"

namespace modalqc {

std::string method_name(MethodKind kind) {
    switch (kind) {
        case MethodKind::DeviationScore: return "DeviationScore";
        case MethodKind::TrendFit:       return "TrendFit";
        case MethodKind::JointDistance:  return "JointDistance";
    }
    return "Unknown";
}

std::string outlier_type_name(OutlierType type) {
    switch (type) {
        case OutlierType::None:           return "None";
        case OutlierType::DeviationScore: return "DeviationScore";
        case OutlierType::TrendFit:       return "TrendFit";
        case OutlierType::JointDistance:  return "JointDistance";
        case OutlierType::Combined:       return "Combined";
    }
    return "Unknown";
}

OutlierType outlier_type_for(MethodKind kind) {
    switch (kind) {
        case MethodKind::DeviationScore: return OutlierType::DeviationScore;
        case MethodKind::TrendFit:       return OutlierType::TrendFit;
        case MethodKind::JointDistance:  return OutlierType::JointDistance;
    }
    return OutlierType::None;
}

double scalar_value(const ModeObservation& obs, ScalarField field) {
    switch (field) {
        case ScalarField::FREQUENCY:     return obs.frequency;
        case ScalarField::DAMPING_RATIO: return obs.damping_ratio;
    }
    return obs.frequency;
}

MethodKind method_kind(const DetectionMethod& method) {
    return std::visit([](const auto& m) { return m.kind(); }, method);
}

MethodResult run_method(const DetectionMethod& method,
                        const std::vector<ModeObservation>& group) {
    return std::visit([&group](const auto& m) { return m.run(group); }, method);
}

}  // namespace modalqc
