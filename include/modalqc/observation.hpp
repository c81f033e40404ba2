#pragma once

#include "modalqc/common.hpp"

namespace modalqc {

// One candidate mode estimate from one segment, as delivered by the
// upstream identification step.
struct RawCandidate {
    int segment_id = 0;
    double frequency = 0.0;             // Hz
    double damping_ratio = 0.0;
    Eigen::VectorXd mode_shape;         // one entry per sensor channel
    double detection_percentage = 0.0;  // stabilization consensus, 0-1
};

// A candidate after MAC matching: carries its sub-mode label and the MAC
// against the winning reference.
struct ModeObservation {
    int mode_number = 0;
    int segment_id = 0;
    std::string sub_mode_label;         // e.g. "6.2"
    double frequency = 0.0;
    double damping_ratio = 0.0;
    Eigen::VectorXd mode_shape;
    double mac_value = 0.0;
    double detection_percentage = 0.0;
};

enum class MethodKind { DeviationScore, TrendFit, JointDistance };

enum class OutlierType { None, DeviationScore, TrendFit, JointDistance, Combined };

constexpr int NUM_METHODS = 3;

std::string method_name(MethodKind kind);
std::string outlier_type_name(OutlierType type);

// Map a single flagging method to its outlier type
OutlierType outlier_type_for(MethodKind kind);

struct MethodFlag {
    bool is_outlier = false;
    double metric_value = 0.0;   // z-score, band deviation or Mahalanobis distance
};

// Output of one detection method over one observation group.
// flags is parallel to the group; empty when the method did not run.
struct MethodResult {
    MethodKind method = MethodKind::DeviationScore;
    bool ran = false;
    std::string failure_reason;
    std::vector<MethodFlag> flags;
    bool used_fallback = false;            // JointDistance univariate path
    std::vector<std::string> warnings;

    int num_flagged() const {
        int n = 0;
        for (const auto& f : flags) {
            if (f.is_outlier) n++;
        }
        return n;
    }
};

struct EnsembleResult {
    int segment_id = 0;
    std::string sub_mode_label;
    bool is_outlier = false;
    OutlierType outlier_type = OutlierType::None;
    int votes = 0;                         // methods that flagged this observation
    double distance_from_mean = 0.0;       // (f - mean) / std of the group
};

}  // namespace modalqc
