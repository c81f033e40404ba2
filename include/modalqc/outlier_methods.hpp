#pragma once

#include "modalqc/observation.hpp"
#include "modalqc/statistics.hpp"
#include <variant>

namespace modalqc {

// Which scalar of an observation a univariate method screens
enum class ScalarField { FREQUENCY, DAMPING_RATIO };

double scalar_value(const ModeObservation& obs, ScalarField field);

struct DeviationScoreConfig {
    double threshold = 2.0;                 // |z| above this is an outlier
    ScalarField field = ScalarField::FREQUENCY;
};

struct TrendFitConfig {
    enum class Band {
        LEAVE_ONE_OUT,   // each point against the prediction band of a fit without it
        PREDICTION,      // every point against the prediction band of the full fit
    };
    int polynomial_degree = 2;
    double confidence_level = 0.95;
    Band band = Band::LEAVE_ONE_OUT;
    ScalarField field = ScalarField::FREQUENCY;
};

struct JointDistanceConfig {
    double distance_threshold = 2.5;   // Mahalanobis distance above this is an outlier
    double mac_threshold = 0.35;       // MAC below this is always an outlier
};

// Z-score screen of one scalar.
// Fewer than 2 points or negligible spread: nothing is flagged, a warning is recorded.
class DeviationScoreMethod {
public:
    explicit DeviationScoreMethod(const DeviationScoreConfig& config = DeviationScoreConfig());

    MethodKind kind() const { return MethodKind::DeviationScore; }
    MethodResult run(const std::vector<ModeObservation>& group) const;

    const DeviationScoreConfig& config() const { return config_; }

private:
    DeviationScoreConfig config_;
};

// Detailed trend-fit output, for callers that want the band itself
struct TrendBand {
    PolynomialFit fit;             // all points
    double t_critical = 0.0;       // first-pass critical value
    Eigen::VectorXd x;             // segment ids
    Eigen::VectorXd observed;
    Eigen::VectorXd predicted;     // centre of the band each point is judged against
    Eigen::VectorXd half_width;    // per point, infinite when a point cannot be judged
    Eigen::VectorXd deviation;     // signed distance outside the band, 0 inside
};

// Polynomial regression of the scalar against segment id with a Student-t band.
//
// LEAVE_ONE_OUT judges every point against the prediction band of the fit
// without it (deleted residuals). Points flagged there are checked again
// against the fit of the unflagged points; only points outside both stay flagged.
class TrendFitMethod {
public:
    explicit TrendFitMethod(const TrendFitConfig& config = TrendFitConfig());

    MethodKind kind() const { return MethodKind::TrendFit; }

    // Never throws for data problems: InsufficientData becomes ran == false
    MethodResult run(const std::vector<ModeObservation>& group) const;

    // Throws InsufficientDataError when the fit is singular or has too few
    // points: n > degree+2 for LEAVE_ONE_OUT, n > degree+1 for PREDICTION
    TrendBand fit(const std::vector<ModeObservation>& group) const;

    const TrendFitConfig& config() const { return config_; }

private:
    TrendFitConfig config_;
};

// Mahalanobis distance over (frequency, mac_value).
// Singular covariance falls back to standardised Euclidean distance and
// sets MethodResult::used_fallback.
class JointDistanceMethod {
public:
    explicit JointDistanceMethod(const JointDistanceConfig& config = JointDistanceConfig());

    MethodKind kind() const { return MethodKind::JointDistance; }
    MethodResult run(const std::vector<ModeObservation>& group) const;

    const JointDistanceConfig& config() const { return config_; }

private:
    JointDistanceConfig config_;
};

using DetectionMethod = std::variant<DeviationScoreMethod, TrendFitMethod, JointDistanceMethod>;

MethodKind method_kind(const DetectionMethod& method);

MethodResult run_method(const DetectionMethod& method,
                        const std::vector<ModeObservation>& group);

}  // namespace modalqc
