#include "modalqc/outlier_methods.hpp"

namespace modalqc {

JointDistanceMethod::JointDistanceMethod(const JointDistanceConfig& config)
    : config_(config) {
    if (!(config_.distance_threshold > 0.0)) {
        throw std::invalid_argument("Joint distance threshold must be positive");
    }
    if (config_.mac_threshold < 0.0 || config_.mac_threshold > 1.0) {
        throw std::invalid_argument("Joint distance MAC threshold must be in [0, 1]");
    }
}

MethodResult JointDistanceMethod::run(const std::vector<ModeObservation>& group) const {
    MethodResult result;
    result.method = kind();
    result.ran = true;

    int n = static_cast<int>(group.size());
    result.flags.assign(n, MethodFlag());
    if (n == 0) return result;

    // Samples as rows: (frequency, mac)
    Eigen::MatrixXd X(n, 2);
    for (int i = 0; i < n; i++) {
        X(i, 0) = group[i].frequency;
        X(i, 1) = group[i].mac_value;
    }
    Eigen::Vector2d mu = X.colwise().mean().transpose();
    Eigen::MatrixXd centered = X.rowwise() - mu.transpose();

    Eigen::Matrix2d cov = Eigen::Matrix2d::Zero();
    if (n > 1) {
        cov = (centered.transpose() * centered) / static_cast<double>(n - 1);
    }

    // Variance floor relative to the magnitude of each dimension
    double var_tol_f = 1e-12 * std::max(1.0, mu(0) * mu(0));
    double var_tol_m = 1e-12 * std::max(1.0, mu(1) * mu(1));
    bool degenerate = (n < 3) || cov(0, 0) <= var_tol_f || cov(1, 1) <= var_tol_m;
    if (!degenerate) {
        double corr = cov(0, 1) / std::sqrt(cov(0, 0) * cov(1, 1));
        degenerate = std::abs(corr) >= 1.0 - 1e-9;
    }

    Eigen::VectorXd d(n);
    if (!degenerate) {
        Eigen::Matrix2d cov_inv = cov.inverse();
        for (int i = 0; i < n; i++) {
            Eigen::Vector2d r = centered.row(i).transpose();
            d(i) = std::sqrt(std::max(0.0, r.dot(cov_inv * r)));
        }
    } else {
        // Dimensions treated independently; a zero-variance dimension adds nothing
        result.used_fallback = true;
        result.warnings.push_back(
            "JointDistance: singular covariance, using standardised Euclidean distance");
        double sf = (cov(0, 0) > var_tol_f) ? std::sqrt(cov(0, 0)) : 0.0;
        double sm = (cov(1, 1) > var_tol_m) ? std::sqrt(cov(1, 1)) : 0.0;
        for (int i = 0; i < n; i++) {
            double zf = (sf > 0.0) ? centered(i, 0) / sf : 0.0;
            double zm = (sm > 0.0) ? centered(i, 1) / sm : 0.0;
            d(i) = std::sqrt(zf * zf + zm * zm);
        }
    }

    for (int i = 0; i < n; i++) {
        result.flags[i].metric_value = d(i);
        result.flags[i].is_outlier = d(i) > config_.distance_threshold ||
                                     group[i].mac_value < config_.mac_threshold;
    }
    return result;
}

}  // namespace modalqc
