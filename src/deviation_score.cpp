#include "modalqc/outlier_methods.hpp"

namespace modalqc {

DeviationScoreMethod::DeviationScoreMethod(const DeviationScoreConfig& config)
    : config_(config) {
    if (!(config_.threshold > 0.0)) {
        throw std::invalid_argument("Deviation score threshold must be positive");
    }
}

MethodResult DeviationScoreMethod::run(const std::vector<ModeObservation>& group) const {
    MethodResult result;
    result.method = kind();
    result.ran = true;

    int n = static_cast<int>(group.size());
    result.flags.assign(n, MethodFlag());

    Eigen::VectorXd v(n);
    for (int i = 0; i < n; i++) {
        v(i) = scalar_value(group[i], config_.field);
    }

    if (n < 2) {
        result.warnings.push_back(
            "DeviationScore: fewer than 2 observations, no points flagged");
        return result;
    }

    double mu = sample_mean(v);
    double sigma = sample_std(v);
    if (negligible_spread(sigma, mu)) {
        result.warnings.push_back(
            "DeviationScore: zero standard deviation, no points flagged");
        return result;
    }

    for (int i = 0; i < n; i++) {
        double z = (v(i) - mu) / sigma;
        result.flags[i].metric_value = z;
        result.flags[i].is_outlier = std::abs(z) > config_.threshold;
    }
    return result;
}

}  // namespace modalqc
