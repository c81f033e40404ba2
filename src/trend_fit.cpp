#include "modalqc/outlier_methods.hpp"
#include <algorithm>

namespace modalqc {

// Signed distance of y outside [centre - hw, centre + hw]; round-off
// residuals of exact fits are not read as excursions
static double band_excess(double y, double centre, double hw) {
    double tol = 1e-9 * std::max(1.0, std::abs(y));
    double r = y - centre;
    if (r > hw + tol) return r - hw;
    if (r < -hw - tol) return r + hw;
    return 0.0;
}

TrendFitMethod::TrendFitMethod(const TrendFitConfig& config)
    : config_(config) {
    if (config_.polynomial_degree < 0) {
        throw std::invalid_argument("Trend fit polynomial degree must be non-negative");
    }
    if (!(config_.confidence_level > 0.0 && config_.confidence_level < 1.0)) {
        throw std::invalid_argument("Trend fit confidence level must be in (0, 1)");
    }
}

TrendBand TrendFitMethod::fit(const std::vector<ModeObservation>& group) const {
    int n = static_cast<int>(group.size());

    TrendBand band;
    band.x.resize(n);
    band.observed.resize(n);
    for (int i = 0; i < n; i++) {
        band.x(i) = static_cast<double>(group[i].segment_id);
        band.observed(i) = scalar_value(group[i], config_.field);
    }

    band.fit = fit_polynomial(band.x, band.observed, config_.polynomial_degree);
    const PolynomialFit& f = band.fit;
    band.predicted.resize(n);
    band.half_width.resize(n);
    band.deviation.resize(n);

    if (config_.band == TrendFitConfig::Band::PREDICTION) {
        band.t_critical = student_t_critical(config_.confidence_level, f.dof);
        double s = f.residual_std_error;
        for (int i = 0; i < n; i++) {
            double h = std::max(0.0, f.leverage(i));
            band.predicted(i) = f.fitted(i);
            band.half_width(i) = band.t_critical * s * std::sqrt(1.0 + h);
            band.deviation(i) = band_excess(band.observed(i), band.predicted(i),
                                            band.half_width(i));
        }
        return band;
    }

    // Deleted-residual pass: one observation fewer per fit
    int dof = f.dof - 1;
    if (dof < 1) {
        throw InsufficientDataError(
            "Leave-one-out band of degree " + std::to_string(f.degree) + " needs more than " +
            std::to_string(f.degree + 2) + " points, got " + std::to_string(n));
    }
    band.t_critical = student_t_critical(config_.confidence_level, dof);
    double ssr = f.residuals.squaredNorm();

    std::vector<int> flagged;
    for (int i = 0; i < n; i++) {
        double one_minus_h = 1.0 - f.leverage(i);
        if (one_minus_h <= 1e-12) {
            // The point alone determines the fit there
            band.predicted(i) = f.fitted(i);
            band.half_width(i) = std::numeric_limits<double>::infinity();
            band.deviation(i) = 0.0;
            continue;
        }
        double e = f.residuals(i);
        double s2 = std::max(0.0, (ssr - e * e / one_minus_h) / dof);
        band.predicted(i) = band.observed(i) - e / one_minus_h;
        band.half_width(i) = band.t_critical * std::sqrt(s2 / one_minus_h);
        band.deviation(i) = band_excess(band.observed(i), band.predicted(i),
                                        band.half_width(i));
        if (band.deviation(i) != 0.0) flagged.push_back(i);
    }
    if (flagged.empty()) return band;

    // Confirm against the fit of the unflagged points
    int m = n - static_cast<int>(flagged.size());
    Eigen::VectorXd xs(m), ys(m);
    std::vector<bool> is_flagged(n, false);
    for (int i : flagged) is_flagged[i] = true;
    for (int i = 0, k = 0; i < n; i++) {
        if (is_flagged[i]) continue;
        xs(k) = band.x(i);
        ys(k) = band.observed(i);
        k++;
    }

    PolynomialFit clean;
    try {
        clean = fit_polynomial(xs, ys, config_.polynomial_degree);
    } catch (const InsufficientDataError&) {
        // Too many flags to refit; first-pass verdicts stand
        return band;
    }
    double t_clean = student_t_critical(config_.confidence_level, clean.dof);
    for (int i : flagged) {
        double h = std::max(0.0, clean.leverage_at(band.x(i)));
        band.predicted(i) = clean.evaluate(band.x(i));
        band.half_width(i) = t_clean * clean.residual_std_error * std::sqrt(1.0 + h);
        band.deviation(i) = band_excess(band.observed(i), band.predicted(i),
                                        band.half_width(i));
    }
    return band;
}

MethodResult TrendFitMethod::run(const std::vector<ModeObservation>& group) const {
    MethodResult result;
    result.method = kind();

    TrendBand band;
    try {
        band = fit(group);
    } catch (const InsufficientDataError& e) {
        result.ran = false;
        result.failure_reason = std::string("InsufficientData: ") + e.what();
        return result;
    }

    result.ran = true;
    int n = static_cast<int>(group.size());
    result.flags.resize(n);
    for (int i = 0; i < n; i++) {
        result.flags[i].metric_value = band.deviation(i);
        result.flags[i].is_outlier = band.deviation(i) != 0.0;
    }
    return result;
}

}  // namespace modalqc
