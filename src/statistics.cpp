#include "modalqc/statistics.hpp"
#include <boost/math/distributions/students_t.hpp>
#include <algorithm>

namespace modalqc {

double sample_mean(const Eigen::VectorXd& v) {
    if (v.size() == 0) return 0.0;
    return v.mean();
}

double sample_std(const Eigen::VectorXd& v) {
    int n = static_cast<int>(v.size());
    if (n < 2) return 0.0;
    double mu = v.mean();
    double ss = (v.array() - mu).square().sum();
    return std::sqrt(ss / (n - 1));
}

bool negligible_spread(double sigma, double mu) {
    return !(sigma > 1e-12 * std::max(1.0, std::abs(mu)));
}

double student_t_critical(double confidence, double dof) {
    if (!(confidence > 0.0 && confidence < 1.0)) {
        throw std::invalid_argument("Confidence level must be in (0, 1)");
    }
    if (!(dof > 0.0)) {
        throw std::invalid_argument("Student-t degrees of freedom must be positive");
    }
    boost::math::students_t dist(dof);
    return boost::math::quantile(dist, 0.5 * (1.0 + confidence));
}

double PolynomialFit::evaluate(double x) const {
    double u = (x - x_center) / x_scale;
    // Horner
    double y = 0.0;
    for (int k = degree; k >= 0; k--) {
        y = y * u + coefficients(k);
    }
    return y;
}

Eigen::VectorXd PolynomialFit::basis(double x) const {
    Eigen::VectorXd row(degree + 1);
    double u = (x - x_center) / x_scale;
    double pw = 1.0;
    for (int k = 0; k <= degree; k++) {
        row(k) = pw;
        pw *= u;
    }
    return row;
}

double PolynomialFit::leverage(int i) const {
    Eigen::VectorXd row = design.row(i).transpose();
    return row.dot(gram_inverse * row);
}

double PolynomialFit::leverage_at(double x) const {
    Eigen::VectorXd row = basis(x);
    return row.dot(gram_inverse * row);
}

PolynomialFit fit_polynomial(const Eigen::VectorXd& x, const Eigen::VectorXd& y, int degree) {
    if (x.size() != y.size()) {
        throw std::invalid_argument("fit_polynomial: x and y have different lengths");
    }
    if (degree < 0) {
        throw std::invalid_argument("fit_polynomial: degree must be non-negative");
    }
    int n = static_cast<int>(x.size());
    int p = degree + 1;
    if (n <= p) {
        throw InsufficientDataError(
            "Polynomial of degree " + std::to_string(degree) + " needs more than " +
            std::to_string(p) + " points, got " + std::to_string(n));
    }

    PolynomialFit fit;
    fit.degree = degree;
    fit.dof = n - p;

    double x_min = x.minCoeff();
    double x_max = x.maxCoeff();
    fit.x_center = 0.5 * (x_min + x_max);
    fit.x_scale = 0.5 * (x_max - x_min);
    if (fit.x_scale <= 0.0) fit.x_scale = 1.0;

    fit.design.resize(n, p);
    for (int i = 0; i < n; i++) {
        double u = (x(i) - fit.x_center) / fit.x_scale;
        double pw = 1.0;
        for (int k = 0; k < p; k++) {
            fit.design(i, k) = pw;
            pw *= u;
        }
    }

    Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(fit.design);
    qr.setThreshold(1e-10);
    if (qr.rank() < p) {
        throw InsufficientDataError(
            "Design matrix is rank deficient (rank " + std::to_string(qr.rank()) +
            " < " + std::to_string(p) + ")");
    }

    fit.coefficients = qr.solve(y);
    fit.fitted = fit.design * fit.coefficients;
    fit.residuals = y - fit.fitted;
    fit.residual_std_error = std::sqrt(fit.residuals.squaredNorm() / fit.dof);

    Eigen::MatrixXd gram = fit.design.transpose() * fit.design;
    fit.gram_inverse = gram.ldlt().solve(Eigen::MatrixXd::Identity(p, p));

    return fit;
}

}  // namespace modalqc
