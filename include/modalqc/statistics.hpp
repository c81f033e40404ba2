#pragma once

#include "modalqc/common.hpp"

namespace modalqc {

double sample_mean(const Eigen::VectorXd& v);

// Sample standard deviation with n-1 denominator; 0 when n < 2
double sample_std(const Eigen::VectorXd& v);

// True when sigma is round-off relative to the magnitude of the mean.
// Identical values rarely give sigma == 0 exactly once the mean is rounded.
bool negligible_spread(double sigma, double mu);

// Two-sided Student-t critical value: quantile at (1 + confidence) / 2
// with dof degrees of freedom. confidence in (0, 1), dof > 0.
double student_t_critical(double confidence, double dof);

// Least-squares polynomial fit y ~ sum_k c_k * u^k with u = (x - x_center) / x_scale.
// Centering and scaling keep the Vandermonde matrix well conditioned.
struct PolynomialFit {
    int degree = 0;
    double x_center = 0.0;
    double x_scale = 1.0;
    Eigen::VectorXd coefficients;      // in scaled u, ascending powers
    Eigen::MatrixXd design;            // n x (degree+1) Vandermonde in u
    Eigen::MatrixXd gram_inverse;      // (X^T X)^-1
    Eigen::VectorXd fitted;
    Eigen::VectorXd residuals;
    double residual_std_error = 0.0;   // sqrt(SSR / dof)
    int dof = 0;                       // n - (degree+1)

    double evaluate(double x) const;

    // Design row [1, u, u^2, ...] for an arbitrary abscissa
    Eigen::VectorXd basis(double x) const;

    // Leverage x0^T (X^T X)^-1 x0 of the i-th design row
    double leverage(int i) const;

    // Same quadratic form for a point that was not part of the fit
    double leverage_at(double x) const;
};

// Throws InsufficientDataError when n <= degree+1 or the design matrix is
// rank deficient (e.g. repeated x values). std::invalid_argument for
// mismatched sizes or a negative degree.
PolynomialFit fit_polynomial(const Eigen::VectorXd& x, const Eigen::VectorXd& y, int degree);

}  // namespace modalqc
