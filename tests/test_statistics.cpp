#include <gtest/gtest.h>
#include "modalqc/statistics.hpp"
#include <cmath>

using namespace modalqc;

TEST(Statistics, MeanAndStd) {
    Eigen::VectorXd v(4);
    v << 2.0, 4.0, 4.0, 6.0;
    EXPECT_DOUBLE_EQ(sample_mean(v), 4.0);
    // sum of squares 8, n-1 = 3
    EXPECT_NEAR(sample_std(v), std::sqrt(8.0 / 3.0), 1e-14);
}

TEST(Statistics, StdOfShortVectors) {
    Eigen::VectorXd one(1);
    one << 3.0;
    EXPECT_DOUBLE_EQ(sample_std(one), 0.0);
    EXPECT_DOUBLE_EQ(sample_std(Eigen::VectorXd()), 0.0);
    EXPECT_DOUBLE_EQ(sample_mean(Eigen::VectorXd()), 0.0);
}

TEST(Statistics, NegligibleSpread) {
    EXPECT_TRUE(negligible_spread(0.0, 25.0));
    EXPECT_TRUE(negligible_spread(3.8e-15, 25.01));
    EXPECT_FALSE(negligible_spread(1e-6, 25.0));
    // Absolute floor near zero mean
    EXPECT_TRUE(negligible_spread(5e-13, 0.0));
    EXPECT_FALSE(negligible_spread(1e-11, 0.0));
    EXPECT_TRUE(negligible_spread(std::nan(""), 1.0));
}

TEST(Statistics, StudentT_KnownValues) {
    EXPECT_NEAR(student_t_critical(0.95, 7), 2.364624, 1e-5);
    EXPECT_NEAR(student_t_critical(0.95, 17), 2.109816, 1e-5);
    EXPECT_NEAR(student_t_critical(0.99, 10), 3.169273, 1e-5);
    // Approaches the normal quantile for large dof
    EXPECT_NEAR(student_t_critical(0.95, 1e6), 1.959964, 1e-4);
}

TEST(Statistics, StudentT_InvalidArgs) {
    EXPECT_THROW(student_t_critical(1.0, 5), std::invalid_argument);
    EXPECT_THROW(student_t_critical(0.0, 5), std::invalid_argument);
    EXPECT_THROW(student_t_critical(0.95, 0), std::invalid_argument);
}

TEST(Statistics, PolynomialFit_ExactQuadratic) {
    int n = 12;
    Eigen::VectorXd x(n), y(n);
    for (int i = 0; i < n; i++) {
        x(i) = i + 1;
        y(i) = 3.0 - 0.5 * x(i) + 0.25 * x(i) * x(i);
    }
    PolynomialFit fit = fit_polynomial(x, y, 2);
    EXPECT_EQ(fit.degree, 2);
    EXPECT_EQ(fit.dof, 9);
    EXPECT_NEAR(fit.residual_std_error, 0.0, 1e-10);
    for (int i = 0; i < n; i++) {
        EXPECT_NEAR(fit.fitted(i), y(i), 1e-10);
    }
    EXPECT_NEAR(fit.evaluate(20.0), 3.0 - 10.0 + 100.0, 1e-8);
}

TEST(Statistics, PolynomialFit_LeverageSumsToParameters) {
    int n = 9;
    Eigen::VectorXd x(n), y(n);
    for (int i = 0; i < n; i++) {
        x(i) = 2.0 * i;
        y(i) = std::sin(0.3 * i);
    }
    PolynomialFit fit = fit_polynomial(x, y, 2);
    double trace = 0.0;
    for (int i = 0; i < n; i++) {
        double h = fit.leverage(i);
        EXPECT_GT(h, 0.0);
        EXPECT_LT(h, 1.0);
        trace += h;
    }
    EXPECT_NEAR(trace, 3.0, 1e-10);
}

TEST(Statistics, PolynomialFit_LeverageAtMatchesDesignRows) {
    int n = 10;
    Eigen::VectorXd x(n), y(n);
    for (int i = 0; i < n; i++) {
        x(i) = i + 1;
        y(i) = std::cos(0.4 * i);
    }
    PolynomialFit fit = fit_polynomial(x, y, 2);
    for (int i = 0; i < n; i++) {
        EXPECT_NEAR(fit.leverage_at(x(i)), fit.leverage(i), 1e-12);
        EXPECT_NEAR(fit.basis(x(i)).dot(fit.coefficients), fit.fitted(i), 1e-12);
    }
    // Extrapolation carries more leverage than any fitted point
    EXPECT_GT(fit.leverage_at(15.0), fit.leverage(n - 1));
}

TEST(Statistics, PolynomialFit_Underdetermined_Throws) {
    Eigen::VectorXd x(3), y(3);
    x << 1, 2, 3;
    y << 1, 4, 9;
    EXPECT_THROW(fit_polynomial(x, y, 2), InsufficientDataError);
}

TEST(Statistics, PolynomialFit_RepeatedX_Throws) {
    Eigen::VectorXd x(6), y(6);
    x << 5, 5, 5, 5, 5, 5;
    y << 1, 2, 3, 4, 5, 6;
    EXPECT_THROW(fit_polynomial(x, y, 1), InsufficientDataError);
}

TEST(Statistics, PolynomialFit_InvalidArgs) {
    Eigen::VectorXd x(5), y(4);
    x.setLinSpaced(5, 0, 4);
    y.setZero();
    EXPECT_THROW(fit_polynomial(x, y, 1), std::invalid_argument);
    Eigen::VectorXd y5 = Eigen::VectorXd::Zero(5);
    EXPECT_THROW(fit_polynomial(x, y5, -1), std::invalid_argument);
}
