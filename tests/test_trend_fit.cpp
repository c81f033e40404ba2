#include <gtest/gtest.h>
#include "modalqc/outlier_methods.hpp"
#include <cmath>
#include <random>

using namespace modalqc;

static std::vector<ModeObservation> series(const std::vector<double>& freqs) {
    std::vector<ModeObservation> g;
    for (size_t i = 0; i < freqs.size(); i++) {
        ModeObservation o;
        o.mode_number = 6;
        o.segment_id = static_cast<int>(i) + 1;
        o.sub_mode_label = "6.1";
        o.frequency = freqs[i];
        o.damping_ratio = 0.02;
        o.mac_value = 0.9;
        g.push_back(o);
    }
    return g;
}

// 30 + 0.05 x - 0.002 x^2 over x = 1..n with +3 Hz at one segment
static std::vector<double> quadratic_with_jump(int n, int jump_segment) {
    std::vector<double> f;
    for (int x = 1; x <= n; x++) {
        f.push_back(30.0 + 0.05 * x - 0.002 * x * x);
    }
    f[jump_segment - 1] += 3.0;
    return f;
}

static void expect_only_flagged(const MethodResult& r, int segment) {
    ASSERT_TRUE(r.ran);
    for (size_t i = 0; i < r.flags.size(); i++) {
        EXPECT_EQ(r.flags[i].is_outlier, static_cast<int>(i) + 1 == segment)
            << "segment " << i + 1;
    }
}

// ---- Insufficient data ----

TEST(TrendFit, TooFewPoints_DoesNotRun) {
    MethodResult r = TrendFitMethod().run(series({25.0, 25.1, 25.2}));
    EXPECT_FALSE(r.ran);
    EXPECT_EQ(r.method, MethodKind::TrendFit);
    EXPECT_TRUE(r.flags.empty());
    EXPECT_EQ(r.failure_reason.rfind("InsufficientData", 0), 0u);
}

TEST(TrendFit, SingleSegment_DoesNotRun) {
    auto g = series({25.0, 25.1, 25.2, 25.3, 25.4, 25.5});
    for (auto& o : g) o.segment_id = 4;
    MethodResult r = TrendFitMethod().run(g);
    EXPECT_FALSE(r.ran);
    EXPECT_THROW(TrendFitMethod().fit(g), InsufficientDataError);
}

TEST(TrendFit, MinimalRunnableSize) {
    // degree 2 leaving one out needs 5 points
    MethodResult r = TrendFitMethod().run(series({25.0, 25.1, 25.0, 25.2}));
    EXPECT_FALSE(r.ran);
    r = TrendFitMethod().run(series({25.0, 25.1, 25.0, 25.2, 25.1}));
    EXPECT_TRUE(r.ran);
    EXPECT_EQ(r.flags.size(), 5u);

    // The full-fit prediction band needs one point fewer
    TrendFitConfig cfg;
    cfg.band = TrendFitConfig::Band::PREDICTION;
    EXPECT_TRUE(TrendFitMethod(cfg).run(series({25.0, 25.1, 25.0, 25.2})).ran);
}

// ---- Detection ----

TEST(TrendFit, QuadraticDrift_FlagsOnlyInjectedJump) {
    MethodResult r = TrendFitMethod().run(series(quadratic_with_jump(20, 10)));
    ASSERT_EQ(r.flags.size(), 20u);
    expect_only_flagged(r, 10);
    // Measured from the trend of the other points, which is exact
    EXPECT_NEAR(r.flags[9].metric_value, 3.0, 1e-6);
}

TEST(TrendFit, JumpAtEdgeSegments) {
    for (int seg : {1, 2, 19, 20}) {
        SCOPED_TRACE("jump at segment " + std::to_string(seg));
        MethodResult r = TrendFitMethod().run(series(quadratic_with_jump(20, seg)));
        expect_only_flagged(r, seg);
        EXPECT_NEAR(r.flags[seg - 1].metric_value, 3.0, 1e-6);
    }
}

TEST(TrendFit, JumpAtFirstOfFiftySegments) {
    MethodResult r = TrendFitMethod().run(series(quadratic_with_jump(50, 1)));
    ASSERT_EQ(r.flags.size(), 50u);
    expect_only_flagged(r, 1);
    EXPECT_NEAR(r.flags[0].metric_value, 3.0, 1e-6);
}

TEST(TrendFit, LastSegmentJumpDoesNotDragNeighbour) {
    std::vector<double> f(10, 25.0);
    f[9] = 30.0;
    TrendFitMethod method;
    MethodResult r = method.run(series(f));
    expect_only_flagged(r, 10);
    EXPECT_NEAR(r.flags[9].metric_value, 5.0, 1e-6);

    TrendBand band = method.fit(series(f));
    EXPECT_NEAR(band.predicted(9), 25.0, 1e-9);
    EXPECT_NEAR(band.deviation(8), 0.0, 1e-12);
}

TEST(TrendFit, ExactPolynomial_NothingFlagged) {
    std::vector<double> f;
    for (int x = 1; x <= 12; x++) {
        f.push_back(40.0 - 0.1 * x + 0.01 * x * x);
    }
    TrendFitMethod method;
    MethodResult r = method.run(series(f));
    ASSERT_TRUE(r.ran);
    EXPECT_EQ(r.num_flagged(), 0);
    TrendBand band = method.fit(series(f));
    EXPECT_NEAR(band.fit.residual_std_error, 0.0, 1e-9);
}

TEST(TrendFit, NoisyStep_FlagsOnlyStep) {
    auto g = series({24.98, 25.01, 25.0, 25.02, 24.99, 25.01, 30.0, 24.98, 25.0, 25.01});
    MethodResult r = TrendFitMethod().run(g);
    expect_only_flagged(r, 7);
    EXPECT_NEAR(r.flags[6].metric_value, 4.9534, 1e-3);
}

TEST(TrendFit, FullFitPredictionBandAbsorbsStep) {
    auto g = series({24.98, 25.01, 25.0, 25.02, 24.99, 25.01, 30.0, 24.98, 25.0, 25.01});
    TrendFitConfig cfg;
    cfg.band = TrendFitConfig::Band::PREDICTION;
    TrendFitMethod method(cfg);
    TrendBand band = method.fit(g);
    EXPECT_NEAR(band.t_critical, 2.364624, 1e-5);
    for (int i = 0; i < 10; i++) {
        EXPECT_NEAR(band.predicted(i), band.fit.fitted(i), 1e-12);
    }
    EXPECT_EQ(method.run(g).num_flagged(), 0);
}

TEST(TrendFit, CleanNoiseFalseAlarmRate) {
    std::mt19937 rng(20240611);
    std::normal_distribution<double> noise(25.0, 0.02);
    TrendFitMethod method;
    int flagged = 0;
    int total = 0;
    for (int k = 0; k < 200; k++) {
        std::vector<double> f(20);
        for (auto& v : f) v = noise(rng);
        MethodResult r = method.run(series(f));
        ASSERT_TRUE(r.ran);
        flagged += r.num_flagged();
        total += static_cast<int>(f.size());
    }
    double rate = static_cast<double>(flagged) / total;
    EXPECT_GT(rate, 0.02);
    EXPECT_LT(rate, 0.08);
}

TEST(TrendFit, BandUsesStudentT) {
    auto g = series({25.0, 25.1, 24.9, 25.05, 24.95, 25.0, 25.1, 24.9, 25.0, 25.02});
    TrendBand band = TrendFitMethod().fit(g);
    EXPECT_EQ(band.fit.dof, 7);
    // One point left out of each fit
    EXPECT_NEAR(band.t_critical, 2.446912, 1e-5);
}

TEST(TrendFit, LinearDegree) {
    std::vector<double> f;
    for (int x = 1; x <= 8; x++) f.push_back(10.0 + 0.5 * x);
    f[0] -= 2.0;
    TrendFitConfig cfg;
    cfg.polynomial_degree = 1;
    MethodResult r = TrendFitMethod(cfg).run(series(f));
    expect_only_flagged(r, 1);
    EXPECT_NEAR(r.flags[0].metric_value, -2.0, 1e-6);
}

TEST(TrendFit, InvalidConfig_Throws) {
    TrendFitConfig cfg;
    cfg.polynomial_degree = -1;
    EXPECT_THROW(TrendFitMethod m(cfg), std::invalid_argument);
    cfg = TrendFitConfig();
    cfg.confidence_level = 1.0;
    EXPECT_THROW(TrendFitMethod m(cfg), std::invalid_argument);
}
