// NumericSampling_test.cpp
#include "gtest/gtest.h"
#include "NumericSampling.h"
#include "Errors.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

using namespace ipsim;

static const size_t N = 100'000;

static double ks_critical(size_t n) {
    // approximate Kolmogorov-Smirnov critical value for alpha=0.001
    return 1.95 / std::sqrt(n);
}

static Distribution weibull(double shape, double scale) {
    return Distribution::create({Family::WEIBULL, {}}, {shape, scale}, "A->B");
}

// Same law as weibull(shape, scale), but without a closed-form inverse
static Distribution weibullSpline(double shape, double scale) {
    return Distribution::create({Family::SPLINE, {-2.0, 0.0, 3.0}}, {-shape * std::log(scale), shape, 0.0}, "A->B");
}

TEST(NumericSampling, NumericInversionMatchesClosedForm) {
    const auto closed = weibull(1.4, 6.0);
    const auto numeric = weibullSpline(1.4, 6.0);
    for (double h : {1e-4, 0.05, 0.5, 1.0, 3.0, 9.0}) {
        const double expected = closed.inverseCumHazard(h);
        EXPECT_NEAR(invertCumHazard(numeric, h), expected, 1e-9 * expected) << "h=" << h;
        EXPECT_NEAR(invertCumHazard(closed, h), expected, 1e-15 * expected);
    }
    // lower bound is respected
    EXPECT_GE(invertCumHazard(numeric, 0.01, 5.0), 5.0);
    EXPECT_TRUE(std::isinf(invertCumHazard(numeric, std::numeric_limits<double>::infinity())));
    EXPECT_THROW(invertCumHazard(numeric, std::nan("")), SamplingFault);
}

TEST(NumericSampling, BoundedHazardNeverReachesTarget) {
    // pwexp with a zero last rate: H is capped at 1
    const auto d = Distribution::create({Family::PWEXP, {0.0, 2.0}}, {0.5, 0.0}, "A->B");
    EXPECT_TRUE(std::isinf(invertCumHazard(d, 1.5)));
    EXPECT_NEAR(invertCumHazard(d, 0.5), 1.0, 1e-14);
}

TEST(NumericSampling, Quantile) {
    const auto e = Distribution::create({Family::EXPONENTIAL, {}}, {0.25}, "A->B");
    EXPECT_NEAR(quantile(e, 0.5), std::log(2.0) / 0.25, 1e-12);
    EXPECT_DOUBLE_EQ(quantile(e, 0.0), 0.0);
    EXPECT_NEAR(quantile(weibullSpline(0.8, 3.0), 0.9), quantile(weibull(0.8, 3.0), 0.9), 1e-8);
    EXPECT_THROW(quantile(e, 1.0), std::invalid_argument);
    EXPECT_THROW(quantile(e, -0.1), std::invalid_argument);
}

TEST(NumericSampling, TruncatedSamplesFollowConditionalLaw) {
    RngEngine rng(2024);
    const double elapsed = 1.5;
    for (const auto& d : {weibull(1.5, 2.0), weibullSpline(1.5, 2.0)}) {
        const double s0 = d.survival(elapsed);
        std::vector<double> values(N);
        for (size_t i = 0; i < N; ++i) values[i] = sampleTruncated(d, elapsed, rng);
        std::sort(values.begin(), values.end());
        ASSERT_GE(values.front(), 0.0);
        double dist = 0;
        for (size_t i = 0; i < N; ++i) {
            const double F = 1.0 - d.survival(elapsed + values[i]) / s0;
            dist = std::max({dist, std::abs(double(i + 1) / N - F), std::abs(double(i) / N - F)});
        }
        EXPECT_LT(dist, ks_critical(N)) << "closed form: " << d.hasInverse();
    }
}

TEST(NumericSampling, TruncatedZeroRateIsNever) {
    RngEngine rng(5);
    const auto d = Distribution::create({Family::EXPONENTIAL, {}}, {0.0}, "A->B");
    EXPECT_TRUE(std::isinf(sampleTruncated(d, 3.0, rng)));
}

TEST(NumericSampling, TruncatedMemorylessExponential) {
    RngEngine rng(11);
    const auto d = Distribution::create({Family::EXPONENTIAL, {}}, {0.4}, "A->B");
    double sum = 0;
    for (size_t i = 0; i < N; ++i) sum += sampleTruncated(d, 7.0, rng);
    const double sigma_mean = 2.5 / std::sqrt(double(N));
    EXPECT_NEAR(sum / N, 2.5, 5 * sigma_mean);
}

TEST(NumericSampling, DiscreteTimesLandOnStepBoundaries) {
    RngEngine rng(77);
    const double rate = 0.5, step = 0.1;
    const auto d = Distribution::create({Family::EXPONENTIAL, {}}, {rate}, "A->B");
    double sum = 0;
    for (size_t i = 0; i < N; ++i) {
        const double t = sampleDiscrete(d, 0.0, step, 100.0, rng);
        ASSERT_TRUE(std::isfinite(t));
        const double k = t / step;
        ASSERT_NEAR(k, std::round(k), 1e-9);
        ASSERT_GE(k, 1.0);
        sum += t;
    }
    // geometric number of intervals with success probability 1 - exp(-rate*step)
    const double p = -std::expm1(-rate * step);
    const double mean0 = step / p;
    const double sd0 = step * std::sqrt(1.0 - p) / p;
    EXPECT_NEAR(sum / N, mean0, 5 * sd0 / std::sqrt(double(N)));
}

TEST(NumericSampling, DiscreteStopsAtLimit) {
    RngEngine rng(3);
    const auto d = Distribution::create({Family::EXPONENTIAL, {}}, {0.0}, "A->B");
    EXPECT_TRUE(std::isinf(sampleDiscrete(d, 0.0, 0.5, 10.0, rng)));
    EXPECT_THROW(sampleDiscrete(d, 0.0, 0.0, 10.0, rng), std::invalid_argument);
    EXPECT_THROW(sampleDiscrete(d, 0.0, 0.5, std::numeric_limits<double>::infinity(), rng), std::invalid_argument);
}

TEST(NumericSampling, DiscreteApproximatesContinuousLaw) {
    RngEngine rng(8);
    const double step = 0.01;
    const auto d = weibullSpline(1.2, 4.0);
    size_t before = 0;
    for (size_t i = 0; i < N; ++i)
        if (sampleDiscrete(d, 0.0, step, 50.0, rng) <= 4.0 + 1e-9) ++before;
    const double p = d.cdf(4.0);
    EXPECT_NEAR(double(before) / N, p, 5 * std::sqrt(p * (1 - p) / N) + 1e-3);
}
