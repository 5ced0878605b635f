// RngEngine_test.cpp
#include "gtest/gtest.h"
#include "RngEngine.h"
#include <algorithm>
#include <cmath>
#include <set>
#include <vector>
#include <boost/math/distributions.hpp>

using namespace ipsim;

static const size_t N = 1'000'000;

static double ks_critical(size_t n) {
    // approximate Kolmogorov-Smirnov critical value for alpha=0.01
    return 1.63 / std::sqrt(n);
}

TEST(RngEngine, Uniform) {
    RngEngine rng(420);
    double mean0 = 0.5;
    double var0 = 1.0 / 12.0;
    double sigma_mean = std::sqrt(var0 / N);
    std::vector<double> values(N);
    for (size_t i = 0; i < N; ++i) {
        values[i] = rng.uniform();
    }
    double sum = 0, sum2 = 0;
    for (auto& x : values) {
        sum += x;
        sum2 += x * x;
    }
    double mean = sum / N;
    double var = sum2 / N - mean * mean;
    EXPECT_NEAR(mean, mean0, 5*sigma_mean);
    EXPECT_NEAR(var/var0, 1.0, 0.10);
    // KS test
    std::sort(values.begin(), values.end());
    double d = 0;
    for (size_t i = 0; i < N; ++i) {
        double F_emp = double(i + 1) / N;
        double F_theo = values[i];
        d = std::max(d, std::abs(F_emp - F_theo));
    }
    EXPECT_LT(d, ks_critical(N));
}

TEST(RngEngine, UniformPositiveNeverZero) {
    RngEngine rng(7);
    for (size_t i = 0; i < N; ++i) {
        const double u = rng.uniformPositive();
        ASSERT_GT(u, 0.0);
        ASSERT_LE(u, 1.0);
    }
}

TEST(RngEngine, Normal) {
    RngEngine rng(420);
    for (double mu : {-3.0, 0.0, 2.5}) {
        for (double sigma : {0.5, 1.0, 4.0}) {
            std::vector<double> values;
            values.reserve(N);
            for (size_t i = 0; i < N; ++i) {
                values.push_back(rng.normal(mu, sigma));
            }
            double sum = 0, sum2 = 0;
            for (auto& x : values) {
                sum += x;
                sum2 += x * x;
            }
            double mean = sum / N;
            double var = sum2 / N - mean * mean;
            double sigma_mean = sigma / std::sqrt(N);
            EXPECT_NEAR(mean, mu, 5*sigma_mean) << " μ=" << mu << " σ=" << sigma;
            EXPECT_NEAR(var/(sigma*sigma), 1.0, 0.10) << " μ=" << mu << " σ=" << sigma;
            // KS test
            std::sort(values.begin(), values.end());
            double d = 0;
            for (size_t i = 0; i < N; ++i) {
                double F_emp = double(i + 1) / N;
                double z = (values[i] - mu) / sigma;
                double F_theo = 0.5 * (1 + std::erf(z / std::sqrt(2)));
                d = std::max(d, std::abs(F_emp - F_theo));
            }
            EXPECT_LT(d, ks_critical(N)) << "Normal KS failed at μ=" << mu << " σ=" << sigma;
        }
    }
}

TEST(RngEngine, Gamma) {
    RngEngine rng(420);
    for (double alpha : {0.5, 1.0, 2.0, 7.5, 50.0}) {
        for (double theta : {0.5, 1.0, 3.0}) {
            std::vector<double> values;
            values.reserve(N);
            for (size_t i = 0; i < N; ++i) {
                values.push_back(rng.gamma(alpha, theta));
            }
            double sum = 0, sum2 = 0;
            for (auto& x : values) {
                sum += x;
                sum2 += x * x;
            }
            double mean0 = alpha * theta;
            double var0 = alpha * theta * theta;
            double mean = sum / N;
            double var = sum2 / N - mean * mean;
            double sigma_mean = std::sqrt(var0 / N);
            EXPECT_NEAR(mean, mean0, 5*sigma_mean) << " α=" << alpha << " θ=" << theta;
            EXPECT_NEAR(var/var0, 1.0, 0.15) << " α=" << alpha << " θ=" << theta;
            // KS test
            std::sort(values.begin(), values.end());
            double d = 0;
            for (size_t i = 0; i < N; ++i) {
                double F_emp = double(i + 1) / N;
                double F_theo = boost::math::gamma_p(alpha, values[i] / theta);
                d = std::max(d, std::abs(F_emp - F_theo));
            }
            EXPECT_LT(d, ks_critical(N)) << "Gamma KS failed at α=" << alpha << " θ=" << theta;
        }
    }
}

TEST(RngEngine, StandardExponential) {
    RngEngine rng(99);
    std::vector<double> values(N);
    for (size_t i = 0; i < N; ++i) values[i] = rng.standardExponential();
    std::sort(values.begin(), values.end());
    double d = 0;
    for (size_t i = 0; i < N; ++i) {
        double F_emp = double(i + 1) / N;
        double F_theo = -std::expm1(-values[i]);
        d = std::max(d, std::abs(F_emp - F_theo));
    }
    EXPECT_GE(values.front(), 0.0);
    EXPECT_LT(d, ks_critical(N));
}

TEST(RngEngine, ReplicateSeedIsDeterministicAndDistinct) {
    EXPECT_EQ(RngEngine::replicateSeed(12345, 1, 2, 3), RngEngine::replicateSeed(12345, 1, 2, 3));

    std::set<uint64_t> seeds;
    for (int strategy = 0; strategy < 4; ++strategy)
        for (int patient = 0; patient < 50; ++patient)
            for (int sample = 0; sample < 50; ++sample)
                seeds.insert(RngEngine::replicateSeed(12345, strategy, patient, sample));
    EXPECT_EQ(seeds.size(), 4u * 50u * 50u);

    // swapping key components must give a different stream
    EXPECT_NE(RngEngine::replicateSeed(1, 2, 3, 4), RngEngine::replicateSeed(1, 3, 2, 4));
    EXPECT_NE(RngEngine::replicateSeed(1, 2, 3, 4), RngEngine::replicateSeed(2, 2, 3, 4));
}

TEST(RngEngine, SameSeedSameStream) {
    RngEngine a(RngEngine::replicateSeed(5, 0, 0, 0));
    RngEngine b(RngEngine::replicateSeed(5, 0, 0, 0));
    for (int i = 0; i < 1000; ++i) ASSERT_EQ(a.nextUInt32(), b.nextUInt32());
}
