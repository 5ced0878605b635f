// Sampler_test.cpp
#include "gtest/gtest.h"
#include "Sampler.h"
#include <cmath>
#include <set>

using namespace ipsim;

TEST(LatinHypercubeSampler, OneDrawPerStratum) {
    const int n = 50;
    LatinHypercubeSampler sampler({Parameter("a", 0.0, 1.0), Parameter("b", -2.0, 2.0), Parameter("c", 3.0, 3.0)},
                                  RngEngine(99));
    const auto draws = sampler.sampleBlock(n);
    ASSERT_EQ(draws.size(), static_cast<size_t>(n));
    EXPECT_EQ(sampler.parameterNames(), (std::vector<std::string>{"a", "b", "c"}));

    std::set<int> strataA, strataB;
    for (int i = 0; i < n; ++i) {
        EXPECT_EQ(draws[i].sample, i);
        ASSERT_EQ(draws[i].values.size(), 3u);
        strataA.insert(static_cast<int>(std::floor(draws[i].values[0] * n)));
        strataB.insert(static_cast<int>(std::floor((draws[i].values[1] + 2.0) / 4.0 * n)));
        EXPECT_DOUBLE_EQ(draws[i].values[2], 3.0);
    }
    EXPECT_EQ(strataA.size(), static_cast<size_t>(n));
    EXPECT_EQ(strataB.size(), static_cast<size_t>(n));
}

TEST(LatinHypercubeSampler, UnscrambledStrataAreInOrder) {
    LatinHypercubeSampler sampler({Parameter("a", 0.0, 10.0)}, RngEngine(1), false);
    const auto draws = sampler.sampleBlock(10);
    for (int i = 0; i < 10; ++i) {
        EXPECT_GE(draws[i].values[0], i);
        EXPECT_LT(draws[i].values[0], i + 1);
    }
}

TEST(LatinHypercubeSampler, SameSeedSameDraws) {
    const std::vector<Parameter> params = {Parameter("a", 0.0, 1.0), Parameter("b", 5.0, 6.0)};
    LatinHypercubeSampler s1(params, RngEngine(7));
    LatinHypercubeSampler s2(params, RngEngine(7));
    const auto d1 = s1.sampleBlock(20);
    const auto d2 = s2.sampleBlock(20);
    for (size_t i = 0; i < d1.size(); ++i) EXPECT_EQ(d1[i].values, d2[i].values);
}

TEST(Sampler, Validation) {
    EXPECT_THROW(Parameter("2fast", 0.0, 1.0), ConfigurationError);
    EXPECT_THROW(Parameter("rate", 1.0, 0.0), ConfigurationError);
    EXPECT_THROW(LatinHypercubeSampler({Parameter("a", 0, 1), Parameter("a", 0, 2)}, RngEngine(1)),
                 ConfigurationError);
    LatinHypercubeSampler empty({}, RngEngine(1));
    EXPECT_THROW(empty.sampleBlock(0), ConfigurationError);
    EXPECT_EQ(empty.sampleBlock(3).size(), 3u);

    EXPECT_THROW(FixedDrawSampler({"a", "b"}, {{1.0, 2.0}, {3.0}}), ConfigurationError);
    EXPECT_THROW(FixedDrawSampler({"a", "a"}, {}), ConfigurationError);
}
