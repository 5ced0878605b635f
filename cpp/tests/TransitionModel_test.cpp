// TransitionModel_test.cpp
#include "gtest/gtest.h"
#include "TransitionModel.h"
#include "Errors.h"
#include <cmath>

using namespace ipsim;

namespace {
    const std::vector<std::string> STATES = {"Healthy", "Sick", "Dead"};

    TransitionSpec exponential(const std::string& from, const std::string& to, const std::string& rate) {
        return {from, to, {Family::EXPONENTIAL, {}}, {rate}};
    }

    std::vector<TransitionSpec> illnessDeath() {
        return {
            exponential("Healthy", "Sick", "0.3 * (1 - 0.5 * treat)"),
            exponential("Healthy", "Dead", "0.1"),
            {"Sick", "Dead", {Family::WEIBULL, {}}, {"1.2", "8"}},
        };
    }
}

TEST(TransitionModel, ClockAndMethodNames) {
    EXPECT_EQ(clockFromName("reset"), Clock::RESET);
    EXPECT_EQ(clockFromName("Forward"), Clock::FORWARD);
    EXPECT_EQ(clockFromName("MIXED"), Clock::MIXED);
    EXPECT_THROW(clockFromName("wall"), ConfigurationError);
    EXPECT_EQ(samplingMethodFromName("invcdf"), SamplingMethod::INVERSE_CDF);
    EXPECT_EQ(samplingMethodFromName("discrete"), SamplingMethod::DISCRETE);
    EXPECT_THROW(samplingMethodFromName("rejection"), ConfigurationError);
}

TEST(TransitionModel, BindsExpressionsPerReplicate) {
    const VariableLayout layout({"treat", "age"});
    const TransitionModel model(STATES, "Healthy", illnessDeath(), layout, {});
    EXPECT_EQ(model.graph().edgeLabel(2), "Sick->Dead");

    std::vector<Distribution> bound;
    model.bind({0.0, 60.0}, bound);
    ASSERT_EQ(bound.size(), 3u);
    EXPECT_NEAR(bound[0].cumHazard(1.0), 0.3, 1e-14);
    EXPECT_EQ(bound[2].family(), Family::WEIBULL);

    model.bind({1.0, 60.0}, bound);
    EXPECT_NEAR(bound[0].cumHazard(1.0), 0.15, 1e-14);
}

TEST(TransitionModel, CopiesEvaluateIndependently) {
    const VariableLayout layout({"treat", "age"});
    const TransitionModel model(STATES, "Healthy", illnessDeath(), layout, {});
    const TransitionModel copy(model);
    std::vector<Distribution> a, b;
    model.bind({1.0, 0.0}, a);
    copy.bind({0.0, 0.0}, b);
    EXPECT_NEAR(a[0].cumHazard(1.0), 0.15, 1e-14);
    EXPECT_NEAR(b[0].cumHazard(1.0), 0.3, 1e-14);
    EXPECT_EQ(&model.graph(), &copy.graph());
}

TEST(TransitionModel, ArityMismatchIsParameterError) {
    auto transitions = illnessDeath();
    transitions[2].parameters = {"1.2"};
    try {
        TransitionModel(STATES, "Healthy", transitions, VariableLayout({"treat"}), {});
        FAIL() << "wrong arity accepted";
    } catch (const ParameterError& e) {
        EXPECT_EQ(e.edge(), "Sick->Dead");
    }
}

TEST(TransitionModel, UnknownVariableNamesTheTransition) {
    auto transitions = illnessDeath();
    transitions[1].parameters = {"0.1 * smoker"};
    try {
        TransitionModel(STATES, "Healthy", transitions, VariableLayout({"treat"}), {});
        FAIL() << "unknown variable accepted";
    } catch (const ConfigurationError& e) {
        EXPECT_NE(std::string(e.what()).find("Healthy->Dead"), std::string::npos) << e.what();
    }
}

TEST(TransitionModel, UnknownStateIsConfigurationError) {
    auto transitions = illnessDeath();
    transitions.push_back(exponential("Sick", "Recovered", "0.1"));
    EXPECT_THROW(TransitionModel(STATES, "Healthy", transitions, VariableLayout({"treat"}), {}),
                 ConfigurationError);
    EXPECT_THROW(TransitionModel(STATES, "Nowhere", illnessDeath(), VariableLayout({"treat"}), {}),
                 ConfigurationError);
}

TEST(TransitionModel, SupportViolationAtBindNamesTheEdge) {
    auto transitions = illnessDeath();
    transitions[2].parameters = {"1.2", "8 - age"};
    const TransitionModel model(STATES, "Healthy", transitions, VariableLayout({"treat", "age"}), {});
    std::vector<Distribution> bound;
    EXPECT_NO_THROW(model.bind({0.0, 2.0}, bound));
    try {
        model.bind({0.0, 10.0}, bound);
        FAIL() << "negative scale accepted";
    } catch (const ParameterError& e) {
        EXPECT_EQ(e.edge(), "Sick->Dead");
    }
}

TEST(TransitionModel, OptionValidation) {
    const VariableLayout layout({"treat"});
    ModelOptions discrete;
    discrete.method = SamplingMethod::DISCRETE;
    discrete.step = 0.0;
    EXPECT_THROW(TransitionModel(STATES, "Healthy", illnessDeath(), layout, discrete), ConfigurationError);

    ModelOptions retries;
    retries.maxRetries = 0;
    EXPECT_THROW(TransitionModel(STATES, "Healthy", illnessDeath(), layout, retries), ConfigurationError);

    ModelOptions mixed;
    mixed.clock = Clock::MIXED;
    EXPECT_THROW(TransitionModel(STATES, "Healthy", illnessDeath(), layout, mixed), ConfigurationError);
    mixed.resetStates = {"Limbo"};
    EXPECT_THROW(TransitionModel(STATES, "Healthy", illnessDeath(), layout, mixed), ConfigurationError);
}

TEST(TransitionModel, ClockResetStates) {
    const VariableLayout layout({"treat"});
    ModelOptions options;
    const TransitionModel reset(STATES, "Healthy", illnessDeath(), layout, options);
    EXPECT_TRUE(reset.resetsClock(0));
    EXPECT_TRUE(reset.resetsClock(1));

    options.clock = Clock::FORWARD;
    const TransitionModel forward(STATES, "Healthy", illnessDeath(), layout, options);
    EXPECT_FALSE(forward.resetsClock(1));

    options.clock = Clock::MIXED;
    options.resetStates = {"Sick"};
    const TransitionModel mixed(STATES, "Healthy", illnessDeath(), layout, options);
    EXPECT_FALSE(mixed.resetsClock(0));
    EXPECT_TRUE(mixed.resetsClock(1));
}

TEST(TransitionModel, SampleTimesAlignWithOutgoingEdges) {
    auto transitions = illnessDeath();
    transitions[1].parameters = {"0"};
    const TransitionModel model(STATES, "Healthy", transitions, VariableLayout({"treat"}), {});
    std::vector<Distribution> bound;
    model.bind({0.0}, bound);

    RngEngine rng(1);
    std::vector<double> times;
    model.sampleTimes(bound, 0, 0.0, 10.0, rng, times);
    ASSERT_EQ(times.size(), 2u);
    EXPECT_TRUE(std::isfinite(times[0]));
    EXPECT_GT(times[0], 0.0);
    EXPECT_TRUE(std::isinf(times[1]));

    model.sampleTimes(bound, 1, 2.0, 10.0, rng, times);
    ASSERT_EQ(times.size(), 1u);
    EXPECT_GE(times[0], 0.0);
}

TEST(TransitionModel, UnusableDrawsBecomeSamplingFault) {
    // gamma survival underflows this far out, so no truncated draw is possible
    std::vector<TransitionSpec> transitions = {
        {"Healthy", "Dead", {Family::GAMMA, {}}, {"2", "1"}},
    };
    ModelOptions options;
    options.clock = Clock::FORWARD;
    options.maxRetries = 3;
    const TransitionModel model({"Healthy", "Dead"}, "Healthy", transitions, VariableLayout({"x"}), options);
    std::vector<Distribution> bound;
    model.bind({0.0}, bound);

    RngEngine rng(1);
    std::vector<double> times;
    try {
        model.sampleTimes(bound, 0, 1e4, 1.0, rng, times);
        FAIL() << "sampling past the survival support succeeded";
    } catch (const SamplingFault& e) {
        const std::string what = e.what();
        EXPECT_NE(what.find("Healthy->Dead"), std::string::npos) << what;
        EXPECT_NE(what.find("after 3 attempts"), std::string::npos) << what;
    }
}

TEST(TransitionModel, DiscreteMethodOnlyForSplines) {
    std::vector<TransitionSpec> transitions = {
        exponential("Healthy", "Sick", "0.5"),
        {"Healthy", "Dead", {Family::SPLINE, {-2.0, 3.0}}, {"-1", "1"}},
        exponential("Sick", "Dead", "0.2"),
    };
    ModelOptions options;
    options.method = SamplingMethod::DISCRETE;
    options.step = 0.25;
    const TransitionModel model(STATES, "Healthy", transitions, VariableLayout({"x"}), options);
    std::vector<Distribution> bound;
    model.bind({0.0}, bound);

    RngEngine rng(4);
    std::vector<double> times;
    bool continuousSeen = false;
    for (int i = 0; i < 200; ++i) {
        model.sampleTimes(bound, 0, 0.0, 1000.0, rng, times);
        ASSERT_EQ(times.size(), 2u);
        const double k = times[1] / 0.25;
        if (std::isfinite(k)) EXPECT_NEAR(k, std::round(k), 1e-9);
        continuousSeen = continuousSeen || std::abs(times[0] / 0.25 - std::round(times[0] / 0.25)) > 1e-6;
    }
    EXPECT_TRUE(continuousSeen);
}
