#include "TransitionModel.h"

#include <algorithm>
#include <cmath>

#include "Errors.h"
#include "NumericSampling.h"

using namespace ipsim;

namespace {
    std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](const unsigned char c) { return std::tolower(c); });
        return s;
    }

    std::shared_ptr<const StateGraph> buildGraph(const std::vector<std::string>& states, const std::string& initial,
                                                 const std::vector<TransitionSpec>& transitions) {
        const auto indexOf = [&states](const std::string& name) {
            const auto it = std::find(states.begin(), states.end(), name);
            if (it == states.end())
                throw ConfigurationError("TransitionModel: unknown state '" + name + "'");
            return static_cast<int>(it - states.begin());
        };
        std::vector<Edge> edges;
        edges.reserve(transitions.size());
        for (const auto& t : transitions) edges.push_back(Edge{indexOf(t.from), indexOf(t.to)});
        return std::make_shared<const StateGraph>(states, std::move(edges), indexOf(initial));
    }
}

Clock ipsim::clockFromName(const std::string& name) {
    const std::string n = lower(name);
    if (n == "reset") return Clock::RESET;
    if (n == "forward") return Clock::FORWARD;
    if (n == "mixed") return Clock::MIXED;
    throw ConfigurationError("unknown clock '" + name + "' (expected reset, forward or mixed)");
}

SamplingMethod ipsim::samplingMethodFromName(const std::string& name) {
    const std::string n = lower(name);
    if (n == "invcdf") return SamplingMethod::INVERSE_CDF;
    if (n == "discrete") return SamplingMethod::DISCRETE;
    throw ConfigurationError("unknown sampling method '" + name + "' (expected invcdf or discrete)");
}


TransitionModel::TransitionModel(const std::vector<std::string>& states, const std::string& initial,
                                 const std::vector<TransitionSpec>& transitions, const VariableLayout& layout,
                                 ModelOptions options)
    : graph_(buildGraph(states, initial, transitions)), transitions_(transitions), options_(std::move(options)) {
    if (options_.method == SamplingMethod::DISCRETE && !(options_.step > 0.0 && std::isfinite(options_.step)))
        throw ConfigurationError("TransitionModel: discrete sampling step must be a positive number");
    if (options_.maxRetries < 1) throw ConfigurationError("TransitionModel: max retries must be at least 1");

    resetsClock_.assign(graph_->numStates(), options_.clock == Clock::RESET);
    if (options_.clock == Clock::MIXED) {
        if (options_.resetStates.empty())
            throw ConfigurationError("TransitionModel: clock 'mixed' needs at least one reset state");
        for (const auto& name : options_.resetStates) resetsClock_[graph_->stateIndex(name)] = true;
    }

    parameters_.reserve(transitions_.size());
    labels_.reserve(transitions_.size());
    for (size_t e = 0; e < transitions_.size(); ++e) {
        const auto& t = transitions_[e];
        labels_.push_back(graph_->edgeLabel(static_cast<int>(e)));

        const std::string knotProblem = t.family.validate();
        if (!knotProblem.empty()) throw ParameterError(labels_.back(), knotProblem);
        if (t.parameters.size() != t.family.arity())
            throw ParameterError(labels_.back(), familyName(t.family.family) + " expects " +
                                 std::to_string(t.family.arity()) + " parameters, got " +
                                 std::to_string(t.parameters.size()));

        std::vector<CompiledExpression> compiled;
        compiled.reserve(t.parameters.size());
        for (const auto& source : t.parameters) {
            try {
                compiled.emplace_back(source, layout);
            } catch (const ConfigurationError& err) {
                throw ConfigurationError("transition " + labels_.back() + ": " + err.what());
            }
        }
        parameters_.push_back(std::move(compiled));
    }
}

void TransitionModel::bind(const std::vector<double>& scope, std::vector<Distribution>& out) const {
    out.clear();
    out.reserve(parameters_.size());
    std::vector<double> values;
    for (size_t e = 0; e < parameters_.size(); ++e) {
        values.clear();
        for (const auto& expression : parameters_[e]) values.push_back(expression.eval(scope));
        out.push_back(Distribution::create(transitions_[e].family, values, labels_[e]));
    }
}

void TransitionModel::sampleTimes(const std::vector<Distribution>& bound, const int state, const double clockTime,
                                  const double remaining, RngEngine& rng, std::vector<double>& times) const {
    const auto& edges = graph_->outgoing(state);
    times.resize(edges.size());
    for (size_t i = 0; i < edges.size(); ++i)
        times[i] = sampleEdge(bound[edges[i]], edges[i], clockTime, remaining, rng);
}

double TransitionModel::sampleEdge(const Distribution& d, const int edge, const double clockTime,
                                   const double remaining, RngEngine& rng) const {
    std::string problem;
    for (int attempt = 0; attempt < options_.maxRetries; ++attempt) {
        try {
            double t;
            if (!d.hasInverse() && options_.method == SamplingMethod::DISCRETE)
                t = sampleDiscrete(d, clockTime, options_.step, remaining, rng);
            else if (clockTime <= 0.0 && d.hasInverse())
                t = d.sample(rng);
            else
                t = sampleTruncated(d, clockTime, rng);

            if (t >= 0.0) return t; // +inf is a valid "never"
            problem = "sampled time " + std::to_string(t);
        } catch (const SamplingFault& fault) {
            problem = fault.what();
        }
    }
    throw SamplingFault("transition " + labels_[edge] + ": " + problem + " (after " +
                        std::to_string(options_.maxRetries) + " attempts)");
}
