#pragma once
/**
 * @file TransitionModel.h
 * @brief Per-edge time-to-event distributions and next-transition sampling.
 */
#include <memory>
#include <string>
#include <vector>

#include "CompiledExpression.h"
#include "Distribution.h"
#include "InputData.h"
#include "RngEngine.h"
#include "StateGraph.h"

namespace ipsim {
    /**
     * @brief Which time axis transition hazards are defined on.
     *
     * RESET: time since entering the current state (semi-Markov).
     * FORWARD: time since the start of the trajectory (Markov in time).
     * MIXED: time since the last entry into one of the reset states.
     */
    enum class Clock : int { RESET, FORWARD, MIXED };

    /**
     * @brief How edges without a closed-form inverse are sampled.
     */
    enum class SamplingMethod : int { INVERSE_CDF, DISCRETE };

    /** @throws ConfigurationError for an unknown name */
    Clock clockFromName(const std::string& name);

    /** @throws ConfigurationError for an unknown name */
    SamplingMethod samplingMethodFromName(const std::string& name);

    /**
     * @brief One transition as written in a model definition.
     */
    struct TransitionSpec {
        std::string from;
        std::string to;
        FamilySpec family;
        std::vector<std::string> parameters; /**< one expression per family parameter, natural scale */
    };

    struct ModelOptions {
        Clock clock = Clock::RESET;
        std::vector<std::string> resetStates; /**< only used with Clock::MIXED */
        SamplingMethod method = SamplingMethod::INVERSE_CDF;
        double step = 0.1; /**< interval width for SamplingMethod::DISCRETE */
        int maxRetries = 20; /**< sampling attempts per edge before a SamplingFault */
    };

    /**
     * @brief The state graph plus one parameterized distribution per edge.
     *
     * Copies recompile the parameter expressions; give each worker thread its own copy.
     * The graph itself is shared and immutable.
     */
    class TransitionModel {
    public:
        /**
         * @param states       state names
         * @param initial      name of the starting state
         * @param transitions  edges in tie-break order
         * @param layout       variables the parameter expressions may use
         * @param options      clock and sampling settings
         * @throws ConfigurationError for graph, option or expression errors
         * @throws ParameterError for wrong arity or malformed knots
         */
        TransitionModel(const std::vector<std::string>& states, const std::string& initial,
                        const std::vector<TransitionSpec>& transitions, const VariableLayout& layout,
                        ModelOptions options);

        const StateGraph& graph() const noexcept { return *graph_; }
        std::shared_ptr<const StateGraph> sharedGraph() const noexcept { return graph_; }
        const ModelOptions& options() const noexcept { return options_; }
        const std::vector<TransitionSpec>& transitions() const noexcept { return transitions_; }

        /**
         * @brief Evaluate every edge's parameters for one replicate.
         * @param scope  replicate variables, VariableLayout order
         * @param out    one distribution per edge, edge order
         * @throws ParameterError naming the edge on a support violation
         */
        void bind(const std::vector<double>& scope, std::vector<Distribution>& out) const;

        /** @brief Whether entering `state` restarts the model clock. */
        bool resetsClock(int state) const { return resetsClock_.at(state); }

        /**
         * @brief Sample the time from now to each transition out of `state`.
         * @param bound      distributions from bind()
         * @param state      current state
         * @param clockTime  time already elapsed on the model clock
         * @param remaining  time left until the horizon
         * @param times      output, aligned with graph().outgoing(state); +inf means never
         * @throws SamplingFault naming the edge after maxRetries unusable draws
         */
        void sampleTimes(const std::vector<Distribution>& bound, int state, double clockTime, double remaining,
                         RngEngine& rng, std::vector<double>& times) const;

    private:
        std::shared_ptr<const StateGraph> graph_;
        std::vector<TransitionSpec> transitions_;
        ModelOptions options_;
        std::vector<std::vector<CompiledExpression>> parameters_;
        std::vector<bool> resetsClock_;
        std::vector<std::string> labels_;

        double sampleEdge(const Distribution& d, int edge, double clockTime, double remaining, RngEngine& rng) const;
    };
}
