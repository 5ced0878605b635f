#pragma once
/**
 * @file StateGraph.h
 * @brief Health states and the permitted transitions between them.
 */
#include <string>
#include <vector>

namespace ipsim {
    /**
     * @brief A directed edge between two states. Its position in StateGraph::edges() is its id.
     */
    struct Edge {
        int from;
        int to;
    };

    /**
     * @brief Immutable multi-state graph shared by every replicate of a run.
     *
     * Edge order is definition order; it breaks ties between equal sampled times.
     */
    class StateGraph {
    public:
        /**
         * @param states   state names, index = state id
         * @param edges    permitted transitions
         * @param initial  state every trajectory starts in
         * @throws ConfigurationError for unknown states, self-loops, duplicate edges, a disconnected
         *         initial state, or when no absorbing state is reachable from the initial state
         */
        StateGraph(std::vector<std::string> states, std::vector<Edge> edges, int initial);

        const std::vector<std::string>& states() const noexcept { return states_; }
        const std::vector<Edge>& edges() const noexcept { return edges_; }
        int initial() const noexcept { return initial_; }
        size_t numStates() const noexcept { return states_.size(); }

        /** @brief Edge ids leaving `state`, ascending. */
        const std::vector<int>& outgoing(int state) const { return outgoing_.at(state); }

        bool isAbsorbing(int state) const { return outgoing_.at(state).empty(); }

        /** @throws ConfigurationError for an unknown name */
        int stateIndex(const std::string& name) const;

        /** @brief "From->To" label for messages. */
        std::string edgeLabel(int edge) const;

    private:
        std::vector<std::string> states_;
        std::vector<Edge> edges_;
        int initial_;
        std::vector<std::vector<int>> outgoing_;
    };
}
