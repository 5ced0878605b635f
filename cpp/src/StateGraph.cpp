#include "StateGraph.h"

#include <deque>
#include <set>

#include "Errors.h"

using namespace ipsim;

StateGraph::StateGraph(std::vector<std::string> states, std::vector<Edge> edges, const int initial)
    : states_(std::move(states)), edges_(std::move(edges)), initial_(initial) {
    const int n = static_cast<int>(states_.size());
    if (n == 0) throw ConfigurationError("StateGraph: no states defined");

    std::set<std::string> names;
    for (const auto& s : states_)
        if (!names.insert(s).second) throw ConfigurationError("StateGraph: duplicate state '" + s + "'");

    if (initial_ < 0 || initial_ >= n)
        throw ConfigurationError("StateGraph: initial state " + std::to_string(initial_) + " does not exist");

    outgoing_.assign(n, {});
    std::vector<bool> incident(n, false);
    std::set<std::pair<int, int>> seen;
    for (size_t e = 0; e < edges_.size(); ++e) {
        const auto& edge = edges_[e];
        if (edge.from < 0 || edge.from >= n || edge.to < 0 || edge.to >= n)
            throw ConfigurationError("StateGraph: edge " + std::to_string(e) + " references an unknown state (" +
                                     std::to_string(edge.from) + " -> " + std::to_string(edge.to) + ")");
        if (edge.from == edge.to)
            throw ConfigurationError("StateGraph: self-transition on state '" + states_[edge.from] + "'");
        if (!seen.insert({edge.from, edge.to}).second)
            throw ConfigurationError("StateGraph: duplicate transition " + edgeLabel(static_cast<int>(e)));
        outgoing_[edge.from].push_back(static_cast<int>(e));
        incident[edge.from] = incident[edge.to] = true;
    }

    if (!edges_.empty() && !incident[initial_])
        throw ConfigurationError("StateGraph: initial state '" + states_[initial_] +
                                 "' is not connected to any transition");

    bool anyAbsorbing = false;
    for (int s = 0; s < n; ++s) anyAbsorbing = anyAbsorbing || outgoing_[s].empty();
    if (!anyAbsorbing) throw ConfigurationError("StateGraph: model has no absorbing state");

    // breadth-first search from the initial state
    std::vector<bool> reached(n, false);
    std::deque<int> queue{initial_};
    reached[initial_] = true;
    bool absorbingReached = false;
    while (!queue.empty()) {
        const int s = queue.front();
        queue.pop_front();
        if (outgoing_[s].empty()) absorbingReached = true;
        for (const int e : outgoing_[s]) {
            const int to = edges_[e].to;
            if (!reached[to]) {
                reached[to] = true;
                queue.push_back(to);
            }
        }
    }
    if (!absorbingReached)
        throw ConfigurationError("StateGraph: no absorbing state is reachable from '" + states_[initial_] + "'");
}

int StateGraph::stateIndex(const std::string& name) const {
    for (size_t i = 0; i < states_.size(); ++i)
        if (states_[i] == name) return static_cast<int>(i);
    throw ConfigurationError("StateGraph: unknown state '" + name + "'");
}

std::string StateGraph::edgeLabel(const int edge) const {
    const auto& e = edges_.at(edge);
    return states_[e.from] + "->" + states_[e.to];
}
