#include "TrajectorySimulator.h"

#include <cmath>
#include <limits>

#include "Errors.h"

using namespace ipsim;

TrajectorySimulator::TrajectorySimulator(const TransitionModel& model, const int maxTransitions)
    : model_(model), maxTransitions_(maxTransitions) {
    if (maxTransitions_ < 1) throw ConfigurationError("TrajectorySimulator: max transitions must be at least 1");
}

TrajectoryResult TrajectorySimulator::run(const std::vector<Distribution>& bound, const double maxTime,
                                          RngEngine& rng, std::vector<EventRecord>& history) const {
    if (!(maxTime >= 0.0) || !std::isfinite(maxTime))
        throw std::invalid_argument("TrajectorySimulator: horizon must be finite and non-negative");

    const StateGraph& graph = model_.graph();
    history.clear();

    int state = graph.initial();
    if (graph.isAbsorbing(state)) {
        history.push_back({state, state, 0.0, 0.0, true});
        return TrajectoryResult::ABSORBED;
    }

    double now = 0.0;
    double clockOrigin = 0.0;
    std::vector<double> times;

    for (int n = 0; n < maxTransitions_; ++n) {
        model_.sampleTimes(bound, state, now - clockOrigin, maxTime - now, rng, times);

        // first minimum wins ties, i.e. the lowest edge index
        size_t best = 0;
        double wait = std::numeric_limits<double>::infinity();
        for (size_t i = 0; i < times.size(); ++i) {
            if (times[i] < wait) {
                wait = times[i];
                best = i;
            }
        }

        if (now + wait > maxTime) {
            history.push_back({state, state, now, maxTime, true});
            return TrajectoryResult::CAPPED_AT_HORIZON;
        }

        const double next = now + wait;
        const int target = graph.edges()[graph.outgoing(state)[best]].to;
        const bool absorbed = graph.isAbsorbing(target);
        const bool final = absorbed || next >= maxTime;
        history.push_back({state, target, now, next, final});
        if (final) return absorbed ? TrajectoryResult::ABSORBED : TrajectoryResult::CAPPED_AT_HORIZON;

        now = next;
        state = target;
        if (model_.resetsClock(state)) clockOrigin = now;
    }

    throw SamplingFault("trajectory exceeded " + std::to_string(maxTransitions_) + " transitions before t=" +
                        std::to_string(maxTime));
}
