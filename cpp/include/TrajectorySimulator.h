#pragma once
/**
 * @file TrajectorySimulator.h
 * @brief Drives one patient through the state graph.
 */
#include <vector>

#include "Distribution.h"
#include "RngEngine.h"
#include "TrajectoryResult.h"
#include "TransitionModel.h"

namespace ipsim {
    /**
     * @brief One sojourn: the patient sat in `from` on [timeStart, timeStop) and then moved to `to`.
     *
     * A final record with from == to means the horizon was reached in `from`.
     */
    struct EventRecord {
        int from;
        int to;
        double timeStart;
        double timeStop;
        bool isFinal;
    };

    /**
     * @brief Competing-risks simulation of a single replicate.
     *
     * Holds no per-replicate state; one instance may be shared by every replicate a worker runs.
     */
    class TrajectorySimulator {
    public:
        /**
         * @param model           transition model (must outlive the simulator)
         * @param maxTransitions  transitions allowed per trajectory before a SamplingFault
         */
        explicit TrajectorySimulator(const TransitionModel& model, int maxTransitions = 10000);

        /**
         * @brief Simulate from the initial state at time 0 until absorption or `maxTime`.
         * @param bound    the replicate's distributions, from TransitionModel::bind
         * @param maxTime  horizon, finite and >= 0
         * @param rng      the replicate's random stream
         * @param history  output; time-ordered, contiguous, exactly one final record
         * @throws SamplingFault if an edge cannot be sampled or the transition cap is hit
         */
        TrajectoryResult run(const std::vector<Distribution>& bound, double maxTime, RngEngine& rng,
                             std::vector<EventRecord>& history) const;

    private:
        const TransitionModel& model_;
        const int maxTransitions_;
    };
}
