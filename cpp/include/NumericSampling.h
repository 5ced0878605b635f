#pragma once
/**
 * @file NumericSampling.h
 * @brief Family-independent inversion and truncated sampling on the cumulative hazard scale.
 *
 * For survival to t0, 1 − S(t)/S(t0) = U is the same event as H(t) = H(t0) + E with
 * E ~ Exp(1), so one inverter of H serves both clock-reset (t0 = 0) and clock-forward draws.
 */
#include "Distribution.h"
#include "RngEngine.h"

namespace ipsim {
    /** Beyond this time the numeric inverter reports "never" (+inf). */
    constexpr double NEVER_TIME = 1e9;

    /**
     * @brief The smallest t >= lower with H(t) = target.
     *
     * Closed-form families invert directly; others use bracket expansion followed by TOMS 748.
     * @return +inf if H stays below target up to NEVER_TIME
     * @throws SamplingFault on NaN hazards or a root finder that does not converge
     */
    double invertCumHazard(const Distribution& d, double target, double lower = 0.0);

    /** @brief The p-quantile, p ∈ [0,1). */
    double quantile(const Distribution& d, double p);

    /**
     * @brief Time from now to the event, given survival to `elapsed`.
     * @return +inf if the event never happens
     * @throws SamplingFault if no survival mass is left at `elapsed` or inversion fails
     */
    double sampleTruncated(const Distribution& d, double elapsed, RngEngine& rng);

    /**
     * @brief Discrete-time approximation: walk intervals of width `step` from `elapsed`,
     *        with event probability 1 − exp(−ΔH) per interval.
     * @param limit  stop after this much time from `elapsed` (must be finite)
     * @return time from `elapsed` to the end of the interval holding the event, or +inf
     */
    double sampleDiscrete(const Distribution& d, double elapsed, double step, double limit, RngEngine& rng);
}
