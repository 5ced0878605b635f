#include "NumericSampling.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>

#include <boost/math/policies/error_handling.hpp>
#include <boost/math/tools/toms748_solve.hpp>

#include "Errors.h"

using namespace ipsim;

namespace {
    constexpr double INF = std::numeric_limits<double>::infinity();
    constexpr std::uintmax_t MAX_ROOT_ITERATIONS = 200;
}

double ipsim::invertCumHazard(const Distribution& d, const double target, const double lower) {
    if (std::isnan(target)) throw SamplingFault("cumulative hazard target is NaN");
    if (std::isinf(target)) return INF;
    if (d.hasInverse()) return std::max(lower, d.inverseCumHazard(target));

    double lo = lower;
    const double hLo = d.cumHazard(lo);
    if (std::isnan(hLo)) throw SamplingFault("cumulative hazard is NaN at t=" + std::to_string(lo));
    if (hLo >= target) return lo;

    // expand until H(hi) >= target
    double hi = std::max(2.0 * lo, 1.0);
    double hHi = d.cumHazard(hi);
    while (hHi < target) {
        if (hi >= NEVER_TIME) return INF;
        lo = hi;
        hi *= 2.0;
        hHi = d.cumHazard(hi);
    }
    if (std::isnan(hHi)) throw SamplingFault("cumulative hazard is NaN at t=" + std::to_string(hi));

    std::uintmax_t iterations = MAX_ROOT_ITERATIONS;
    const auto f = [&d, target](const double t) { return d.cumHazard(t) - target; };
    try {
        const auto root = boost::math::tools::toms748_solve(f, lo, hi, boost::math::tools::eps_tolerance<double>(45),
                                                            iterations);
        if (iterations >= MAX_ROOT_ITERATIONS)
            throw SamplingFault("cumulative hazard inversion did not converge in [" + std::to_string(lo) + ", " +
                                std::to_string(hi) + "]");
        return 0.5 * (root.first + root.second);
    } catch (const boost::math::evaluation_error& e) {
        throw SamplingFault(std::string("cumulative hazard inversion failed: ") + e.what());
    } catch (const std::domain_error& e) {
        throw SamplingFault(std::string("cumulative hazard inversion failed: ") + e.what());
    }
}

double ipsim::quantile(const Distribution& d, const double p) {
    if (!(p >= 0.0 && p < 1.0)) throw std::invalid_argument("quantile: p must be in [0,1)");
    return invertCumHazard(d, -std::log1p(-p));
}

double ipsim::sampleTruncated(const Distribution& d, const double elapsed, RngEngine& rng) {
    const double h0 = d.cumHazard(elapsed);
    if (std::isnan(h0)) throw SamplingFault("cumulative hazard is NaN at t=" + std::to_string(elapsed));
    if (std::isinf(h0)) throw SamplingFault("no survival probability left at t=" + std::to_string(elapsed));

    const double t = invertCumHazard(d, h0 + rng.standardExponential(), elapsed);
    return t - elapsed;
}

double ipsim::sampleDiscrete(const Distribution& d, const double elapsed, const double step, const double limit,
                             RngEngine& rng) {
    if (!(step > 0.0)) throw std::invalid_argument("sampleDiscrete: step must be positive");
    if (!std::isfinite(limit)) throw std::invalid_argument("sampleDiscrete: limit must be finite");

    const auto nSteps = static_cast<long long>(std::ceil(limit / step));
    double hPrev = d.cumHazard(elapsed);
    for (long long i = 1; i <= nSteps; ++i) {
        const double hNext = d.cumHazard(elapsed + static_cast<double>(i) * step);
        const double p = -std::expm1(-(hNext - hPrev));
        if (std::isnan(p))
            throw SamplingFault("interval event probability is NaN at t=" +
                                std::to_string(elapsed + static_cast<double>(i) * step));
        if (rng.uniform() < p) return static_cast<double>(i) * step;
        hPrev = hNext;
    }
    return INF;
}
