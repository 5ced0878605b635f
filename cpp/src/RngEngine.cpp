#include "RngEngine.h"

#include <cassert>
#include <chrono>
#include <cmath>
#include <functional>
#include <thread>

#include <boost/math/constants/constants.hpp>


using namespace ipsim;

namespace {
    // splitmix64 finalizer, used to decorrelate neighbouring replicate keys
    uint64_t mix64(uint64_t z) {
        z += 0x9E3779B97F4A7C15ULL;
        z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
        z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
        return z ^ (z >> 31);
    }
}

//------------------------------------------------------------------------------
// defaultSeed(): mix high-res clock and thread ID for initial seeding
//------------------------------------------------------------------------------
uint64_t RngEngine::defaultSeed() {
    const auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    const auto tid = std::hash<std::thread::id>()(std::this_thread::get_id());
    return static_cast<uint64_t>(now) ^ (static_cast<uint64_t>(tid) << 1);
}

//------------------------------------------------------------------------------
// replicateSeed(): hash (seed, strategy, patient, sample) into one stream seed
//------------------------------------------------------------------------------
uint64_t RngEngine::replicateSeed(const uint64_t baseSeed, const int strategyId, const int patientId,
                                  const int sampleId) {
    uint64_t h = mix64(baseSeed);
    h = mix64(h ^ static_cast<uint64_t>(static_cast<uint32_t>(strategyId)));
    h = mix64(h ^ static_cast<uint64_t>(static_cast<uint32_t>(patientId)));
    h = mix64(h ^ static_cast<uint64_t>(static_cast<uint32_t>(sampleId)));
    return h;
}

//------------------------------------------------------------------------------
// Constructor: initialize PCG state
//------------------------------------------------------------------------------
RngEngine::RngEngine(const uint64_t seed) : state_(0), increment_(seed << 1 | 1) {
    // Advance state at least once
    state_ = seed + increment_;
    state_ = state_ * 6364136223846793005ULL + increment_;
}

//------------------------------------------------------------------------------
// nextUInt32(): PCG-XSH-RR 32-bit generator
//------------------------------------------------------------------------------
uint32_t RngEngine::nextUInt32() {
    const uint64_t old = state_;
    state_ = old * 6364136223846793005ULL + increment_;
    const auto xorshifted = static_cast<uint32_t>(((old >> 18u) ^ old) >> 27u);
    const auto rot = static_cast<uint32_t>(old >> 59u);
    return (xorshifted >> rot) | (xorshifted << ((-rot) & 31u));
}

//------------------------------------------------------------------------------
// uniform(): convert nextUInt32() into [0,1)
//------------------------------------------------------------------------------
double RngEngine::uniform() {
    return nextUInt32() * (1.0 / 4294967296.0);
}

//------------------------------------------------------------------------------
// uniformPositive(): (0,1], never zero
//------------------------------------------------------------------------------
double RngEngine::uniformPositive() {
    return 1.0 - uniform();
}

//------------------------------------------------------------------------------
// sampleBoxMuller(): one N(0,1) variate, caching the second of each pair
//------------------------------------------------------------------------------
double RngEngine::sampleBoxMuller() {
    if (haveSpare_) {
        haveSpare_ = false;
        return spare_;
    }
    const double u1 = uniformPositive();
    const double u2 = uniform();
    const double r = std::sqrt(-2.0 * std::log(u1));
    const double theta = boost::math::constants::two_pi<double>() * u2;
    spare_ = r * std::sin(theta);
    haveSpare_ = true;
    return r * std::cos(theta);
}

//------------------------------------------------------------------------------
// normal(mean,stddev): scale a standard Box-Muller sample
//------------------------------------------------------------------------------
double RngEngine::normal(const double mean, const double stddev) {
    assert(stddev >= 0.0 && "Normal stddev must be non-negative");
    return mean + stddev * sampleBoxMuller();
}

//------------------------------------------------------------------------------
// sampleGammaShape1(shape): Marsaglia–Tsang for Gamma(shape,1)
//------------------------------------------------------------------------------
double RngEngine::sampleGammaShape1(const double shape) {
    if (shape < 1.0) {
        // Gamma(a) = Gamma(a+1) * U^(1/a) for a<1
        const double u = uniformPositive();
        return sampleGammaShape1(shape + 1.0) * std::pow(u, 1.0 / shape);
    }
    const double d = shape - 1.0 / 3.0;
    const double c = 1.0 / std::sqrt(9.0 * d);
    while (true) {
        const double x = sampleBoxMuller();
        double v = 1.0 + c * x;
        if (v <= 0) continue;
        v = v * v * v;
        const double u = uniformPositive();
        if (u < 1.0 - 0.0331 * x * x * x * x) {
            return d * v;
        }
        if (std::log(u) < 0.5 * x * x + d * (1.0 - v + std::log(v))) {
            return d * v;
        }
    }
}

//------------------------------------------------------------------------------
// gamma(shape,scale): scale the unit Gamma by 'scale'
//------------------------------------------------------------------------------
double RngEngine::gamma(const double shape, const double scale) {
    assert(shape > 0.0 && "Gamma shape must be positive");
    assert(scale > 0.0 && "Gamma scale must be positive");
    return sampleGammaShape1(shape) * scale;
}

//------------------------------------------------------------------------------
// standardExponential(): inversion of the unit exponential CDF
//------------------------------------------------------------------------------
double RngEngine::standardExponential() {
    return -std::log(uniformPositive());
}
