#pragma once
#include <cstdint>

namespace ipsim {
    /**
     * @brief Small, copyable RNG engine offering
     *   • Uniform [0,1) and (0,1]
     *   • Gaussian via Box–Muller
     *   • Gamma via Marsaglia–Tsang
     *   • Exponential via inversion
     *
     * One engine is owned by exactly one replicate at a time.
     */
    class RngEngine {
    public:
        /**
         * @param seed  Optional seed (default = time ^ thread_id).
         */
        explicit RngEngine(uint64_t seed = defaultSeed());

        /** @return a double ∈ [0,1) */
        double uniform();

        /** @return a double ∈ (0,1], safe to pass to log() */
        double uniformPositive();

        /** @brief Draw one Normal(mean, stddev).
         *  @param mean Mean
         *  @param stddev  Must be >= 0.
         *  @return a Normal(mean, stddev) variate */
        double normal(double mean, double stddev);

        /** @brief Draw one Gamma(shape, scale) variate.
         *  @param shape Must be > 0.
         *  @param scale Must be > 0.
         *  @return a Gamma(shape, scale) variate */
        double gamma(double shape, double scale);

        /** @return an Exponential(1) variate */
        double standardExponential();

        /** Default seed generator (clock ^ thread_id) */
        static uint64_t defaultSeed();

        /**
         * @brief Seed for one replicate, independent of scheduling order.
         * @param baseSeed    run-level seed
         * @param strategyId  strategy id of the replicate
         * @param patientId   patient id of the replicate
         * @param sampleId    PSA sample index of the replicate
         */
        static uint64_t replicateSeed(uint64_t baseSeed, int strategyId, int patientId, int sampleId);

        /** @return next 32-bit uniform integer via PCG */
        uint32_t nextUInt32();

    private:
        // --- PCG state ---
        uint64_t state_;
        uint64_t increment_;
        bool haveSpare_ = false;
        double spare_ = 0.0;

        /**@return a single sample from StandardNormal(0,1) via Box-Muller */
        double sampleBoxMuller();

        /** Marsaglia–Tsang algorithm for Gamma(shape,1) */
        double sampleGammaShape1(double shape);
    };
}
