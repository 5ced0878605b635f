#pragma once
/**
 * @file Distribution.h
 * @brief Time-to-event distribution families attached to transitions.
 */
#include <string>
#include <variant>
#include <vector>

#include "RngEngine.h"

namespace ipsim {
    enum class Family : int { EXPONENTIAL, WEIBULL, GAMMA, LOGNORMAL, GOMPERTZ, LOGLOGISTIC, PWEXP, SPLINE };

    /** @throws ConfigurationError for an unknown family name */
    Family familyFromName(const std::string& name);

    std::string familyName(Family family);

    /**
     * @brief The fixed part of an edge's distribution: its family and, where the family needs
     *        them, knots (log-time knots for SPLINE, interval start times for PWEXP).
     */
    struct FamilySpec {
        Family family;
        std::vector<double> knots;

        /** @brief Number of parameters the family takes. */
        size_t arity() const noexcept;

        /** @brief Whether the inverse cumulative hazard has a closed form. */
        bool closedForm() const noexcept { return family != Family::SPLINE; }

        /**
         * @brief Check the knots.
         * @return empty string if valid, otherwise a description of the problem
         */
        std::string validate() const;
    };

    namespace dist {
        struct Exponential {
            double rate;
        };

        struct Weibull {
            double shape, scale;
        };

        struct Gamma {
            double shape, rate;
        };

        struct Lognormal {
            double meanlog, sdlog;
        };

        /** h(t) = rate·exp(shape·t); shape < 0 leaves a cured fraction. */
        struct Gompertz {
            double shape, rate;
        };

        struct LogLogistic {
            double shape, scale;
        };

        /** rates[i] applies on [cuts[i], cuts[i+1]), the last one up to infinity. */
        struct PiecewiseExponential {
            std::vector<double> cuts, rates;
        };

        /** Royston–Parmar: log H(t) = s(log t), a natural cubic spline with the given knots. */
        struct Spline {
            std::vector<double> knots, gamma;
        };
    }

    /**
     * @brief A fully parameterized time-to-event distribution.
     *
     * The family alternative is chosen once, when the edge is bound for a replicate.
     */
    class Distribution {
    public:
        /**
         * @brief Build a distribution from natural-scale parameters.
         * @param spec    family and knots
         * @param params  spec.arity() values
         * @param edge    label used in error messages
         * @throws ParameterError on wrong arity or support violation
         */
        static Distribution create(const FamilySpec& spec, const std::vector<double>& params,
                                   const std::string& edge);

        Family family() const noexcept;

        /** @brief H(t); 0 at t <= 0. */
        double cumHazard(double t) const;

        /** @brief S(t) = P(T > t). */
        double survival(double t) const;

        /** @brief F(t) = 1 − S(t). */
        double cdf(double t) const;

        double hazard(double t) const;

        double logHazard(double t) const;

        /** @brief Whether inverseCumHazard() and sample() are available. */
        bool hasInverse() const noexcept;

        /**
         * @brief The t with H(t) = h; +inf if H never reaches h.
         * @throws SamplingFault if the tail cannot be resolved numerically
         * @throws std::logic_error if !hasInverse()
         */
        double inverseCumHazard(double h) const;

        /**
         * @brief Closed-form random variate from the untruncated distribution.
         * @throws std::logic_error if !hasInverse()
         */
        double sample(RngEngine& rng) const;

    private:
        // alternatives in Family order
        using Variant = std::variant<dist::Exponential, dist::Weibull, dist::Gamma, dist::Lognormal,
                                     dist::Gompertz, dist::LogLogistic, dist::PiecewiseExponential, dist::Spline>;

        explicit Distribution(Variant impl) : impl_(std::move(impl)) {}

        Variant impl_;
    };
}
