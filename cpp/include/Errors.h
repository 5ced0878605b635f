#pragma once
/**
 * @file Errors.h
 * @brief Exception types raised during model setup and simulation.
 */
#include <stdexcept>
#include <string>

namespace ipsim {
    /**
     * @brief Malformed graph, input table, expression or configuration value.
     *
     * Raised while building a model; aborts the whole run.
     */
    class ConfigurationError : public std::invalid_argument {
    public:
        explicit ConfigurationError(const std::string& what) : std::invalid_argument(what) {}
    };

    /**
     * @brief Wrong parameter arity or a parameter outside its support.
     */
    class ParameterError : public std::invalid_argument {
    public:
        /**
         * @param edge     description of the offending transition, e.g. "Healthy->Sick"
         * @param message  what is wrong with its parameters
         */
        ParameterError(const std::string& edge, const std::string& message)
            : std::invalid_argument("transition " + edge + ": " + message), edge_(edge) {}

        /** @brief The transition the error refers to. */
        const std::string& edge() const noexcept { return edge_; }

    private:
        std::string edge_;
    };

    /**
     * @brief A sampler could not produce a usable time for one replicate.
     *
     * Caught per replicate by BatchSimulator; the replicate is recorded as missing.
     */
    class SamplingFault : public std::runtime_error {
    public:
        explicit SamplingFault(const std::string& what) : std::runtime_error(what) {}
    };
}
