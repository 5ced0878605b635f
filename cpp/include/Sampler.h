#pragma once
/**
 * @file Sampler.h
 * @brief Sources of probabilistic-sensitivity-analysis (PSA) parameter draws.
 */
#include <memory>
#include <string>
#include <vector>

#include "Parameter.h"
#include "RngEngine.h"

namespace ipsim {
    /**
     * @brief One PSA draw: a sample index and one value per sampler parameter.
     */
    struct Draw {
        int sample; /**< PSA sample index, 0-based */
        std::vector<double> values; /**< aligned with Sampler::parameterNames() */
    };


    /**
     * @brief Abstract base class for all PSA samplers.
     *
     * BatchSimulator asks for all P draws once, before any replicate runs.
     */
    class Sampler {
    public:
        virtual ~Sampler() = default;

        /** @brief Names of the sampled parameters, in Draw::values order. */
        virtual const std::vector<std::string>& parameterNames() const = 0;

        /**
         * @brief Produce n draws, numbered 0..n-1.
         * @param n  Number of draws requested.
         * @throws ConfigurationError if the sampler cannot supply n draws.
         */
        virtual std::vector<Draw> sampleBlock(int n) = 0;
    };


    /**
     * @brief Latin-Hypercube sampler over an arbitrary set of Parameters.
     *
     * Samples uniformly within strata per dimension, optionally scrambled.
     */
    class LatinHypercubeSampler final : public Sampler {
    public:
        /**
         * @param params    List of parameters to sample; names must be unique.
         * @param rng       RngEngine for shuffle and uniforms.
         * @param scramble  If true, shuffle strata per dimension.
         */
        explicit LatinHypercubeSampler(const std::vector<Parameter>& params, const RngEngine& rng,
                                       bool scramble = true);

        const std::vector<std::string>& parameterNames() const override { return names_; }

        std::vector<Draw> sampleBlock(int n) override;

    private:
        std::vector<Parameter> params_;
        std::vector<std::string> names_;
        RngEngine rng_;
        const bool scramble_;

        /**
         * @brief Generate a random permutation of 0…n-1.
         */
        std::vector<int> shuffledIndices(int n);
    };

    /**
     * @brief Hands out a fixed table of draws, e.g. a posterior sample from a fitting library.
     */
    class FixedDrawSampler final : public Sampler {
    public:
        /**
         * @param names  parameter names, one per column
         * @param rows   one row per draw, each of size names.size()
         * @throws ConfigurationError on ragged rows or duplicate names
         */
        FixedDrawSampler(std::vector<std::string> names, std::vector<std::vector<double>> rows);

        const std::vector<std::string>& parameterNames() const override { return names_; }

        /** @brief First n rows of the table. */
        std::vector<Draw> sampleBlock(int n) override;

        /** @brief Number of rows available. */
        size_t size() const noexcept { return rows_.size(); }

    private:
        std::vector<std::string> names_;
        std::vector<std::vector<double>> rows_;
    };
}
