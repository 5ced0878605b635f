#pragma once
/**
 * @file InputData.h
 * @brief Strategies, patients and the variable scope seen by expressions.
 */
#include <optional>
#include <string>
#include <vector>

#include "Sampler.h"

namespace ipsim {
    /**
     * @brief One treatment strategy and its covariates (e.g. a treatment indicator).
     */
    struct Strategy {
        int id;
        std::string name;
        std::vector<double> covariates;
    };

    /**
     * @brief One simulated patient: identity, subgroup and static covariates.
     */
    struct Patient {
        int id;
        int group;
        std::vector<double> covariates;
    };

    /**
     * @brief The strategy × patient input table of a batch.
     */
    class InputData {
    public:
        /**
         * @throws ConfigurationError if either table is empty, ids repeat or a row has the wrong width
         */
        InputData(std::vector<std::string> strategyCovariates, std::vector<Strategy> strategies,
                  std::vector<std::string> patientCovariates, std::vector<Patient> patients);

        const std::vector<std::string>& strategyCovariates() const noexcept { return strategyCovariates_; }
        const std::vector<Strategy>& strategies() const noexcept { return strategies_; }
        const std::vector<std::string>& patientCovariates() const noexcept { return patientCovariates_; }
        const std::vector<Patient>& patients() const noexcept { return patients_; }

        /** @brief Column of a patient covariate, if present. */
        std::optional<size_t> patientCovariateIndex(const std::string& name) const;

        /** @brief Position of the strategy with this name, if present. */
        std::optional<size_t> strategyIndex(const std::string& name) const;

    private:
        std::vector<std::string> strategyCovariates_;
        std::vector<Strategy> strategies_;
        std::vector<std::string> patientCovariates_;
        std::vector<Patient> patients_;
    };

    /**
     * @brief Ordered variable names available to expressions:
     *        PSA parameters, then strategy covariates, then patient covariates.
     */
    class VariableLayout {
    public:
        /** @throws ConfigurationError on duplicate names */
        explicit VariableLayout(std::vector<std::string> names);

        /** @brief Layout for a sampler's parameters plus the input table's covariates. */
        VariableLayout(const std::vector<std::string>& parameterNames, const InputData& input);

        const std::vector<std::string>& names() const noexcept { return names_; }
        size_t size() const noexcept { return names_.size(); }

        /**
         * @brief Fill `scope` with the values of one replicate, in names() order.
         */
        void assemble(const Draw& draw, const Strategy& strategy, const Patient& patient,
                      std::vector<double>& scope) const;

    private:
        std::vector<std::string> names_;
    };
}
