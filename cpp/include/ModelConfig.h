#pragma once
/**
 * @file ModelConfig.h
 * @brief Model definition files and CSV input tables.
 */
#include <istream>
#include <string>
#include <vector>

#include "BatchSimulator.h"
#include "InputData.h"
#include "Parameter.h"
#include "Sampler.h"
#include "StateValue.h"
#include "TransitionModel.h"

namespace ipsim {
    /**
     * @brief Everything a model file defines.
     */
    struct ModelDefinition {
        // [model]
        std::vector<std::string> states;
        std::string initial;
        ModelOptions options;
        std::vector<TransitionSpec> transitions;

        // [strategies]
        std::vector<std::string> strategyCovariates;
        std::vector<Strategy> strategies;
        std::string reference; /**< empty = first strategy */

        // [values]
        std::vector<ValueSpec> values;

        // [psa]
        std::vector<Parameter> parameters;
        bool scramble = true;

        // [simulation]
        BatchOptions batch;
        std::vector<double> discountRates;
        std::vector<double> wtp;
        double occupancyStep = 0.0; /**< 0 = no state occupancy output */
        bool keepEvents = false;
    };

    /**
     * @brief Parse a model file in Boost.Program_options config syntax.
     * @param source  name used in error messages
     * @throws ConfigurationError on unknown keys, missing required keys or malformed lines
     */
    ModelDefinition parseModel(std::istream& in, const std::string& source);

    /** @throws ConfigurationError if the file cannot be opened or parsed */
    ModelDefinition loadModel(const std::string& path);

    /** @brief "From To family [knots=a,b,...] : expr | expr ..." */
    TransitionSpec parseTransition(const std::string& line);

    /** @brief "kind name method [times=a,b,...] [time-reset] : State = expr | expr ; State = expr" */
    ValueSpec parseValue(const std::string& line);

    /**
     * @brief Patient table: header "patient_id[,group],covariates...".
     */
    struct PatientTable {
        std::vector<std::string> covariates;
        std::vector<Patient> patients;
    };

    /** @throws ConfigurationError on a malformed header or row */
    PatientTable readPatients(std::istream& in, const std::string& source);

    /**
     * @brief PSA draws table: a header of parameter names, one row per draw.
     * @throws ConfigurationError on a malformed header or row
     */
    FixedDrawSampler readDraws(std::istream& in, const std::string& source);
}
