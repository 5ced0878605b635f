#include "InputData.h"

#include <set>

#include "Errors.h"

using namespace ipsim;

namespace {
    std::vector<std::string> concatNames(const std::vector<std::string>& parameterNames, const InputData& input) {
        std::vector<std::string> all(parameterNames);
        all.insert(all.end(), input.strategyCovariates().begin(), input.strategyCovariates().end());
        all.insert(all.end(), input.patientCovariates().begin(), input.patientCovariates().end());
        return all;
    }
}

InputData::InputData(std::vector<std::string> strategyCovariates, std::vector<Strategy> strategies,
                     std::vector<std::string> patientCovariates, std::vector<Patient> patients)
    : strategyCovariates_(std::move(strategyCovariates)), strategies_(std::move(strategies)),
      patientCovariates_(std::move(patientCovariates)), patients_(std::move(patients)) {
    if (strategies_.empty()) throw ConfigurationError("InputData: at least one strategy is required");
    if (patients_.empty()) throw ConfigurationError("InputData: at least one patient is required");

    std::set<int> strategyIds;
    std::set<std::string> strategyNames;
    for (const auto& s : strategies_) {
        if (!strategyIds.insert(s.id).second)
            throw ConfigurationError("InputData: duplicate strategy id " + std::to_string(s.id));
        if (!strategyNames.insert(s.name).second)
            throw ConfigurationError("InputData: duplicate strategy name '" + s.name + "'");
        if (s.covariates.size() != strategyCovariates_.size())
            throw ConfigurationError("InputData: strategy '" + s.name + "' has " +
                                     std::to_string(s.covariates.size()) + " covariates, expected " +
                                     std::to_string(strategyCovariates_.size()));
    }

    std::set<int> patientIds;
    for (const auto& p : patients_) {
        if (!patientIds.insert(p.id).second)
            throw ConfigurationError("InputData: duplicate patient id " + std::to_string(p.id));
        if (p.covariates.size() != patientCovariates_.size())
            throw ConfigurationError("InputData: patient " + std::to_string(p.id) + " has " +
                                     std::to_string(p.covariates.size()) + " covariates, expected " +
                                     std::to_string(patientCovariates_.size()));
    }
}

std::optional<size_t> InputData::patientCovariateIndex(const std::string& name) const {
    for (size_t i = 0; i < patientCovariates_.size(); ++i)
        if (patientCovariates_[i] == name) return i;
    return std::nullopt;
}

std::optional<size_t> InputData::strategyIndex(const std::string& name) const {
    for (size_t i = 0; i < strategies_.size(); ++i)
        if (strategies_[i].name == name) return i;
    return std::nullopt;
}


VariableLayout::VariableLayout(std::vector<std::string> names) : names_(std::move(names)) {
    std::set<std::string> seen;
    for (const auto& n : names_)
        if (!seen.insert(n).second)
            throw ConfigurationError("VariableLayout: variable '" + n + "' is defined twice");
}

VariableLayout::VariableLayout(const std::vector<std::string>& parameterNames, const InputData& input)
    : VariableLayout(concatNames(parameterNames, input)) {}

void VariableLayout::assemble(const Draw& draw, const Strategy& strategy, const Patient& patient,
                              std::vector<double>& scope) const {
    scope.clear();
    scope.insert(scope.end(), draw.values.begin(), draw.values.end());
    scope.insert(scope.end(), strategy.covariates.begin(), strategy.covariates.end());
    scope.insert(scope.end(), patient.covariates.begin(), patient.covariates.end());
    if (scope.size() != names_.size())
        throw ConfigurationError("VariableLayout: replicate supplies " + std::to_string(scope.size()) +
                                 " values for " + std::to_string(names_.size()) + " variables");
}
