#include "Sampler.h"
#include <algorithm>
#include <random>
#include <set>

#include "Errors.h"

using namespace ipsim;

namespace {
    void requireUniqueNames(const std::vector<std::string>& names, const std::string& who) {
        std::set<std::string> seen;
        for (const auto& name : names)
            if (!seen.insert(name).second)
                throw ConfigurationError(who + ": duplicate parameter '" + name + "'");
    }
}

LatinHypercubeSampler::LatinHypercubeSampler(const std::vector<Parameter>& params, const RngEngine& rng,
                                             const bool scramble)
    : params_(params), rng_(rng), scramble_(scramble) {
    names_.reserve(params_.size());
    for (const auto& p : params_) names_.push_back(p.name);
    requireUniqueNames(names_, "LatinHypercubeSampler");
}

std::vector<int> LatinHypercubeSampler::shuffledIndices(const int n) {
    std::vector<int> idx(n);
    for (int i = 0; i < n; ++i) idx[i] = i;
    if (scramble_) {
        std::shuffle(idx.begin(), idx.end(), std::mt19937(rng_.nextUInt32()));
    }
    return idx;
}

std::vector<Draw> LatinHypercubeSampler::sampleBlock(const int n) {
    if (n <= 0) throw ConfigurationError("LatinHypercubeSampler: number of draws must be positive");
    const size_t d = params_.size();

    std::vector<std::vector<int>> perm(d);
    for (size_t j = 0; j < d; ++j) perm[j] = shuffledIndices(n);

    std::vector<Draw> out;
    out.reserve(n);

    for (int i = 0; i < n; ++i) {
        Draw draw{i, std::vector<double>(d)};
        for (size_t j = 0; j < d; ++j) {
            if (params_[j].isFixed()) {
                draw.values[j] = params_[j].min;
                continue;
            }
            const int stratum = perm[j][i];
            const double u = (stratum + rng_.uniform()) / static_cast<double>(n);
            draw.values[j] = params_[j].at(u);
        }
        out.push_back(std::move(draw));
    }
    return out;
}


FixedDrawSampler::FixedDrawSampler(std::vector<std::string> names, std::vector<std::vector<double>> rows)
    : names_(std::move(names)), rows_(std::move(rows)) {
    requireUniqueNames(names_, "FixedDrawSampler");
    for (size_t i = 0; i < rows_.size(); ++i)
        if (rows_[i].size() != names_.size())
            throw ConfigurationError("FixedDrawSampler: row " + std::to_string(i) + " has " +
                                     std::to_string(rows_[i].size()) + " values, expected " +
                                     std::to_string(names_.size()));
}

std::vector<Draw> FixedDrawSampler::sampleBlock(const int n) {
    if (n <= 0) throw ConfigurationError("FixedDrawSampler: number of draws must be positive");
    if (static_cast<size_t>(n) > rows_.size())
        throw ConfigurationError("FixedDrawSampler: " + std::to_string(n) + " draws requested but only " +
                                 std::to_string(rows_.size()) + " supplied");

    std::vector<Draw> out;
    out.reserve(n);
    for (int i = 0; i < n; ++i) out.push_back(Draw{i, rows_[i]});
    return out;
}
