#include "Summary.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <tuple>

#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/variance.hpp>

using namespace ipsim;

namespace {
    constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

    double orderStatistic(const std::vector<double>& sorted, const double p) {
        const double h = p * static_cast<double>(sorted.size() - 1);
        const auto lo = static_cast<size_t>(std::floor(h));
        const size_t hi = std::min(lo + 1, sorted.size() - 1);
        return sorted[lo] + (h - static_cast<double>(lo)) * (sorted[hi] - sorted[lo]);
    }

    /** (group, sample) → strategy → outcome */
    std::map<std::pair<int, int>, std::map<int, const DrawOutcome*>> byDraw(const std::vector<DrawOutcome>& outcomes) {
        std::map<std::pair<int, int>, std::map<int, const DrawOutcome*>> index;
        for (const auto& o : outcomes)
            if (o.count > 0) index[{o.group, o.sample}][o.strategy] = &o;
        return index;
    }

    size_t numRates(const std::vector<DrawOutcome>& outcomes) {
        return outcomes.empty() ? 0 : outcomes.front().means.size();
    }
}

std::vector<DrawOutcome> ipsim::drawOutcomes(const std::map<CellKey, OutcomeCell>& cells, const bool byGroup) {
    std::map<CellKey, OutcomeCell> pooled;
    for (const auto& entry : cells) {
        const int group = byGroup ? std::get<2>(entry.first) : ALL_GROUPS;
        auto& cell = pooled[CellKey{std::get<0>(entry.first), std::get<1>(entry.first), group}];
        if (cell.sums.empty()) {
            cell = entry.second;
            continue;
        }
        cell.count += entry.second.count;
        cell.missing += entry.second.missing;
        for (size_t i = 0; i < cell.sums.size(); ++i)
            for (size_t j = 0; j < cell.sums[i].size(); ++j)
                cell.sums[i][j] += entry.second.sums[i][j];
    }

    std::vector<DrawOutcome> outcomes;
    outcomes.reserve(pooled.size());
    for (const auto& entry : pooled) {
        DrawOutcome o{std::get<0>(entry.first), std::get<1>(entry.first), std::get<2>(entry.first),
                      entry.second.count, entry.second.missing, entry.second.sums};
        for (auto& row : o.means)
            for (auto& v : row) v = o.count > 0 ? v / static_cast<double>(o.count) : NaN;
        outcomes.push_back(std::move(o));
    }
    return outcomes;
}

Statistic ipsim::summarize(std::vector<double> values) {
    namespace acc = boost::accumulators;
    Statistic s;
    s.n = static_cast<long>(values.size());
    if (values.empty()) {
        s.mean = s.sd = s.lower = s.upper = NaN;
        return s;
    }

    acc::accumulator_set<double, acc::stats<acc::tag::mean, acc::tag::variance>> moments;
    for (const double v : values) moments(v);
    s.mean = acc::mean(moments);
    // tag::variance is the population variance
    s.sd = s.n > 1 ? std::sqrt(acc::variance(moments) * static_cast<double>(s.n) / static_cast<double>(s.n - 1))
                   : NaN;

    std::sort(values.begin(), values.end());
    s.lower = orderStatistic(values, 0.025);
    s.upper = orderStatistic(values, 0.975);
    return s;
}

std::vector<StrategySummary> ipsim::summarizeStrategies(const std::vector<DrawOutcome>& outcomes) {
    // (group, strategy) → draws
    std::map<std::pair<int, int>, std::vector<const DrawOutcome*>> index;
    for (const auto& o : outcomes)
        if (o.count > 0) index[{o.group, o.strategy}].push_back(&o);

    std::vector<StrategySummary> summaries;
    const size_t nRates = numRates(outcomes);
    for (const auto& entry : index) {
        const size_t nColumns = entry.second.front()->means.front().size();
        for (size_t r = 0; r < nRates; ++r) {
            StrategySummary summary{entry.first.second, entry.first.first, r, {}};
            for (size_t c = 0; c < nColumns; ++c) {
                std::vector<double> values;
                values.reserve(entry.second.size());
                for (const auto* o : entry.second) values.push_back(o->means[r][c]);
                summary.columns.push_back(summarize(std::move(values)));
            }
            summaries.push_back(std::move(summary));
        }
    }
    return summaries;
}

std::vector<IncrementalResult> ipsim::incrementalAnalysis(const std::vector<DrawOutcome>& outcomes,
                                                          const int reference, const size_t costColumn,
                                                          const size_t qalyColumn, const std::vector<double>& wtp) {
    struct Diffs {
        std::vector<double> cost, qalys;
    };
    // (group, strategy, rate) → paired differences
    std::map<std::tuple<int, int, size_t>, Diffs> diffs;
    const size_t nRates = numRates(outcomes);

    for (const auto& draw : byDraw(outcomes)) {
        const auto ref = draw.second.find(reference);
        if (ref == draw.second.end()) continue;
        for (const auto& other : draw.second) {
            if (other.first == reference) continue;
            for (size_t r = 0; r < nRates; ++r) {
                auto& d = diffs[{draw.first.first, other.first, r}];
                d.cost.push_back(other.second->means[r][costColumn] - ref->second->means[r][costColumn]);
                d.qalys.push_back(other.second->means[r][qalyColumn] - ref->second->means[r][qalyColumn]);
            }
        }
    }

    std::vector<IncrementalResult> results;
    results.reserve(diffs.size());
    for (const auto& entry : diffs) {
        const auto& d = entry.second;
        IncrementalResult result{std::get<1>(entry.first), std::get<0>(entry.first), std::get<2>(entry.first),
                                 summarize(d.cost), summarize(d.qalys), NaN, {}};
        if (result.qalys.mean != 0.0) result.icer = result.cost.mean / result.qalys.mean;
        for (const double lambda : wtp) {
            std::vector<double> inmb(d.cost.size());
            for (size_t i = 0; i < inmb.size(); ++i) inmb[i] = lambda * d.qalys[i] - d.cost[i];
            result.inmb.push_back(summarize(std::move(inmb)));
        }
        results.push_back(std::move(result));
    }
    return results;
}

std::vector<AcceptabilityPoint> ipsim::acceptabilityCurve(const std::vector<DrawOutcome>& outcomes,
                                                          const std::vector<int>& strategies,
                                                          const size_t costColumn, const size_t qalyColumn,
                                                          const std::vector<double>& wtp) {
    // (group, rate, wtp index) → wins per strategy position, plus the number of usable draws
    std::map<std::tuple<int, size_t, size_t>, std::vector<long>> wins;
    std::map<int, long> usable;
    const size_t nRates = numRates(outcomes);

    for (const auto& draw : byDraw(outcomes)) {
        const bool complete = std::all_of(strategies.begin(), strategies.end(),
                                          [&draw](const int s) { return draw.second.count(s) > 0; });
        if (!complete) continue;
        const int group = draw.first.first;
        usable[group] += 1;

        for (size_t r = 0; r < nRates; ++r) {
            for (size_t w = 0; w < wtp.size(); ++w) {
                auto& counts = wins[{group, r, w}];
                if (counts.empty()) counts.assign(strategies.size(), 0);
                size_t best = 0;
                double bestNmb = -std::numeric_limits<double>::infinity();
                for (size_t i = 0; i < strategies.size(); ++i) {
                    const auto& means = draw.second.at(strategies[i])->means[r];
                    const double nmb = wtp[w] * means[qalyColumn] - means[costColumn];
                    if (nmb > bestNmb) {
                        bestNmb = nmb;
                        best = i;
                    }
                }
                counts[best] += 1;
            }
        }
    }

    std::vector<AcceptabilityPoint> curve;
    for (const auto& entry : wins) {
        const int group = std::get<0>(entry.first);
        const auto n = static_cast<double>(usable[group]);
        for (size_t i = 0; i < strategies.size(); ++i)
            curve.push_back({group, std::get<1>(entry.first), wtp[std::get<2>(entry.first)], strategies[i],
                             static_cast<double>(entry.second[i]) / n});
    }
    return curve;
}
