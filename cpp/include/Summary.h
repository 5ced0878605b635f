#pragma once
/**
 * @file Summary.h
 * @brief Cost-effectiveness summaries across PSA draws.
 */
#include <map>
#include <vector>

#include "Collector.h"

namespace ipsim {
    /** Group id of rows pooled over all subgroups. */
    constexpr int ALL_GROUPS = -1;

    /**
     * @brief Mean outcome per completed replicate for one (sample, strategy, group).
     */
    struct DrawOutcome {
        int sample;
        int strategy;
        int group;
        long count;
        long missing;
        std::vector<std::vector<double>> means; /**< [rate][column]; NaN when count == 0 */
    };

    /**
     * @brief Reduce outcome sums to per-replicate means.
     * @param byGroup  keep subgroups apart; otherwise pool them under ALL_GROUPS
     * @return rows ordered by (sample, strategy, group)
     */
    std::vector<DrawOutcome> drawOutcomes(const std::map<CellKey, OutcomeCell>& cells, bool byGroup);

    /**
     * @brief Mean, sample standard deviation and 95% interval of a set of values.
     */
    struct Statistic {
        long n = 0;
        double mean;
        double sd; /**< NaN for n < 2 */
        double lower; /**< 2.5% quantile */
        double upper; /**< 97.5% quantile */
    };

    /** @brief Summarize values; quantiles interpolate between order statistics. */
    Statistic summarize(std::vector<double> values);

    /**
     * @brief Across-draw summary of every outcome column for one strategy and group.
     */
    struct StrategySummary {
        int strategy;
        int group;
        size_t rate; /**< index into the discount rates */
        std::vector<Statistic> columns;
    };

    /** @brief Summaries ordered by (group, strategy, rate); draws without completed replicates are skipped. */
    std::vector<StrategySummary> summarizeStrategies(const std::vector<DrawOutcome>& outcomes);

    /**
     * @brief One strategy against the reference strategy.
     */
    struct IncrementalResult {
        int strategy;
        int group;
        size_t rate;
        Statistic cost;
        Statistic qalys;
        double icer; /**< mean incremental cost / mean incremental QALYs; NaN if the latter is 0 */
        std::vector<Statistic> inmb; /**< one per willingness-to-pay */
    };

    /**
     * @brief Incremental costs, QALYs, ICER and INMB, paired by draw.
     * @param reference  Strategy::id of the comparator
     */
    std::vector<IncrementalResult> incrementalAnalysis(const std::vector<DrawOutcome>& outcomes, int reference,
                                                       size_t costColumn, size_t qalyColumn,
                                                       const std::vector<double>& wtp);

    struct AcceptabilityPoint {
        int group;
        size_t rate;
        double wtp;
        int strategy;
        double probability; /**< share of draws in which the strategy has the highest net monetary benefit */
    };

    /**
     * @brief Cost-effectiveness acceptability curve.
     *
     * Only draws in which every strategy has completed replicates count; ties go to the first
     * strategy in `strategies`.
     */
    std::vector<AcceptabilityPoint> acceptabilityCurve(const std::vector<DrawOutcome>& outcomes,
                                                       const std::vector<int>& strategies, size_t costColumn,
                                                       size_t qalyColumn, const std::vector<double>& wtp);
}
