#pragma once
/**
 * @file OutputWriter.h
 * @brief CSV tables of simulation results.
 */
#include <map>
#include <ostream>
#include <string>
#include <vector>

#include "BatchSimulator.h"
#include "Collector.h"
#include "InputData.h"
#include "Summary.h"

namespace ipsim {
    /**
     * @brief Writes result tables with state and strategy names resolved.
     *
     * Numbers are written with enough digits to round-trip.
     */
    class OutputWriter {
    public:
        /**
         * @param input    strategies, for their names
         * @param states   state names
         * @param columns  outcome column names, StateValue::columnNames()
         * @param rates    discount rates, indexed like the outcome rows
         */
        OutputWriter(const InputData& input, std::vector<std::string> states, std::vector<std::string> columns,
                     std::vector<double> rates);

        /** sample,strategy,patient,from,to,time_start,time_stop,is_final */
        void writeEvents(std::ostream& os, const std::vector<EventRow>& rows) const;

        /** sample,strategy,group,discount,count,missing,<columns> */
        void writeOutcomes(std::ostream& os, const std::vector<DrawOutcome>& outcomes) const;

        /** strategy,group,discount,outcome,n,mean,sd,lower,upper */
        void writeSummaries(std::ostream& os, const std::vector<StrategySummary>& summaries) const;

        /** strategy,group,discount,measure,wtp,n,mean,sd,lower,upper; plus one icer row per comparison */
        void writeIncremental(std::ostream& os, const std::vector<IncrementalResult>& results,
                              const std::vector<double>& wtp) const;

        /** group,discount,wtp,strategy,probability */
        void writeAcceptability(std::ostream& os, const std::vector<AcceptabilityPoint>& curve) const;

        /** sample,strategy,time,<state probabilities>,n */
        void writeOccupancy(std::ostream& os, const StateOccupancyCollector& occupancy) const;

        /** sample,strategy,patient,message */
        void writeFailures(std::ostream& os, const std::vector<FailedReplicate>& failures) const;

    private:
        std::map<int, std::string> strategyNames_;
        std::vector<std::string> states_;
        std::vector<std::string> columns_;
        std::vector<double> rates_;

        const std::string& strategy(int id) const { return strategyNames_.at(id); }
        static std::string group(int id);
    };
}
