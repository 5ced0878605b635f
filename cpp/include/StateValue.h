#pragma once
/**
 * @file StateValue.h
 * @brief Discounted costs, utilities and life-years from an event history.
 */
#include <string>
#include <utility>
#include <vector>

#include "CompiledExpression.h"
#include "InputData.h"
#include "StateGraph.h"
#include "TrajectorySimulator.h"

namespace ipsim {
    enum class ValueKind : int { COST, UTILITY };

    /**
     * @brief WLOS integrates a flow rate over the time spent in a state;
     *        STARTING adds a one-off amount on each entry into a state.
     */
    enum class ValueMethod : int { WLOS, STARTING };

    /** @throws ConfigurationError for an unknown name */
    ValueKind valueKindFromName(const std::string& name);

    /** @throws ConfigurationError for an unknown name */
    ValueMethod valueMethodFromName(const std::string& name);

    /**
     * @brief One named cost or utility category.
     *
     * Values are piecewise constant in time. Period k starts at times[k] (times[0] must be 0);
     * with timeReset the periods are measured from state entry instead of from time 0.
     */
    struct ValueSpec {
        std::string name;
        ValueKind kind = ValueKind::COST;
        ValueMethod method = ValueMethod::WLOS;
        std::vector<double> times;
        bool timeReset = false;
        /** state name → one expression per period, or a single expression for all periods; unlisted states are 0 */
        std::vector<std::pair<std::string, std::vector<std::string>>> states;
    };

    /** @brief Present value of a constant flow z on [t0, t1) under continuous discount rate r. */
    double presentValue(double z, double t0, double t1, double r);

    /**
     * @brief Evaluates value schedules for one replicate and accumulates them over event histories.
     *
     * Output columns, per discount rate: one per ValueSpec, then total cost, QALYs and life-years.
     * Copies recompile their expressions; give each worker thread its own copy.
     */
    class StateValue {
    public:
        /**
         * @param graph          states the schedules refer to
         * @param specs          value schedules; names must be unique
         * @param layout         variables the value expressions may use
         * @param discountRates  continuous rates, each finite and >= 0
         * @throws ConfigurationError on unknown states, bad breakpoints, bad rates or expressions
         */
        StateValue(const StateGraph& graph, std::vector<ValueSpec> specs, const VariableLayout& layout,
                   std::vector<double> discountRates);

        const std::vector<ValueSpec>& specs() const noexcept { return specs_; }
        const std::vector<double>& discountRates() const noexcept { return rates_; }

        /** @brief Column names of accumulate()'s output rows. */
        std::vector<std::string> columnNames() const;

        /** @brief Index of the "total_cost" column. */
        size_t totalCostColumn() const noexcept { return specs_.size(); }

        /** @brief Index of the "qalys" column. */
        size_t qalyColumn() const noexcept { return specs_.size() + 1; }

        /** @brief Index of the "life_years" column. */
        size_t lifeYearColumn() const noexcept { return specs_.size() + 2; }

        size_t numColumns() const noexcept { return specs_.size() + 3; }

        /**
         * @brief Evaluate every value expression for one replicate.
         * @throws ConfigurationError naming the value and state if an expression is not finite
         */
        void bind(const std::vector<double>& scope);

        /**
         * @brief Discounted totals of one event history, using the values from the last bind().
         * @param out  resized to [rate][column]
         */
        void accumulate(const std::vector<EventRecord>& history, std::vector<std::vector<double>>& out) const;

    private:
        std::vector<ValueSpec> specs_;
        std::vector<double> rates_;
        std::vector<bool> absorbing_;
        std::vector<std::string> stateNames_;
        // [value][state][period]; an empty period list means 0
        std::vector<std::vector<std::vector<CompiledExpression>>> expressions_;
        std::vector<std::vector<std::vector<double>>> bound_;

        double valueAt(size_t v, int state, size_t period) const;
        size_t periodOf(size_t v, double t) const;
        double flow(size_t v, const EventRecord& record, double r) const;
    };
}
