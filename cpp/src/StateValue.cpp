#include "StateValue.h"

#include <algorithm>
#include <cmath>
#include <set>

#include "Errors.h"

using namespace ipsim;

ValueKind ipsim::valueKindFromName(const std::string& name) {
    if (name == "cost") return ValueKind::COST;
    if (name == "utility") return ValueKind::UTILITY;
    throw ConfigurationError("unknown value kind '" + name + "' (expected cost or utility)");
}

ValueMethod ipsim::valueMethodFromName(const std::string& name) {
    if (name == "wlos") return ValueMethod::WLOS;
    if (name == "starting") return ValueMethod::STARTING;
    throw ConfigurationError("unknown value method '" + name + "' (expected wlos or starting)");
}

double ipsim::presentValue(const double z, const double t0, const double t1, const double r) {
    if (t1 <= t0) return 0.0;
    if (r == 0.0) return z * (t1 - t0);
    return z * std::exp(-r * t0) * -std::expm1(-r * (t1 - t0)) / r;
}


StateValue::StateValue(const StateGraph& graph, std::vector<ValueSpec> specs, const VariableLayout& layout,
                       std::vector<double> discountRates)
    : specs_(std::move(specs)), rates_(std::move(discountRates)), stateNames_(graph.states()) {
    if (rates_.empty()) throw ConfigurationError("StateValue: at least one discount rate is required");
    for (const double r : rates_)
        if (!(r >= 0.0) || !std::isfinite(r))
            throw ConfigurationError("StateValue: discount rate " + std::to_string(r) + " must be finite and >= 0");

    const size_t nStates = graph.numStates();
    for (size_t s = 0; s < nStates; ++s) absorbing_.push_back(graph.isAbsorbing(static_cast<int>(s)));

    std::set<std::string> names{"total_cost", "qalys", "life_years"};
    for (auto& spec : specs_) {
        if (spec.name.empty()) throw ConfigurationError("StateValue: value without a name");
        if (!names.insert(spec.name).second)
            throw ConfigurationError("StateValue: duplicate or reserved value name '" + spec.name + "'");

        if (spec.times.empty()) spec.times.push_back(0.0);
        if (spec.times.front() != 0.0)
            throw ConfigurationError("StateValue: breakpoints of '" + spec.name + "' must start at 0");
        for (size_t k = 1; k < spec.times.size(); ++k)
            if (!(spec.times[k] > spec.times[k - 1]) || !std::isfinite(spec.times[k]))
                throw ConfigurationError("StateValue: breakpoints of '" + spec.name +
                                         "' must be finite and strictly increasing");

        const size_t nPeriods = spec.times.size();
        std::vector<std::vector<CompiledExpression>> perState(nStates);
        for (const auto& entry : spec.states) {
            const int s = graph.stateIndex(entry.first);
            if (!perState[s].empty())
                throw ConfigurationError("StateValue: state '" + entry.first + "' listed twice in '" + spec.name + "'");
            if (entry.second.size() != 1 && entry.second.size() != nPeriods)
                throw ConfigurationError("StateValue: '" + spec.name + "' has " + std::to_string(nPeriods) +
                                         " periods but state '" + entry.first + "' gives " +
                                         std::to_string(entry.second.size()) + " values");
            for (size_t k = 0; k < nPeriods; ++k) {
                const std::string& source = entry.second.size() == 1 ? entry.second.front() : entry.second[k];
                try {
                    perState[s].emplace_back(source, layout);
                } catch (const ConfigurationError& err) {
                    throw ConfigurationError("value " + spec.name + ", state " + entry.first + ": " + err.what());
                }
            }
        }
        expressions_.push_back(std::move(perState));
        bound_.emplace_back(nStates, std::vector<double>(nPeriods, 0.0));
    }
}

std::vector<std::string> StateValue::columnNames() const {
    std::vector<std::string> columns;
    columns.reserve(numColumns());
    for (const auto& spec : specs_) columns.push_back(spec.name);
    columns.insert(columns.end(), {"total_cost", "qalys", "life_years"});
    return columns;
}

void StateValue::bind(const std::vector<double>& scope) {
    for (size_t v = 0; v < expressions_.size(); ++v) {
        for (size_t s = 0; s < expressions_[v].size(); ++s) {
            const auto& periods = expressions_[v][s];
            for (size_t k = 0; k < periods.size(); ++k) {
                const double z = periods[k].eval(scope);
                if (!std::isfinite(z))
                    throw ConfigurationError("value " + specs_[v].name + ", state " + stateNames_[s] +
                                             ": expression '" + periods[k].expr() + "' evaluates to " +
                                             std::to_string(z));
                bound_[v][s][k] = z;
            }
        }
    }
}

double StateValue::valueAt(const size_t v, const int state, const size_t period) const {
    return bound_[v][state][period];
}

size_t StateValue::periodOf(const size_t v, const double t) const {
    const auto& times = specs_[v].times;
    return static_cast<size_t>(std::upper_bound(times.begin(), times.end(), t) - times.begin()) - 1;
}

double StateValue::flow(const size_t v, const EventRecord& record, const double r) const {
    const auto& spec = specs_[v];
    const double origin = spec.timeReset ? record.timeStart : 0.0;
    double total = 0.0;
    for (size_t k = 0; k < spec.times.size(); ++k) {
        const double lo = std::max(record.timeStart, origin + spec.times[k]);
        const double hi = k + 1 < spec.times.size() ? std::min(record.timeStop, origin + spec.times[k + 1])
                                                    : record.timeStop;
        total += presentValue(valueAt(v, record.from, k), lo, hi, r);
    }
    return total;
}

void StateValue::accumulate(const std::vector<EventRecord>& history, std::vector<std::vector<double>>& out) const {
    out.assign(rates_.size(), std::vector<double>(numColumns(), 0.0));

    for (size_t i = 0; i < rates_.size(); ++i) {
        const double r = rates_[i];
        auto& row = out[i];
        for (const auto& record : history) {
            for (size_t v = 0; v < specs_.size(); ++v) {
                if (specs_[v].method == ValueMethod::WLOS) {
                    row[v] += flow(v, record, r);
                    continue;
                }
                // one-off amounts: entry into `from`, and into `to` for a final transition
                const size_t entryPeriod = specs_[v].timeReset ? 0 : periodOf(v, record.timeStart);
                row[v] += valueAt(v, record.from, entryPeriod) * std::exp(-r * record.timeStart);
                if (record.isFinal && record.to != record.from) {
                    const size_t period = specs_[v].timeReset ? 0 : periodOf(v, record.timeStop);
                    row[v] += valueAt(v, record.to, period) * std::exp(-r * record.timeStop);
                }
            }
            if (!absorbing_[record.from])
                row[lifeYearColumn()] += presentValue(1.0, record.timeStart, record.timeStop, r);
        }
        for (size_t v = 0; v < specs_.size(); ++v)
            row[specs_[v].kind == ValueKind::COST ? totalCostColumn() : qalyColumn()] += row[v];
    }
}
