#include "Collector.h"
#include <cassert>
#include <algorithm>
#include <limits>

using namespace ipsim;

// EventHistoryCollector
void EventHistoryCollector::reset(const ReplicateKey& key, const std::vector<double>& scope) {
    key_ = key;
    current_.clear();
}

void EventHistoryCollector::registerEvent(const EventRecord& record) {
    current_.push_back(record);
}

void EventHistoryCollector::save(const TrajectoryResult trajectoryResult) {
    if (trajectoryResult != TrajectoryResult::FAILED)
        for (const auto& record : current_) rows_.push_back({key_, record});
    current_.clear();
}

void EventHistoryCollector::merge(const DataCollector& other) {
    const auto& o = dynamic_cast<const EventHistoryCollector&>(other);

    rows_.reserve(rows_.size() + o.rows_.size());
    rows_.insert(rows_.end(), o.rows_.begin(), o.rows_.end());
}

void EventHistoryCollector::finalize() {
    std::stable_sort(rows_.begin(), rows_.end(), [](const EventRow& a, const EventRow& b) {
        return std::tie(a.key.sample, a.key.strategy, a.key.patient) <
               std::tie(b.key.sample, b.key.strategy, b.key.patient);
    });
}


// OutcomeCollector
OutcomeCollector::OutcomeCollector(const StateValue& values): values_(values) {}

void OutcomeCollector::reset(const ReplicateKey& key, const std::vector<double>& scope) {
    key_ = key;
    history_.clear();
    values_.bind(scope);
}

void OutcomeCollector::registerEvent(const EventRecord& record) {
    history_.push_back(record);
}

void OutcomeCollector::save(const TrajectoryResult trajectoryResult) {
    auto& cell = cells_[CellKey{key_.sample, key_.strategy, key_.group}];
    if (cell.sums.empty())
        cell.sums.assign(values_.discountRates().size(), std::vector<double>(values_.numColumns(), 0.0));

    if (trajectoryResult == TrajectoryResult::FAILED) {
        cell.missing += 1;
        history_.clear();
        return;
    }

    values_.accumulate(history_, totals_);
    for (size_t i = 0; i < totals_.size(); ++i)
        for (size_t j = 0; j < totals_[i].size(); ++j)
            cell.sums[i][j] += totals_[i][j];
    cell.count += 1;
    history_.clear();
}

void OutcomeCollector::merge(const DataCollector& other) {
    const auto& o = dynamic_cast<const OutcomeCollector&>(other);
    for (const auto& entry : o.cells_) {
        auto& cell = cells_[entry.first];
        if (cell.sums.empty()) {
            cell = entry.second;
            continue;
        }
        assert(cell.sums.size() == entry.second.sums.size());
        cell.count += entry.second.count;
        cell.missing += entry.second.missing;
        for (size_t i = 0; i < cell.sums.size(); ++i)
            for (size_t j = 0; j < cell.sums[i].size(); ++j)
                cell.sums[i][j] += entry.second.sums[i][j];
    }
}


// StateOccupancyCollector
StateOccupancyCollector::StateOccupancyCollector(std::shared_ptr<const StateGraph> graph, std::vector<double> grid):
    graph_(std::move(graph)), grid_(std::move(grid)), occupied_(grid_.size(), -1) {
    assert(std::is_sorted(grid_.begin(), grid_.end()));
}

void StateOccupancyCollector::reset(const ReplicateKey& key, const std::vector<double>& scope) {
    key_ = key;
    std::fill(occupied_.begin(), occupied_.end(), -1);
}

void StateOccupancyCollector::mark(const double from, const double to, const bool inclusive, const int state) {
    auto it = std::lower_bound(grid_.begin(), grid_.end(), from);
    for (; it != grid_.end() && (*it < to || (inclusive && *it == to)); ++it)
        occupied_[it - grid_.begin()] = state;
}

void StateOccupancyCollector::registerEvent(const EventRecord& record) {
    constexpr double forever = std::numeric_limits<double>::infinity();
    if (!record.isFinal) {
        mark(record.timeStart, record.timeStop, false, record.from);
        return;
    }
    if (record.from == record.to) {
        mark(record.timeStart, graph_->isAbsorbing(record.from) ? forever : record.timeStop, true, record.from);
        return;
    }
    mark(record.timeStart, record.timeStop, false, record.from);
    mark(record.timeStop, graph_->isAbsorbing(record.to) ? forever : record.timeStop, true, record.to);
}

void StateOccupancyCollector::save(const TrajectoryResult trajectoryResult) {
    if (trajectoryResult == TrajectoryResult::FAILED) return;

    const size_t nStates = graph_->numStates();
    auto& counts = counts_[{key_.sample, key_.strategy}];
    if (counts.empty()) counts.assign(grid_.size(), std::vector<long>(nStates + 1, 0));

    for (size_t g = 0; g < grid_.size(); ++g) {
        if (occupied_[g] < 0) continue;
        counts[g][occupied_[g]] += 1;
        counts[g][nStates] += 1;
    }
}

void StateOccupancyCollector::merge(const DataCollector& other) {
    const auto& o = dynamic_cast<const StateOccupancyCollector&>(other);
    assert(o.grid_.size() == grid_.size());
    for (const auto& entry : o.counts_) {
        auto& counts = counts_[entry.first];
        if (counts.empty()) {
            counts = entry.second;
            continue;
        }
        for (size_t g = 0; g < counts.size(); ++g)
            for (size_t s = 0; s < counts[g].size(); ++s)
                counts[g][s] += entry.second[g][s];
    }
}


//DataCollectorGroup
DataCollectorGroup::DataCollectorGroup(const std::vector<std::shared_ptr<DataCollector>>& collectors) {
    collectors_.reserve(collectors.size());
    for (const auto& collector : collectors)
        collectors_.emplace_back(collector->clone());
}

DataCollectorGroup::DataCollectorGroup(const DataCollectorGroup& other) {
    collectors_.reserve(other.collectors_.size());
    for (const auto& collector : other.collectors_)
        collectors_.emplace_back(collector->clone());
}


void DataCollectorGroup::merge(const DataCollector& other) {
    const auto& o = dynamic_cast<const DataCollectorGroup&>(other);
    assert(o.collectors_.size() == collectors_.size());
    for (size_t i = 0; i < collectors_.size(); ++i)
        collectors_[i]->merge(*o.collectors_[i]);
}
