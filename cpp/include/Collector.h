#pragma once
/**
 * @file Collector.h
 * @brief Interfaces and implementations for collecting simulation data.
 */
#include <map>
#include <memory>
#include <tuple>
#include <vector>

#include "StateGraph.h"
#include "StateValue.h"
#include "TrajectoryResult.h"
#include "TrajectorySimulator.h"

namespace ipsim {
    /**
     * @brief Identity of one replicate.
     */
    struct ReplicateKey {
        int sample;
        int strategy; /**< Strategy::id */
        int patient; /**< Patient::id */
        int group; /**< Patient::group */
    };

    /**
     * @brief Base interface for streaming & final data collection.
     *
     * BatchSimulator calls reset() once per replicate, registerEvent() for each record of a
     * completed trajectory, then save(). A FAILED replicate gets reset() and save() only.
     */
    class DataCollector {
    public:
        virtual ~DataCollector() = default;

        /**
         * @brief reset the per‑trajectory temporary state for a new replicate
         * @param key    the replicate
         * @param scope  its variables, VariableLayout order
         */
        virtual void reset(const ReplicateKey& key, const std::vector<double>& scope) = 0;

        /** @brief record one event of the current trajectory */
        virtual void registerEvent(const EventRecord& record) = 0;

        /**
         * @brief commit per‑trajectory data into long‑term storage
         * @param trajectoryResult  trajectory outcome
         */
        virtual void save(TrajectoryResult trajectoryResult) = 0;

        /**
         * @brief merge another collector’s results into this one
         * @param other  same type collector to absorb
         */
        virtual void merge(const DataCollector& other) = 0;

        /** @brief put merged results into their final order; called once after all merges */
        virtual void finalize() {}

        /** @brief deep copy of this collector, including any results it already holds */
        virtual std::unique_ptr<DataCollector> clone() const = 0;
    };


    /**
     * @brief One row of the event history table.
     */
    struct EventRow {
        ReplicateKey key;
        EventRecord record;
    };

    /**
     * @brief Keeps the full event history of every completed replicate.
     */
    class EventHistoryCollector final : public DataCollector {
    public:
        EventHistoryCollector() = default;
        EventHistoryCollector(const EventHistoryCollector& other) = default;

        std::unique_ptr<DataCollector> clone() const override {
            return std::make_unique<EventHistoryCollector>(*this);
        }

        void reset(const ReplicateKey& key, const std::vector<double>& scope) override;
        void registerEvent(const EventRecord& record) override;
        void save(TrajectoryResult trajectoryResult) override;
        void merge(const DataCollector& other) override;

        /** @brief Sort by (sample, strategy, patient), keeping time order within a replicate. */
        void finalize() override;

        /** @brief Access collected rows. */
        const std::vector<EventRow>& rows() const noexcept { return rows_; }

    private:
        ReplicateKey key_{};
        std::vector<EventRecord> current_;
        std::vector<EventRow> rows_;
    };


    /** (sample, strategy id, group) */
    using CellKey = std::tuple<int, int, int>;

    /**
     * @brief Sums of discounted outcomes for one (sample, strategy, group) cell.
     */
    struct OutcomeCell {
        long count = 0; /**< completed replicates */
        long missing = 0; /**< replicates that raised a SamplingFault */
        std::vector<std::vector<double>> sums; /**< [rate][column], see StateValue::columnNames() */
    };

    /**
     * @brief Discounted costs, QALYs and life-years summed per (sample, strategy, group).
     */
    class OutcomeCollector final : public DataCollector {
    public:
        /** @param values  value schedules; copied */
        explicit OutcomeCollector(const StateValue& values);

        OutcomeCollector(const OutcomeCollector& other) = default;

        std::unique_ptr<DataCollector> clone() const override { return std::make_unique<OutcomeCollector>(*this); }

        void reset(const ReplicateKey& key, const std::vector<double>& scope) override;
        void registerEvent(const EventRecord& record) override;
        void save(TrajectoryResult trajectoryResult) override;
        void merge(const DataCollector& other) override;

        const StateValue& values() const noexcept { return values_; }

        /** @brief Accumulated cells, ordered by key. */
        const std::map<CellKey, OutcomeCell>& cells() const noexcept { return cells_; }

    private:
        StateValue values_;
        std::map<CellKey, OutcomeCell> cells_;

        // per-trajectory state
        ReplicateKey key_{};
        std::vector<EventRecord> history_;
        std::vector<std::vector<double>> totals_;
    };


    /**
     * @brief Counts of the state occupied at each grid time, per (sample, strategy).
     */
    class StateOccupancyCollector final : public DataCollector {
    public:
        /**
         * @param graph  state graph (shared)
         * @param grid   ascending observation times
         */
        StateOccupancyCollector(std::shared_ptr<const StateGraph> graph, std::vector<double> grid);

        StateOccupancyCollector(const StateOccupancyCollector& other) = default;

        std::unique_ptr<DataCollector> clone() const override {
            return std::make_unique<StateOccupancyCollector>(*this);
        }

        void reset(const ReplicateKey& key, const std::vector<double>& scope) override;
        void registerEvent(const EventRecord& record) override;
        void save(TrajectoryResult trajectoryResult) override;
        void merge(const DataCollector& other) override;

        const std::vector<double>& grid() const noexcept { return grid_; }

        /**
         * @brief Observation counts per (sample, strategy id).
         * @return counts[g][s]: trajectories in state s at grid()[g]; the last entry of each row is
         *         the number of trajectories observed at grid()[g]
         */
        const std::map<std::pair<int, int>, std::vector<std::vector<long>>>& counts() const noexcept {
            return counts_;
        }

    private:
        std::shared_ptr<const StateGraph> graph_;
        std::vector<double> grid_;
        std::map<std::pair<int, int>, std::vector<std::vector<long>>> counts_;

        // per-trajectory state, -1 = not observed
        ReplicateKey key_{};
        std::vector<int> occupied_;

        void mark(double from, double to, bool inclusive, int state);
    };


    /**
     * @brief Thread‑local grouping of multiple DataCollector instances.
     *
     * Internally owns unique_ptr<DataCollector> clones.
     */
    class DataCollectorGroup final : public DataCollector {
    public:
        /**
         * @brief Construct by cloning from shared_ptr collectors.
         * @param collectors  original collectors to clone
         */
        explicit DataCollectorGroup(const std::vector<std::shared_ptr<DataCollector>>& collectors);

        /**
         * @brief Copy constructor.
         * @param other the other DataCollectorGroup to copy
         */
        DataCollectorGroup(const DataCollectorGroup& other);

        DataCollectorGroup(DataCollectorGroup&& other) noexcept = default;
        DataCollectorGroup& operator=(DataCollectorGroup&& other) noexcept = default;

        std::unique_ptr<DataCollector> clone() const override { return std::make_unique<DataCollectorGroup>(*this); }

        void reset(const ReplicateKey& key, const std::vector<double>& scope) override {
            for (const auto& c : collectors_) c->reset(key, scope);
        }

        void registerEvent(const EventRecord& record) override {
            for (const auto& c : collectors_) c->registerEvent(record);
        }

        void save(const TrajectoryResult trajectoryResult) override {
            for (const auto& c : collectors_) c->save(trajectoryResult);
        }

        void merge(const DataCollector& other) override;

        void finalize() override {
            for (const auto& c : collectors_) c->finalize();
        }

        /** @brief Number of collectors in this group. */
        size_t size() const { return collectors_.size(); }

        /**
         * @brief Access a specific collector.
         * @param i  index [0...size())
         */
        const std::unique_ptr<DataCollector>& at(const size_t i) const { return collectors_.at(i); }

        /** @brief First collector of type T, or nullptr. */
        template <typename T>
        const T* find() const {
            for (const auto& c : collectors_)
                if (const auto* typed = dynamic_cast<const T*>(c.get())) return typed;
            return nullptr;
        }

    private:
        std::vector<std::unique_ptr<DataCollector>> collectors_;
    };
}
