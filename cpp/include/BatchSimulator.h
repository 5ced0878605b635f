#pragma once
/**
 * @file BatchSimulator.h
 * @brief Runs every (strategy, patient, PSA draw) replicate on a worker pool.
 */
#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "Collector.h"
#include "InputData.h"
#include "Sampler.h"
#include "TransitionModel.h"

namespace ipsim {
    struct BatchOptions {
        int numSamples = 1; /**< PSA draws */
        double horizon = 1.0; /**< time horizon, finite and > 0 */
        std::optional<double> maxAge; /**< caps each patient's horizon at maxAge - age */
        std::string ageVariable = "age"; /**< patient covariate holding the age, used with maxAge */
        uint64_t seed = 0; /**< base seed for every replicate stream */
        int maxWorkers = 1;
        int chunkSize = 64; /**< replicates per work item */
        int maxTransitions = 10000; /**< per trajectory */
        double timeBudget = 0.0; /**< wall-clock seconds, 0 = unlimited */
    };

    /**
     * @brief A replicate whose trajectory raised a SamplingFault.
     */
    struct FailedReplicate {
        ReplicateKey key;
        std::string message;
    };

    /**
     * @brief Orchestrates PSA draws, parallel trajectory simulation and data collection.
     */
    class BatchSimulator {
    public:
        /**
         * @brief Draws the PSA sample and binds every replicate once.
         * @param sampler     source of PSA draws
         * @param input       strategies and patients
         * @param layout      variable layout the model and collectors were compiled against
         * @param model       transition model; each worker gets a copy
         * @param collectors  data collectors; each worker gets a copy
         * @param options     run settings
         * @throws ConfigurationError or ParameterError if any replicate cannot be bound
         */
        BatchSimulator(Sampler& sampler, const InputData& input, const VariableLayout& layout,
                       const TransitionModel& model, const DataCollectorGroup& collectors, BatchOptions options);

        /**
         * @brief Run all replicates, merging results into `collectors()`.
         *
         * Every run starts from the collectors given to the constructor; results of an earlier run
         * are replaced, not added to.
         */
        void run();

        /** @brief Stop this and any later run() after the current replicate. Thread-safe. */
        void cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }

        /** @brief True if the last run() stopped early (cancel or time budget). */
        bool interrupted() const noexcept { return interrupted_; }

        /** @brief Access the merged collectors of the last `run()`. */
        const DataCollectorGroup& collectors() const { return collectors_; }

        /** @brief Faulted replicates, ordered by key. */
        const std::vector<FailedReplicate>& failures() const noexcept { return failures_; }

        const std::vector<Draw>& draws() const noexcept { return draws_; }

        /** @brief Replicates run to completion or fault by the last run(). */
        int64_t processed() const noexcept { return processed_; }

        /** @brief Strategies × patients × draws. */
        int64_t numReplicates() const noexcept;

    private:
        const InputData& input_;
        const VariableLayout& layout_;
        const TransitionModel& model_;
        const DataCollectorGroup prototype_; /**< as passed in; workers and each run start from copies */
        DataCollectorGroup collectors_;
        const BatchOptions options_;
        std::vector<Draw> draws_;
        std::optional<size_t> ageColumn_;

        std::atomic<bool> cancelled_{false};
        std::optional<std::chrono::steady_clock::time_point> deadline_;
        bool interrupted_ = false;
        int64_t processed_ = 0;
        std::vector<FailedReplicate> failures_;

        double horizonFor(const Patient& patient) const;

        ReplicateKey keyOf(int64_t index, const Draw*& draw, const Strategy*& strategy,
                           const Patient*& patient) const;

        void validate() const;

        struct WorkerState;

        void processChunk(int64_t chunkIndex, WorkerState& worker) const;
    };
}
