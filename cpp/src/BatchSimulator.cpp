#include "BatchSimulator.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <memory>
#include <thread>

#include <boost/log/trivial.hpp>

#include "Errors.h"
#include "TrajectorySimulator.h"

using namespace ipsim;

struct BatchSimulator::WorkerState {
    WorkerState(const TransitionModel& model_, const DataCollectorGroup& collectors_, const int maxTransitions)
        : model(model_), collectors(collectors_), simulator(model, maxTransitions) {}

    TransitionModel model;
    DataCollectorGroup collectors;
    TrajectorySimulator simulator;

    // scratch
    std::vector<double> scope;
    std::vector<Distribution> bound;
    std::vector<EventRecord> history;

    std::vector<FailedReplicate> failures;
    int64_t processed = 0;
    bool stopped = false;
    std::exception_ptr error;
    std::thread thread;
};


BatchSimulator::BatchSimulator(Sampler& sampler, const InputData& input, const VariableLayout& layout,
                               const TransitionModel& model, const DataCollectorGroup& collectors,
                               BatchOptions options)
    : input_(input), layout_(layout), model_(model), prototype_(collectors), collectors_(collectors),
      options_(std::move(options)) {
    if (options_.numSamples < 1) throw ConfigurationError("BatchSimulator: samples must be at least 1");
    if (!(options_.horizon > 0.0) || !std::isfinite(options_.horizon))
        throw ConfigurationError("BatchSimulator: horizon must be finite and > 0");
    if (options_.maxWorkers < 1) throw ConfigurationError("BatchSimulator: threads must be at least 1");
    if (options_.chunkSize < 1) throw ConfigurationError("BatchSimulator: chunk size must be at least 1");
    if (!(options_.timeBudget >= 0.0)) throw ConfigurationError("BatchSimulator: time budget must be >= 0");

    if (options_.maxAge) {
        ageColumn_ = input_.patientCovariateIndex(options_.ageVariable);
        if (!ageColumn_)
            throw ConfigurationError("BatchSimulator: max age is set but patients have no '" +
                                     options_.ageVariable + "' column");
    }

    draws_ = sampler.sampleBlock(options_.numSamples);
    validate();
}

int64_t BatchSimulator::numReplicates() const noexcept {
    return static_cast<int64_t>(draws_.size()) * static_cast<int64_t>(input_.strategies().size()) *
           static_cast<int64_t>(input_.patients().size());
}

ReplicateKey BatchSimulator::keyOf(const int64_t index, const Draw*& draw, const Strategy*& strategy,
                                   const Patient*& patient) const {
    const auto nPatients = static_cast<int64_t>(input_.patients().size());
    const auto nStrategies = static_cast<int64_t>(input_.strategies().size());
    patient = &input_.patients()[index % nPatients];
    strategy = &input_.strategies()[(index / nPatients) % nStrategies];
    draw = &draws_[index / (nPatients * nStrategies)];
    return ReplicateKey{draw->sample, strategy->id, patient->id, patient->group};
}

double BatchSimulator::horizonFor(const Patient& patient) const {
    if (!ageColumn_) return options_.horizon;
    const double remaining = *options_.maxAge - patient.covariates[*ageColumn_];
    return std::clamp(remaining, 0.0, options_.horizon);
}

void BatchSimulator::validate() const {
    DataCollectorGroup trial(prototype_);
    std::vector<double> scope;
    std::vector<Distribution> bound;
    const Draw* draw;
    const Strategy* strategy;
    const Patient* patient;

    const int64_t n = numReplicates();
    for (int64_t i = 0; i < n; ++i) {
        const ReplicateKey key = keyOf(i, draw, strategy, patient);
        layout_.assemble(*draw, *strategy, *patient, scope);
        try {
            model_.bind(scope, bound);
            trial.reset(key, scope);
        } catch (const std::invalid_argument&) {
            BOOST_LOG_TRIVIAL(error) << "cannot bind replicate sample=" << key.sample << " strategy="
                                     << strategy->name << " patient=" << key.patient;
            throw;
        }
    }
    BOOST_LOG_TRIVIAL(debug) << "bound " << n << " replicates";
}


void BatchSimulator::run() {
    const int64_t total = numReplicates();
    const int64_t nChunks = (total + options_.chunkSize - 1) / options_.chunkSize;
    std::atomic<int64_t> nextChunk{0};

    deadline_.reset();
    if (options_.timeBudget > 0.0)
        deadline_ = std::chrono::steady_clock::now() +
                    std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                        std::chrono::duration<double>(options_.timeBudget));

    BOOST_LOG_TRIVIAL(info) << "simulating " << total << " replicates (" << draws_.size() << " draws x "
                            << input_.strategies().size() << " strategies x " << input_.patients().size()
                            << " patients) on " << options_.maxWorkers << " threads";

    processed_ = 0;
    interrupted_ = false;
    failures_.clear();
    collectors_ = DataCollectorGroup(prototype_);

    std::vector<std::unique_ptr<WorkerState>> workers;
    workers.reserve(options_.maxWorkers);
    try {
        for (int i = 0; i < options_.maxWorkers; ++i) {
            workers.push_back(std::make_unique<WorkerState>(model_, prototype_, options_.maxTransitions));
            auto& wk = *workers.back();
            wk.thread = std::thread([&wk, &nextChunk, nChunks, this] {
                try {
                    while (!wk.stopped) {
                        const int64_t chunkIdx = nextChunk.fetch_add(1, std::memory_order_relaxed);
                        if (chunkIdx >= nChunks) break;
                        processChunk(chunkIdx, wk);
                    }
                } catch (...) {
                    wk.error = std::current_exception();
                }
            });
        }
    } catch (...) {
        // drain the work list so started workers exit, then join them before unwinding
        nextChunk.store(nChunks, std::memory_order_relaxed);
        for (auto& wk : workers)
            if (wk->thread.joinable()) wk->thread.join();
        throw;
    }

    for (auto& wk : workers) wk->thread.join();
    for (auto& wk : workers)
        if (wk->error) std::rethrow_exception(wk->error);

    for (auto& wk : workers) {
        collectors_.merge(wk->collectors);
        processed_ += wk->processed;
        interrupted_ = interrupted_ || wk->stopped;
        failures_.insert(failures_.end(), wk->failures.begin(), wk->failures.end());
    }
    collectors_.finalize();
    std::sort(failures_.begin(), failures_.end(), [](const FailedReplicate& a, const FailedReplicate& b) {
        return std::tie(a.key.sample, a.key.strategy, a.key.patient) <
               std::tie(b.key.sample, b.key.strategy, b.key.patient);
    });

    if (interrupted_)
        BOOST_LOG_TRIVIAL(warning) << "run stopped early after " << processed_ << " of " << total << " replicates";
    if (!failures_.empty())
        BOOST_LOG_TRIVIAL(warning) << failures_.size() << " replicates failed and are reported as missing";
    BOOST_LOG_TRIVIAL(info) << "finished " << processed_ << " replicates";
}

void BatchSimulator::processChunk(const int64_t chunkIndex, WorkerState& worker) const {
    const int64_t begin = chunkIndex * options_.chunkSize;
    const int64_t end = std::min(begin + options_.chunkSize, numReplicates());
    const Draw* draw;
    const Strategy* strategy;
    const Patient* patient;

    for (int64_t i = begin; i < end; ++i) {
        if (cancelled_.load(std::memory_order_relaxed) ||
            (deadline_ && std::chrono::steady_clock::now() >= *deadline_)) {
            worker.stopped = true;
            return;
        }

        const ReplicateKey key = keyOf(i, draw, strategy, patient);
        layout_.assemble(*draw, *strategy, *patient, worker.scope);
        worker.model.bind(worker.scope, worker.bound);
        worker.collectors.reset(key, worker.scope);

        RngEngine rng(RngEngine::replicateSeed(options_.seed, key.strategy, key.patient, key.sample));
        try {
            const auto result = worker.simulator.run(worker.bound, horizonFor(*patient), rng, worker.history);
            for (const auto& record : worker.history) worker.collectors.registerEvent(record);
            worker.collectors.save(result);
        } catch (const SamplingFault& fault) {
            BOOST_LOG_TRIVIAL(warning) << "replicate sample=" << key.sample << " strategy=" << strategy->name
                                       << " patient=" << key.patient << " failed: " << fault.what();
            worker.collectors.save(TrajectoryResult::FAILED);
            worker.failures.push_back({key, fault.what()});
        }
        ++worker.processed;
    }
}
