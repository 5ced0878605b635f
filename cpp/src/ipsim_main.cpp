#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <boost/log/trivial.hpp>
#include <boost/program_options.hpp>

#include "BatchSimulator.h"
#include "Collector.h"
#include "Errors.h"
#include "Logging.h"
#include "ModelConfig.h"
#include "OutputWriter.h"
#include "Summary.h"

using namespace ipsim;

namespace {
    std::ofstream openOutput(const std::string& prefix, const std::string& name) {
        const std::string path = prefix + name;
        std::ofstream os(path);
        if (!os) throw std::runtime_error("cannot write '" + path + "'");
        BOOST_LOG_TRIVIAL(info) << "writing " << path;
        return os;
    }

    std::unique_ptr<Sampler> makeSampler(const ModelDefinition& def, const std::string& drawsFile) {
        if (drawsFile.empty())
            return std::make_unique<LatinHypercubeSampler>(def.parameters, RngEngine(def.batch.seed), def.scramble);
        std::ifstream in(drawsFile);
        if (!in) throw ConfigurationError("cannot open draws file '" + drawsFile + "'");
        return std::make_unique<FixedDrawSampler>(readDraws(in, drawsFile));
    }

    std::vector<double> occupancyGrid(const double step, const double horizon) {
        std::vector<double> grid;
        if (step <= 0.0) return grid;
        for (int i = 0; static_cast<double>(i) * step <= horizon; ++i) grid.push_back(static_cast<double>(i) * step);
        return grid;
    }
}

int main(int argc, char* argv[]) {
    namespace po = boost::program_options;
    po::options_description desc("Individual patient simulation of multi-state models.");
    std::string modelFile;
    std::string patientFile;
    std::string drawsFile;
    std::string outputPrefix("ipsim_");
    std::string logLevel;

    desc.add_options()
        ("help", "show help message")
        ("model,m", po::value<std::string>(&modelFile)->required(), "model definition file")
        ("patients,p", po::value<std::string>(&patientFile)->required(), "patient table (CSV)")
        ("draws,d", po::value<std::string>(&drawsFile)->default_value(""),
            "PSA draws table (CSV); replaces the [psa] parameters")
        ("output,o", po::value<std::string>(&outputPrefix)->default_value(outputPrefix),
            "prefix of the output files")
        ("threads,j", po::value<int>(), "number of threads")
        ("samples,n", po::value<int>(), "number of PSA draws")
        ("seed", po::value<uint64_t>(), "seed for random number generator")
        ("horizon", po::value<double>(), "time horizon")
        ("keep-events", po::value<bool>(), "write the event history table")
        ("loglevel", po::value<std::string>(&logLevel)->default_value("info"),
            "Set the logging level to trace, debug, info, warning, error, or fatal.");

    po::positional_options_description positional;
    positional.add("model", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(), vm);
        if (vm.count("help")) {
            std::cout << desc << std::endl;
            return 0;
        }
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << e.what() << "\n" << desc << std::endl;
        return 1;
    }

    try {
        initLogging(logLevel);

        ModelDefinition def = loadModel(modelFile);
        if (vm.count("threads")) def.batch.maxWorkers = vm["threads"].as<int>();
        if (vm.count("samples")) def.batch.numSamples = vm["samples"].as<int>();
        if (vm.count("seed")) def.batch.seed = vm["seed"].as<uint64_t>();
        if (vm.count("horizon")) def.batch.horizon = vm["horizon"].as<double>();
        if (vm.count("keep-events")) def.keepEvents = vm["keep-events"].as<bool>();

        std::ifstream patientStream(patientFile);
        if (!patientStream) throw ConfigurationError("cannot open patient file '" + patientFile + "'");
        PatientTable table = readPatients(patientStream, patientFile);
        const InputData input(def.strategyCovariates, def.strategies, table.covariates, table.patients);

        const std::string referenceName = def.reference.empty() ? input.strategies().front().name : def.reference;
        const auto reference = input.strategyIndex(referenceName);
        if (!reference) throw ConfigurationError("reference strategy '" + referenceName + "' is not defined");

        auto sampler = makeSampler(def, drawsFile);
        const VariableLayout layout(sampler->parameterNames(), input);
        const TransitionModel model(def.states, def.initial, def.transitions, layout, def.options);
        const StateValue values(model.graph(), def.values, layout, def.discountRates);

        std::vector<std::shared_ptr<DataCollector>> collectors{std::make_shared<OutcomeCollector>(values)};
        if (def.keepEvents) collectors.push_back(std::make_shared<EventHistoryCollector>());
        const auto grid = occupancyGrid(def.occupancyStep, def.batch.horizon);
        if (!grid.empty()) collectors.push_back(std::make_shared<StateOccupancyCollector>(model.sharedGraph(), grid));

        BatchSimulator simulator(*sampler, input, layout, model, DataCollectorGroup(collectors), def.batch);
        simulator.run();

        const auto& results = simulator.collectors();
        const OutputWriter writer(input, def.states, values.columnNames(), values.discountRates());
        const auto* outcomes = results.find<OutcomeCollector>();

        auto draws = drawOutcomes(outcomes->cells(), true);
        const auto pooled = drawOutcomes(outcomes->cells(), false);
        draws.insert(draws.end(), pooled.begin(), pooled.end());

        std::vector<int> strategyIds;
        for (const auto& s : input.strategies()) strategyIds.push_back(s.id);
        const int referenceId = input.strategies()[*reference].id;

        auto os = openOutput(outputPrefix, "outcomes.csv");
        writer.writeOutcomes(os, draws);
        os = openOutput(outputPrefix, "summary.csv");
        writer.writeSummaries(os, summarizeStrategies(draws));
        if (strategyIds.size() > 1) {
            os = openOutput(outputPrefix, "incremental.csv");
            writer.writeIncremental(os, incrementalAnalysis(draws, referenceId, values.totalCostColumn(),
                                                            values.qalyColumn(), def.wtp),
                                    def.wtp);
            if (!def.wtp.empty()) {
                os = openOutput(outputPrefix, "ceac.csv");
                writer.writeAcceptability(os, acceptabilityCurve(draws, strategyIds, values.totalCostColumn(),
                                                                 values.qalyColumn(), def.wtp));
            }
        }
        if (const auto* events = results.find<EventHistoryCollector>()) {
            os = openOutput(outputPrefix, "events.csv");
            writer.writeEvents(os, events->rows());
        }
        if (const auto* occupancy = results.find<StateOccupancyCollector>()) {
            os = openOutput(outputPrefix, "occupancy.csv");
            writer.writeOccupancy(os, *occupancy);
        }
        if (!simulator.failures().empty()) {
            os = openOutput(outputPrefix, "failures.csv");
            writer.writeFailures(os, simulator.failures());
        }
    } catch (const std::invalid_argument& e) {
        BOOST_LOG_TRIVIAL(error) << e.what();
        return 1;
    } catch (const std::runtime_error& e) {
        BOOST_LOG_TRIVIAL(error) << e.what();
        return 2;
    }
    return 0;
}
