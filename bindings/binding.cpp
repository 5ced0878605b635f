#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <sstream>

#include "BatchSimulator.h"
#include "Collector.h"
#include "Distribution.h"
#include "ModelConfig.h"
#include "NumericSampling.h"
#include "Parameter.h"
#include "Sampler.h"
#include "StateValue.h"
#include "Summary.h"
#include "TransitionModel.h"


namespace py = pybind11;
using namespace ipsim;


namespace ipsim {
     /**
      * @brief Owns every object a batch run references, built from model file text.
      */
     struct PySimulation {
          ModelDefinition def;
          std::unique_ptr<InputData> input;
          std::shared_ptr<Sampler> sampler;
          std::unique_ptr<VariableLayout> layout;
          std::unique_ptr<TransitionModel> model;
          std::unique_ptr<StateValue> values;
          std::unique_ptr<BatchSimulator> core;

          PySimulation(const std::string& modelText,
                       const std::vector<std::string>& patientCovariates,
                       const std::vector<Patient>& patients,
                       const std::shared_ptr<Sampler>& draws,
                       const bool keepEvents,
                       const double occupancyStep) {
               std::istringstream in(modelText);
               def = parseModel(in, "<model>");
               input = std::make_unique<InputData>(def.strategyCovariates, def.strategies, patientCovariates, patients);
               sampler = draws ? draws
                               : std::make_shared<LatinHypercubeSampler>(def.parameters, RngEngine(def.batch.seed),
                                                                         def.scramble);
               layout = std::make_unique<VariableLayout>(sampler->parameterNames(), *input);
               model = std::make_unique<TransitionModel>(def.states, def.initial, def.transitions, *layout,
                                                         def.options);
               values = std::make_unique<StateValue>(model->graph(), def.values, *layout, def.discountRates);

               std::vector<std::shared_ptr<DataCollector>> collectors{std::make_shared<OutcomeCollector>(*values)};
               if (keepEvents || def.keepEvents) collectors.push_back(std::make_shared<EventHistoryCollector>());
               if (occupancyStep > 0.0) {
                    std::vector<double> grid;
                    for (int i = 0; i * occupancyStep <= def.batch.horizon; ++i) grid.push_back(i * occupancyStep);
                    collectors.push_back(std::make_shared<StateOccupancyCollector>(model->sharedGraph(), grid));
               }
               core = std::make_unique<BatchSimulator>(*sampler, *input, *layout, *model,
                                                       DataCollectorGroup(collectors), def.batch);
          }

          void run() const {
               py::gil_scoped_release release;
               core->run();
          }

          std::vector<DrawOutcome> outcomes(const bool byGroup) const {
               return drawOutcomes(core->collectors().find<OutcomeCollector>()->cells(), byGroup);
          }

          std::vector<EventRow> events() const {
               const auto* events = core->collectors().find<EventHistoryCollector>();
               if (!events) throw py::value_error("event histories were not kept; pass keep_events=True");
               return events->rows();
          }

          int strategyId(const std::string& name) const {
               const auto index = input->strategyIndex(name);
               if (!index) throw py::value_error("Unknown strategy '" + name + "'");
               return input->strategies()[*index].id;
          }
     };
}


PYBIND11_MODULE(_ipsim, m) {
     m.doc() = "Individual patient simulation of multi-state models";

     py::register_exception<ConfigurationError>(m, "ConfigurationError", PyExc_ValueError);
     py::register_exception<ParameterError>(m, "ParameterError", PyExc_ValueError);
     py::register_exception<SamplingFault>(m, "SamplingFault", PyExc_RuntimeError);

     // Parameter
     py::class_<Parameter>(m, "Parameter")
          .def(py::init<std::string, double, double>(),
               py::arg("name"),
               py::arg("min"),
               py::arg("max")
          )
          .def_readonly("name", &Parameter::name)
          .def_readonly("min", &Parameter::min)
          .def_readonly("max", &Parameter::max)
          .def("is_fixed", &Parameter::isFixed);

     py::class_<Sampler, std::shared_ptr<Sampler>>(m, "Sampler")
          .def("parameter_names", &Sampler::parameterNames);

     py::class_<LatinHypercubeSampler, Sampler, std::shared_ptr<LatinHypercubeSampler>>(m, "LatinHypercubeSampler")
          .def(py::init([](const std::vector<Parameter>& vec, const uint64_t seed, const bool scramble) {
                    return std::make_shared<LatinHypercubeSampler>(vec, RngEngine(seed), scramble);
               }),
               py::arg("parameters"),
               py::arg("seed"),
               py::arg("scramble") = true
          );

     py::class_<FixedDrawSampler, Sampler, std::shared_ptr<FixedDrawSampler>>(m, "FixedDrawSampler")
          .def(py::init<std::vector<std::string>, std::vector<std::vector<double>>>(),
               py::arg("names"),
               py::arg("rows"),
               "Hand out fitted parameter draws, one row per PSA sample."
          )
          .def("__len__", &FixedDrawSampler::size);

     py::class_<Patient>(m, "Patient")
          .def(py::init([](const int id, const int group, const std::vector<double>& covariates) {
                    return Patient{id, group, covariates};
               }),
               py::arg("id"),
               py::arg("group") = 0,
               py::arg("covariates") = std::vector<double>{}
          )
          .def_readonly("id", &Patient::id)
          .def_readonly("group", &Patient::group)
          .def_readonly("covariates", &Patient::covariates);

     // Distributions, for inspecting a family outside a model
     py::class_<Distribution>(m, "Distribution")
          .def(py::init([](const std::string& family, const std::vector<double>& params,
                           const std::vector<double>& knots) {
                    return Distribution::create(FamilySpec{familyFromName(family), knots}, params, family);
               }),
               py::arg("family"),
               py::arg("params"),
               py::arg("knots") = std::vector<double>{}
          )
          .def("survival", &Distribution::survival, py::arg("t"))
          .def("cdf", &Distribution::cdf, py::arg("t"))
          .def("hazard", &Distribution::hazard, py::arg("t"))
          .def("cum_hazard", &Distribution::cumHazard, py::arg("t"))
          .def("quantile", [](const Distribution& d, const double p) { return quantile(d, p); }, py::arg("p"));

     // Results
     py::class_<ReplicateKey>(m, "ReplicateKey")
          .def_readonly("sample", &ReplicateKey::sample)
          .def_readonly("strategy", &ReplicateKey::strategy)
          .def_readonly("patient", &ReplicateKey::patient)
          .def_readonly("group", &ReplicateKey::group);

     py::class_<EventRecord>(m, "EventRecord")
          .def_readonly("from_state", &EventRecord::from)
          .def_readonly("to_state", &EventRecord::to)
          .def_readonly("time_start", &EventRecord::timeStart)
          .def_readonly("time_stop", &EventRecord::timeStop)
          .def_readonly("is_final", &EventRecord::isFinal);

     py::class_<EventRow>(m, "EventRow")
          .def_readonly("key", &EventRow::key)
          .def_readonly("record", &EventRow::record);

     py::class_<FailedReplicate>(m, "FailedReplicate")
          .def_readonly("key", &FailedReplicate::key)
          .def_readonly("message", &FailedReplicate::message);

     py::class_<DrawOutcome>(m, "DrawOutcome")
          .def_readonly("sample", &DrawOutcome::sample)
          .def_readonly("strategy", &DrawOutcome::strategy)
          .def_readonly("group", &DrawOutcome::group)
          .def_readonly("count", &DrawOutcome::count)
          .def_readonly("missing", &DrawOutcome::missing)
          .def_readonly("means", &DrawOutcome::means);

     py::class_<Statistic>(m, "Statistic")
          .def_readonly("n", &Statistic::n)
          .def_readonly("mean", &Statistic::mean)
          .def_readonly("sd", &Statistic::sd)
          .def_readonly("lower", &Statistic::lower)
          .def_readonly("upper", &Statistic::upper);

     py::class_<StrategySummary>(m, "StrategySummary")
          .def_readonly("strategy", &StrategySummary::strategy)
          .def_readonly("group", &StrategySummary::group)
          .def_readonly("rate", &StrategySummary::rate)
          .def_readonly("columns", &StrategySummary::columns);

     py::class_<IncrementalResult>(m, "IncrementalResult")
          .def_readonly("strategy", &IncrementalResult::strategy)
          .def_readonly("group", &IncrementalResult::group)
          .def_readonly("rate", &IncrementalResult::rate)
          .def_readonly("cost", &IncrementalResult::cost)
          .def_readonly("qalys", &IncrementalResult::qalys)
          .def_readonly("icer", &IncrementalResult::icer)
          .def_readonly("inmb", &IncrementalResult::inmb);

     py::class_<AcceptabilityPoint>(m, "AcceptabilityPoint")
          .def_readonly("group", &AcceptabilityPoint::group)
          .def_readonly("rate", &AcceptabilityPoint::rate)
          .def_readonly("wtp", &AcceptabilityPoint::wtp)
          .def_readonly("strategy", &AcceptabilityPoint::strategy)
          .def_readonly("probability", &AcceptabilityPoint::probability);

     m.attr("ALL_GROUPS") = ALL_GROUPS;
     m.def("summarize_strategies", &summarizeStrategies, py::arg("outcomes"));

     // Simulation
     py::class_<PySimulation, std::shared_ptr<PySimulation>>(m, "PySimulation")
          .def(py::init<std::string, std::vector<std::string>, std::vector<Patient>, std::shared_ptr<Sampler>,
                        bool, double>(),
               py::arg("model"),
               py::arg("patient_covariates"),
               py::arg("patients"),
               py::arg("draws") = nullptr,
               py::arg("keep_events") = false,
               py::arg("occupancy_step") = 0.0
          )
          .def("run", &PySimulation::run)
          .def("cancel", [](const PySimulation& s) { s.core->cancel(); })
          .def("interrupted", [](const PySimulation& s) { return s.core->interrupted(); })
          .def("states", [](const PySimulation& s) { return s.def.states; })
          .def("columns", [](const PySimulation& s) { return s.values->columnNames(); })
          .def("discount_rates", [](const PySimulation& s) { return s.values->discountRates(); })
          .def("strategy_id", &PySimulation::strategyId, py::arg("name"))
          .def("outcomes", &PySimulation::outcomes, py::arg("by_group") = false)
          .def("events", &PySimulation::events)
          .def("failures", [](const PySimulation& s) { return s.core->failures(); })
          .def("incremental", [](const PySimulation& s, const std::string& reference, const std::vector<double>& wtp,
                                 const bool byGroup) {
                    return incrementalAnalysis(s.outcomes(byGroup), s.strategyId(reference),
                                               s.values->totalCostColumn(), s.values->qalyColumn(), wtp);
               },
               py::arg("reference"),
               py::arg("wtp") = std::vector<double>{},
               py::arg("by_group") = false
          )
          .def("acceptability", [](const PySimulation& s, const std::vector<double>& wtp, const bool byGroup) {
                    std::vector<int> strategies;
                    for (const auto& st : s.input->strategies()) strategies.push_back(st.id);
                    return acceptabilityCurve(s.outcomes(byGroup), strategies, s.values->totalCostColumn(),
                                              s.values->qalyColumn(), wtp);
               },
               py::arg("wtp"),
               py::arg("by_group") = false
          );
}
