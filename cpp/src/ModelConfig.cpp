#include "ModelConfig.h"

#include <fstream>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>

#include "Errors.h"

using namespace ipsim;
namespace po = boost::program_options;

namespace {
    using Strings = std::vector<std::string>;

    Strings words(const std::string& text) {
        Strings out;
        const std::string trimmed = boost::algorithm::trim_copy(text);
        if (trimmed.empty()) return out;
        boost::algorithm::split(out, trimmed, boost::algorithm::is_space(), boost::algorithm::token_compress_on);
        return out;
    }

    Strings fields(const std::string& text, const char* separators) {
        Strings out;
        boost::algorithm::split(out, text, boost::algorithm::is_any_of(separators));
        for (auto& f : out) boost::algorithm::trim(f);
        return out;
    }

    double number(const std::string& text, const std::string& context) {
        try {
            return boost::lexical_cast<double>(boost::algorithm::trim_copy(text));
        } catch (const boost::bad_lexical_cast&) {
            throw ConfigurationError(context + ": '" + text + "' is not a number");
        }
    }

    int integer(const std::string& text, const std::string& context) {
        try {
            return boost::lexical_cast<int>(boost::algorithm::trim_copy(text));
        } catch (const boost::bad_lexical_cast&) {
            throw ConfigurationError(context + ": '" + text + "' is not an integer");
        }
    }

    std::vector<double> numberList(const std::string& text, const std::string& context) {
        std::vector<double> out;
        for (const auto& f : fields(text, ",")) out.push_back(number(f, context));
        return out;
    }

    /** Split "head : tail" at the first colon. */
    std::pair<std::string, std::string> headAndBody(const std::string& line, const std::string& context) {
        const auto colon = line.find(':');
        if (colon == std::string::npos) throw ConfigurationError(context + ": expected ':' in '" + line + "'");
        return {boost::algorithm::trim_copy(line.substr(0, colon)), boost::algorithm::trim_copy(line.substr(colon + 1))};
    }

    /** "key=value" option token, or false if `token` is not one for `key`. */
    bool keyed(const std::string& token, const std::string& key, std::string& value) {
        if (!boost::algorithm::starts_with(token, key + "=")) return false;
        value = token.substr(key.size() + 1);
        return true;
    }

    Strings csvRow(const std::string& line) {
        return fields(line, ",");
    }

    bool skipLine(const std::string& line) {
        const std::string trimmed = boost::algorithm::trim_copy(line);
        return trimmed.empty() || trimmed.front() == '#';
    }
}

TransitionSpec ipsim::parseTransition(const std::string& line) {
    const auto parts = headAndBody(line, "transition");
    const Strings head = words(parts.first);
    if (head.size() < 3)
        throw ConfigurationError("transition: expected 'From To family' before ':' in '" + line + "'");

    TransitionSpec spec{head[0], head[1], FamilySpec{familyFromName(head[2]), {}}, {}};
    for (size_t i = 3; i < head.size(); ++i) {
        std::string value;
        if (keyed(head[i], "knots", value) || keyed(head[i], "cuts", value))
            spec.family.knots = numberList(value, "transition " + head[0] + "->" + head[1]);
        else
            throw ConfigurationError("transition " + head[0] + "->" + head[1] + ": unknown option '" + head[i] + "'");
    }
    if (!parts.second.empty()) spec.parameters = fields(parts.second, "|");
    return spec;
}

ValueSpec ipsim::parseValue(const std::string& line) {
    const auto parts = headAndBody(line, "value");
    const Strings head = words(parts.first);
    if (head.size() < 3)
        throw ConfigurationError("value: expected 'kind name method' before ':' in '" + line + "'");

    ValueSpec spec;
    spec.kind = valueKindFromName(head[0]);
    spec.name = head[1];
    spec.method = valueMethodFromName(head[2]);
    for (size_t i = 3; i < head.size(); ++i) {
        std::string value;
        if (keyed(head[i], "times", value))
            spec.times = numberList(value, "value " + spec.name);
        else if (head[i] == "time-reset")
            spec.timeReset = true;
        else
            throw ConfigurationError("value " + spec.name + ": unknown option '" + head[i] + "'");
    }

    for (const auto& entry : fields(parts.second, ";")) {
        if (entry.empty()) continue;
        const auto eq = entry.find('=');
        if (eq == std::string::npos)
            throw ConfigurationError("value " + spec.name + ": expected 'State = expression' in '" + entry + "'");
        spec.states.emplace_back(boost::algorithm::trim_copy(entry.substr(0, eq)), fields(entry.substr(eq + 1), "|"));
    }
    return spec;
}


ModelDefinition ipsim::parseModel(std::istream& in, const std::string& source) {
    po::options_description desc("model file");
    desc.add_options()
        ("model.states", po::value<std::string>()->required(), "state names")
        ("model.initial", po::value<std::string>()->required(), "initial state")
        ("model.clock", po::value<std::string>()->default_value("reset"), "reset, forward or mixed")
        ("model.reset-states", po::value<std::string>()->default_value(""), "states that reset a mixed clock")
        ("model.method", po::value<std::string>()->default_value("invcdf"), "invcdf or discrete")
        ("model.step", po::value<double>()->default_value(0.1), "discrete sampling step")
        ("model.max-retries", po::value<int>()->default_value(20), "sampling attempts per edge")
        ("model.max-transitions", po::value<int>()->default_value(10000), "transitions per trajectory")
        ("model.transition", po::value<Strings>()->composing(), "From To family : parameters")
        ("strategies.covariates", po::value<std::string>()->default_value(""), "strategy covariate names")
        ("strategies.strategy", po::value<Strings>()->composing(), "name covariate values...")
        ("strategies.reference", po::value<std::string>()->default_value(""), "comparator strategy")
        ("values.value", po::value<Strings>()->composing(), "kind name method : State = value ; ...")
        ("psa.parameter", po::value<Strings>()->composing(), "name min [max]")
        ("psa.scramble", po::value<bool>()->default_value(true), "shuffle Latin hypercube strata")
        ("simulation.horizon", po::value<double>()->required(), "time horizon")
        ("simulation.max-age", po::value<double>(), "cap each patient's horizon at max-age - age")
        ("simulation.age-variable", po::value<std::string>()->default_value("age"), "patient age covariate")
        ("simulation.samples", po::value<int>()->default_value(1), "PSA draws")
        ("simulation.seed", po::value<uint64_t>()->default_value(1), "random seed")
        ("simulation.threads", po::value<int>()->default_value(1), "worker threads")
        ("simulation.chunk-size", po::value<int>()->default_value(64), "replicates per work item")
        ("simulation.discount", po::value<std::vector<double>>()->composing(), "continuous discount rate")
        ("simulation.wtp", po::value<std::vector<double>>()->composing(), "willingness to pay")
        ("simulation.occupancy-step", po::value<double>()->default_value(0.0), "state occupancy grid step")
        ("simulation.keep-events", po::value<bool>()->default_value(false), "write the event history")
        ("simulation.time-budget", po::value<double>()->default_value(0.0), "wall-clock seconds, 0 = none");

    po::variables_map vm;
    try {
        po::store(po::parse_config_file(in, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        throw ConfigurationError(source + ": " + e.what());
    }

    const auto list = [&vm](const char* key) { return vm.count(key) ? vm[key].as<Strings>() : Strings{}; };

    ModelDefinition def;
    def.states = words(vm["model.states"].as<std::string>());
    def.initial = boost::algorithm::trim_copy(vm["model.initial"].as<std::string>());
    def.options.clock = clockFromName(vm["model.clock"].as<std::string>());
    def.options.resetStates = words(vm["model.reset-states"].as<std::string>());
    def.options.method = samplingMethodFromName(vm["model.method"].as<std::string>());
    def.options.step = vm["model.step"].as<double>();
    def.options.maxRetries = vm["model.max-retries"].as<int>();
    for (const auto& line : list("model.transition")) def.transitions.push_back(parseTransition(line));

    def.strategyCovariates = words(vm["strategies.covariates"].as<std::string>());
    int strategyId = 0;
    for (const auto& line : list("strategies.strategy")) {
        const Strings tokens = words(line);
        if (tokens.size() != def.strategyCovariates.size() + 1)
            throw ConfigurationError(source + ": strategy '" + line + "' needs a name and " +
                                     std::to_string(def.strategyCovariates.size()) + " covariate values");
        Strategy strategy{strategyId++, tokens.front(), {}};
        for (size_t i = 1; i < tokens.size(); ++i)
            strategy.covariates.push_back(number(tokens[i], "strategy " + tokens.front()));
        def.strategies.push_back(std::move(strategy));
    }
    def.reference = boost::algorithm::trim_copy(vm["strategies.reference"].as<std::string>());

    for (const auto& line : list("values.value")) def.values.push_back(parseValue(line));

    for (const auto& line : list("psa.parameter")) {
        const Strings tokens = words(line);
        if (tokens.size() != 2 && tokens.size() != 3)
            throw ConfigurationError(source + ": parameter '" + line + "' must be 'name min [max]'");
        const double lo = number(tokens[1], "parameter " + tokens[0]);
        const double hi = tokens.size() == 3 ? number(tokens[2], "parameter " + tokens[0]) : lo;
        def.parameters.emplace_back(tokens[0], lo, hi);
    }
    def.scramble = vm["psa.scramble"].as<bool>();

    auto& batch = def.batch;
    batch.horizon = vm["simulation.horizon"].as<double>();
    if (vm.count("simulation.max-age")) batch.maxAge = vm["simulation.max-age"].as<double>();
    batch.ageVariable = vm["simulation.age-variable"].as<std::string>();
    batch.numSamples = vm["simulation.samples"].as<int>();
    batch.seed = vm["simulation.seed"].as<uint64_t>();
    batch.maxWorkers = vm["simulation.threads"].as<int>();
    batch.chunkSize = vm["simulation.chunk-size"].as<int>();
    batch.maxTransitions = vm["model.max-transitions"].as<int>();
    batch.timeBudget = vm["simulation.time-budget"].as<double>();

    def.discountRates = vm.count("simulation.discount") ? vm["simulation.discount"].as<std::vector<double>>()
                                                         : std::vector<double>{0.0};
    if (vm.count("simulation.wtp")) def.wtp = vm["simulation.wtp"].as<std::vector<double>>();
    def.occupancyStep = vm["simulation.occupancy-step"].as<double>();
    if (!(def.occupancyStep >= 0.0)) throw ConfigurationError(source + ": occupancy-step must be >= 0");
    def.keepEvents = vm["simulation.keep-events"].as<bool>();

    if (def.strategies.empty()) def.strategies.push_back(Strategy{0, "default", {}});
    return def;
}

ModelDefinition ipsim::loadModel(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigurationError("cannot open model file '" + path + "'");
    return parseModel(in, path);
}


PatientTable ipsim::readPatients(std::istream& in, const std::string& source) {
    std::string line;
    while (std::getline(in, line) && skipLine(line)) {}
    const Strings header = csvRow(line);
    if (header.empty() || header.front() != "patient_id")
        throw ConfigurationError(source + ": patient table must start with a 'patient_id' column");

    const bool hasGroup = header.size() > 1 && header[1] == "group";
    const size_t first = hasGroup ? 2 : 1;

    PatientTable table;
    table.covariates.assign(header.begin() + first, header.end());
    int lineNo = 1;
    while (std::getline(in, line)) {
        ++lineNo;
        if (skipLine(line)) continue;
        const Strings row = csvRow(line);
        const std::string context = source + ":" + std::to_string(lineNo);
        if (row.size() != header.size())
            throw ConfigurationError(context + ": expected " + std::to_string(header.size()) + " fields, got " +
                                     std::to_string(row.size()));
        Patient patient{integer(row[0], context), hasGroup ? integer(row[1], context) : 0, {}};
        for (size_t i = first; i < row.size(); ++i) patient.covariates.push_back(number(row[i], context));
        table.patients.push_back(std::move(patient));
    }
    return table;
}

FixedDrawSampler ipsim::readDraws(std::istream& in, const std::string& source) {
    std::string line;
    while (std::getline(in, line) && skipLine(line)) {}
    Strings names = csvRow(line);
    if (names.empty() || names.front().empty()) throw ConfigurationError(source + ": draws table has no header");

    std::vector<std::vector<double>> rows;
    int lineNo = 1;
    while (std::getline(in, line)) {
        ++lineNo;
        if (skipLine(line)) continue;
        const Strings row = csvRow(line);
        const std::string context = source + ":" + std::to_string(lineNo);
        if (row.size() != names.size())
            throw ConfigurationError(context + ": expected " + std::to_string(names.size()) + " fields, got " +
                                     std::to_string(row.size()));
        std::vector<double> values;
        values.reserve(row.size());
        for (const auto& f : row) values.push_back(number(f, context));
        rows.push_back(std::move(values));
    }
    return FixedDrawSampler(std::move(names), std::move(rows));
}
