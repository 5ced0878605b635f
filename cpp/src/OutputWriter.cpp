#include "OutputWriter.h"

#include <iomanip>
#include <limits>

using namespace ipsim;

namespace {
    void precise(std::ostream& os) {
        os << std::setprecision(std::numeric_limits<double>::max_digits10);
    }

    void statistic(std::ostream& os, const Statistic& s) {
        os << s.n << ',' << s.mean << ',' << s.sd << ',' << s.lower << ',' << s.upper << '\n';
    }

    /** Quote a free-text field. */
    std::string quoted(const std::string& text) {
        std::string out = "\"";
        for (const char c : text) {
            if (c == '"') out += '"';
            out += c;
        }
        return out + '"';
    }
}

OutputWriter::OutputWriter(const InputData& input, std::vector<std::string> states,
                           std::vector<std::string> columns, std::vector<double> rates)
    : states_(std::move(states)), columns_(std::move(columns)), rates_(std::move(rates)) {
    for (const auto& s : input.strategies()) strategyNames_[s.id] = s.name;
}

std::string OutputWriter::group(const int id) {
    return id == ALL_GROUPS ? "all" : std::to_string(id);
}

void OutputWriter::writeEvents(std::ostream& os, const std::vector<EventRow>& rows) const {
    precise(os);
    os << "sample,strategy,patient,from,to,time_start,time_stop,is_final\n";
    for (const auto& row : rows) {
        const auto& r = row.record;
        os << row.key.sample << ',' << strategy(row.key.strategy) << ',' << row.key.patient << ','
           << states_[r.from] << ',' << states_[r.to] << ',' << r.timeStart << ',' << r.timeStop << ','
           << (r.isFinal ? 1 : 0) << '\n';
    }
}

void OutputWriter::writeOutcomes(std::ostream& os, const std::vector<DrawOutcome>& outcomes) const {
    precise(os);
    os << "sample,strategy,group,discount,count,missing";
    for (const auto& c : columns_) os << ',' << c;
    os << '\n';
    for (const auto& o : outcomes) {
        for (size_t r = 0; r < o.means.size(); ++r) {
            os << o.sample << ',' << strategy(o.strategy) << ',' << group(o.group) << ',' << rates_[r] << ','
               << o.count << ',' << o.missing;
            for (const double v : o.means[r]) os << ',' << v;
            os << '\n';
        }
    }
}

void OutputWriter::writeSummaries(std::ostream& os, const std::vector<StrategySummary>& summaries) const {
    precise(os);
    os << "strategy,group,discount,outcome,n,mean,sd,lower,upper\n";
    for (const auto& s : summaries) {
        for (size_t c = 0; c < s.columns.size(); ++c) {
            os << strategy(s.strategy) << ',' << group(s.group) << ',' << rates_[s.rate] << ',' << columns_[c] << ',';
            statistic(os, s.columns[c]);
        }
    }
}

void OutputWriter::writeIncremental(std::ostream& os, const std::vector<IncrementalResult>& results,
                                    const std::vector<double>& wtp) const {
    precise(os);
    os << "strategy,group,discount,measure,wtp,n,mean,sd,lower,upper\n";
    for (const auto& r : results) {
        const auto prefix = [&]() -> std::ostream& {
            return os << strategy(r.strategy) << ',' << group(r.group) << ',' << rates_[r.rate] << ',';
        };
        prefix() << "cost,,";
        statistic(os, r.cost);
        prefix() << "qalys,,";
        statistic(os, r.qalys);
        prefix() << "icer,," << r.cost.n << ',' << r.icer << ",,,\n";
        for (size_t w = 0; w < r.inmb.size(); ++w) {
            prefix() << "inmb," << wtp[w] << ',';
            statistic(os, r.inmb[w]);
        }
    }
}

void OutputWriter::writeAcceptability(std::ostream& os, const std::vector<AcceptabilityPoint>& curve) const {
    precise(os);
    os << "group,discount,wtp,strategy,probability\n";
    for (const auto& p : curve)
        os << group(p.group) << ',' << rates_[p.rate] << ',' << p.wtp << ',' << strategy(p.strategy) << ','
           << p.probability << '\n';
}

void OutputWriter::writeOccupancy(std::ostream& os, const StateOccupancyCollector& occupancy) const {
    precise(os);
    os << "sample,strategy,time";
    for (const auto& s : states_) os << ',' << s;
    os << ",n\n";
    const auto& grid = occupancy.grid();
    for (const auto& entry : occupancy.counts()) {
        for (size_t g = 0; g < grid.size(); ++g) {
            const auto& counts = entry.second[g];
            const long n = counts.back();
            os << entry.first.first << ',' << strategy(entry.first.second) << ',' << grid[g];
            for (size_t s = 0; s < states_.size(); ++s)
                os << ',' << (n > 0 ? static_cast<double>(counts[s]) / static_cast<double>(n)
                                    : std::numeric_limits<double>::quiet_NaN());
            os << ',' << n << '\n';
        }
    }
}

void OutputWriter::writeFailures(std::ostream& os, const std::vector<FailedReplicate>& failures) const {
    os << "sample,strategy,patient,message\n";
    for (const auto& f : failures)
        os << f.key.sample << ',' << strategy(f.key.strategy) << ',' << f.key.patient << ',' << quoted(f.message)
           << '\n';
}
