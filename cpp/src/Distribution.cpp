#include "Distribution.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>

#include <boost/math/distributions/complement.hpp>
#include <boost/math/distributions/gamma.hpp>
#include <boost/math/distributions/lognormal.hpp>

#include "Errors.h"

using namespace ipsim;

namespace {
    constexpr double INF = std::numeric_limits<double>::infinity();

    template <class... Ts>
    struct overloaded : Ts... {
        using Ts::operator()...;
    };
    template <class... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;

    double positivePart(const double x) { return x > 0.0 ? x : 0.0; }

    // s(x) and s'(x) of the Royston–Parmar natural cubic spline
    double splineValue(const dist::Spline& d, const double x, double* slope) {
        const double kmin = d.knots.front();
        const double kmax = d.knots.back();
        double s = d.gamma[0] + d.gamma[1] * x;
        double ds = d.gamma[1];
        for (size_t j = 1; j + 1 < d.knots.size(); ++j) {
            const double kj = d.knots[j];
            const double lambda = (kmax - kj) / (kmax - kmin);
            const double a = positivePart(x - kj);
            const double b = positivePart(x - kmin);
            const double c = positivePart(x - kmax);
            s += d.gamma[j + 1] * (a * a * a - lambda * b * b * b - (1.0 - lambda) * c * c * c);
            ds += d.gamma[j + 1] * 3.0 * (a * a - lambda * b * b - (1.0 - lambda) * c * c);
        }
        if (slope) *slope = ds;
        return s;
    }

    // cumulative hazard
    double cumHazardOf(const dist::Exponential& d, const double t) { return d.rate * t; }

    double cumHazardOf(const dist::Weibull& d, const double t) { return std::pow(t / d.scale, d.shape); }

    double cumHazardOf(const dist::Gamma& d, const double t) {
        const boost::math::gamma_distribution<> g(d.shape, 1.0 / d.rate);
        return -std::log(boost::math::cdf(boost::math::complement(g, t)));
    }

    double cumHazardOf(const dist::Lognormal& d, const double t) {
        const boost::math::lognormal_distribution<> ln(d.meanlog, d.sdlog);
        return -std::log(boost::math::cdf(boost::math::complement(ln, t)));
    }

    double cumHazardOf(const dist::Gompertz& d, const double t) {
        if (d.shape == 0.0) return d.rate * t;
        return d.rate / d.shape * std::expm1(d.shape * t);
    }

    double cumHazardOf(const dist::LogLogistic& d, const double t) {
        return std::log1p(std::pow(t / d.scale, d.shape));
    }

    double cumHazardOf(const dist::PiecewiseExponential& d, const double t) {
        double h = 0.0;
        for (size_t i = 0; i < d.cuts.size(); ++i) {
            const double end = i + 1 < d.cuts.size() ? d.cuts[i + 1] : INF;
            if (t <= d.cuts[i]) break;
            h += d.rates[i] * (std::min(t, end) - d.cuts[i]);
        }
        return h;
    }

    double cumHazardOf(const dist::Spline& d, const double t) {
        return std::exp(splineValue(d, std::log(t), nullptr));
    }

    // hazard
    double hazardOf(const dist::Exponential& d, double) { return d.rate; }

    double hazardOf(const dist::Weibull& d, const double t) {
        return d.shape / d.scale * std::pow(t / d.scale, d.shape - 1.0);
    }

    double hazardOf(const dist::Gamma& d, const double t) {
        const boost::math::gamma_distribution<> g(d.shape, 1.0 / d.rate);
        const double s = boost::math::cdf(boost::math::complement(g, t));
        return s > 0.0 ? boost::math::pdf(g, t) / s : d.rate;
    }

    double hazardOf(const dist::Lognormal& d, const double t) {
        const boost::math::lognormal_distribution<> ln(d.meanlog, d.sdlog);
        const double s = boost::math::cdf(boost::math::complement(ln, t));
        return s > 0.0 ? boost::math::pdf(ln, t) / s : 0.0;
    }

    double hazardOf(const dist::Gompertz& d, const double t) { return d.rate * std::exp(d.shape * t); }

    double hazardOf(const dist::LogLogistic& d, const double t) {
        const double z = std::pow(t / d.scale, d.shape);
        return d.shape / d.scale * std::pow(t / d.scale, d.shape - 1.0) / (1.0 + z);
    }

    double hazardOf(const dist::PiecewiseExponential& d, const double t) {
        size_t i = 0;
        while (i + 1 < d.cuts.size() && t >= d.cuts[i + 1]) ++i;
        return d.rates[i];
    }

    double hazardOf(const dist::Spline& d, const double t) {
        // below the first knot log H is linear in log t, so h(t) -> exp(gamma0) * gamma1 * t^(gamma1 - 1)
        if (t <= 0.0)
            return d.gamma[1] > 0.0 ? std::exp(d.gamma[0]) * d.gamma[1] * std::pow(0.0, d.gamma[1] - 1.0) : 0.0;
        double slope = 0.0;
        const double h = std::exp(splineValue(d, std::log(t), &slope));
        return h * slope / t;
    }

    // inverse cumulative hazard, closed forms only
    double inverseOf(const dist::Exponential& d, const double h) {
        if (h <= 0.0) return 0.0;
        return d.rate > 0.0 ? h / d.rate : INF;
    }

    double inverseOf(const dist::Weibull& d, const double h) { return d.scale * std::pow(h, 1.0 / d.shape); }

    template <class BoostDist>
    double inverseViaSurvival(const BoostDist& bd, const double h) {
        if (h <= 0.0) return 0.0;
        if (std::isinf(h)) return INF;
        const double s = std::exp(-h);
        if (s <= 0.0) throw SamplingFault("survival probability underflows at cumulative hazard " + std::to_string(h));
        return boost::math::quantile(boost::math::complement(bd, s));
    }

    double inverseOf(const dist::Gamma& d, const double h) {
        return inverseViaSurvival(boost::math::gamma_distribution<>(d.shape, 1.0 / d.rate), h);
    }

    double inverseOf(const dist::Lognormal& d, const double h) {
        return inverseViaSurvival(boost::math::lognormal_distribution<>(d.meanlog, d.sdlog), h);
    }

    double inverseOf(const dist::Gompertz& d, const double h) {
        if (h <= 0.0) return 0.0;
        if (d.shape == 0.0) return h / d.rate;
        const double x = d.shape * h / d.rate;
        if (x <= -1.0) return INF; // cured fraction: H is bounded by -rate/shape
        return std::log1p(x) / d.shape;
    }

    double inverseOf(const dist::LogLogistic& d, const double h) {
        if (h <= 0.0) return 0.0;
        return d.scale * std::pow(std::expm1(h), 1.0 / d.shape);
    }

    double inverseOf(const dist::PiecewiseExponential& d, const double h) {
        if (h <= 0.0) return 0.0;
        double remaining = h;
        for (size_t i = 0; i < d.cuts.size(); ++i) {
            const double width = i + 1 < d.cuts.size() ? d.cuts[i + 1] - d.cuts[i] : INF;
            const double mass = d.rates[i] * width;
            if (d.rates[i] > 0.0 && mass >= remaining) return d.cuts[i] + remaining / d.rates[i];
            if (std::isfinite(mass)) remaining -= mass;
        }
        return INF;
    }

    void require(const bool condition, const std::string& edge, const std::string& message) {
        if (!condition) throw ParameterError(edge, message);
    }

    bool finite(const std::vector<double>& values) {
        return std::all_of(values.begin(), values.end(), [](const double v) { return std::isfinite(v); });
    }
}


Family ipsim::familyFromName(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(), [](const unsigned char c) { return std::tolower(c); });
    if (n == "exp" || n == "exponential") return Family::EXPONENTIAL;
    if (n == "weibull") return Family::WEIBULL;
    if (n == "gamma") return Family::GAMMA;
    if (n == "lnorm" || n == "lognormal") return Family::LOGNORMAL;
    if (n == "gompertz") return Family::GOMPERTZ;
    if (n == "llogis" || n == "loglogistic") return Family::LOGLOGISTIC;
    if (n == "pwexp") return Family::PWEXP;
    if (n == "spline" || n == "survspline") return Family::SPLINE;
    throw ConfigurationError("unknown distribution family '" + name + "'");
}

std::string ipsim::familyName(const Family family) {
    switch (family) {
    case Family::EXPONENTIAL: return "exponential";
    case Family::WEIBULL: return "weibull";
    case Family::GAMMA: return "gamma";
    case Family::LOGNORMAL: return "lognormal";
    case Family::GOMPERTZ: return "gompertz";
    case Family::LOGLOGISTIC: return "loglogistic";
    case Family::PWEXP: return "pwexp";
    case Family::SPLINE: return "spline";
    }
    return "unknown";
}


size_t FamilySpec::arity() const noexcept {
    switch (family) {
    case Family::EXPONENTIAL: return 1;
    case Family::PWEXP:
    case Family::SPLINE: return knots.size();
    default: return 2;
    }
}

std::string FamilySpec::validate() const {
    if (family != Family::PWEXP && family != Family::SPLINE) {
        if (!knots.empty()) return familyName(family) + " takes no knots";
        return "";
    }
    if (family == Family::PWEXP && knots.empty()) return "pwexp needs at least one interval start time";
    if (family == Family::SPLINE && knots.size() < 2) return "spline needs at least two knots";
    if (!finite(knots)) return "knots must be finite";
    for (size_t i = 1; i < knots.size(); ++i)
        if (knots[i] <= knots[i - 1]) return "knots must be strictly increasing";
    if (family == Family::PWEXP && knots.front() != 0.0) return "pwexp intervals must start at time 0";
    return "";
}


Distribution Distribution::create(const FamilySpec& spec, const std::vector<double>& params, const std::string& edge) {
    const std::string knotProblem = spec.validate();
    require(knotProblem.empty(), edge, knotProblem);
    require(params.size() == spec.arity(), edge,
            familyName(spec.family) + " expects " + std::to_string(spec.arity()) + " parameters, got " +
            std::to_string(params.size()));
    require(finite(params), edge, "parameters must be finite");

    switch (spec.family) {
    case Family::EXPONENTIAL:
        require(params[0] >= 0.0, edge, "exponential rate must be >= 0, got " + std::to_string(params[0]));
        return Distribution(dist::Exponential{params[0]});
    case Family::WEIBULL:
        require(params[0] > 0.0, edge, "weibull shape must be > 0, got " + std::to_string(params[0]));
        require(params[1] > 0.0, edge, "weibull scale must be > 0, got " + std::to_string(params[1]));
        return Distribution(dist::Weibull{params[0], params[1]});
    case Family::GAMMA:
        require(params[0] > 0.0, edge, "gamma shape must be > 0, got " + std::to_string(params[0]));
        require(params[1] > 0.0, edge, "gamma rate must be > 0, got " + std::to_string(params[1]));
        return Distribution(dist::Gamma{params[0], params[1]});
    case Family::LOGNORMAL:
        require(params[1] > 0.0, edge, "lognormal sdlog must be > 0, got " + std::to_string(params[1]));
        return Distribution(dist::Lognormal{params[0], params[1]});
    case Family::GOMPERTZ:
        require(params[1] > 0.0, edge, "gompertz rate must be > 0, got " + std::to_string(params[1]));
        return Distribution(dist::Gompertz{params[0], params[1]});
    case Family::LOGLOGISTIC:
        require(params[0] > 0.0, edge, "loglogistic shape must be > 0, got " + std::to_string(params[0]));
        require(params[1] > 0.0, edge, "loglogistic scale must be > 0, got " + std::to_string(params[1]));
        return Distribution(dist::LogLogistic{params[0], params[1]});
    case Family::PWEXP:
        for (size_t i = 0; i < params.size(); ++i)
            require(params[i] >= 0.0, edge,
                    "pwexp rate " + std::to_string(i) + " must be >= 0, got " + std::to_string(params[i]));
        return Distribution(dist::PiecewiseExponential{spec.knots, params});
    case Family::SPLINE:
        require(params[1] > 0.0, edge, "spline gamma1 must be > 0, got " + std::to_string(params[1]));
        return Distribution(dist::Spline{spec.knots, params});
    }
    throw ParameterError(edge, "unsupported family");
}

Family Distribution::family() const noexcept {
    return static_cast<Family>(impl_.index());
}

double Distribution::cumHazard(const double t) const {
    if (t <= 0.0) return 0.0;
    return std::visit([t](const auto& d) { return cumHazardOf(d, t); }, impl_);
}

double Distribution::survival(const double t) const {
    if (t <= 0.0) return 1.0;
    return std::visit(overloaded{
                          [t](const dist::Gamma& d) {
                              const boost::math::gamma_distribution<> g(d.shape, 1.0 / d.rate);
                              return boost::math::cdf(boost::math::complement(g, t));
                          },
                          [t](const dist::Lognormal& d) {
                              const boost::math::lognormal_distribution<> ln(d.meanlog, d.sdlog);
                              return boost::math::cdf(boost::math::complement(ln, t));
                          },
                          [t](const auto& d) -> double { return std::exp(-cumHazardOf(d, t)); }
                      }, impl_);
}

double Distribution::cdf(const double t) const {
    if (t <= 0.0) return 0.0;
    return std::visit(overloaded{
                          [t](const dist::Gamma& d) {
                              return boost::math::cdf(boost::math::gamma_distribution<>(d.shape, 1.0 / d.rate), t);
                          },
                          [t](const dist::Lognormal& d) {
                              return boost::math::cdf(boost::math::lognormal_distribution<>(d.meanlog, d.sdlog), t);
                          },
                          [t](const auto& d) -> double { return -std::expm1(-cumHazardOf(d, t)); }
                      }, impl_);
}

double Distribution::hazard(const double t) const {
    if (t < 0.0) return 0.0;
    return std::visit([t](const auto& d) { return hazardOf(d, t); }, impl_);
}

double Distribution::logHazard(const double t) const {
    return std::log(hazard(t));
}

bool Distribution::hasInverse() const noexcept {
    return !std::holds_alternative<dist::Spline>(impl_);
}

double Distribution::inverseCumHazard(const double h) const {
    return std::visit(overloaded{
                          [](const dist::Spline&) -> double {
                              throw std::logic_error("spline cumulative hazard has no closed-form inverse");
                          },
                          [h](const auto& d) -> double { return inverseOf(d, h); }
                      }, impl_);
}

double Distribution::sample(RngEngine& rng) const {
    return std::visit(overloaded{
                          [&rng](const dist::Gamma& d) { return rng.gamma(d.shape, 1.0 / d.rate); },
                          [&rng](const dist::Lognormal& d) { return std::exp(rng.normal(d.meanlog, d.sdlog)); },
                          [](const dist::Spline&) -> double {
                              throw std::logic_error("spline has no closed-form random variate generator");
                          },
                          [&rng](const auto& d) -> double { return inverseOf(d, rng.standardExponential()); }
                      }, impl_);
}
