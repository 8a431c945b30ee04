// environment.hpp — Bosonic environments characterised by J(w), S(w) and C(t)

#pragma once

#include <any>
#include <complex>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "qenv/fit.hpp"
#include "qenv/interpolation.hpp"

namespace qenv {

class BosonicEnvironment;
class ExponentialBosonicEnvironment;

// Options understood by the approximation strategies. Each strategy reads only the
// fields it needs:
//   matsubara, pade  : Nk, combine
//   correlation_fit  : tlist, Nr, Ni, full_ansatz, final_rmse, fit, correlation_info
//   underdamped_fit  : wlist, N, Nk (default 1), final_rmse, fit, combine, spectral_info
struct ApproximationOptions {
    std::optional<std::size_t> Nk;
    bool combine{true};

    std::vector<double> tlist;
    std::optional<std::size_t> Nr;
    std::optional<std::size_t> Ni;
    bool full_ansatz{false};

    std::vector<double> wlist;
    std::optional<std::size_t> N;

    std::optional<double> final_rmse;
    fit::FitOptions fit;

    fit::CorrelationFitInfo* correlation_info{nullptr};
    fit::SpectralFitInfo* spectral_info{nullptr};
};

using Approximator = ExponentialBosonicEnvironment (*)(const BosonicEnvironment&,
                                                       const ApproximationOptions&);
using ApproximatorTable = std::map<std::string, Approximator>;

// Environment of an open quantum system. Any one of the three characteristic
// functions determines the other two; whatever a concrete environment does not
// know in closed form is derived on demand:
//   J <- S       detailed balance (needs T)
//   S <- J       detailed balance (needs T), S(0) = 2 T J(eps) / eps
//   S <- C       Fourier transform over [-tMax, tMax]
//   C <- S       inverse transform over [-wMax, wMax]
// Instances are immutable; every query recomputes from the backing data.
class BosonicEnvironment {
public:
    virtual ~BosonicEnvironment() = default;

    const std::optional<double>& temperature() const noexcept { return T_; }
    const std::any& tag() const noexcept { return tag_; }

    // J(w), exactly zero for w <= 0.
    double spectral_density(double w) const;
    std::vector<double> spectral_density(const std::vector<double>& w) const { return sd_impl(w); }

    // S(w). eps is the finite difference used for S(0) when S is derived from J.
    double power_spectrum(double w, double eps = 1e-10) const;
    std::vector<double> power_spectrum(const std::vector<double>& w, double eps = 1e-10) const {
        return ps_impl(w, eps);
    }

    // C(t), with C(-t) = conj C(t). eps is forwarded to S when C is derived from J.
    std::complex<double> correlation_function(double t, double eps = 1e-10) const;
    std::vector<std::complex<double>> correlation_function(const std::vector<double>& t,
                                                           double eps = 1e-10) const {
        return cf_impl(t, eps);
    }

    // Dispatches to a named strategy; throws UnknownMethod for names this
    // environment does not provide.
    ExponentialBosonicEnvironment exponential_approximation(const std::string& method,
                                                            const ApproximationOptions& options = {}) const;
    std::vector<std::string> approximation_methods() const;

    // Factories. With a callable the support bound (tMax / wMax) may be left unset,
    // in which case conversions needing the transform throw MissingSupportBound.
    // With samples the bound is the largest |x| of the table.
    static std::unique_ptr<BosonicEnvironment> from_correlation_function(
        ComplexFunction C,
        std::optional<double> tMax = std::nullopt,
        std::optional<double> T = std::nullopt,
        std::any tag = {});
    static std::unique_ptr<BosonicEnvironment> from_correlation_function(
        const std::vector<double>& tlist,
        const std::vector<std::complex<double>>& C,
        std::optional<double> T = std::nullopt,
        std::any tag = {});

    static std::unique_ptr<BosonicEnvironment> from_power_spectrum(
        RealFunction S,
        std::optional<double> wMax = std::nullopt,
        std::optional<double> T = std::nullopt,
        std::any tag = {});
    static std::unique_ptr<BosonicEnvironment> from_power_spectrum(
        const std::vector<double>& wlist,
        const std::vector<double>& S,
        std::optional<double> T = std::nullopt,
        std::any tag = {});

    static std::unique_ptr<BosonicEnvironment> from_spectral_density(
        RealFunction J,
        std::optional<double> wMax = std::nullopt,
        std::optional<double> T = std::nullopt,
        std::any tag = {});
    static std::unique_ptr<BosonicEnvironment> from_spectral_density(
        const std::vector<double>& wlist,
        const std::vector<double>& J,
        std::optional<double> T = std::nullopt,
        std::any tag = {});

protected:
    explicit BosonicEnvironment(std::optional<double> T = std::nullopt, std::any tag = {});

    virtual std::vector<double> sd_impl(const std::vector<double>& w) const = 0;
    virtual std::vector<double> ps_impl(const std::vector<double>& w, double eps) const = 0;
    virtual std::vector<std::complex<double>> cf_impl(const std::vector<double>& t, double eps) const = 0;

    // correlation_fit and underdamped_fit; models add their analytic expansions.
    virtual const ApproximatorTable& approximators() const;
    static const ApproximatorTable& default_approximators();

    std::vector<double> ps_from_sd(const std::vector<double>& w, double eps) const;
    std::vector<double> sd_from_ps(const std::vector<double>& w) const;
    std::vector<double> ps_from_cf(const std::vector<double>& w, double tMax) const;
    std::vector<std::complex<double>> cf_from_ps(const std::vector<double>& t, double wMax, double eps) const;

    // Temperature, or MissingTemperature naming the caller.
    double require_temperature(const std::string& who) const;

private:
    std::optional<double> T_;
    std::any tag_;
};

} // namespace qenv
