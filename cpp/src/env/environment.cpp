#include "qenv/environment.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

#include "qenv/bath_models.hpp"
#include "qenv/errors.hpp"
#include "qenv/exponential.hpp"
#include "qenv/fourier.hpp"
#include "qenv/thermal.hpp"

namespace qenv {

namespace {

// Largest |x| of a sample table or query grid; sets the transform window.
double max_abs_endpoint(const std::vector<double>& x) {
    if (x.empty()) return 0.0;
    const auto [lo, hi] = std::minmax_element(x.begin(), x.end());
    return std::max(std::abs(*lo), std::abs(*hi));
}

class CorrelationFunctionEnvironment final : public BosonicEnvironment {
public:
    CorrelationFunctionEnvironment(ComplexFunction C, std::optional<double> tMax,
                                   std::optional<double> T, std::any tag)
        : BosonicEnvironment(T, std::move(tag)), C_(std::move(C)), tMax_(tMax) {}

protected:
    std::vector<double> sd_impl(const std::vector<double>& w) const override {
        return sd_from_ps(w);
    }

    std::vector<double> ps_impl(const std::vector<double>& w, double) const override {
        if (!tMax_) {
            throw MissingSupportBound("power_spectrum: the support of the correlation function (tMax) "
                                      "must be specified to compute the power spectrum");
        }
        return ps_from_cf(w, *tMax_);
    }

    std::vector<std::complex<double>> cf_impl(const std::vector<double>& t, double) const override {
        std::vector<std::complex<double>> out(t.size());
        for (std::size_t k = 0; k < t.size(); ++k) {
            out[k] = t[k] >= 0.0 ? C_(t[k]) : std::conj(C_(-t[k]));
        }
        return out;
    }

private:
    ComplexFunction C_;
    std::optional<double> tMax_;
};

class PowerSpectrumEnvironment final : public BosonicEnvironment {
public:
    PowerSpectrumEnvironment(RealFunction S, std::optional<double> wMax,
                             std::optional<double> T, std::any tag)
        : BosonicEnvironment(T, std::move(tag)), S_(std::move(S)), wMax_(wMax) {}

protected:
    std::vector<double> sd_impl(const std::vector<double>& w) const override {
        return sd_from_ps(w);
    }

    std::vector<double> ps_impl(const std::vector<double>& w, double) const override {
        std::vector<double> out(w.size());
        std::transform(w.begin(), w.end(), out.begin(), S_);
        return out;
    }

    std::vector<std::complex<double>> cf_impl(const std::vector<double>& t, double eps) const override {
        if (!wMax_) {
            throw MissingSupportBound("correlation_function: the support of the power spectrum (wMax) "
                                      "must be specified to compute the correlation function");
        }
        return cf_from_ps(t, *wMax_, eps);
    }

private:
    RealFunction S_;
    std::optional<double> wMax_;
};

class SpectralDensityEnvironment final : public BosonicEnvironment {
public:
    SpectralDensityEnvironment(RealFunction J, std::optional<double> wMax,
                               std::optional<double> T, std::any tag)
        : BosonicEnvironment(T, std::move(tag)), J_(std::move(J)), wMax_(wMax) {}

protected:
    std::vector<double> sd_impl(const std::vector<double>& w) const override {
        std::vector<double> out(w.size(), 0.0);
        for (std::size_t k = 0; k < w.size(); ++k) {
            if (w[k] > 0.0) out[k] = J_(w[k]);
        }
        return out;
    }

    std::vector<double> ps_impl(const std::vector<double>& w, double eps) const override {
        return ps_from_sd(w, eps);
    }

    std::vector<std::complex<double>> cf_impl(const std::vector<double>& t, double eps) const override {
        if (!wMax_) {
            throw MissingSupportBound("correlation_function: the support of the spectral density (wMax) "
                                      "must be specified to compute the correlation function");
        }
        return cf_from_ps(t, *wMax_, eps);
    }

private:
    RealFunction J_;
    std::optional<double> wMax_;
};

// ----------------------------- Fit strategies --------------------------------

ExponentialBosonicEnvironment correlation_fit(const BosonicEnvironment& env,
                                              const ApproximationOptions& o) {
    if (o.tlist.empty()) throw std::invalid_argument("correlation_fit: tlist must not be empty");
    const auto C = env.correlation_function(o.tlist);
    fit::CorrelationFit result = fit::fit_correlation(C, o.tlist, o.Nr, o.Ni,
                                                      o.final_rmse.value_or(2e-5),
                                                      o.fit, o.full_ansatz);
    if (o.correlation_info) *o.correlation_info = result.info;

    ExponentLists lists{std::move(result.ck_real), std::move(result.vk_real),
                        std::move(result.ck_imag), std::move(result.vk_imag)};
    return ExponentialBosonicEnvironment(lists, env.temperature(), o.combine);
}

ExponentialBosonicEnvironment underdamped_fit(const BosonicEnvironment& env,
                                              const ApproximationOptions& o) {
    if (o.wlist.empty()) throw std::invalid_argument("underdamped_fit: wlist must not be empty");
    if (!env.temperature()) {
        throw MissingTemperature("underdamped_fit: bath temperature must be specified for this operation");
    }
    const std::size_t Nk = o.Nk.value_or(1);
    const auto J = env.spectral_density(o.wlist);
    fit::SpectralFit result = fit::fit_underdamped(J, o.wlist, o.N, Nk,
                                                   o.final_rmse.value_or(5e-6), o.fit);
    if (o.spectral_info) *o.spectral_info = result.info;

    // Meier-Tannor term (a, b, c) is an underdamped mode with lam^2 = a, gamma = 2b, w0^2 = b^2 + c^2.
    const double T = *env.temperature();
    const auto& a = result.params[0];
    const auto& b = result.params[1];
    const auto& c = result.params[2];
    ExponentLists all;
    for (std::size_t i = 0; i < a.size(); ++i) {
        const double w0 = std::sqrt(b[i] * b[i] + c[i] * c[i]);
        ExponentLists mode = underdamped_matsubara_terms(T, a[i], 2.0 * b[i], w0, Nk);
        all.ck_real.insert(all.ck_real.end(), mode.ck_real.begin(), mode.ck_real.end());
        all.vk_real.insert(all.vk_real.end(), mode.vk_real.begin(), mode.vk_real.end());
        all.ck_imag.insert(all.ck_imag.end(), mode.ck_imag.begin(), mode.ck_imag.end());
        all.vk_imag.insert(all.vk_imag.end(), mode.vk_imag.begin(), mode.vk_imag.end());
    }
    return ExponentialBosonicEnvironment(all, env.temperature(), o.combine);
}

} // namespace

BosonicEnvironment::BosonicEnvironment(std::optional<double> T, std::any tag)
    : T_(T), tag_(std::move(tag)) {}

double BosonicEnvironment::spectral_density(double w) const {
    return sd_impl(std::vector<double>{w}).front();
}

double BosonicEnvironment::power_spectrum(double w, double eps) const {
    return ps_impl(std::vector<double>{w}, eps).front();
}

std::complex<double> BosonicEnvironment::correlation_function(double t, double eps) const {
    return cf_impl(std::vector<double>{t}, eps).front();
}

double BosonicEnvironment::require_temperature(const std::string& who) const {
    if (!T_) throw MissingTemperature(who + ": bath temperature must be specified for this operation");
    return *T_;
}

std::vector<double> BosonicEnvironment::ps_from_sd(const std::vector<double>& w, double eps) const {
    const double T = require_temperature("power_spectrum");
    std::vector<double> S(w.size(), 0.0);

    if (T == 0.0) {
        const std::vector<double> J = sd_impl(w);
        for (std::size_t k = 0; k < w.size(); ++k) S[k] = 2.0 * heaviside(w[k]) * J[k];
        return S;
    }

    // S(0) = 2 T J'(0), from a one-sided difference. A tabulated J is zero below its
    // first sample, so a table starting above eps gives S(0) = 0.
    std::vector<double> absw(w.size());
    std::transform(w.begin(), w.end(), absw.begin(), [](double x) { return std::abs(x); });
    const std::vector<double> Jabs = sd_impl(absw);
    bool need_zero = false;
    for (std::size_t k = 0; k < w.size(); ++k) {
        if (w[k] == 0.0) {
            need_zero = true;
            continue;
        }
        S[k] = 2.0 * sign(w[k]) * Jabs[k] * (n_thermal(w[k], T) + 1.0);
    }
    if (need_zero) {
        const double S0 = 2.0 * T * sd_impl(std::vector<double>{eps}).front() / eps;
        for (std::size_t k = 0; k < w.size(); ++k) {
            if (w[k] == 0.0) S[k] = S0;
        }
    }
    return S;
}

std::vector<double> BosonicEnvironment::sd_from_ps(const std::vector<double>& w) const {
    const double T = require_temperature("spectral_density");
    std::vector<double> positive;
    positive.reserve(w.size());
    for (double x : w) {
        if (x > 0.0) positive.push_back(x);
    }
    std::vector<double> J(w.size(), 0.0);
    if (positive.empty()) return J;

    const std::vector<double> S = ps_impl(positive, 1e-10);
    std::size_t p = 0;
    for (std::size_t k = 0; k < w.size(); ++k) {
        if (w[k] > 0.0) {
            J[k] = S[p] / 2.0 / (n_thermal(w[k], T) + 1.0);
            ++p;
        }
    }
    return J;
}

std::vector<double> BosonicEnvironment::ps_from_cf(const std::vector<double>& w, double tMax) const {
    if (w.empty()) return {};
    const double wMax = max_abs_endpoint(w);
    const ComplexFunction C = [this](double t) { return cf_impl(std::vector<double>{t}, 1e-10).front(); };
    const ComplexFunction mirrored = fourier::transform(C, wMax, tMax);

    std::vector<double> S(w.size());
    for (std::size_t k = 0; k < w.size(); ++k) S[k] = mirrored(-w[k]).real();
    return S;
}

std::vector<std::complex<double>> BosonicEnvironment::cf_from_ps(const std::vector<double>& t,
                                                                 double wMax,
                                                                 double eps) const {
    if (t.empty()) return {};
    const double tMax = max_abs_endpoint(t);
    const ComplexFunction S = [this, eps](double w) {
        return std::complex<double>(ps_impl(std::vector<double>{w}, eps).front(), 0.0);
    };
    const ComplexFunction transformed = fourier::transform(S, tMax, wMax);

    std::vector<std::complex<double>> C(t.size());
    for (std::size_t k = 0; k < t.size(); ++k) C[k] = transformed(t[k]) / (2.0 * PI);
    return C;
}

const ApproximatorTable& BosonicEnvironment::default_approximators() {
    static const ApproximatorTable table{
        {"correlation_fit", &correlation_fit},
        {"underdamped_fit", &underdamped_fit},
    };
    return table;
}

const ApproximatorTable& BosonicEnvironment::approximators() const {
    return default_approximators();
}

ExponentialBosonicEnvironment BosonicEnvironment::exponential_approximation(
    const std::string& method, const ApproximationOptions& options) const {
    const ApproximatorTable& table = approximators();
    const auto it = table.find(method);
    if (it == table.end()) throw UnknownMethod("Unknown approximation method: " + method);
    return it->second(*this, options);
}

std::vector<std::string> BosonicEnvironment::approximation_methods() const {
    std::vector<std::string> names;
    for (const auto& kv : approximators()) names.push_back(kv.first);
    return names;
}

// -------------------------------- Factories ----------------------------------

std::unique_ptr<BosonicEnvironment> BosonicEnvironment::from_correlation_function(
    ComplexFunction C, std::optional<double> tMax, std::optional<double> T, std::any tag) {
    if (!C) throw std::invalid_argument("from_correlation_function: empty callable");
    return std::make_unique<CorrelationFunctionEnvironment>(
        complex_interpolation(std::move(C)), tMax, T, std::move(tag));
}

std::unique_ptr<BosonicEnvironment> BosonicEnvironment::from_correlation_function(
    const std::vector<double>& tlist, const std::vector<std::complex<double>>& C,
    std::optional<double> T, std::any tag) {
    ComplexFunction f = complex_interpolation(tlist, C, "correlation function");
    return std::make_unique<CorrelationFunctionEnvironment>(
        std::move(f), max_abs_endpoint(tlist), T, std::move(tag));
}

std::unique_ptr<BosonicEnvironment> BosonicEnvironment::from_power_spectrum(
    RealFunction S, std::optional<double> wMax, std::optional<double> T, std::any tag) {
    if (!S) throw std::invalid_argument("from_power_spectrum: empty callable");
    return std::make_unique<PowerSpectrumEnvironment>(
        real_interpolation(std::move(S)), wMax, T, std::move(tag));
}

std::unique_ptr<BosonicEnvironment> BosonicEnvironment::from_power_spectrum(
    const std::vector<double>& wlist, const std::vector<double>& S,
    std::optional<double> T, std::any tag) {
    RealFunction f = real_interpolation(wlist, S, "power spectrum");
    return std::make_unique<PowerSpectrumEnvironment>(
        std::move(f), max_abs_endpoint(wlist), T, std::move(tag));
}

std::unique_ptr<BosonicEnvironment> BosonicEnvironment::from_spectral_density(
    RealFunction J, std::optional<double> wMax, std::optional<double> T, std::any tag) {
    if (!J) throw std::invalid_argument("from_spectral_density: empty callable");
    return std::make_unique<SpectralDensityEnvironment>(
        real_interpolation(std::move(J)), wMax, T, std::move(tag));
}

std::unique_ptr<BosonicEnvironment> BosonicEnvironment::from_spectral_density(
    const std::vector<double>& wlist, const std::vector<double>& J,
    std::optional<double> T, std::any tag) {
    RealFunction f = real_interpolation(wlist, J, "spectral density");
    return std::make_unique<SpectralDensityEnvironment>(
        std::move(f), max_abs_endpoint(wlist), T, std::move(tag));
}

} // namespace qenv
