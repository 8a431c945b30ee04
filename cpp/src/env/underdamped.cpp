#include "qenv/bath_models.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#include "qenv/errors.hpp"
#include "qenv/thermal.hpp"

namespace qenv {

ExponentLists underdamped_matsubara_terms(double T, double lam2, double gamma, double w0, std::size_t Nk) {
    if (!(T > 0.0)) throw std::invalid_argument("underdamped matsubara: requires a temperature T > 0");
    const double Om2 = w0 * w0 - 0.25 * gamma * gamma;
    if (!(Om2 > 0.0)) {
        throw std::invalid_argument("underdamped matsubara: requires w0 > gamma / 2 (got w0=" + std::to_string(w0)
                                    + ", gamma=" + std::to_string(gamma) + ")");
    }
    using cd = std::complex<double>;
    const cd i(0.0, 1.0);
    const double beta = 1.0 / T;
    const double Om = std::sqrt(Om2);
    const double Gamma = 0.5 * gamma;
    const double amp = lam2 / (4.0 * Om);

    const cd z_plus(Om, Gamma);    // Om + i Gamma
    const cd z_minus(Om, -Gamma);  // Om - i Gamma

    ExponentLists out;
    out.ck_real.reserve(Nk + 2);
    out.vk_real.reserve(Nk + 2);
    out.ck_real.push_back(amp / std::tanh(beta * z_plus / 2.0));
    out.ck_real.push_back(amp / std::tanh(beta * z_minus / 2.0));
    out.vk_real.push_back(-i * Om + Gamma);
    out.vk_real.push_back(i * Om + Gamma);
    for (std::size_t k = 1; k <= Nk; ++k) {
        const double nu = 2.0 * PI * static_cast<double>(k) / beta;
        out.ck_real.push_back((-2.0 * lam2 * gamma / beta) * nu
                              / ((z_plus * z_plus + nu * nu) * (z_minus * z_minus + nu * nu)));
        out.vk_real.emplace_back(nu);
    }
    out.ck_imag = {i * amp, -i * amp};
    out.vk_imag = {-i * Om + Gamma, i * Om + Gamma};
    return out;
}

UnderDampedEnvironment::UnderDampedEnvironment(double T, double lam, double gamma, double w0, std::any tag)
    : BosonicEnvironment(T, std::move(tag)), lam_(lam), gamma_(gamma), w0_(w0) {}

std::vector<double> UnderDampedEnvironment::sd_impl(const std::vector<double>& w) const {
    std::vector<double> J(w.size(), 0.0);
    for (std::size_t k = 0; k < w.size(); ++k) {
        const double x = w[k];
        if (!(x > 0.0)) continue;
        const double d = x * x - w0_ * w0_;
        J[k] = lam_ * lam_ * gamma_ * x / (d * d + gamma_ * gamma_ * x * x);
    }
    return J;
}

std::vector<double> UnderDampedEnvironment::ps_impl(const std::vector<double>& w, double eps) const {
    const double T = require_temperature("UnderDampedEnvironment::power_spectrum");
    std::vector<double> S = ps_from_sd(w, eps);
    for (std::size_t k = 0; k < w.size(); ++k) {
        if (w[k] == 0.0) S[k] = 2.0 * T * lam_ * lam_ * gamma_ / std::pow(w0_, 4);
    }
    return S;
}

std::vector<std::complex<double>> UnderDampedEnvironment::cf_impl(const std::vector<double>& t, double eps) const {
    // S(w) is negligible beyond a few widths above the resonance
    const double wMax = w0_ + 10.0 * gamma_;
    return cf_from_ps(t, wMax, eps);
}

ExponentLists UnderDampedEnvironment::matsubara_terms(std::size_t Nk) const {
    if (!temperature()) {
        throw MissingTemperature("UnderDampedEnvironment::matsubara: bath temperature must be specified");
    }
    return underdamped_matsubara_terms(*temperature(), lam_ * lam_, gamma_, w0_, Nk);
}

ExponentialBosonicEnvironment UnderDampedEnvironment::matsubara(std::size_t Nk, bool combine) const {
    return ExponentialBosonicEnvironment(matsubara_terms(Nk), temperature(), combine);
}

const ApproximatorTable& UnderDampedEnvironment::approximators() const {
    static const ApproximatorTable table = [] {
        ApproximatorTable t = default_approximators();
        t["matsubara"] = [](const BosonicEnvironment& env, const ApproximationOptions& o) {
            if (!o.Nk) throw std::invalid_argument("matsubara: Nk must be specified");
            return static_cast<const UnderDampedEnvironment&>(env).matsubara(*o.Nk, o.combine);
        };
        return t;
    }();
    return table;
}

} // namespace qenv
