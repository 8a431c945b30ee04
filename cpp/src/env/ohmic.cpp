#include "qenv/bath_models.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "qenv/errors.hpp"
#include "qenv/thermal.hpp"

namespace qenv {

OhmicEnvironment::OhmicEnvironment(double T,
                                   double alpha,
                                   double wc,
                                   double s,
                                   std::shared_ptr<const SpecialFunctions> functions,
                                   std::any tag,
                                   std::ostream* log)
    : BosonicEnvironment(T, std::move(tag)),
      alpha_(alpha), wc_(wc), s_(s), functions_(std::move(functions)) {
    if (!(wc_ > 0.0)) throw std::invalid_argument("OhmicEnvironment: wc must be > 0");
    if (!functions_) {
        std::ostream& os = log ? *log : std::cerr;
        os << "Warning: OhmicEnvironment: no special-function implementation was given; "
              "correlation_function is unavailable\n";
    }
}

std::vector<double> OhmicEnvironment::sd_impl(const std::vector<double>& w) const {
    std::vector<double> J(w.size(), 0.0);
    for (std::size_t k = 0; k < w.size(); ++k) {
        const double x = w[k];
        if (x > 0.0) J[k] = alpha_ * std::pow(x, s_) / std::pow(wc_, 1.0 - s_) * std::exp(-x / wc_);
    }
    return J;
}

std::vector<double> OhmicEnvironment::ps_impl(const std::vector<double>& w, double eps) const {
    return ps_from_sd(w, eps);
}

std::vector<std::complex<double>> OhmicEnvironment::cf_impl(const std::vector<double>& t, double) const {
    if (!functions_) {
        throw MissingOptionalDependency("OhmicEnvironment::correlation_function: requires Gamma and "
                                        "Hurwitz zeta functions, but none were provided");
    }
    const double T = require_temperature("OhmicEnvironment::correlation_function");
    if (T < 0.0) throw std::invalid_argument("OhmicEnvironment::correlation_function: T must be >= 0");

    // (1/pi) int_0^inf J(w) [(n + 1) e^{-iwt} + n e^{iwt}] dw with J = alpha wc^(s-1) w^s e^{-w/wc}
    using cd = std::complex<double>;
    const double gamma_s1 = functions_->gamma(s_ + 1.0);
    std::vector<cd> C(t.size());

    if (T == 0.0) {
        const double corr = alpha_ * std::pow(wc_, 2.0 * s_) / PI * gamma_s1;
        for (std::size_t k = 0; k < t.size(); ++k) {
            C[k] = corr * std::pow(cd(1.0, wc_ * t[k]), -(s_ + 1.0));
        }
        return C;
    }

    const double corr = alpha_ * std::pow(wc_, s_ - 1.0) / PI * gamma_s1 * std::pow(T, s_ + 1.0);
    const double x = wc_ / T;
    for (std::size_t k = 0; k < t.size(); ++k) {
        const cd u1 = cd(1.0 + x, -wc_ * t[k]) / x;
        const cd u2 = cd(1.0, wc_ * t[k]) / x;
        C[k] = corr * (functions_->hurwitz_zeta(s_ + 1.0, u1) + functions_->hurwitz_zeta(s_ + 1.0, u2));
    }
    return C;
}

} // namespace qenv
