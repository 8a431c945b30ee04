#include "qenv/bath_models.hpp"

#include <Eigen/Dense>
#include <Eigen/Eigenvalues>

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#include "qenv/errors.hpp"
#include "qenv/thermal.hpp"

namespace qenv {

namespace {

double checked_temperature(const std::optional<double>& T, const char* who) {
    if (!T) throw MissingTemperature(std::string(who) + ": bath temperature must be specified for this operation");
    if (!(*T > 0.0)) {
        throw std::invalid_argument(std::string(who) + ": requires a temperature T > 0");
    }
    return *T;
}

std::size_t checked_terms(std::size_t Nk, const char* who) {
    if (Nk == 0) throw std::invalid_argument(std::string(who) + ": Nk must be >= 1");
    return Nk;
}

// Ascending eigenvalues of the symmetric tridiagonal matrix with zero diagonal and
// off-diagonal entries 1 / sqrt((2k + p) (2k + p - 2)), k = 0 .. n-2.
Eigen::VectorXd tridiagonal_spectrum(Eigen::Index n, int p) {
    if (n <= 0) return Eigen::VectorXd();
    const Eigen::VectorXd diag = Eigen::VectorXd::Zero(n);
    Eigen::VectorXd sub(n - 1);
    for (Eigen::Index k = 0; k + 1 < n; ++k) {
        const double kk = static_cast<double>(k);
        sub(k) = 1.0 / std::sqrt((2.0 * kk + p) * (2.0 * kk + p - 2.0));
    }
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> es;
    es.computeFromTridiagonal(diag, sub, Eigen::EigenvaluesOnly);
    if (es.info() != Eigen::Success) {
        throw std::runtime_error("pade: tridiagonal eigensolver did not converge");
    }
    return es.eigenvalues();
}

} // namespace

DrudeLorentzEnvironment::DrudeLorentzEnvironment(double T, double lam, double gamma, std::any tag)
    : BosonicEnvironment(T, std::move(tag)), lam_(lam), gamma_(gamma) {}

std::vector<double> DrudeLorentzEnvironment::sd_impl(const std::vector<double>& w) const {
    std::vector<double> J(w.size(), 0.0);
    for (std::size_t k = 0; k < w.size(); ++k) {
        const double x = w[k];
        if (x > 0.0) J[k] = 2.0 * lam_ * gamma_ * x / (gamma_ * gamma_ + x * x);
    }
    return J;
}

std::vector<double> DrudeLorentzEnvironment::ps_impl(const std::vector<double>& w, double eps) const {
    const double T = require_temperature("DrudeLorentzEnvironment::power_spectrum");
    std::vector<double> S = ps_from_sd(w, eps);
    // analytic zero-frequency limit instead of the finite difference
    for (std::size_t k = 0; k < w.size(); ++k) {
        if (w[k] == 0.0) S[k] = 4.0 * T * lam_ / gamma_;
    }
    return S;
}

std::vector<std::complex<double>> DrudeLorentzEnvironment::cf_impl(const std::vector<double>& t, double) const {
    const ExponentLists terms = matsubara_terms(kCorrelationTerms);
    std::vector<std::complex<double>> C(t.size());
    for (std::size_t n = 0; n < t.size(); ++n) {
        const double tau = std::abs(t[n]);
        std::complex<double> re(0.0, 0.0), im(0.0, 0.0);
        for (std::size_t k = 0; k < terms.ck_real.size(); ++k) re += terms.ck_real[k] * std::exp(-terms.vk_real[k] * tau);
        for (std::size_t k = 0; k < terms.ck_imag.size(); ++k) im += terms.ck_imag[k] * std::exp(-terms.vk_imag[k] * tau);
        const std::complex<double> c = re + std::complex<double>(0.0, 1.0) * im;
        C[n] = t[n] < 0.0 ? std::conj(c) : c;
    }
    return C;
}

ExponentLists DrudeLorentzEnvironment::matsubara_terms(std::size_t Nk) const {
    const double T = checked_temperature(temperature(), "DrudeLorentzEnvironment::matsubara");
    checked_terms(Nk, "DrudeLorentzEnvironment::matsubara");

    ExponentLists out;
    out.ck_real.reserve(Nk + 1);
    out.vk_real.reserve(Nk + 1);
    out.ck_real.emplace_back(lam_ * gamma_ / std::tan(gamma_ / (2.0 * T)));
    out.vk_real.emplace_back(gamma_);
    for (std::size_t k = 1; k <= Nk; ++k) {
        const double vk = 2.0 * PI * static_cast<double>(k) * T;
        out.ck_real.emplace_back(8.0 * lam_ * gamma_ * T * PI * static_cast<double>(k) * T
                                 / (vk * vk - gamma_ * gamma_));
        out.vk_real.emplace_back(vk);
    }
    out.ck_imag = {std::complex<double>(-lam_ * gamma_, 0.0)};
    out.vk_imag = {std::complex<double>(gamma_, 0.0)};
    return out;
}

ExponentLists DrudeLorentzEnvironment::pade_terms(std::size_t Nk) const {
    const double T = checked_temperature(temperature(), "DrudeLorentzEnvironment::pade");
    checked_terms(Nk, "DrudeLorentzEnvironment::pade");
    const double beta = 1.0 / T;
    const Eigen::Index n = static_cast<Eigen::Index>(Nk);

    // Poles eps_j and zeros chi_j of the [N-1/N] Pade approximant of the Bose function.
    const Eigen::VectorXd ev = tridiagonal_spectrum(2 * n, 5);
    const Eigen::VectorXd cv = tridiagonal_spectrum(2 * n - 1, 7);
    std::vector<double> eps(Nk), chi(Nk - 1);
    for (Eigen::Index j = 0; j < n; ++j) eps[j] = -2.0 / ev(j);
    for (Eigen::Index j = 0; j + 1 < n; ++j) chi[j] = -2.0 / cv(j);

    const double prefactor = 0.5 * static_cast<double>(Nk) * (2.0 * (static_cast<double>(Nk) + 1.0) + 1.0);
    std::vector<double> kappa(Nk);
    for (std::size_t j = 0; j < Nk; ++j) {
        double term = prefactor;
        for (std::size_t k = 0; k + 1 < Nk; ++k) {
            const double delta = (j == k) ? 1.0 : 0.0;
            term *= (chi[k] * chi[k] - eps[j] * eps[j]) / (eps[k] * eps[k] - eps[j] * eps[j] + delta);
        }
        const double delta = (j == Nk - 1) ? 1.0 : 0.0;
        term /= eps[Nk - 1] * eps[Nk - 1] - eps[j] * eps[j] + delta;
        kappa[j] = term;
    }

    const std::complex<double> eta0 = lam_ * gamma_ * (1.0 / std::tan(gamma_ * beta / 2.0) - std::complex<double>(0.0, 1.0));

    ExponentLists out;
    out.ck_real.reserve(Nk + 1);
    out.vk_real.reserve(Nk + 1);
    out.ck_real.emplace_back(eta0.real());
    out.vk_real.emplace_back(gamma_);
    for (std::size_t l = 0; l < Nk; ++l) {
        const double pole = eps[l] / beta;
        const double eta = (kappa[l] / beta) * 4.0 * lam_ * gamma_ * pole / (pole * pole - gamma_ * gamma_);
        out.ck_real.emplace_back(eta);
        out.vk_real.emplace_back(pole);
    }
    out.ck_imag = {std::complex<double>(eta0.imag(), 0.0)};
    out.vk_imag = {std::complex<double>(gamma_, 0.0)};
    return out;
}

ExponentialBosonicEnvironment DrudeLorentzEnvironment::matsubara(std::size_t Nk, bool combine) const {
    return ExponentialBosonicEnvironment(matsubara_terms(Nk), temperature(), combine);
}

ExponentialBosonicEnvironment DrudeLorentzEnvironment::pade(std::size_t Nk, bool combine) const {
    return ExponentialBosonicEnvironment(pade_terms(Nk), temperature(), combine);
}

const ApproximatorTable& DrudeLorentzEnvironment::approximators() const {
    static const ApproximatorTable table = [] {
        ApproximatorTable t = default_approximators();
        t["matsubara"] = [](const BosonicEnvironment& env, const ApproximationOptions& o) {
            if (!o.Nk) throw std::invalid_argument("matsubara: Nk must be specified");
            return static_cast<const DrudeLorentzEnvironment&>(env).matsubara(*o.Nk, o.combine);
        };
        t["pade"] = [](const BosonicEnvironment& env, const ApproximationOptions& o) {
            if (!o.Nk) throw std::invalid_argument("pade: Nk must be specified");
            return static_cast<const DrudeLorentzEnvironment&>(env).pade(*o.Nk, o.combine);
        };
        return t;
    }();
    return table;
}

} // namespace qenv
