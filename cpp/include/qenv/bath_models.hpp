// bath_models.hpp — Closed-form bosonic environments and their exponential expansions

#pragma once

#include <any>
#include <complex>
#include <cstddef>
#include <iosfwd>
#include <memory>
#include <optional>
#include <vector>

#include "qenv/environment.hpp"
#include "qenv/exponential.hpp"
#include "qenv/special_functions.hpp"

namespace qenv {

// J(w) = 2 lam gamma w / (gamma^2 + w^2)
class DrudeLorentzEnvironment final : public BosonicEnvironment {
public:
    // Matsubara terms summed when evaluating C(t).
    static constexpr std::size_t kCorrelationTerms = 15000;

    DrudeLorentzEnvironment(double T, double lam, double gamma, std::any tag = {});

    double lam() const noexcept { return lam_; }
    double gamma() const noexcept { return gamma_; }

    // Nk Matsubara frequencies 2 pi k T plus the Drude pole. Requires T > 0.
    ExponentLists matsubara_terms(std::size_t Nk) const;
    // Pade [Nk-1/Nk] spectrum decomposition of the Bose function. Requires T > 0.
    ExponentLists pade_terms(std::size_t Nk) const;

    ExponentialBosonicEnvironment matsubara(std::size_t Nk, bool combine = true) const;
    ExponentialBosonicEnvironment pade(std::size_t Nk, bool combine = true) const;

protected:
    std::vector<double> sd_impl(const std::vector<double>& w) const override;
    std::vector<double> ps_impl(const std::vector<double>& w, double eps) const override;
    std::vector<std::complex<double>> cf_impl(const std::vector<double>& t, double eps) const override;
    const ApproximatorTable& approximators() const override;

private:
    double lam_;
    double gamma_;
};

// J(w) = lam^2 gamma w / ((w^2 - w0^2)^2 + gamma^2 w^2)
class UnderDampedEnvironment final : public BosonicEnvironment {
public:
    UnderDampedEnvironment(double T, double lam, double gamma, double w0, std::any tag = {});

    double lam() const noexcept { return lam_; }
    double gamma() const noexcept { return gamma_; }
    double w0() const noexcept { return w0_; }

    ExponentLists matsubara_terms(std::size_t Nk) const;
    ExponentialBosonicEnvironment matsubara(std::size_t Nk, bool combine = true) const;

protected:
    std::vector<double> sd_impl(const std::vector<double>& w) const override;
    std::vector<double> ps_impl(const std::vector<double>& w, double eps) const override;
    std::vector<std::complex<double>> cf_impl(const std::vector<double>& t, double eps) const override;
    const ApproximatorTable& approximators() const override;

private:
    double lam_;
    double gamma_;
    double w0_;
};

// Matsubara expansion of an underdamped mode given by its squared coupling
// (lam2 may be negative for fitted modes). Requires T > 0 and w0 > gamma / 2.
ExponentLists underdamped_matsubara_terms(double T, double lam2, double gamma, double w0, std::size_t Nk);

// J(w) = alpha w^s / wc^(1-s) exp(-|w| / wc) for w > 0
class OhmicEnvironment final : public BosonicEnvironment {
public:
    // A null special-function capability is reported on `log` now and raises
    // MissingOptionalDependency when the correlation function is requested.
    OhmicEnvironment(double T,
                     double alpha,
                     double wc,
                     double s,
                     std::shared_ptr<const SpecialFunctions> functions = default_special_functions(),
                     std::any tag = {},
                     std::ostream* log = nullptr);

    double alpha() const noexcept { return alpha_; }
    double wc() const noexcept { return wc_; }
    double s() const noexcept { return s_; }

protected:
    std::vector<double> sd_impl(const std::vector<double>& w) const override;
    std::vector<double> ps_impl(const std::vector<double>& w, double eps) const override;
    std::vector<std::complex<double>> cf_impl(const std::vector<double>& t, double eps) const override;

private:
    double alpha_;
    double wc_;
    double s_;
    std::shared_ptr<const SpecialFunctions> functions_;
};

} // namespace qenv
